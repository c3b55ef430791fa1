#pragma once
// token_filter.hpp
// Stopword / profanity removal for the word (unigram) path only.
// Comparison is case-normalized exact match, no stemming.
// Both lists are loaded once and never change afterwards; a list file that
// cannot be opened is a configuration error (std::runtime_error), never skipped.

#include <string>
#include <unordered_set>
#include <vector>
#include "ngram_tokenizer.hpp"

class TokenFilter {
public:
    TokenFilter(std::unordered_set<std::string> stopwords, std::unordered_set<std::string> profanity);

    // Loads both lists; throws std::runtime_error if either file is missing
    static TokenFilter from_files(const std::string& stopwords_path, const std::string& profanity_path);

    // One lowercase word per entry. Lines may hold several words separated by
    // whitespace or commas, and characters other than ASCII letters are dropped
    // so entries look like normalized text ("don't" -> "dont").
    static std::unordered_set<std::string> load_word_list(const std::string& path);

    bool is_stopword(const std::string& token) const;
    bool is_profane(const std::string& token) const;
    bool is_excluded(const std::string& token) const;

    // Words that are in neither list, in their original order
    std::vector<std::string> apply(const NGramSequence& words) const;
    std::vector<std::string> apply(const std::vector<std::string>& words) const;

    size_t stopword_count() const { return stop_words_.size(); }
    size_t profanity_count() const { return profanity_.size(); }

private:
    std::unordered_set<std::string> stop_words_;
    std::unordered_set<std::string> profanity_;

    static std::string normalize_entry(const std::string& word);
};
