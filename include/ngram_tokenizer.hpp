#pragma once
// ngram_tokenizer.hpp
// Splits a cleaned line on whitespace and exposes every contiguous window of n words
// as a token ("the quick fox", n=2 -> "the quick", "quick fox").
// n = 1 gives the plain word sequence. Fewer than n words gives nothing.
// The sequence owns its text and only stores word offsets, so it can be iterated
// any number of times and each token is built when it is dereferenced.

#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

class NGramSequence {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = std::string;

        const_iterator() = default;
        const_iterator(const NGramSequence* seq, size_t pos) : seq_(seq), pos_(pos) {}

        std::string operator*() const { return seq_->at(pos_); }
        const_iterator& operator++() { ++pos_; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++pos_; return tmp; }

        bool operator==(const const_iterator& other) const { return seq_ == other.seq_ && pos_ == other.pos_; }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        const NGramSequence* seq_ = nullptr;
        size_t pos_ = 0;
    };

    // Throws std::invalid_argument if n == 0. Case is kept unless `lowercase` is set.
    NGramSequence(std::string text, size_t n, bool lowercase = false);

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, size()); }

    // max(0, words - n + 1)
    size_t size() const;
    bool empty() const { return size() == 0; }

    size_t n() const { return n_; }
    size_t word_count() const { return words_.size(); }

    // i-th window, words joined by a single space
    std::string at(size_t i) const;

    std::vector<std::string> to_vector() const;

private:
    std::string text_;
    std::vector<std::pair<size_t, size_t>> words_;   // offset, length
    size_t n_;
};

// Convenience wrappers
NGramSequence tokenize_words(const std::string& text, bool lowercase = false);
NGramSequence tokenize_ngrams(const std::string& text, size_t n, bool lowercase = false);

// "a b c d" -> {"a", "b", "c", "d"}
std::vector<std::string> split_ngram(const std::string& token);
