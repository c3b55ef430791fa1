#include "ngram_tokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

NGramSequence::NGramSequence(std::string text, size_t n, bool lowercase)
    : text_(std::move(text)), n_(n) {
    if (n_ == 0) {
        throw std::invalid_argument("n-gram size must be at least 1");
    }

    if (lowercase) {
        std::transform(text_.begin(), text_.end(), text_.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    // Record where every whitespace delimited word starts and how long it is
    size_t i = 0;
    const size_t len = text_.size();
    while (i < len) {
        while (i < len && std::isspace(static_cast<unsigned char>(text_[i]))) i++;
        if (i >= len) break;
        size_t start = i;
        while (i < len && !std::isspace(static_cast<unsigned char>(text_[i]))) i++;
        words_.emplace_back(start, i - start);
    }
}

size_t NGramSequence::size() const {
    if (words_.size() < n_) return 0;
    return words_.size() - n_ + 1;
}

std::string NGramSequence::at(size_t i) const {
    if (i >= size()) {
        throw std::out_of_range("n-gram index " + std::to_string(i) + " out of range");
    }

    std::string token;
    for (size_t w = i; w < i + n_; ++w) {
        if (w > i) token += ' ';
        token.append(text_, words_[w].first, words_[w].second);
    }
    return token;
}

std::vector<std::string> NGramSequence::to_vector() const {
    std::vector<std::string> out;
    out.reserve(size());
    for (const auto& token : *this) out.push_back(token);
    return out;
}

NGramSequence tokenize_words(const std::string& text, bool lowercase) {
    return NGramSequence(text, 1, lowercase);
}

NGramSequence tokenize_ngrams(const std::string& text, size_t n, bool lowercase) {
    return NGramSequence(text, n, lowercase);
}

std::vector<std::string> split_ngram(const std::string& token) {
    std::vector<std::string> words;
    std::stringstream ss(token);
    std::string word;
    while (ss >> word) {
        words.push_back(word);
    }
    return words;
}
