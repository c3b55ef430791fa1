#pragma once
// text_normalizer.hpp
// Deterministic cleanup of raw corpus lines before tokenization.
// The rewrites always run in this order:
//   1. drop every character that is neither alphabetic nor whitespace (punctuation, digits, symbols)
//   2. drop every whitespace delimited run that starts with "http"
//   3. drop every word that contains the same character twice in a row
//      (quirk kept on purpose: "book" and "hello" go, not just "sooo")
//   4. transliterate to ASCII (Latin-ASCII), dropping what has no mapping,
//      then repeat 1-3 on the ASCII text
//   5. collapse whitespace runs to one space and trim
// Uses ICU so that "alphabetic" and "whitespace" are the Unicode properties.

#include <memory>
#include <string>
#include <unicode/regex.h>
#include <unicode/translit.h>
#include <unicode/unistr.h>

class TextNormalizer {
public:
    // Compiles the patterns and the transliterator; throws std::runtime_error if ICU refuses them
    TextNormalizer();
    ~TextNormalizer();

    TextNormalizer(const TextNormalizer&) = delete;
    TextNormalizer& operator=(const TextNormalizer&) = delete;

    // Full cleanup. Empty / whitespace-only / garbage input gives "".
    std::string normalize(const std::string& text) const;

    // Single rewrite steps, UTF-8 in and out
    std::string strip_symbols(const std::string& text) const;
    std::string strip_urls(const std::string& text) const;
    std::string strip_repeated_letter_words(const std::string& text) const;
    std::string transliterate(const std::string& text) const;

    static std::string collapse_whitespace(const std::string& text);

private:
    std::unique_ptr<icu::RegexPattern> symbol_pattern_;
    std::unique_ptr<icu::RegexPattern> url_pattern_;
    std::unique_ptr<icu::RegexPattern> repeat_pattern_;
    std::unique_ptr<icu::Transliterator> to_ascii_;

    void remove_matches(const icu::RegexPattern& pattern, icu::UnicodeString& text) const;
    void apply_rewrites(icu::UnicodeString& text) const;   // steps 1-3
};
