#include "text_normalizer.hpp"
#include <sstream>
#include <stdexcept>
#include <unicode/utypes.h>

namespace {

// Anything that is neither a letter nor a space
const char* kSymbolRegex = "[^\\p{Alphabetic}\\p{White_Space}]+";

// "http" at the start of a whitespace delimited run, up to the next whitespace
const char* kUrlRegex = "(?<![^\\p{White_Space}])http[^\\p{White_Space}]*";

// A whole word that has some character twice in a row somewhere inside it
const char* kRepeatRegex = "\\b(?=\\w*(\\w)\\1)\\w+\\b";

const char* kTransliteratorId = "Latin-ASCII; [^\\u0000-\\u007F] Remove";

std::unique_ptr<icu::RegexPattern> compile(const char* regex) {
    UErrorCode status = U_ZERO_ERROR;
    UParseError parse_error;
    std::unique_ptr<icu::RegexPattern> pattern(
        icu::RegexPattern::compile(icu::UnicodeString::fromUTF8(regex), 0, parse_error, status));
    if (U_FAILURE(status) || !pattern) {
        throw std::runtime_error(std::string("Could not compile pattern ") + regex + ": " + u_errorName(status));
    }
    return pattern;
}

std::string to_utf8(const icu::UnicodeString& text) {
    std::string out;
    text.toUTF8String(out);
    return out;
}

}

TextNormalizer::TextNormalizer()
    : symbol_pattern_(compile(kSymbolRegex)),
      url_pattern_(compile(kUrlRegex)),
      repeat_pattern_(compile(kRepeatRegex)) {
    UErrorCode status = U_ZERO_ERROR;
    to_ascii_.reset(icu::Transliterator::createInstance(
        icu::UnicodeString::fromUTF8(kTransliteratorId), UTRANS_FORWARD, status));
    if (U_FAILURE(status) || !to_ascii_) {
        throw std::runtime_error(std::string("Could not create transliterator: ") + u_errorName(status));
    }
}

TextNormalizer::~TextNormalizer() = default;

void TextNormalizer::remove_matches(const icu::RegexPattern& pattern, icu::UnicodeString& text) const {
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(pattern.matcher(text, status));
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Regex matcher failed: ") + u_errorName(status));
    }
    icu::UnicodeString replaced = matcher->replaceAll(icu::UnicodeString(), status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Regex replace failed: ") + u_errorName(status));
    }
    matcher.reset();
    text = replaced;
}

void TextNormalizer::apply_rewrites(icu::UnicodeString& text) const {
    remove_matches(*symbol_pattern_, text);
    remove_matches(*url_pattern_, text);
    remove_matches(*repeat_pattern_, text);
}

std::string TextNormalizer::normalize(const std::string& text) const {
    if (text.empty()) return "";

    // Invalid UTF-8 becomes U+FFFD, which step 1 removes
    icu::UnicodeString work = icu::UnicodeString::fromUTF8(text);
    apply_rewrites(work);
    to_ascii_->transliterate(work);

    // Latin-ASCII can emit punctuation or new doubled letters ("ß" -> "ss"), so the
    // rewrites run once more over the ASCII text
    apply_rewrites(work);

    return collapse_whitespace(to_utf8(work));
}

std::string TextNormalizer::strip_symbols(const std::string& text) const {
    icu::UnicodeString work = icu::UnicodeString::fromUTF8(text);
    remove_matches(*symbol_pattern_, work);
    return to_utf8(work);
}

std::string TextNormalizer::strip_urls(const std::string& text) const {
    icu::UnicodeString work = icu::UnicodeString::fromUTF8(text);
    remove_matches(*url_pattern_, work);
    return to_utf8(work);
}

std::string TextNormalizer::strip_repeated_letter_words(const std::string& text) const {
    icu::UnicodeString work = icu::UnicodeString::fromUTF8(text);
    remove_matches(*repeat_pattern_, work);
    return to_utf8(work);
}

std::string TextNormalizer::transliterate(const std::string& text) const {
    icu::UnicodeString work = icu::UnicodeString::fromUTF8(text);
    to_ascii_->transliterate(work);
    return to_utf8(work);
}

std::string TextNormalizer::collapse_whitespace(const std::string& text) {
    std::stringstream ss(text);
    std::string word;
    std::string out;
    out.reserve(text.size());
    while (ss >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}
