#include "corpus_summary.hpp"
#include "json_file.hpp"
#include <cctype>
#include <cmath>
#include <iostream>

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

double share(uint64_t part, uint64_t total) {
    if (total == 0) return 0.0;
    return round2(static_cast<double>(part) / static_cast<double>(total));
}

}

uint64_t count_chars(const std::string& text) {
    uint64_t n = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

uint64_t count_words(const std::string& text) {
    uint64_t n = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            n++;
        }
    }
    return n;
}

CorpusSummary summarize_corpus(const SourceCorpus& corpus) {
    CorpusSummary s;
    s.source = corpus.name;
    s.size_bytes = corpus.size_bytes;
    s.size_mb = static_cast<double>(corpus.size_bytes) / (1024.0 * 1024.0);
    s.lines = corpus.lines.size();
    for (const auto& line : corpus.lines) {
        s.chars += count_chars(line);
        s.words += count_words(line);
    }
    return s;
}

std::vector<CorpusSummary> summarize_corpora(const std::vector<SourceCorpus>& corpora) {
    std::vector<CorpusSummary> summaries;
    summaries.reserve(corpora.size());

    uint64_t total_chars = 0, total_lines = 0, total_words = 0;
    for (const auto& corpus : corpora) {
        summaries.push_back(summarize_corpus(corpus));
        total_chars += summaries.back().chars;
        total_lines += summaries.back().lines;
        total_words += summaries.back().words;
    }

    for (auto& s : summaries) {
        s.pct_chars = share(s.chars, total_chars);
        s.pct_lines = share(s.lines, total_lines);
        s.pct_words = share(s.words, total_words);
    }
    return summaries;
}

json summary_to_json(const std::vector<CorpusSummary>& summaries) {
    json rows = json::array();
    for (const auto& s : summaries) {
        rows.push_back({
            {"source", s.source},
            {"size_bytes", s.size_bytes},
            {"size_mb", s.size_mb},
            {"lines", s.lines},
            {"chars", s.chars},
            {"words", s.words},
            {"pct_chars", s.pct_chars},
            {"pct_lines", s.pct_lines},
            {"pct_words", s.pct_words}
        });
    }
    return rows;
}

bool save_summary_json(const std::vector<CorpusSummary>& summaries, const std::string& output_path) {
    json j;
    j["sources"] = summary_to_json(summaries);
    return write_json_file(j, output_path, 2);
}
