#pragma once
// corpus_summary.hpp
// Descriptive statistics of the raw (unsampled) source corpora:
// size on disk, line / character / word counts and each source's share of the totals.

#include <string>
#include <vector>
#include <cstdint>
#include "corpus_loader.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct CorpusSummary {
    std::string source;
    std::uintmax_t size_bytes = 0;
    double size_mb = 0.0;          // size_bytes / 2^20
    uint64_t lines = 0;
    uint64_t chars = 0;            // Unicode code points
    uint64_t words = 0;            // whitespace separated words

    // Shares of the totals over all summarized sources, rounded to 2 decimals
    double pct_chars = 0.0;
    double pct_lines = 0.0;
    double pct_words = 0.0;
};

// Number of code points in a UTF-8 string (continuation bytes are not counted)
uint64_t count_chars(const std::string& text);

// Number of whitespace separated words
uint64_t count_words(const std::string& text);

CorpusSummary summarize_corpus(const SourceCorpus& corpus);

// Summaries for every corpus, with the pct_* columns filled in
std::vector<CorpusSummary> summarize_corpora(const std::vector<SourceCorpus>& corpora);

json summary_to_json(const std::vector<CorpusSummary>& summaries);
bool save_summary_json(const std::vector<CorpusSummary>& summaries, const std::string& output_path);
