#pragma once
// coverage_selector.hpp
// Minimal coverage sets: walk the ranked frequency table, accumulate proportions
// and keep the longest prefix whose cumulative proportion is <= threshold.
//   - empty table        -> empty set
//   - threshold >= 1.0   -> the whole ranked table
//   - threshold <= 0.0   -> empty set (no entry can have cumulative mass <= 0)
// The running sum is taken in rank order, so identical input gives identical output bit for bit.

#include <cstdint>
#include <string>
#include <vector>
#include "frequency_table.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct CoverageEntry {
    std::string token;
    uint64_t count;
    double proportion;
    double cumulative;
};

struct CoverageSet {
    double threshold = 0.0;
    uint64_t total_tokens = 0;      // mass of the whole table
    size_t distinct_tokens = 0;     // size of the whole table
    std::vector<CoverageEntry> entries;

    // Number of distinct tokens needed to reach the threshold
    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    // Cumulative proportion of the last kept entry (0 when empty)
    double covered_mass() const { return entries.empty() ? 0.0 : entries.back().cumulative; }

    // The k most frequent kept entries
    std::vector<CoverageEntry> top(size_t k) const;
};

// `ranked` must already be in rank order (FrequencyTable::ranked())
CoverageSet select_coverage(const std::vector<RankedToken>& ranked, uint64_t total_tokens, double threshold);

CoverageSet select_coverage(const FrequencyTable& table, double threshold);

json coverage_to_json(const CoverageSet& coverage);
bool coverage_from_json(const json& j, CoverageSet& out);

bool save_coverage_json(const CoverageSet& coverage, const std::string& output_path);
bool load_coverage_json(const std::string& path, CoverageSet& out);
