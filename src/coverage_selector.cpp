#include "coverage_selector.hpp"
#include "json_file.hpp"
#include <algorithm>
#include <iostream>

std::vector<CoverageEntry> CoverageSet::top(size_t k) const {
    size_t n = std::min(k, entries.size());
    return std::vector<CoverageEntry>(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(n));
}

CoverageSet select_coverage(const std::vector<RankedToken>& ranked, uint64_t total_tokens, double threshold) {
    CoverageSet result;
    result.threshold = threshold;
    result.total_tokens = total_tokens;
    result.distinct_tokens = ranked.size();

    if (ranked.empty() || threshold <= 0.0) return result;

    const bool take_all = threshold >= 1.0;
    double cumulative = 0.0;
    for (const auto& item : ranked) {
        cumulative += item.proportion;
        // Strict threshold: the first entry that pushes the sum past it is not kept
        if (!take_all && cumulative > threshold) break;
        result.entries.push_back({item.token, item.count, item.proportion, cumulative});
    }
    return result;
}

CoverageSet select_coverage(const FrequencyTable& table, double threshold) {
    return select_coverage(table.ranked(), table.total(), threshold);
}

json coverage_to_json(const CoverageSet& coverage) {
    json j;
    j["threshold"] = coverage.threshold;
    j["total_tokens"] = coverage.total_tokens;
    j["distinct_tokens"] = coverage.distinct_tokens;
    j["size"] = coverage.size();

    json rows = json::array();
    for (const auto& e : coverage.entries) {
        rows.push_back({
            {"token", e.token},
            {"count", e.count},
            {"proportion", e.proportion},
            {"coverage", e.cumulative}
        });
    }
    j["entries"] = rows;
    return j;
}

bool coverage_from_json(const json& j, CoverageSet& out) {
    try {
        CoverageSet c;
        c.threshold = j.at("threshold").get<double>();
        c.total_tokens = j.at("total_tokens").get<uint64_t>();
        c.distinct_tokens = j.at("distinct_tokens").get<size_t>();
        for (const auto& row : j.at("entries")) {
            c.entries.push_back({
                row.at("token").get<std::string>(),
                row.at("count").get<uint64_t>(),
                row.at("proportion").get<double>(),
                row.at("coverage").get<double>()
            });
        }
        out = std::move(c);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[Coverage] Error reading coverage table: " << e.what() << std::endl;
        return false;
    }
}

bool save_coverage_json(const CoverageSet& coverage, const std::string& output_path) {
    return write_json_file(coverage_to_json(coverage), output_path, 2);
}

bool load_coverage_json(const std::string& path, CoverageSet& out) {
    json j;
    if (!read_json_file(path, j)) return false;
    return coverage_from_json(j, out);
}
