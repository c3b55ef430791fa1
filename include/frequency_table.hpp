#pragma once
// frequency_table.hpp
// Token -> occurrence count, with proportions relative to the total count.
// Counting is one hash insert per token; memory grows with the number of distinct tokens.
// ranked() is the only way to get an ordering and it is a total order:
// count descending (same as proportion descending), then token ascending.

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

struct RankedToken {
    std::string token;
    uint64_t count;
    double proportion;
};

class FrequencyTable {
public:
    FrequencyTable() = default;

    void add(const std::string& token, uint64_t count = 1);

    template <typename Range>
    void add_all(const Range& tokens) {
        for (const auto& token : tokens) add(token);
    }

    // Adds every count of `other` into this table (partition-then-merge counting)
    void merge(const FrequencyTable& other);

    uint64_t count(const std::string& token) const;
    double proportion(const std::string& token) const;

    uint64_t total() const { return total_; }
    size_t distinct() const { return counts_.size(); }
    bool empty() const { return total_ == 0; }

    // Every distinct token with its proportion, in the deterministic rank order
    std::vector<RankedToken> ranked() const;

private:
    std::unordered_map<std::string, uint64_t> counts_;
    uint64_t total_ = 0;
};

// Rank order used everywhere a frequency ordering is needed
bool rank_before(const RankedToken& a, const RankedToken& b);
