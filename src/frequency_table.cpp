#include "frequency_table.hpp"
#include <algorithm>

void FrequencyTable::add(const std::string& token, uint64_t count) {
    if (count == 0) return;
    counts_[token] += count;
    total_ += count;
}

void FrequencyTable::merge(const FrequencyTable& other) {
    for (const auto& [token, n] : other.counts_) {
        counts_[token] += n;
    }
    total_ += other.total_;
}

uint64_t FrequencyTable::count(const std::string& token) const {
    auto it = counts_.find(token);
    return (it == counts_.end()) ? 0 : it->second;
}

double FrequencyTable::proportion(const std::string& token) const {
    if (total_ == 0) return 0.0;
    return static_cast<double>(count(token)) / static_cast<double>(total_);
}

bool rank_before(const RankedToken& a, const RankedToken& b) {
    if (a.count != b.count) return a.count > b.count;
    return a.token < b.token;
}

std::vector<RankedToken> FrequencyTable::ranked() const {
    std::vector<RankedToken> items;
    items.reserve(counts_.size());
    const double total = static_cast<double>(total_);
    for (const auto& [token, n] : counts_) {
        items.push_back({token, n, static_cast<double>(n) / total});
    }

    // Hash order is arbitrary, the comparator alone decides the result
    std::sort(items.begin(), items.end(), rank_before);
    return items;
}
