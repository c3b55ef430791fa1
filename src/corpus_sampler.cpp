#include "corpus_sampler.hpp"
#include <cmath>
#include <iostream>
#include <iterator>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace {

// FNV-1a, used to derive a stable per-source seed from the source name
uint32_t fnv1a(const std::string& s) {
    uint32_t h = 2166136261u;
    for (unsigned char c : s) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

// Uniform value in [0, bound) by rejection, so results do not depend on the
// standard library's distribution implementation
uint64_t draw_below(std::mt19937_64& rng, uint64_t bound) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    const uint64_t limit = max - max % bound;
    uint64_t value;
    do {
        value = rng();
    } while (value >= limit);
    return value % bound;
}

}

CorpusSampler::CorpusSampler(uint32_t seed, double fraction) : seed_(seed), fraction_(fraction) {
    if (!(fraction > 0.0 && fraction <= 1.0)) {
        throw std::invalid_argument("Sample fraction must be in (0, 1], got " + std::to_string(fraction));
    }
}

size_t CorpusSampler::sample_size(size_t corpus_size) const {
    if (fraction_ >= 1.0) return corpus_size;
    return static_cast<size_t>(std::floor(static_cast<double>(corpus_size) * fraction_));
}

std::mt19937_64 CorpusSampler::engine_for(const std::string& source) const {
    std::seed_seq seq{seed_, fnv1a(source)};
    return std::mt19937_64(seq);
}

std::vector<Record> CorpusSampler::sample(const SourceCorpus& corpus) const {
    const size_t n = corpus.lines.size();
    const size_t k = sample_size(n);

    std::vector<Record> out;
    if (k == 0) {
        std::cout << "[Sampler] " << corpus.name << ": corpus too small for fraction "
                  << fraction_ << ", sample is empty" << std::endl;
        return out;
    }

    // Partial Fisher-Yates: the first k slots end up as a uniform draw without replacement
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::mt19937_64 rng = engine_for(corpus.name);
    for (size_t i = 0; i < k; ++i) {
        size_t j = i + static_cast<size_t>(draw_below(rng, n - i));
        std::swap(order[i], order[j]);
    }

    out.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        out.push_back({corpus.lines[order[i]], corpus.name});
    }
    return out;
}

std::vector<Record> CorpusSampler::sample_all(const std::vector<SourceCorpus>& corpora) const {
    std::vector<Record> all;
    for (const auto& corpus : corpora) {
        std::vector<Record> part = sample(corpus);
        std::cout << "[Sampler] " << corpus.name << ": sampled " << part.size()
                  << " of " << corpus.lines.size() << " lines" << std::endl;
        all.insert(all.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    return all;
}
