#pragma once
// corpus_sampler.hpp
// Reproducible uniform subsampling of each source corpus.
// Every source is sampled on its own (never from the union) with floor(lines * fraction)
// draws without replacement, then tagged with its source name.
// The generator for a source is seeded from (seed, source name) only, so a source's
// sample does not change when other sources are added or resized.

#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "corpus_loader.hpp"

class CorpusSampler {
public:
    // fraction must be in (0, 1]; anything else throws std::invalid_argument
    CorpusSampler(uint32_t seed, double fraction);

    // floor(corpus_size * fraction)
    size_t sample_size(size_t corpus_size) const;

    // Lines drawn from one corpus, in draw order, each tagged with corpus.name
    std::vector<Record> sample(const SourceCorpus& corpus) const;

    // Per-source samples concatenated in the order of `corpora`
    std::vector<Record> sample_all(const std::vector<SourceCorpus>& corpora) const;

    uint32_t seed() const { return seed_; }
    double fraction() const { return fraction_; }

private:
    uint32_t seed_;
    double fraction_;

    std::mt19937_64 engine_for(const std::string& source) const;
};
