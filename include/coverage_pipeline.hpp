#pragma once
// coverage_pipeline.hpp
// raw corpora -> sample -> normalize -> tokenize -> (filter on the word path) -> count -> coverage sets
// One generic routine handles every granularity; it is parameterized only by n and
// whether the word filter applies. Granularities run concurrently over the shared,
// read-only cleaned sample, and counting inside a granularity is split into
// per-worker partial tables that are merged before ranking.

#include <string>
#include <vector>
#include "corpus_loader.hpp"
#include "corpus_summary.hpp"
#include "corpus_sampler.hpp"
#include "coverage_selector.hpp"
#include "frequency_table.hpp"
#include "pipeline_config.hpp"
#include "text_normalizer.hpp"
#include "token_filter.hpp"

struct GranularityResult {
    GranularitySpec spec;
    uint64_t total_tokens = 0;
    size_t distinct_tokens = 0;
    std::vector<CoverageSet> coverage;   // same order as spec.thresholds
};

// Word proportions inside one source (the "distribution by source" view)
struct SourceWordProportions {
    std::string source;
    uint64_t total_tokens = 0;
    std::vector<RankedToken> ranked;
};

struct PipelineResult {
    std::vector<CorpusSummary> summaries;
    size_t sampled_records = 0;
    size_t vocabulary_size = 0;          // distinct filtered words in the sample
    std::vector<GranularityResult> granularities;
    std::vector<SourceWordProportions> source_proportions;
    double run_time_seconds = 0.0;
};

class CoveragePipeline {
public:
    // Loads the stopword and profanity lists named in the config; throws std::runtime_error if either is missing
    explicit CoveragePipeline(const PipelineConfig& config);

    // Uses an already built filter (no files touched)
    CoveragePipeline(const PipelineConfig& config, TokenFilter filter);

    // Whole run over in-memory corpora
    PipelineResult run(const std::vector<SourceCorpus>& corpora) const;

    // Loads config.sources() from disk and runs; throws std::runtime_error if a source cannot be read
    PipelineResult run_from_config() const;

    // Normalizes every record's text; lines that clean to "" are kept but yield no tokens
    std::vector<Record> clean(std::vector<Record> sample) const;

    // Token counts of one granularity over the cleaned sample
    FrequencyTable count_tokens(const std::vector<Record>& cleaned, size_t n, bool filtered) const;

    // Counts, ranks and selects every threshold of `spec`
    GranularityResult analyze(const std::vector<Record>& cleaned, const GranularitySpec& spec) const;

    std::vector<SourceWordProportions> source_word_proportions(const std::vector<Record>& cleaned) const;

    // Writes summary, coverage tables, per-source proportions and a run report under output_dir.
    // n-gram tables (n > 1) also list each entry's words separately.
    bool save_results(const PipelineResult& result, const std::string& output_dir) const;

private:
    PipelineConfig config_;
    TokenFilter filter_;
    TextNormalizer normalizer_;
    CorpusSampler sampler_;

    void count_range(const std::vector<Record>& cleaned, size_t begin, size_t end,
                     size_t n, bool filtered, FrequencyTable& table) const;
};
