#pragma once
// pipeline_config.hpp
// Everything the pipeline needs that is not corpus text: seed, sample fraction,
// word list paths, the source files and the granularities to analyze.
// Nothing here is process-global; a config object is passed to CoveragePipeline.
// Can be filled from a JSON file (missing keys keep their defaults).

#include <cstdint>
#include <string>
#include <vector>

struct SourceSpec {
    std::string name;
    std::string path;
};

// One token population: n-gram size, whether the stopword/profanity filter applies,
// and the coverage thresholds to compute for it
struct GranularitySpec {
    std::string name;
    size_t n = 1;
    bool filtered = false;
    std::vector<double> thresholds;
};

class PipelineConfig {
public:
    PipelineConfig();

    // Configuration
    void set_seed(uint32_t seed);
    void set_sample_fraction(double fraction);          // (0, 1], throws std::invalid_argument
    void set_stopwords_path(const std::string& path);
    void set_profanity_path(const std::string& path);
    void set_lowercase(bool lowercase);
    void set_workers(size_t workers);                    // clamped to [1, max_workers()]
    void set_verbose(bool verbose);
    void set_progress_every(size_t records);
    void add_source(const std::string& name, const std::string& path);
    void clear_sources();
    // n >= 1 and distinct output file names, throws std::invalid_argument
    void set_granularities(const std::vector<GranularitySpec>& granularities);

    // Reads a JSON config; false if the file is missing or malformed.
    // Invalid values throw std::invalid_argument. Nothing is applied unless the whole file is valid.
    bool load_from_json(const std::string& config_path);

    uint32_t seed() const { return seed_; }
    double sample_fraction() const { return sample_fraction_; }
    const std::string& stopwords_path() const { return stopwords_path_; }
    const std::string& profanity_path() const { return profanity_path_; }
    bool lowercase() const { return lowercase_; }
    size_t workers() const { return workers_; }
    bool verbose() const { return verbose_; }
    size_t progress_every() const { return progress_every_; }
    const std::vector<SourceSpec>& sources() const { return sources_; }
    const std::vector<GranularitySpec>& granularities() const { return granularities_; }

    // max(4, hardware threads)
    static size_t max_workers();

    // words at 0.5 and 0.9 (filtered), bigrams / trigrams / quadgrams at 0.9
    static std::vector<GranularitySpec> default_granularities();

private:
    uint32_t seed_ = 1001;
    double sample_fraction_ = 0.1;
    std::string stopwords_path_ = "data/stopwords.txt";
    std::string profanity_path_ = "data/final/en_US/en_US.swearWords.csv";
    bool lowercase_ = false;
    size_t workers_ = 1;
    bool verbose_ = true;
    size_t progress_every_ = 100000;
    std::vector<SourceSpec> sources_;
    std::vector<GranularitySpec> granularities_;
};

// Output file stem of one coverage table: "word_cover_50", "bigram_cover_90"
std::string coverage_file_stem(const std::string& granularity, double threshold);
