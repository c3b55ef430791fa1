#include "pipeline_config.hpp"
#include "json_file.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

PipelineConfig::PipelineConfig() : granularities_(default_granularities()) {
    size_t hw = std::thread::hardware_concurrency();
    workers_ = (hw == 0) ? 4 : hw;
}

std::string coverage_file_stem(const std::string& granularity, double threshold) {
    std::ostringstream ss;
    ss << granularity << "_cover_" << threshold * 100.0;
    return ss.str();
}

size_t PipelineConfig::max_workers() {
    size_t hw = std::thread::hardware_concurrency();
    return std::max<size_t>(4, hw);
}

std::vector<GranularitySpec> PipelineConfig::default_granularities() {
    return {
        {"word", 1, true, {0.5, 0.9}},
        {"bigram", 2, false, {0.9}},
        {"trigram", 3, false, {0.9}},
        {"quadgram", 4, false, {0.9}}
    };
}

void PipelineConfig::set_seed(uint32_t seed) {
    seed_ = seed;
}

void PipelineConfig::set_sample_fraction(double fraction) {
    if (!(fraction > 0.0 && fraction <= 1.0)) {
        throw std::invalid_argument("sample_fraction must be in (0, 1], got " + std::to_string(fraction));
    }
    sample_fraction_ = fraction;
}

void PipelineConfig::set_stopwords_path(const std::string& path) {
    stopwords_path_ = path;
}

void PipelineConfig::set_profanity_path(const std::string& path) {
    profanity_path_ = path;
}

void PipelineConfig::set_lowercase(bool lowercase) {
    lowercase_ = lowercase;
}

void PipelineConfig::set_workers(size_t workers) {
    workers_ = std::min(std::max<size_t>(1, workers), max_workers());
}

void PipelineConfig::set_verbose(bool verbose) {
    verbose_ = verbose;
}

void PipelineConfig::set_progress_every(size_t records) {
    progress_every_ = records;
}

void PipelineConfig::add_source(const std::string& name, const std::string& path) {
    sources_.push_back({name, path});
}

void PipelineConfig::clear_sources() {
    sources_.clear();
}

void PipelineConfig::set_granularities(const std::vector<GranularitySpec>& granularities) {
    std::set<std::string> stems;
    for (const auto& g : granularities) {
        if (g.n == 0) {
            throw std::invalid_argument("granularity '" + g.name + "' has n = 0");
        }
        for (double threshold : g.thresholds) {
            std::string stem = coverage_file_stem(g.name, threshold);
            if (!stems.insert(stem).second) {
                throw std::invalid_argument("coverage table '" + stem + "' is configured twice");
            }
        }
    }
    granularities_ = granularities;
}

bool PipelineConfig::load_from_json(const std::string& config_path) {
    json j;
    if (!read_json_file(config_path, j)) {
        std::cerr << "[Config] Error: could not load " << config_path << std::endl;
        return false;
    }

    // Applied to a copy so a bad value leaves this config untouched
    PipelineConfig loaded(*this);
    try {
        if (j.contains("seed")) loaded.set_seed(j["seed"].get<uint32_t>());
        if (j.contains("sample_fraction")) loaded.set_sample_fraction(j["sample_fraction"].get<double>());
        if (j.contains("stopwords_path")) loaded.set_stopwords_path(j["stopwords_path"].get<std::string>());
        if (j.contains("profanity_path")) loaded.set_profanity_path(j["profanity_path"].get<std::string>());
        if (j.contains("lowercase")) loaded.set_lowercase(j["lowercase"].get<bool>());
        if (j.contains("workers")) {
            long long workers = j["workers"].get<long long>();
            if (workers < 1) {
                throw std::invalid_argument("workers must be at least 1, got " + std::to_string(workers));
            }
            loaded.set_workers(static_cast<size_t>(workers));
        }
        if (j.contains("verbose")) loaded.set_verbose(j["verbose"].get<bool>());
        if (j.contains("progress_every")) loaded.set_progress_every(j["progress_every"].get<size_t>());

        if (j.contains("sources") && j["sources"].is_array()) {
            loaded.clear_sources();
            for (const auto& s : j["sources"]) {
                loaded.add_source(s.at("name").get<std::string>(), s.at("path").get<std::string>());
            }
        }

        if (j.contains("granularities") && j["granularities"].is_array()) {
            std::vector<GranularitySpec> specs;
            for (const auto& g : j["granularities"]) {
                GranularitySpec spec;
                spec.name = g.at("name").get<std::string>();
                spec.n = g.at("n").get<size_t>();
                spec.filtered = g.value("filtered", false);
                spec.thresholds = g.value("thresholds", std::vector<double>{0.9});
                specs.push_back(spec);
            }
            loaded.set_granularities(specs);
        }
    } catch (const json::exception& e) {
        std::cerr << "[Config] Error in " << config_path << ": " << e.what() << std::endl;
        return false;
    }

    *this = loaded;

    std::cout << "[Config] Loaded " << config_path << " (" << sources_.size() << " sources, "
              << granularities_.size() << " granularities)" << std::endl;
    return true;
}
