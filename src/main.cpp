#include "coverage_pipeline.hpp"
#include "pipeline_config.hpp"
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_summary(const std::vector<CorpusSummary>& summaries) {
    std::cout << std::left
              << std::setw(12) << "Source"
              << std::setw(12) << "Size (MB)"
              << std::setw(12) << "Lines"
              << std::setw(14) << "Chars"
              << std::setw(14) << "Words"
              << "\n";
    std::cout << std::string(64, '-') << "\n";
    for (const auto& s : summaries) {
        std::cout << std::left
                  << std::setw(12) << s.source
                  << std::setw(12) << std::fixed << std::setprecision(1) << s.size_mb
                  << std::setw(12) << s.lines
                  << std::setw(14) << s.chars
                  << std::setw(14) << s.words
                  << "\n";
    }
    std::cout << std::string(64, '-') << "\n";
    std::cout.unsetf(std::ios::fixed);
    std::cout << std::setprecision(6);
}

void print_top(const GranularityResult& g, size_t k) {
    if (g.coverage.empty()) return;
    const CoverageSet& widest = g.coverage.back();
    std::cout << "\nTop " << k << " " << g.spec.name << "s:\n";
    size_t rank = 0;
    for (const auto& e : widest.top(k)) {
        std::cout << "  " << std::setw(3) << ++rank << ". " << e.token
                  << " (" << e.count << ", " << e.proportion << ")\n";
    }
}

}

int main(int argc, char* argv[]) {
    std::string config_path = "config/pipeline.json";
    std::string output_dir = "clean_repos";

    if (argc >= 2) config_path = argv[1];
    if (argc >= 3) output_dir = argv[2];

    try {
        PipelineConfig config;
        if (fs::exists(config_path)) {
            if (!config.load_from_json(config_path)) {
                std::cerr << "Error: invalid configuration " << config_path << "\n";
                return 1;
            }
        } else {
            std::cout << "[Main] No config at " << config_path << ", using defaults\n";
        }

        if (config.sources().empty()) {
            std::cerr << "Error: no sources configured\n";
            return 1;
        }

        std::cout << "[Main] Output: " << output_dir << "\n\n";

        CoveragePipeline pipeline(config);
        PipelineResult result = pipeline.run_from_config();

        std::cout << "\n";
        print_summary(result.summaries);

        std::cout << "\nSampled records: " << result.sampled_records << "\n";
        std::cout << "Distinct words:  " << result.vocabulary_size << "\n";
        for (const auto& g : result.granularities) {
            for (const auto& c : g.coverage) {
                std::cout << "  " << g.spec.name << " " << c.threshold * 100.0 << "% coverage: "
                          << c.size() << " of " << g.distinct_tokens << " distinct\n";
            }
        }
        for (const auto& g : result.granularities) {
            print_top(g, 20);
        }

        if (!pipeline.save_results(result, output_dir)) {
            std::cerr << "Error: Failed to save results\n";
            return 1;
        }

        // Check the widest word table reads back
        for (const auto& g : result.granularities) {
            if (g.coverage.empty()) continue;
            const CoverageSet& c = g.coverage.back();
            CoverageSet check;
            std::string file = (fs::path(output_dir) / (coverage_file_stem(g.spec.name, c.threshold) + ".json")).string();
            if (load_coverage_json(file, check) && check.size() == c.size()) {
                std::cout << "\nVerification: " << file << " loads correctly\n";
            }
            break;
        }

    } catch (const std::exception& e) {
        std::cerr << "\nERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
