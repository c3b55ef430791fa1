#include "coverage_pipeline.hpp"
#include "json_file.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

CoveragePipeline::CoveragePipeline(const PipelineConfig& config)
    : CoveragePipeline(config, TokenFilter::from_files(config.stopwords_path(), config.profanity_path())) {}

CoveragePipeline::CoveragePipeline(const PipelineConfig& config, TokenFilter filter)
    : config_(config),
      filter_(std::move(filter)),
      normalizer_(),
      sampler_(config.seed(), config.sample_fraction()) {}

std::vector<Record> CoveragePipeline::clean(std::vector<Record> sample) const {
    size_t processed = 0;
    size_t emptied = 0;
    for (auto& record : sample) {
        record.text = normalizer_.normalize(record.text);
        if (record.text.empty()) emptied++;

        processed++;
        if (config_.verbose() && config_.progress_every() > 0 && processed % config_.progress_every() == 0) {
            std::cout << "[Pipeline] Cleaned " << processed << " records..." << std::endl;
        }
    }

    if (config_.verbose()) {
        std::cout << "[Pipeline] Cleaned " << processed << " records (" << emptied
                  << " empty after cleanup)" << std::endl;
    }
    return sample;
}

void CoveragePipeline::count_range(const std::vector<Record>& cleaned, size_t begin, size_t end,
                                   size_t n, bool filtered, FrequencyTable& table) const {
    for (size_t i = begin; i < end; ++i) {
        if (cleaned[i].text.empty()) continue;

        NGramSequence tokens(cleaned[i].text, n, config_.lowercase());
        if (filtered) {
            for (const auto& token : tokens) {
                if (!filter_.is_excluded(token)) table.add(token);
            }
        } else {
            table.add_all(tokens);
        }
    }
}

FrequencyTable CoveragePipeline::count_tokens(const std::vector<Record>& cleaned, size_t n, bool filtered) const {
    if (n == 0) throw std::invalid_argument("n-gram size must be at least 1");

    size_t workers = std::min(config_.workers(), cleaned.size());
    if (workers <= 1) {
        FrequencyTable table;
        count_range(cleaned, 0, cleaned.size(), n, filtered, table);
        return table;
    }

    // Partition the records, count each partition on its own, merge in partition order
    size_t chunk = (cleaned.size() + workers - 1) / workers;
    std::vector<std::future<FrequencyTable>> futures;
    for (size_t begin = 0; begin < cleaned.size(); begin += chunk) {
        size_t end = std::min(begin + chunk, cleaned.size());
        futures.push_back(std::async(std::launch::async, [this, &cleaned, begin, end, n, filtered]() {
            FrequencyTable partial;
            count_range(cleaned, begin, end, n, filtered, partial);
            return partial;
        }));
    }

    FrequencyTable table;
    for (auto& f : futures) {
        table.merge(f.get());
    }
    return table;
}

GranularityResult CoveragePipeline::analyze(const std::vector<Record>& cleaned, const GranularitySpec& spec) const {
    GranularityResult result;
    result.spec = spec;

    FrequencyTable table = count_tokens(cleaned, spec.n, spec.filtered);
    result.total_tokens = table.total();
    result.distinct_tokens = table.distinct();

    std::vector<RankedToken> ranked = table.ranked();
    for (double threshold : spec.thresholds) {
        result.coverage.push_back(select_coverage(ranked, table.total(), threshold));
    }

    if (config_.verbose()) {
        std::ostringstream ss;
        ss << "[Pipeline] " << spec.name << ": " << result.total_tokens << " tokens, "
           << result.distinct_tokens << " distinct";
        for (const auto& c : result.coverage) {
            ss << ", " << c.threshold * 100.0 << "% coverage with " << c.size();
        }
        std::cout << ss.str() << std::endl;
    }
    return result;
}

std::vector<SourceWordProportions> CoveragePipeline::source_word_proportions(const std::vector<Record>& cleaned) const {
    std::vector<std::string> order;
    std::unordered_map<std::string, FrequencyTable> tables;

    for (const auto& record : cleaned) {
        auto it = tables.find(record.source);
        if (it == tables.end()) {
            order.push_back(record.source);
            it = tables.emplace(record.source, FrequencyTable()).first;
        }
        if (record.text.empty()) continue;

        NGramSequence words(record.text, 1, config_.lowercase());
        it->second.add_all(filter_.apply(words));
    }

    std::vector<SourceWordProportions> out;
    out.reserve(order.size());
    for (const auto& source : order) {
        const FrequencyTable& t = tables.at(source);
        out.push_back({source, t.total(), t.ranked()});
    }
    return out;
}

PipelineResult CoveragePipeline::run(const std::vector<SourceCorpus>& corpora) const {
    auto start_time = std::chrono::steady_clock::now();
    PipelineResult result;

    std::cout << "[Pipeline] Summarizing " << corpora.size() << " sources..." << std::endl;
    result.summaries = summarize_corpora(corpora);

    std::cout << "[Pipeline] Sampling " << config_.sample_fraction() * 100.0
              << "% of each source (seed " << config_.seed() << ")" << std::endl;
    std::vector<Record> cleaned = clean(sampler_.sample_all(corpora));
    result.sampled_records = cleaned.size();

    // Granularities are independent and only read `cleaned`
    std::vector<std::future<GranularityResult>> futures;
    for (const auto& spec : config_.granularities()) {
        futures.push_back(std::async(std::launch::async, [this, &cleaned, spec]() {
            return analyze(cleaned, spec);
        }));
    }
    for (auto& f : futures) {
        result.granularities.push_back(f.get());
    }

    bool have_words = false;
    for (const auto& g : result.granularities) {
        if (g.spec.n == 1 && g.spec.filtered) {
            result.vocabulary_size = g.distinct_tokens;
            have_words = true;
            break;
        }
    }
    if (!have_words) {
        result.vocabulary_size = count_tokens(cleaned, 1, true).distinct();
    }

    result.source_proportions = source_word_proportions(cleaned);

    auto stop_time = std::chrono::steady_clock::now();
    result.run_time_seconds = std::chrono::duration<double>(stop_time - start_time).count();

    std::cout << "[Pipeline] Vocabulary: " << result.vocabulary_size << " distinct words" << std::endl;
    std::cout << "[Pipeline] Done in " << result.run_time_seconds << " s" << std::endl;
    return result;
}

PipelineResult CoveragePipeline::run_from_config() const {
    std::vector<SourceCorpus> corpora;
    for (const auto& source : config_.sources()) {
        SourceCorpus corpus;
        if (!load_source_corpus(source.name, source.path, corpus)) {
            throw std::runtime_error("Could not read source '" + source.name + "' from " + source.path);
        }
        corpora.push_back(std::move(corpus));
    }
    return run(corpora);
}

bool CoveragePipeline::save_results(const PipelineResult& result, const std::string& output_dir) const {
    try {
        fs::create_directories(output_dir);
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Error: could not create " << output_dir << ": " << e.what() << std::endl;
        return false;
    }

    bool ok = save_summary_json(result.summaries, (fs::path(output_dir) / "repo_summary.json").string());

    json report;
    report["seed"] = config_.seed();
    report["sample_fraction"] = config_.sample_fraction();
    report["sampled_records"] = result.sampled_records;
    report["vocabulary_size"] = result.vocabulary_size;
    report["run_time_seconds"] = result.run_time_seconds;
    report["granularities"] = json::array();

    for (const auto& g : result.granularities) {
        json entry;
        entry["name"] = g.spec.name;
        entry["n"] = g.spec.n;
        entry["filtered"] = g.spec.filtered;
        entry["total_tokens"] = g.total_tokens;
        entry["distinct_tokens"] = g.distinct_tokens;
        entry["coverage"] = json::array();

        for (const auto& c : g.coverage) {
            std::string file = coverage_file_stem(g.spec.name, c.threshold) + ".json";
            json table = coverage_to_json(c);
            if (g.spec.n > 1) {
                for (auto& row : table["entries"]) {
                    row["words"] = split_ngram(row["token"].get<std::string>());
                }
            }
            ok = write_json_file(table, (fs::path(output_dir) / file).string(), 2) && ok;
            entry["coverage"].push_back({{"threshold", c.threshold}, {"size", c.size()}, {"file", file}});
        }
        report["granularities"].push_back(entry);
    }

    json by_source = json::array();
    for (const auto& sp : result.source_proportions) {
        json rows = json::array();
        for (const auto& r : sp.ranked) {
            rows.push_back({{"token", r.token}, {"count", r.count}, {"proportion", r.proportion}});
        }
        by_source.push_back({{"source", sp.source}, {"total_tokens", sp.total_tokens}, {"words", rows}});
    }
    ok = write_json_file(by_source, (fs::path(output_dir) / "word_proportions_by_source.json").string(), -1) && ok;
    ok = write_json_file(report, (fs::path(output_dir) / "report.json").string(), 2) && ok;

    if (ok) {
        std::cout << "[Pipeline] Saved results to " << output_dir << std::endl;
    } else {
        std::cerr << "[Pipeline] Some results could not be saved to " << output_dir << std::endl;
    }
    return ok;
}
