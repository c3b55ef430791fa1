// =============================================================================
// Pipeline Config Tests
// =============================================================================

#include <gtest/gtest.h>
#include "pipeline_config.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("corpus_coverage_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write_config(const std::string& content) {
        fs::path p = dir_ / "config.json";
        std::ofstream out(p);
        out << content;
        return p.string();
    }

    fs::path dir_;
};

TEST_F(PipelineConfigTest, Defaults) {
    PipelineConfig config;
    EXPECT_EQ(config.seed(), 1001u);
    EXPECT_DOUBLE_EQ(config.sample_fraction(), 0.1);
    EXPECT_FALSE(config.lowercase());
    EXPECT_GE(config.workers(), 1u);
    EXPECT_TRUE(config.sources().empty());

    const auto& g = config.granularities();
    ASSERT_EQ(g.size(), 4u);
    EXPECT_EQ(g[0].n, 1u);
    EXPECT_TRUE(g[0].filtered);
    EXPECT_EQ(g[0].thresholds, (std::vector<double>{0.5, 0.9}));
    for (size_t i = 1; i < 4; ++i) {
        EXPECT_EQ(g[i].n, i + 1);
        EXPECT_FALSE(g[i].filtered);
        EXPECT_EQ(g[i].thresholds, (std::vector<double>{0.9}));
    }
}

TEST_F(PipelineConfigTest, LoadFromJson) {
    std::string path = write_config(R"({
        "seed": 42,
        "sample_fraction": 0.25,
        "stopwords_path": "stop.txt",
        "profanity_path": "bad.txt",
        "lowercase": true,
        "workers": 2,
        "verbose": false,
        "sources": [{"name": "news", "path": "news.txt"}, {"name": "blogs", "path": "blogs.txt"}],
        "granularities": [{"name": "word", "n": 1, "filtered": true, "thresholds": [0.5]},
                          {"name": "bigram", "n": 2}]
    })");

    PipelineConfig config;
    ASSERT_TRUE(config.load_from_json(path));
    EXPECT_EQ(config.seed(), 42u);
    EXPECT_DOUBLE_EQ(config.sample_fraction(), 0.25);
    EXPECT_EQ(config.stopwords_path(), "stop.txt");
    EXPECT_EQ(config.profanity_path(), "bad.txt");
    EXPECT_TRUE(config.lowercase());
    EXPECT_EQ(config.workers(), 2u);
    EXPECT_FALSE(config.verbose());

    ASSERT_EQ(config.sources().size(), 2u);
    EXPECT_EQ(config.sources()[0].name, "news");
    EXPECT_EQ(config.sources()[1].path, "blogs.txt");

    ASSERT_EQ(config.granularities().size(), 2u);
    EXPECT_EQ(config.granularities()[1].n, 2u);
    EXPECT_FALSE(config.granularities()[1].filtered);
    EXPECT_EQ(config.granularities()[1].thresholds, (std::vector<double>{0.9}));
}

TEST_F(PipelineConfigTest, MissingKeysKeepDefaults) {
    std::string path = write_config(R"({"seed": 7})");
    PipelineConfig config;
    ASSERT_TRUE(config.load_from_json(path));
    EXPECT_EQ(config.seed(), 7u);
    EXPECT_DOUBLE_EQ(config.sample_fraction(), 0.1);
    EXPECT_EQ(config.granularities().size(), 4u);
}

TEST_F(PipelineConfigTest, MissingOrMalformedFile) {
    PipelineConfig config;
    EXPECT_FALSE(config.load_from_json((dir_ / "absent.json").string()));
    EXPECT_FALSE(config.load_from_json(write_config("{ not json")));
    EXPECT_FALSE(config.load_from_json(write_config(R"({"seed": "abc"})")));
}

TEST_F(PipelineConfigTest, InvalidFractionIsConfigError) {
    PipelineConfig config;
    EXPECT_THROW(config.set_sample_fraction(0.0), std::invalid_argument);
    EXPECT_THROW(config.set_sample_fraction(1.01), std::invalid_argument);
    EXPECT_THROW(config.load_from_json(write_config(R"({"sample_fraction": 2.0})")), std::invalid_argument);
    EXPECT_DOUBLE_EQ(config.sample_fraction(), 0.1);
}

TEST_F(PipelineConfigTest, ZeroNGranularityRejected) {
    PipelineConfig config;
    EXPECT_THROW(config.set_granularities({{"bad", 0, false, {0.9}}}), std::invalid_argument);
}

TEST_F(PipelineConfigTest, WorkersClamped) {
    PipelineConfig config;
    config.set_workers(0);
    EXPECT_EQ(config.workers(), 1u);
    config.set_workers(1000000);
    EXPECT_EQ(config.workers(), PipelineConfig::max_workers());
    EXPECT_GE(PipelineConfig::max_workers(), 4u);
}

TEST_F(PipelineConfigTest, NonPositiveWorkersInJsonRejected) {
    PipelineConfig config;
    config.set_workers(2);
    EXPECT_THROW(config.load_from_json(write_config(R"({"workers": -1})")), std::invalid_argument);
    EXPECT_THROW(config.load_from_json(write_config(R"({"workers": 0})")), std::invalid_argument);
    EXPECT_EQ(config.workers(), 2u);
}

// A file with one bad value changes nothing, even keys read before it
TEST_F(PipelineConfigTest, FailedLoadLeavesConfigUntouched) {
    PipelineConfig config;
    config.set_workers(2);
    std::string path = write_config(R"({
        "seed": 42,
        "workers": 3,
        "lowercase": true,
        "sources": [{"name": "news", "path": "news.txt"}],
        "granularities": [{"name": "word", "n": 0}]
    })");

    EXPECT_THROW(config.load_from_json(path), std::invalid_argument);
    EXPECT_EQ(config.seed(), 1001u);
    EXPECT_EQ(config.workers(), 2u);
    EXPECT_FALSE(config.lowercase());
    EXPECT_TRUE(config.sources().empty());
    EXPECT_EQ(config.granularities().size(), 4u);

    EXPECT_FALSE(config.load_from_json(write_config(R"({"seed": 42, "verbose": "yes"})")));
    EXPECT_EQ(config.seed(), 1001u);
}

TEST_F(PipelineConfigTest, DuplicateCoverageFilesRejected) {
    PipelineConfig config;
    // Both thresholds print as "90"
    EXPECT_THROW(config.set_granularities({{"word", 1, true, {0.9, 0.9000001}}}), std::invalid_argument);
    EXPECT_THROW(config.set_granularities({{"word", 1, true, {0.5}}, {"word", 1, false, {0.5}}}),
                 std::invalid_argument);
    EXPECT_EQ(config.granularities().size(), 4u);

    config.set_granularities({{"word", 1, true, {0.5, 0.9}}, {"bigram", 2, false, {0.9}}});
    EXPECT_EQ(config.granularities().size(), 2u);
}

TEST_F(PipelineConfigTest, CoverageFileStem) {
    EXPECT_EQ(coverage_file_stem("word", 0.5), "word_cover_50");
    EXPECT_EQ(coverage_file_stem("bigram", 0.9), "bigram_cover_90");
}
