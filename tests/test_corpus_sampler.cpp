// =============================================================================
// Corpus Sampler Tests
// =============================================================================

#include <gtest/gtest.h>
#include "corpus_sampler.hpp"
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

SourceCorpus numbered_corpus(const std::string& name, size_t lines) {
    std::vector<std::string> text;
    for (size_t i = 0; i < lines; ++i) text.push_back(name + " line " + std::to_string(i));
    return make_source_corpus(name, text);
}

std::vector<std::string> texts(const std::vector<Record>& records) {
    std::vector<std::string> out;
    for (const auto& r : records) out.push_back(r.text);
    return out;
}

}

class CorpusSamplerTest : public ::testing::Test {
protected:
    SourceCorpus blogs = numbered_corpus("blogs", 1000);
    SourceCorpus news = numbered_corpus("news", 400);
};

TEST_F(CorpusSamplerTest, SampleSizeIsFloor) {
    CorpusSampler sampler(1001, 0.1);
    EXPECT_EQ(sampler.sample_size(1000), 100u);
    EXPECT_EQ(sampler.sample_size(19), 1u);
    EXPECT_EQ(sampler.sample_size(9), 0u);
    EXPECT_EQ(sampler.sample(blogs).size(), 100u);
}

TEST_F(CorpusSamplerTest, SameSeedSameSample) {
    CorpusSampler a(1001, 0.1);
    CorpusSampler b(1001, 0.1);
    EXPECT_EQ(texts(a.sample(blogs)), texts(b.sample(blogs)));
    EXPECT_EQ(texts(a.sample(blogs)), texts(a.sample(blogs)));
}

TEST_F(CorpusSamplerTest, DifferentSeedDifferentSample) {
    CorpusSampler a(1001, 0.1);
    CorpusSampler b(2002, 0.1);
    EXPECT_NE(texts(a.sample(blogs)), texts(b.sample(blogs)));
}

TEST_F(CorpusSamplerTest, DrawsWithoutReplacement) {
    CorpusSampler sampler(7, 0.5);
    auto sample = texts(sampler.sample(blogs));
    std::set<std::string> unique(sample.begin(), sample.end());
    EXPECT_EQ(unique.size(), sample.size());

    std::set<std::string> all(blogs.lines.begin(), blogs.lines.end());
    for (const auto& line : sample) {
        EXPECT_TRUE(all.count(line)) << line;
    }
}

TEST_F(CorpusSamplerTest, FullFractionTakesEverything) {
    CorpusSampler sampler(1001, 1.0);
    auto sample = texts(sampler.sample(news));
    ASSERT_EQ(sample.size(), news.lines.size());
    std::set<std::string> got(sample.begin(), sample.end());
    std::set<std::string> want(news.lines.begin(), news.lines.end());
    EXPECT_EQ(got, want);
}

TEST_F(CorpusSamplerTest, RecordsTaggedWithSource) {
    CorpusSampler sampler(1001, 0.1);
    for (const auto& r : sampler.sample(news)) {
        EXPECT_EQ(r.source, "news");
    }
}

TEST_F(CorpusSamplerTest, SampleAllConcatenatesInSourceOrder) {
    CorpusSampler sampler(1001, 0.1);
    auto all = sampler.sample_all({blogs, news});
    ASSERT_EQ(all.size(), 140u);
    for (size_t i = 0; i < 100; ++i) EXPECT_EQ(all[i].source, "blogs");
    for (size_t i = 100; i < 140; ++i) EXPECT_EQ(all[i].source, "news");
}

// A source's sample must not depend on which other sources are present
TEST_F(CorpusSamplerTest, SourcesSampledIndependently) {
    CorpusSampler sampler(1001, 0.1);
    auto alone = sampler.sample_all({news});
    auto with_blogs = sampler.sample_all({blogs, news});
    auto bigger_blogs = sampler.sample_all({numbered_corpus("blogs", 5000), news});

    std::vector<Record> news_part(with_blogs.begin() + 100, with_blogs.end());
    std::vector<Record> news_part2(bigger_blogs.begin() + 500, bigger_blogs.end());
    EXPECT_EQ(texts(alone), texts(news_part));
    EXPECT_EQ(texts(alone), texts(news_part2));
}

TEST_F(CorpusSamplerTest, TooSmallCorpusGivesEmptySample) {
    CorpusSampler sampler(1001, 0.1);
    EXPECT_TRUE(sampler.sample(numbered_corpus("tiny", 3)).empty());
    EXPECT_TRUE(sampler.sample(numbered_corpus("none", 0)).empty());
}

TEST_F(CorpusSamplerTest, InvalidFractionThrows) {
    EXPECT_THROW(CorpusSampler(1, 0.0), std::invalid_argument);
    EXPECT_THROW(CorpusSampler(1, -0.2), std::invalid_argument);
    EXPECT_THROW(CorpusSampler(1, 1.5), std::invalid_argument);
    EXPECT_THROW(CorpusSampler(1, std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_NO_THROW(CorpusSampler(1, 1.0));
}
