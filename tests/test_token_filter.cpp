// =============================================================================
// Token Filter Tests
// =============================================================================

#include <gtest/gtest.h>
#include "token_filter.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using Tokens = std::vector<std::string>;

class TokenFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("corpus_coverage_filter_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        fs::path p = dir_ / name;
        std::ofstream out(p);
        out << content;
        return p.string();
    }

    TokenFilter make_filter() {
        return TokenFilter({"the", "a", "and", "of"}, {"darn", "heck"});
    }

    fs::path dir_;
};

TEST_F(TokenFilterTest, RemovesStopwordsAndProfanity) {
    TokenFilter filter = make_filter();
    Tokens words = {"the", "fox", "and", "a", "darn", "dog"};
    EXPECT_EQ(filter.apply(words), (Tokens{"fox", "dog"}));
}

TEST_F(TokenFilterTest, CaseNormalizedComparison) {
    TokenFilter filter = make_filter();
    EXPECT_TRUE(filter.is_stopword("The"));
    EXPECT_TRUE(filter.is_profane("HECK"));
    EXPECT_FALSE(filter.is_excluded("Fox"));
}

TEST_F(TokenFilterTest, ExactMatchOnly) {
    TokenFilter filter({"run"}, {});
    EXPECT_FALSE(filter.is_excluded("runs"));
    EXPECT_FALSE(filter.is_excluded("rerun"));
    EXPECT_TRUE(filter.is_excluded("run"));
}

// Nothing in either list survives the filter
TEST_F(TokenFilterTest, Exclusivity) {
    TokenFilter filter = make_filter();
    NGramSequence words("The fox and a Dog of the darn heck night and day", 1);
    Tokens kept = filter.apply(words);
    EXPECT_EQ(kept, (Tokens{"fox", "Dog", "night", "day"}));
    for (const auto& w : kept) {
        EXPECT_FALSE(filter.is_excluded(w)) << w;
    }
}

TEST_F(TokenFilterTest, LoadWordList) {
    std::string path = write_file("words.csv", "The\n  AND \ndarn, heck\ndon't\n\n  \n");
    auto words = TokenFilter::load_word_list(path);
    EXPECT_EQ(words.size(), 5u);
    EXPECT_TRUE(words.count("the"));
    EXPECT_TRUE(words.count("and"));
    EXPECT_TRUE(words.count("darn"));
    EXPECT_TRUE(words.count("heck"));
    EXPECT_TRUE(words.count("dont"));
}

TEST_F(TokenFilterTest, FromFiles) {
    std::string stop = write_file("stop.txt", "the\nof\n");
    std::string prof = write_file("prof.txt", "darn\n");
    TokenFilter filter = TokenFilter::from_files(stop, prof);
    EXPECT_EQ(filter.stopword_count(), 2u);
    EXPECT_EQ(filter.profanity_count(), 1u);
    EXPECT_TRUE(filter.is_excluded("darn"));
}

TEST_F(TokenFilterTest, MissingListIsFatal) {
    std::string stop = write_file("stop.txt", "the\n");
    std::string missing = (dir_ / "missing.txt").string();
    EXPECT_THROW(TokenFilter::load_word_list(missing), std::runtime_error);
    EXPECT_THROW(TokenFilter::from_files(stop, missing), std::runtime_error);
    EXPECT_THROW(TokenFilter::from_files(missing, stop), std::runtime_error);
}
