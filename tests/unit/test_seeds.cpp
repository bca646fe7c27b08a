#include <fstream>
#include <sstream>
#include <gtest/gtest.h>
#include "strider/errors.hpp"
#include "../../src/core/config/seeds.hpp"
#include "../../src/core/logger/logger.hpp"

using namespace Strider::Core;

class SeedLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(LOG_NONE);
    }
    void TearDown() override {
        std::remove(file_.c_str());
        Logger::set_level(LOG_ALL);
    }

    void write_file(const std::string& content) {
        std::ofstream ofs(file_);
        ofs << content;
    }

    std::string file_ = "test_seeds.txt";
};

TEST_F(SeedLoaderTest, ReadLinesSkipsCommentsAndBlanks) {
    std::istringstream in("http://a.test\n  # a comment line  \n\n  http://b.test  \n#x\n");
    auto               lines = SeedLoader::read_lines(in);
    EXPECT_EQ(lines, (std::vector<std::string>{"http://a.test", "http://b.test"}));
}

TEST_F(SeedLoaderTest, FromFile) {
    write_file("http://a.test/\nexample.com/path\n\nhttp://a.test\n");
    Config config;
    config.url_file = file_;

    auto seeds = SeedLoader::load(config);
    EXPECT_EQ(seeds, (std::vector<std::string>{"http://a.test/", "https://example.com/path"}));
}

TEST_F(SeedLoaderTest, CliUrlsComeFirst) {
    write_file("http://b.test\n");
    Config config;
    config.urls     = {"http://a.test"};
    config.url_file = file_;

    auto seeds = SeedLoader::load(config);
    EXPECT_EQ(seeds, (std::vector<std::string>{"http://a.test/", "http://b.test/"}));
}

TEST_F(SeedLoaderTest, FromStdin) {
    std::istringstream in("http://stdin.test/a\n");
    Config             config;
    config.url_file = "-";

    auto seeds = SeedLoader::load(config, in);
    EXPECT_EQ(seeds, (std::vector<std::string>{"http://stdin.test/a"}));
}

TEST_F(SeedLoaderTest, EmptyFileIsConfigError) {
    write_file("\n# only comments\n   \n");
    Config config;
    config.url_file = file_;
    EXPECT_THROW(SeedLoader::load(config), Strider::ConfigError);
}

TEST_F(SeedLoaderTest, MissingFileIsConfigError) {
    Config config;
    config.url_file = "no_such_seed_file.txt";
    EXPECT_THROW(SeedLoader::load(config), Strider::ConfigError);
}

TEST_F(SeedLoaderTest, NoSeedsIsConfigError) {
    Config config;
    EXPECT_THROW(SeedLoader::load(config), Strider::ConfigError);
}

TEST_F(SeedLoaderTest, InvalidSeedsSkipped) {
    Config config;
    config.urls = {"ftp://files.test/", "http://ok.test", "http://bad host/"};

    auto seeds = SeedLoader::load(config);
    EXPECT_EQ(seeds, (std::vector<std::string>{"http://ok.test/"}));
}

TEST_F(SeedLoaderTest, AllInvalidIsConfigError) {
    Config config;
    config.urls = {"ftp://files.test/", "mailto:someone@test"};
    EXPECT_THROW(SeedLoader::load(config), Strider::ConfigError);
}
