// DocCrawler headers
#include "crawler/CrawlerOptions.hpp"
#include <options/Options.hpp>

// Fakes
#include "fakes/TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

namespace DocCrawler::test {

  using shared_opts::Options;

  namespace {
    Options::ParseResult parse(std::vector<std::string> args, std::string& err) {
      args.insert(args.begin(), "doc-crawler");
      std::vector<char*> argv;
      for (auto& a : args) argv.push_back(a.data());
      return Options::load_and_parse(static_cast<int>(argv.size()), argv.data(), err);
    }
  } // namespace

  TEST(CrawlerOptionsTest, DefaultsApplyWithOnlyAJobName) {
    std::string err;
    ASSERT_EQ(parse({"docs"}, err), Options::ParseResult::Ok) << err;
    EXPECT_EQ(crawler_opts::get_job_name(), std::optional<std::string>("docs"));
    EXPECT_EQ(crawler_opts::get_loop(), std::optional<int>(-1));
    EXPECT_EQ(crawler_opts::get_rest(), std::optional<bool>(false));
    EXPECT_EQ(crawler_opts::get_shutdown_timeout_seconds(), std::optional<int>(0));
    ASSERT_TRUE(crawler_opts::get_config_dir().has_value());
    EXPECT_EQ(std::filesystem::path(*crawler_opts::get_config_dir()).filename(), ".doc-crawler");
  }

  TEST(CrawlerOptionsTest, CommandLineOverridesDefaults) {
    std::string err;
    ASSERT_EQ(parse({"--loop", "3", "--rest", "--debug", "--shutdown-timeout", "10", "--config-dir", "/tmp/jobs", "nightly"}, err),
              Options::ParseResult::Ok) << err;
    EXPECT_EQ(crawler_opts::get_job_name(), std::optional<std::string>("nightly"));
    EXPECT_EQ(crawler_opts::get_loop(), std::optional<int>(3));
    EXPECT_EQ(crawler_opts::get_rest(), std::optional<bool>(true));
    EXPECT_EQ(crawler_opts::get_debug(), std::optional<bool>(true));
    EXPECT_EQ(crawler_opts::get_shutdown_timeout_seconds(), std::optional<int>(10));
    EXPECT_EQ(crawler_opts::get_config_dir(), std::optional<std::string>("/tmp/jobs"));
  }

  TEST(CrawlerOptionsTest, ConfigFileSectionProvidesDefaults) {
    TempDir dir;
    const auto config = dir.path() / "crawler.json";
    std::ofstream(config) << R"({"crawler": {"loop": 1, "config_dir": "jobs", "rest": true}})";

    std::string err;
    ASSERT_EQ(parse({"-c", config.string(), "docs"}, err), Options::ParseResult::Ok) << err;
    EXPECT_EQ(crawler_opts::get_loop(), std::optional<int>(1));
    EXPECT_EQ(crawler_opts::get_rest(), std::optional<bool>(true));
    EXPECT_EQ(crawler_opts::get_config_dir(), std::optional<std::string>((dir.path() / "jobs").string()));
  }

  TEST(CrawlerOptionsTest, MissingJobOrMalformedConfigIsAnError) {
    std::string err;
    EXPECT_EQ(parse({}, err), Options::ParseResult::Error);
    EXPECT_FALSE(err.empty());

    TempDir dir;
    const auto config = dir.path() / "broken.json";
    std::ofstream(config) << "{ not json";
    err.clear();
    EXPECT_EQ(parse({"-c", config.string(), "docs"}, err), Options::ParseResult::Error);
    EXPECT_NE(err.find("broken.json"), std::string::npos);
  }

  TEST(CrawlerOptionsTest, NegativeShutdownTimeoutIsRejected) {
    std::string err;
    EXPECT_EQ(parse({"--shutdown-timeout", "-1", "docs"}, err), Options::ParseResult::Error);
  }

} // namespace DocCrawler::test
