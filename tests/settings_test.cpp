// DocCrawler headers
#include "settings/Protocol.hpp"
#include "settings/SettingsLoader.hpp"
#include "settings/SettingsValidator.hpp"
#include "logger.hpp"

// Fakes
#include "fakes/TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <fstream>

namespace DocCrawler::test {

  using Config::CrawlSettings;
  using Config::ServerSettings;
  using Config::SettingsLoader;
  using Config::SettingsValidator;

  namespace {
    CrawlSettings valid_local(const std::string& name = "docs") {
      auto s = SettingsLoader::defaults(name);
      s.fs.url = "/srv/docs";
      return s;
    }

    CrawlSettings valid_ssh() {
      auto s = valid_local();
      ServerSettings server;
      server.hostname = "files.example.org";
      server.port = 22;
      server.username = "crawler";
      server.password = "secret";
      server.protocol = "ssh";
      s.server = server;
      return s;
    }
  } // namespace

  TEST(ProtocolTest, ParsesKnownNames) {
    EXPECT_EQ(Config::parse_protocol("local"), Config::Protocol::Local);
    EXPECT_EQ(Config::parse_protocol("ssh"), Config::Protocol::Ssh);
    EXPECT_EQ(Config::parse_protocol("ftp"), Config::Protocol::Ftp);
    EXPECT_FALSE(Config::parse_protocol("smb").has_value());
    EXPECT_EQ(Config::supported_protocols(), "local, ssh, ftp");
    EXPECT_EQ(Config::default_port(Config::Protocol::Ssh), 22);
    EXPECT_EQ(Config::default_port(Config::Protocol::Ftp), 21);
  }

  TEST(ProtocolTest, NamesMatchExactly) {
    EXPECT_FALSE(Config::parse_protocol("SSH").has_value());
    EXPECT_FALSE(Config::parse_protocol("Ftp").has_value());
    EXPECT_FALSE(Config::parse_protocol(" local").has_value());
  }

  TEST(SettingsLoaderTest, DefaultsMatchTheDocumentedValues) {
    auto s = SettingsLoader::defaults("docs");
    EXPECT_EQ(s.name, "docs");
    EXPECT_EQ(s.fs.url, "/tmp/es");
    EXPECT_EQ(s.fs.update_rate, std::chrono::minutes(15));
    ASSERT_EQ(s.fs.excludes.size(), 1u);
    EXPECT_EQ(s.fs.excludes[0], "*/~*");
    EXPECT_TRUE(s.fs.index_folders);
    EXPECT_TRUE(s.fs.add_filesize);
    EXPECT_FALSE(s.fs.follow_symlinks);
    EXPECT_FALSE(s.server.has_value());
    EXPECT_EQ(s.protocol_name(), "local");
    EXPECT_EQ(s.index_name(), "docs");
    EXPECT_EQ(s.folder_index_name(), "docs_folder");
  }

  TEST(SettingsLoaderTest, FromJsonAppliesFieldsAndServerDefaultPort) {
    auto j = nlohmann::json::parse(R"({
      "name": "remote",
      "fs": { "url": "/data", "update_rate": "30s", "includes": ["*.pdf"], "checksum": "MD5" },
      "server": { "hostname": "ftp.example.org", "protocol": "ftp", "username": "anon" },
      "backend": { "index": "remote_docs" }
    })");

    auto s = SettingsLoader::from_json(j);
    EXPECT_EQ(s.name, "remote");
    EXPECT_EQ(s.fs.url, "/data");
    EXPECT_EQ(s.fs.update_rate, std::chrono::seconds(30));
    ASSERT_EQ(s.fs.includes.size(), 1u);
    EXPECT_EQ(s.fs.includes[0], "*.pdf");
    EXPECT_EQ(s.fs.checksum, std::optional<std::string>("MD5"));
    ASSERT_TRUE(s.server.has_value());
    EXPECT_EQ(s.server->port, 21);
    EXPECT_EQ(s.protocol_name(), "ftp");
    EXPECT_EQ(s.index_name(), "remote_docs");
    EXPECT_EQ(s.folder_index_name(), "remote_folder");
  }

  TEST(SettingsLoaderTest, UpdateRateAcceptsIntegerSeconds) {
    auto s = SettingsLoader::from_json(nlohmann::json::parse(R"({"fs": {"update_rate": 90}})"));
    EXPECT_EQ(s.fs.update_rate, std::chrono::seconds(90));
  }

  TEST(SettingsLoaderTest, UpdateRateOutOfRangeThrows) {
    EXPECT_THROW(SettingsLoader::from_json(nlohmann::json::parse(R"({"fs": {"update_rate": 10000000000000000}})")),
                 std::runtime_error);
    EXPECT_THROW(SettingsLoader::from_json(nlohmann::json::parse(R"({"fs": {"update_rate": 18446744073709551615}})")),
                 std::runtime_error);
    EXPECT_THROW(SettingsLoader::from_json(nlohmann::json::parse(R"({"fs": {"update_rate": -5}})")),
                 std::runtime_error);
  }

  TEST(SettingsLoaderTest, WrongFieldTypeThrows) {
    EXPECT_THROW(SettingsLoader::from_json(nlohmann::json::parse(R"({"fs": {"url": 12}})")), std::runtime_error);
    EXPECT_THROW(SettingsLoader::from_json(nlohmann::json::parse(R"({"fs": []})")), std::runtime_error);
    EXPECT_THROW(SettingsLoader::from_json(nlohmann::json::parse(R"({"fs": {"update_rate": "soon"}})")), std::runtime_error);
    EXPECT_THROW(SettingsLoader::from_json(nlohmann::json::array()), std::runtime_error);
  }

  TEST(SettingsLoaderTest, ParsesAndFormatsDurations) {
    EXPECT_EQ(SettingsLoader::parse_duration("500ms"), std::chrono::milliseconds(500));
    EXPECT_EQ(SettingsLoader::parse_duration("15m"), std::chrono::minutes(15));
    EXPECT_EQ(SettingsLoader::parse_duration("2h"), std::chrono::hours(2));
    EXPECT_EQ(SettingsLoader::parse_duration("1d"), std::chrono::hours(24));
    EXPECT_EQ(SettingsLoader::parse_duration("45"), std::chrono::seconds(45));
    EXPECT_THROW(SettingsLoader::parse_duration("-5s"), std::runtime_error);
    EXPECT_THROW(SettingsLoader::parse_duration("5 weeks"), std::runtime_error);
    EXPECT_THROW(SettingsLoader::parse_duration("200000000000000d"), std::runtime_error);
    EXPECT_THROW(SettingsLoader::parse_duration("9223372036854776s"), std::runtime_error);
    EXPECT_EQ(SettingsLoader::parse_duration("9223372036854775ms").count(), 9223372036854775LL);

    EXPECT_EQ(SettingsLoader::format_duration(std::chrono::minutes(15)), "15m");
    EXPECT_EQ(SettingsLoader::format_duration(std::chrono::milliseconds(1500)), "1500ms");
    EXPECT_EQ(SettingsLoader::format_duration(std::chrono::milliseconds(0)), "0s");
  }

  TEST(SettingsLoaderTest, LoadJobReadsSavedSettingsAndDefaultsTheName) {
    TempDir dir;
    auto s = valid_local("");
    s.fs.update_rate = std::chrono::minutes(5);
    SettingsLoader::save(s, dir.path() / "nightly" / SettingsLoader::kSettingsFile);

    auto loaded = SettingsLoader::load_job(dir.path(), "nightly");
    EXPECT_EQ(loaded.name, "nightly");
    EXPECT_EQ(loaded.fs.url, "/srv/docs");
    EXPECT_EQ(loaded.fs.update_rate, std::chrono::minutes(5));
  }

  TEST(SettingsLoaderTest, LoadJobWithoutSettingsFileThrows) {
    TempDir dir;
    EXPECT_THROW(SettingsLoader::load_job(dir.path(), "missing"), std::runtime_error);
  }

  TEST(SettingsLoaderTest, MalformedSettingsFileThrows) {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "broken");
    std::ofstream(dir.path() / "broken" / SettingsLoader::kSettingsFile) << "{ \"name\": ";
    EXPECT_THROW(SettingsLoader::load_job(dir.path(), "broken"), std::runtime_error);
  }

  TEST(SettingsValidatorTest, AcceptsValidLocalAndSshSettings) {
    EXPECT_TRUE(SettingsValidator::collect_errors(valid_local()).empty());
    EXPECT_TRUE(SettingsValidator::collect_errors(valid_ssh()).empty());

    auto with_key = valid_ssh();
    with_key.server->password.clear();
    with_key.server->pem_path = "/home/crawler/.ssh/id_rsa";
    EXPECT_TRUE(SettingsValidator::collect_errors(with_key).empty());
  }

  TEST(SettingsValidatorTest, RejectsUnsupportedChecksum) {
    auto s = valid_local();
    s.fs.checksum = "CRC32";
    EXPECT_EQ(SettingsValidator::collect_errors(s).size(), 1u);

    s.fs.checksum = "sha-256";
    EXPECT_TRUE(SettingsValidator::collect_errors(s).empty());
  }

  TEST(SettingsValidatorTest, RejectsXmlAndJsonTogether) {
    auto s = valid_local();
    s.fs.xml_support = true;
    s.fs.json_support = true;
    EXPECT_EQ(SettingsValidator::collect_errors(s).size(), 1u);
  }

  TEST(SettingsValidatorTest, RejectsMissingOrUnusableName) {
    EXPECT_FALSE(SettingsValidator::collect_errors(valid_local("")).empty());
    EXPECT_FALSE(SettingsValidator::collect_errors(valid_local("a/b")).empty());
    EXPECT_FALSE(SettingsValidator::collect_errors(valid_local("..")).empty());
  }

  TEST(SettingsValidatorTest, RejectsSshWithoutCredentials) {
    auto s = valid_ssh();
    s.server->username.clear();
    EXPECT_EQ(SettingsValidator::collect_errors(s).size(), 1u);

    s = valid_ssh();
    s.server->password.clear();
    EXPECT_EQ(SettingsValidator::collect_errors(s).size(), 1u);
  }

  TEST(SettingsValidatorTest, RejectsNonPositiveUpdateRate) {
    auto s = valid_local();
    s.fs.update_rate = std::chrono::milliseconds(0);
    EXPECT_EQ(SettingsValidator::collect_errors(s).size(), 1u);
  }

  TEST(SettingsValidatorTest, RejectsIdenticalIndexNames) {
    auto s = valid_local();
    s.backend.index = "shared";
    s.backend.index_folder = "shared";
    EXPECT_EQ(SettingsValidator::collect_errors(s).size(), 1u);
  }

  TEST(SettingsValidatorTest, LeavesUnknownProtocolToTheSelector) {
    auto s = valid_local();
    ServerSettings server;
    server.protocol = "smb";
    s.server = server;
    EXPECT_TRUE(SettingsValidator::collect_errors(s).empty());
  }

  TEST(SettingsValidatorTest, ValidateLogsEveryError) {
    auto logger = std::make_shared<Logger>("test");
    auto sink = std::make_shared<VectorSink>();
    logger->add_sink(sink);

    auto s = valid_ssh();
    s.server->username.clear();
    s.fs.checksum = "CRC32";

    EXPECT_TRUE(SettingsValidator::validate(s, logger));
    EXPECT_EQ(sink->get_lines(0, SIZE_MAX, LogLevel::Error).size(), 2u);
    EXPECT_TRUE(sink->contains("When using SSH"));

    EXPECT_FALSE(SettingsValidator::validate(valid_local(), logger));
  }

} // namespace DocCrawler::test
