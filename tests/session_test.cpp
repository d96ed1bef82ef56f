// DocCrawler headers
#include "crawler/session/CrawlSession.hpp"
#include "crawler/worker/JobStatus.hpp"
#include "settings/SettingsLoader.hpp"

// Fakes
#include "fakes/FakeServices.hpp"
#include "fakes/FakeWorker.hpp"
#include "fakes/TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <fstream>
#include <future>
#include <thread>

namespace DocCrawler::test {

  using namespace std::chrono_literals;
  using Workers::WorkerKind;

  class CrawlSessionTest : public ::testing::Test {
  protected:
    void SetUp() override {
      log = std::make_shared<CallLog>();
      management = std::make_shared<FakeManagementService>(log);
      documents = std::make_shared<FakeDocumentService>(log);

      logger = std::make_shared<Logger>("test");
      sink = std::make_shared<VectorSink>();
      sink->set_level(LogLevel::Debug);
      logger->add_sink(sink);

      settings = Config::SettingsLoader::defaults("docs");
      settings.fs.url = (dir.path() / "tree").string();
      std::filesystem::create_directories(settings.fs.url);

      for (auto kind : {WorkerKind::Noop, WorkerKind::Local, WorkerKind::Ssh, WorkerKind::Ftp}) {
        workers.register_worker(kind, [this, kind](Workers::WorkerContext) -> std::unique_ptr<Workers::ICrawlWorker> {
          auto worker = std::make_unique<FakeWorker>(kind, stubborn, quick);
          last_worker = worker.get();
          return worker;
        });
      }
    }

    SessionDependencies fakes() {
      SessionDependencies deps;
      deps.services = Services::ServiceBundle{management, documents};
      deps.workers = &workers;
      return deps;
    }

    std::unique_ptr<CrawlSession> make_session(int loop, bool rest = false) {
      return std::make_unique<CrawlSession>(dir.path() / "config", settings, loop, rest, logger, fakes());
    }

    Config::ServerSettings ssh_server() {
      Config::ServerSettings server;
      server.hostname = "files.example.org";
      server.port = 22;
      server.username = "crawler";
      server.password = "secret";
      server.protocol = "ssh";
      return server;
    }

    TempDir dir;
    std::shared_ptr<CallLog> log;
    std::shared_ptr<FakeManagementService> management;
    std::shared_ptr<FakeDocumentService> documents;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<VectorSink> sink;
    Config::CrawlSettings settings;
    Workers::WorkerRegistry workers;
    bool stubborn = false;
    bool quick = false;
    FakeWorker* last_worker = nullptr;
  };

  TEST_F(CrawlSessionTest, InvalidSettingsMakeConstructionThrow) {
    auto bad_checksum = settings;
    bad_checksum.fs.checksum = "CRC32";
    auto both_parsers = settings;
    both_parsers.fs.xml_support = true;
    both_parsers.fs.json_support = true;
    auto no_name = settings;
    no_name.name.clear();
    auto ssh_no_user = settings;
    ssh_no_user.server = ssh_server();
    ssh_no_user.server->username.clear();
    auto no_rate = settings;
    no_rate.fs.update_rate = 0ms;

    for (const auto& s : {bad_checksum, both_parsers, no_name, ssh_no_user, no_rate}) {
      EXPECT_THROW(CrawlSession(dir.path() / "config", s, 1, false, logger, fakes()), std::runtime_error);
    }
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "config" / "docs"));
  }

  TEST_F(CrawlSessionTest, ValidSettingsConstructWithoutStartingAnything) {
    auto session = make_session(1);
    EXPECT_NE(session->management_service(), nullptr);
    EXPECT_NE(session->document_service(), nullptr);
    EXPECT_EQ(session->state(), SessionState::Constructed);
    EXPECT_EQ(session->job_dir(), dir.path() / "config" / "docs");
    EXPECT_TRUE(std::filesystem::is_directory(session->job_dir()));
    EXPECT_TRUE(log->calls().empty());
    EXPECT_TRUE(session->worker().is_closed());

    EXPECT_NO_THROW(session->close());
    EXPECT_EQ(session->state(), SessionState::Stopped);
  }

  TEST_F(CrawlSessionTest, DefaultServicesAreBuiltWhenNoneInjected) {
    CrawlSession session(dir.path() / "config", settings, 0, false, logger);
    EXPECT_NE(session.management_service(), nullptr);
    EXPECT_NE(session.document_service(), nullptr);
    EXPECT_EQ(session.worker().kind(), WorkerKind::Noop);
    EXPECT_NO_THROW(session.close());
  }

  TEST_F(CrawlSessionTest, ZeroRunsWithoutRestMakesStartANoop) {
    auto session = make_session(0, false);
    session->start();

    EXPECT_FALSE(management->is_started());
    EXPECT_FALSE(documents->is_started());
    EXPECT_EQ(session->state(), SessionState::Constructed);
    EXPECT_TRUE(sink->contains("Nothing to do"));
    EXPECT_NO_THROW(session->close());
  }

  TEST_F(CrawlSessionTest, ZeroRunsSelectsNoopEvenForSsh) {
    settings.server = ssh_server();
    auto session = make_session(0);
    EXPECT_EQ(session->worker().kind(), WorkerKind::Noop);
  }

  TEST_F(CrawlSessionTest, ProtocolSelectsTheWorker) {
    settings.server = ssh_server();
    EXPECT_EQ(make_session(1)->worker().kind(), WorkerKind::Ssh);

    settings.server->protocol = "ftp";
    settings.server->port = 21;
    EXPECT_EQ(make_session(Workers::LOOP_INFINITE)->worker().kind(), WorkerKind::Ftp);
  }

  TEST_F(CrawlSessionTest, UnsupportedProtocolNamesTheProtocol) {
    auto server = ssh_server();
    server.protocol = "smb";
    settings.server = server;
    try {
      make_session(1);
      FAIL() << "expected UnsupportedProtocolError";
    } catch (const Workers::UnsupportedProtocolError& e) {
      EXPECT_NE(std::string(e.what()).find("smb"), std::string::npos);
    }
  }

  TEST_F(CrawlSessionTest, StartBringsUpServicesInOrderThenLaunchesWorker) {
    auto session = make_session(Workers::LOOP_INFINITE);
    session->start();

    EXPECT_EQ(session->state(), SessionState::Running);
    const std::vector<std::string> expected{"management.start", "documents.start", "documents.create_schema"};
    EXPECT_EQ(log->calls(), expected);
    EXPECT_TRUE(sink->contains("connected to backend version [fake-7.1]"));
    EXPECT_TRUE(sink->contains("watch mode"));
    ASSERT_NE(last_worker, nullptr);
    EXPECT_FALSE(last_worker->is_closed());

    session->close();
  }

  TEST_F(CrawlSessionTest, CloseRightAfterStartStopsWorkerAndServices) {
    auto session = make_session(Workers::LOOP_INFINITE);
    session->start();

    auto closing = std::async(std::launch::async, [&]() { session->close(); });
    ASSERT_EQ(closing.wait_for(10s), std::future_status::ready);
    closing.get();

    EXPECT_FALSE(session->worker_running());
    EXPECT_TRUE(session->worker().is_closed());
    EXPECT_FALSE(management->is_started());
    EXPECT_FALSE(documents->is_started());
    EXPECT_EQ(session->state(), SessionState::Stopped);
    EXPECT_TRUE(sink->contains("Crawl session [docs] stopped"));

    const auto calls = log->calls();
    ASSERT_GE(calls.size(), 2u);
    EXPECT_EQ(calls[calls.size() - 2], "management.close");
    EXPECT_EQ(calls.back(), "documents.close");
  }

  TEST_F(CrawlSessionTest, WorkerThatEndsAtOnceIsNotReportedRunning) {
    quick = true;
    auto session = make_session(Workers::LOOP_INFINITE);
    session->start();

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (session->worker_running() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(5ms);
    }
    EXPECT_FALSE(session->worker_running());
    ASSERT_NE(last_worker, nullptr);
    EXPECT_EQ(last_worker->runs(), 1);

    auto closing = std::async(std::launch::async, [&]() { session->close(); });
    ASSERT_EQ(closing.wait_for(5s), std::future_status::ready);
    closing.get();
    EXPECT_EQ(session->state(), SessionState::Stopped);
  }

  TEST_F(CrawlSessionTest, CloseTwiceDoesNotThrow) {
    auto session = make_session(1);
    session->start();
    EXPECT_NO_THROW(session->close());
    EXPECT_NO_THROW(session->close());
    EXPECT_EQ(management->close_calls.load(), 1);
  }

  TEST_F(CrawlSessionTest, StartTwiceIsRejected) {
    auto session = make_session(1);
    session->start();
    EXPECT_THROW(session->start(), std::logic_error);
    session->close();
  }

  TEST_F(CrawlSessionTest, ServiceStartFailurePropagatesAndCloseStillWorks) {
    management->fail_start = true;
    auto session = make_session(1);
    EXPECT_THROW(session->start(), std::runtime_error);
    EXPECT_FALSE(session->worker_running());
    EXPECT_NO_THROW(session->close());
    EXPECT_EQ(documents->close_calls.load(), 1);
  }

  TEST_F(CrawlSessionTest, ManagementCloseFailureStillClosesDocuments) {
    management->fail_close = true;
    auto session = make_session(1);
    session->start();

    EXPECT_THROW(session->close(), std::runtime_error);
    EXPECT_EQ(documents->close_calls.load(), 1);
    EXPECT_FALSE(documents->is_started());
    EXPECT_EQ(session->state(), SessionState::Stopped);
  }

  TEST_F(CrawlSessionTest, FirstCloseFailureIsTheOneRethrown) {
    management->fail_close = true;
    documents->fail_close = true;
    auto session = make_session(1);

    try {
      session->close();
      FAIL() << "expected the management close failure";
    } catch (const std::runtime_error& e) {
      EXPECT_STREQ(e.what(), "management close failed");
    }
  }

  TEST_F(CrawlSessionTest, ShutdownTimeoutThrowsWhenWorkerIgnoresClose) {
    stubborn = true;
    auto session = make_session(Workers::LOOP_INFINITE);
    session->set_shutdown_timeout(600ms);
    session->start();

    EXPECT_THROW(session->close(), std::runtime_error);
    EXPECT_TRUE(session->worker_running());
    EXPECT_EQ(management->close_calls.load(), 0);
    EXPECT_EQ(session->state(), SessionState::Stopping);

    last_worker->release();
    EXPECT_NO_THROW(session->close());
    EXPECT_EQ(management->close_calls.load(), 1);
  }

  TEST_F(CrawlSessionTest, RealLocalWorkerRunsPassesAndWritesStatus) {
    std::ofstream(std::filesystem::path(settings.fs.url) / "readme.md") << "# docs";
    settings.fs.update_rate = 10ms;
    CrawlSession session(dir.path() / "config", settings, 2, false, logger,
                         SessionDependencies{Services::ServiceBundle{management, documents}, nullptr});
    session.start();
    while (session.worker_running()) std::this_thread::sleep_for(10ms);
    session.close();

    EXPECT_EQ(session.worker().runs(), 2);
    EXPECT_EQ(documents->documents("docs").size(), 1u);
    auto status = Workers::JobStatus::read(session.job_dir());
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->runs, 2);
  }

} // namespace DocCrawler::test
