/**
 * \file crawler/session/CrawlSession.hpp
 * \brief Lifecycle controller for one crawl job.
 */
#pragma once

#include "crawler/worker/ICrawlWorker.hpp"
#include "crawler/worker/WorkerSelector.hpp"
#include "service/ServiceFactory.hpp"
#include "settings/CrawlSettings.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

namespace DocCrawler {

enum class SessionState {
    Constructed,
    Starting,
    Running,
    Stopping,
    Stopped
};

inline std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Constructed: return "constructed";
        case SessionState::Starting:    return "starting";
        case SessionState::Running:     return "running";
        case SessionState::Stopping:    return "stopping";
        case SessionState::Stopped:     return "stopped";
    }
    return "unknown";
}

/** \brief Collaborators a caller may substitute; unset members use the defaults. */
struct SessionDependencies {
    std::optional<Services::ServiceBundle> services;
    const Workers::WorkerRegistry* workers{nullptr};
};

/**
 * \brief Owns the services and the worker thread of a crawl job.
 *
 * Construction validates the settings, prepares "<config_root>/<name>",
 * builds the services and selects the worker; nothing is started.
 * \c start brings up the services, provisions the schema and runs the
 * worker on a dedicated thread. \c close stops the worker cooperatively,
 * waits for it and then closes the services.
 *
 * \c start and \c close must be called from one thread.
 */
class CrawlSession {
public:
    /** \brief Interval at which \c close checks whether the worker thread is gone. */
    static constexpr std::chrono::milliseconds kShutdownPollInterval{500};

    /**
     * \param config_root Root of the per-job state directories; created if missing.
     * \param settings Job settings, validated here.
     * \param loop Run count: 0 none, <0 until closed, N passes.
     * \param rest Whether auxiliary interfaces keep the session alive without crawling.
     * \param logger Shared logger (may be nullptr).
     * \param deps Optional service bundle and worker registry overrides.
     * \throws std::runtime_error on invalid settings or when the job directory can not be created.
     * \throws Workers::UnsupportedProtocolError when no worker handles the configured protocol.
     */
    CrawlSession(std::filesystem::path config_root,
                 Config::CrawlSettings settings,
                 int loop,
                 bool rest,
                 std::shared_ptr<Logger> logger = nullptr,
                 SessionDependencies deps = {});
    ~CrawlSession();

    CrawlSession(const CrawlSession&) = delete;
    CrawlSession& operator=(const CrawlSession&) = delete;

    /**
     * \brief Start services and launch the worker thread.
     *
     * Does nothing when there is no pass to run and REST is off. Service
     * errors propagate as thrown; already started services are left to \c close.
     * \throws std::logic_error when called a second time.
     */
    void start();

    /**
     * \brief Stop the worker, wait for its thread and close both services.
     *
     * Safe before \c start, after a failed \c start and when repeated. Both
     * services are closed even if the first one throws; the first error is
     * rethrown afterwards.
     * \throws std::runtime_error when a shutdown timeout is set and the worker outlives it.
     */
    void close();

    /** \brief Bound the wait for the worker thread in \c close; zero waits forever. */
    void set_shutdown_timeout(std::chrono::milliseconds timeout) { shutdown_timeout_ = timeout; }

    std::shared_ptr<Services::IManagementService> management_service() const { return services_.management; }
    std::shared_ptr<Services::IDocumentService> document_service() const { return services_.documents; }
    Workers::ICrawlWorker& worker() const { return *worker_; }
    SessionState state() const { return state_.load(); }
    const Config::CrawlSettings& settings() const { return settings_; }
    const std::filesystem::path& job_dir() const { return job_dir_; }
    int loop() const { return loop_; }
    bool rest() const { return rest_; }

    /** \brief True while the worker thread is executing \c run. */
    bool worker_running() const { return worker_alive_.load(); }

private:
    void run_worker();
    void wait_for_worker();
    void close_services();

    std::filesystem::path config_root_;
    Config::CrawlSettings settings_;
    std::filesystem::path job_dir_;
    int loop_;
    bool rest_;
    std::shared_ptr<Logger> logger_;

    Services::ServiceBundle services_;
    std::unique_ptr<Workers::ICrawlWorker> worker_;

    std::thread worker_thread_;
    std::atomic<bool> worker_alive_{false};
    std::mutex done_mtx_;
    std::condition_variable done_cv_;

    std::atomic<SessionState> state_{SessionState::Constructed};
    std::chrono::milliseconds shutdown_timeout_{0};
};

} // namespace DocCrawler
