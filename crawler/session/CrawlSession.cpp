/**
 * \file crawler/session/CrawlSession.cpp
 * \brief Session construction, worker thread and ordered shutdown.
 */
#include "CrawlSession.hpp"
#include "settings/SettingsLoader.hpp"
#include "settings/SettingsValidator.hpp"
#include "processUtils.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>

namespace DocCrawler {

namespace fs = std::filesystem;

CrawlSession::CrawlSession(fs::path config_root,
                           Config::CrawlSettings settings,
                           int loop,
                           bool rest,
                           std::shared_ptr<Logger> logger,
                           SessionDependencies deps)
    : config_root_(std::move(config_root))
    , settings_(std::move(settings))
    , loop_(loop)
    , rest_(rest)
    , logger_(std::move(logger))
{
    std::error_code ec;
    fs::create_directories(config_root_, ec);
    if (ec) {
        throw std::system_error(ec, "Can not create the config directory " + config_root_.string());
    }

    if (Config::SettingsValidator::validate(settings_, logger_)) {
        throw std::runtime_error("Settings of job [" + settings_.name + "] are invalid. Check the logs.");
    }

    job_dir_ = config_root_ / settings_.name;
    try {
        fs::create_directories(job_dir_);
    } catch (const fs::filesystem_error&) {
        std::throw_with_nested(std::runtime_error("Can not create the job config directory " + job_dir_.string()));
    }

    if (deps.services) {
        services_ = std::move(*deps.services);
        if (!services_.management || !services_.documents) {
            throw std::invalid_argument("CrawlSession: injected service bundle is incomplete");
        }
    } else {
        services_ = Services::ServiceFactory::create(settings_, job_dir_, logger_);
    }

    const auto kind = Workers::WorkerSelector::select(settings_.protocol_name(), loop_);
    const Workers::WorkerRegistry& registry = deps.workers ? *deps.workers : Workers::WorkerRegistry::instance();

    Workers::WorkerContext context;
    context.settings = settings_;
    context.job_dir = job_dir_;
    context.loop = loop_;
    context.management = services_.management;
    context.documents = services_.documents;
    context.logger = logger_;
    worker_ = registry.create(kind, std::move(context));

    if (logger_) {
        logger_->debug("Crawl session [" + settings_.name + "] created with worker [" +
                       std::string(Workers::to_string(kind)) + "], loop " + std::to_string(loop_));
    }
}

CrawlSession::~CrawlSession() {
    if (state_.load() == SessionState::Stopped) return;
    shutdown_timeout_ = std::chrono::milliseconds{0};
    try {
        close();
    } catch (const std::exception& e) {
        if (logger_) logger_->error("Crawl session [" + settings_.name + "] failed to close: " + e.what());
    }
}

void CrawlSession::start() {
    if (loop_ == 0 && !rest_) {
        if (logger_) {
            logger_->warning("Number of runs is set to 0 and rest api is disabled. Nothing to do for [" +
                             settings_.name + "]");
        }
        return;
    }

    SessionState expected = SessionState::Constructed;
    if (!state_.compare_exchange_strong(expected, SessionState::Starting)) {
        throw std::logic_error("CrawlSession::start called on a session that is " +
                               std::string(to_string(expected)));
    }

    services_.management->start();
    services_.documents->start();
    services_.documents->create_schema();

    if (logger_) {
        logger_->info("Crawl session [" + settings_.name + "] connected to backend version [" +
                      services_.management->get_version() + "]");
        if (loop_ < 0) {
            logger_->info("Crawl worker for [" + settings_.name + "] started in watch mode. It will run every " +
                          Config::SettingsLoader::format_duration(settings_.fs.update_rate) + ".");
        }
    }

    // Raised before the thread exists so a fast worker can not be overwritten
    worker_->set_closed(false);
    worker_alive_.store(true);
    try {
        worker_thread_ = std::thread([this]() { run_worker(); });
    } catch (const std::system_error&) {
        worker_alive_.store(false);
        worker_->set_closed(true);
        throw;
    }
    state_.store(SessionState::Running);
}

void CrawlSession::run_worker() {
    ProcessUtils::set_current_thread_name("crawl-" + settings_.name);
    if (logger_) logger_->debug("Crawl worker thread started (" + ProcessUtils::get_thread_info() + ")");

    try {
        worker_->run();
    } catch (const std::exception& e) {
        if (logger_) logger_->error("Crawl worker for [" + settings_.name + "] terminated: " + e.what());
    }

    {
        std::lock_guard<std::mutex> lk(done_mtx_);
        worker_alive_.store(false);
    }
    done_cv_.notify_all();
}

void CrawlSession::close() {
    if (state_.load() == SessionState::Stopped) {
        if (logger_) logger_->debug("Crawl session [" + settings_.name + "] already stopped");
        return;
    }
    state_.store(SessionState::Stopping);

    worker_->close();
    worker_->monitor()->notify_all();

    wait_for_worker();
    close_services();
}

void CrawlSession::wait_for_worker() {
    if (!worker_thread_.joinable()) return;

    const auto started = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lk(done_mtx_);
    while (worker_alive_.load()) {
        if (done_cv_.wait_for(lk, kShutdownPollInterval, [this]() { return !worker_alive_.load(); })) break;

        if (logger_) logger_->debug("Waiting for the crawl worker of [" + settings_.name + "] to stop");
        if (shutdown_timeout_.count() > 0 && std::chrono::steady_clock::now() - started >= shutdown_timeout_) {
            throw std::runtime_error("Crawl worker for [" + settings_.name + "] did not stop within " +
                                     Config::SettingsLoader::format_duration(shutdown_timeout_));
        }
    }
    lk.unlock();
    worker_thread_.join();
}

void CrawlSession::close_services() {
    std::exception_ptr first_error;

    try {
        services_.management->close();
    } catch (const std::exception& e) {
        if (logger_) logger_->error("Can not close the management service of [" + settings_.name + "]: " + e.what());
        first_error = std::current_exception();
    }
    try {
        services_.documents->close();
    } catch (const std::exception& e) {
        if (logger_) logger_->error("Can not close the document service of [" + settings_.name + "]: " + e.what());
        if (!first_error) first_error = std::current_exception();
    }

    state_.store(SessionState::Stopped);
    if (logger_) logger_->info("Crawl session [" + settings_.name + "] stopped");

    if (first_error) std::rethrow_exception(first_error);
}

} // namespace DocCrawler
