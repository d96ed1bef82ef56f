/**
 * \file crawler/worker/CrawlWorkerBase.hpp
 * \brief Pass loop, stop flag and bounded backoff shared by every worker.
 */
#pragma once

#include "ICrawlWorker.hpp"
#include "WorkerContext.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace DocCrawler::Workers {

/** \brief Delays applied after consecutive failed passes. */
struct RetryPolicy {
    std::chrono::milliseconds initial{std::chrono::seconds(1)};
    std::chrono::milliseconds max{std::chrono::seconds(30)};
};

/**
 * \brief Implements \c ICrawlWorker around a single \c run_pass hook.
 *
 * \c run loops: check the flag, run a pass, stop after N passes in N-pass
 * mode, then wait on the monitor (update rate after a good pass, exponential
 * backoff capped by \c RetryPolicy::max after a failed one). Exceptions from
 * \c run_pass are logged and retried; they never leave \c run.
 */
class CrawlWorkerBase : public ICrawlWorker {
public:
    /** \brief Upper bound of a single retry wait. */
    static constexpr std::chrono::milliseconds MAX_SLEEP_RETRY_TIME{std::chrono::seconds(30)};

    CrawlWorkerBase(WorkerKind kind, WorkerContext context);

    void run() override;

    bool is_closed() const override { return closed_.load(std::memory_order_acquire); }
    void set_closed(bool closed) override { closed_.store(closed, std::memory_order_release); }
    void close() override { set_closed(true); }
    std::shared_ptr<CancellationMonitor> monitor() const override { return monitor_; }
    WorkerKind kind() const override { return kind_; }
    int runs() const override { return runs_.load(std::memory_order_relaxed); }

    /** \brief Override the retry delays; the max is clamped to \c MAX_SLEEP_RETRY_TIME. */
    void set_retry_policy(RetryPolicy policy);

    /** \brief Wait before retry number \p failures (1-based): initial * 2^(failures-1), capped. */
    static std::chrono::milliseconds backoff_delay(int failures, const RetryPolicy& policy);

protected:
    /** \brief One crawl pass. Throwing marks the pass as failed. */
    virtual void run_pass() = 0;

    /**
     * \brief Park on the monitor for up to \p timeout.
     * \return true when the worker was closed meanwhile.
     */
    bool wait_or_closed(std::chrono::milliseconds timeout);

    const WorkerContext& context() const { return context_; }
    const Config::CrawlSettings& settings() const { return context_.settings; }
    const std::shared_ptr<Logger>& logger() const { return context_.logger; }

private:
    WorkerKind kind_;
    WorkerContext context_;
    RetryPolicy retry_;

    std::atomic<bool> closed_{true};
    std::atomic<int> runs_{0};
    std::shared_ptr<CancellationMonitor> monitor_;
};

} // namespace DocCrawler::Workers
