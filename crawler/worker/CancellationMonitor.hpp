/**
 * \file crawler/worker/CancellationMonitor.hpp
 * \brief Wake-on-cancel primitive shared by a crawl worker and its session.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace DocCrawler::Workers {

/**
 * \brief Interruptible sleep used for retry backoff and the wait between passes.
 *
 * The worker blocks in \c wait_for with a stop predicate (normally "closed flag
 * is set"); the session sets the flag and calls \c notify_all. Because
 * \c notify_all takes the mutex before notifying, a waiter either observes the
 * flag when it evaluates the predicate or is already blocked and gets woken:
 * no stop request is lost between the check and the wait.
 */
class CancellationMonitor {
public:
    CancellationMonitor() = default;

    CancellationMonitor(const CancellationMonitor&) = delete;
    CancellationMonitor& operator=(const CancellationMonitor&) = delete;

    /**
     * \brief Block until \p stop holds or \p timeout elapses.
     * \return The final value of \p stop (true means "stop requested").
     */
    template <typename Rep, typename Period, typename Predicate>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout, Predicate stop) {
        std::unique_lock<std::mutex> lk(mutex_);
        return condition_.wait_for(lk, timeout, stop);
    }

    /** \brief Wake every thread parked in \c wait_for so it re-evaluates its predicate. */
    void notify_all() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
        }
        condition_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable condition_;
};

} // namespace DocCrawler::Workers
