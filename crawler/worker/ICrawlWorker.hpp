/**
 * \file crawler/worker/ICrawlWorker.hpp
 * \brief Contract between a crawl session and the worker running its passes.
 */
#pragma once

#include "CancellationMonitor.hpp"

#include <memory>
#include <string_view>

namespace DocCrawler::Workers {

/** \brief Concrete worker strategies a session can run. */
enum class WorkerKind { Noop, Local, Ssh, Ftp };

inline std::string_view to_string(WorkerKind kind) noexcept {
    switch (kind) {
        case WorkerKind::Noop:  return "noop";
        case WorkerKind::Local: return "local";
        case WorkerKind::Ssh:   return "ssh";
        case WorkerKind::Ftp:   return "ftp";
    }
    return "unknown";
}

/**
 * \brief Cancellable, run-once unit of crawl work.
 *
 * Workers are constructed closed. The session clears the flag right before
 * launching \c run on its worker thread, and stops the worker by setting the
 * flag again and waking the monitor. \c run checks the flag before each pass,
 * around each wait and between traversal entries, and returns once it is set
 * (or once the configured number of passes is done). It is never restarted.
 */
class ICrawlWorker {
public:
    virtual ~ICrawlWorker() = default;

    /** \brief Execute passes according to the run count, then return. */
    virtual void run() = 0;

    /** \brief True when the worker has been asked to stop (or has not been activated yet). */
    virtual bool is_closed() const = 0;
    /** \brief Set or clear the stop request. */
    virtual void set_closed(bool closed) = 0;
    /** \brief Request a stop; equivalent to \c set_closed(true). */
    virtual void close() = 0;

    /** \brief Monitor this worker parks on while backing off or waiting for the next pass. */
    virtual std::shared_ptr<CancellationMonitor> monitor() const = 0;

    /** \brief Strategy implemented by this worker. */
    virtual WorkerKind kind() const = 0;
    /** \brief Passes started so far, failed ones included. */
    virtual int runs() const = 0;
};

} // namespace DocCrawler::Workers
