/**
 * \file crawler/worker/WorkerSelector.hpp
 * \brief Protocol based worker selection and the worker constructor registry.
 */
#pragma once

#include "ICrawlWorker.hpp"
#include "WorkerContext.hpp"

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace DocCrawler::Workers {

/** \brief Raised when a job names a protocol no worker implements. */
class UnsupportedProtocolError : public std::invalid_argument {
public:
    explicit UnsupportedProtocolError(const std::string& protocol);

    const std::string& protocol() const noexcept { return protocol_; }

private:
    std::string protocol_;
};

/** \brief Pure mapping from (protocol, run count) to a worker strategy. */
class WorkerSelector {
public:
    /**
     * \brief Pick the strategy for a job.
     * \param protocol Configured protocol name; empty means local.
     * \param loop Run count; 0 always selects \c WorkerKind::Noop.
     * \throws UnsupportedProtocolError for any other protocol name.
     */
    static WorkerKind select(const std::string& protocol, int loop);

private:
    WorkerSelector() = delete;
};

/**
 * \brief Maps each \c WorkerKind to a constructor.
 *
 * \c defaults() registers the built-in workers. Tests replace entries with
 * \c register_worker to run sessions on scripted workers.
 */
class WorkerRegistry {
public:
    using Constructor = std::function<std::unique_ptr<ICrawlWorker>(WorkerContext)>;

    WorkerRegistry() = default;

    /** \brief Registry holding the built-in worker for every kind. */
    static WorkerRegistry defaults();
    /** \brief Process-wide registry with the built-ins. */
    static const WorkerRegistry& instance();

    /** \brief Register or replace the constructor for \p kind. */
    void register_worker(WorkerKind kind, Constructor constructor);
    bool has_worker(WorkerKind kind) const;

    /**
     * \brief Build an (unstarted, closed) worker.
     * \throws std::out_of_range when nothing is registered for \p kind.
     */
    std::unique_ptr<ICrawlWorker> create(WorkerKind kind, WorkerContext context) const;

private:
    static Constructor builtin(WorkerKind kind);

    std::map<WorkerKind, Constructor> constructors_;
};

} // namespace DocCrawler::Workers
