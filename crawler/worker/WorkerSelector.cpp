/**
 * \file crawler/worker/WorkerSelector.cpp
 */
#include "WorkerSelector.hpp"
#include "LocalWorker.hpp"
#include "NoopWorker.hpp"
#include "RemoteWorker.hpp"
#include "settings/Protocol.hpp"

namespace DocCrawler::Workers {

UnsupportedProtocolError::UnsupportedProtocolError(const std::string& protocol)
    : std::invalid_argument(protocol + " is not supported yet. Please use one of: " + Config::supported_protocols())
    , protocol_(protocol) {}

WorkerKind WorkerSelector::select(const std::string& protocol, int loop) {
    if (loop == 0) return WorkerKind::Noop;
    if (protocol.empty()) return WorkerKind::Local;

    auto parsed = Config::parse_protocol(protocol);
    if (!parsed) {
        throw UnsupportedProtocolError(protocol);
    }
    switch (*parsed) {
        case Config::Protocol::Local: return WorkerKind::Local;
        case Config::Protocol::Ssh:   return WorkerKind::Ssh;
        case Config::Protocol::Ftp:   return WorkerKind::Ftp;
    }
    throw UnsupportedProtocolError(protocol);
}

WorkerRegistry WorkerRegistry::defaults() {
    WorkerRegistry registry;
    for (WorkerKind kind : {WorkerKind::Noop, WorkerKind::Local, WorkerKind::Ssh, WorkerKind::Ftp}) {
        registry.register_worker(kind, builtin(kind));
    }
    return registry;
}

const WorkerRegistry& WorkerRegistry::instance() {
    static const WorkerRegistry registry = defaults();
    return registry;
}

void WorkerRegistry::register_worker(WorkerKind kind, Constructor constructor) {
    constructors_[kind] = std::move(constructor);
}

bool WorkerRegistry::has_worker(WorkerKind kind) const {
    return constructors_.count(kind) != 0;
}

std::unique_ptr<ICrawlWorker> WorkerRegistry::create(WorkerKind kind, WorkerContext context) const {
    auto it = constructors_.find(kind);
    if (it == constructors_.end() || !it->second) {
        throw std::out_of_range("No worker registered for [" + std::string(to_string(kind)) + "]");
    }
    return it->second(std::move(context));
}

WorkerRegistry::Constructor WorkerRegistry::builtin(WorkerKind kind) {
    switch (kind) {
        case WorkerKind::Noop:
            return [](WorkerContext ctx) -> std::unique_ptr<ICrawlWorker> { return std::make_unique<NoopWorker>(std::move(ctx)); };
        case WorkerKind::Local:
            return [](WorkerContext ctx) -> std::unique_ptr<ICrawlWorker> { return std::make_unique<LocalWorker>(std::move(ctx)); };
        case WorkerKind::Ssh:
            return [](WorkerContext ctx) -> std::unique_ptr<ICrawlWorker> { return std::make_unique<SshWorker>(std::move(ctx)); };
        case WorkerKind::Ftp:
            return [](WorkerContext ctx) -> std::unique_ptr<ICrawlWorker> { return std::make_unique<FtpWorker>(std::move(ctx)); };
    }
    throw std::logic_error("unknown worker kind");
}

} // namespace DocCrawler::Workers
