/**
 * \file crawler/worker/RemoteWorker.cpp
 */
#include "RemoteWorker.hpp"

#include <stdexcept>

namespace DocCrawler::Workers {

RemoteCrawlWorker::RemoteCrawlWorker(WorkerKind kind, Sources::CurlFileSource::Scheme scheme, WorkerContext context)
    : FileCrawlWorker(kind, std::move(context))
    , scheme_(scheme) {
    if (!settings().server) {
        throw std::invalid_argument("Worker [" + std::string(to_string(kind)) + "] requires a server section");
    }
}

std::unique_ptr<Sources::IFileSource> RemoteCrawlWorker::create_source() {
    return std::make_unique<Sources::CurlFileSource>(scheme_,
                                                     *settings().server,
                                                     [this]() { return is_closed(); },
                                                     logger());
}

SshWorker::SshWorker(WorkerContext context)
    : RemoteCrawlWorker(WorkerKind::Ssh, Sources::CurlFileSource::Scheme::Sftp, std::move(context)) {}

FtpWorker::FtpWorker(WorkerContext context)
    : RemoteCrawlWorker(WorkerKind::Ftp, Sources::CurlFileSource::Scheme::Ftp, std::move(context)) {}

} // namespace DocCrawler::Workers
