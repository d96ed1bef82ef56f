/**
 * \file crawler/worker/RemoteWorker.hpp
 * \brief Workers crawling a remote server over sftp or ftp.
 */
#pragma once

#include "FileCrawlWorker.hpp"
#include "crawler/source/CurlFileSource.hpp"

namespace DocCrawler::Workers {

/**
 * \brief Opens a \c CurlFileSource on the configured server for every pass.
 *
 * Transfers in flight abort as soon as the worker is closed.
 */
class RemoteCrawlWorker : public FileCrawlWorker {
protected:
    RemoteCrawlWorker(WorkerKind kind, Sources::CurlFileSource::Scheme scheme, WorkerContext context);

    std::unique_ptr<Sources::IFileSource> create_source() override;

private:
    Sources::CurlFileSource::Scheme scheme_;
};

class SshWorker : public RemoteCrawlWorker {
public:
    explicit SshWorker(WorkerContext context);
};

class FtpWorker : public RemoteCrawlWorker {
public:
    explicit FtpWorker(WorkerContext context);
};

} // namespace DocCrawler::Workers
