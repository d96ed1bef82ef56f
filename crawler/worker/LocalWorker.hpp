/**
 * \file crawler/worker/LocalWorker.hpp
 * \brief Crawls a directory tree on the local filesystem.
 */
#pragma once

#include "FileCrawlWorker.hpp"

namespace DocCrawler::Workers {

class LocalWorker : public FileCrawlWorker {
public:
    explicit LocalWorker(WorkerContext context);

protected:
    std::unique_ptr<Sources::IFileSource> create_source() override;
};

} // namespace DocCrawler::Workers
