/**
 * \file crawler/worker/LocalWorker.cpp
 */
#include "LocalWorker.hpp"
#include "crawler/source/LocalFileSource.hpp"

namespace DocCrawler::Workers {

LocalWorker::LocalWorker(WorkerContext context)
    : FileCrawlWorker(WorkerKind::Local, std::move(context)) {}

std::unique_ptr<Sources::IFileSource> LocalWorker::create_source() {
    return std::make_unique<Sources::LocalFileSource>(settings().fs.follow_symlinks);
}

} // namespace DocCrawler::Workers
