/**
 * \file crawler/worker/NoopWorker.cpp
 */
#include "NoopWorker.hpp"

namespace DocCrawler::Workers {

NoopWorker::NoopWorker(WorkerContext context)
    : CrawlWorkerBase(WorkerKind::Noop, std::move(context)) {}

void NoopWorker::run() {
    if (logger()) logger()->debug("No crawl pass requested for [" + settings().name + "]");
}

} // namespace DocCrawler::Workers
