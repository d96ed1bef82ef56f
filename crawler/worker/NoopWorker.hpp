/**
 * \file crawler/worker/NoopWorker.hpp
 * \brief Worker selected when the run count is zero.
 */
#pragma once

#include "CrawlWorkerBase.hpp"

namespace DocCrawler::Workers {

/** \brief Runs no pass at all; \c run logs and returns. */
class NoopWorker : public CrawlWorkerBase {
public:
    explicit NoopWorker(WorkerContext context);

    void run() override;

protected:
    void run_pass() override {}
};

} // namespace DocCrawler::Workers
