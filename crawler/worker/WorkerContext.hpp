/**
 * \file crawler/worker/WorkerContext.hpp
 * \brief Everything a worker constructor receives from the session.
 */
#pragma once

#include "settings/CrawlSettings.hpp"
#include "service/IManagementService.hpp"
#include "service/IDocumentService.hpp"
#include "logger.hpp"

#include <filesystem>
#include <memory>

namespace DocCrawler::Workers {

/** \brief Run count meaning "crawl until closed" (watch mode). */
inline constexpr int LOOP_INFINITE = -1;

struct WorkerContext {
    Config::CrawlSettings settings;
    std::filesystem::path job_dir;   ///< Per-job state directory (status file lives here).
    int loop{LOOP_INFINITE};         ///< 0 none, <0 until closed, N passes.
    std::shared_ptr<Services::IManagementService> management;
    std::shared_ptr<Services::IDocumentService> documents;
    std::shared_ptr<Logger> logger;
};

} // namespace DocCrawler::Workers
