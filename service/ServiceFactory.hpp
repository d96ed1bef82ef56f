/**
 * \file service/ServiceFactory.hpp
 * \brief Builds the management/document service pair for a job.
 */
#pragma once

#include "IManagementService.hpp"
#include "IDocumentService.hpp"
#include "settings/CrawlSettings.hpp"
#include "logger.hpp"

#include <filesystem>
#include <memory>

namespace DocCrawler::Services {

/** \brief The two services a session starts and closes independently. */
struct ServiceBundle {
    std::shared_ptr<IManagementService> management;
    std::shared_ptr<IDocumentService> documents;
};

/** \brief Static factory resolving the backend from the job settings. */
class ServiceFactory {
public:
    /**
     * \brief Create unstarted services backed by a local index store.
     * \param settings Job settings; backend.path selects the store root.
     * \param job_dir Job state directory, used when backend.path is empty.
     * \param logger Logger shared with the services.
     */
    static ServiceBundle create(const Config::CrawlSettings& settings,
                                const std::filesystem::path& job_dir,
                                std::shared_ptr<Logger> logger);

private:
    ServiceFactory() = delete;
};

} // namespace DocCrawler::Services
