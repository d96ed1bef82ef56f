/**
 * \file service/ServiceFactory.cpp
 * \brief Backend resolution for the service bundle.
 */
#include "ServiceFactory.hpp"
#include "local/LocalManagementService.hpp"
#include "local/LocalDocumentService.hpp"

namespace DocCrawler::Services {

ServiceBundle ServiceFactory::create(const Config::CrawlSettings& settings,
                                     const std::filesystem::path& job_dir,
                                     std::shared_ptr<Logger> logger) {
    const std::filesystem::path root = settings.backend.path.empty()
        ? job_dir / "index"
        : std::filesystem::path(settings.backend.path);

    ServiceBundle bundle;
    bundle.management = std::make_shared<LocalManagementService>(root, logger);
    bundle.documents = std::make_shared<LocalDocumentService>(root,
                                                              settings.index_name(),
                                                              settings.folder_index_name(),
                                                              settings.backend.push_templates,
                                                              std::move(logger));
    return bundle;
}

} // namespace DocCrawler::Services
