/**
 * \file service/local/LocalManagementService.hpp
 * \brief \c IManagementService over a \c LocalIndexStore.
 */
#pragma once

#include "service/IManagementService.hpp"
#include "LocalIndexStore.hpp"
#include "logger.hpp"

#include <memory>
#include <string>

namespace DocCrawler::Services {

/** \brief Opens the store root and reports its version. */
class LocalManagementService : public IManagementService {
public:
    LocalManagementService(std::filesystem::path store_root, std::shared_ptr<Logger> logger);

    /** \copydoc IManagementService::start */
    void start() override;
    /** \copydoc IManagementService::close */
    void close() override;
    /** \copydoc IManagementService::get_version */
    std::string get_version() const override;
    /** \copydoc IManagementService::is_started */
    bool is_started() const override;

private:
    std::shared_ptr<Logger> logger_;
    LocalIndexStore store_;
};

} // namespace DocCrawler::Services
