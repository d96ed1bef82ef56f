/**
 * \file service/local/LocalManagementService.cpp
 */
#include "LocalManagementService.hpp"

namespace DocCrawler::Services {

LocalManagementService::LocalManagementService(std::filesystem::path store_root, std::shared_ptr<Logger> logger)
    : logger_(logger), store_(std::move(store_root), std::move(logger)) {}

void LocalManagementService::start() {
    store_.open();
    if (logger_) logger_->debug("Management service connected to local store " + store_.root().string());
}

void LocalManagementService::close() {
    if (!store_.is_open()) return;
    store_.close();
    if (logger_) logger_->debug("Management service closed");
}

std::string LocalManagementService::get_version() const {
    return "local-index " + store_.version();
}

bool LocalManagementService::is_started() const {
    return store_.is_open();
}

} // namespace DocCrawler::Services
