/**
 * \file service/local/LocalDocumentService.cpp
 */
#include "LocalDocumentService.hpp"

namespace DocCrawler::Services {

LocalDocumentService::LocalDocumentService(std::filesystem::path store_root,
                                           std::string index,
                                           std::string folder_index,
                                           bool push_templates,
                                           std::shared_ptr<Logger> logger)
    : logger_(logger)
    , store_(std::move(store_root), std::move(logger))
    , index_(std::move(index))
    , folder_index_(std::move(folder_index))
    , push_templates_(push_templates) {}

void LocalDocumentService::start() {
    store_.open();
    if (logger_) logger_->debug("Document service connected to local store " + store_.root().string());
}

void LocalDocumentService::close() {
    if (!store_.is_open()) return;
    store_.close();
    if (logger_) {
        logger_->debug("Document service closed after " + std::to_string(indexed_count()) + " documents");
    }
}

void LocalDocumentService::create_schema() {
    std::optional<nlohmann::json> docs_schema;
    std::optional<nlohmann::json> folders_schema;
    if (push_templates_) {
        docs_schema = document_schema();
        folders_schema = folder_schema();
    }
    store_.create_index(index_, docs_schema);
    store_.create_index(folder_index_, folders_schema);
    if (logger_) logger_->debug("Indices [" + index_ + "] and [" + folder_index_ + "] are ready");
}

void LocalDocumentService::index(const std::string& index, const std::string& id, const nlohmann::json& document) {
    store_.put(index, id, document);
    indexed_.fetch_add(1, std::memory_order_relaxed);
}

void LocalDocumentService::remove(const std::string& index, const std::string& id) {
    store_.erase(index, id);
}

bool LocalDocumentService::is_started() const {
    return store_.is_open();
}

nlohmann::json LocalDocumentService::document_schema() {
    return {
        {"kind", "document"},
        {"fields", {
            {"file.filename", "keyword"},
            {"file.extension", "keyword"},
            {"file.filesize", "long"},
            {"file.last_modified", "date"},
            {"file.indexing_date", "date"},
            {"path.real", "keyword"},
            {"path.virtual", "keyword"},
            {"path.root", "keyword"},
        }},
    };
}

nlohmann::json LocalDocumentService::folder_schema() {
    return {
        {"kind", "folder"},
        {"fields", {
            {"file.filename", "keyword"},
            {"path.real", "keyword"},
            {"path.virtual", "keyword"},
            {"path.root", "keyword"},
        }},
    };
}

} // namespace DocCrawler::Services
