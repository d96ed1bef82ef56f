/**
 * \file service/local/LocalDocumentService.hpp
 * \brief \c IDocumentService over a \c LocalIndexStore.
 */
#pragma once

#include "service/IDocumentService.hpp"
#include "LocalIndexStore.hpp"
#include "logger.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace DocCrawler::Services {

/** \brief Writes crawled documents into the document and folder indices. */
class LocalDocumentService : public IDocumentService {
public:
    /**
     * \param store_root Root directory of the local store.
     * \param index Document index name.
     * \param folder_index Folder index name.
     * \param push_templates Write `_schema.json` files when provisioning.
     * \param logger Shared logger.
     */
    LocalDocumentService(std::filesystem::path store_root,
                         std::string index,
                         std::string folder_index,
                         bool push_templates,
                         std::shared_ptr<Logger> logger);

    void start() override;
    void close() override;
    void create_schema() override;
    void index(const std::string& index, const std::string& id, const nlohmann::json& document) override;
    void remove(const std::string& index, const std::string& id) override;
    bool is_started() const override;

    /** \brief Documents accepted since construction. */
    std::uint64_t indexed_count() const { return indexed_.load(std::memory_order_relaxed); }
    const LocalIndexStore& store() const { return store_; }

    /** \brief Schema written for the document index. */
    static nlohmann::json document_schema();
    /** \brief Schema written for the folder index. */
    static nlohmann::json folder_schema();

private:
    std::shared_ptr<Logger> logger_;
    LocalIndexStore store_;
    std::string index_;
    std::string folder_index_;
    bool push_templates_;
    std::atomic<std::uint64_t> indexed_{0};
};

} // namespace DocCrawler::Services
