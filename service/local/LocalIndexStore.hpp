/**
 * \file service/local/LocalIndexStore.hpp
 * \brief Directory-backed document index used by the default services.
 */
#pragma once

#include "logger.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace DocCrawler::Services {

/**
 * \brief One directory per index, one JSON file per document.
 *
 * Layout under the root:
 * - `_backend.json` holds the store version, written on first open;
 * - `<index>/_schema.json` holds the schema pushed at provisioning;
 * - `<index>/<id>.json` holds one document.
 *
 * Several instances may share a root; documents are written through a
 * temporary file and renamed so readers never see partial content.
 */
class LocalIndexStore {
public:
    static constexpr const char* kStoreVersion = "1.0.0";
    static constexpr const char* kBackendFile = "_backend.json";
    static constexpr const char* kSchemaFile = "_schema.json";

    LocalIndexStore(std::filesystem::path root, std::shared_ptr<Logger> logger);

    /** \brief Create the root if needed and read its version. Throws std::runtime_error. */
    void open();
    /** \brief Mark the store closed; later document calls throw. */
    void close();
    bool is_open() const;

    /** \brief Version recorded in `_backend.json`. */
    std::string version() const;

    /** \brief Create an index directory; writes the schema when one is given. */
    void create_index(const std::string& index, const std::optional<nlohmann::json>& schema);
    bool has_index(const std::string& index) const;

    void put(const std::string& index, const std::string& id, const nlohmann::json& document);
    void erase(const std::string& index, const std::string& id);
    std::optional<nlohmann::json> get(const std::string& index, const std::string& id) const;
    /** \brief Number of documents in an index (schema file excluded). */
    std::size_t count(const std::string& index) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path index_dir(const std::string& index) const;
    std::filesystem::path document_path(const std::string& index, const std::string& id) const;
    void require_open(const char* operation) const;

    std::filesystem::path root_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex mutex_;
    bool open_{false};
    std::string version_;
};

} // namespace DocCrawler::Services
