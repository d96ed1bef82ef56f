/**
 * \file service/local/LocalIndexStore.cpp
 * \brief Filesystem implementation of the local document index.
 */
#include "LocalIndexStore.hpp"
#include <options/Options.hpp>

#include <stdexcept>
#include <system_error>

namespace DocCrawler::Services {

namespace fs = std::filesystem;

namespace {

void check_name(const std::string& kind, const std::string& name) {
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        throw std::invalid_argument("LocalIndexStore: invalid " + kind + " name [" + name + "]");
    }
}

} // namespace

LocalIndexStore::LocalIndexStore(fs::path root, std::shared_ptr<Logger> logger)
    : root_(std::move(root)), logger_(std::move(logger)) {}

void LocalIndexStore::open() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (open_) return;

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw std::system_error(ec, "LocalIndexStore: cannot create store root " + root_.string());
    }

    const fs::path backend_file = root_ / kBackendFile;
    if (fs::exists(backend_file)) {
        auto j = shared_opts::Options::read_json_file(backend_file);
        if (!j.contains("version") || !j["version"].is_string()) {
            throw std::runtime_error("LocalIndexStore: " + backend_file.string() + " has no version");
        }
        version_ = j["version"].get<std::string>();
    } else {
        shared_opts::Options::write_json_file(backend_file, nlohmann::json{{"version", kStoreVersion}});
        version_ = kStoreVersion;
        if (logger_) logger_->info("LocalIndexStore: initialized new store at " + root_.string());
    }
    open_ = true;
}

void LocalIndexStore::close() {
    std::lock_guard<std::mutex> lk(mutex_);
    open_ = false;
}

bool LocalIndexStore::is_open() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return open_;
}

std::string LocalIndexStore::version() const {
    std::lock_guard<std::mutex> lk(mutex_);
    require_open("version");
    return version_;
}

void LocalIndexStore::create_index(const std::string& index, const std::optional<nlohmann::json>& schema) {
    check_name("index", index);
    std::lock_guard<std::mutex> lk(mutex_);
    require_open("create_index");

    std::error_code ec;
    fs::create_directories(index_dir(index), ec);
    if (ec) {
        throw std::system_error(ec, "LocalIndexStore: cannot create index " + index);
    }
    if (schema) {
        shared_opts::Options::write_json_file(index_dir(index) / kSchemaFile, *schema);
    }
}

bool LocalIndexStore::has_index(const std::string& index) const {
    check_name("index", index);
    return fs::is_directory(index_dir(index));
}

void LocalIndexStore::put(const std::string& index, const std::string& id, const nlohmann::json& document) {
    check_name("index", index);
    check_name("document id", id);
    std::lock_guard<std::mutex> lk(mutex_);
    require_open("put");
    if (!fs::is_directory(index_dir(index))) {
        throw std::runtime_error("LocalIndexStore: index [" + index + "] does not exist");
    }
    shared_opts::Options::write_json_file(document_path(index, id), document);
}

void LocalIndexStore::erase(const std::string& index, const std::string& id) {
    check_name("index", index);
    check_name("document id", id);
    std::lock_guard<std::mutex> lk(mutex_);
    require_open("erase");
    std::error_code ec;
    fs::remove(document_path(index, id), ec);
    if (ec) {
        throw std::system_error(ec, "LocalIndexStore: cannot remove " + index + "/" + id);
    }
}

std::optional<nlohmann::json> LocalIndexStore::get(const std::string& index, const std::string& id) const {
    check_name("index", index);
    check_name("document id", id);
    const fs::path path = document_path(index, id);
    if (!fs::exists(path)) return std::nullopt;
    return shared_opts::Options::read_json_file(path);
}

std::size_t LocalIndexStore::count(const std::string& index) const {
    check_name("index", index);
    const fs::path dir = index_dir(index);
    if (!fs::is_directory(dir)) return 0;
    std::size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json" &&
            entry.path().filename() != kSchemaFile) {
            ++n;
        }
    }
    return n;
}

fs::path LocalIndexStore::index_dir(const std::string& index) const {
    return root_ / index;
}

fs::path LocalIndexStore::document_path(const std::string& index, const std::string& id) const {
    return root_ / index / (id + ".json");
}

void LocalIndexStore::require_open(const char* operation) const {
    if (!open_) {
        throw std::logic_error(std::string{"LocalIndexStore: "} + operation + " called on a closed store");
    }
}

} // namespace DocCrawler::Services
