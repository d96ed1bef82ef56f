/**
 * \file crawler/worker/FileCrawlWorker.cpp
 * \brief Directory walk and document submission.
 */
#include "FileCrawlWorker.hpp"
#include "JobStatus.hpp"

#include <cctype>
#include <chrono>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>

namespace DocCrawler::Workers {

namespace {

std::string join_virtual(const std::string& parent, const std::string& name) {
    return parent == "/" ? "/" + name : parent + "/" + name;
}

std::string extension_of(const std::string& name) {
    const auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) return "";
    std::string ext = name.substr(dot + 1);
    for (auto& c : ext) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return ext;
}

// Closes the source when the pass ends, whatever the outcome
struct SourceCloser {
    Sources::IFileSource& source;
    ~SourceCloser() { source.close(); }
};

} // namespace

FileCrawlWorker::FileCrawlWorker(WorkerKind kind, WorkerContext context)
    : CrawlWorkerBase(kind, std::move(context))
    , filter_(settings().fs.includes, settings().fs.excludes) {}

std::string FileCrawlWorker::document_id(const std::string& virtual_path) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << std::hash<std::string>{}(virtual_path);
    return oss.str();
}

void FileCrawlWorker::run_pass() {
    if (!context().documents) {
        throw std::logic_error("crawl worker has no document service");
    }

    auto source = create_source();
    source->open();
    SourceCloser closer{*source};

    const std::string& root = settings().fs.url;
    if (!source->is_directory(root)) {
        throw std::runtime_error("Root directory [" + root + "] does not exist on " + source->describe());
    }

    if (logger()) logger()->debug("Indexing [" + root + "] from " + source->describe());

    PassStats stats;
    walk(*source, stats);

    if (is_closed()) {
        if (logger()) logger()->info("Crawl pass of [" + settings().name + "] interrupted by stop request");
        return;
    }

    JobStatus status;
    status.name = settings().name;
    status.lastrun = std::chrono::system_clock::now();
    status.indexed = stats.files;
    status.errors = stats.errors;
    status.runs = runs();
    status.write(context().job_dir);

    if (logger()) {
        logger()->info("Crawl pass #" + std::to_string(runs()) + " of [" + settings().name + "] done: " +
                       std::to_string(stats.files) + " file(s), " + std::to_string(stats.folders) +
                       " folder(s), " + std::to_string(stats.errors) + " error(s)");
    }
}

void FileCrawlWorker::walk(Sources::IFileSource& source, PassStats& stats) {
    // (real path, virtual path) pairs still to list
    std::vector<std::pair<std::string, std::string>> pending{{settings().fs.url, "/"}};
    // Directories already queued, by resolved identity; breaks symlink cycles
    std::unordered_set<std::string> visited{source.directory_identity(settings().fs.url)};
    const std::string index = settings().index_name();
    const std::string folder_index = settings().folder_index_name();

    while (!pending.empty()) {
        if (is_closed()) return;
        auto [real_dir, virtual_dir] = std::move(pending.back());
        pending.pop_back();

        std::vector<Sources::FileEntry> entries;
        try {
            entries = source.list(real_dir);
        } catch (const std::exception& e) {
            if (real_dir == settings().fs.url) throw;
            ++stats.errors;
            if (logger()) logger()->warning("Skipping [" + real_dir + "]: " + e.what());
            continue;
        }

        for (const auto& entry : entries) {
            if (is_closed()) return;
            const std::string virtual_path = join_virtual(virtual_dir, entry.name);

            if (entry.directory) {
                if (!filter_.accepts_directory(virtual_path)) continue;
                if (!visited.insert(source.directory_identity(entry.path)).second) {
                    if (logger()) logger()->debug("Skipping [" + virtual_path + "]: directory already crawled");
                    continue;
                }
                if (settings().fs.index_folders) {
                    if (submit(folder_index, document_id(virtual_path), folder_document(entry, virtual_path), stats)) {
                        ++stats.folders;
                    }
                }
                pending.emplace_back(entry.path, virtual_path);
                continue;
            }

            if (!filter_.accepts_file(virtual_path)) {
                if (logger()) logger()->debug("Ignoring [" + virtual_path + "]");
                continue;
            }
            if (submit(index, document_id(virtual_path), file_document(entry, virtual_path), stats)) {
                ++stats.files;
            }
        }
    }
}

bool FileCrawlWorker::submit(const std::string& index, const std::string& id, const nlohmann::json& doc,
                             PassStats& stats) {
    try {
        context().documents->index(index, id, doc);
        indexed_.fetch_add(1, std::memory_order_relaxed);
        return true;
    } catch (const std::exception& e) {
        ++stats.errors;
        if (logger()) logger()->warning("Can not index [" + doc["path"]["virtual"].get<std::string>() + "]: " + e.what());
        return false;
    }
}

nlohmann::json FileCrawlWorker::file_document(const Sources::FileEntry& entry, const std::string& virtual_path) const {
    nlohmann::json doc;
    doc["file"]["filename"] = entry.name;
    doc["file"]["extension"] = extension_of(entry.name);
    if (settings().fs.add_filesize) doc["file"]["filesize"] = entry.size;
    if (entry.last_modified) doc["file"]["last_modified"] = to_iso8601(*entry.last_modified);
    doc["file"]["indexing_date"] = to_iso8601(std::chrono::system_clock::now());
    doc["path"]["root"] = settings().fs.url;
    doc["path"]["real"] = entry.path;
    doc["path"]["virtual"] = virtual_path;
    return doc;
}

nlohmann::json FileCrawlWorker::folder_document(const Sources::FileEntry& entry, const std::string& virtual_path) const {
    nlohmann::json doc;
    doc["file"]["filename"] = entry.name;
    doc["path"]["root"] = settings().fs.url;
    doc["path"]["real"] = entry.path;
    doc["path"]["virtual"] = virtual_path;
    return doc;
}

} // namespace DocCrawler::Workers
