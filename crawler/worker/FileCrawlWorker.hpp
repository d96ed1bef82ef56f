/**
 * \file crawler/worker/FileCrawlWorker.hpp
 * \brief Pass implementation shared by the local, ssh and ftp workers.
 */
#pragma once

#include "CrawlWorkerBase.hpp"
#include "PathFilter.hpp"
#include "crawler/source/IFileSource.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace DocCrawler::Workers {

/**
 * \brief Walks fs.url on an \c IFileSource and submits one document per file.
 *
 * The walk checks the closed flag before every entry, so a stop request
 * ends the pass at the next entry. A completed pass rewrites the job status
 * file; an interrupted one leaves the previous status untouched.
 */
class FileCrawlWorker : public CrawlWorkerBase {
public:
    FileCrawlWorker(WorkerKind kind, WorkerContext context);

    /** \brief Documents submitted over all passes. */
    std::uint64_t indexed() const { return indexed_.load(std::memory_order_relaxed); }

    /** \brief Stable document id derived from the virtual path. */
    static std::string document_id(const std::string& virtual_path);

protected:
    /** \brief Create the (unopened) source this worker reads from. */
    virtual std::unique_ptr<Sources::IFileSource> create_source() = 0;

    void run_pass() override;

private:
    struct PassStats {
        std::uint64_t files{0};
        std::uint64_t folders{0};
        std::uint64_t errors{0};
    };

    void walk(Sources::IFileSource& source, PassStats& stats);
    bool submit(const std::string& index, const std::string& id, const nlohmann::json& doc, PassStats& stats);
    nlohmann::json file_document(const Sources::FileEntry& entry, const std::string& virtual_path) const;
    nlohmann::json folder_document(const Sources::FileEntry& entry, const std::string& virtual_path) const;

    PathFilter filter_;
    std::atomic<std::uint64_t> indexed_{0};
};

} // namespace DocCrawler::Workers
