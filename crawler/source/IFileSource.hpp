/**
 * \file crawler/source/IFileSource.hpp
 * \brief Directory listing abstraction walked by file crawl workers.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DocCrawler::Sources {

/** \brief One entry of a directory listing. */
struct FileEntry {
    std::string name;        ///< Last path component.
    std::string path;        ///< Full path on the source, usable with \c list.
    bool directory{false};
    std::uint64_t size{0};
    std::optional<std::chrono::system_clock::time_point> last_modified;
};

/** \brief Read-only access to a tree of files (local disk, sftp, ftp). */
class IFileSource {
public:
    virtual ~IFileSource() = default;

    /** \brief Connect / prepare. Throws on failure. */
    virtual void open() = 0;
    /** \brief Release the connection. Safe to call twice. */
    virtual void close() = 0;
    /** \brief True if \p directory exists and is a directory. */
    virtual bool is_directory(const std::string& directory) = 0;
    /** \brief Entries directly under \p directory, "." and ".." excluded. Throws on failure. */
    virtual std::vector<FileEntry> list(const std::string& directory) = 0;
    /**
     * \brief Identity of \p directory once links are resolved.
     * Two paths reaching the same directory return the same value.
     */
    virtual std::string directory_identity(const std::string& directory) = 0;
    /** \brief Printable location, e.g. "sftp://host:22". */
    virtual std::string describe() const = 0;
};

} // namespace DocCrawler::Sources
