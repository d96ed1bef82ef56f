/**
 * \file crawler/source/LocalFileSource.cpp
 */
#include "LocalFileSource.hpp"

#include <filesystem>
#include <system_error>

namespace DocCrawler::Sources {

namespace fs = std::filesystem;

bool LocalFileSource::is_directory(const std::string& directory) {
    std::error_code ec;
    return fs::is_directory(directory, ec);
}

std::string LocalFileSource::directory_identity(const std::string& directory) {
    std::error_code ec;
    auto canonical = fs::canonical(directory, ec);
    return ec ? directory : canonical.string();
}

std::vector<FileEntry> LocalFileSource::list(const std::string& directory) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw std::system_error(ec, "cannot list " + directory);
    }

    std::vector<FileEntry> entries;
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!follow_symlinks_ && entry.is_symlink(entry_ec)) continue;

        FileEntry e;
        e.name = entry.path().filename().string();
        e.path = entry.path().string();
        e.directory = entry.is_directory(entry_ec);
        if (entry_ec) continue; // dangling link or entry removed while listing

        if (!e.directory) {
            e.size = entry.file_size(entry_ec);
            if (entry_ec) continue;
        }
        auto mtime = entry.last_write_time(entry_ec);
        if (!entry_ec) {
            e.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(mtime));
        }
        entries.push_back(std::move(e));
    }
    return entries;
}

} // namespace DocCrawler::Sources
