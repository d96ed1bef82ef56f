/**
 * \file crawler/worker/PathFilter.hpp
 * \brief Include/exclude glob matching on virtual paths.
 */
#pragma once

#include <string>
#include <vector>

namespace DocCrawler::Workers {

/**
 * \brief Case-insensitive glob filter; '*' also matches '/'.
 *
 * Patterns are tested against the virtual path ("/dir/name.ext"). Excludes
 * win over includes; an empty include list accepts every file.
 */
class PathFilter {
public:
    PathFilter(std::vector<std::string> includes, std::vector<std::string> excludes);

    /** \brief Files must match an include (if any) and no exclude. */
    bool accepts_file(const std::string& virtual_path) const;
    /** \brief Directories are only subject to excludes. */
    bool accepts_directory(const std::string& virtual_path) const;

    static bool matches(const std::string& pattern, const std::string& virtual_path);

private:
    bool excluded(const std::string& lowered) const;

    std::vector<std::string> includes_;
    std::vector<std::string> excludes_;
};

} // namespace DocCrawler::Workers
