/**
 * \file crawler/worker/PathFilter.cpp
 */
#include "PathFilter.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>

namespace DocCrawler::Workers {

namespace {

std::string lowered(std::string s) {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> lowered_all(std::vector<std::string> patterns) {
    for (auto& p : patterns) p = lowered(std::move(p));
    return patterns;
}

} // namespace

PathFilter::PathFilter(std::vector<std::string> includes, std::vector<std::string> excludes)
    : includes_(lowered_all(std::move(includes)))
    , excludes_(lowered_all(std::move(excludes))) {}

bool PathFilter::matches(const std::string& pattern, const std::string& virtual_path) {
    // No FNM_PATHNAME: '*' spans directory separators
    return ::fnmatch(lowered(pattern).c_str(), lowered(virtual_path).c_str(), 0) == 0;
}

bool PathFilter::excluded(const std::string& path) const {
    return std::any_of(excludes_.begin(), excludes_.end(), [&](const std::string& p) {
        return ::fnmatch(p.c_str(), path.c_str(), 0) == 0;
    });
}

bool PathFilter::accepts_file(const std::string& virtual_path) const {
    const std::string path = lowered(virtual_path);
    if (excluded(path)) return false;
    if (includes_.empty()) return true;
    return std::any_of(includes_.begin(), includes_.end(), [&](const std::string& p) {
        return ::fnmatch(p.c_str(), path.c_str(), 0) == 0;
    });
}

bool PathFilter::accepts_directory(const std::string& virtual_path) const {
    return !excluded(lowered(virtual_path));
}

} // namespace DocCrawler::Workers
