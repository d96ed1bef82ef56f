/**
 * \file crawler/worker/JobStatus.cpp
 */
#include "JobStatus.hpp"
#include <options/Options.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace DocCrawler::Workers {

std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

std::chrono::system_clock::time_point from_iso8601(const std::string& text) {
    std::tm utc{};
    std::istringstream in(text);
    in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        throw std::runtime_error("invalid timestamp '" + text + "'");
    }
    return std::chrono::system_clock::from_time_t(timegm(&utc));
}

std::optional<JobStatus> JobStatus::read(const std::filesystem::path& job_dir) {
    const auto file = job_dir / kStatusFile;
    if (!std::filesystem::exists(file)) return std::nullopt;

    const auto j = shared_opts::Options::read_json_file(file);
    JobStatus status;
    try {
        status.name = j.value("name", std::string{});
        if (j.contains("lastrun")) status.lastrun = from_iso8601(j["lastrun"].get<std::string>());
        status.indexed = j.value("indexed", std::uint64_t{0});
        status.errors = j.value("errors", std::uint64_t{0});
        status.runs = j.value("runs", 0);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("corrupted status file " + file.string() + ": " + e.what());
    }
    return status;
}

void JobStatus::write(const std::filesystem::path& job_dir) const {
    const nlohmann::json j{
        {"name", name},
        {"lastrun", to_iso8601(lastrun)},
        {"indexed", indexed},
        {"errors", errors},
        {"runs", runs},
    };
    shared_opts::Options::write_json_file(job_dir / kStatusFile, j, 2);
}

} // namespace DocCrawler::Workers
