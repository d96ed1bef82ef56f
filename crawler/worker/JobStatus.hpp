/**
 * \file crawler/worker/JobStatus.hpp
 * \brief Summary of the last completed pass, persisted in the job directory.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace DocCrawler::Workers {

struct JobStatus {
    static constexpr const char* kStatusFile = "_status.json";

    std::string name;
    std::chrono::system_clock::time_point lastrun{};
    std::uint64_t indexed{0};
    std::uint64_t errors{0};
    int runs{0};

    /** \brief Read "<job_dir>/_status.json"; nullopt when absent. */
    static std::optional<JobStatus> read(const std::filesystem::path& job_dir);
    /** \brief Replace "<job_dir>/_status.json". */
    void write(const std::filesystem::path& job_dir) const;
};

/** \brief UTC timestamp formatted as "YYYY-MM-DDTHH:MM:SSZ". */
std::string to_iso8601(std::chrono::system_clock::time_point tp);
/** \brief Inverse of \c to_iso8601; throws std::runtime_error on other formats. */
std::chrono::system_clock::time_point from_iso8601(const std::string& text);

} // namespace DocCrawler::Workers
