/**
 * \file settings/SettingsLoader.hpp
 * \brief JSON (de)serialization of \c CrawlSettings.
 */
#pragma once

#include "CrawlSettings.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace DocCrawler::Config {

/** \brief Reads and writes job settings files ("<config dir>/<job>/_settings.json"). */
class SettingsLoader {
public:
    static constexpr const char* kSettingsFile = "_settings.json";

    /** \brief Settings with every default applied, for the given job name. */
    static CrawlSettings defaults(const std::string& name);

    /**
     * \brief Build settings from a parsed JSON document.
     * \throws std::runtime_error when a field has the wrong type or an unreadable duration.
     */
    static CrawlSettings from_json(const nlohmann::json& j);

    /** \brief Inverse of \c from_json. */
    static nlohmann::json to_json(const CrawlSettings& settings);

    /** \brief Load one settings file. */
    static CrawlSettings load(const std::filesystem::path& file);

    /** \brief Load "<config_dir>/<job>/_settings.json"; the job name defaults to \p job. */
    static CrawlSettings load_job(const std::filesystem::path& config_dir, const std::string& job);

    /** \brief Write settings as pretty-printed JSON, creating parent directories. */
    static void save(const CrawlSettings& settings, const std::filesystem::path& file);

    /**
     * \brief Parse durations such as "500ms", "30s", "15m", "1h" or "2d".
     * A bare number is taken as seconds.
     */
    static std::chrono::milliseconds parse_duration(std::string_view text);

    /** \brief Shortest exact textual form accepted by \c parse_duration. */
    static std::string format_duration(std::chrono::milliseconds duration);
};

} // namespace DocCrawler::Config
