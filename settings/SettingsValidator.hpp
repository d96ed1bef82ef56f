/**
 * \file settings/SettingsValidator.hpp
 * \brief Pass/fail gate applied to job settings before a session is built.
 */
#pragma once

#include "CrawlSettings.hpp"
#include "logger.hpp"

#include <memory>
#include <string>
#include <vector>

namespace DocCrawler::Config {

/** \brief Checks settings for combinations the crawler cannot honour. */
class SettingsValidator {
public:
    /** \brief Digest names accepted for fs.checksum. */
    static const std::vector<std::string>& supported_checksums();

    /** \brief Every problem found, as human readable messages. Empty when valid. */
    static std::vector<std::string> collect_errors(const CrawlSettings& settings);

    /**
     * \brief Log every problem at error level.
     * \return true when errors were found.
     */
    static bool validate(const CrawlSettings& settings, const std::shared_ptr<Logger>& logger);
};

} // namespace DocCrawler::Config
