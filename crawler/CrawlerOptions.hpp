/**
 * \file crawler/CrawlerOptions.hpp
 * \brief Command line and config file options of the doc-crawler program.
 */
#pragma once

#include <optional>
#include <string>

/** \brief Accessors for crawler options, filled by \c shared_opts::Options::load_and_parse. */
namespace crawler_opts {
    std::optional<std::string> get_job_name();
    std::optional<std::string> get_config_dir();
    std::optional<int> get_loop();
    std::optional<bool> get_rest();
    std::optional<int> get_shutdown_timeout_seconds();
    std::optional<bool> get_debug();
    std::optional<bool> get_setup();
    void register_options();
}
