/**
 * \file crawler/CrawlerOptions.cpp
 * \brief Option provider for the crawler program.
 */

#include "CrawlerOptions.hpp"
#include <options/Options.hpp>
#include <processUtils.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <filesystem>

namespace crawler_opts {

static std::optional<std::string> g_job_name;
static std::optional<std::string> g_config_dir;
static std::optional<int> g_loop;
static std::optional<bool> g_rest;
/// Seconds; 0 waits for the worker without bound.
static std::optional<int> g_shutdown_timeout;
static std::optional<bool> g_debug;
static std::optional<bool> g_setup;

std::optional<std::string> get_job_name() { return g_job_name; }
std::optional<std::string> get_config_dir() { return g_config_dir; }
std::optional<int> get_loop() { return g_loop; }
std::optional<bool> get_rest() { return g_rest; }
std::optional<int> get_shutdown_timeout_seconds() { return g_shutdown_timeout; }
std::optional<bool> get_debug() { return g_debug; }
std::optional<bool> get_setup() { return g_setup; }

void register_options() {
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::string config_dir_default = (ProcessUtils::get_home_dir() / ".doc-crawler").string();
        int loop_default = -1;
        bool rest_default = false;
        int timeout_default = 0;
        bool debug_default = false;
        if (j.contains("crawler") && j["crawler"].is_object()) {
            const auto& c = j["crawler"];
            if (c.contains("config_dir") && c["config_dir"].is_string()) {
                std::filesystem::path dir = c["config_dir"].get<std::string>();
                // Relative to the config file that names it
                if (dir.is_relative()) {
                    if (auto base = shared_opts::Options::get_config_dir()) dir = *base / dir;
                }
                config_dir_default = dir.string();
            }
            if (c.contains("loop") && c["loop"].is_number_integer()) loop_default = c["loop"].get<int>();
            if (c.contains("rest") && c["rest"].is_boolean()) rest_default = c["rest"].get<bool>();
            if (c.contains("shutdown_timeout") && c["shutdown_timeout"].is_number_integer()) timeout_default = c["shutdown_timeout"].get<int>();
            if (c.contains("debug") && c["debug"].is_boolean()) debug_default = c["debug"].get<bool>();
        }
        g_config_dir = config_dir_default;
        g_loop = loop_default;
        g_rest = rest_default;
        g_shutdown_timeout = timeout_default;
        g_debug = debug_default;
        g_setup = false;

        app.add_option("job", g_job_name, "Name of the job to run")
            ->required()
            ->group("Crawler");
        app.add_option("--config-dir", g_config_dir, "Directory holding one sub directory per job")
            ->group("Crawler");
        app.add_option("--loop", g_loop, "Number of passes: 0 none, -1 watch until stopped")
            ->group("Crawler");
        app.add_flag("--rest", g_rest, "Keep the session alive for auxiliary interfaces")
            ->group("Crawler");
        app.add_option("--shutdown-timeout", g_shutdown_timeout, "Seconds to wait for the worker on stop (0 = no limit)")
            ->check(CLI::NonNegativeNumber)
            ->group("Crawler");
        app.add_flag("--debug", g_debug, "Log debug messages")
            ->group("Crawler");
        app.add_flag("--setup", g_setup, "Write default settings for the job and exit")
            ->group("Crawler");
    });
}

} // namespace crawler_opts

namespace {
    struct CrawlerOptsAutoReg {
        CrawlerOptsAutoReg() { crawler_opts::register_options(); }
    } crawler_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
