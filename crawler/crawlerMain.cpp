/**
 * \file crawler/crawlerMain.cpp
 * \brief Entrypoint for the doc-crawler program.
 */

#include "session/CrawlSession.hpp"
#include "CrawlerOptions.hpp"
#include "settings/SettingsLoader.hpp"
#include "logger.hpp"
#include <options/Options.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_stop_requested{false};

void on_stop_signal(int) {
    g_stop_requested.store(true);
}

void print_error(const std::exception& e, int depth = 0) {
    std::cerr << std::string(static_cast<size_t>(depth) * 2, ' ') << e.what() << std::endl;
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        print_error(nested, depth + 1);
    }
}

} // namespace

/** \brief Entrypoint for the crawler binary. */
int main(int argc, char* argv[]) {
    try {
        std::string opt_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opt_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0;
        }
        if (parse_res == shared_opts::Options::ParseResult::Error) {
            std::cerr << "doc-crawler option parse error: " << opt_err << std::endl;
            return 2;
        }

        namespace co = crawler_opts;
        const std::string job = co::get_job_name().value_or("");
        const std::filesystem::path config_dir = co::get_config_dir().value_or(".doc-crawler");
        const int loop = co::get_loop().value_or(DocCrawler::Workers::LOOP_INFINITE);
        const bool rest = co::get_rest().value_or(false);
        const bool debug = co::get_debug().value_or(false);

        auto logger = std::make_shared<Logger>("doc-crawler");
        auto stdout_sink = std::make_shared<StdoutSink>();
        stdout_sink->set_level(debug ? LogLevel::Debug : LogLevel::Info);
        logger->add_sink(stdout_sink);

        const auto settings_file = config_dir / job / DocCrawler::Config::SettingsLoader::kSettingsFile;
        if (co::get_setup().value_or(false)) {
            if (std::filesystem::exists(settings_file)) {
                logger->error("Settings for job [" + job + "] already exist in " + settings_file.string());
                return 1;
            }
            DocCrawler::Config::SettingsLoader::save(DocCrawler::Config::SettingsLoader::defaults(job), settings_file);
            logger->info("Default settings for job [" + job + "] written to " + settings_file.string());
            return 0;
        }

        auto settings = DocCrawler::Config::SettingsLoader::load_job(config_dir, job);

        // The job directory exists once its settings were read
        auto file_sink = std::make_shared<FileSink>(config_dir / job / "crawler.log");
        file_sink->set_level(debug ? LogLevel::Debug : LogLevel::Info);
        logger->add_sink(file_sink);

        DocCrawler::CrawlSession session(config_dir, std::move(settings), loop, rest, logger);
        if (auto seconds = co::get_shutdown_timeout_seconds().value_or(0); seconds > 0) {
            session.set_shutdown_timeout(std::chrono::seconds(seconds));
        }

        std::signal(SIGINT, on_stop_signal);
        std::signal(SIGTERM, on_stop_signal);

        session.start();

        while (!g_stop_requested.load()) {
            const bool serving = rest && session.state() == DocCrawler::SessionState::Running;
            if (!session.worker_running() && !serving) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        if (g_stop_requested.load()) logger->info("Stop requested, closing crawl session [" + job + "]");

        try {
            session.close();
        } catch (const std::exception& e) {
            logger->error(std::string{"Crawl session did not close cleanly: "} + e.what());
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "doc-crawler error: ";
        print_error(e);
        return 1;
    }
}
