/**
 * \file subprojects/shared/options/Options.cpp
 * \brief Two-phase command line parse with JSON config defaults.
 */
#include "Options.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <utility>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace shared_opts {

struct ProviderHolder { std::function<void(CLI::App&, const nlohmann::json&)> cb; };

static std::vector<ProviderHolder>& providers() {
    static std::vector<ProviderHolder> p;
    return p;
}

// Store the loaded config file path (if any) so that option providers can resolve relative paths.
static std::optional<std::filesystem::path>& loaded_config_file_storage() {
    static std::optional<std::filesystem::path> p; return p;
}

std::mutex& Options::providers_mutex() {
    static std::mutex m;
    return m;
}

void Options::add_provider(Provider p) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().push_back(ProviderHolder{std::move(p)});
}

nlohmann::json Options::read_json_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("cannot open " + path.string());
    }
    try {
        return nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("malformed JSON in " + path.string() + ": " + e.what());
    }
}

void Options::write_json_file(const std::filesystem::path& path, const nlohmann::json& value, int indent) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot write " + tmp.string());
        }
        out << value.dump(indent);
        if (indent >= 0) out << '\n';
        if (!out.flush()) {
            throw std::runtime_error("short write on " + tmp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::system_error(ec, "cannot rename into " + path.string());
    }
}

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    CLI::App app{"doc-crawler: crawl a directory tree into a document index"};
    app.set_version_flag("-V,--version", std::string{"doc-crawler " DOCCRAWLER_VERSION});

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");

    // Allow extra args temporarily while we look for the config file path.
    // We'll do a strict parse on the real app after option providers are registered.
    app.allow_extras(true);

    // Minimal pre-parser to discover -c/--config early, so providers can take
    // their defaults from the JSON document before the full parse.
    CLI::App config_scan{"config_scan"};
    config_scan.add_option("-c,--config", config_file);
    config_scan.allow_extras(true);
    config_scan.set_help_flag();
    try {
        config_scan.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        // The real parse below reports the same problem with full context
        config_file.clear();
    }

    nlohmann::json cfg_json = nlohmann::json::object();
    loaded_config_file_storage().reset();
    if (!config_file.empty()) {
        try {
            cfg_json = read_json_file(config_file);
            loaded_config_file_storage() = std::filesystem::absolute(config_file);
        } catch (const std::exception& e) {
            err = e.what();
            return ParseResult::Error;
        }
    }

    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        for (auto &ph : providers()) {
            if (ph.cb) ph.cb(app, cfg_json);
        }
    }

    app.allow_extras(false);
    app.require_subcommand(0);
    try {
        app.parse(argc, argv);
        return ParseResult::Ok;
    } catch (const CLI::CallForHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForAllHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForVersion &v) {
        std::cout << v.what() << std::endl;
        return ParseResult::Version;
    } catch (const std::exception &e) {
        err = e.what();
        return ParseResult::Error;
    }
}

std::optional<std::filesystem::path> Options::get_config_dir() {
    auto &s = loaded_config_file_storage();
    if (s && s->has_parent_path()) return s->parent_path();
    return std::nullopt;
}

}
