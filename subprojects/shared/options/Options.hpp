/**
 * \file subprojects/shared/options/Options.hpp
 * \brief Command line parsing shared by the crawler program and its option providers.
 */
#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {

/**
 * \brief Collects option providers and runs the two-phase parse.
 *
 * The first phase only looks for -c/--config and loads that JSON document;
 * every registered provider then adds its options, taking defaults from the
 * document, before the strict parse of the full command line.
 */
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider p);

    /** \brief Parse argv; on \c ParseResult::Error \p err holds the message. */
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);

    /** \brief Directory of the loaded config file, for resolving relative paths in providers. */
    static std::optional<std::filesystem::path> get_config_dir();

    /** \brief Read a JSON document; throws std::runtime_error naming the file on open or parse failure. */
    static nlohmann::json read_json_file(const std::filesystem::path& path);

    /**
     * \brief Replace \p path with \p value, written to a sibling ".tmp" file and renamed over it.
     * Readers see the old document or the new one, never a partial write.
     * \param indent Passed to nlohmann::json::dump; pretty printed output ends with a newline.
     */
    static void write_json_file(const std::filesystem::path& path, const nlohmann::json& value, int indent = -1);

private:
    static std::mutex& providers_mutex();
};

} // namespace shared_opts
