/**
 * \file settings/SettingsLoader.cpp
 * \brief JSON mapping for job settings.
 */
#include "SettingsLoader.hpp"
#include "Protocol.hpp"
#include <options/Options.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace DocCrawler::Config {

namespace {

// Copy j[key] into out when present; a present value of the wrong type is an error.
template <typename T>
void read_field(const nlohmann::json& j, const char* section, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        out = j[key].get<T>();
    } catch (const nlohmann::json::type_error&) {
        const std::string field = *section ? std::string{section} + "." + key : std::string{key};
        throw std::runtime_error("settings: " + field + " has the wrong type (" + j[key].type_name() + ")");
    }
}

// value * factor_ms as milliseconds; throws when the product does not fit.
std::chrono::milliseconds scaled_duration(long long value, long long factor_ms, std::string_view text) {
    if (value < 0 || value > std::chrono::milliseconds::max().count() / factor_ms) {
        throw std::runtime_error("settings: invalid duration '" + std::string(text) + "'");
    }
    return std::chrono::milliseconds(value * factor_ms);
}

const nlohmann::json& section_of(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(key) || j[key].is_null()) return empty;
    if (!j[key].is_object()) {
        throw std::runtime_error(std::string{"settings: "} + key + " must be an object");
    }
    return j[key];
}

} // namespace

CrawlSettings SettingsLoader::defaults(const std::string& name) {
    CrawlSettings s;
    s.name = name;
    return s;
}

CrawlSettings SettingsLoader::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("settings: top level must be a JSON object");
    }
    CrawlSettings s;
    read_field(j, "", "name", s.name);

    const auto& fs = section_of(j, "fs");
    read_field(fs, "fs", "url", s.fs.url);
    if (fs.contains("update_rate")) {
        const auto& rate = fs["update_rate"];
        if (rate.is_string()) {
            s.fs.update_rate = parse_duration(rate.get<std::string>());
        } else if (rate.is_number_unsigned()) {
            const auto seconds = rate.get<std::uint64_t>();
            if (seconds > static_cast<std::uint64_t>(std::numeric_limits<long long>::max())) {
                throw std::runtime_error("settings: invalid duration '" + rate.dump() + "'");
            }
            s.fs.update_rate = scaled_duration(static_cast<long long>(seconds), 1000, rate.dump());
        } else if (rate.is_number_integer()) {
            s.fs.update_rate = scaled_duration(rate.get<long long>(), 1000, rate.dump());
        } else if (!rate.is_null()) {
            throw std::runtime_error("settings: fs.update_rate must be a duration string or seconds");
        }
    }
    read_field(fs, "fs", "includes", s.fs.includes);
    read_field(fs, "fs", "excludes", s.fs.excludes);
    read_field(fs, "fs", "json_support", s.fs.json_support);
    read_field(fs, "fs", "xml_support", s.fs.xml_support);
    if (fs.contains("checksum") && !fs["checksum"].is_null()) {
        std::string checksum;
        read_field(fs, "fs", "checksum", checksum);
        s.fs.checksum = checksum;
    }
    read_field(fs, "fs", "follow_symlinks", s.fs.follow_symlinks);
    read_field(fs, "fs", "index_folders", s.fs.index_folders);
    read_field(fs, "fs", "add_filesize", s.fs.add_filesize);

    if (j.contains("server") && !j["server"].is_null()) {
        const auto& srv = section_of(j, "server");
        ServerSettings server;
        read_field(srv, "server", "hostname", server.hostname);
        read_field(srv, "server", "port", server.port);
        read_field(srv, "server", "username", server.username);
        read_field(srv, "server", "password", server.password);
        read_field(srv, "server", "protocol", server.protocol);
        read_field(srv, "server", "pem_path", server.pem_path);
        if (server.port == 0) {
            if (auto p = parse_protocol(server.protocol)) server.port = default_port(*p);
        }
        s.server = server;
    }

    const auto& backend = section_of(j, "backend");
    read_field(backend, "backend", "path", s.backend.path);
    read_field(backend, "backend", "index", s.backend.index);
    read_field(backend, "backend", "index_folder", s.backend.index_folder);
    read_field(backend, "backend", "push_templates", s.backend.push_templates);
    return s;
}

nlohmann::json SettingsLoader::to_json(const CrawlSettings& s) {
    nlohmann::json j;
    j["name"] = s.name;
    j["fs"] = {
        {"url", s.fs.url},
        {"update_rate", format_duration(s.fs.update_rate)},
        {"includes", s.fs.includes},
        {"excludes", s.fs.excludes},
        {"json_support", s.fs.json_support},
        {"xml_support", s.fs.xml_support},
        {"follow_symlinks", s.fs.follow_symlinks},
        {"index_folders", s.fs.index_folders},
        {"add_filesize", s.fs.add_filesize},
    };
    if (s.fs.checksum) j["fs"]["checksum"] = *s.fs.checksum;
    if (s.server) {
        j["server"] = {
            {"hostname", s.server->hostname},
            {"port", s.server->port},
            {"username", s.server->username},
            {"password", s.server->password},
            {"protocol", s.server->protocol},
            {"pem_path", s.server->pem_path},
        };
    }
    j["backend"] = {
        {"path", s.backend.path},
        {"index", s.backend.index},
        {"index_folder", s.backend.index_folder},
        {"push_templates", s.backend.push_templates},
    };
    return j;
}

CrawlSettings SettingsLoader::load(const std::filesystem::path& file) {
    return from_json(shared_opts::Options::read_json_file(file));
}

CrawlSettings SettingsLoader::load_job(const std::filesystem::path& config_dir, const std::string& job) {
    const auto file = config_dir / job / kSettingsFile;
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("job [" + job + "] has no settings file at " + file.string());
    }
    CrawlSettings s = load(file);
    if (s.name.empty()) s.name = job;
    return s;
}

void SettingsLoader::save(const CrawlSettings& settings, const std::filesystem::path& file) {
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path());
    }
    shared_opts::Options::write_json_file(file, to_json(settings), 2);
}

std::chrono::milliseconds SettingsLoader::parse_duration(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    long long value = 0;
    const char* begin = text.data() + pos;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr == begin || value < 0) {
        throw std::runtime_error("settings: invalid duration '" + std::string(text) + "'");
    }
    std::string unit(ptr, end);
    while (!unit.empty() && std::isspace(static_cast<unsigned char>(unit.back()))) unit.pop_back();

    if (unit.empty() || unit == "s") return scaled_duration(value, 1000, text);
    if (unit == "ms") return scaled_duration(value, 1, text);
    if (unit == "m")  return scaled_duration(value, 60 * 1000, text);
    if (unit == "h")  return scaled_duration(value, 3600 * 1000, text);
    if (unit == "d")  return scaled_duration(value, 24LL * 3600 * 1000, text);
    throw std::runtime_error("settings: unknown duration unit '" + unit + "' in '" + std::string(text) + "'");
}

std::string SettingsLoader::format_duration(std::chrono::milliseconds duration) {
    const long long ms = duration.count();
    if (ms % 86400000 == 0 && ms != 0) return std::to_string(ms / 86400000) + "d";
    if (ms % 3600000 == 0 && ms != 0)  return std::to_string(ms / 3600000) + "h";
    if (ms % 60000 == 0 && ms != 0)    return std::to_string(ms / 60000) + "m";
    if (ms % 1000 == 0)                return std::to_string(ms / 1000) + "s";
    return std::to_string(ms) + "ms";
}

} // namespace DocCrawler::Config
