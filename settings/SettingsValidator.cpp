/**
 * \file settings/SettingsValidator.cpp
 * \brief Settings rules checked before a crawl session is created.
 */
#include "SettingsValidator.hpp"
#include "Protocol.hpp"

#include <algorithm>
#include <cctype>

namespace DocCrawler::Config {

namespace {

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

const std::vector<std::string>& SettingsValidator::supported_checksums() {
    static const std::vector<std::string> names{"MD2", "MD5", "SHA-1", "SHA-224", "SHA-256", "SHA-384", "SHA-512"};
    return names;
}

std::vector<std::string> SettingsValidator::collect_errors(const CrawlSettings& settings) {
    std::vector<std::string> errors;

    if (settings.name.empty()) {
        errors.emplace_back("A job name is required");
    } else if (settings.name.find('/') != std::string::npos || settings.name == "." || settings.name == "..") {
        errors.emplace_back("Job name [" + settings.name + "] can not be used as a directory name");
    }

    if (settings.fs.url.empty()) {
        errors.emplace_back("fs.url must point to the directory to crawl");
    }

    if (settings.fs.update_rate.count() <= 0) {
        errors.emplace_back("fs.update_rate must be greater than zero");
    }

    if (settings.fs.checksum) {
        const auto& known = supported_checksums();
        if (std::find(known.begin(), known.end(), upper(*settings.fs.checksum)) == known.end()) {
            errors.emplace_back("fs.checksum [" + *settings.fs.checksum + "] is not a supported digest algorithm");
        }
    }

    if (settings.fs.xml_support && settings.fs.json_support) {
        errors.emplace_back("Can not support both xml and json parsing");
    }

    if (settings.server) {
        const auto& server = *settings.server;
        // Unknown protocol names are reported by the worker selector, which lists the supported set
        auto protocol = parse_protocol(server.protocol);
        if (protocol && *protocol != Protocol::Local) {
            if (server.hostname.empty()) {
                errors.emplace_back("server.hostname is required for protocol " + server.protocol);
            }
            if (server.port <= 0 || server.port > 65535) {
                errors.emplace_back("server.port [" + std::to_string(server.port) + "] is out of range");
            }
        }
        if (protocol == Protocol::Ssh) {
            if (server.username.empty()) {
                errors.emplace_back("When using SSH, you need to set a username and probably a password or a pem file");
            } else if (server.password.empty() && server.pem_path.empty()) {
                errors.emplace_back("When using SSH, you need to set a password or a pem file");
            }
        }
    }

    if (settings.index_name() == settings.folder_index_name()) {
        errors.emplace_back("backend.index and backend.index_folder must differ");
    }

    return errors;
}

bool SettingsValidator::validate(const CrawlSettings& settings, const std::shared_ptr<Logger>& logger) {
    const auto errors = collect_errors(settings);
    if (logger) {
        for (const auto& e : errors) {
            logger->error(e);
        }
    }
    return !errors.empty();
}

} // namespace DocCrawler::Config
