/**
 * \file settings/Protocol.cpp
 * \brief Protocol name mapping.
 */
#include "Protocol.hpp"

#include <array>

namespace DocCrawler::Config {

namespace {
constexpr std::array<Protocol, 3> kAllProtocols{Protocol::Local, Protocol::Ssh, Protocol::Ftp};
}

std::string_view to_string(Protocol protocol) noexcept {
    switch (protocol) {
        case Protocol::Local: return "local";
        case Protocol::Ssh:   return "ssh";
        case Protocol::Ftp:   return "ftp";
    }
    return "unknown";
}

std::optional<Protocol> parse_protocol(std::string_view name) {
    for (Protocol p : kAllProtocols) {
        if (name == to_string(p)) return p;
    }
    return std::nullopt;
}

std::string supported_protocols() {
    std::string out;
    for (Protocol p : kAllProtocols) {
        if (!out.empty()) out += ", ";
        out += to_string(p);
    }
    return out;
}

int default_port(Protocol protocol) noexcept {
    switch (protocol) {
        case Protocol::Ssh: return 22;
        case Protocol::Ftp: return 21;
        case Protocol::Local: return 0;
    }
    return 0;
}

} // namespace DocCrawler::Config
