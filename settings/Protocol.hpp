/**
 * \file settings/Protocol.hpp
 * \brief Access protocols a crawl target can be reached with.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace DocCrawler::Config {

/** \brief Closed set of supported access protocols. */
enum class Protocol { Local, Ssh, Ftp };

/** \brief Lower-case name used in settings files ("local", "ssh", "ftp"). */
std::string_view to_string(Protocol protocol) noexcept;

/**
 * \brief Parse a configured protocol name. Names are lower case and match exactly.
 * \return The protocol, or nullopt when the name is not supported.
 */
std::optional<Protocol> parse_protocol(std::string_view name);

/** \brief Comma separated list of supported names, for error messages. */
std::string supported_protocols();

/** \brief Well-known port used when the server block leaves it unset. */
int default_port(Protocol protocol) noexcept;

} // namespace DocCrawler::Config
