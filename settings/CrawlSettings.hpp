/**
 * \file settings/CrawlSettings.hpp
 * \brief In-memory job settings shared by the session, workers and services.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace DocCrawler::Config {

/** \brief What to crawl and how often. */
struct FsSettings {
    std::string url{"/tmp/es"};                                  ///< Root directory of the crawl.
    std::chrono::milliseconds update_rate{std::chrono::minutes(15)}; ///< Wait between two passes.
    std::vector<std::string> includes;                           ///< Glob patterns; empty means everything.
    std::vector<std::string> excludes{"*/~*"};                   ///< Glob patterns removed after includes.
    bool json_support{false};                                    ///< Treat files as JSON documents.
    bool xml_support{false};                                     ///< Treat files as XML documents.
    std::optional<std::string> checksum;                         ///< Digest algorithm name, if any.
    bool follow_symlinks{false};
    bool index_folders{true};                                    ///< Also submit directories.
    bool add_filesize{true};
};

/** \brief Remote server reached over ssh or ftp. */
struct ServerSettings {
    std::string hostname;
    int port{0};               ///< 0 selects the protocol's well-known port.
    std::string username;
    std::string password;
    std::string protocol{"local"}; ///< Raw configured value; resolved by the worker selector.
    std::string pem_path;      ///< Private key file for ssh.
};

/** \brief Location and naming of the document index. */
struct BackendSettings {
    std::string path;          ///< Store root; empty means "<job dir>/index".
    std::string index;         ///< Document index; empty means the job name.
    std::string index_folder;  ///< Folder index; empty means "<job name>_folder".
    bool push_templates{true}; ///< Write schema files when provisioning.
};

/** \brief Complete settings of one crawl job. Immutable once loaded. */
struct CrawlSettings {
    std::string name;
    FsSettings fs;
    std::optional<ServerSettings> server;
    BackendSettings backend;

    /** \brief Configured protocol name; "local" when there is no server block. */
    std::string protocol_name() const {
        return server ? server->protocol : std::string{"local"};
    }

    std::string index_name() const {
        return backend.index.empty() ? name : backend.index;
    }

    std::string folder_index_name() const {
        return backend.index_folder.empty() ? name + "_folder" : backend.index_folder;
    }
};

} // namespace DocCrawler::Config
