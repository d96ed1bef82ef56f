/**
 * \file crawler/source/CurlFileSource.hpp
 * \brief \c IFileSource for sftp and ftp servers, backed by libcurl.
 */
#pragma once

#include "IFileSource.hpp"
#include "settings/CrawlSettings.hpp"
#include "logger.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <curl/curl.h>

namespace DocCrawler::Sources {

/**
 * \brief Lists remote directories with libcurl.
 *
 * "sftp" authenticates with the password or the configured private key;
 * "ftp" uses the password. Listings are parsed from the `ls -l` style text
 * both transports return for a directory URL. Transfers abort as soon as
 * the cancellation predicate holds.
 */
class CurlFileSource : public IFileSource {
public:
    enum class Scheme { Sftp, Ftp };

    /**
     * \param scheme Transport to use.
     * \param server Host, port and credentials.
     * \param cancelled Polled during transfers; returning true aborts them.
     * \param logger Shared logger.
     */
    CurlFileSource(Scheme scheme,
                   Config::ServerSettings server,
                   std::function<bool()> cancelled,
                   std::shared_ptr<Logger> logger);
    ~CurlFileSource() override;

    CurlFileSource(const CurlFileSource&) = delete;
    CurlFileSource& operator=(const CurlFileSource&) = delete;

    void open() override;
    void close() override;
    bool is_directory(const std::string& directory) override;
    std::vector<FileEntry> list(const std::string& directory) override;
    /** \brief Listings report links as files, so the path itself is the identity. */
    std::string directory_identity(const std::string& directory) override { return directory; }
    std::string describe() const override;

    /**
     * \brief Parse `ls -l` style listing text.
     * \param listing Raw transfer output.
     * \param directory Prefix used to build each entry's path.
     */
    static std::vector<FileEntry> parse_listing(std::string_view listing, const std::string& directory);

private:
    std::string url_for(const std::string& directory) const;
    CURLcode perform_listing(const std::string& directory, std::string& out);

    Scheme scheme_;
    Config::ServerSettings server_;
    std::function<bool()> cancelled_;
    std::shared_ptr<Logger> logger_;
    CURL* handle_{nullptr};
};

} // namespace DocCrawler::Sources
