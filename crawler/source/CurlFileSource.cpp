/**
 * \file crawler/source/CurlFileSource.cpp
 * \brief libcurl transfers and listing parser for remote sources.
 */
#include "CurlFileSource.hpp"

#include <cctype>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace DocCrawler::Sources {

namespace {

void ensure_curl_initialized() {
    static std::once_flag init_flag;
    std::call_once(init_flag, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

size_t append_to_string(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * nmemb);
    return size * nmemb;
}

int abort_when_cancelled(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancelled = static_cast<std::function<bool()>*>(userdata);
    return (*cancelled && (*cancelled)()) ? 1 : 0;
}

bool is_number(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string join_path(const std::string& directory, const std::string& name) {
    if (directory.empty() || directory.back() == '/') return directory + name;
    return directory + "/" + name;
}

} // namespace

CurlFileSource::CurlFileSource(Scheme scheme,
                               Config::ServerSettings server,
                               std::function<bool()> cancelled,
                               std::shared_ptr<Logger> logger)
    : scheme_(scheme)
    , server_(std::move(server))
    , cancelled_(std::move(cancelled))
    , logger_(std::move(logger)) {}

CurlFileSource::~CurlFileSource() {
    close();
}

void CurlFileSource::open() {
    if (handle_) return;
    ensure_curl_initialized();
    handle_ = curl_easy_init();
    if (!handle_) {
        throw std::runtime_error("curl_easy_init failed for " + describe());
    }
    if (logger_) logger_->debug("Opened remote source " + describe());
}

void CurlFileSource::close() {
    if (handle_) {
        curl_easy_cleanup(handle_);
        handle_ = nullptr;
    }
}

std::string CurlFileSource::describe() const {
    return std::string(scheme_ == Scheme::Sftp ? "sftp" : "ftp") + "://" + server_.hostname + ":" +
           std::to_string(server_.port);
}

std::string CurlFileSource::url_for(const std::string& directory) const {
    std::string url = describe();

    // ftp paths are relative to the login directory; %2F anchors them at the server root
    if (scheme_ == Scheme::Ftp && !directory.empty() && directory.front() == '/') {
        url += "/%2F";
    } else {
        url += "/";
    }

    std::istringstream parts(directory);
    std::string part;
    bool first = true;
    while (std::getline(parts, part, '/')) {
        if (part.empty()) continue;
        char* escaped = curl_easy_escape(handle_, part.c_str(), static_cast<int>(part.size()));
        if (!escaped) {
            throw std::runtime_error("curl_easy_escape failed for " + part);
        }
        if (!first) url += "/";
        url += escaped;
        curl_free(escaped);
        first = false;
    }
    if (url.back() != '/') url += "/";
    return url;
}

CURLcode CurlFileSource::perform_listing(const std::string& directory, std::string& out) {
    if (!handle_) {
        throw std::logic_error("CurlFileSource: list called before open on " + describe());
    }
    out.clear();
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_reset(handle_);
    const std::string url = url_for(directory);
    curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &append_to_string);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle_, CURLOPT_XFERINFOFUNCTION, &abort_when_cancelled);
    curl_easy_setopt(handle_, CURLOPT_XFERINFODATA, &cancelled_);
    curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_TIME, 60L);
    if (!server_.username.empty()) {
        curl_easy_setopt(handle_, CURLOPT_USERNAME, server_.username.c_str());
    }
    if (!server_.password.empty()) {
        curl_easy_setopt(handle_, CURLOPT_PASSWORD, server_.password.c_str());
    }
    if (scheme_ == Scheme::Sftp) {
        curl_easy_setopt(handle_, CURLOPT_SSH_AUTH_TYPES,
                         static_cast<long>(CURLSSH_AUTH_PUBLICKEY | CURLSSH_AUTH_PASSWORD));
        if (!server_.pem_path.empty()) {
            curl_easy_setopt(handle_, CURLOPT_SSH_PRIVATE_KEYFILE, server_.pem_path.c_str());
        }
    }

    CURLcode rc = curl_easy_perform(handle_);
    if (rc != CURLE_OK && logger_) {
        logger_->debug("Listing " + url + " failed: " + std::string(errbuf[0] ? errbuf : curl_easy_strerror(rc)));
    }
    return rc;
}

bool CurlFileSource::is_directory(const std::string& directory) {
    std::string listing;
    CURLcode rc = perform_listing(directory, listing);
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        throw std::runtime_error("transfer cancelled on " + describe());
    }
    return rc == CURLE_OK;
}

std::vector<FileEntry> CurlFileSource::list(const std::string& directory) {
    std::string listing;
    CURLcode rc = perform_listing(directory, listing);
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        throw std::runtime_error("transfer cancelled on " + describe());
    }
    if (rc != CURLE_OK) {
        throw std::runtime_error("cannot list " + directory + " on " + describe() + ": " + curl_easy_strerror(rc));
    }
    return parse_listing(listing, directory);
}

std::vector<FileEntry> CurlFileSource::parse_listing(std::string_view listing, const std::string& directory) {
    std::vector<FileEntry> entries;
    std::istringstream lines{std::string(listing)};
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line.rfind("total ", 0) == 0) continue;

        // perms links owner [group] size month day time|year name...
        std::istringstream fields(line);
        std::vector<std::string> tokens;
        std::string token;
        while (tokens.size() < 8 && fields >> token) tokens.push_back(token);
        if (tokens.size() < 8) continue;

        std::string name;
        std::getline(fields, name);
        size_t start = name.find_first_not_of(' ');
        name = (start == std::string::npos) ? std::string{} : name.substr(start);

        size_t size_index = 4;
        if (!is_number(tokens[4]) && is_number(tokens[3])) {
            // Listing without a group column: the 8th token already belongs to the name
            size_index = 3;
            name = name.empty() ? tokens[7] : tokens[7] + " " + name;
        }
        if (name.empty() || !is_number(tokens[size_index])) continue;

        const char type = tokens[0].empty() ? '-' : tokens[0][0];
        if (type == 'l') {
            size_t arrow = name.find(" -> ");
            if (arrow != std::string::npos) name = name.substr(0, arrow);
        }
        if (name == "." || name == "..") continue;

        FileEntry e;
        e.name = name;
        e.path = join_path(directory, name);
        e.directory = (type == 'd');
        e.size = std::stoull(tokens[size_index]);
        entries.push_back(std::move(e));
    }
    return entries;
}

} // namespace DocCrawler::Sources
