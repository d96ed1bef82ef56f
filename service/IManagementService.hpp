/**
 * \file service/IManagementService.hpp
 * \brief Backend connection owner used by the crawl session.
 */
#pragma once

#include <string>

namespace DocCrawler::Services {

/** \brief Owns the backend connection and reports what is on the other side. */
class IManagementService {
public:
    virtual ~IManagementService() = default;

    /** \brief Establish the backend connection. Throws on failure. */
    virtual void start() = 0;
    /** \brief Release the connection. Safe when never started or already closed. */
    virtual void close() = 0;
    /** \brief Backend version string; requires a started service. */
    virtual std::string get_version() const = 0;
    /** \brief True between a successful \c start and \c close. */
    virtual bool is_started() const = 0;
};

} // namespace DocCrawler::Services
