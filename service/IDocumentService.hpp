/**
 * \file service/IDocumentService.hpp
 * \brief Schema provisioning and document submission.
 */
#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace DocCrawler::Services {

/** \brief Receives the documents produced by crawl workers. */
class IDocumentService {
public:
    virtual ~IDocumentService() = default;

    /** \brief Open the document channel. Throws on failure. */
    virtual void start() = 0;
    /** \brief Close the channel. Safe when never started or already closed. */
    virtual void close() = 0;
    /** \brief Create the document and folder indices. Requires an established connection. */
    virtual void create_schema() = 0;
    /** \brief Insert or replace one document. */
    virtual void index(const std::string& index, const std::string& id, const nlohmann::json& document) = 0;
    /** \brief Remove one document; removing a missing id is not an error. */
    virtual void remove(const std::string& index, const std::string& id) = 0;
    /** \brief True between a successful \c start and \c close. */
    virtual bool is_started() const = 0;
};

} // namespace DocCrawler::Services
