/**
 * \file crawler/source/LocalFileSource.hpp
 * \brief \c IFileSource over the local filesystem.
 */
#pragma once

#include "IFileSource.hpp"

namespace DocCrawler::Sources {

class LocalFileSource : public IFileSource {
public:
    explicit LocalFileSource(bool follow_symlinks) : follow_symlinks_(follow_symlinks) {}

    void open() override {}
    void close() override {}
    bool is_directory(const std::string& directory) override;
    std::vector<FileEntry> list(const std::string& directory) override;
    std::string directory_identity(const std::string& directory) override;
    std::string describe() const override { return "local"; }

private:
    bool follow_symlinks_;
};

} // namespace DocCrawler::Sources
