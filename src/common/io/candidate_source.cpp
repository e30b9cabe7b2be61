// File: common/io/candidate_source.cpp

#include "common/io/candidate_source.hpp"

#include "common/io/io.hpp"

namespace common::io {

    std::vector<std::filesystem::path> FilesystemCandidateSource::list(const std::filesystem::path &directory,
                                                                       const std::vector<std::string> &extensions) const {
        return filesByExtensions(directory, extensions, recursive_);
    }

} // namespace common::io
