// File: common/io/candidate_source.hpp

#ifndef COMMON_IO_CANDIDATE_SOURCE_HPP
#define COMMON_IO_CANDIDATE_SOURCE_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace common::io {

    class CandidateSource {
    public:
        virtual ~CandidateSource() = default;

        // Candidate image paths under directory whose extension is allowed, in a stable order.
        // Throws types::DirectoryError when the directory cannot be listed.
        [[nodiscard]] virtual std::vector<std::filesystem::path> list(const std::filesystem::path &directory,
                                                                      const std::vector<std::string> &extensions) const = 0;
    };

    class FilesystemCandidateSource final : public CandidateSource {
    public:
        explicit FilesystemCandidateSource(const bool recursive = true) : recursive_(recursive) {}

        [[nodiscard]] std::vector<std::filesystem::path> list(const std::filesystem::path &directory,
                                                              const std::vector<std::string> &extensions) const override;

    private:
        bool recursive_;
    };

} // namespace common::io

#endif // COMMON_IO_CANDIDATE_SOURCE_HPP
