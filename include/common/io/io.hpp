// File: common/io/io.hpp

#ifndef IO_HPP
#define IO_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "common/logging/logger.hpp"
#include "types/errors.hpp"

namespace common::io {

    /**
     * @brief Checks whether a file's extension is in the allow-list, ignoring case.
     *
     * @param path File path.
     * @param extensions Normalized allow-list (lower case, no leading dot).
     * @return true if the extension of path is allowed.
     */
    inline bool hasAllowedExtension(const std::filesystem::path &path, const std::vector<std::string> &extensions) {
        std::string extension = path.extension().string();
        if (extension.size() < 2) {
            return false;
        }
        extension.erase(0, 1);
        std::ranges::transform(extension, extension.begin(), [](const unsigned char c) { return std::tolower(c); });
        return std::ranges::find(extensions, extension) != extensions.end();
    }

    /**
     * @brief Lists regular files under a directory whose extension is in the allow-list.
     *
     * Entries that cannot be inspected are logged and skipped rather than aborting the listing.
     *
     * @param dir_path Directory to scan.
     * @param extensions Normalized allow-list (lower case, no leading dot).
     * @param recursive Descend into sub-directories.
     * @return Matching paths, sorted lexicographically.
     * @throws types::DirectoryError if the directory does not exist, is not a directory or cannot be opened.
     */
    inline std::vector<std::filesystem::path> filesByExtensions(const std::filesystem::path &dir_path,
                                                                const std::vector<std::string> &extensions,
                                                                const bool recursive = true) {
        std::error_code ec;
        if (!std::filesystem::exists(dir_path, ec) || !std::filesystem::is_directory(dir_path, ec)) {
            LOG_ERROR("Directory does not exist or is not a directory: {}", dir_path);
            throw types::DirectoryError(
                    fmt::format("Directory does not exist or is not a directory: {}", dir_path.string()));
        }

        LOG_DEBUG("Listing files with extensions {} in directory: {}", extensions, dir_path);
        std::vector<std::filesystem::path> matching_files;

        const auto collect = [&](auto iterator) {
            if (ec) {
                LOG_ERROR("Could not open directory {}: {}", dir_path, ec.message());
                throw types::DirectoryError(
                        fmt::format("Could not open directory {}: {}", dir_path.string(), ec.message()));
            }
            for (auto it = std::move(iterator); it != decltype(it){}; it.increment(ec)) {
                std::error_code entry_ec;
                if (it->is_regular_file(entry_ec) && !entry_ec && hasAllowedExtension(it->path(), extensions)) {
                    matching_files.push_back(it->path());
                }
            }
            // increment() ends the walk on error, keep what was listed so far
            if (ec) {
                LOG_WARN("Listing of {} stopped early: {}", dir_path, ec.message());
            }
        };

        if (recursive) {
            // skip_permission_denied would turn an unreadable root into an empty listing
            (void) std::filesystem::directory_iterator(dir_path, ec);
            if (ec) {
                LOG_ERROR("Could not open directory {}: {}", dir_path, ec.message());
                throw types::DirectoryError(
                        fmt::format("Could not open directory {}: {}", dir_path.string(), ec.message()));
            }
            collect(std::filesystem::recursive_directory_iterator(
                    dir_path, std::filesystem::directory_options::skip_permission_denied, ec));
        } else {
            collect(std::filesystem::directory_iterator(dir_path, std::filesystem::directory_options::none, ec));
        }

        std::ranges::sort(matching_files);

        LOG_DEBUG("Found {} files with extensions {} in directory: {}", matching_files.size(), extensions, dir_path);
        return matching_files;
    }

    /**
     * @brief Resolves a path for identity comparison without requiring it to exist.
     */
    inline std::filesystem::path resolvePath(const std::filesystem::path &path) {
        std::error_code ec;
        auto resolved = std::filesystem::weakly_canonical(path, ec);
        if (!ec) {
            return resolved;
        }
        const auto absolute = std::filesystem::absolute(path, ec);
        return (ec ? path : absolute).lexically_normal();
    }

    /**
     * @brief Checks whether two paths name the same file.
     */
    inline bool samePath(const std::filesystem::path &lhs, const std::filesystem::path &rhs) {
        std::error_code ec;
        if (std::filesystem::equivalent(lhs, rhs, ec) && !ec) {
            return true;
        }
        return resolvePath(lhs) == resolvePath(rhs);
    }

} // namespace common::io

#endif // IO_HPP
