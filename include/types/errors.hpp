// File: types/errors.hpp

#ifndef TYPES_ERRORS_HPP
#define TYPES_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace types {

    enum class ErrorKind { Decode, InvalidBuffer, ConfigurationMismatch, Directory };

    [[nodiscard]] constexpr std::string_view toString(const ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::Decode:
                return "decode";
            case ErrorKind::InvalidBuffer:
                return "invalid-buffer";
            case ErrorKind::ConfigurationMismatch:
                return "configuration-mismatch";
            case ErrorKind::Directory:
                return "directory";
        }
        return "unknown";
    }

    // Base of every classified failure raised by the similarity engine.
    class SimilarityError : public std::runtime_error {
    public:
        SimilarityError(const ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    // The file is missing or cannot be parsed as an image.
    class DecodeError final : public SimilarityError {
    public:
        explicit DecodeError(const std::string &message) : SimilarityError(ErrorKind::Decode, message) {}
    };

    // A pixel buffer violates its dimensional invariants.
    class InvalidBufferError final : public SimilarityError {
    public:
        explicit InvalidBufferError(const std::string &message) : SimilarityError(ErrorKind::InvalidBuffer, message) {}
    };

    // Descriptors built under different configurations were compared.
    class ConfigurationMismatchError final : public SimilarityError {
    public:
        explicit ConfigurationMismatchError(const std::string &message) :
            SimilarityError(ErrorKind::ConfigurationMismatch, message) {}
    };

    // The directory to scan is missing, not a directory, or unreadable.
    class DirectoryError final : public SimilarityError {
    public:
        explicit DirectoryError(const std::string &message) : SimilarityError(ErrorKind::Directory, message) {}
    };

} // namespace types

#endif // TYPES_ERRORS_HPP
