// File: common/io/image_decoder.hpp

#ifndef COMMON_IO_IMAGE_DECODER_HPP
#define COMMON_IO_IMAGE_DECODER_HPP

#include <filesystem>

#include "types/pixel_buffer.hpp"

namespace common::io {

    class ImageDecoder {
    public:
        virtual ~ImageDecoder() = default;

        // Decode the file into a validated pixel buffer.
        // Throws types::DecodeError (unreadable file) or types::InvalidBufferError (unusable pixel layout).
        [[nodiscard]] virtual types::PixelBuffer decode(const std::filesystem::path &path) const = 0;
    };

    // Decodes anything cv::imread understands.
    class OpenCVImageDecoder final : public ImageDecoder {
    public:
        [[nodiscard]] types::PixelBuffer decode(const std::filesystem::path &path) const override;
    };

} // namespace common::io

#endif // COMMON_IO_IMAGE_DECODER_HPP
