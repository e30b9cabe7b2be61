// File: common/io/image_decoder.cpp

#include "common/io/image_decoder.hpp"

#include "common/io/image.hpp"
#include "types/errors.hpp"

namespace common::io {

    types::PixelBuffer OpenCVImageDecoder::decode(const std::filesystem::path &path) const {
        const cv::Mat image = image::readImage(path);
        try {
            return types::PixelBuffer::fromMat(image);
        } catch (const types::InvalidBufferError &e) {
            LOG_ERROR("Decoded image {} is not usable: {}", path, e.what());
            throw types::InvalidBufferError(fmt::format("{}: {}", path.string(), e.what()));
        }
    }

} // namespace common::io
