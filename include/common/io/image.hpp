// File: common/io/image.hpp

#ifndef COMMON_IMAGE_IO_HPP
#define COMMON_IMAGE_IO_HPP

#include <filesystem>
#include <string_view>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "common/logging/logger.hpp"
#include "types/errors.hpp"

namespace common::io::image {
    /**
     * @brief Reads an image from a file using OpenCV, keeping its channel layout.
     *
     * 16-bit images are scaled down to 8 bits and double images narrowed to float, so the
     * result is always CV_8U or CV_32F with 1, 3 or 4 channels.
     *
     * @param file_path Path to the image file.
     * @return cv::Mat The loaded image.
     * @throws types::DecodeError if the file does not exist or could not be decoded.
     */
    inline cv::Mat readImage(const std::filesystem::path &file_path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file_path, ec)) {
            LOG_ERROR("Image does not exist: {}", file_path);
            throw types::DecodeError(fmt::format("No such file: {}", file_path.string()));
        }

        LOG_TRACE("Reading image from file: {}", file_path);
        cv::Mat image;
        try {
            image = cv::imread(file_path.string(), cv::IMREAD_UNCHANGED);
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV failed to decode {}: {}", file_path, e.what());
            throw types::DecodeError(fmt::format("Could not decode {}: {}", file_path.string(), e.what()));
        }

        if (image.empty()) {
            LOG_ERROR("Could not read image: {}", file_path);
            throw types::DecodeError(fmt::format("Could not read image: {}", file_path.string()));
        }

        if (image.depth() == CV_16U) {
            image.convertTo(image, CV_8U, 1.0 / 257.0);
        } else if (image.depth() == CV_64F) {
            image.convertTo(image, CV_32F);
        }

        LOG_TRACE("Image read successfully: {} ({}x{}, {} channels)", file_path, image.cols, image.rows,
                  image.channels());
        return image;
    }
} // namespace common::io::image

#endif // COMMON_IMAGE_IO_HPP
