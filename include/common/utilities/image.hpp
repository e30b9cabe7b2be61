// File: common/utilities/image.hpp

#ifndef COMMON_UTILITIES_IMAGE_HPP
#define COMMON_UTILITIES_IMAGE_HPP

#include <stdexcept>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "common/logging/logger.hpp"

namespace common::utilities {

    /**
     * @brief Converts an image to 8-bit samples.
     *
     * Float images are expected in [0, 1] and are scaled by 255, saturating out-of-range values.
     *
     * @param image Image to be converted (CV_8U or CV_32F).
     * @return cv::Mat The 8-bit image (shares data when already 8-bit).
     */
    inline cv::Mat to8Bit(const cv::Mat &image) {
        if (image.depth() == CV_8U) {
            return image;
        }
        cv::Mat converted;
        image.convertTo(converted, CV_MAKETYPE(CV_8U, image.channels()), 255.0);
        LOG_TRACE("Converted {}-channel float image to 8-bit", image.channels());
        return converted;
    }

    /**
     * @brief Converts an 8-bit image to grayscale.
     *
     * @param image Image with 1 (gray), 3 (BGR) or 4 (BGRA) channels.
     * @return cv::Mat The grayscale image.
     * @throws std::invalid_argument for any other channel count.
     */
    inline cv::Mat toGrayscale(const cv::Mat &image) {
        cv::Mat gray;
        switch (image.channels()) {
            case 1:
                LOG_TRACE("Image is already grayscale");
                return image;
            case 3:
                cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
                break;
            case 4:
                cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
                break;
            default:
                throw std::invalid_argument("Images with " + std::to_string(image.channels()) +
                                            " channels are not supported");
        }
        LOG_TRACE("Converted image to grayscale");
        return gray;
    }

    /**
     * @brief Converts an 8-bit image to three BGR channels.
     *
     * Gray is replicated into every channel, alpha is dropped.
     *
     * @param image Image with 1, 3 or 4 channels.
     * @return cv::Mat The BGR image.
     * @throws std::invalid_argument for any other channel count.
     */
    inline cv::Mat toBgr(const cv::Mat &image) {
        cv::Mat bgr;
        switch (image.channels()) {
            case 1:
                cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
                break;
            case 3:
                return image;
            case 4:
                cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
                break;
            default:
                throw std::invalid_argument("Images with " + std::to_string(image.channels()) +
                                            " channels are not supported");
        }
        return bgr;
    }

} // namespace common::utilities

#endif // COMMON_UTILITIES_IMAGE_HPP
