// File: types/pixel_buffer.cpp

#include "types/pixel_buffer.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "types/errors.hpp"

namespace types {

    namespace {
        void checkShape(const int width, const int height, const int channels, const std::size_t sample_count) {
            if (width <= 0 || height <= 0) {
                throw InvalidBufferError(fmt::format("Invalid dimensions {}x{}", width, height));
            }
            if (channels != 1 && channels != 3 && channels != 4) {
                throw InvalidBufferError(fmt::format("Unsupported channel count {}", channels));
            }
            const auto expected = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) *
                                  static_cast<std::size_t>(channels);
            if (sample_count != expected) {
                throw InvalidBufferError(fmt::format("Buffer holds {} samples, expected {} ({}x{}x{})", sample_count,
                                                     expected, width, height, channels));
            }
        }

        template<typename Sample>
        cv::Mat toMat(const int width, const int height, const int channels, const std::vector<Sample> &samples,
                      const int depth) {
            checkShape(width, height, channels, samples.size());
            cv::Mat mat(height, width, CV_MAKETYPE(depth, channels));
            std::copy(samples.begin(), samples.end(), mat.ptr<Sample>());
            return mat;
        }
    } // namespace

    PixelBuffer::PixelBuffer(const int width, const int height, const int channels,
                             const std::vector<std::uint8_t> &samples) :
        mat_(toMat(width, height, channels, samples, CV_8U)) {}

    PixelBuffer::PixelBuffer(const int width, const int height, const int channels, const std::vector<float> &samples) :
        mat_(toMat(width, height, channels, samples, CV_32F)) {}

    PixelBuffer PixelBuffer::fromMat(const cv::Mat &mat) {
        validate(mat);
        return PixelBuffer(mat.isContinuous() ? mat : mat.clone());
    }

    void PixelBuffer::validate(const cv::Mat &mat) {
        if (mat.empty()) {
            throw InvalidBufferError("Pixel buffer is empty");
        }
        if (mat.dims != 2) {
            throw InvalidBufferError(fmt::format("Pixel buffer must be two-dimensional, got {} dimensions", mat.dims));
        }
        if (mat.depth() != CV_8U && mat.depth() != CV_32F) {
            throw InvalidBufferError(fmt::format("Unsupported sample depth {}", mat.depth()));
        }
        checkShape(mat.cols, mat.rows, mat.channels(), mat.total() * mat.channels());
    }

    std::string PixelBuffer::toString() const {
        return fmt::format("PixelBuffer({}x{}, channels: {}, samples: {})", width(), height(), channels(),
                           isFloat() ? "float" : "uint8");
    }

} // namespace types
