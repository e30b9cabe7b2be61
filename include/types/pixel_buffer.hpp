// File: types/pixel_buffer.hpp

#ifndef TYPES_PIXEL_BUFFER_HPP
#define TYPES_PIXEL_BUFFER_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

namespace types {

    /*
     * Decoded raster image: width x height pixels of 1, 3 or 4 interleaved channels,
     * row-major, 8-bit unsigned or 32-bit float samples (floats are expected in [0, 1]).
     * Multi-channel data follows OpenCV's BGR(A) order. The backing matrix is always continuous
     * and never modified after construction.
     */
    class PixelBuffer {
    public:
        PixelBuffer() = default;

        // Copies the samples; throws InvalidBufferError unless samples.size() == width * height * channels.
        PixelBuffer(int width, int height, int channels, const std::vector<std::uint8_t> &samples);
        PixelBuffer(int width, int height, int channels, const std::vector<float> &samples);

        // Wraps (or, when not continuous, copies) an OpenCV matrix after validating it.
        [[nodiscard]] static PixelBuffer fromMat(const cv::Mat &mat);

        [[nodiscard]] int width() const noexcept { return mat_.cols; }
        [[nodiscard]] int height() const noexcept { return mat_.rows; }
        [[nodiscard]] int channels() const noexcept { return mat_.channels(); }
        [[nodiscard]] bool isFloat() const noexcept { return mat_.depth() == CV_32F; }
        [[nodiscard]] bool empty() const noexcept { return mat_.empty(); }
        [[nodiscard]] std::size_t sampleCount() const noexcept { return mat_.total() * mat_.channels(); }

        [[nodiscard]] const cv::Mat &mat() const noexcept { return mat_; }

        [[nodiscard]] std::string toString() const;

        // Throws InvalidBufferError when any invariant does not hold for the given matrix.
        static void validate(const cv::Mat &mat);

    private:
        explicit PixelBuffer(cv::Mat mat) : mat_(std::move(mat)) {}

        cv::Mat mat_;
    };

} // namespace types

#endif // TYPES_PIXEL_BUFFER_HPP
