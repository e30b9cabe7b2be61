// File: processing/image/descriptor_builder.hpp

#ifndef DESCRIPTOR_BUILDER_HPP
#define DESCRIPTOR_BUILDER_HPP

#include <opencv2/core.hpp>

#include "types/image_descriptor.hpp"
#include "types/pixel_buffer.hpp"

namespace processing::image {

    /*
     * Turns a pixel buffer into an ImageDescriptor under a fixed configuration.
     * build() is a pure function of (buffer, config): no I/O and no shared state, so one
     * builder may be used from any number of threads.
     */
    class DescriptorBuilder {
    public:
        // Throws std::invalid_argument if the configuration is invalid.
        explicit DescriptorBuilder(types::DescriptorConfig config = {});

        // Throws types::InvalidBufferError if the buffer violates its invariants.
        [[nodiscard]] types::ImageDescriptor build(const types::PixelBuffer &buffer) const;

    private:
        types::DescriptorConfig config_;

        // AC coefficients smaller than this are treated as exactly zero.
        static constexpr double flat_tolerance_ = 1e-6;

        [[nodiscard]] types::ImageDescriptor::PerceptualHash computeHash(const cv::Mat &image) const;
        [[nodiscard]] Eigen::VectorXd computeHistogram(const cv::Mat &image) const;
    };

} // namespace processing::image

#endif // DESCRIPTOR_BUILDER_HPP
