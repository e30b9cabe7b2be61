// File: processing/image/descriptor_builder.cpp

#include "processing/image/descriptor_builder.hpp"

#include <cmath>

#include <opencv2/imgproc.hpp>

#include "common/logging/logger.hpp"
#include "common/utilities/image.hpp"
#include "types/errors.hpp"

namespace processing::image {

    DescriptorBuilder::DescriptorBuilder(types::DescriptorConfig config) : config_(std::move(config)) {
        config_.validate();
        LOG_DEBUG("Descriptor builder ready: {}", config_.toString());
    }

    types::ImageDescriptor DescriptorBuilder::build(const types::PixelBuffer &buffer) const {
        types::PixelBuffer::validate(buffer.mat());

        const cv::Mat image = common::utilities::to8Bit(buffer.mat());

        std::optional<types::ImageDescriptor::PerceptualHash> hash;
        std::optional<Eigen::VectorXd> histogram;
        if (config_.usesHash()) {
            hash = computeHash(image);
        }
        if (config_.usesHistogram()) {
            histogram = computeHistogram(image);
        }

        types::ImageDescriptor descriptor(config_, std::move(hash), std::move(histogram));
        LOG_TRACE("Built {} from {}", descriptor.toString(), buffer.toString());
        return descriptor;
    }

    types::ImageDescriptor::PerceptualHash DescriptorBuilder::computeHash(const cv::Mat &image) const {
        const cv::Mat gray = common::utilities::toGrayscale(image);

        types::ImageDescriptor::PerceptualHash hash;
        const cv::Scalar mean_color = cv::mean(common::utilities::toBgr(image));
        for (int channel = 0; channel < 3; ++channel) {
            hash.mean_color[channel] = mean_color[channel] / 255.0;
        }

        // Area interpolation averages source pixels, so rescaled copies land on nearly the same grid
        cv::Mat resized;
        cv::resize(gray, resized, cv::Size(config_.hash_size, config_.hash_size), 0.0, 0.0, cv::INTER_AREA);

        cv::Mat samples;
        resized.convertTo(samples, CV_64F);

        cv::Mat coefficients;
        cv::dct(samples, coefficients);

        const int block_size = config_.dct_size;
        cv::Mat block = coefficients(cv::Rect(0, 0, block_size, block_size)).clone();

        double ac_sum = 0.0;
        hash.flat = true;
        for (int row = 0; row < block_size; ++row) {
            for (int col = 0; col < block_size; ++col) {
                auto &value = block.at<double>(row, col);
                if (std::abs(value) < flat_tolerance_) {
                    value = 0.0;
                }
                if (row == 0 && col == 0) {
                    continue;
                }
                ac_sum += value;
                hash.flat = hash.flat && value == 0.0;
            }
        }

        // mean of the block without the DC term; a 1x1 block has no AC terms at all
        const int ac_count = block_size * block_size - 1;
        const double threshold = ac_count > 0 ? ac_sum / ac_count : 0.0;

        hash.bits.reserve(static_cast<std::size_t>(block_size) * block_size);
        for (int row = 0; row < block_size; ++row) {
            for (int col = 0; col < block_size; ++col) {
                hash.bits.push_back(block.at<double>(row, col) >= threshold ? 1 : 0);
            }
        }

        return hash;
    }

    Eigen::VectorXd DescriptorBuilder::computeHistogram(const cv::Mat &image) const {
        const cv::Mat bgr = common::utilities::toBgr(image);
        const int bins = config_.histogram_bins;
        const float range[] = {0.0f, 256.0f};
        const float *hist_range = {range};
        const auto pixel_count = static_cast<double>(bgr.total());

        Eigen::VectorXd histogram = Eigen::VectorXd::Zero(3 * bins);
        for (int channel = 0; channel < 3; ++channel) {
            cv::Mat counts;
            cv::calcHist(&bgr, 1, &channel, cv::noArray(), counts, 1, &bins, &hist_range, true, false);
            for (int bin = 0; bin < bins; ++bin) {
                // normalized by pixel count so images of any size are comparable
                histogram(channel * bins + bin) = static_cast<double>(counts.at<float>(bin)) / pixel_count;
            }
        }

        return histogram;
    }

} // namespace processing::image
