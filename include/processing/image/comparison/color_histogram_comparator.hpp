// File: processing/image/comparison/color_histogram_comparator.hpp

#ifndef COLOR_HISTOGRAM_COMPARATOR_HPP
#define COLOR_HISTOGRAM_COMPARATOR_HPP

#include <array>
#include <numeric>

#include <Eigen/Dense>

#include "processing/image/comparator.hpp"

namespace processing::image {

    // Bhattacharyya coefficient of the normalized per-channel histograms, averaged over B, G and R.
    class ColorHistogramComparator final : public ImageComparator {
    public:
        ColorHistogramComparator() = default;

        [[nodiscard]] types::DescriptorMethod method() const noexcept override {
            return types::DescriptorMethod::Histogram;
        }

    protected:
        [[nodiscard]] double score(const types::ImageDescriptor &descriptor1,
                                   const types::ImageDescriptor &descriptor2) const override {
            const Eigen::VectorXd &hist1 = *descriptor1.histogram();
            const Eigen::VectorXd &hist2 = *descriptor2.histogram();
            const Eigen::Index bins = descriptor1.config().histogram_bins;

            if (hist1.size() != 3 * bins || hist2.size() != 3 * bins) {
                throw types::ConfigurationMismatchError(fmt::format(
                        "Histogram sizes {} and {} do not match {} bins per channel", hist1.size(), hist2.size(), bins));
            }

            std::array<double, 3> coefficients{};
            for (Eigen::Index channel = 0; channel < 3; ++channel) {
                coefficients[channel] =
                        bhattacharyya(hist1.segment(channel * bins, bins), hist2.segment(channel * bins, bins));
            }

            // heuristic - assigning equal weight to each channel
            const double similarity = std::accumulate(coefficients.begin(), coefficients.end(), 0.0) / 3.0;
            LOG_TRACE("Histogram similarity: {:.4f} (B: {:.4f}, G: {:.4f}, R: {:.4f})", similarity, coefficients[0],
                      coefficients[1], coefficients[2]);
            return similarity;
        }

        [[nodiscard]] bool needsHistogram() const noexcept override { return true; }

    private:
        // Overlap of two histograms that each sum to 1. An empty channel only matches another empty channel.
        [[nodiscard]] static double bhattacharyya(const Eigen::Ref<const Eigen::VectorXd> &hist1,
                                                  const Eigen::Ref<const Eigen::VectorXd> &hist2) {
            const bool empty1 = hist1.sum() <= epsilon_;
            const bool empty2 = hist2.sum() <= epsilon_;
            if (empty1 || empty2) {
                return empty1 && empty2 ? 1.0 : 0.0;
            }
            return hist1.cwiseProduct(hist2).cwiseSqrt().sum();
        }
    };

} // namespace processing::image

#endif // COLOR_HISTOGRAM_COMPARATOR_HPP
