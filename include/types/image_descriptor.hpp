// File: types/image_descriptor.hpp

#ifndef TYPES_IMAGE_DESCRIPTOR_HPP
#define TYPES_IMAGE_DESCRIPTOR_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Eigen/Dense>

namespace types {

    enum class DescriptorMethod { PerceptualHash, Histogram, Composite };

    [[nodiscard]] std::string_view toString(DescriptorMethod method) noexcept;

    // Accepts "phash", "histogram" and "composite" (case-insensitive).
    [[nodiscard]] std::optional<DescriptorMethod> parseDescriptorMethod(std::string_view name);

    struct DescriptorConfig {
        DescriptorMethod method = DescriptorMethod::Composite;
        int hash_size = 32; // side of the square the image is resized to before the DCT, must be even
        int dct_size = 8; // side of the low-frequency block kept from the DCT
        int histogram_bins = 32; // bins per channel over [0, 256)
        double hash_weight = 0.5; // exponent of the hash score in the composite score

        [[nodiscard]] bool usesHash() const noexcept { return method != DescriptorMethod::Histogram; }
        [[nodiscard]] bool usesHistogram() const noexcept { return method != DescriptorMethod::PerceptualHash; }

        // Throws std::invalid_argument naming the first offending field.
        void validate() const;

        [[nodiscard]] std::string toString() const;

        bool operator==(const DescriptorConfig &other) const = default;
    };

    /*
     * Comparable summary of one image. Which components are present depends on the method of
     * the configuration it was built with:
     *  - hash: dct_size^2 bits of the low-frequency DCT block, thresholded at the block's AC mean,
     *    plus a flatness flag (no AC energy at all) and the mean B, G, R levels in [0, 1];
     *  - histogram: 3 * bins values, one block per channel, each block summing to 1.
     */
    class ImageDescriptor {
    public:
        struct PerceptualHash {
            std::vector<std::uint8_t> bits;
            bool flat = false;
            std::array<double, 3> mean_color{};

            bool operator==(const PerceptualHash &other) const = default;
        };

        ImageDescriptor(DescriptorConfig config, std::optional<PerceptualHash> hash,
                        std::optional<Eigen::VectorXd> histogram) :
            config_(std::move(config)), hash_(std::move(hash)), histogram_(std::move(histogram)) {}

        [[nodiscard]] const DescriptorConfig &config() const noexcept { return config_; }
        [[nodiscard]] const std::optional<PerceptualHash> &hash() const noexcept { return hash_; }
        [[nodiscard]] const std::optional<Eigen::VectorXd> &histogram() const noexcept { return histogram_; }

        [[nodiscard]] std::string toString() const;

        bool operator==(const ImageDescriptor &other) const;
        bool operator!=(const ImageDescriptor &other) const { return !(*this == other); }

    private:
        DescriptorConfig config_;
        std::optional<PerceptualHash> hash_;
        std::optional<Eigen::VectorXd> histogram_;
    };

} // namespace types

#endif // TYPES_IMAGE_DESCRIPTOR_HPP
