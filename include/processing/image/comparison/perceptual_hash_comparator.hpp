// File: processing/image/comparison/perceptual_hash_comparator.hpp

#ifndef PERCEPTUAL_HASH_COMPARATOR_HPP
#define PERCEPTUAL_HASH_COMPARATOR_HPP

#include <cmath>

#include "processing/image/comparator.hpp"

namespace processing::image {

    // 1 - normalized Hamming distance between the two perceptual hashes.
    class PerceptualHashComparator final : public ImageComparator {
    public:
        PerceptualHashComparator() = default;

        [[nodiscard]] types::DescriptorMethod method() const noexcept override {
            return types::DescriptorMethod::PerceptualHash;
        }

    protected:
        [[nodiscard]] double score(const types::ImageDescriptor &descriptor1,
                                   const types::ImageDescriptor &descriptor2) const override {
            const auto &hash1 = *descriptor1.hash();
            const auto &hash2 = *descriptor2.hash();

            // Flat images have no structure, their hashes are all ones whatever the color.
            if (hash1.flat && hash2.flat) {
                double largest_difference = 0.0;
                for (std::size_t channel = 0; channel < hash1.mean_color.size(); ++channel) {
                    largest_difference = std::max(largest_difference,
                                                  std::abs(hash1.mean_color[channel] - hash2.mean_color[channel]));
                }
                LOG_TRACE("Both hashes are flat, color similarity: {:.4f}", 1.0 - largest_difference);
                return 1.0 - largest_difference;
            }

            return hammingSimilarity(hash1.bits, hash2.bits);
        }

        [[nodiscard]] bool needsHash() const noexcept override { return true; }

    private:
        [[nodiscard]] static double hammingSimilarity(const std::vector<std::uint8_t> &bits1,
                                                      const std::vector<std::uint8_t> &bits2) {
            if (bits1.size() != bits2.size() || bits1.empty()) {
                throw types::ConfigurationMismatchError(
                        fmt::format("Hash lengths differ: {} vs {}", bits1.size(), bits2.size()));
            }

            std::size_t distance = 0;
            for (std::size_t i = 0; i < bits1.size(); ++i) {
                distance += bits1[i] != bits2[i] ? 1 : 0;
            }

            return 1.0 - static_cast<double>(distance) / static_cast<double>(bits1.size());
        }
    };

} // namespace processing::image

#endif // PERCEPTUAL_HASH_COMPARATOR_HPP
