// File: processing/image/comparison/composite_comparator.hpp

#ifndef COMPOSITE_COMPARATOR_HPP
#define COMPOSITE_COMPARATOR_HPP

#include <cmath>
#include <memory>

#include "color_histogram_comparator.hpp"
#include "perceptual_hash_comparator.hpp"
#include "processing/image/comparator.hpp"

namespace processing::image {

    /*
     * Weighted geometric mean of structure (perceptual hash) and color (histogram):
     *     score = hash^w * histogram^(1 - w), w = DescriptorConfig::hash_weight.
     * Either component at 0 drives the score to 0 (unless its weight is 0), so two flat images
     * of different colors, whose hashes agree, still score 0.
     */
    class CompositeComparator final : public ImageComparator {
    public:
        CompositeComparator() :
            hash_comparator_(std::make_shared<PerceptualHashComparator>()),
            histogram_comparator_(std::make_shared<ColorHistogramComparator>()) {}

        CompositeComparator(std::shared_ptr<ImageComparator> hash_comparator,
                            std::shared_ptr<ImageComparator> histogram_comparator) :
            hash_comparator_(std::move(hash_comparator)), histogram_comparator_(std::move(histogram_comparator)) {}

        [[nodiscard]] types::DescriptorMethod method() const noexcept override {
            return types::DescriptorMethod::Composite;
        }

    protected:
        [[nodiscard]] double score(const types::ImageDescriptor &descriptor1,
                                   const types::ImageDescriptor &descriptor2) const override {
            const double hash_score = hash_comparator_->compare(descriptor1, descriptor2);
            const double histogram_score = histogram_comparator_->compare(descriptor1, descriptor2);
            const double hash_weight = descriptor1.config().hash_weight;

            const double composite_score =
                    std::pow(hash_score, hash_weight) * std::pow(histogram_score, 1.0 - hash_weight);

            LOG_TRACE("Composite Score: {:.4f} (Hash: {:.4f} ^ {:.2f}, Histogram: {:.4f} ^ {:.2f})", composite_score,
                      hash_score, hash_weight, histogram_score, 1.0 - hash_weight);

            return composite_score;
        }

        [[nodiscard]] bool needsHash() const noexcept override { return true; }
        [[nodiscard]] bool needsHistogram() const noexcept override { return true; }

    private:
        std::shared_ptr<ImageComparator> hash_comparator_;
        std::shared_ptr<ImageComparator> histogram_comparator_;
    };

} // namespace processing::image

#endif // COMPOSITE_COMPARATOR_HPP
