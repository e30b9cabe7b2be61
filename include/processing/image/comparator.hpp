// File: processing/image/comparator.hpp

#ifndef IMAGE_COMPARATOR_HPP
#define IMAGE_COMPARATOR_HPP

#include <algorithm>
#include <limits>
#include <memory>

#include "common/logging/logger.hpp"
#include "types/errors.hpp"
#include "types/image_descriptor.hpp"

namespace processing::image {

    class ImageComparator {
    public:
        virtual ~ImageComparator() = default;

        // Compare two descriptors and return a score indicating their similarity. [0, 1] where 0 means no similarity.
        // Identical descriptors score exactly 1 and compare(a, b) == compare(b, a).
        // Throws types::ConfigurationMismatchError if the descriptors were built under different configurations.
        [[nodiscard]] double compare(const types::ImageDescriptor &descriptor1,
                                     const types::ImageDescriptor &descriptor2) const {
            ensureComparable(descriptor1, descriptor2);
            if (descriptor1 == descriptor2) {
                return 1.0;
            }
            return std::clamp(score(descriptor1, descriptor2), 0.0, 1.0);
        }

        [[nodiscard]] virtual types::DescriptorMethod method() const noexcept = 0;

        // Comparator matching the configuration's method.
        [[nodiscard]] static std::shared_ptr<ImageComparator> create(const types::DescriptorConfig &config);

    protected:
        static constexpr double epsilon_ = std::numeric_limits<double>::epsilon();

        // Raw score of two comparable, non-identical descriptors.
        [[nodiscard]] virtual double score(const types::ImageDescriptor &descriptor1,
                                           const types::ImageDescriptor &descriptor2) const = 0;

        // Components this comparator reads; missing ones are reported as a configuration mismatch.
        [[nodiscard]] virtual bool needsHash() const noexcept { return false; }
        [[nodiscard]] virtual bool needsHistogram() const noexcept { return false; }

    private:
        void ensureComparable(const types::ImageDescriptor &descriptor1,
                              const types::ImageDescriptor &descriptor2) const {
            if (descriptor1.config() != descriptor2.config()) {
                LOG_ERROR("Refusing to compare descriptors of different configurations: {} vs {}",
                          descriptor1.config().toString(), descriptor2.config().toString());
                throw types::ConfigurationMismatchError(
                        fmt::format("Descriptors are not comparable: {} vs {}", descriptor1.config().toString(),
                                    descriptor2.config().toString()));
            }

            const auto missing = [this](const types::ImageDescriptor &descriptor) {
                return (needsHash() && !descriptor.hash()) || (needsHistogram() && !descriptor.histogram());
            };
            if (missing(descriptor1) || missing(descriptor2)) {
                LOG_ERROR("{} comparator cannot score {} descriptors", types::toString(method()),
                          types::toString(descriptor1.config().method));
                throw types::ConfigurationMismatchError(
                        fmt::format("The {} comparator cannot score descriptors built with method {}",
                                    types::toString(method()), types::toString(descriptor1.config().method)));
            }
        }
    };

} // namespace processing::image

#endif // IMAGE_COMPARATOR_HPP
