// File: processing/image/comparator.cpp

#include "processing/image/comparator.hpp"

#include <functional>
#include <unordered_map>

#include "processing/image/comparison/color_histogram_comparator.hpp"
#include "processing/image/comparison/composite_comparator.hpp"
#include "processing/image/comparison/perceptual_hash_comparator.hpp"

namespace processing::image {

    using FactoryFunction = std::function<std::shared_ptr<ImageComparator>()>;

    std::shared_ptr<ImageComparator> ImageComparator::create(const types::DescriptorConfig &config) {
        static const std::unordered_map<types::DescriptorMethod, FactoryFunction> map{
                {types::DescriptorMethod::PerceptualHash, [] { return std::make_shared<PerceptualHashComparator>(); }},
                {types::DescriptorMethod::Histogram, [] { return std::make_shared<ColorHistogramComparator>(); }},
                {types::DescriptorMethod::Composite, [] { return std::make_shared<CompositeComparator>(); }}};

        LOG_DEBUG("Using {} image comparator.", types::toString(config.method));
        return map.at(config.method)();
    }

} // namespace processing::image
