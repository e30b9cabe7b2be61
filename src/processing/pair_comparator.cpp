// File: processing/pair_comparator.cpp

#include "processing/pair_comparator.hpp"

#include <stdexcept>

#include "common/formatting/fmt_score.hpp"
#include "common/logging/logger.hpp"

namespace processing {

    PairComparator::PairComparator(const types::DescriptorConfig &config,
                                   std::shared_ptr<common::io::ImageDecoder> decoder) :
        builder_(config), comparator_(image::ImageComparator::create(config)), decoder_(std::move(decoder)) {
        if (!decoder_) {
            throw std::invalid_argument("PairComparator requires an image decoder");
        }
    }

    types::ImageDescriptor PairComparator::describe(const std::filesystem::path &path) const {
        LOG_DEBUG("Describing {}", path);
        const types::PixelBuffer buffer = decoder_->decode(path);
        try {
            return builder_.build(buffer);
        } catch (const types::InvalidBufferError &e) {
            throw types::InvalidBufferError(fmt::format("{}: {}", path.string(), e.what()));
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV failed to describe {}: {}", path, e.what());
            throw types::InvalidBufferError(fmt::format("{}: {}", path.string(), e.what()));
        }
    }

    double PairComparator::score(const types::ImageDescriptor &descriptor1,
                                 const types::ImageDescriptor &descriptor2) const {
        return comparator_->compare(descriptor1, descriptor2);
    }

    types::SimilarityScore PairComparator::compare(const std::filesystem::path &path1,
                                                   const std::filesystem::path &path2) const {
        const auto descriptor1 = describe(path1);
        const auto descriptor2 = describe(path2);

        types::SimilarityScore result{score(descriptor1, descriptor2), path1.string(), path2.string()};
        LOG_INFO("Compared pair: {}", result);
        return result;
    }

} // namespace processing
