// File: processing/pair_comparator.hpp

#ifndef PAIR_COMPARATOR_HPP
#define PAIR_COMPARATOR_HPP

#include <filesystem>
#include <memory>

#include "common/io/image_decoder.hpp"
#include "processing/image/comparator.hpp"
#include "processing/image/descriptor_builder.hpp"
#include "types/similarity_score.hpp"

namespace processing {

    /*
     * Decode -> describe -> score for image files. Every mode goes through this class, which is
     * the only place images are decoded and descriptors are built. Errors are never swallowed:
     * types::DecodeError, types::InvalidBufferError and types::ConfigurationMismatchError reach the caller.
     */
    class PairComparator {
    public:
        explicit PairComparator(const types::DescriptorConfig &config,
                                std::shared_ptr<common::io::ImageDecoder> decoder =
                                        std::make_shared<common::io::OpenCVImageDecoder>());

        // Decode the file and build its descriptor.
        [[nodiscard]] types::ImageDescriptor describe(const std::filesystem::path &path) const;

        // Score two descriptors built by describe().
        [[nodiscard]] double score(const types::ImageDescriptor &descriptor1,
                                   const types::ImageDescriptor &descriptor2) const;

        // Describe both files and score them.
        [[nodiscard]] types::SimilarityScore compare(const std::filesystem::path &path1,
                                                     const std::filesystem::path &path2) const;

    private:
        image::DescriptorBuilder builder_;
        std::shared_ptr<image::ImageComparator> comparator_;
        std::shared_ptr<common::io::ImageDecoder> decoder_;
    };

} // namespace processing

#endif // PAIR_COMPARATOR_HPP
