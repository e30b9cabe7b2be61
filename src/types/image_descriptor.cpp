// File: types/image_descriptor.cpp

#include "types/image_descriptor.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/core.h>

namespace types {

    std::string_view toString(const DescriptorMethod method) noexcept {
        switch (method) {
            case DescriptorMethod::PerceptualHash:
                return "phash";
            case DescriptorMethod::Histogram:
                return "histogram";
            case DescriptorMethod::Composite:
                return "composite";
        }
        return "unknown";
    }

    std::optional<DescriptorMethod> parseDescriptorMethod(std::string_view name) {
        std::string lowered(name);
        std::ranges::transform(lowered, lowered.begin(), [](const unsigned char c) { return std::tolower(c); });

        if (lowered == "phash") {
            return DescriptorMethod::PerceptualHash;
        }
        if (lowered == "histogram") {
            return DescriptorMethod::Histogram;
        }
        if (lowered == "composite") {
            return DescriptorMethod::Composite;
        }
        return std::nullopt;
    }

    void DescriptorConfig::validate() const {
        if (usesHash()) {
            if (hash_size < 2 || hash_size % 2 != 0) {
                throw std::invalid_argument(fmt::format("hash_size must be an even number >= 2, got {}", hash_size));
            }
            if (dct_size < 1 || dct_size > hash_size) {
                throw std::invalid_argument(
                        fmt::format("dct_size must be in [1, {}], got {}", hash_size, dct_size));
            }
        }
        if (usesHistogram() && (histogram_bins < 1 || histogram_bins > 256)) {
            throw std::invalid_argument(fmt::format("histogram_bins must be in [1, 256], got {}", histogram_bins));
        }
        if (method == DescriptorMethod::Composite && !(hash_weight >= 0.0 && hash_weight <= 1.0)) {
            throw std::invalid_argument(fmt::format("hash_weight must be in [0, 1], got {}", hash_weight));
        }
    }

    std::string DescriptorConfig::toString() const {
        return fmt::format("DescriptorConfig(method: {}, hash_size: {}, dct_size: {}, bins: {}, hash_weight: {})",
                           types::toString(method), hash_size, dct_size, histogram_bins, hash_weight);
    }

    bool ImageDescriptor::operator==(const ImageDescriptor &other) const {
        if (config_ != other.config_ || hash_ != other.hash_ || histogram_.has_value() != other.histogram_.has_value()) {
            return false;
        }
        if (!histogram_) {
            return true;
        }
        return histogram_->size() == other.histogram_->size() && *histogram_ == *other.histogram_;
    }

    std::string ImageDescriptor::toString() const {
        return fmt::format("ImageDescriptor({}, hash: {}, histogram: {})", types::toString(config_.method),
                           hash_ ? fmt::format("{} bits{}", hash_->bits.size(), hash_->flat ? " (flat)" : "")
                                 : "none",
                           histogram_ ? fmt::format("{} bins", histogram_->size()) : "none");
    }

} // namespace types
