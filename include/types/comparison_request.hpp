// File: types/comparison_request.hpp

#ifndef TYPES_COMPARISON_REQUEST_HPP
#define TYPES_COMPARISON_REQUEST_HPP

#include <filesystem>

#include "config/settings.hpp"
#include "types/similarity_score.hpp"

namespace types {

    // One invocation's worth of work. Built once by the front end, read-only afterwards.
    struct ComparisonRequest {
        ComparisonMode mode = ComparisonMode::Pair;
        std::filesystem::path image_a; // pair
        std::filesystem::path image_b; // pair
        std::filesystem::path target; // match
        std::filesystem::path directory; // directory, match
        config::Settings settings; // carries the extension allow-list and descriptor configuration
    };

} // namespace types

#endif // TYPES_COMPARISON_REQUEST_HPP
