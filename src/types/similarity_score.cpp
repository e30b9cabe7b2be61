// File: types/similarity_score.cpp

#include "types/similarity_score.hpp"

#include <algorithm>

namespace types {

    void RankedReport::rank() {
        std::ranges::sort(results, rankedBefore);
        std::ranges::sort(skipped, [](const SkippedEntry &lhs, const SkippedEntry &rhs) {
            return std::tie(lhs.first, lhs.second) < std::tie(rhs.first, rhs.second);
        });
    }

} // namespace types
