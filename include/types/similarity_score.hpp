// File: types/similarity_score.hpp

#ifndef TYPES_SIMILARITY_SCORE_HPP
#define TYPES_SIMILARITY_SCORE_HPP

#include <cstddef>
#include <string>
#include <tuple>
#include <vector>

#include "types/errors.hpp"

namespace types {

    enum class ComparisonMode { Pair, AllPairs, Match };

    [[nodiscard]] constexpr std::string_view toString(const ComparisonMode mode) noexcept {
        switch (mode) {
            case ComparisonMode::Pair:
                return "pair";
            case ComparisonMode::AllPairs:
                return "directory";
            case ComparisonMode::Match:
                return "match";
        }
        return "unknown";
    }

    // Score in [0, 1] (1 = identical) between the images identified by first and second.
    struct SimilarityScore {
        double score = 0.0;
        std::string first;
        std::string second;

        bool operator==(const SimilarityScore &other) const = default;
    };

    // Descending score, then ascending (first, second) so ties always land in the same order.
    [[nodiscard]] inline bool rankedBefore(const SimilarityScore &lhs, const SimilarityScore &rhs) noexcept {
        if (lhs.score != rhs.score) {
            return lhs.score > rhs.score;
        }
        return std::tie(lhs.first, lhs.second) < std::tie(rhs.first, rhs.second);
    }

    // A path (or pair of paths, "second" left empty otherwise) that could not be scored.
    struct SkippedEntry {
        std::string first;
        std::string second;
        ErrorKind kind = ErrorKind::Decode;
        std::string reason;

        bool operator==(const SkippedEntry &other) const = default;
    };

    struct RankedReport {
        ComparisonMode mode = ComparisonMode::AllPairs;
        std::vector<SimilarityScore> results;
        std::vector<SkippedEntry> skipped;
        std::size_t candidates = 0;
        bool cancelled = false;

        [[nodiscard]] bool empty() const noexcept { return results.empty(); }

        // Sorts results by rank and skipped entries by path.
        void rank();

        bool operator==(const RankedReport &other) const = default;
    };

} // namespace types

#endif // TYPES_SIMILARITY_SCORE_HPP
