// File: common/formatting/fmt_score.hpp

#ifndef COMMON_FORMATTING_FMT_SCORE_HPP
#define COMMON_FORMATTING_FMT_SCORE_HPP

#include <fmt/format.h>

#include "types/errors.hpp"
#include "types/similarity_score.hpp"

/*
 * Formatters for the comparison result types.
 * SimilarityScore accepts a precision (default 6): fmt::format("{:.3}", score) -> 0.954 "a.png" "b.png"
 * SkippedEntry: skipped "a.png": decode: Could not read image: a.png
 */

template<>
struct fmt::formatter<types::ErrorKind> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const types::ErrorKind kind, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(types::toString(kind), ctx);
    }
};

template<>
struct fmt::formatter<types::SimilarityScore> {
    int precision = 6;

    constexpr auto parse(fmt::format_parse_context &ctx) {
        auto it = ctx.begin();
        const auto end = ctx.end();

        if (it != end && *it == '.') {
            ++it;
            int parsed_precision = 0;
            while (it != end && *it >= '0' && *it <= '9') {
                parsed_precision = parsed_precision * 10 + (*it - '0');
                ++it;
            }
            precision = parsed_precision;
        }

        if (it != end && *it != '}') {
            throw fmt::format_error("Invalid format specifier for SimilarityScore");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const types::SimilarityScore &score, FormatContext &ctx) const {
        if (score.second.empty()) {
            return fmt::format_to(ctx.out(), "{:.{}f} \"{}\"", score.score, precision, score.first);
        }
        return fmt::format_to(ctx.out(), "{:.{}f} \"{}\" \"{}\"", score.score, precision, score.first, score.second);
    }
};

template<>
struct fmt::formatter<types::SkippedEntry> {
    constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const types::SkippedEntry &entry, FormatContext &ctx) const {
        if (entry.second.empty()) {
            return fmt::format_to(ctx.out(), "skipped \"{}\": {}: {}", entry.first, entry.kind, entry.reason);
        }
        return fmt::format_to(ctx.out(), "skipped \"{}\" \"{}\": {}: {}", entry.first, entry.second, entry.kind,
                              entry.reason);
    }
};

#endif // COMMON_FORMATTING_FMT_SCORE_HPP
