// File: reporting/result_reporter.cpp

#include "reporting/result_reporter.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <unordered_map>

#include <fmt/ostream.h>
#include <json/json.h>

#include "common/formatting/fmt_score.hpp"
#include "common/logging/logger.hpp"

namespace reporting {

    namespace {
        // The identity that is printed for a result: match results only show the candidate.
        types::SimilarityScore displayed(const types::RankedReport &report, const types::SimilarityScore &score) {
            if (report.mode == types::ComparisonMode::Match) {
                return {score.score, score.second, {}};
            }
            return score;
        }
    } // namespace

    std::unique_ptr<ResultReporter> ResultReporter::create(const std::string &format, const int precision) {
        using FactoryFunction = std::function<std::unique_ptr<ResultReporter>(int)>;
        static const std::unordered_map<std::string, FactoryFunction> map{
                {"lines", [](const int p) { return std::make_unique<LineReporter>(p); }},
                {"table", [](const int p) { return std::make_unique<TableReporter>(p); }},
                {"json", [](const int p) { return std::make_unique<JsonReporter>(p); }}};

        const auto it = map.find(format);
        if (it == map.end()) {
            LOG_ERROR("Invalid report format '{}'", format);
            throw std::invalid_argument("Unknown report format '" + format + "'");
        }
        LOG_DEBUG("Using {} reporter with precision {}", format, precision);
        return it->second(precision);
    }

    void LineReporter::report(const types::RankedReport &report, std::ostream &out) const {
        const auto line = fmt::format("{{:.{}}}\n", precision_);
        for (const auto &score: report.results) {
            fmt::print(out, fmt::runtime(line), displayed(report, score));
        }
        for (const auto &entry: report.skipped) {
            fmt::print(out, "{}\n", entry);
        }
        if (report.cancelled) {
            out << "# cancelled, results are partial\n";
        }
    }

    void TableReporter::report(const types::RankedReport &report, std::ostream &out) const {
        const bool match_mode = report.mode == types::ComparisonMode::Match;
        const std::string first_header = match_mode ? "candidate" : "image_a";

        std::size_t first_width = first_header.size();
        for (const auto &score: report.results) {
            first_width = std::max(first_width, displayed(report, score).first.size());
        }
        const std::size_t rank_width = std::max<std::size_t>(4, std::to_string(report.results.size()).size());
        const std::size_t score_width = std::max<std::size_t>(5, static_cast<std::size_t>(precision_) + 2);

        if (match_mode) {
            fmt::print(out, "{:>{}}  {:<{}}  {}\n", "rank", rank_width, "score", score_width, first_header);
        } else {
            fmt::print(out, "{:>{}}  {:<{}}  {:<{}}  {}\n", "rank", rank_width, "score", score_width, first_header,
                       first_width, "image_b");
        }

        std::size_t rank = 1;
        for (const auto &score: report.results) {
            const auto shown = displayed(report, score);
            const auto value = fmt::format("{:.{}f}", shown.score, precision_);
            if (match_mode) {
                fmt::print(out, "{:>{}}  {:<{}}  {}\n", rank++, rank_width, value, score_width, shown.first);
            } else {
                fmt::print(out, "{:>{}}  {:<{}}  {:<{}}  {}\n", rank++, rank_width, value, score_width, shown.first,
                           first_width, shown.second);
            }
        }

        fmt::print(out, "\n{} results from {} candidates, {} skipped{}\n", report.results.size(), report.candidates,
                   report.skipped.size(), report.cancelled ? " (cancelled, partial)" : "");
        for (const auto &entry: report.skipped) {
            fmt::print(out, "{}\n", entry);
        }
    }

    void JsonReporter::report(const types::RankedReport &report, std::ostream &out) const {
        Json::Value root(Json::objectValue);
        root["mode"] = std::string(types::toString(report.mode));
        root["cancelled"] = report.cancelled;
        root["candidates"] = static_cast<Json::UInt64>(report.candidates);

        Json::Value results(Json::arrayValue);
        for (const auto &score: report.results) {
            Json::Value entry(Json::objectValue);
            entry["score"] = score.score;
            if (report.mode == types::ComparisonMode::Match) {
                entry["target"] = score.first;
                entry["candidate"] = score.second;
            } else {
                entry["image_a"] = score.first;
                entry["image_b"] = score.second;
            }
            results.append(entry);
        }
        root["results"] = results;

        Json::Value skipped(Json::arrayValue);
        for (const auto &skip: report.skipped) {
            Json::Value entry(Json::objectValue);
            entry["path"] = skip.first;
            if (!skip.second.empty()) {
                entry["other_path"] = skip.second;
            }
            entry["kind"] = std::string(types::toString(skip.kind));
            entry["reason"] = skip.reason;
            skipped.append(entry);
        }
        root["skipped"] = skipped;

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        builder["precision"] = precision_;
        builder["precisionType"] = "decimal";
        const std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(root, &out);
        out << '\n';
    }

} // namespace reporting
