// File: batch/orchestrator.cpp

#include "batch/orchestrator.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"
#include "common/timer.hpp"
#include "types/errors.hpp"

namespace batch {

    namespace {
        types::SkippedEntry toSkipped(std::string first, std::string second, const types::SimilarityError &error) {
            LOG_WARN("Skipping {}{}{}: {}", first, second.empty() ? "" : " / ", second, error.what());
            return {std::move(first), std::move(second), error.kind(), error.what()};
        }
    } // namespace

    BatchOrchestrator::BatchOrchestrator(const config::Settings &settings) :
        BatchOrchestrator(std::make_shared<processing::PairComparator>(settings.descriptor),
                          std::make_shared<common::io::FilesystemCandidateSource>(settings.recursive),
                          settings.concurrency) {}

    BatchOrchestrator::BatchOrchestrator(std::shared_ptr<processing::PairComparator> comparator,
                                         std::shared_ptr<common::io::CandidateSource> candidates,
                                         const unsigned int concurrency) :
        comparator_(std::move(comparator)), candidates_(std::move(candidates)), pool_(concurrency) {
        if (!comparator_ || !candidates_) {
            throw std::invalid_argument("BatchOrchestrator requires a pair comparator and a candidate source");
        }
    }

    std::vector<BatchOrchestrator::Described>
    BatchOrchestrator::describeAll(const std::vector<std::filesystem::path> &paths, types::RankedReport &report,
                                   const CancellationToken *token) const {
        std::vector<Described> described(paths.size());
        std::vector<std::optional<types::SkippedEntry>> failures(paths.size());

        pool_.run(
                paths.size(),
                [&](const std::size_t index) {
                    described[index].path = paths[index];
                    try {
                        described[index].descriptor = comparator_->describe(paths[index]);
                    } catch (const types::SimilarityError &e) {
                        failures[index] = toSkipped(paths[index].string(), {}, e);
                    }
                },
                token);

        for (auto &failure: failures) {
            if (failure) {
                report.skipped.push_back(std::move(*failure));
            }
        }
        return described;
    }

    types::RankedReport BatchOrchestrator::allPairs(const std::filesystem::path &directory,
                                                    const std::vector<std::string> &extensions,
                                                    const CancellationToken *token) const {
        Timer timer("all-pairs comparison of " + directory.string());

        types::RankedReport report;
        report.mode = types::ComparisonMode::AllPairs;

        const auto paths = candidates_->list(directory, extensions);
        report.candidates = paths.size();
        LOG_INFO("Found {} candidate images in {}", paths.size(), directory);
        if (paths.size() < 2) {
            LOG_INFO("Fewer than two candidates in {}, nothing to compare", directory);
            finish(report, token);
            return report;
        }

        auto described = describeAll(paths, report, token);
        std::erase_if(described, [](const Described &item) { return !item.descriptor.has_value(); });

        std::vector<std::pair<std::size_t, std::size_t>> pairs;
        if (described.size() >= 2) {
            pairs.reserve(described.size() * (described.size() - 1) / 2);
            for (std::size_t a = 0; a + 1 < described.size(); ++a) {
                for (std::size_t b = a + 1; b < described.size(); ++b) {
                    pairs.emplace_back(a, b);
                }
            }
        }
        LOG_DEBUG("Scoring {} pairs from {} described images", pairs.size(), described.size());

        std::vector<std::optional<types::SimilarityScore>> scores(pairs.size());
        std::vector<std::optional<types::SkippedEntry>> failures(pairs.size());
        pool_.run(
                pairs.size(),
                [&](const std::size_t index) {
                    const auto &[a, b] = pairs[index];
                    auto first = described[a].path.string();
                    auto second = described[b].path.string();
                    if (second < first) {
                        std::swap(first, second);
                    }
                    try {
                        const double score = comparator_->score(*described[a].descriptor, *described[b].descriptor);
                        scores[index] = types::SimilarityScore{score, std::move(first), std::move(second)};
                    } catch (const types::SimilarityError &e) {
                        failures[index] = toSkipped(std::move(first), std::move(second), e);
                    }
                },
                token);

        for (std::size_t i = 0; i < pairs.size(); ++i) {
            if (scores[i]) {
                report.results.push_back(std::move(*scores[i]));
            } else if (failures[i]) {
                report.skipped.push_back(std::move(*failures[i]));
            }
        }

        finish(report, token);
        return report;
    }

    types::RankedReport BatchOrchestrator::match(const std::filesystem::path &target,
                                                 const std::filesystem::path &directory,
                                                 const std::vector<std::string> &extensions,
                                                 const CancellationToken *token) const {
        Timer timer("match of " + target.string() + " against " + directory.string());

        types::RankedReport report;
        report.mode = types::ComparisonMode::Match;

        // List first so a bad directory is reported before any decoding work
        auto paths = candidates_->list(directory, extensions);
        const auto target_descriptor = comparator_->describe(target);

        std::erase_if(paths, [&target](const std::filesystem::path &path) {
            if (common::io::samePath(path, target)) {
                LOG_DEBUG("Excluding the target {} from its own candidates", path);
                return true;
            }
            return false;
        });
        report.candidates = paths.size();
        LOG_INFO("Matching {} against {} candidate images in {}", target, paths.size(), directory);

        std::vector<std::optional<types::SimilarityScore>> scores(paths.size());
        std::vector<std::optional<types::SkippedEntry>> failures(paths.size());
        pool_.run(
                paths.size(),
                [&](const std::size_t index) {
                    try {
                        const auto descriptor = comparator_->describe(paths[index]);
                        scores[index] = types::SimilarityScore{comparator_->score(target_descriptor, descriptor),
                                                               target.string(), paths[index].string()};
                    } catch (const types::SimilarityError &e) {
                        failures[index] = toSkipped(paths[index].string(), {}, e);
                    }
                },
                token);

        for (std::size_t i = 0; i < paths.size(); ++i) {
            if (scores[i]) {
                report.results.push_back(std::move(*scores[i]));
            } else if (failures[i]) {
                report.skipped.push_back(std::move(*failures[i]));
            }
        }

        finish(report, token);
        return report;
    }

    types::RankedReport BatchOrchestrator::pair(const std::filesystem::path &image_a,
                                                const std::filesystem::path &image_b) const {
        types::RankedReport report;
        report.mode = types::ComparisonMode::Pair;
        report.candidates = 2;
        report.results.push_back(comparator_->compare(image_a, image_b));
        return report;
    }

    types::RankedReport BatchOrchestrator::run(const types::ComparisonRequest &request,
                                               const CancellationToken *token) const {
        switch (request.mode) {
            case types::ComparisonMode::Pair:
                return pair(request.image_a, request.image_b);
            case types::ComparisonMode::AllPairs:
                return allPairs(request.directory, request.settings.extensions, token);
            case types::ComparisonMode::Match:
                return match(request.target, request.directory, request.settings.extensions, token);
        }
        throw std::invalid_argument("Unknown comparison mode");
    }

    void BatchOrchestrator::finish(types::RankedReport &report, const CancellationToken *token) {
        report.cancelled = token && token->cancelled();
        if (report.cancelled) {
            LOG_WARN("Run was cancelled, reporting {} partial results", report.results.size());
        }
        report.rank();
        LOG_INFO("{} results, {} skipped", report.results.size(), report.skipped.size());
    }

} // namespace batch
