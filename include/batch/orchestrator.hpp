// File: batch/orchestrator.hpp

#ifndef BATCH_ORCHESTRATOR_HPP
#define BATCH_ORCHESTRATOR_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "batch/worker_pool.hpp"
#include "common/io/candidate_source.hpp"
#include "config/settings.hpp"
#include "processing/pair_comparator.hpp"
#include "types/comparison_request.hpp"
#include "types/similarity_score.hpp"

namespace batch {

    /*
     * Applies the pair comparator across many images and ranks the outcome.
     *
     * Every candidate is decoded and described once, in parallel, then the required pairs are
     * scored from the descriptors. A file that fails to decode or describe becomes one skipped
     * entry and the run goes on; only directory-level problems (types::DirectoryError) and, in
     * match mode, an unusable target abort a run.
     */
    class BatchOrchestrator {
    public:
        explicit BatchOrchestrator(const config::Settings &settings);

        BatchOrchestrator(std::shared_ptr<processing::PairComparator> comparator,
                          std::shared_ptr<common::io::CandidateSource> candidates, unsigned int concurrency = 0);

        // Every unordered pair of distinct candidates; fewer than two candidates give an empty report.
        [[nodiscard]] types::RankedReport allPairs(const std::filesystem::path &directory,
                                                   const std::vector<std::string> &extensions,
                                                   const CancellationToken *token = nullptr) const;

        // The target against every candidate except itself. Target failures are rethrown.
        [[nodiscard]] types::RankedReport match(const std::filesystem::path &target,
                                                const std::filesystem::path &directory,
                                                const std::vector<std::string> &extensions,
                                                const CancellationToken *token = nullptr) const;

        // A single comparison; failures are rethrown since there is no batch to continue.
        [[nodiscard]] types::RankedReport pair(const std::filesystem::path &image_a,
                                               const std::filesystem::path &image_b) const;

        [[nodiscard]] types::RankedReport run(const types::ComparisonRequest &request,
                                              const CancellationToken *token = nullptr) const;

    private:
        std::shared_ptr<processing::PairComparator> comparator_;
        std::shared_ptr<common::io::CandidateSource> candidates_;
        WorkerPool pool_;

        struct Described {
            std::filesystem::path path;
            std::optional<types::ImageDescriptor> descriptor;
        };

        // Describes every path on the pool; failures are appended to report.skipped.
        [[nodiscard]] std::vector<Described> describeAll(const std::vector<std::filesystem::path> &paths,
                                                         types::RankedReport &report,
                                                         const CancellationToken *token) const;

        static void finish(types::RankedReport &report, const CancellationToken *token);
    };

} // namespace batch

#endif // BATCH_ORCHESTRATOR_HPP
