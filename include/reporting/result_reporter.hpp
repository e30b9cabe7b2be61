// File: reporting/result_reporter.hpp

#ifndef RESULT_REPORTER_HPP
#define RESULT_REPORTER_HPP

#include <memory>
#include <ostream>
#include <string>

#include "types/similarity_score.hpp"

namespace reporting {

    class ResultReporter {
    public:
        explicit ResultReporter(const int precision = 6) : precision_(precision) {}
        virtual ~ResultReporter() = default;

        // Write the whole report. Output depends only on the report, never on timing or thread order.
        virtual void report(const types::RankedReport &report, std::ostream &out) const = 0;

        // "lines", "table" or "json"; throws std::invalid_argument for anything else.
        [[nodiscard]] static std::unique_ptr<ResultReporter> create(const std::string &format, int precision = 6);

    protected:
        int precision_;
    };

    // One line per result (score, then the quoted paths), followed by one line per skipped entry.
    class LineReporter final : public ResultReporter {
    public:
        using ResultReporter::ResultReporter;

        void report(const types::RankedReport &report, std::ostream &out) const override;
    };

    // Aligned columns with a header row and a summary footer.
    class TableReporter final : public ResultReporter {
    public:
        using ResultReporter::ResultReporter;

        void report(const types::RankedReport &report, std::ostream &out) const override;
    };

    // A single JSON document.
    class JsonReporter final : public ResultReporter {
    public:
        using ResultReporter::ResultReporter;

        void report(const types::RankedReport &report, std::ostream &out) const override;
    };

} // namespace reporting

#endif // RESULT_REPORTER_HPP
