// File: cli/runner.cpp

#include "cli/runner.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

#include "batch/orchestrator.hpp"
#include "cli/command_line.hpp"
#include "common/logging/logger.hpp"
#include "common/timer.hpp"
#include "reporting/result_reporter.hpp"

namespace cli {

    int run(const int argc, const char *const *argv, std::ostream &out, std::ostream &err,
            const batch::CancellationToken *token) {
        const std::string program = argc > 0 && argv[0] ? std::filesystem::path(argv[0]).filename().string()
                                                        : "image-similarity";

        types::ComparisonRequest request;
        try {
            const auto command = CommandLine::parse(argc, argv);
            if (command.show_help) {
                out << usage(program);
                return 0;
            }
            if (command.show_version) {
                out << version() << '\n';
                return 0;
            }
            request = command.toRequest();
        } catch (const UsageError &e) {
            err << "error: " << e.what() << "\n\n" << usage(program);
            return 2;
        } catch (const std::invalid_argument &e) {
            err << "error: " << e.what() << '\n';
            return 2;
        } catch (const std::runtime_error &e) {
            err << "error: " << e.what() << '\n';
            return 1;
        }

        const auto &settings = request.settings;
        common::logging::Logger::setLogLevel(settings.log_level);
        common::logging::Logger::addFileSink(settings.log_file);

        try {
            const auto reporter = reporting::ResultReporter::create(settings.report_format, settings.report_precision);
            const batch::BatchOrchestrator orchestrator(settings);

            types::RankedReport report;
            {
                const Timer timer(std::string(types::toString(request.mode)));
                report = orchestrator.run(request, token);
            }
            reporter->report(report, out);
            out.flush();
        } catch (const types::SimilarityError &e) {
            LOG_ERROR("{} error: {}", types::toString(e.kind()), e.what());
            err << "error: " << e.what() << '\n';
            return 1;
        } catch (const std::invalid_argument &e) {
            err << "error: " << e.what() << '\n';
            return 2;
        } catch (const std::exception &e) {
            LOG_CRITICAL("Unexpected failure: {}", e.what());
            err << "error: " << e.what() << '\n';
            return 1;
        }
        return 0;
    }

} // namespace cli
