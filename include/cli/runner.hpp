// File: cli/runner.hpp

#ifndef CLI_RUNNER_HPP
#define CLI_RUNNER_HPP

#include <ostream>

#include "batch/worker_pool.hpp"

namespace cli {

    /*
     * Parses the command line, runs the requested comparison and writes the report to out.
     * Errors are written to err as one "error: ..." line. Returns the process exit code:
     *   0  success, including runs with skipped files and cancelled runs
     *   1  fatal runtime error (undecodable pair or match target, bad directory, unreadable config file)
     *   2  usage error or invalid option/configuration value
     */
    [[nodiscard]] int run(int argc, const char *const *argv, std::ostream &out, std::ostream &err,
                          const batch::CancellationToken *token = nullptr);

} // namespace cli

#endif // CLI_RUNNER_HPP
