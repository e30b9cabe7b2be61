// File: cli/command_line.hpp

#ifndef CLI_COMMAND_LINE_HPP
#define CLI_COMMAND_LINE_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "types/comparison_request.hpp"

namespace cli {

    // Misuse of the command line; reported with the usage text and exit code 2.
    class UsageError final : public std::invalid_argument {
    public:
        explicit UsageError(const std::string &message) : std::invalid_argument(message) {}
    };

    /*
     * image-similarity [options] pair -a <path> -b <path>
     * image-similarity [options] directory -d <path> [-e <ext,...>]
     * image-similarity [options] match -i <path> -d <path> [-e <ext,...>]
     *
     * Options may appear before or after the subcommand. Values are given as "-a x", "--imagea x"
     * or "--imagea=x".
     */
    struct CommandLine {
        std::optional<types::ComparisonMode> mode;
        bool show_help = false;
        bool show_version = false;

        std::optional<std::string> image_a;
        std::optional<std::string> image_b;
        std::optional<std::string> image;
        std::optional<std::string> directory;
        std::optional<std::string> extensions;

        std::optional<std::string> config_file;
        std::optional<std::string> method;
        std::optional<std::string> format;
        std::optional<std::string> log_level;
        std::optional<unsigned int> jobs;

        // Throws UsageError on unknown subcommands or options, missing values, or options that
        // do not belong to the chosen subcommand.
        [[nodiscard]] static CommandLine parse(int argc, const char *const *argv);

        // Settings are the defaults, overlaid with --config (if any), overlaid with explicit flags.
        // Throws std::invalid_argument for bad values and std::runtime_error if the config file cannot be loaded.
        [[nodiscard]] types::ComparisonRequest toRequest() const;
    };

    [[nodiscard]] std::string usage(std::string_view program);

    [[nodiscard]] std::string version();

} // namespace cli

#endif // CLI_COMMAND_LINE_HPP
