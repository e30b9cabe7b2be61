// File: cli/command_line.cpp

#include "cli/command_line.hpp"

#include <charconv>
#include <functional>
#include <unordered_map>

#include <fmt/format.h>

#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

#ifndef IMAGE_SIMILARITY_VERSION
#define IMAGE_SIMILARITY_VERSION "0.1.0"
#endif

namespace cli {

    namespace {
        using Setter = std::function<void(CommandLine &, const std::string &)>;

        struct OptionSpec {
            std::string long_name;
            bool takes_value;
            Setter set;
        };

        unsigned int parseJobs(const std::string &value) {
            unsigned int jobs = 0;
            const auto *end = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(value.data(), end, jobs);
            if (value.empty() || ec != std::errc() || ptr != end) {
                throw UsageError("--jobs expects a non-negative integer, got '" + value + "'");
            }
            return jobs;
        }

        // Short name -> spec. Every option is also reachable by its long name.
        const std::unordered_map<char, OptionSpec> &options() {
            static const std::unordered_map<char, OptionSpec> table{
                    {'a', {"imagea", true, [](CommandLine &c, const std::string &v) { c.image_a = v; }}},
                    {'b', {"imageb", true, [](CommandLine &c, const std::string &v) { c.image_b = v; }}},
                    {'i', {"image", true, [](CommandLine &c, const std::string &v) { c.image = v; }}},
                    {'d', {"directory", true, [](CommandLine &c, const std::string &v) { c.directory = v; }}},
                    {'e', {"ext", true, [](CommandLine &c, const std::string &v) { c.extensions = v; }}},
                    {'c', {"config", true, [](CommandLine &c, const std::string &v) { c.config_file = v; }}},
                    {'m', {"method", true, [](CommandLine &c, const std::string &v) { c.method = v; }}},
                    {'f', {"format", true, [](CommandLine &c, const std::string &v) { c.format = v; }}},
                    {'j', {"jobs", true, [](CommandLine &c, const std::string &v) { c.jobs = parseJobs(v); }}},
                    {'L', {"log-level", true, [](CommandLine &c, const std::string &v) { c.log_level = v; }}},
                    {'h', {"help", false, [](CommandLine &c, const std::string &) { c.show_help = true; }}},
                    {'V', {"version", false, [](CommandLine &c, const std::string &) { c.show_version = true; }}}};
            return table;
        }

        const OptionSpec *findLong(const std::string &name) {
            for (const auto &[short_name, spec]: options()) {
                if (spec.long_name == name) {
                    return &spec;
                }
            }
            return nullptr;
        }

        std::optional<types::ComparisonMode> parseMode(const std::string &word) {
            static const std::unordered_map<std::string, types::ComparisonMode> modes{
                    {"pair", types::ComparisonMode::Pair},
                    {"directory", types::ComparisonMode::AllPairs},
                    {"match", types::ComparisonMode::Match}};
            const auto it = modes.find(word);
            if (it == modes.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        void require(const std::optional<std::string> &value, const char *option, const types::ComparisonMode mode) {
            if (!value || value->empty()) {
                throw UsageError(fmt::format("{} requires {}", types::toString(mode), option));
            }
        }

        void forbid(const std::optional<std::string> &value, const char *option, const types::ComparisonMode mode) {
            if (value) {
                throw UsageError(fmt::format("{} is not valid for {}", option, types::toString(mode)));
            }
        }
    } // namespace

    CommandLine CommandLine::parse(const int argc, const char *const *argv) {
        CommandLine command;

        for (int i = 1; i < argc; ++i) {
            const std::string argument = argv[i] ? argv[i] : "";

            const OptionSpec *spec = nullptr;
            std::optional<std::string> inline_value;
            if (argument.rfind("--", 0) == 0 && argument.size() > 2) {
                std::string name = argument.substr(2);
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.erase(eq);
                }
                spec = findLong(name);
            } else if (argument.size() == 2 && argument.front() == '-') {
                const auto it = options().find(argument[1]);
                spec = it == options().end() ? nullptr : &it->second;
            } else if (!argument.empty() && argument.front() != '-') {
                if (command.mode) {
                    throw UsageError("Unexpected argument '" + argument + "'");
                }
                command.mode = parseMode(argument);
                if (!command.mode) {
                    throw UsageError("Unknown command '" + argument + "'");
                }
                continue;
            }

            if (!spec) {
                throw UsageError("Unknown option '" + argument + "'");
            }
            if (!spec->takes_value) {
                if (inline_value) {
                    throw UsageError("--" + spec->long_name + " does not take a value");
                }
                spec->set(command, {});
                continue;
            }
            if (!inline_value) {
                if (i + 1 >= argc || !argv[i + 1]) {
                    throw UsageError("--" + spec->long_name + " requires a value");
                }
                inline_value = argv[++i];
            }
            spec->set(command, *inline_value);
        }

        if (command.show_help || command.show_version) {
            return command;
        }
        if (!command.mode) {
            throw UsageError("No command given");
        }

        switch (*command.mode) {
            case types::ComparisonMode::Pair:
                require(command.image_a, "-a/--imagea", *command.mode);
                require(command.image_b, "-b/--imageb", *command.mode);
                forbid(command.image, "-i/--image", *command.mode);
                forbid(command.directory, "-d/--directory", *command.mode);
                forbid(command.extensions, "-e/--ext", *command.mode);
                break;
            case types::ComparisonMode::AllPairs:
                require(command.directory, "-d/--directory", *command.mode);
                forbid(command.image_a, "-a/--imagea", *command.mode);
                forbid(command.image_b, "-b/--imageb", *command.mode);
                forbid(command.image, "-i/--image", *command.mode);
                break;
            case types::ComparisonMode::Match:
                require(command.image, "-i/--image", *command.mode);
                require(command.directory, "-d/--directory", *command.mode);
                forbid(command.image_a, "-a/--imagea", *command.mode);
                forbid(command.image_b, "-b/--imageb", *command.mode);
                break;
        }
        return command;
    }

    types::ComparisonRequest CommandLine::toRequest() const {
        if (!mode) {
            throw UsageError("No command given");
        }

        types::ComparisonRequest request;
        request.mode = *mode;
        request.image_a = image_a.value_or("");
        request.image_b = image_b.value_or("");
        request.target = image.value_or("");
        request.directory = directory.value_or("");

        if (config_file) {
            const config::Configuration configuration(*config_file);
            configuration.show();
            request.settings = config::Settings::fromConfiguration(configuration);
        }

        auto &settings = request.settings;
        if (method) {
            const auto parsed = types::parseDescriptorMethod(*method);
            if (!parsed) {
                throw UsageError("Unknown method '" + *method + "'");
            }
            settings.descriptor.method = *parsed;
        }
        if (format) {
            settings.report_format = *format;
        }
        if (log_level) {
            settings.log_level = *log_level;
        }
        if (jobs) {
            settings.concurrency = *jobs;
        }
        if (extensions) {
            settings.extensions = config::parseExtensions(*extensions);
        }

        settings.validate();
        LOG_DEBUG("Request: {} with {}", types::toString(request.mode), settings.descriptor.toString());
        return request;
    }

    std::string usage(const std::string_view program) {
        return fmt::format("Usage:\n"
                           "  {0} [options] pair -a <image> -b <image>\n"
                           "  {0} [options] directory -d <dir> [-e <ext,...>]\n"
                           "  {0} [options] match -i <image> -d <dir> [-e <ext,...>]\n"
                           "\n"
                           "Commands:\n"
                           "  pair        score two images\n"
                           "  directory   score every pair of images in a directory, best first\n"
                           "  match       score one image against every image in a directory, best first\n"
                           "\n"
                           "Options:\n"
                           "  -a, --imagea <path>      first image (pair)\n"
                           "  -b, --imageb <path>      second image (pair)\n"
                           "  -i, --image <path>       target image (match)\n"
                           "  -d, --directory <path>   directory of candidates (directory, match)\n"
                           "  -e, --ext <list>         comma separated extensions (default png,jpg,jpeg)\n"
                           "  -c, --config <file>      YAML configuration file\n"
                           "  -m, --method <name>      phash, histogram or composite (default composite)\n"
                           "  -j, --jobs <n>           worker threads, 0 = hardware threads (default 0)\n"
                           "  -f, --format <name>      lines, table or json (default lines)\n"
                           "  -L, --log-level <level>  trace, debug, info, warn, error, critical or off\n"
                           "  -h, --help               show this help\n"
                           "  -V, --version            show the version\n",
                           program);
    }

    std::string version() { return std::string("image-similarity ") + IMAGE_SIMILARITY_VERSION; }

} // namespace cli
