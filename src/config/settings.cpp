// File: config/settings.cpp

#include "config/settings.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace config {

    namespace {
        const std::vector<std::string> kReportFormats = {"lines", "table", "json"};
        const std::vector<std::string> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

        std::string trim(const std::string &value) {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }
    } // namespace

    Settings Settings::fromConfiguration(const Configuration &configuration) {
        Settings settings;

        if (const auto method = configuration.get<std::string>("descriptor.method")) {
            const auto parsed = types::parseDescriptorMethod(*method);
            if (!parsed) {
                throw std::invalid_argument("Unknown descriptor method '" + *method + "'");
            }
            settings.descriptor.method = *parsed;
        }
        settings.descriptor.hash_size = configuration.get("descriptor.hash_size", settings.descriptor.hash_size);
        settings.descriptor.dct_size = configuration.get("descriptor.dct_size", settings.descriptor.dct_size);
        settings.descriptor.histogram_bins =
                configuration.get("descriptor.histogram_bins", settings.descriptor.histogram_bins);
        settings.descriptor.hash_weight = configuration.get("descriptor.hash_weight", settings.descriptor.hash_weight);

        settings.concurrency = configuration.get("batch.concurrency", settings.concurrency);
        settings.recursive = configuration.get("batch.recursive", settings.recursive);
        if (const auto extensions = configuration.get<std::vector<std::string>>("batch.extensions")) {
            settings.extensions = normalizeExtensions(*extensions);
            if (settings.extensions.empty()) {
                settings.extensions = defaultExtensions();
            }
        }

        settings.report_format = configuration.get("report.format", settings.report_format.c_str());
        settings.report_precision = configuration.get("report.precision", settings.report_precision);
        settings.log_level = configuration.get("logging.level", settings.log_level.c_str());
        settings.log_file = configuration.get("logging.file", settings.log_file.c_str());

        settings.validate();
        return settings;
    }

    void Settings::validate() const {
        descriptor.validate();
        if (std::ranges::find(kReportFormats, report_format) == kReportFormats.end()) {
            throw std::invalid_argument("Unknown report format '" + report_format + "'");
        }
        if (report_precision < 1 || report_precision > 17) {
            throw std::invalid_argument("report precision must be in [1, 17], got " + std::to_string(report_precision));
        }
        if (std::ranges::find(kLogLevels, log_level) == kLogLevels.end()) {
            throw std::invalid_argument("Unknown log level '" + log_level + "'");
        }
        if (extensions.empty()) {
            throw std::invalid_argument("extension allow-list must not be empty");
        }
    }

    std::vector<std::string> parseExtensions(const std::string &list) {
        std::vector<std::string> tokens;
        std::string token;
        std::istringstream token_stream(list);
        while (std::getline(token_stream, token, ',')) {
            tokens.push_back(std::move(token));
        }

        auto extensions = normalizeExtensions(tokens);
        return extensions.empty() ? Settings::defaultExtensions() : extensions;
    }

    std::vector<std::string> normalizeExtensions(const std::vector<std::string> &extensions) {
        std::vector<std::string> normalized;
        for (const auto &raw: extensions) {
            std::string extension = trim(raw);
            if (!extension.empty() && extension.front() == '.') {
                extension.erase(0, 1);
            }
            std::ranges::transform(extension, extension.begin(), [](const unsigned char c) { return std::tolower(c); });
            if (!extension.empty() && std::ranges::find(normalized, extension) == normalized.end()) {
                normalized.push_back(std::move(extension));
            }
        }
        return normalized;
    }

} // namespace config
