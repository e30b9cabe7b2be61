// File: config/settings.hpp

#ifndef CONFIG_SETTINGS_HPP
#define CONFIG_SETTINGS_HPP

#include <string>
#include <vector>

#include "config/configuration.hpp"
#include "types/image_descriptor.hpp"

namespace config {

    // Everything one invocation needs, resolved once and passed down explicitly.
    struct Settings {
        types::DescriptorConfig descriptor;
        unsigned int concurrency = 0; // 0 = one worker per hardware thread
        bool recursive = true;
        std::vector<std::string> extensions = defaultExtensions();
        std::string report_format = "lines";
        int report_precision = 6;
        std::string log_level = "warn";
        std::string log_file;

        [[nodiscard]] static std::vector<std::string> defaultExtensions() { return {"png", "jpg", "jpeg"}; }

        // Defaults overlaid with whatever keys the configuration defines; throws std::invalid_argument on bad values.
        [[nodiscard]] static Settings fromConfiguration(const Configuration &configuration);

        // Throws std::invalid_argument naming the first invalid field.
        void validate() const;
    };

    // Split "png, .JPG,jpeg" into {"png", "jpg", "jpeg"}; an empty result falls back to the defaults.
    [[nodiscard]] std::vector<std::string> parseExtensions(const std::string &list);

    // Lower-cases, trims and strips a leading dot from every entry, dropping empty entries and duplicates.
    [[nodiscard]] std::vector<std::string> normalizeExtensions(const std::vector<std::string> &extensions);

} // namespace config

#endif // CONFIG_SETTINGS_HPP
