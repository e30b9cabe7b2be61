// File: config/configuration.hpp

#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "common/logging/logger.hpp"

namespace config {

    /*
     * YAML configuration flattened into dotted keys ("descriptor.hash_size").
     * Nested maps are expanded, scalars and sequences are stored as nodes.
     * An instance is a plain value owned by whoever loaded it; nothing is process-wide.
     */
    class Configuration {
    public:
        Configuration() = default;

        // Load the given file; throws std::runtime_error when it cannot be read or parsed.
        explicit Configuration(const std::string &filename);

        [[nodiscard]] static Configuration fromString(const std::string &yaml);

        [[nodiscard]] std::vector<std::string> keys() const;

        // Helper function to log entire configuration
        void show() const;

        // Get a value of type T from the configuration
        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const;

        // Get a value of type T from the configuration with a default value
        template<typename T>
        [[nodiscard]] T get(const std::string &key, T default_value) const;

        // Specialization to handle const char* as std::string
        [[nodiscard]] std::string get(const std::string &key, const char *default_value) const;

        [[nodiscard]] const std::string &filename() const noexcept { return filename_; }

    private:
        std::unordered_map<std::string, YAML::Node> config_map_;
        std::string filename_;

        // Load the entire configuration into a map
        void load(const YAML::Node &node, const std::string &prefix = "");
    };

    // Template definitions
    template<typename T>
    std::optional<T> Configuration::get(const std::string &key) const {
        const auto it = config_map_.find(key);
        if (it == config_map_.end()) {
            LOG_TRACE("Key '{}' not found in configuration", key);
            return std::nullopt;
        }
        try {
            return it->second.as<T>();
        } catch (const YAML::Exception &e) {
            LOG_ERROR("YAML parsing exception for key '{}': {}", key, e.what());
            throw std::invalid_argument("Invalid value for configuration key '" + key + "': " + e.what());
        }
    }

    template<typename T>
    T Configuration::get(const std::string &key, T default_value) const {
        auto value = get<T>(key);
        return value ? *value : default_value;
    }

    // Specialization to force const char* to std::string (yaml-cpp misbehaves with const char*)
    inline std::string Configuration::get(const std::string &key, const char *default_value) const {
        return get<std::string>(key, std::string(default_value));
    }

} // namespace config

#endif // CONFIGURATION_HPP
