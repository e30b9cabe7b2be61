// File: config/configuration.cpp

#include "config/configuration.hpp"

#include <algorithm>

namespace config {

    Configuration::Configuration(const std::string &filename) : filename_(filename) {
        LOG_INFO("Loading configuration from file: {}", filename);

        try {
            const YAML::Node root = YAML::LoadFile(filename);
            LOG_INFO("Configuration file '{}' loaded successfully.", filename);
            load(root);
        } catch (const YAML::BadFile &e) {
            LOG_CRITICAL("Could not open configuration file '{}': {}", filename, e.what());
            throw std::runtime_error("Could not open configuration file: " + filename);
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration: {}", e.what());
            throw std::runtime_error("Invalid configuration file " + filename + ": " + e.what());
        }
    }

    Configuration Configuration::fromString(const std::string &yaml) {
        Configuration configuration;
        try {
            configuration.load(YAML::Load(yaml));
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while parsing configuration: {}", e.what());
            throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
        }
        return configuration;
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        if (!node.IsMap()) {
            if (!node.IsNull()) {
                throw std::runtime_error("Configuration root must be a map");
            }
            return;
        }
        for (const auto &it: node) {
            std::string key = prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
            if (it.second.IsMap()) {
                LOG_DEBUG("Loading nested map for key: '{}'", key);
                load(it.second, key); // Recursively load nested maps
            } else {
                LOG_DEBUG("Loaded key: '{}', value: '{}'", key,
                          it.second.IsScalar() ? it.second.as<std::string>() : "[non-scalar]");
                config_map_[key] = it.second;
            }
        }
    }

    std::vector<std::string> Configuration::keys() const {
        std::vector<std::string> result;
        result.reserve(config_map_.size());
        for (const auto &entry: config_map_) {
            result.push_back(entry.first);
        }
        std::ranges::sort(result);
        return result;
    }

    void Configuration::show() const {
        LOG_INFO("Configuration details:");
        for (const auto &key: keys()) {
            const auto &node = config_map_.at(key);
            LOG_INFO("{}: {}", key, node.IsScalar() ? node.as<std::string>() : YAML::Dump(node));
        }
    }
} // namespace config
