// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <filesystem>

namespace common::logging {

    std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
    spdlog::level::level_enum Logger::level_ = spdlog::level::warn;
    std::string Logger::pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%# %!] %v";
    std::once_flag Logger::init_flag_;

    void Logger::init(const std::string &log_level, const std::string &pattern) {
        pattern_ = pattern;
        level_ = getLogLevel(log_level);
        initialize();
    }

    void Logger::initialize() {
        try {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

            logger_ = std::make_shared<spdlog::logger>("image-similarity", console_sink);
            logger_->set_level(level_);
            logger_->set_pattern(pattern_);

            spdlog::register_logger(logger_);
            spdlog::set_default_logger(logger_);
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        }
    }

    void Logger::setLogLevel(const std::string &level) {
        std::call_once(init_flag_, []() { init(); });
        level_ = getLogLevel(level);
        if (logger_) {
            logger_->set_level(level_);
        }
    }

    void Logger::addFileSink(const std::string &file_path) {
        std::call_once(init_flag_, []() { init(); });
        if (!logger_ || file_path.empty()) {
            return;
        }

        try {
            if (const std::filesystem::path path(file_path);
                !path.parent_path().empty() && !std::filesystem::exists(path.parent_path())) {
                std::filesystem::create_directories(path.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, true);
            file_sink->set_pattern(pattern_);
            logger_->sinks().push_back(std::move(file_sink));
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Could not open log file '" << file_path << "': " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error &ex) {
            std::cerr << "Could not create log directory for '" << file_path << "': " << ex.what() << std::endl;
        }
    }

    spdlog::level::level_enum Logger::getLogLevel(const std::string &level) {
        static const std::unordered_map<std::string_view, spdlog::level::level_enum> level_map = {
                {"trace", spdlog::level::trace},
                {"debug", spdlog::level::debug},
                {"info", spdlog::level::info},
                {"warn", spdlog::level::warn},
                {"error", spdlog::level::err},
                {"critical", spdlog::level::critical},
                {"off", spdlog::level::off}
        };
        const auto iterator = level_map.find(level);
        return iterator != level_map.end() ? iterator->second : spdlog::level::warn;
    }

}
