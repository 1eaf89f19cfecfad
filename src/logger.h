#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// Default spdlog logger: colored console at the requested level, file sink at trace
class Logger {
public:
    static constexpr const char* DEFAULT_LOG_PATH = "logs/photo_vault.log";

    static void initialize(LogLevel level = LogLevel::Info, const std::string& log_path = DEFAULT_LOG_PATH) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(static_cast<spdlog::level::level_enum>(level));

        std::vector<spdlog::sink_ptr> sinks{console_sink};
        std::string file_error;
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, true);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }
        catch (const spdlog::spdlog_ex& ex) {
            file_error = ex.what();
        }

        auto logger = std::make_shared<spdlog::logger>("photo_vault", sinks.begin(), sinks.end());
        logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        // File sink receives everything, the console filters by its own level
        logger->set_level(spdlog::level::trace);

        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(1));

        if (!file_error.empty()) {
            spdlog::warn("Logging to console only, cannot open {}: {}", log_path, file_error);
        }
    }

    static void set_level(LogLevel level) {
        spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    }

    // "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"; fallback otherwise
    static LogLevel parse_level(std::string name, LogLevel fallback = LogLevel::Info) {
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn" || name == "warning") return LogLevel::Warning;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return fallback;
    }
};

#define LOG_TRACE(...)    spdlog::trace(__VA_ARGS__)
#define LOG_DEBUG(...)    spdlog::debug(__VA_ARGS__)
#define LOG_INFO(...)     spdlog::info(__VA_ARGS__)
#define LOG_WARN(...)     spdlog::warn(__VA_ARGS__)
#define LOG_ERROR(...)    spdlog::error(__VA_ARGS__)
#define LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)
