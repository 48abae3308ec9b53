#include "gencache/core/Logging.hpp"
#include "gencache/core/Errors.hpp"
#include <filesystem>
#include <mutex>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace gencache {
namespace logging {

namespace {

std::mutex loggerMutex;

spdlog::level::level_enum parseLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str возвращает off для неизвестных строк
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level: " + level);
    }
    return parsed;
}

} // namespace

nlohmann::json LoggingConfig::toJson() const {
    return {
        {"level", level},
        {"path", path},
        {"maxFileSize", maxFileSize},
        {"maxFiles", maxFiles}
    };
}

LoggingConfig LoggingConfig::fromJson(const nlohmann::json& j) {
    LoggingConfig config;
    try {
        config.level = j.value("level", config.level);
        config.path = j.value("path", config.path);
        config.maxFileSize = j.value("maxFileSize", config.maxFileSize);
        config.maxFiles = j.value("maxFiles", config.maxFiles);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid logging section: ") + e.what());
    }
    parseLevel(config.level);
    if (!config.path.empty() && (config.maxFileSize == 0 || config.maxFiles == 0)) {
        throw ConfigError("Logging file rotation requires non-zero maxFileSize and maxFiles");
    }
    return config;
}

std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    std::lock_guard<std::mutex> lock(loggerMutex);
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    return spdlog::stdout_color_mt(kLoggerName);
}

void initialize(const LoggingConfig& config) {
    auto level = parseLevel(config.level);

    std::vector<spdlog::sink_ptr> sinks;

    // Консоль
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(consoleSink);

    // Файл с ротацией
    if (!config.path.empty()) {
        auto parent = std::filesystem::path(config.path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.path, config.maxFileSize, config.maxFiles);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(fileSink);
    }

    auto appLogger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    appLogger->set_level(level);

    std::lock_guard<std::mutex> lock(loggerMutex);
    spdlog::drop(kLoggerName);
    spdlog::register_logger(appLogger);
    appLogger->debug("Logging initialized: level={}, file='{}'", config.level, config.path);
}

} // namespace logging
} // namespace gencache
