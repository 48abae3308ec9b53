#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gencache {
namespace logging {

// Имя общего логгера библиотеки
inline constexpr const char* kLoggerName = "gencache";

struct LoggingConfig {
    std::string level = "info";
    std::string path;                       // пусто = только консоль
    size_t maxFileSize = 1024 * 1024 * 5;
    size_t maxFiles = 3;

    nlohmann::json toJson() const;
    static LoggingConfig fromJson(const nlohmann::json& j);
};

/**
 * @brief Общий логгер библиотеки.
 * @details Если приложение не зарегистрировало логгер "gencache",
 * создаётся консольный логгер по умолчанию.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Настройка логгера приложения: консоль + ротируемый файл.
 * @throws ConfigError если уровень логирования неизвестен
 */
void initialize(const LoggingConfig& config);

} // namespace logging
} // namespace gencache
