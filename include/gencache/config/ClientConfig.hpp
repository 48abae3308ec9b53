#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "gencache/cache/CacheConfig.hpp"
#include "gencache/core/Logging.hpp"
#include "gencache/store/RedisStore.hpp"

namespace gencache {
namespace config {

// Конфигурация клиентского процесса (JSON-файл)
struct ClientConfig {
    cache::CacheOptions cache;
    store::RedisConfig redis;
    logging::LoggingConfig logging;

    nlohmann::json toJson() const;
    static ClientConfig fromJson(const nlohmann::json& j);
};

/**
 * @brief Загрузить конфигурацию из файла.
 * @throws ConfigError если файл не читается или содержит ошибки
 */
ClientConfig loadClientConfig(const std::string& path);

} // namespace config
} // namespace gencache
