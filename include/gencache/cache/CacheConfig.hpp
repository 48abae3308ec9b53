#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "gencache/cache/Serializer.hpp"

namespace gencache {
namespace cache {

// Параметры одного региона
struct RegionConfig {
    // Верхние границы: значения переводятся в миллисекунды и наносекунды
    static constexpr std::chrono::seconds kMaxExpiration{std::chrono::hours(24) * 3650};
    static constexpr std::chrono::milliseconds kMaxLockDuration{std::chrono::hours(24)};

    std::chrono::seconds expiration{300};
    std::chrono::milliseconds lockLease{30000};
    std::chrono::milliseconds lockAcquireTimeout{10000};
    std::chrono::milliseconds lockRetryInterval{10};
    std::chrono::milliseconds lockMaxRetryInterval{100};
    size_t maxGenerationRetries = 16;

    bool validate() const {
        if (expiration.count() <= 0 || expiration > kMaxExpiration) return false;
        if (lockLease.count() <= 0 || lockLease > kMaxLockDuration) return false;
        if (lockAcquireTimeout.count() < 0 || lockAcquireTimeout > kMaxLockDuration) return false;
        if (lockRetryInterval.count() <= 0) return false;
        if (lockMaxRetryInterval < lockRetryInterval || lockMaxRetryInterval > kMaxLockDuration) return false;
        if (maxGenerationRetries == 0) return false;
        return true;
    }

    nlohmann::json toJson() const;
    static RegionConfig fromJson(const nlohmann::json& j);
    // Отсутствующие поля берутся из base
    static RegionConfig fromJson(const nlohmann::json& j, const RegionConfig& base);
};

// Описание подавленной ошибки для обработчика onException
struct CacheErrorEvent {
    std::string region;
    std::string operation;
    std::string message;
};

/**
 * @brief Общие параметры клиента кэша.
 * @details Конфигурация регионов: явная запись в regions или defaults.
 */
struct CacheOptions {
    std::string keyPrefix = "gencache";
    RegionConfig defaults;
    std::unordered_map<std::string, RegionConfig> regions;
    size_t maxTrackedRegions = 1024;
    std::shared_ptr<ISerializer> serializer = std::make_shared<JsonSerializer>();

    std::function<void(const CacheErrorEvent&)> onException;
    std::function<void(const std::string& region, const std::string& id, const std::string& reason)> onLockFailed;
    std::function<void(const std::string& region, const std::string& id)> onUnlockFailed;

    const RegionConfig& regionConfig(const std::string& region) const {
        auto it = regions.find(region);
        return it != regions.end() ? it->second : defaults;
    }

    bool validate() const;

    // Колбэки в JSON не попадают, сериализатор только встроенных типов
    nlohmann::json toJson() const;
    static CacheOptions fromJson(const nlohmann::json& j);
};

} // namespace cache
} // namespace gencache
