#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "gencache/cache/CacheConfig.hpp"
#include "gencache/cache/CacheMetrics.hpp"
#include "gencache/cache/CacheNamespace.hpp"
#include "gencache/cache/GenerationCache.hpp"
#include "gencache/core/Errors.hpp"
#include "gencache/store/RemoteStore.hpp"

namespace gencache {
namespace cache {

/**
 * @brief Регион распределённого кэша с инвалидацией через поколения.
 *
 * put/get/remove выполняются через GenerationSynchronizer; clear увеличивает
 * поколение и не перебирает элементы; lock/unlock работают с распределённой
 * блокировкой, не зависящей от поколения.
 *
 * Недоступность хранилища не превращается в ошибку вызывающего: put, remove,
 * clear, unlock ничего не делают, get возвращает промах, lock возвращает false.
 * Ошибка десериализации (SerializationError) пробрасывается.
 */
class RegionCache {
public:
    RegionCache(std::string region,
                std::shared_ptr<store::IRemoteStore> store,
                CacheOptions options = CacheOptions{},
                std::shared_ptr<GenerationCache> generations = nullptr);
    ~RegionCache();

    RegionCache(const RegionCache&) = delete;
    RegionCache& operator=(const RegionCache&) = delete;

    void put(const std::string& id, const nlohmann::json& value);
    std::optional<nlohmann::json> get(const std::string& id);
    void remove(const std::string& id);
    void clear();

    /// Блокирующий захват; false при таймауте или недоступном хранилище.
    bool lock(const std::string& id);
    void unlock(const std::string& id);

    // Освобождает только локальные ресурсы, хранилище не трогает
    void destroy();

    template<typename T>
    void putObject(const std::string& id, const T& value) {
        put(id, nlohmann::json(value));
    }

    template<typename T>
    std::optional<T> getObject(const std::string& id) {
        auto value = get(id);
        if (!value) {
            return std::nullopt;
        }
        try {
            return value->get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError("Cached value in region '" + regionName() + "' has unexpected shape: " + e.what());
        }
    }

    const std::string& regionName() const;
    const RegionConfig& regionConfig() const;
    CacheNamespace& cacheNamespace();
    CacheMetrics getMetrics() const;

private:
    void reportFailure(const char* operation, const std::exception& e);

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cache
} // namespace gencache
