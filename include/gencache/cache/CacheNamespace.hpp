#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "gencache/cache/GenerationCache.hpp"
#include "gencache/store/RemoteStore.hpp"

namespace gencache {
namespace cache {

/**
 * @brief Пространство ключей региона и работа с его поколением.
 *
 * Раскладка ключей:
 *   <prefix>:{<region>}:generation    счётчик поколения
 *   <prefix>:{<region>}:keys          реестр региона
 *   <prefix>:{<region>}:g<N>:<id>     элемент поколения N
 *   <prefix>:{<region>}:lock:<id>     блокировка
 *
 * Символы ':', '{', '}', '%' в имени региона кодируются как %XX, поэтому
 * ключи разных пар (регион, поколение) не пересекаются.
 */
class CacheNamespace {
public:
    CacheNamespace(std::string region,
                   std::string keyPrefix,
                   std::shared_ptr<store::IRemoteStore> store,
                   std::shared_ptr<GenerationCache> generations);

    const std::string& region() const { return region_; }

    std::string generationKey() const;
    std::string registryKey() const;
    std::string lockKey(const std::string& id) const;
    std::string itemKey(int64_t generation, const std::string& id) const;
    /// Ключ элемента для локального поколения.
    std::string itemKey(const std::string& id);

    /// Локальное поколение; инициализируется из хранилища при отсутствии.
    int64_t generation();
    std::optional<int64_t> localGeneration() const;

    /// Установить счётчик в 1, если его нет, и вернуть текущее значение.
    int64_t ensureGeneration();
    /// Прочитать счётчик; отсутствие = ensureGeneration().
    int64_t fetchGeneration();
    /// Атомарно увеличить счётчик на 1.
    int64_t advanceGeneration();

    void adopt(int64_t generation);
    void forget();

    static std::string escapeRegion(const std::string& region);

private:
    int64_t parseGeneration(const store::Bytes& raw) const;

    std::string region_;
    std::string prefix_;            // "<keyPrefix>:{<escaped region>}"
    std::shared_ptr<store::IRemoteStore> store_;
    std::shared_ptr<GenerationCache> generations_;
};

} // namespace cache
} // namespace gencache
