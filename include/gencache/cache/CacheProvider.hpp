#pragma once

#include <memory>
#include <string>
#include "gencache/cache/CacheConfig.hpp"
#include "gencache/cache/GenerationCache.hpp"
#include "gencache/cache/RegionCache.hpp"
#include "gencache/store/RemoteStore.hpp"

namespace gencache {
namespace cache {

/**
 * @brief Клиент кэша: хранилище, общие параметры и кэш поколений.
 * @details Регионы одного провайдера делят кэш поколений; разные провайдеры
 * изолированы друг от друга, как разные процессы.
 */
class CacheProvider {
public:
    CacheProvider(std::shared_ptr<store::IRemoteStore> store, CacheOptions options = CacheOptions{});

    std::unique_ptr<RegionCache> buildCache(const std::string& region) const;

    const CacheOptions& options() const { return options_; }
    std::shared_ptr<store::IRemoteStore> store() const { return store_; }
    std::shared_ptr<GenerationCache> generations() const { return generations_; }

private:
    std::shared_ptr<store::IRemoteStore> store_;
    CacheOptions options_;
    std::shared_ptr<GenerationCache> generations_;
};

} // namespace cache
} // namespace gencache
