#include "gencache/cache/RegionCache.hpp"
#include <atomic>
#include <mutex>
#include <unordered_map>
#include "gencache/cache/GenerationSynchronizer.hpp"
#include "gencache/core/Logging.hpp"
#include "gencache/lock/DistributedLock.hpp"

namespace gencache {
namespace cache {

// Реализация PIMPL
struct RegionCache::Impl {
    std::string region;
    std::shared_ptr<store::IRemoteStore> store;
    CacheOptions options;
    RegionConfig config;
    CacheNamespace ns;
    GenerationSynchronizer synchronizer;
    lock::DistributedLock distributedLock;
    lock::LockSettings lockSettings;

    // Токены блокировок, захваченных через этот экземпляр
    std::unordered_map<std::string, lock::LockHandle> heldLocks;
    std::mutex locksMutex;

    std::atomic<size_t> hitCount{0};
    std::atomic<size_t> missCount{0};
    std::atomic<size_t> putCount{0};
    std::atomic<size_t> removeCount{0};
    std::atomic<size_t> clearCount{0};
    std::atomic<size_t> generationRetries{0};
    std::atomic<size_t> storeFailures{0};
    std::atomic<size_t> lockAcquisitions{0};
    std::atomic<size_t> lockFailures{0};

    Impl(std::string regionName,
         std::shared_ptr<store::IRemoteStore> remote,
         CacheOptions opts,
         std::shared_ptr<GenerationCache> generations)
        : region(std::move(regionName))
        , store(std::move(remote))
        , options(std::move(opts))
        , config(options.regionConfig(region))
        , ns(region, options.keyPrefix, store,
             generations ? std::move(generations) : std::make_shared<GenerationCache>(options.maxTrackedRegions))
        , synchronizer(config.maxGenerationRetries)
        , distributedLock(store) {
        lockSettings.lease = config.lockLease;
        lockSettings.acquireTimeout = config.lockAcquireTimeout;
        lockSettings.retryInterval = config.lockRetryInterval;
        lockSettings.maxRetryInterval = config.lockMaxRetryInterval;
    }
};

RegionCache::RegionCache(std::string region,
                         std::shared_ptr<store::IRemoteStore> store,
                         CacheOptions options,
                         std::shared_ptr<GenerationCache> generations) {
    if (region.empty()) {
        throw ConfigError("Region name must not be empty");
    }
    if (!options.validate()) {
        throw ConfigError("Invalid cache options for region '" + region + "'");
    }
    pImpl = std::make_unique<Impl>(std::move(region), std::move(store), std::move(options), std::move(generations));

    // Первое обращение к региону создаёт счётчик поколения
    try {
        auto generation = pImpl->ns.ensureGeneration();
        logging::logger()->debug("Region '{}' opened at generation {}", pImpl->region, generation);
    } catch (const store::StoreError& e) {
        reportFailure("open", e);
    }
}

RegionCache::~RegionCache() = default;

void RegionCache::reportFailure(const char* operation, const std::exception& e) {
    ++pImpl->storeFailures;
    const char* cause = dynamic_cast<const GenerationRetryError*>(&e) != nullptr
        ? "generation kept changing"
        : "cache backend unavailable";
    logging::logger()->warn("Region '{}': {} skipped, {}: {}", pImpl->region, operation, cause, e.what());
    if (pImpl->options.onException) {
        pImpl->options.onException(CacheErrorEvent{pImpl->region, operation, e.what()});
    }
}

void RegionCache::put(const std::string& id, const nlohmann::json& value) {
    auto data = pImpl->options.serializer->serialize(value);
    auto ttl = std::chrono::duration_cast<store::Ttl>(pImpl->config.expiration);
    auto registryKey = pImpl->ns.registryKey();
    size_t retries = 0;

    try {
        pImpl->synchronizer.run(pImpl->ns, id, [&](const std::string& key, int64_t generation) {
            pImpl->store->set(key, data, ttl);
            pImpl->store->set(registryKey, store::toBytes(std::to_string(generation)), ttl);
            return true;
        }, &retries);
        ++pImpl->putCount;
    } catch (const store::StoreError& e) {
        reportFailure("put", e);
    } catch (const GenerationRetryError& e) {
        reportFailure("put", e);
    }
    pImpl->generationRetries += retries;
}

std::optional<nlohmann::json> RegionCache::get(const std::string& id) {
    std::optional<store::Bytes> data;
    size_t retries = 0;

    try {
        data = pImpl->synchronizer.run(pImpl->ns, id, [&](const std::string& key, int64_t) {
            return pImpl->store->get(key);
        }, &retries);
    } catch (const store::StoreError& e) {
        reportFailure("get", e);
    } catch (const GenerationRetryError& e) {
        reportFailure("get", e);
    }
    pImpl->generationRetries += retries;

    if (!data) {
        ++pImpl->missCount;
        return std::nullopt;
    }
    ++pImpl->hitCount;
    return pImpl->options.serializer->deserialize(*data);
}

void RegionCache::remove(const std::string& id) {
    size_t retries = 0;

    try {
        pImpl->synchronizer.run(pImpl->ns, id, [&](const std::string& key, int64_t) {
            pImpl->store->remove(key);
            return true;
        }, &retries);
        ++pImpl->removeCount;
    } catch (const store::StoreError& e) {
        reportFailure("remove", e);
    } catch (const GenerationRetryError& e) {
        reportFailure("remove", e);
    }
    pImpl->generationRetries += retries;
}

void RegionCache::clear() {
    try {
        // Старые элементы становятся недостижимыми и истекают по своему TTL
        auto generation = pImpl->ns.advanceGeneration();
        pImpl->store->remove(pImpl->ns.registryKey());
        ++pImpl->clearCount;
        logging::logger()->info("Region '{}' cleared, now at generation {}", pImpl->region, generation);
    } catch (const store::StoreError& e) {
        reportFailure("clear", e);
    }
}

bool RegionCache::lock(const std::string& id) {
    auto key = pImpl->ns.lockKey(id);
    std::string reason;

    try {
        auto handle = pImpl->distributedLock.acquire(key, pImpl->lockSettings);
        {
            std::lock_guard<std::mutex> guard(pImpl->locksMutex);
            pImpl->heldLocks[id] = std::move(handle);
        }
        ++pImpl->lockAcquisitions;
        return true;
    } catch (const lock::LockError& e) {
        logging::logger()->warn("Region '{}': lock on '{}' failed: {}", pImpl->region, id, e.what());
        reason = e.what();
    } catch (const store::StoreError& e) {
        reportFailure("lock", e);
        reason = e.what();
    }

    ++pImpl->lockFailures;
    if (pImpl->options.onLockFailed) {
        pImpl->options.onLockFailed(pImpl->region, id, reason);
    }
    return false;
}

void RegionCache::unlock(const std::string& id) {
    std::optional<lock::LockHandle> handle;
    {
        std::lock_guard<std::mutex> guard(pImpl->locksMutex);
        auto it = pImpl->heldLocks.find(id);
        if (it != pImpl->heldLocks.end()) {
            handle = std::move(it->second);
            pImpl->heldLocks.erase(it);
        }
    }

    if (!handle) {
        logging::logger()->debug("Region '{}': unlock of '{}' ignored, lock not held", pImpl->region, id);
        return;
    }

    try {
        if (!pImpl->distributedLock.release(*handle) && pImpl->options.onUnlockFailed) {
            pImpl->options.onUnlockFailed(pImpl->region, id);
        }
    } catch (const store::StoreError& e) {
        reportFailure("unlock", e);
    }
}

void RegionCache::destroy() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> guard(pImpl->locksMutex);
        dropped = pImpl->heldLocks.size();
        pImpl->heldLocks.clear();
    }
    pImpl->ns.forget();
    logging::logger()->debug("Region '{}' destroyed locally ({} lock tokens dropped)", pImpl->region, dropped);
}

const std::string& RegionCache::regionName() const {
    return pImpl->region;
}

const RegionConfig& RegionCache::regionConfig() const {
    return pImpl->config;
}

CacheNamespace& RegionCache::cacheNamespace() {
    return pImpl->ns;
}

CacheMetrics RegionCache::getMetrics() const {
    CacheMetrics metrics;
    metrics.hitCount = pImpl->hitCount;
    metrics.missCount = pImpl->missCount;
    metrics.putCount = pImpl->putCount;
    metrics.removeCount = pImpl->removeCount;
    metrics.clearCount = pImpl->clearCount;
    metrics.generationRetries = pImpl->generationRetries;
    metrics.storeFailures = pImpl->storeFailures;
    metrics.lockAcquisitions = pImpl->lockAcquisitions;
    metrics.lockFailures = pImpl->lockFailures;
    metrics.lastUpdate = std::chrono::steady_clock::now();
    return metrics;
}

} // namespace cache
} // namespace gencache
