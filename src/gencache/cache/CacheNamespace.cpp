#include "gencache/cache/CacheNamespace.hpp"
#include <charconv>
#include <cstdio>
#include "gencache/core/Logging.hpp"

namespace gencache {
namespace cache {

CacheNamespace::CacheNamespace(std::string region,
                               std::string keyPrefix,
                               std::shared_ptr<store::IRemoteStore> store,
                               std::shared_ptr<GenerationCache> generations)
    : region_(std::move(region))
    , prefix_(keyPrefix + ":{" + escapeRegion(region_) + "}")
    , store_(std::move(store))
    , generations_(std::move(generations)) {
    if (!store_) {
        throw ConfigError("CacheNamespace requires a store");
    }
    if (!generations_) {
        generations_ = std::make_shared<GenerationCache>();
    }
}

std::string CacheNamespace::escapeRegion(const std::string& region) {
    std::string escaped;
    escaped.reserve(region.size());
    for (char c : region) {
        if (c == ':' || c == '{' || c == '}' || c == '%') {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", static_cast<unsigned char>(c));
            escaped += buf;
        } else {
            escaped += c;
        }
    }
    return escaped;
}

std::string CacheNamespace::generationKey() const {
    return prefix_ + ":generation";
}

std::string CacheNamespace::registryKey() const {
    return prefix_ + ":keys";
}

std::string CacheNamespace::lockKey(const std::string& id) const {
    return prefix_ + ":lock:" + id;
}

std::string CacheNamespace::itemKey(int64_t generation, const std::string& id) const {
    return prefix_ + ":g" + std::to_string(generation) + ":" + id;
}

std::string CacheNamespace::itemKey(const std::string& id) {
    return itemKey(generation(), id);
}

int64_t CacheNamespace::generation() {
    if (auto local = generations_->get(region_)) {
        return *local;
    }
    return ensureGeneration();
}

std::optional<int64_t> CacheNamespace::localGeneration() const {
    return generations_->get(region_);
}

int64_t CacheNamespace::parseGeneration(const store::Bytes& raw) const {
    int64_t value = 0;
    auto text = store::toString(raw);
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 1) {
        throw store::StoreError("Corrupt generation '" + text + "' for region '" + region_ + "'");
    }
    return value;
}

int64_t CacheNamespace::ensureGeneration() {
    auto key = generationKey();
    bool created = store_->setIfAbsent(key, store::toBytes("1"), store::Ttl::zero());
    if (created) {
        logging::logger()->debug("Region '{}': generation bootstrapped to 1", region_);
    }

    auto raw = store_->get(key);
    if (!raw) {
        throw store::StoreError("Generation key for region '" + region_ + "' vanished during bootstrap");
    }
    auto value = parseGeneration(*raw);
    adopt(value);
    return value;
}

int64_t CacheNamespace::fetchGeneration() {
    auto raw = store_->get(generationKey());
    if (!raw) {
        // Хранилище очищено извне: начинаем заново с 1
        if (auto local = localGeneration()) {
            logging::logger()->warn("Region '{}': generation key missing (local {}), re-bootstrapping",
                                    region_, *local);
        }
        return ensureGeneration();
    }
    auto value = parseGeneration(*raw);
    adopt(value);
    return value;
}

int64_t CacheNamespace::advanceGeneration() {
    auto value = store_->increment(generationKey(), 1);
    adopt(value);
    logging::logger()->debug("Region '{}': generation advanced to {}", region_, value);
    return value;
}

void CacheNamespace::adopt(int64_t generation) {
    generations_->set(region_, generation);
}

void CacheNamespace::forget() {
    generations_->erase(region_);
}

} // namespace cache
} // namespace gencache
