#include "gencache/cache/CacheProvider.hpp"
#include "gencache/core/Logging.hpp"

namespace gencache {
namespace cache {

CacheProvider::CacheProvider(std::shared_ptr<store::IRemoteStore> store, CacheOptions options)
    : store_(std::move(store))
    , options_(std::move(options)) {
    if (!store_) {
        throw ConfigError("CacheProvider requires a store");
    }
    if (!options_.validate()) {
        throw ConfigError("Invalid cache options");
    }
    generations_ = std::make_shared<GenerationCache>(options_.maxTrackedRegions);
    logging::logger()->info("Cache provider started: prefix='{}', {} configured regions",
                            options_.keyPrefix, options_.regions.size());
}

std::unique_ptr<RegionCache> CacheProvider::buildCache(const std::string& region) const {
    return std::make_unique<RegionCache>(region, store_, options_, generations_);
}

} // namespace cache
} // namespace gencache
