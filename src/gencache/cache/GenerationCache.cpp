#include "gencache/cache/GenerationCache.hpp"
#include "gencache/core/Errors.hpp"
#include "gencache/core/Logging.hpp"

namespace gencache {
namespace cache {

GenerationCache::GenerationCache(size_t maxRegions) : maxRegions_(maxRegions) {
    if (maxRegions_ == 0) {
        throw ConfigError("GenerationCache requires at least one region slot");
    }
}

void GenerationCache::touch(std::unordered_map<std::string, std::pair<std::list<std::string>::iterator, int64_t>>::iterator it) {
    lruList_.splice(lruList_.begin(), lruList_, it->second.first);
}

std::optional<int64_t> GenerationCache::get(const std::string& region) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = generations_.find(region);
    if (it == generations_.end()) {
        return std::nullopt;
    }
    touch(it);
    return it->second.second;
}

void GenerationCache::set(const std::string& region, int64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = generations_.find(region);
    if (it != generations_.end()) {
        it->second.second = generation;
        touch(it);
        return;
    }

    // Вытесняем самый давний регион
    if (generations_.size() >= maxRegions_) {
        const std::string& victim = lruList_.back();
        logging::logger()->debug("GenerationCache: evicting region '{}'", victim);
        generations_.erase(victim);
        lruList_.pop_back();
    }

    lruList_.push_front(region);
    generations_.emplace(region, std::make_pair(lruList_.begin(), generation));
}

void GenerationCache::erase(const std::string& region) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = generations_.find(region);
    if (it == generations_.end()) {
        return;
    }
    lruList_.erase(it->second.first);
    generations_.erase(it);
}

size_t GenerationCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generations_.size();
}

} // namespace cache
} // namespace gencache
