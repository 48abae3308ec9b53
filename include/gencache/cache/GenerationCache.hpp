#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace gencache {
namespace cache {

/**
 * @brief Локальный (на клиента) кэш последних увиденных поколений регионов.
 * @details Ограниченный LRU по имени региона. Значения носят рекомендательный
 * характер и всегда перепроверяются по хранилищу.
 */
class GenerationCache {
public:
    explicit GenerationCache(size_t maxRegions = 1024);

    std::optional<int64_t> get(const std::string& region);
    void set(const std::string& region, int64_t generation);
    void erase(const std::string& region);

    size_t size() const;
    size_t maxRegions() const { return maxRegions_; }

private:
    void touch(std::unordered_map<std::string, std::pair<std::list<std::string>::iterator, int64_t>>::iterator it);

    size_t maxRegions_;
    std::unordered_map<std::string, std::pair<std::list<std::string>::iterator, int64_t>> generations_;
    std::list<std::string> lruList_;
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace gencache
