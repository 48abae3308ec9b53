#include "gencache/store/MemoryStore.hpp"
#include <algorithm>
#include <charconv>
#include <limits>
#include <mutex>
#include "gencache/core/Logging.hpp"

namespace gencache {
namespace store {

MemoryStore::MemoryStore(Clock::duration cleanupInterval)
    : cleanupInterval_(cleanupInterval)
    , lastCleanup_(Clock::now()) {
}

bool MemoryStore::isExpired(const Entry& entry, Clock::time_point now) {
    return entry.hasExpiry && now >= entry.expiresAt;
}

MemoryStore::Entry MemoryStore::makeEntry(const Bytes& value, Ttl ttl, Clock::time_point now) {
    Entry entry{value, Clock::time_point{}, false};
    if (ttl.count() > 0) {
        entry.expiresAt = now + ttl;
        entry.hasExpiry = true;
    }
    return entry;
}

MemoryStore::Entry* MemoryStore::findLive(const std::string& key, Clock::time_point now) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (isExpired(it->second, now)) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

size_t MemoryStore::removeExpiredLocked(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (isExpired(it->second, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    lastCleanup_ = now;
    return removed;
}

// Ключи старых поколений больше не читаются, поэтому одной ленивой очистки мало
void MemoryStore::cleanupIfDue(Clock::time_point now) {
    if (now - lastCleanup_ < cleanupInterval_) {
        return;
    }
    auto removed = removeExpiredLocked(now);
    if (removed > 0) {
        logging::logger()->debug("MemoryStore cleanup: {} expired keys removed", removed);
    }
}

std::optional<Bytes> MemoryStore::get(const std::string& key) {
    auto now = Clock::now();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (!isExpired(it->second, now)) {
            return it->second.value;
        }
    }
    // Ключ просрочен: удаляем под эксклюзивной блокировкой
    std::unique_lock<std::shared_mutex> lock(mutex_);
    findLive(key, now);
    return std::nullopt;
}

void MemoryStore::set(const std::string& key, const Bytes& value, Ttl ttl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto now = Clock::now();
    cleanupIfDue(now);
    entries_[key] = makeEntry(value, ttl, now);
}

bool MemoryStore::setIfAbsent(const std::string& key, const Bytes& value, Ttl ttl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto now = Clock::now();
    cleanupIfDue(now);
    if (findLive(key, now)) {
        return false;
    }
    entries_[key] = makeEntry(value, ttl, now);
    return true;
}

void MemoryStore::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(key);
}

bool MemoryStore::removeIfEquals(const std::string& key, const Bytes& expected) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto* entry = findLive(key, Clock::now());
    if (!entry || entry->value != expected) {
        return false;
    }
    entries_.erase(key);
    return true;
}

int64_t MemoryStore::increment(const std::string& key, int64_t delta) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto now = Clock::now();
    auto* entry = findLive(key, now);
    if (!entry) {
        entries_[key] = makeEntry(toBytes(std::to_string(delta)), Ttl::zero(), now);
        return delta;
    }

    int64_t current = 0;
    auto text = toString(entry->value);
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), current);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw StoreError("Value at '" + key + "' is not an integer");
    }

    if ((delta > 0 && current > std::numeric_limits<int64_t>::max() - delta) ||
        (delta < 0 && current < std::numeric_limits<int64_t>::min() - delta)) {
        throw StoreError("Increment of '" + key + "' would overflow");
    }

    // TTL сохраняется, как у INCRBY
    current += delta;
    entry->value = toBytes(std::to_string(current));
    return current;
}

std::optional<Ttl> MemoryStore::ttl(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto now = Clock::now();
    auto* entry = findLive(key, now);
    if (!entry || !entry->hasExpiry) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<Ttl>(entry->expiresAt - now);
}

void MemoryStore::flushAll() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto removed = entries_.size();
    entries_.clear();
    logging::logger()->debug("MemoryStore flushed: {} keys removed", removed);
}

size_t MemoryStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto now = Clock::now();
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [now](const auto& item) { return !isExpired(item.second, now); }));
}

size_t MemoryStore::entryCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

size_t MemoryStore::removeExpired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return removeExpiredLocked(Clock::now());
}

} // namespace store
} // namespace gencache
