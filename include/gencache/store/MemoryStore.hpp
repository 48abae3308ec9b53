#pragma once

#include <chrono>
#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "gencache/store/RemoteStore.hpp"

namespace gencache {
namespace store {

/**
 * @brief Хранилище в памяти процесса с TTL на каждый ключ.
 * @details Потокобезопасно. Просроченные ключи удаляются при обращении к ним,
 * а остальные периодической очисткой при записи не чаще cleanupInterval.
 * Используется как однохостовый бэкенд и в тестах.
 */
class MemoryStore : public IRemoteStore {
public:
    using Clock = std::chrono::steady_clock;

    explicit MemoryStore(Clock::duration cleanupInterval = std::chrono::seconds(1));
    ~MemoryStore() override = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::optional<Bytes> get(const std::string& key) override;
    void set(const std::string& key, const Bytes& value, Ttl ttl) override;
    bool setIfAbsent(const std::string& key, const Bytes& value, Ttl ttl) override;
    void remove(const std::string& key) override;
    bool removeIfEquals(const std::string& key, const Bytes& expected) override;
    int64_t increment(const std::string& key, int64_t delta) override;
    std::optional<Ttl> ttl(const std::string& key) override;

    // Административная очистка (аналог FLUSHDB)
    void flushAll();

    // Количество живых ключей
    size_t size() const;
    // Количество записей в памяти, включая ещё не удалённые просроченные
    size_t entryCount() const;

    // Удаляет все просроченные записи, возвращает их количество
    size_t removeExpired();

private:
    struct Entry {
        Bytes value;
        Clock::time_point expiresAt;
        bool hasExpiry;
    };

    static bool isExpired(const Entry& entry, Clock::time_point now);
    static Entry makeEntry(const Bytes& value, Ttl ttl, Clock::time_point now);
    // Вызывается под эксклюзивной блокировкой
    Entry* findLive(const std::string& key, Clock::time_point now);
    size_t removeExpiredLocked(Clock::time_point now);
    void cleanupIfDue(Clock::time_point now);

    std::unordered_map<std::string, Entry> entries_;
    Clock::duration cleanupInterval_;
    Clock::time_point lastCleanup_;
    mutable std::shared_mutex mutex_;
};

} // namespace store
} // namespace gencache
