#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "gencache/core/Errors.hpp"

namespace gencache {
namespace store {

using Bytes = std::vector<uint8_t>;
using Ttl = std::chrono::milliseconds;

/**
 * @brief Адаптер удалённого key/value хранилища.
 * @details Все операции атомарны на одном ключе. При недоступности
 * хранилища любая операция бросает StoreError.
 */
class IRemoteStore {
public:
    virtual ~IRemoteStore() = default;

    /// Значение по ключу или пусто.
    virtual std::optional<Bytes> get(const std::string& key) = 0;
    /// Перезаписать значение и TTL (0 = бессрочно).
    virtual void set(const std::string& key, const Bytes& value, Ttl ttl) = 0;
    /// Записать, только если ключа нет. true, если ключ создан этим вызовом.
    virtual bool setIfAbsent(const std::string& key, const Bytes& value, Ttl ttl) = 0;
    /// Удалить ключ, если он есть.
    virtual void remove(const std::string& key) = 0;
    /// Удалить ключ, только если его значение равно expected.
    virtual bool removeIfEquals(const std::string& key, const Bytes& expected) = 0;
    /// Атомарный инкремент; отсутствующий ключ создаётся со значением delta.
    virtual int64_t increment(const std::string& key, int64_t delta) = 0;
    /// Оставшееся время жизни; пусто, если ключа нет или он бессрочный.
    virtual std::optional<Ttl> ttl(const std::string& key) = 0;
};

// Вспомогательные преобразования для строковых значений
inline Bytes toBytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

inline std::string toString(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

} // namespace store
} // namespace gencache
