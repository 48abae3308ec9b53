#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include "gencache/store/RemoteStore.hpp"

namespace gencache {
namespace lock {

struct LockSettings {
    std::chrono::milliseconds lease{30000};
    std::chrono::milliseconds acquireTimeout{10000};
    std::chrono::milliseconds retryInterval{10};
    std::chrono::milliseconds maxRetryInterval{100};
};

// Удерживаемая блокировка: ключ и уникальный токен захвата
struct LockHandle {
    std::string key;
    std::string token;
    std::chrono::steady_clock::time_point acquiredAt;
    size_t attempts = 0;
};

/**
 * @brief Распределённая блокировка поверх условной записи хранилища.
 * @details Запись "set-if-absent" с TTL и случайным токеном; освобождение
 * удаляет ключ только при совпадении токена. TTL (аренда) ограничивает время,
 * на которое упавший владелец может задержать остальных.
 */
class DistributedLock {
public:
    explicit DistributedLock(std::shared_ptr<store::IRemoteStore> store);

    /**
     * @brief Блокирующий захват с экспоненциальной паузой между попытками.
     * @throws LockTimeoutError если блокировка не получена за acquireTimeout
     * @throws store::StoreError если хранилище недоступно
     */
    LockHandle acquire(const std::string& key, const LockSettings& settings);

    /// Одна попытка захвата.
    std::optional<LockHandle> tryAcquire(const std::string& key, std::chrono::milliseconds lease);

    /**
     * @brief Освободить блокировку.
     * @return false, если токен уже не совпадает (аренда истекла) или ключа нет
     */
    bool release(const LockHandle& handle);

    /// Случайный токен захвата (16 байт из RAND_bytes, hex).
    static std::string generateToken();

private:
    std::shared_ptr<store::IRemoteStore> store_;
};

} // namespace lock
} // namespace gencache
