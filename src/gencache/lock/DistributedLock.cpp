#include "gencache/lock/DistributedLock.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>
#include <openssl/rand.h>
#include "gencache/core/Errors.hpp"
#include "gencache/core/Logging.hpp"

namespace gencache {
namespace lock {

namespace {

constexpr int kTokenBytes = 16;

// Срок ожидания с насыщением вместо переполнения time_point
std::chrono::steady_clock::time_point deadlineAfter(std::chrono::steady_clock::time_point start,
                                                    std::chrono::milliseconds timeout) {
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::time_point::max() - start);
    if (timeout >= headroom) {
        return std::chrono::steady_clock::time_point::max();
    }
    return start + timeout;
}

std::chrono::milliseconds jittered(std::chrono::milliseconds interval) {
    thread_local std::mt19937 rng{std::random_device{}()};
    // Разброс до половины интервала, чтобы конкуренты не просыпались разом
    std::uniform_int_distribution<int64_t> dist(0, std::max<int64_t>(interval.count() / 2, 0));
    return interval + std::chrono::milliseconds(dist(rng));
}

} // namespace

DistributedLock::DistributedLock(std::shared_ptr<store::IRemoteStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw ConfigError("DistributedLock requires a store");
    }
}

std::string DistributedLock::generateToken() {
    unsigned char raw[kTokenBytes];
    if (RAND_bytes(raw, kTokenBytes) != 1) {
        throw LockError("Failed to generate lock token");
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < kTokenBytes; ++i) {
        ss << std::setw(2) << static_cast<int>(raw[i]);
    }
    return ss.str();
}

std::optional<LockHandle> DistributedLock::tryAcquire(const std::string& key, std::chrono::milliseconds lease) {
    LockHandle handle;
    handle.key = key;
    handle.token = generateToken();
    handle.attempts = 1;
    if (!store_->setIfAbsent(key, store::toBytes(handle.token), lease)) {
        return std::nullopt;
    }
    handle.acquiredAt = std::chrono::steady_clock::now();
    return handle;
}

LockHandle DistributedLock::acquire(const std::string& key, const LockSettings& settings) {
    auto start = std::chrono::steady_clock::now();
    auto deadline = deadlineAfter(start, settings.acquireTimeout);
    auto interval = settings.retryInterval;

    LockHandle handle;
    handle.key = key;
    handle.token = generateToken();
    auto value = store::toBytes(handle.token);

    while (true) {
        ++handle.attempts;
        if (store_->setIfAbsent(key, value, settings.lease)) {
            handle.acquiredAt = std::chrono::steady_clock::now();
            if (handle.attempts > 1) {
                logging::logger()->debug("Lock '{}' acquired after {} attempts in {}ms", key, handle.attempts,
                    std::chrono::duration_cast<std::chrono::milliseconds>(handle.acquiredAt - start).count());
            }
            return handle;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw LockTimeoutError("Timed out after " + std::to_string(settings.acquireTimeout.count()) +
                                   "ms waiting for lock '" + key + "'");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(jittered(interval), remaining));
        interval = interval > settings.maxRetryInterval / 2 ? settings.maxRetryInterval : interval * 2;
    }
}

bool DistributedLock::release(const LockHandle& handle) {
    bool released = store_->removeIfEquals(handle.key, store::toBytes(handle.token));
    if (!released) {
        logging::logger()->warn("Lock '{}' was not held by token {} (lease expired?)", handle.key, handle.token);
    }
    return released;
}

} // namespace lock
} // namespace gencache
