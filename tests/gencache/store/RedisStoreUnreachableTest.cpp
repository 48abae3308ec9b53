#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include "gencache/cache/RegionCache.hpp"
#include "gencache/store/RedisStore.hpp"

using namespace gencache;

// Порт, на котором заведомо никто не слушает
std::shared_ptr<store::RedisStore> unreachableStore() {
    store::RedisConfig config;
    config.host = "127.0.0.1";
    config.port = 1;
    config.connectTimeout = std::chrono::milliseconds(200);
    config.commandTimeout = std::chrono::milliseconds(200);
    return std::make_shared<store::RedisStore>(config);
}

void testAdapterReportsStoreError() {
    auto redis = unreachableStore();
    assert(!redis->isConnected());
    bool thrown = false;
    try {
        redis->get("key");
    } catch (const store::StoreError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] RedisStore reports connection failures\n";
}

void testPutAndGetSilentlyContinue() {
    cache::RegionCache cache("region_A", unreachableStore());
    cache.put("1", {{"Name", "A"}, {"Age", 1}});
    assert(!cache.get("1"));
    std::cout << "[OK] put/get continue without Redis\n";
}

void testLockUnlockRemoveSilentlyContinue() {
    cache::RegionCache cache("region_A", unreachableStore());
    cache.put("1", {{"Name", "A"}, {"Age", 1}});
    assert(!cache.lock("1"));
    cache.unlock("1");
    cache.remove("1");
    cache.clear();
    assert(cache.getMetrics().storeFailures >= 4);
    std::cout << "[OK] lock/unlock/remove continue without Redis\n";
}

void testInvalidConfigRejected() {
    store::RedisConfig config;
    config.port = 0;
    bool thrown = false;
    try {
        store::RedisStore redis(config);
    } catch (const ConfigError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] RedisStore rejects invalid configuration\n";
}

int main() {
    testAdapterReportsStoreError();
    testPutAndGetSilentlyContinue();
    testLockUnlockRemoveSilentlyContinue();
    testInvalidConfigRejected();
    std::cout << "All RedisStore tests passed!\n";
    return 0;
}
