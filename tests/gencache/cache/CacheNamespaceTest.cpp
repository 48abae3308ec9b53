#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "gencache/cache/CacheNamespace.hpp"
#include "gencache/store/MemoryStore.hpp"

using namespace gencache;

void testKeyLayout() {
    auto store = std::make_shared<store::MemoryStore>();
    cache::CacheNamespace ns("region", "gencache", store, nullptr);
    assert(ns.generationKey() == "gencache:{region}:generation");
    assert(ns.registryKey() == "gencache:{region}:keys");
    assert(ns.lockKey("7") == "gencache:{region}:lock:7");
    assert(ns.itemKey(3, "7") == "gencache:{region}:g3:7");
    std::cout << "[OK] CacheNamespace key layout\n";
}

void testItemKeysNeverCollide() {
    auto store = std::make_shared<store::MemoryStore>();
    // Имена регионов с разделителями внутри
    cache::CacheNamespace a("a", "p", store, nullptr);
    cache::CacheNamespace b("a}:g1", "p", store, nullptr);
    cache::CacheNamespace c("a:g1", "p", store, nullptr);

    std::set<std::string> keys;
    for (int64_t g = 1; g <= 3; ++g) {
        keys.insert(a.itemKey(g, "x"));
        keys.insert(a.itemKey(g, "g1:x"));
        keys.insert(b.itemKey(g, "x"));
        keys.insert(c.itemKey(g, "x"));
    }
    assert(keys.size() == 12);
    assert(cache::CacheNamespace::escapeRegion("a:b{c}%") == "a%3Ab%7Bc%7D%25");
    std::cout << "[OK] CacheNamespace item keys are collision-free\n";
}

void testEnsureGenerationConcurrently() {
    auto store = std::make_shared<store::MemoryStore>();
    std::vector<int64_t> seen(16, 0);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&store, &seen, i] {
            cache::CacheNamespace ns("shared", "gencache", store, nullptr);
            seen[i] = ns.ensureGeneration();
        });
    }
    for (auto& t : threads) t.join();
    for (auto g : seen) {
        assert(g == 1);
    }
    std::cout << "[OK] CacheNamespace concurrent bootstrap\n";
}

void testFetchAndAdvance() {
    auto store = std::make_shared<store::MemoryStore>();
    auto generations = std::make_shared<cache::GenerationCache>();
    cache::CacheNamespace ns("r", "gencache", store, generations);

    assert(!ns.localGeneration());
    assert(ns.generation() == 1);
    assert(*generations->get("r") == 1);

    store->increment(ns.generationKey(), 4);
    assert(ns.generation() == 1);          // локальное значение пока старое
    assert(ns.fetchGeneration() == 5);
    assert(ns.generation() == 5);

    assert(ns.advanceGeneration() == 6);
    assert(*ns.localGeneration() == 6);
    assert(ns.itemKey("id") == "gencache:{r}:g6:id");

    // Внешний сброс хранилища: поколение начинается заново с 1
    store->flushAll();
    assert(ns.fetchGeneration() == 1);
    assert(*ns.localGeneration() == 1);

    ns.forget();
    assert(!ns.localGeneration());
    std::cout << "[OK] CacheNamespace fetch/advance/reset\n";
}

void testCorruptGeneration() {
    auto store = std::make_shared<store::MemoryStore>();
    cache::CacheNamespace ns("r", "gencache", store, nullptr);
    store->set(ns.generationKey(), store::toBytes("garbage"), store::Ttl::zero());
    bool thrown = false;
    try {
        ns.fetchGeneration();
    } catch (const store::StoreError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] CacheNamespace corrupt generation\n";
}

void testGenerationCacheEviction() {
    cache::GenerationCache generations(2);
    generations.set("a", 1);
    generations.set("b", 2);
    assert(generations.get("a")); // "a" становится самым свежим
    generations.set("c", 3);
    assert(generations.size() == 2);
    assert(!generations.get("b"));
    assert(*generations.get("a") == 1);
    assert(*generations.get("c") == 3);
    std::cout << "[OK] GenerationCache LRU eviction\n";
}

int main() {
    testKeyLayout();
    testItemKeysNeverCollide();
    testEnsureGenerationConcurrently();
    testFetchAndAdvance();
    testCorruptGeneration();
    testGenerationCacheEviction();
    std::cout << "All CacheNamespace tests passed!\n";
    return 0;
}
