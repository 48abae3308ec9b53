#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <thread>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>
#include "gencache/cache/CacheProvider.hpp"
#include "gencache/cache/RegionCache.hpp"
#include "gencache/core/Logging.hpp"
#include "gencache/store/MemoryStore.hpp"

using namespace gencache;
using std::chrono::minutes;

struct Person {
    std::string name;
    int age = 0;
};

void to_json(nlohmann::json& j, const Person& p) {
    j = nlohmann::json{{"Name", p.name}, {"Age", p.age}};
}

void from_json(const nlohmann::json& j, Person& p) {
    j.at("Name").get_to(p.name);
    j.at("Age").get_to(p.age);
}

// Хранилище, которое всегда недоступно
class UnreachableStore : public store::IRemoteStore {
public:
    std::optional<store::Bytes> get(const std::string&) override { fail(); return std::nullopt; }
    void set(const std::string&, const store::Bytes&, store::Ttl) override { fail(); }
    bool setIfAbsent(const std::string&, const store::Bytes&, store::Ttl) override { fail(); return false; }
    void remove(const std::string&) override { fail(); }
    bool removeIfEquals(const std::string&, const store::Bytes&) override { fail(); return false; }
    int64_t increment(const std::string&, int64_t) override { fail(); return 0; }
    std::optional<store::Ttl> ttl(const std::string&) override { fail(); return std::nullopt; }

private:
    static void fail() { throw store::StoreError("Connection refused"); }
};

// Имитирует непрерывные очистки другими клиентами
class ClearStormStore : public store::MemoryStore {
public:
    std::optional<store::Bytes> get(const std::string& key) override {
        if (key.size() > 11 && key.compare(key.size() - 11, 11, ":generation") == 0) {
            MemoryStore::increment(key, 1);
        }
        return MemoryStore::get(key);
    }
};

std::shared_ptr<store::MemoryStore> newStore() {
    return std::make_shared<store::MemoryStore>();
}

Person readPerson(store::IRemoteStore& store, const cache::CacheOptions& options, const std::string& key) {
    auto raw = store.get(key);
    assert(raw);
    return options.serializer->deserialize(*raw).get<Person>();
}

void testConstructorSetsGeneration() {
    auto store = newStore();
    cache::RegionCache cache("regionName", store);
    auto genKey = cache.cacheNamespace().generationKey();
    assert(genKey.find("gencache:{regionName}") != std::string::npos);
    assert(cache.cacheNamespace().generation() == 1);
    std::cout << "[OK] constructor bootstraps generation\n";
}

void testConstructorReusesExistingGeneration() {
    auto store = newStore();
    cache::CacheProvider client1(store);
    cache::CacheProvider client2(store);
    auto cache1 = client1.buildCache("regionName");
    auto cache2 = client2.buildCache("regionName");
    assert(cache1->cacheNamespace().generation() == 1);
    assert(cache2->cacheNamespace().generation() == 1);
    std::cout << "[OK] distributed clients share generation\n";
}

void testPutSerializesWithExpiry() {
    auto store = newStore();
    cache::CacheOptions options;
    cache::RegionCache cache("region", store, options);

    cache.putObject("999", Person{"Foo", 10});

    auto key = cache.cacheNamespace().itemKey("999");
    auto ttl = store->ttl(key);
    assert(ttl && *ttl > minutes(4) && *ttl <= minutes(5));

    auto person = readPerson(*store, options, key);
    assert(person.name == "Foo");
    assert(person.age == 10);
    std::cout << "[OK] put serializes with expiry\n";
}

void testConfiguredRegionExpiration() {
    auto store = newStore();
    cache::CacheOptions options;
    cache::RegionConfig config;
    config.expiration = minutes(99);
    options.regions["region"] = config;
    cache::RegionCache cache("region", store, options);

    cache.putObject("999", Person{"Foo", 10});

    auto ttl = store->ttl(cache.cacheNamespace().itemKey("999"));
    assert(ttl && *ttl > minutes(98) && *ttl <= minutes(99));
    std::cout << "[OK] region expiration from configuration\n";
}

void testPutRetriesUntilGenerationMatches() {
    auto store = newStore();
    cache::CacheOptions options;
    cache::RegionCache cache("region", store, options);

    // Другой клиент увеличил поколение
    store->increment(cache.cacheNamespace().generationKey(), 100);

    cache.putObject("999", Person{"Foo", 10});

    assert(cache.cacheNamespace().generation() == 101);
    auto person = readPerson(*store, options, cache.cacheNamespace().itemKey("999"));
    assert(person.name == "Foo");
    assert(person.age == 10);
    assert(cache.getMetrics().generationRetries == 1);
    std::cout << "[OK] put follows generation advance\n";
}

void testGetDeserializes() {
    auto store = newStore();
    cache::RegionCache cache("region", store);
    cache.putObject("999", Person{"Foo", 10});

    auto person = cache.getObject<Person>("999");
    assert(person);
    assert(person->name == "Foo");
    assert(person->age == 10);
    std::cout << "[OK] get deserializes\n";
}

void testGetMissing() {
    auto store = newStore();
    cache::RegionCache cache("region", store);
    assert(!cache.get("99999"));
    assert(cache.getMetrics().missCount == 1);
    std::cout << "[OK] get returns nothing for unknown id\n";
}

void testGetRetriesUntilGenerationMatches() {
    auto store = newStore();
    cache::CacheProvider client1(store);
    cache::CacheProvider client2(store);
    auto cache1 = client1.buildCache("region");

    store->increment(cache1->cacheNamespace().generationKey(), 100);
    auto cache2 = client2.buildCache("region");
    cache2->putObject("999", Person{"Foo", 10});

    auto person = cache1->getObject<Person>("999");
    assert(cache1->cacheNamespace().generation() == 101);
    assert(person);
    assert(person->name == "Foo");
    assert(person->age == 10);
    std::cout << "[OK] get follows generation advance\n";
}

void testDifferentRegions() {
    auto store = newStore();
    cache::RegionCache cacheA("region_A", store);
    cache::RegionCache cacheB("region_B", store);

    cacheA.putObject("1", Person{"A", 1});
    cacheB.putObject("1", Person{"B", 1});

    assert(cacheA.getObject<Person>("1")->name == "A");
    assert(cacheB.getObject<Person>("1")->name == "B");
    std::cout << "[OK] regions are isolated\n";
}

void testRemove() {
    auto store = newStore();
    cache::RegionCache cache("region", store);
    cache.putObject("999", Person{"Foo", 10});

    cache.remove("999");

    assert(!store->get(cache.cacheNamespace().itemKey("999")));
    assert(!cache.get("999"));
    std::cout << "[OK] remove\n";
}

void testRemoveRetriesUntilGenerationMatches() {
    auto store = newStore();
    cache::CacheProvider client1(store);
    cache::CacheProvider client2(store);
    auto cache1 = client1.buildCache("region");

    store->increment(cache1->cacheNamespace().generationKey(), 100);
    auto cache2 = client2.buildCache("region");
    cache2->putObject("999", Person{"Foo", 10});

    cache1->remove("999");

    assert(cache1->cacheNamespace().generation() == 101);
    assert(!store->get(cache1->cacheNamespace().itemKey("999")));
    std::cout << "[OK] remove follows generation advance\n";
}

void testClear() {
    auto store = newStore();
    cache::RegionCache cache("region", store);
    cache.putObject("1", Person{"Foo", 1});
    cache.putObject("2", Person{"Bar", 2});
    cache.putObject("3", Person{"Baz", 3});
    auto& ns = cache.cacheNamespace();
    std::vector<std::string> oldKeys = {ns.itemKey("1"), ns.itemKey("2"), ns.itemKey("3")};
    auto registryKey = ns.registryKey();
    assert(store->get(registryKey));

    cache.clear();

    assert(ns.generation() == 2);
    assert(!store->get(ns.itemKey("1")));
    assert(!store->get(ns.itemKey("2")));
    assert(!store->get(ns.itemKey("3")));
    assert(!cache.get("1"));
    assert(!store->get(registryKey));

    // Старые значения истекут сами
    for (const auto& key : oldKeys) {
        assert(store->get(key));
        auto ttl = store->ttl(key);
        assert(ttl && *ttl <= minutes(5));
    }
    std::cout << "[OK] clear advances generation\n";
}

void testClearAfterForeignAdvance() {
    auto store = newStore();
    cache::RegionCache cache("region", store);

    store->increment(cache.cacheNamespace().generationKey(), 100);

    cache.clear();

    assert(cache.cacheNamespace().generation() == 102);
    std::cout << "[OK] clear after foreign advance\n";
}

void testDestroyDoesNotClear() {
    auto store = newStore();
    cache::RegionCache cache("region", store);
    cache.putObject("1", Person{"Foo", 1});

    cache.destroy();

    assert(cache.cacheNamespace().generation() == 1);
    assert(cache.getObject<Person>("1")->name == "Foo");
    std::cout << "[OK] destroy keeps store untouched\n";
}

void testServerGenerationRestoredAfterFlush() {
    auto store = newStore();
    cache::RegionCache cache("region", store);
    cache.putObject("1", Person{"A", 1});
    cache.clear();
    cache.clear();
    assert(cache.cacheNamespace().generation() == 3);

    store->flushAll();
    cache.putObject("1", Person{"B", 2});

    auto raw = store->get(cache.cacheNamespace().generationKey());
    assert(raw);
    assert(store::toString(*raw) == std::to_string(cache.cacheNamespace().generation()));
    assert(cache.getObject<Person>("1")->name == "B");
    std::cout << "[OK] generation re-bootstrapped after flush\n";
}

void testUnreachableStoreIsSilent() {
    auto store = std::make_shared<UnreachableStore>();
    std::vector<cache::CacheErrorEvent> events;
    int lockFailures = 0;
    cache::CacheOptions options;
    options.onException = [&events](const cache::CacheErrorEvent& e) { events.push_back(e); };
    options.onLockFailed = [&lockFailures](const std::string&, const std::string&, const std::string&) { ++lockFailures; };

    cache::RegionCache cache("region_A", store, options);
    cache.putObject("1", Person{"A", 1});
    assert(!cache.get("1"));
    cache.remove("1");
    assert(!cache.lock("1"));
    cache.unlock("1");
    cache.clear();

    assert(lockFailures == 1);
    assert(events.size() >= 5);
    assert(events.front().region == "region_A");
    assert(cache.getMetrics().storeFailures == events.size());
    std::cout << "[OK] unreachable store is silent\n";
}

void testGenerationRetryBudget() {
    auto store = std::make_shared<ClearStormStore>();
    cache::CacheOptions options;
    options.defaults.maxGenerationRetries = 3;
    cache::RegionCache cache("storm", store, options);

    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    auto logger = logging::logger();
    logger->sinks().push_back(sink);

    cache.putObject("1", Person{"A", 1});
    assert(!cache.get("1"));
    assert(cache.getMetrics().storeFailures >= 2);
    assert(cache.getMetrics().generationRetries >= 6);

    // В журнале указана настоящая причина пропуска
    logger->sinks().pop_back();
    bool sawRetryCause = false;
    for (const auto& line : sink->last_formatted()) {
        assert(line.find("backend unavailable") == std::string::npos);
        if (line.find("generation kept changing") != std::string::npos) {
            sawRetryCause = true;
        }
    }
    assert(sawRetryCause);
    std::cout << "[OK] generation retry budget is bounded\n";
}

void testClearedGenerationsAreReclaimed() {
    auto store = std::make_shared<store::MemoryStore>(std::chrono::milliseconds(100));
    cache::CacheOptions options;
    options.defaults.expiration = std::chrono::seconds(1);
    cache::RegionCache cache("region", store, options);

    for (int round = 0; round < 5; ++round) {
        for (int i = 0; i < 100; ++i) {
            cache.putObject(std::to_string(i), Person{"A", i});
        }
        cache.clear();
    }
    assert(store->entryCount() > 500);

    // Ключи прошлых поколений истекают и уходят при следующей записи
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    cache.putObject("1", Person{"B", 1});
    assert(store->entryCount() == store->size());
    assert(store->entryCount() <= 3);
    assert(cache.getObject<Person>("1")->name == "B");
    std::cout << "[OK] cleared generations are reclaimed by the memory store\n";
}

void testMalformedValueSurfaces() {
    auto store = newStore();
    cache::RegionCache cache("region", store);
    store->set(cache.cacheNamespace().itemKey("bad"), store::toBytes("{not json"), store::Ttl::zero());

    bool thrown = false;
    try {
        cache.get("bad");
    } catch (const cache::SerializationError&) {
        thrown = true;
    }
    assert(thrown);

    cache.put("shape", nlohmann::json{{"unexpected", true}});
    thrown = false;
    try {
        cache.getObject<Person>("shape");
    } catch (const cache::SerializationError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] malformed values raise SerializationError\n";
}

int main() {
    testConstructorSetsGeneration();
    testConstructorReusesExistingGeneration();
    testPutSerializesWithExpiry();
    testConfiguredRegionExpiration();
    testPutRetriesUntilGenerationMatches();
    testGetDeserializes();
    testGetMissing();
    testGetRetriesUntilGenerationMatches();
    testDifferentRegions();
    testRemove();
    testRemoveRetriesUntilGenerationMatches();
    testClear();
    testClearAfterForeignAdvance();
    testDestroyDoesNotClear();
    testServerGenerationRestoredAfterFlush();
    testUnreachableStoreIsSilent();
    testGenerationRetryBudget();
    testClearedGenerationsAreReclaimed();
    testMalformedValueSurfaces();
    std::cout << "All RegionCache tests passed!\n";
    return 0;
}
