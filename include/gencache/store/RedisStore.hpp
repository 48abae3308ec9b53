#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "gencache/store/RemoteStore.hpp"

struct redisContext;
struct redisReply;

namespace gencache {
namespace store {

struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    int db = 0;
    std::string password;
    std::chrono::milliseconds connectTimeout{1000};
    std::chrono::milliseconds commandTimeout{1000};

    bool validate() const {
        if (host.empty()) return false;
        if (port <= 0 || port > 65535) return false;
        if (db < 0) return false;
        if (connectTimeout.count() <= 0 || commandTimeout.count() <= 0) return false;
        return true;
    }

    nlohmann::json toJson() const;
    static RedisConfig fromJson(const nlohmann::json& j);
};

/**
 * @brief Адаптер Redis на hiredis.
 * @details Одно соединение под мьютексом. Соединение устанавливается лениво
 * и переустанавливается после сетевой ошибки; конструктор не бросает
 * исключений, ошибка соединения проявляется как StoreError первой команды.
 */
class RedisStore : public IRemoteStore {
public:
    explicit RedisStore(RedisConfig config);
    ~RedisStore() override;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    std::optional<Bytes> get(const std::string& key) override;
    void set(const std::string& key, const Bytes& value, Ttl ttl) override;
    bool setIfAbsent(const std::string& key, const Bytes& value, Ttl ttl) override;
    void remove(const std::string& key) override;
    bool removeIfEquals(const std::string& key, const Bytes& expected) override;
    int64_t increment(const std::string& key, int64_t delta) override;
    std::optional<Ttl> ttl(const std::string& key) override;

    bool isConnected() const;
    const RedisConfig& config() const { return config_; }

private:
    using ContextPtr = std::unique_ptr<redisContext, void(*)(redisContext*)>;
    using ReplyPtr = std::unique_ptr<redisReply, void(*)(redisReply*)>;

    // Вызываются под mutex_
    void ensureConnected();
    void disconnect();
    ReplyPtr command(int argc, const char** argv, const size_t* argvlen);

    RedisConfig config_;
    ContextPtr context_;
    mutable std::mutex mutex_;
};

} // namespace store
} // namespace gencache
