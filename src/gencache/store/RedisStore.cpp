#include "gencache/store/RedisStore.hpp"
#include <sys/time.h>
#include <vector>
#include <hiredis/hiredis.h>
#include "gencache/core/Logging.hpp"

namespace gencache {
namespace store {

namespace {

// Удаление ключа только владельцем значения
const char* kRemoveIfEqualsScript =
    "if redis.call('get', KEYS[1]) == ARGV[1] then "
    "return redis.call('del', KEYS[1]) "
    "else return 0 end";

void freeContext(redisContext* context) {
    if (context) {
        redisFree(context);
    }
}

void freeReply(redisReply* reply) {
    if (reply) {
        freeReplyObject(reply);
    }
}

timeval toTimeval(std::chrono::milliseconds ms) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

// Построитель аргументов команды для redisCommandArgv
class Args {
public:
    Args& add(const std::string& s) {
        storage_.push_back(s);
        return *this;
    }
    Args& add(const Bytes& b) {
        storage_.emplace_back(b.begin(), b.end());
        return *this;
    }

    int argc() const { return static_cast<int>(storage_.size()); }

    void build(std::vector<const char*>& argv, std::vector<size_t>& lens) const {
        argv.clear();
        lens.clear();
        for (const auto& s : storage_) {
            argv.push_back(s.data());
            lens.push_back(s.size());
        }
    }

private:
    std::vector<std::string> storage_;
};

std::string ttlMillis(Ttl ttl) {
    return std::to_string(ttl.count());
}

} // namespace

RedisStore::RedisStore(RedisConfig config)
    : config_(std::move(config))
    , context_(nullptr, &freeContext) {
    if (!config_.validate()) {
        throw ConfigError("Invalid Redis configuration for " + config_.host + ":" + std::to_string(config_.port));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        ensureConnected();
    } catch (const StoreError& e) {
        // Недоступность сервера не мешает созданию адаптера
        logging::logger()->warn("Redis {}:{} is not reachable yet: {}", config_.host, config_.port, e.what());
    }
}

RedisStore::~RedisStore() = default;

bool RedisStore::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_ && context_->err == 0;
}

void RedisStore::disconnect() {
    context_.reset();
}

void RedisStore::ensureConnected() {
    if (context_ && context_->err == 0) {
        return;
    }
    disconnect();

    auto tv = toTimeval(config_.connectTimeout);
    ContextPtr context(redisConnectWithTimeout(config_.host.c_str(), config_.port, tv), &freeContext);
    if (!context) {
        throw StoreError("Cannot allocate Redis context");
    }
    if (context->err) {
        throw StoreError("Cannot connect to Redis " + config_.host + ":" + std::to_string(config_.port) + ": " + context->errstr);
    }
    if (redisSetTimeout(context.get(), toTimeval(config_.commandTimeout)) != REDIS_OK) {
        throw StoreError("Cannot set Redis command timeout: " + std::string(context->errstr));
    }

    auto handshake = [&context](const std::vector<std::string>& parts) {
        std::vector<const char*> argv;
        std::vector<size_t> lens;
        for (const auto& p : parts) {
            argv.push_back(p.data());
            lens.push_back(p.size());
        }
        ReplyPtr reply(static_cast<redisReply*>(
            redisCommandArgv(context.get(), static_cast<int>(argv.size()), argv.data(), lens.data())), &freeReply);
        if (!reply) {
            throw StoreError("Redis handshake failed: " + std::string(context->errstr));
        }
        if (reply->type == REDIS_REPLY_ERROR) {
            throw StoreError("Redis handshake rejected: " + std::string(reply->str, reply->len));
        }
    };

    if (!config_.password.empty()) {
        handshake({"AUTH", config_.password});
    }
    if (config_.db != 0) {
        handshake({"SELECT", std::to_string(config_.db)});
    }

    context_ = std::move(context);
    logging::logger()->info("Connected to Redis {}:{} db={}", config_.host, config_.port, config_.db);
}

RedisStore::ReplyPtr RedisStore::command(int argc, const char** argv, const size_t* argvlen) {
    ensureConnected();
    ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(context_.get(), argc, argv, argvlen)), &freeReply);
    if (!reply) {
        std::string error = context_->errstr;
        // Контекст после сетевой ошибки непригоден
        disconnect();
        throw StoreError("Redis command failed: " + error);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        throw StoreError("Redis error: " + std::string(reply->str, reply->len));
    }
    return reply;
}

std::optional<Bytes> RedisStore::get(const std::string& key) {
    Args args;
    args.add("GET").add(key);
    std::vector<const char*> argv;
    std::vector<size_t> lens;
    args.build(argv, lens);

    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command(args.argc(), argv.data(), lens.data());
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    if (reply->type != REDIS_REPLY_STRING) {
        throw StoreError("Unexpected reply type for GET " + key);
    }
    return Bytes(reply->str, reply->str + reply->len);
}

void RedisStore::set(const std::string& key, const Bytes& value, Ttl ttl) {
    Args args;
    args.add("SET").add(key).add(value);
    if (ttl.count() > 0) {
        args.add("PX").add(ttlMillis(ttl));
    }
    std::vector<const char*> argv;
    std::vector<size_t> lens;
    args.build(argv, lens);

    std::lock_guard<std::mutex> lock(mutex_);
    command(args.argc(), argv.data(), lens.data());
}

bool RedisStore::setIfAbsent(const std::string& key, const Bytes& value, Ttl ttl) {
    Args args;
    args.add("SET").add(key).add(value).add("NX");
    if (ttl.count() > 0) {
        args.add("PX").add(ttlMillis(ttl));
    }
    std::vector<const char*> argv;
    std::vector<size_t> lens;
    args.build(argv, lens);

    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command(args.argc(), argv.data(), lens.data());
    return reply->type == REDIS_REPLY_STATUS;
}

void RedisStore::remove(const std::string& key) {
    Args args;
    args.add("DEL").add(key);
    std::vector<const char*> argv;
    std::vector<size_t> lens;
    args.build(argv, lens);

    std::lock_guard<std::mutex> lock(mutex_);
    command(args.argc(), argv.data(), lens.data());
}

bool RedisStore::removeIfEquals(const std::string& key, const Bytes& expected) {
    Args args;
    args.add("EVAL").add(std::string(kRemoveIfEqualsScript)).add("1").add(key).add(expected);
    std::vector<const char*> argv;
    std::vector<size_t> lens;
    args.build(argv, lens);

    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command(args.argc(), argv.data(), lens.data());
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

int64_t RedisStore::increment(const std::string& key, int64_t delta) {
    Args args;
    args.add("INCRBY").add(key).add(std::to_string(delta));
    std::vector<const char*> argv;
    std::vector<size_t> lens;
    args.build(argv, lens);

    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command(args.argc(), argv.data(), lens.data());
    if (reply->type != REDIS_REPLY_INTEGER) {
        throw StoreError("Unexpected reply type for INCRBY " + key);
    }
    return static_cast<int64_t>(reply->integer);
}

std::optional<Ttl> RedisStore::ttl(const std::string& key) {
    Args args;
    args.add("PTTL").add(key);
    std::vector<const char*> argv;
    std::vector<size_t> lens;
    args.build(argv, lens);

    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command(args.argc(), argv.data(), lens.data());
    if (reply->type != REDIS_REPLY_INTEGER) {
        throw StoreError("Unexpected reply type for PTTL " + key);
    }
    // -2: ключа нет, -1: без срока жизни
    if (reply->integer < 0) {
        return std::nullopt;
    }
    return Ttl(reply->integer);
}

} // namespace store
} // namespace gencache
