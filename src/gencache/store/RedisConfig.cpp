#include "gencache/store/RedisStore.hpp"

namespace gencache {
namespace store {

nlohmann::json RedisConfig::toJson() const {
    return {
        {"host", host},
        {"port", port},
        {"db", db},
        {"password", password},
        {"connectTimeoutMs", connectTimeout.count()},
        {"commandTimeoutMs", commandTimeout.count()}
    };
}

RedisConfig RedisConfig::fromJson(const nlohmann::json& j) {
    RedisConfig config;
    try {
        config.host = j.value("host", config.host);
        config.port = j.value("port", config.port);
        config.db = j.value("db", config.db);
        config.password = j.value("password", config.password);
        config.connectTimeout = std::chrono::milliseconds(
            j.value("connectTimeoutMs", static_cast<int64_t>(config.connectTimeout.count())));
        config.commandTimeout = std::chrono::milliseconds(
            j.value("commandTimeoutMs", static_cast<int64_t>(config.commandTimeout.count())));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid redis section: ") + e.what());
    }
    if (!config.validate()) {
        throw ConfigError("Invalid redis section: check host, port, db and timeouts");
    }
    return config;
}

} // namespace store
} // namespace gencache
