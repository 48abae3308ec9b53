#include "gencache/config/ClientConfig.hpp"
#include <fstream>
#include "gencache/core/Errors.hpp"

namespace gencache {
namespace config {

nlohmann::json ClientConfig::toJson() const {
    return {
        {"cache", cache.toJson()},
        {"redis", redis.toJson()},
        {"logging", logging.toJson()}
    };
}

ClientConfig ClientConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Client configuration must be a JSON object");
    }
    ClientConfig config;
    if (j.contains("cache")) {
        config.cache = cache::CacheOptions::fromJson(j.at("cache"));
    }
    if (j.contains("redis")) {
        config.redis = store::RedisConfig::fromJson(j.at("redis"));
    }
    if (j.contains("logging")) {
        config.logging = logging::LoggingConfig::fromJson(j.at("logging"));
    }
    return config;
}

ClientConfig loadClientConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file '" + path + "'");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Cannot parse configuration file '" + path + "': " + e.what());
    }
    return ClientConfig::fromJson(j);
}

} // namespace config
} // namespace gencache
