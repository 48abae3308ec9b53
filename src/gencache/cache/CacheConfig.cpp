#include "gencache/cache/CacheConfig.hpp"
#include "gencache/core/Errors.hpp"

namespace gencache {
namespace cache {

namespace {

template<typename Duration>
Duration readDuration(const nlohmann::json& j, const char* key, Duration fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return Duration(j.at(key).get<int64_t>());
}

// Имя формата для встроенных сериализаторов, пустая строка для прочих
std::string serializerFormat(const std::shared_ptr<ISerializer>& serializer) {
    if (std::dynamic_pointer_cast<JsonSerializer>(serializer)) return "json";
    if (std::dynamic_pointer_cast<MsgPackSerializer>(serializer)) return "msgpack";
    return {};
}

} // namespace

nlohmann::json RegionConfig::toJson() const {
    return {
        {"expirationSeconds", expiration.count()},
        {"lockLeaseMs", lockLease.count()},
        {"lockAcquireTimeoutMs", lockAcquireTimeout.count()},
        {"lockRetryIntervalMs", lockRetryInterval.count()},
        {"lockMaxRetryIntervalMs", lockMaxRetryInterval.count()},
        {"maxGenerationRetries", maxGenerationRetries}
    };
}

RegionConfig RegionConfig::fromJson(const nlohmann::json& j) {
    return fromJson(j, RegionConfig());
}

RegionConfig RegionConfig::fromJson(const nlohmann::json& j, const RegionConfig& base) {
    RegionConfig config = base;
    try {
        config.expiration = readDuration(j, "expirationSeconds", config.expiration);
        config.lockLease = readDuration(j, "lockLeaseMs", config.lockLease);
        config.lockAcquireTimeout = readDuration(j, "lockAcquireTimeoutMs", config.lockAcquireTimeout);
        config.lockRetryInterval = readDuration(j, "lockRetryIntervalMs", config.lockRetryInterval);
        config.lockMaxRetryInterval = readDuration(j, "lockMaxRetryIntervalMs", config.lockMaxRetryInterval);
        config.maxGenerationRetries = j.value("maxGenerationRetries", config.maxGenerationRetries);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid region configuration: ") + e.what());
    }
    if (!config.validate()) {
        throw ConfigError("Invalid region configuration: " + j.dump());
    }
    return config;
}

bool CacheOptions::validate() const {
    if (keyPrefix.empty()) return false;
    if (maxTrackedRegions == 0) return false;
    if (!serializer) return false;
    if (!defaults.validate()) return false;
    for (const auto& [name, config] : regions) {
        if (name.empty() || !config.validate()) return false;
    }
    return true;
}

nlohmann::json CacheOptions::toJson() const {
    nlohmann::json regionsJson = nlohmann::json::object();
    for (const auto& [name, config] : regions) {
        regionsJson[name] = config.toJson();
    }
    nlohmann::json j = {
        {"keyPrefix", keyPrefix},
        {"maxTrackedRegions", maxTrackedRegions},
        {"defaults", defaults.toJson()},
        {"regions", regionsJson}
    };

    auto compressing = std::dynamic_pointer_cast<CompressingSerializer>(serializer);
    std::string format = serializerFormat(compressing ? compressing->inner() : serializer);
    if (!format.empty()) {
        j["serializer"] = format;
        j["compressionThreshold"] = compressing ? compressing->threshold() : 0;
    }
    return j;
}

CacheOptions CacheOptions::fromJson(const nlohmann::json& j) {
    CacheOptions options;
    try {
        options.keyPrefix = j.value("keyPrefix", options.keyPrefix);
        options.maxTrackedRegions = j.value("maxTrackedRegions", options.maxTrackedRegions);

        if (j.contains("defaults")) {
            options.defaults = RegionConfig::fromJson(j.at("defaults"));
        }
        // Регионы наследуют значения по умолчанию
        if (j.contains("regions")) {
            for (const auto& [name, regionJson] : j.at("regions").items()) {
                options.regions[name] = RegionConfig::fromJson(regionJson, options.defaults);
            }
        }

        std::string format = j.value("serializer", std::string("json"));
        std::shared_ptr<ISerializer> serializer;
        if (format == "json") {
            serializer = std::make_shared<JsonSerializer>();
        } else if (format == "msgpack") {
            serializer = std::make_shared<MsgPackSerializer>();
        } else {
            throw ConfigError("Unknown serializer: " + format);
        }

        size_t threshold = j.value("compressionThreshold", static_cast<size_t>(0));
        if (threshold > 0) {
            serializer = std::make_shared<CompressingSerializer>(serializer, threshold);
        }
        options.serializer = serializer;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid cache section: ") + e.what());
    }

    if (!options.validate()) {
        throw ConfigError("Invalid cache section: check keyPrefix, maxTrackedRegions and regions");
    }
    return options;
}

} // namespace cache
} // namespace gencache
