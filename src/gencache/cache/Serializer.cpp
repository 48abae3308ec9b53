#include "gencache/cache/Serializer.hpp"
#include <limits>
#include <new>
#include <string>
#include <zlib.h>
#include "gencache/core/Errors.hpp"

namespace gencache {
namespace cache {

namespace {

constexpr uint8_t kRawFlag = 0;
constexpr uint8_t kZlibFlag = 1;
constexpr size_t kHeaderSize = 1 + 4;
// Предельная степень сжатия deflate
constexpr uint64_t kMaxDeflateRatio = 1032;

} // namespace

Bytes JsonSerializer::serialize(const nlohmann::json& value) const {
    try {
        return store::toBytes(value.dump());
    } catch (const nlohmann::json::exception& e) {
        // Например, строка с некорректным UTF-8
        throw SerializationError(std::string("Cannot serialize value: ") + e.what());
    }
}

nlohmann::json JsonSerializer::deserialize(const Bytes& data) const {
    try {
        return nlohmann::json::parse(data.begin(), data.end());
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("Malformed JSON value: ") + e.what());
    }
}

Bytes MsgPackSerializer::serialize(const nlohmann::json& value) const {
    return nlohmann::json::to_msgpack(value);
}

nlohmann::json MsgPackSerializer::deserialize(const Bytes& data) const {
    try {
        return nlohmann::json::from_msgpack(data);
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("Malformed MessagePack value: ") + e.what());
    }
}

CompressingSerializer::CompressingSerializer(std::shared_ptr<ISerializer> inner, size_t threshold)
    : inner_(std::move(inner))
    , threshold_(threshold) {
    if (!inner_) {
        throw ConfigError("CompressingSerializer requires an inner serializer");
    }
}

Bytes CompressingSerializer::serialize(const nlohmann::json& value) const {
    Bytes plain = inner_->serialize(value);

    if (plain.size() < threshold_ || plain.size() > std::numeric_limits<uint32_t>::max()) {
        Bytes out;
        out.reserve(plain.size() + 1);
        out.push_back(kRawFlag);
        out.insert(out.end(), plain.begin(), plain.end());
        return out;
    }

    uLongf compressedSize = compressBound(static_cast<uLong>(plain.size()));
    Bytes out(kHeaderSize + compressedSize);
    int rc = compress2(out.data() + kHeaderSize, &compressedSize,
                       plain.data(), static_cast<uLong>(plain.size()), Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) {
        throw SerializationError("zlib compression failed with code " + std::to_string(rc));
    }

    auto length = static_cast<uint32_t>(plain.size());
    out[0] = kZlibFlag;
    out[1] = static_cast<uint8_t>(length >> 24);
    out[2] = static_cast<uint8_t>(length >> 16);
    out[3] = static_cast<uint8_t>(length >> 8);
    out[4] = static_cast<uint8_t>(length);
    out.resize(kHeaderSize + compressedSize);
    return out;
}

nlohmann::json CompressingSerializer::deserialize(const Bytes& data) const {
    if (data.empty()) {
        throw SerializationError("Empty compressed payload");
    }

    if (data[0] == kRawFlag) {
        return inner_->deserialize(Bytes(data.begin() + 1, data.end()));
    }
    if (data[0] != kZlibFlag || data.size() < kHeaderSize) {
        throw SerializationError("Unknown payload header");
    }

    uint32_t length = (static_cast<uint32_t>(data[1]) << 24) |
                      (static_cast<uint32_t>(data[2]) << 16) |
                      (static_cast<uint32_t>(data[3]) << 8) |
                      static_cast<uint32_t>(data[4]);

    uint64_t compressedSize = data.size() - kHeaderSize;
    if (length > compressedSize * kMaxDeflateRatio) {
        throw SerializationError("Corrupt compressed payload: declared length " + std::to_string(length) +
                                 " for " + std::to_string(compressedSize) + " compressed bytes");
    }

    Bytes plain;
    try {
        plain.resize(length);
    } catch (const std::bad_alloc&) {
        throw SerializationError("Cannot allocate " + std::to_string(length) + " bytes for decompression");
    }
    uLongf plainSize = length;
    int rc = uncompress(plain.data(), &plainSize,
                        data.data() + kHeaderSize, static_cast<uLong>(compressedSize));
    if (rc != Z_OK || plainSize != length) {
        throw SerializationError("zlib decompression failed with code " + std::to_string(rc));
    }
    return inner_->deserialize(plain);
}

} // namespace cache
} // namespace gencache
