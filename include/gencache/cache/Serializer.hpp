#pragma once

#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include "gencache/store/RemoteStore.hpp"

namespace gencache {
namespace cache {

using store::Bytes;

/**
 * @brief Преобразование значений кэша в байты и обратно.
 * @details deserialize бросает SerializationError на повреждённых данных.
 */
class ISerializer {
public:
    virtual ~ISerializer() = default;
    virtual Bytes serialize(const nlohmann::json& value) const = 0;
    virtual nlohmann::json deserialize(const Bytes& data) const = 0;
};

// Текстовый JSON
class JsonSerializer : public ISerializer {
public:
    Bytes serialize(const nlohmann::json& value) const override;
    nlohmann::json deserialize(const Bytes& data) const override;
};

// Бинарный MessagePack
class MsgPackSerializer : public ISerializer {
public:
    Bytes serialize(const nlohmann::json& value) const override;
    nlohmann::json deserialize(const Bytes& data) const override;
};

/**
 * @brief Декоратор, сжимающий крупные значения через zlib.
 * @details Формат: байт флага (0 = как есть, 1 = zlib), для zlib далее
 * 4 байта исходной длины (big-endian) и сжатые данные. Заголовок с длиной,
 * недостижимой для deflate при данном размере сжатых данных, считается повреждённым.
 */
class CompressingSerializer : public ISerializer {
public:
    CompressingSerializer(std::shared_ptr<ISerializer> inner, size_t threshold);

    Bytes serialize(const nlohmann::json& value) const override;
    nlohmann::json deserialize(const Bytes& data) const override;

    size_t threshold() const { return threshold_; }
    const std::shared_ptr<ISerializer>& inner() const { return inner_; }

private:
    std::shared_ptr<ISerializer> inner_;
    size_t threshold_;
};

} // namespace cache
} // namespace gencache
