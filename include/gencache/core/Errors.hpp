#pragma once

#include <stdexcept>
#include <string>

namespace gencache {

// Базовое исключение для всех ошибок кэша
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Некорректная или нечитаемая конфигурация
class ConfigError : public CacheError {
public:
    using CacheError::CacheError;
};

namespace store {

/**
 * @brief Хранилище недоступно или ответило ошибкой.
 * @details Перехватывается на границе RegionCache и превращается в промах / no-op.
 */
class StoreError : public CacheError {
public:
    using CacheError::CacheError;
};

} // namespace store

namespace cache {

// Исчерпан лимит повторов при смене поколения
class GenerationRetryError : public CacheError {
public:
    using CacheError::CacheError;
};

// Повреждённые байты значения; пробрасывается вызывающему
class SerializationError : public CacheError {
public:
    using CacheError::CacheError;
};

} // namespace cache

namespace lock {

class LockError : public CacheError {
public:
    using CacheError::CacheError;
};

// Блокировка не получена за отведённое время
class LockTimeoutError : public LockError {
public:
    using LockError::LockError;
};

} // namespace lock

} // namespace gencache
