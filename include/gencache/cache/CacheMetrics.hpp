#pragma once
#include <cstddef>
#include <chrono>
#include <nlohmann/json.hpp>

namespace gencache {
namespace cache {

struct CacheMetrics {
    size_t hitCount = 0;            // Попадания
    size_t missCount = 0;           // Промахи
    size_t putCount = 0;            // Записи
    size_t removeCount = 0;         // Удаления
    size_t clearCount = 0;          // Очистки региона
    size_t generationRetries = 0;   // Повторы из-за смены поколения
    size_t storeFailures = 0;       // Подавленные ошибки хранилища
    size_t lockAcquisitions = 0;    // Успешные захваты
    size_t lockFailures = 0;        // Неудачные захваты
    std::chrono::steady_clock::time_point lastUpdate; // Время последнего обновления

    double hitRate() const {
        size_t requests = hitCount + missCount;
        return requests == 0 ? 0.0 : static_cast<double>(hitCount) / requests;
    }

    nlohmann::json toJson() const {
        return {
            {"hitCount", hitCount},
            {"missCount", missCount},
            {"hitRate", hitRate()},
            {"putCount", putCount},
            {"removeCount", removeCount},
            {"clearCount", clearCount},
            {"generationRetries", generationRetries},
            {"storeFailures", storeFailures},
            {"lockAcquisitions", lockAcquisitions},
            {"lockFailures", lockFailures},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

} // namespace cache
} // namespace gencache
