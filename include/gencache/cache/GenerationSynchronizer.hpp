#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include "gencache/cache/CacheNamespace.hpp"
#include "gencache/core/Errors.hpp"
#include "gencache/core/Logging.hpp"

namespace gencache {
namespace cache {

/**
 * @brief Согласование локального поколения с поколением в хранилище.
 *
 * Операция выполняется над ключом локального поколения g, затем поколение
 * перечитывается. Если оно изменилось, новое значение принимается и операция
 * повторяется целиком. Число повторов ограничено maxRetries.
 */
class GenerationSynchronizer {
public:
    explicit GenerationSynchronizer(size_t maxRetries) : maxRetries_(maxRetries) {}

    /**
     * @param op вызывается с ключом элемента и номером поколения
     * @param retries сюда добавляется число выполненных повторов
     * @return результат последнего (согласованного) вызова op
     * @throws GenerationRetryError если поколение не стабилизировалось
     */
    template<typename Op>
    auto run(CacheNamespace& ns, const std::string& id, Op&& op, size_t* retries = nullptr)
        -> decltype(op(std::string(), int64_t())) {
        int64_t generation = ns.generation();

        for (size_t attempt = 0; attempt <= maxRetries_; ++attempt) {
            auto result = op(ns.itemKey(generation, id), generation);

            int64_t authoritative = ns.fetchGeneration();
            if (authoritative == generation) {
                return result;
            }

            logging::logger()->debug("Region '{}': generation moved {} -> {}, retrying '{}'",
                                     ns.region(), generation, authoritative, id);
            generation = authoritative;
            if (retries) {
                ++*retries;
            }
        }

        throw GenerationRetryError("Generation of region '" + ns.region() +
                                   "' did not settle after " + std::to_string(maxRetries_) + " retries");
    }

    size_t maxRetries() const { return maxRetries_; }

private:
    size_t maxRetries_;
};

} // namespace cache
} // namespace gencache
