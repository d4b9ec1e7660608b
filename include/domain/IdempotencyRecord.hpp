#pragma once

#include "domain/SavedResponse.hpp"
#include <string>
#include <chrono>
#include <optional>

/**
 * Идемпотентность запросов
 */
namespace newsletter::domain
{

    /**
     * @brief Строка таблицы idempotency
     *
     * Claimed:   response == nullopt, запись видна только внутри транзакции захвата
     * Completed: response заполнен и закоммичен
     */
    struct IdempotencyRecord
    {
        std::string userId;
        std::string idempotencyKey;
        std::chrono::system_clock::time_point createdAt;
        std::optional<SavedResponse> response;

        bool isCompleted() const { return response.has_value(); }
    };

} // namespace newsletter::domain
