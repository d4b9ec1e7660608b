#pragma once

#include "settings/Env.hpp"
#include <climits>
#include <cstddef>
#include <cstdint>

namespace newsletter::settings
{

    /**
     * @brief Настройки кэша ответов идемпотентности
     *
     * Читает из ENV:
     * - IDEMPOTENCY_MAX_RESPONSE_BODY_BYTES (default: 1048576)
     *   Тело ответа целиком буферизуется в памяти перед сохранением,
     *   поэтому больше этого лимита ответ не кэшируется (500).
     * - IDEMPOTENCY_TRANSACTION_TIMEOUT_MS (default: 30000)
     *   idle_in_transaction_session_timeout для транзакции захвата:
     *   брошенная транзакция закрывается сервером, захват откатывается.
     * - IDEMPOTENCY_CLAIM_LOCK_TIMEOUT_MS (default: 1000)
     *   lock_timeout на INSERT захвата: конкурент не ждёт незакоммиченного
     *   владельца ключа дольше этого (0 - ждать без лимита).
     *
     * Некорректное значение роняет старт (std::invalid_argument).
     */
    class IdempotencySettings
    {
    public:
        IdempotencySettings()
            : maxResponseBodyBytes_(static_cast<std::size_t>(env::getUnsignedOr(
                  "IDEMPOTENCY_MAX_RESPONSE_BODY_BYTES", 1024 * 1024, SIZE_MAX))),
              transactionTimeoutMs_(static_cast<int>(env::getUnsignedOr(
                  "IDEMPOTENCY_TRANSACTION_TIMEOUT_MS", 30000, INT_MAX))),
              claimLockTimeoutMs_(static_cast<int>(env::getUnsignedOr(
                  "IDEMPOTENCY_CLAIM_LOCK_TIMEOUT_MS", 1000, INT_MAX)))
        {
        }

        std::size_t getMaxResponseBodyBytes() const { return maxResponseBodyBytes_; }
        int getTransactionTimeoutMs() const { return transactionTimeoutMs_; }
        int getClaimLockTimeoutMs() const { return claimLockTimeoutMs_; }

    private:
        std::size_t maxResponseBodyBytes_;
        int transactionTimeoutMs_;
        int claimLockTimeoutMs_;
    };

} // namespace newsletter::settings
