#pragma once

#include "ports/output/ITransaction.hpp"
#include "domain/IdempotencyKey.hpp"
#include "domain/SavedResponse.hpp"
#include <memory>
#include <optional>
#include <string>

namespace newsletter::ports::output
{

    enum class ClaimOutcome
    {
        INSERTED,
        ALREADY_PRESENT
    };

    /**
     * @brief Хранилище ответов по ключу (userId, idempotencyKey)
     *
     * Уникальность пары обеспечивает само хранилище (PRIMARY KEY),
     * других примитивов синхронизации нет.
     */
    class IIdempotencyStore
    {
    public:
        virtual ~IIdempotencyStore() = default;

        /**
         * @brief Открыть транзакцию для захвата ключа
         * @throws StorageError
         */
        virtual std::unique_ptr<ITransaction> beginTransaction() = 0;

        /**
         * @brief INSERT ... ON CONFLICT DO NOTHING внутри транзакции
         * @throws StorageError
         */
        virtual ClaimOutcome insertClaimIfAbsent(ITransaction &tx,
                                                 const std::string &userId,
                                                 const domain::IdempotencyKey &key) = 0;

        /**
         * @brief Записать ответ в захваченную строку той же транзакцией
         * @throws StorageError
         */
        virtual void finalize(ITransaction &tx,
                              const std::string &userId,
                              const domain::IdempotencyKey &key,
                              const domain::SavedResponse &response) = 0;

        /**
         * @brief Прочитать закоммиченный ответ (без транзакции вызывающего)
         *
         * nullopt и когда строки нет, и когда она ещё не финализирована.
         * @throws StorageError
         */
        virtual std::optional<domain::SavedResponse> fetchCompleted(const std::string &userId,
                                                                    const domain::IdempotencyKey &key) = 0;
    };

} // namespace newsletter::ports::output
