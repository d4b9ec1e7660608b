#pragma once

#include "ports/output/ITransaction.hpp"
#include "domain/IdempotencyKey.hpp"
#include "domain/SavedResponse.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace newsletter::ports::input
{

    /**
     * @brief Что делать вызывающему после tryProcess()
     *
     * START_PROCESSING:        ключ захвачен, вызывающий владеет транзакцией
     * RETURN_CACHED_RESPONSE:  ключ уже обработан, отдать сохранённый ответ
     */
    class NextAction
    {
    public:
        enum class Kind
        {
            START_PROCESSING,
            RETURN_CACHED_RESPONSE
        };

        static NextAction startProcessing(std::unique_ptr<output::ITransaction> tx)
        {
            return NextAction(Kind::START_PROCESSING, std::move(tx), std::nullopt);
        }

        static NextAction returnCachedResponse(domain::SavedResponse response)
        {
            return NextAction(Kind::RETURN_CACHED_RESPONSE, nullptr, std::move(response));
        }

        Kind kind() const { return kind_; }
        bool isStartProcessing() const { return kind_ == Kind::START_PROCESSING; }

        /**
         * @brief Забрать транзакцию (один раз)
         */
        std::unique_ptr<output::ITransaction> takeTransaction()
        {
            if (!transaction_)
            {
                throw std::logic_error("NextAction holds no transaction");
            }
            return std::move(transaction_);
        }

        const domain::SavedResponse &cachedResponse() const
        {
            if (!cached_)
            {
                throw std::logic_error("NextAction holds no cached response");
            }
            return *cached_;
        }

    private:
        NextAction(Kind kind,
                   std::unique_ptr<output::ITransaction> tx,
                   std::optional<domain::SavedResponse> cached)
            : kind_(kind), transaction_(std::move(tx)), cached_(std::move(cached)) {}

        Kind kind_;
        std::unique_ptr<output::ITransaction> transaction_;
        std::optional<domain::SavedResponse> cached_;
    };

    /**
     * @brief Протокол захвата ключа идемпотентности
     */
    class IIdempotencyService
    {
    public:
        virtual ~IIdempotencyService() = default;

        /**
         * @brief Захватить (userId, key) или вернуть сохранённый ответ
         * @throws StorageError, InvariantViolation
         */
        virtual NextAction tryProcess(const std::string &userId, const domain::IdempotencyKey &key) = 0;

        /**
         * @brief Записать ответ и закоммитить транзакцию захвата
         *
         * Транзакция потребляется: при ошибке она откатывается вместе с захватом.
         * @throws StorageError
         */
        virtual void finalize(std::unique_ptr<output::ITransaction> tx,
                              const std::string &userId,
                              const domain::IdempotencyKey &key,
                              const domain::SavedResponse &response) = 0;
    };

} // namespace newsletter::ports::input
