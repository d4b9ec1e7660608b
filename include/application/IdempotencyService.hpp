#pragma once

#include "ports/input/IIdempotencyService.hpp"
#include "ports/output/IIdempotencyStore.hpp"
#include "domain/errors/IdempotencyErrors.hpp"
#include <memory>
#include <iostream>

namespace newsletter::application
{

    /**
     * @brief Протокол захвата ключа идемпотентности
     *
     * Start -> {Processing | Replaying} -> Done
     *
     * 1. Открываем транзакцию, INSERT ... ON CONFLICT DO NOTHING.
     * 2. Вставили строку: транзакция уходит вызывающему (START_PROCESSING).
     *    Он выполняет побочные эффекты в ней же и вызывает finalize(),
     *    либо отпускает транзакцию, и захват откатывается.
     * 3. Строка уже есть: транзакцию откатываем, читаем сохранённый ответ.
     *    Ответа нет -> параллельный захват ещё не закоммичен -> InvariantViolation.
     *
     * Ошибки хранилища не ретраятся, повтор остаётся за клиентом.
     */
    class IdempotencyService : public ports::input::IIdempotencyService
    {
    public:
        explicit IdempotencyService(std::shared_ptr<ports::output::IIdempotencyStore> store)
            : store_(std::move(store))
        {
            std::cout << "[IdempotencyService] Created" << std::endl;
        }

        ports::input::NextAction tryProcess(const std::string &userId,
                                            const domain::IdempotencyKey &key) override
        {
            auto tx = store_->beginTransaction();

            if (store_->insertClaimIfAbsent(*tx, userId, key) == ports::output::ClaimOutcome::INSERTED)
            {
                std::cout << "[IdempotencyService] Claimed key " << key.value()
                          << " for user " << userId << std::endl;
                return ports::input::NextAction::startProcessing(std::move(tx));
            }

            // Ничего не записали, транзакция больше не нужна
            tx->rollback();

            auto saved = store_->fetchCompleted(userId, key);
            if (!saved)
            {
                std::cerr << "[IdempotencyService] Key " << key.value() << " for user " << userId
                          << " is claimed but has no saved response" << std::endl;
                throw domain::InvariantViolation("We expected a saved response, we didn't find it");
            }

            std::cout << "[IdempotencyService] Replaying saved response for key " << key.value()
                      << " (status " << saved->status << ")" << std::endl;
            return ports::input::NextAction::returnCachedResponse(std::move(*saved));
        }

        void finalize(std::unique_ptr<ports::output::ITransaction> tx,
                      const std::string &userId,
                      const domain::IdempotencyKey &key,
                      const domain::SavedResponse &response) override
        {
            if (!tx || !tx->isActive())
            {
                throw domain::TransactionStateError("finalize() requires the active claim transaction");
            }

            // при исключении tx откатится в деструкторе
            store_->finalize(*tx, userId, key, response);
            tx->commit();

            std::cout << "[IdempotencyService] Saved response for key " << key.value()
                      << " (status " << response.status << ")" << std::endl;
        }

    private:
        std::shared_ptr<ports::output::IIdempotencyStore> store_;
    };

} // namespace newsletter::application
