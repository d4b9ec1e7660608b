#pragma once

#include "ports/output/IIdempotencyStore.hpp"
#include "adapters/secondary/PostgresTransaction.hpp"
#include "adapters/secondary/HeaderCodec.hpp"
#include "settings/DbSettings.hpp"
#include "settings/IdempotencySettings.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <iostream>

namespace newsletter::adapters::secondary
{

    /**
     * @brief PostgreSQL реализация хранилища идемпотентности
     *
     * Таблица idempotency, PRIMARY KEY (user_id, idempotency_key).
     * Взаимное исключение захватов держится только на этом ключе.
     */
    class PostgresIdempotencyStore : public ports::output::IIdempotencyStore
    {
    public:
        PostgresIdempotencyStore(std::shared_ptr<settings::DbSettings> db,
                                 std::shared_ptr<settings::IdempotencySettings> settings)
            : db_(std::move(db)), settings_(std::move(settings))
        {
            // Проверяем соединение, но не создаём таблицу (см. migrations/)
            pqxx::connection c(db_->getConnectionString());
            std::cout << "[PostgresIdempotencyStore] Connected to " << db_->getName() << std::endl;
        }

        std::unique_ptr<ports::output::ITransaction> beginTransaction() override
        {
            try
            {
                return std::make_unique<PostgresTransaction>(db_->getConnectionString(),
                                                             settings_->getTransactionTimeoutMs());
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresIdempotencyStore] beginTransaction() failed: " << e.what() << std::endl;
                throw domain::StorageError(std::string("Failed to open transaction: ") + e.what());
            }
        }

        ports::output::ClaimOutcome insertClaimIfAbsent(ports::output::ITransaction &tx,
                                                        const std::string &userId,
                                                        const domain::IdempotencyKey &key) override
        {
            auto &work = PostgresTransaction::from(tx).work();
            const int lockTimeoutMs = settings_->getClaimLockTimeoutMs();
            try
            {
                // Конкурент не ждёт незакоммиченного владельца дольше lock_timeout
                if (lockTimeoutMs > 0)
                {
                    work.exec("SET LOCAL lock_timeout = " + std::to_string(lockTimeoutMs));
                }

                auto r = work.exec_params(
                    R"(
                        INSERT INTO idempotency (user_id, idempotency_key, created_at)
                        VALUES ($1, $2, NOW())
                        ON CONFLICT DO NOTHING
                    )",
                    userId, key.value());

                if (lockTimeoutMs > 0)
                {
                    work.exec("SET LOCAL lock_timeout = 0");
                }

                return r.affected_rows() > 0 ? ports::output::ClaimOutcome::INSERTED
                                             : ports::output::ClaimOutcome::ALREADY_PRESENT;
            }
            catch (const pqxx::sql_error &e)
            {
                if (isLockTimeout(e))
                {
                    std::cout << "[PostgresIdempotencyStore] Key " << key.value()
                              << " is held by an uncommitted claim" << std::endl;
                    return ports::output::ClaimOutcome::ALREADY_PRESENT;
                }
                std::cerr << "[PostgresIdempotencyStore] insertClaimIfAbsent() failed: " << e.what() << std::endl;
                throw domain::StorageError(std::string("Failed to claim idempotency key: ") + e.what());
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresIdempotencyStore] insertClaimIfAbsent() failed: " << e.what() << std::endl;
                throw domain::StorageError(std::string("Failed to claim idempotency key: ") + e.what());
            }
        }

        void finalize(ports::output::ITransaction &tx,
                      const std::string &userId,
                      const domain::IdempotencyKey &key,
                      const domain::SavedResponse &response) override
        {
            auto &work = PostgresTransaction::from(tx).work();
            const auto headers = HeaderCodec::encode(response.headers);

            pqxx::result r;
            try
            {
                r = work.exec_params(
                    R"(
                        UPDATE idempotency
                        SET response_status_code = $3,
                            response_headers = $4,
                            response_body = $5
                        WHERE user_id = $1 AND idempotency_key = $2
                    )",
                    userId,
                    key.value(),
                    response.status,
                    pqxx::binary_cast(headers),
                    pqxx::binary_cast(response.body));
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresIdempotencyStore] finalize() failed: " << e.what() << std::endl;
                throw domain::StorageError(std::string("Failed to save response: ") + e.what());
            }

            if (r.affected_rows() != 1)
            {
                throw domain::StorageError("No claimed idempotency row for key " + key.value());
            }
        }

        std::optional<domain::SavedResponse> fetchCompleted(const std::string &userId,
                                                            const domain::IdempotencyKey &key) override
        {
            try
            {
                pqxx::connection c(db_->getConnectionString());
                pqxx::read_transaction t(c);
                auto r = t.exec_params(
                    R"(
                        SELECT response_status_code, response_headers, response_body
                        FROM idempotency
                        WHERE user_id = $1 AND idempotency_key = $2
                          AND response_status_code IS NOT NULL
                    )",
                    userId, key.value());

                if (r.empty())
                    return std::nullopt;

                const auto &row = r[0];
                if (row[1].is_null() || row[2].is_null())
                    return std::nullopt;

                const auto headerBytes = row[1].as<std::basic_string<std::byte>>();
                const auto bodyBytes = row[2].as<std::basic_string<std::byte>>();

                std::vector<std::uint8_t> encodedHeaders(headerBytes.size());
                std::transform(headerBytes.begin(), headerBytes.end(), encodedHeaders.begin(),
                               [](std::byte b) { return std::to_integer<std::uint8_t>(b); });

                domain::SavedResponse saved;
                saved.status = row[0].as<int>();
                saved.headers = HeaderCodec::decode(encodedHeaders);
                saved.body.resize(bodyBytes.size());
                std::transform(bodyBytes.begin(), bodyBytes.end(), saved.body.begin(),
                               [](std::byte b) { return std::to_integer<char>(b); });
                return saved;
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresIdempotencyStore] fetchCompleted() failed: " << e.what() << std::endl;
                throw domain::StorageError(std::string("Failed to fetch saved response: ") + e.what());
            }
        }

    private:
        std::shared_ptr<settings::DbSettings> db_;
        std::shared_ptr<settings::IdempotencySettings> settings_;

        // SQLSTATE 55P03 lock_not_available
        static bool isLockTimeout(const pqxx::sql_error &e)
        {
            return e.sqlstate() == "55P03";
        }
    };

} // namespace newsletter::adapters::secondary
