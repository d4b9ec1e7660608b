#pragma once

#include "ports/output/ITransaction.hpp"
#include "domain/errors/IdempotencyErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace newsletter::adapters::secondary
{

    /**
     * @brief Транзакция PostgreSQL со своим соединением
     *
     * Одно соединение на транзакцию: захваты из разных потоков
     * не делят pqxx::connection.
     */
    class PostgresTransaction : public ports::output::ITransaction
    {
    public:
        /**
         * @param idleTimeoutMs idle_in_transaction_session_timeout (0 - без лимита)
         * @throws pqxx::failure
         */
        PostgresTransaction(const std::string &connectionString, int idleTimeoutMs)
            : connection_(std::make_unique<pqxx::connection>(connectionString)),
              work_(std::make_unique<pqxx::work>(*connection_))
        {
            if (idleTimeoutMs > 0)
            {
                work_->exec("SET LOCAL idle_in_transaction_session_timeout = " + std::to_string(idleTimeoutMs));
            }
        }

        ~PostgresTransaction() override
        {
            if (!active_)
                return;

            try
            {
                work_->abort();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresTransaction] abort() on release failed: " << e.what() << std::endl;
            }
        }

        PostgresTransaction(const PostgresTransaction &) = delete;
        PostgresTransaction &operator=(const PostgresTransaction &) = delete;

        void commit() override
        {
            ensureActive("commit");
            active_ = false;
            try
            {
                work_->commit();
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresTransaction] commit() failed: " << e.what() << std::endl;
                throw domain::StorageError(std::string("Failed to commit transaction: ") + e.what());
            }
        }

        void rollback() override
        {
            ensureActive("rollback");
            active_ = false;
            try
            {
                work_->abort();
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresTransaction] rollback() failed: " << e.what() << std::endl;
                throw domain::StorageError(std::string("Failed to roll back transaction: ") + e.what());
            }
        }

        bool isActive() const override { return active_; }

        pqxx::work &work()
        {
            ensureActive("use");
            return *work_;
        }

        /**
         * @brief Достать PostgresTransaction из порта
         * @throws std::invalid_argument если транзакция открыта другим хранилищем
         */
        static PostgresTransaction &from(ports::output::ITransaction &tx)
        {
            auto *pg = dynamic_cast<PostgresTransaction *>(&tx);
            if (!pg)
            {
                throw std::invalid_argument("Transaction was not opened by a PostgreSQL adapter");
            }
            return *pg;
        }

    private:
        std::unique_ptr<pqxx::connection> connection_;
        std::unique_ptr<pqxx::work> work_;
        bool active_ = true;

        void ensureActive(const char *operation) const
        {
            if (!active_)
            {
                throw domain::TransactionStateError(std::string("Cannot ") + operation +
                                                    ": transaction already finished");
            }
        }
    };

} // namespace newsletter::adapters::secondary
