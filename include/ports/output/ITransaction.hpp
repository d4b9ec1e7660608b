#pragma once

namespace newsletter::ports::output
{

    /**
     * @brief Транзакция хранилища, выданная одному владельцу
     *
     * Владелец обязан вызвать ровно один из commit()/rollback().
     * Повторный вызов бросает TransactionStateError.
     * Деструктор незавершённой транзакции делает rollback.
     *
     * Не передаётся между потоками.
     */
    class ITransaction
    {
    public:
        virtual ~ITransaction() = default;

        virtual void commit() = 0;
        virtual void rollback() = 0;

        /**
         * @brief true, пока не было commit()/rollback()
         */
        virtual bool isActive() const = 0;
    };

} // namespace newsletter::ports::output
