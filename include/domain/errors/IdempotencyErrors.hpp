#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @file IdempotencyErrors.hpp
 * @brief Исключения подсистемы идемпотентности
 *
 * ValidationError     -> 400, клиент прислал некорректные данные
 * StorageError        -> 500, сбой транзакции или соединения с БД
 * InvariantViolation  -> 500, ключ занят, но ответ ещё не сохранён (гонка)
 */
namespace newsletter::domain
{

    class ValidationError : public std::runtime_error
    {
    public:
        explicit ValidationError(const std::string &message)
            : std::runtime_error(message) {}
    };

    class StorageError : public std::runtime_error
    {
    public:
        explicit StorageError(const std::string &message)
            : std::runtime_error(message) {}
    };

    class InvariantViolation : public std::runtime_error
    {
    public:
        explicit InvariantViolation(const std::string &message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief Тело ответа не помещается в лимит кэша идемпотентности
     */
    class ResponseTooLargeError : public std::runtime_error
    {
    public:
        ResponseTooLargeError(std::size_t size, std::size_t limit)
            : std::runtime_error("Response body of " + std::to_string(size) +
                                 " bytes exceeds idempotency capture limit of " +
                                 std::to_string(limit) + " bytes"),
              size_(size), limit_(limit) {}

        std::size_t getSize() const { return size_; }
        std::size_t getLimit() const { return limit_; }

    private:
        std::size_t size_;
        std::size_t limit_;
    };

    /**
     * @brief Повторный commit/rollback уже завершённой транзакции
     */
    class TransactionStateError : public std::logic_error
    {
    public:
        explicit TransactionStateError(const std::string &message)
            : std::logic_error(message) {}
    };

} // namespace newsletter::domain
