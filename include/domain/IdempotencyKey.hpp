#pragma once

#include <string>
#include <cstddef>
#include <utility>

namespace newsletter::domain
{

    /**
     * @brief Ключ идемпотентности, присланный клиентом
     *
     * Создаётся только через parse(), поэтому любой экземпляр уже валиден:
     * - не пустой (после trim)
     * - не длиннее MAX_LENGTH символов
     * - только ASCII буквы, цифры и '-'
     *
     * Пример: "8f14e45f-ceea-467f-a8f2-3c1d9a2b7e10"
     */
    class IdempotencyKey
    {
    public:
        static constexpr std::size_t MAX_LENGTH = 50;

        /**
         * @brief Проверить строку и создать ключ
         * @throws ValidationError если строка не удовлетворяет правилам
         */
        static IdempotencyKey parse(const std::string &raw);

        const std::string &value() const { return value_; }

        bool operator==(const IdempotencyKey &other) const { return value_ == other.value_; }
        bool operator!=(const IdempotencyKey &other) const { return value_ != other.value_; }

    private:
        explicit IdempotencyKey(std::string value) : value_(std::move(value)) {}

        std::string value_;
    };

} // namespace newsletter::domain
