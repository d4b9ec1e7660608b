#pragma once

#include <string>
#include <vector>

/**
 * Сохранённый HTTP ответ для повторной выдачи по ключу идемпотентности
 */
namespace newsletter::domain
{

    /**
     * @brief Заголовок ответа
     *
     * value хранится как сырые байты: HTTP не гарантирует, что это валидный текст.
     */
    struct HeaderPair
    {
        std::string name;
        std::string value;

        bool operator==(const HeaderPair &other) const
        {
            return name == other.name && value == other.value;
        }
    };

    /**
     * @brief Статус, заголовки (в исходном порядке, с повторами) и тело ответа
     */
    struct SavedResponse
    {
        int status = 0;
        std::vector<HeaderPair> headers;
        std::string body; ///< сырые байты, может содержать '\0'

        bool operator==(const SavedResponse &other) const
        {
            return status == other.status && headers == other.headers && body == other.body;
        }
    };

} // namespace newsletter::domain
