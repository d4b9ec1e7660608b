#pragma once

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace newsletter::settings::env
{

    inline std::string getOr(const char *name, const std::string &defaultValue)
    {
        const char *value = std::getenv(name);
        return value ? std::string(value) : defaultValue;
    }

    /**
     * @brief Целое без знака из ENV, иначе defaultValue
     *
     * Строка целиком должна быть числом: "-1", "30s", "" и переполнение
     * не принимаются.
     *
     * @throws std::invalid_argument с именем переменной
     */
    inline unsigned long long getUnsignedOr(const char *name,
                                            unsigned long long defaultValue,
                                            unsigned long long maxValue = std::numeric_limits<unsigned long long>::max())
    {
        const char *raw = std::getenv(name);
        if (!raw)
            return defaultValue;

        const std::string value(raw);
        // stoull молча заворачивает "-1" в ULLONG_MAX
        if (value.empty() || value.front() < '0' || value.front() > '9')
        {
            throw std::invalid_argument(std::string(name) + ": expected a non-negative integer, got '" + value + "'");
        }

        std::size_t pos = 0;
        unsigned long long parsed = 0;
        try
        {
            parsed = std::stoull(value, &pos);
        }
        catch (const std::out_of_range &)
        {
            throw std::invalid_argument(std::string(name) + ": value out of range '" + value + "'");
        }

        if (pos != value.size())
        {
            throw std::invalid_argument(std::string(name) + ": trailing characters in '" + value + "'");
        }
        if (parsed > maxValue)
        {
            throw std::invalid_argument(std::string(name) + ": value above " + std::to_string(maxValue));
        }
        return parsed;
    }

} // namespace newsletter::settings::env
