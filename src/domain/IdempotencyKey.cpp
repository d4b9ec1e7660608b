#include "domain/IdempotencyKey.hpp"
#include "domain/errors/IdempotencyErrors.hpp"

#include <algorithm>
#include <cctype>

namespace newsletter::domain
{

    namespace
    {
        bool isAllowedChar(unsigned char c)
        {
            return (c < 0x80 && std::isalnum(c)) || c == '-';
        }

        bool isBlank(const std::string &s)
        {
            return std::all_of(s.begin(), s.end(), [](unsigned char c)
                               { return std::isspace(c); });
        }
    } // namespace

    IdempotencyKey IdempotencyKey::parse(const std::string &raw)
    {
        if (raw.empty() || isBlank(raw))
        {
            throw ValidationError("The idempotency key cannot be empty");
        }

        if (raw.size() > MAX_LENGTH)
        {
            throw ValidationError("The idempotency key must be shorter than " +
                                  std::to_string(MAX_LENGTH + 1) + " characters");
        }

        if (!std::all_of(raw.begin(), raw.end(), [](unsigned char c)
                         { return isAllowedChar(c); }))
        {
            throw ValidationError("The idempotency key may only contain ASCII letters, digits and '-'");
        }

        return IdempotencyKey(raw);
    }

} // namespace newsletter::domain
