#include "domain/NewsletterIssue.hpp"
#include "domain/errors/IdempotencyErrors.hpp"

#include <algorithm>
#include <cctype>

namespace newsletter::domain
{

    namespace
    {
        bool isBlank(const std::string &s)
        {
            return std::all_of(s.begin(), s.end(), [](unsigned char c)
                               { return std::isspace(c); });
        }
    } // namespace

    NewsletterIssue NewsletterIssue::parse(const std::string &title,
                                           const std::string &textContent,
                                           const std::string &htmlContent)
    {
        if (isBlank(title))
        {
            throw ValidationError("Newsletter title is required");
        }
        if (isBlank(textContent) && isBlank(htmlContent))
        {
            throw ValidationError("Newsletter content is required");
        }

        return NewsletterIssue{title, textContent, htmlContent};
    }

} // namespace newsletter::domain
