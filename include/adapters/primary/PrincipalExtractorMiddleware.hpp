#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/JsonError.hpp"
#include <iostream>

namespace newsletter::adapters::primary
{

    /**
     * @brief Middleware: X-User-Id -> attribute "userId"
     *
     * Заголовок выставляет auth gateway после проверки сессии,
     * сам сервис учётные данные не проверяет.
     */
    class PrincipalExtractorMiddleware : public IHttpHandler
    {
    public:
        static constexpr const char *USER_ID_HEADER = "X-User-Id";
        static constexpr const char *USER_ID_ATTRIBUTE = "userId";

        PrincipalExtractorMiddleware()
        {
            std::cout << "[PrincipalExtractorMiddleware] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string userId = req.getHeader(USER_ID_HEADER).value_or("");
            if (userId.empty())
            {
                sendError(res, 401, "You must be logged in to publish a newsletter issue");
                return;
            }

            req.setAttribute(USER_ID_ATTRIBUTE, userId);
            res.setStatus(0); // для middleware
        }
    };

} // namespace newsletter::adapters::primary
