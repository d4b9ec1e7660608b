#pragma once

#include "ports/output/ITransaction.hpp"
#include "domain/NewsletterIssue.hpp"

namespace newsletter::ports::input
{

    /**
     * @brief Интерфейс сервиса публикации рассылки
     */
    class INewsletterService
    {
    public:
        virtual ~INewsletterService() = default;

        /**
         * @brief Сохранить выпуск и поставить доставку в очередь
         *
         * Выполняется в транзакции захвата ключа идемпотентности.
         */
        virtual domain::PublishResult publishIssue(output::ITransaction &tx,
                                                   const domain::NewsletterIssue &issue) = 0;
    };

} // namespace newsletter::ports::input
