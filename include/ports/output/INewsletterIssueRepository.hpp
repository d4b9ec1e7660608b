#pragma once

#include "ports/output/ITransaction.hpp"
#include "domain/NewsletterIssue.hpp"
#include <string>

namespace newsletter::ports::output
{

    /**
     * @brief Репозиторий выпусков рассылки и очереди доставки
     *
     * Все записи делаются в транзакции вызывающего, чтобы выпуск
     * и сохранённый ответ коммитились вместе.
     */
    class INewsletterIssueRepository
    {
    public:
        virtual ~INewsletterIssueRepository() = default;

        virtual void insertIssue(ITransaction &tx,
                                 const std::string &issueId,
                                 const domain::NewsletterIssue &issue) = 0;

        /**
         * @brief Поставить выпуск в очередь для всех подтверждённых подписчиков
         * @return количество поставленных задач
         */
        virtual int enqueueDeliveryTasks(ITransaction &tx, const std::string &issueId) = 0;
    };

} // namespace newsletter::ports::output
