#pragma once

#include <string>

namespace newsletter::domain
{

    /**
     * @brief Выпуск рассылки, который публикует администратор
     */
    struct NewsletterIssue
    {
        std::string title;
        std::string textContent;
        std::string htmlContent;

        /**
         * @brief Проверить поля и собрать выпуск
         * @throws ValidationError пустой заголовок или нет ни одного варианта содержимого
         */
        static NewsletterIssue parse(const std::string &title,
                                     const std::string &textContent,
                                     const std::string &htmlContent);
    };

    /**
     * @brief Результат публикации выпуска
     */
    struct PublishResult
    {
        std::string issueId;      ///< "issue-xxxxxxxx-..."
        int queuedDeliveries = 0; ///< задач в issue_delivery_queue
    };

} // namespace newsletter::domain
