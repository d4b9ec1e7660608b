#pragma once

#include "ports/input/INewsletterService.hpp"
#include "ports/output/INewsletterIssueRepository.hpp"
#include "utils/IdGenerator.hpp"
#include <memory>
#include <iostream>

namespace newsletter::application
{

    /**
     * @brief Публикация выпуска рассылки
     *
     * Письма не отправляются здесь: выпуск попадает в issue_delivery_queue,
     * откуда его забирает внешний delivery worker.
     */
    class NewsletterService : public ports::input::INewsletterService
    {
    public:
        explicit NewsletterService(std::shared_ptr<ports::output::INewsletterIssueRepository> issues)
            : issues_(std::move(issues))
        {
            std::cout << "[NewsletterService] Created" << std::endl;
        }

        domain::PublishResult publishIssue(ports::output::ITransaction &tx,
                                           const domain::NewsletterIssue &issue) override
        {
            domain::PublishResult result;
            result.issueId = utils::IdGenerator::withPrefix("issue");

            issues_->insertIssue(tx, result.issueId, issue);
            result.queuedDeliveries = issues_->enqueueDeliveryTasks(tx, result.issueId);

            std::cout << "[NewsletterService] Issue " << result.issueId << " queued for "
                      << result.queuedDeliveries << " subscribers" << std::endl;
            return result;
        }

    private:
        std::shared_ptr<ports::output::INewsletterIssueRepository> issues_;
    };

} // namespace newsletter::application
