#pragma once

#include "ports/output/INewsletterIssueRepository.hpp"
#include "adapters/secondary/PostgresTransaction.hpp"
#include <pqxx/pqxx>
#include <iostream>

namespace newsletter::adapters::secondary
{

    /**
     * @brief PostgreSQL репозиторий выпусков (newsletter_issues + issue_delivery_queue)
     */
    class PostgresNewsletterIssueRepository : public ports::output::INewsletterIssueRepository
    {
    public:
        PostgresNewsletterIssueRepository()
        {
            std::cout << "[PostgresNewsletterIssueRepository] Created" << std::endl;
        }

        void insertIssue(ports::output::ITransaction &tx,
                         const std::string &issueId,
                         const domain::NewsletterIssue &issue) override
        {
            auto &work = PostgresTransaction::from(tx).work();
            try
            {
                work.exec_params(
                    R"(
                        INSERT INTO newsletter_issues
                            (newsletter_issue_id, title, text_content, html_content, published_at)
                        VALUES ($1, $2, $3, $4, NOW())
                    )",
                    issueId, issue.title, issue.textContent, issue.htmlContent);
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresNewsletterIssueRepository] insertIssue() failed: " << e.what() << std::endl;
                throw domain::StorageError(std::string("Failed to store newsletter issue: ") + e.what());
            }
        }

        int enqueueDeliveryTasks(ports::output::ITransaction &tx, const std::string &issueId) override
        {
            auto &work = PostgresTransaction::from(tx).work();
            try
            {
                auto r = work.exec_params(
                    R"(
                        INSERT INTO issue_delivery_queue (newsletter_issue_id, subscriber_email)
                        SELECT $1, email
                        FROM subscriptions
                        WHERE status = 'confirmed'
                    )",
                    issueId);
                return static_cast<int>(r.affected_rows());
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresNewsletterIssueRepository] enqueueDeliveryTasks() failed: " << e.what() << std::endl;
                throw domain::StorageError(std::string("Failed to enqueue delivery tasks: ") + e.what());
            }
        }
    };

} // namespace newsletter::adapters::secondary
