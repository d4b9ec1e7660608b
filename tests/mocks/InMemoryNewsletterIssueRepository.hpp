#pragma once

#include "ports/output/INewsletterIssueRepository.hpp"
#include "mocks/InMemoryIdempotencyStore.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace newsletter::tests::mocks
{

    /**
     * @brief In-Memory репозиторий выпусков
     *
     * Записи применяются только при commit() транзакции InMemoryIdempotencyStore.
     */
    class InMemoryNewsletterIssueRepository : public ports::output::INewsletterIssueRepository
    {
    public:
        void insertIssue(ports::output::ITransaction &tx,
                         const std::string &issueId,
                         const domain::NewsletterIssue &issue) override
        {
            ++insertCalls_;
            InMemoryTransaction::from(tx).onCommit([this, issueId, issue]()
                                                   {
                std::lock_guard<std::mutex> lock(mutex_);
                issues_[issueId] = issue; });
        }

        int enqueueDeliveryTasks(ports::output::ITransaction &tx, const std::string &issueId) override
        {
            std::vector<std::string> emails;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                emails = confirmedSubscribers_;
            }

            InMemoryTransaction::from(tx).onCommit([this, issueId, emails]()
                                                   {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto &email : emails)
                    deliveryQueue_.emplace_back(issueId, email); });
            return static_cast<int>(emails.size());
        }

        // Test helpers
        void addConfirmedSubscriber(const std::string &email)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            confirmedSubscribers_.push_back(email);
        }

        size_t issueCount() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return issues_.size();
        }

        size_t queuedDeliveries() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return deliveryQueue_.size();
        }

        int insertCalls() const { return insertCalls_; }

    private:
        mutable std::mutex mutex_;
        std::vector<std::string> confirmedSubscribers_;
        std::map<std::string, domain::NewsletterIssue> issues_;
        std::vector<std::pair<std::string, std::string>> deliveryQueue_;
        std::atomic<int> insertCalls_{0};
    };

} // namespace newsletter::tests::mocks
