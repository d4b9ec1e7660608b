#pragma once

#include "ports/output/IIdempotencyStore.hpp"
#include <gmock/gmock.h>

namespace newsletter::tests::mocks
{

    class MockIdempotencyStore : public ports::output::IIdempotencyStore
    {
    public:
        MOCK_METHOD(std::unique_ptr<ports::output::ITransaction>, beginTransaction, (), (override));
        MOCK_METHOD(ports::output::ClaimOutcome, insertClaimIfAbsent,
                    (ports::output::ITransaction &, const std::string &, const domain::IdempotencyKey &),
                    (override));
        MOCK_METHOD(void, finalize,
                    (ports::output::ITransaction &, const std::string &, const domain::IdempotencyKey &,
                     const domain::SavedResponse &),
                    (override));
        MOCK_METHOD(std::optional<domain::SavedResponse>, fetchCompleted,
                    (const std::string &, const domain::IdempotencyKey &), (override));
    };

    /**
     * @brief Транзакция, которая считает commit/rollback
     */
    class MockTransaction : public ports::output::ITransaction
    {
    public:
        MOCK_METHOD(void, commit, (), (override));
        MOCK_METHOD(void, rollback, (), (override));
        MOCK_METHOD(bool, isActive, (), (const, override));
    };

} // namespace newsletter::tests::mocks
