#include <gtest/gtest.h>

#include "domain/IdempotencyKey.hpp"
#include "domain/errors/IdempotencyErrors.hpp"

using namespace newsletter::domain;

TEST(IdempotencyKeyTest, EmptyString_IsRejected)
{
    EXPECT_THROW(IdempotencyKey::parse(""), ValidationError);
}

TEST(IdempotencyKeyTest, WhitespaceOnly_IsRejected)
{
    EXPECT_THROW(IdempotencyKey::parse(" "), ValidationError);
    EXPECT_THROW(IdempotencyKey::parse("\t\n  "), ValidationError);
}

TEST(IdempotencyKeyTest, TooLong_IsRejected)
{
    EXPECT_THROW(IdempotencyKey::parse(std::string(300, 'x')), ValidationError);
    EXPECT_THROW(IdempotencyKey::parse(std::string(IdempotencyKey::MAX_LENGTH + 1, 'x')), ValidationError);
}

TEST(IdempotencyKeyTest, MaxLength_IsAccepted)
{
    auto key = IdempotencyKey::parse(std::string(IdempotencyKey::MAX_LENGTH, 'x'));
    EXPECT_EQ(key.value().size(), IdempotencyKey::MAX_LENGTH);
}

TEST(IdempotencyKeyTest, AlphanumericWithHyphen_IsAccepted)
{
    auto key = IdempotencyKey::parse("abc-123");
    EXPECT_EQ(key.value(), "abc-123");
}

TEST(IdempotencyKeyTest, Uuid_IsAccepted)
{
    EXPECT_NO_THROW(IdempotencyKey::parse("8f14e45f-ceea-467f-a8f2-3c1d9a2b7e10"));
}

TEST(IdempotencyKeyTest, ForbiddenCharacters_AreRejected)
{
    for (const std::string raw : {"abc 123", "abc/123", "abc_123", "a=b", "<key>", "{key}", "key\"", "ключ"})
    {
        EXPECT_THROW(IdempotencyKey::parse(raw), ValidationError) << "input: " << raw;
    }
}

TEST(IdempotencyKeyTest, SurroundingWhitespace_IsRejected)
{
    EXPECT_THROW(IdempotencyKey::parse(" abc-123"), ValidationError);
    EXPECT_THROW(IdempotencyKey::parse("abc-123\n"), ValidationError);
}

TEST(IdempotencyKeyTest, Equality_ComparesValue)
{
    EXPECT_EQ(IdempotencyKey::parse("abc"), IdempotencyKey::parse("abc"));
    EXPECT_NE(IdempotencyKey::parse("abc"), IdempotencyKey::parse("ABC"));
}
