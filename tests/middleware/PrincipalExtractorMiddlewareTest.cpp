// tests/middleware/PrincipalExtractorMiddlewareTest.cpp
/**
 * @file PrincipalExtractorMiddlewareTest.cpp
 * @brief Unit-тесты для PrincipalExtractorMiddleware и ChainHandler
 */

#include <gtest/gtest.h>

#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/PrincipalExtractorMiddleware.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace newsletter::adapters::primary;

namespace
{
    // Пишет userId из attributes в тело ответа
    class EchoUserHandler : public IHttpHandler
    {
    public:
        void handle(IRequest &req, IResponse &res) override
        {
            ++calls;
            res.setResult(200, "text/plain", req.getAttribute("userId").value_or(""));
        }

        int calls = 0;
    };

    // Ничего не отвечает
    class SilentHandler : public IHttpHandler
    {
    public:
        void handle(IRequest &, IResponse &) override {}
    };
} // namespace

class PrincipalExtractorMiddlewareTest : public ::testing::Test
{
protected:
    SimpleRequest createRequest(const std::string &userId = "")
    {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath("/admin/newsletters");
        if (!userId.empty())
        {
            req.setHeader("X-User-Id", userId);
        }
        return req;
    }

    PrincipalExtractorMiddleware middleware_;
};

TEST_F(PrincipalExtractorMiddlewareTest, UserHeader_SetsAttribute)
{
    auto req = createRequest("user-001");
    SimpleResponse res;

    middleware_.handle(req, res);

    // статус 0: chain продолжится
    EXPECT_EQ(res.getStatus(), 0);
    EXPECT_EQ(req.getAttribute("userId").value_or(""), "user-001");
}

TEST_F(PrincipalExtractorMiddlewareTest, NoUserHeader_Returns401)
{
    auto req = createRequest();
    SimpleResponse res;

    middleware_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_TRUE(json["error"].get<std::string>().find("logged in") != std::string::npos);
}

TEST_F(PrincipalExtractorMiddlewareTest, Chain_PassesPrincipalToHandler)
{
    auto echo = std::make_shared<EchoUserHandler>();
    ChainHandler chain({std::make_shared<PrincipalExtractorMiddleware>(), echo});

    auto req = createRequest("user-042");
    SimpleResponse res;
    chain.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.getBody(), "user-042");
    EXPECT_EQ(echo->calls, 1);
}

TEST_F(PrincipalExtractorMiddlewareTest, Chain_StopsAtFirstStatus)
{
    auto echo = std::make_shared<EchoUserHandler>();
    ChainHandler chain({std::make_shared<PrincipalExtractorMiddleware>(), echo});

    auto req = createRequest();
    SimpleResponse res;
    chain.handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(echo->calls, 0);
}

TEST_F(PrincipalExtractorMiddlewareTest, Chain_WithoutAnswer_Returns500)
{
    ChainHandler chain({std::make_shared<PrincipalExtractorMiddleware>(), std::make_shared<SilentHandler>()});

    auto req = createRequest("user-001");
    SimpleResponse res;
    chain.handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}
