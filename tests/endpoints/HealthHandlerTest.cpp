#include <gtest/gtest.h>

#include "adapters/primary/HealthHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using newsletter::adapters::primary::HealthHandler;

TEST(HealthHandlerTest, Get_ReturnsHealthyWithVersion)
{
    HealthHandler handler("2.1.0");
    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/health");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["status"], "healthy");
    EXPECT_EQ(json["service"], "newsletter-service");
    EXPECT_EQ(json["version"], "2.1.0");
    EXPECT_GE(json["uptime_seconds"].get<long long>(), 0);
}

TEST(HealthHandlerTest, Post_Returns405)
{
    HealthHandler handler;
    SimpleRequest req;
    req.setMethod("POST");
    req.setPath("/health");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}
