#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <utility>
#include <string>

namespace newsletter::adapters::primary
{

    /**
     * @brief GET /health : liveness для Kubernetes
     *
     * Базу не трогает: недоступный PostgreSQL даёт 500 на публикации,
     * а не перезапуск пода.
     */
    class HealthHandler : public IHttpHandler
    {
    public:
        explicit HealthHandler(std::string version = "1.0.0")
            : version_(std::move(version)), startedAt_(std::chrono::steady_clock::now()) {}

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                res.setResult(405, "application/json", R"({"error":"Method not allowed"})");
                return;
            }

            auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - startedAt_);

            nlohmann::json body = {
                {"status", "healthy"},
                {"service", "newsletter-service"},
                {"version", version_},
                {"uptime_seconds", uptime.count()}};
            res.setResult(200, "application/json", body.dump());
        }

    private:
        std::string version_;
        std::chrono::steady_clock::time_point startedAt_;
    };

} // namespace newsletter::adapters::primary
