#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IIdempotencyService.hpp"
#include "ports/input/INewsletterService.hpp"
#include "settings/IdempotencySettings.hpp"
#include "adapters/primary/ResponseCapture.hpp"
#include "adapters/primary/JsonError.hpp"
#include "domain/IdempotencyKey.hpp"
#include "domain/NewsletterIssue.hpp"
#include "domain/errors/IdempotencyErrors.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <iostream>

namespace newsletter::adapters::primary
{

    /**
     * @brief POST /admin/newsletters : опубликовать выпуск рассылки
     *
     * Body: {"title", "text_content", "html_content", "idempotency_key"}
     * Ключ можно передать и заголовком Idempotency-Key (поле тела важнее).
     *
     * Повтор с тем же ключом от того же пользователя получает
     * байт-в-байт тот же ответ, выпуск повторно не создаётся.
     *
     * Требует attribute "userId" (PrincipalExtractorMiddleware).
     */
    class PublishNewsletterHandler : public IHttpHandler
    {
    public:
        static constexpr const char *IDEMPOTENCY_KEY_HEADER = "Idempotency-Key";
        static constexpr const char *REDIRECT_LOCATION = "/admin/newsletters";

        PublishNewsletterHandler(
            std::shared_ptr<ports::input::IIdempotencyService> idempotency,
            std::shared_ptr<ports::input::INewsletterService> newsletter,
            std::shared_ptr<settings::IdempotencySettings> settings)
            : idempotency_(std::move(idempotency)),
              newsletter_(std::move(newsletter)),
              settings_(std::move(settings))
        {
            std::cout << "[PublishNewsletterHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            std::string userId = req.getAttribute("userId").value_or("");
            if (userId.empty())
            {
                sendError(res, 401, "You must be logged in to publish a newsletter issue");
                return;
            }

            nlohmann::json body;
            try
            {
                body = nlohmann::json::parse(req.getBody());
            }
            catch (const nlohmann::json::exception &)
            {
                sendError(res, 400, "Invalid JSON");
                return;
            }
            if (!body.is_object())
            {
                sendError(res, 400, "Invalid JSON");
                return;
            }

            std::optional<domain::IdempotencyKey> key;
            std::optional<domain::NewsletterIssue> issue;
            try
            {
                key = domain::IdempotencyKey::parse(extractRawKey(req, body));
                issue = domain::NewsletterIssue::parse(
                    stringField(body, "title"),
                    stringField(body, "text_content"),
                    stringField(body, "html_content"));
            }
            catch (const domain::ValidationError &e)
            {
                sendError(res, 400, e.what());
                return;
            }

            try
            {
                auto action = idempotency_->tryProcess(userId, *key);
                if (!action.isStartProcessing())
                {
                    reconstruct(action.cachedResponse(), res);
                    return;
                }

                // Владеем транзакцией захвата: выход по исключению откатит и выпуск, и захват
                auto tx = action.takeTransaction();
                auto result = newsletter_->publishIssue(*tx, *issue);

                ResponseCapture capture(settings_->getMaxResponseBodyBytes());
                writeAccepted(capture, result);
                auto saved = capture.capture();

                idempotency_->finalize(std::move(tx), userId, *key, saved);
                reconstruct(saved, res);
            }
            catch (const domain::InvariantViolation &e)
            {
                std::cerr << "[PublishNewsletterHandler] Concurrent request in flight for key "
                          << key->value() << ": " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
            catch (const domain::StorageError &e)
            {
                std::cerr << "[PublishNewsletterHandler] Storage error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PublishNewsletterHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IIdempotencyService> idempotency_;
        std::shared_ptr<ports::input::INewsletterService> newsletter_;
        std::shared_ptr<settings::IdempotencySettings> settings_;

        static std::string stringField(const nlohmann::json &body, const char *name)
        {
            auto it = body.find(name);
            if (it == body.end() || !it->is_string())
                return "";
            return it->get<std::string>();
        }

        static std::string extractRawKey(IRequest &req, const nlohmann::json &body)
        {
            std::string raw = stringField(body, "idempotency_key");
            if (raw.empty())
            {
                raw = req.getHeader(IDEMPOTENCY_KEY_HEADER).value_or("");
            }
            return raw;
        }

        // 303 See Other -> /admin/newsletters
        static void writeAccepted(IResponse &res, const domain::PublishResult &result)
        {
            nlohmann::json response;
            response["newsletter_issue_id"] = result.issueId;
            response["queued_deliveries"] = result.queuedDeliveries;
            response["message"] = "The newsletter issue has been accepted - emails will go out shortly.";

            res.setStatus(303);
            res.setHeader("Content-Type", "application/json");
            res.setHeader("Location", REDIRECT_LOCATION);
            res.setBody(response.dump());
        }
    };

} // namespace newsletter::adapters::primary
