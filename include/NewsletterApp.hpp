// include/NewsletterApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <boost/di.hpp>

/**
 * @class NewsletterApp
 * @brief Newsletter Service: идемпотентная публикация выпусков рассылки
 *
 * Наследует BoostBeastApplication (Template Method):
 * 1. loadEnvironment()    - окружение
 * 2. configureInjection() - Boost.DI и регистрация handlers
 * 3. start()              - HTTP сервер (из базового класса)
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapters:   PrincipalExtractorMiddleware, PublishNewsletterHandler, HealthHandler
 * - Application:        IdempotencyService, NewsletterService
 * - Secondary Adapters: PostgresIdempotencyStore, PostgresNewsletterIssueRepository
 */
namespace newsletter
{

    class NewsletterApp : public BoostBeastApplication
    {
    public:
        NewsletterApp();
        ~NewsletterApp() override;

    protected:
        void loadEnvironment(int argc, char *argv[]) override;
        void configureInjection() override;
    };

} // namespace newsletter
