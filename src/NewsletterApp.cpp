#include "NewsletterApp.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/IdempotencySettings.hpp"

// Ports
#include "ports/input/IIdempotencyService.hpp"
#include "ports/input/INewsletterService.hpp"
#include "ports/output/IIdempotencyStore.hpp"
#include "ports/output/INewsletterIssueRepository.hpp"

// Application
#include "application/IdempotencyService.hpp"
#include "application/NewsletterService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresIdempotencyStore.hpp"
#include "adapters/secondary/PostgresNewsletterIssueRepository.hpp"

// Primary Adapters
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/PrincipalExtractorMiddleware.hpp"
#include "adapters/primary/PublishNewsletterHandler.hpp"

#include <iostream>
#include <memory>
#include <vector>

namespace di = boost::di;

namespace newsletter
{

    NewsletterApp::NewsletterApp()
    {
        std::cout << "[NewsletterApp] Initializing..." << std::endl;
    }

    NewsletterApp::~NewsletterApp()
    {
        std::cout << "[NewsletterApp] Shutting down..." << std::endl;
    }

    void NewsletterApp::loadEnvironment(int argc, char *argv[])
    {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[NewsletterApp] Environment loaded" << std::endl;
    }

    void NewsletterApp::configureInjection()
    {
        std::cout << "[NewsletterApp] Configuring DI..." << std::endl;

        auto injector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton),
            di::bind<settings::IdempotencySettings>().in(di::singleton),

            di::bind<ports::output::IIdempotencyStore>()
                .to<adapters::secondary::PostgresIdempotencyStore>()
                .in(di::singleton),
            di::bind<ports::output::INewsletterIssueRepository>()
                .to<adapters::secondary::PostgresNewsletterIssueRepository>()
                .in(di::singleton),

            di::bind<ports::input::IIdempotencyService>().to<application::IdempotencyService>().in(di::singleton),
            di::bind<ports::input::INewsletterService>().to<application::NewsletterService>().in(di::singleton));

        handlers_[getHandlerKey("GET", "/health")] = std::make_shared<adapters::primary::HealthHandler>();

        // principal -> идемпотентная публикация
        auto publishHandler = injector.create<std::shared_ptr<adapters::primary::PublishNewsletterHandler>>();
        auto principalMiddleware = std::make_shared<adapters::primary::PrincipalExtractorMiddleware>();
        handlers_[getHandlerKey("POST", "/admin/newsletters")] =
            std::make_shared<adapters::primary::ChainHandler>(
                std::vector<std::shared_ptr<IHttpHandler>>{principalMiddleware, publishHandler});

        std::cout << "[NewsletterApp] Ready" << std::endl;
    }

} // namespace newsletter
