#include "NewsletterApp.hpp"
#include <iostream>
#include <csignal>

// Global pointer for signal handler
newsletter::NewsletterApp *g_app = nullptr;

void signalHandler(int signal)
{
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app)
    {
        g_app->stop();
    }
}

int main(int argc, char *argv[])
{
    try
    {
        newsletter::NewsletterApp app;
        g_app = &app;

        // graceful shutdown в Kubernetes
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Newsletter Service v1.0.0 Starting" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Newsletter Service stopped" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
