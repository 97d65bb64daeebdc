// main.cpp
#include "capsync_client.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include "logger/Mylogger.hpp"

using namespace std::chrono_literals;

// Global atomic flag for shutdown control
std::atomic<bool> running{true};

void signal_handler(int)
{
    running = false;
}

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::string config_path = (argc > 1) ? argv[1] : "config/capsync_config.json";

    try
    {
        config::EngineConfig cfg = config::loadEngineConfig(config_path);
        MyLogger::init(cfg.log_file, cfg.log_level);
        MyLogger::info("=== capsync starting, config " + config_path + " ===");
        MyLogger::info("Store: " + cfg.store_path + ", server: " + cfg.server_url);

        CapsyncClient client(cfg);
        client.initialize();
        if (cfg.auth_token.empty())
            MyLogger::warning("No auth_token configured, sync stays idle until one is supplied");
        client.start();

        auto lastReport = std::chrono::steady_clock::now();
        while (running)
        {
            std::this_thread::sleep_for(500ms);
            if (std::chrono::steady_clock::now() - lastReport > 60s)
            {
                MyLogger::info("Status: " + client.status().dump());
                lastReport = std::chrono::steady_clock::now();
            }
        }

        MyLogger::info("=== Initiating Shutdown ===");
        client.stop();
        MyLogger::info("Shutdown complete.");
    }
    catch (const std::exception &e)
    {
        std::cerr << "\n!!! Critical Error: " << e.what() << " !!!\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
