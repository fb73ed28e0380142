#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "api/Controllers.hpp"
#include "api/HttpServer.hpp"
#include "api/ToolSchema.hpp"
#include "api/ToolServer.hpp"
#include "app/RenderService.h"
#include "config/ConfigProvider.h"
#include "logging/Log.h"
#include "ui/ResourceProvider.h"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

void printHelp(const gridimg::config::Config& defaults) {
    using gridimg::config::ConfigProvider;
    std::cout << "Usage: gridimg_server [options]\n"
              << "      --transport MODE        stdio|http (default: "
              << ConfigProvider::transportToString(defaults.transport) << ")\n"
              << "      --http                  Same as --transport http\n"
              << "      --host ADDRESS          (default: " << defaults.host << ")\n"
              << "  -p, --port N                (default: " << defaults.port << ")\n"
              << "  -t, --threads N             (default: " << defaults.threads << ")\n"
              << "      --cors-origin ORIGIN    Enables Access-Control-Allow-Origin\n"
              << "      --font PATH             Preferred TTF/OTF font\n"
              << "      --symbol-policy POLICY  coerce|reject (default: "
              << ConfigProvider::symbolPolicyToString(defaults.symbolPolicy) << ")\n"
              << "      --config FILE           key=value file\n"
              << "  -l, --log-level LEVEL       trace|debug|info|warn|error (default: "
              << ConfigProvider::logLevelToString(defaults.logLevel) << ")\n"
              << "      --help                  Show this help\n"
              << "      --version               Show the version\n"
              << "Environment: GRIDIMG_TRANSPORT, GRIDIMG_HOST, GRIDIMG_PORT, GRIDIMG_THREADS,\n"
              << "             GRIDIMG_CORS_ORIGIN, GRIDIMG_FONT, GRIDIMG_SYMBOL_POLICY,\n"
              << "             GRIDIMG_LOG_LEVEL, GRIDIMG_CONFIG\n";
}

int runHttp(const gridimg::config::Config& config) {
    using namespace gridimg;

    api::Endpoint endpoint{config.host, config.port};
    api::HttpServer server(endpoint, static_cast<std::size_t>(config.threads));

    api::HttpServer::CorsConfig corsConfig{};
    corsConfig.enabled = !config.corsOrigin.empty();
    corsConfig.origin = config.corsOrigin;
    server.setCorsConfig(std::move(corsConfig));

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    server.start();
    LOG_INFO(logging::LogCategory::HTTP, "Server running, waiting for requests");

    while (gSignalStatus == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO(logging::LogCategory::HTTP, "Signal %d received, shutting down", static_cast<int>(gSignalStatus));
    server.stop();
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace gridimg;

    try {
        config::ConfigProvider provider(argc, argv);
        const config::Config& config = provider.get();

        if (config.showHelp) {
            printHelp(config::Config{});
            return EXIT_SUCCESS;
        }
        if (config.showVersion) {
            std::cout << "gridimg_server " << api::kServiceVersion << '\n';
            return EXIT_SUCCESS;
        }

        logging::Log::set_log_level(config.logLevel);
        LOG_INFO(logging::LogCategory::CONFIG, "Configuration loaded");
        LOG_INFO(logging::LogCategory::CONFIG, "  Transport: %s",
                 config::ConfigProvider::transportToString(config.transport).c_str());
        LOG_INFO(logging::LogCategory::CONFIG, "  Log level: %s", logging::Log::level_to_string(config.logLevel));
        if (config.transport == config::Transport::Http) {
            LOG_INFO(logging::LogCategory::CONFIG, "  Listen: %s:%u", config.host.c_str(),
                     static_cast<unsigned>(config.port));
            LOG_INFO(logging::LogCategory::CONFIG, "  Worker threads: %d", config.threads);
            LOG_DEBUG(logging::LogCategory::CONFIG, "  CORS origin: %s",
                      config.corsOrigin.empty() ? "(disabled)" : config.corsOrigin.c_str());
        }
        LOG_DEBUG(logging::LogCategory::CONFIG, "  Font: %s", config.fontPath.empty() ? "(auto)" : config.fontPath.c_str());
        LOG_DEBUG(logging::LogCategory::CONFIG, "  Symbol policy: %s",
                  config::ConfigProvider::symbolPolicyToString(config.symbolPolicy).c_str());
        if (!config.configFile.empty()) {
            LOG_DEBUG(logging::LogCategory::CONFIG, "  Config file: %s", config.configFile.c_str());
        }

        ui::ResourceProvider::configureShared(config.fontPath);

        auto service = std::make_shared<const app::RenderService>(config, ui::ResourceProvider::shared());

        if (config.transport == config::Transport::Http) {
            api::setRenderService(service);
            return runHttp(config);
        }

        api::ToolServer toolServer(service);
        return toolServer.run(std::cin, std::cout);
    }
    catch (const std::exception& ex) {
        std::cerr << "Fatal: " << ex.what() << '\n';
        return EXIT_FAILURE;
    }
}
