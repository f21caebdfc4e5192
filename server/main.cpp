#include <Ascent/Core/Logger.hpp>
#include <Ascent/Game/FairnessCommitment.hpp>
#include <Ascent/Game/GameConfig.hpp>
#include <Ascent/Game/RoundEngine.hpp>
#include <Ascent/Game/RoundStore.hpp>
#include <Ascent/Game/Scheduler.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "AdminServer.hpp"
#include "WebSocketGateway.hpp"

using namespace Ascent;

namespace {

bool InitializeLogging(const Game::GameConfig& config) {
    auto outputs = Core::LogOutput::Console;
    if (!config.logFile.empty()) {
        outputs = outputs | Core::LogOutput::File;
    }
    return Core::Logger::Instance().Initialize(config.logLevel, outputs, config.logFile);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config-file]" << std::endl;
        return 2;
    }

    // Configuration errors are reported before the configured logger exists
    if (!Core::Logger::Instance().Initialize(Core::LogLevel::Info, Core::LogOutput::Console)) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }

    const std::string configPath = argc == 2 ? argv[1] : "";
    auto loaded = Game::GameConfig::load(configPath);
    if (loaded.isFailure()) {
        std::cerr << "Configuration rejected: " << getErrorMessage(loaded.error()) << std::endl;
        return 1;
    }
    const Game::GameConfig config = std::move(loaded).value();

    Core::Logger::Instance().Shutdown();
    if (!InitializeLogging(config)) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }

    ASCENT_LOG_INFO("========================================");
    ASCENT_LOG_INFO("  Ascent Round Server");
    ASCENT_LOG_INFO("========================================");
    ASCENT_LOG_INFO_F("Client seed '%s', edge factor %.4f", config.clientSeed.c_str(), config.edgeFactor);

    // Persistence
    std::shared_ptr<Game::PersistenceQueue> persistence;
    if (!config.persistencePath.empty()) {
        persistence = std::make_shared<Game::PersistenceQueue>(
            std::make_shared<Game::JsonLinesRoundStore>(config.persistencePath),
            config.persistenceQueueDepth);
        auto started = persistence->start();
        if (started.isFailure()) {
            ASCENT_LOG_CRITICAL_F("Persistence queue failed to start: %s",
                                  std::string(getErrorMessage(started.error())).c_str());
            return 1;
        }
        ASCENT_LOG_INFO_F("Recording rounds to %s", config.persistencePath.c_str());
    } else {
        ASCENT_LOG_WARNING("Persistence disabled; rounds are not recorded");
    }

    // Round engine
    Game::ThreadScheduler scheduler;
    auto schedulerStarted = scheduler.start();
    if (schedulerStarted.isFailure()) {
        ASCENT_LOG_CRITICAL_F("Scheduler failed to start: %s",
                              std::string(getErrorMessage(schedulerStarted.error())).c_str());
        if (persistence) {
            persistence->stop();
        }
        return 1;
    }

    Game::RoundEngine engine(config, scheduler, Game::FairnessCommitment(config.edgeFactor), persistence);

    Server::WebSocketGateway gateway(engine, config.bindAddress, config.port, config.sessionQueueDepth);
    std::unique_ptr<Server::AdminServer> admin;
    if (config.adminPort != 0) {
        admin = std::make_unique<Server::AdminServer>(engine, persistence, config.bindAddress, config.adminPort);
    }

    auto shutdown = [&]() {
        gateway.Stop();
        if (admin) {
            admin->Stop();
        }
        engine.stop();
        scheduler.stop();
        if (persistence) {
            persistence->stop();
        }
    };

    Result<void> started = engine.start();
    if (started.isSuccess()) {
        started = gateway.Start();
    }
    if (started.isSuccess() && admin) {
        started = admin->Start();
    }
    if (started.isFailure()) {
        ASCENT_LOG_CRITICAL_F("Server failed to start: %s",
                              std::string(getErrorMessage(started.error())).c_str());
        shutdown();
        Core::Logger::Instance().Shutdown();
        return 1;
    }

    ASCENT_LOG_INFO_F("Players: ws://%s:%u", config.bindAddress.c_str(), static_cast<unsigned>(gateway.LocalPort()));
    ASCENT_LOG_INFO("Press Ctrl+C to stop");

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signals_ioc;
    boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            ASCENT_LOG_INFO_F("Received signal %d, shutting down", signal);
        }
    });
    signals_ioc.run();

    shutdown();

    if (persistence) {
        const auto stats = persistence->statistics();
        ASCENT_LOG_INFO_F("Persistence: %llu written, %llu failed, %llu dropped",
                          static_cast<unsigned long long>(stats.written),
                          static_cast<unsigned long long>(stats.failed),
                          static_cast<unsigned long long>(stats.dropped));
    }

    ASCENT_LOG_INFO("Server stopped");
    Core::Logger::Instance().Shutdown();
    return 0;
}
