#include "proxykeeper/config/PoolConfig.hpp"
#include "proxykeeper/service/PoolManager.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <filesystem>
#include <string>
#include <thread>

int main(int argc, char** argv) {
    using namespace proxykeeper;
    util::initLogging(util::LogLevel::info);

    const std::filesystem::path configPath = argc > 1 ? argv[1] : "data/proxykeeper.json";
    auto config = config::loadPoolConfig(configPath);
    util::initLogging(config.logLevel);

    util::log(util::LogLevel::info,
              "Proxy pool target " + std::to_string(config.targetCount) + ", threshold " +
                  std::to_string(config.minThreshold) + ", probe " + config.probeUrl);

    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);
    std::thread ioThread;
    try {
        service::PoolManager manager{io, config};

        boost::asio::signal_set signals{io, SIGINT, SIGTERM};
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            util::log(util::LogLevel::info, "Received signal " + std::to_string(signal) + ", shutting down");
            manager.stop();
            work.reset();
            io.stop();
        });

        // Signals are served while the first fill runs on this thread.
        ioThread = std::thread([&io]() { io.run(); });

        try {
            manager.initialize();
            for (const auto& proxy : manager.snapshot()) {
                util::log(util::LogLevel::info, "  " + proxy.uri);
            }
        } catch (const std::exception&) {
            // The io thread still references the manager.
            io.stop();
            ioThread.join();
            throw;
        }

        ioThread.join();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"proxykeeper terminated: "} + ex.what());
        return 1;
    }
    return 0;
}
