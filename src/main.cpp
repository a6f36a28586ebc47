#include <csignal>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "Errors.h"
#include "Logger.h"
#include "ProxyConfig.h"
#include "Supervisor.h"

namespace {

void log_stats(Logger& logger, const AggregateStats& stats) {
    logger.log(LogLevel::INFO,
               "Active: " + std::to_string(stats.totals.active_connections) +
               ", total: " + std::to_string(stats.totals.total_connections) +
               ", in: " + std::to_string(stats.totals.total_bytes_in) +
               ", out: " + std::to_string(stats.totals.total_bytes_out) +
               ", errors: " + std::to_string(stats.totals.total_errors) +
               ", workers: " + std::to_string(stats.live_workers) + "/" + std::to_string(stats.workers.size()) +
               ", restarts: " + std::to_string(stats.total_restarts) +
               ", bandwidth: " + std::to_string(static_cast<uint64_t>(stats.bandwidth_bps)) + " B/s");
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "config.json";

    ProxyConfig config;
    std::ifstream config_file(config_path);
    if (!config_file) {
        std::cerr << "Failed to open " << config_path << ", using defaults\n";
    } else {
        config_file.close();
        try {
            config = ProxyConfig::from_file(config_path);
        } catch (const InvalidConfig& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }

    Logger logger(log_level_from_string(config.log_level), config.log_file);
    logger.set_tag("supervisor");

    // Signals are taken synchronously below; workers inherit the mask and
    // reset it themselves.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    signal(SIGPIPE, SIG_IGN);

    std::unique_ptr<Supervisor> server;
    try {
        server = create_proxy_server(config, logger);
    } catch (const ProxyError& e) {
        logger.log(LogLevel::CRITICAL, std::string("Failed to start proxy: ") + e.what());
        return 1;
    }

    logger.log(LogLevel::INFO, std::string(config.protocol == ProxyProtocol::HTTP ? "HTTP" : "SOCKS5") +
               " proxy running on " + config.bind_address + ":" +
               std::to_string(server->listen_port()) + " with " + std::to_string(config.worker_count) +
               " workers. Press Ctrl+C to stop...");

    const timespec interval{5, 0};
    while (true) {
        int sig = sigtimedwait(&signals, nullptr, &interval);
        if (sig == SIGINT || sig == SIGTERM) {
            logger.log(LogLevel::INFO, std::string("Received ") + strsignal(sig) + ", shutting down");
            break;
        }
        log_stats(logger, server->current_stats());
    }

    server->shutdown();
    server->wait_until_stopped();

    logger.log(LogLevel::INFO, "Final Statistics:");
    log_stats(logger, server->current_stats());
    return 0;
}
