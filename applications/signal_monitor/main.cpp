// applications/signal_monitor/main.cpp
#include "crossover/core/clock.hpp"
#include "crossover/core/engine.hpp"
#include "crossover/core/settings.hpp"
#include "crossover/feed/zmq_quote_source.hpp"
#include "crossover/io/signal_log.hpp"
#include "crossover/utils/cancellation_token.hpp"
#include "crossover/utils/config.hpp"
#include "crossover/utils/logger.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [config_file]\n"
              << "  Polls quotes for the configured tickers during market hours and\n"
              << "  appends every moving-average signal change to the signal log.\n"
              << "  config_file defaults to crossover.conf\n";
}

// SIGINT/SIGTERM are blocked in every thread and collected here, so the
// token is cancelled from normal thread context.
std::thread start_signal_watcher(crossover::utils::CancellationToken& token, sigset_t signals) {
    return std::thread([&token, signals]() {
        int received = 0;
        while (!token.is_cancelled()) {
            if (sigwait(&signals, &received) != 0) {
                continue;
            }
            if (received == SIGUSR1) {
                return;
            }
            crossover::utils::Logger::warn() << "Received signal " << received << ", stopping after current step"
                                             << crossover::utils::Logger::endl;
            token.cancel();
        }
    });
}

} // namespace

int main(int argc, char** argv) {
    std::string config_file = "crossover.conf";
    if (argc > 1) {
        if (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        config_file = argv[1];
    }

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    crossover::utils::CancellationToken token;
    std::thread watcher = start_signal_watcher(token, signals);
    int exit_code = 0;

    try {
        auto config = crossover::utils::Config::instance();
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << ". Using defaults." << std::endl;
        }

        auto settings = crossover::core::MonitorSettings::from_config(*config);
        crossover::utils::Logger::set_level(settings.log_level);

        auto policy = settings.make_policy();
        auto signal_log = std::make_shared<crossover::io::CsvSignalLog>(settings.log_file, policy.zone());
        auto source = std::make_shared<crossover::feed::ZmqQuoteSource>(settings.quote_endpoint,
                                                                         settings.request_timeout);
        auto clock = std::make_shared<crossover::core::SystemClock>();

        crossover::core::Engine engine(settings.engine, policy, source, signal_log, clock);

        crossover::utils::Logger::info() << "Quotes from " << settings.quote_endpoint
                                         << ", signals to " << settings.log_file
                                         << crossover::utils::Logger::endl;
        engine.run(token);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    // Wake the watcher if no signal arrived.
    if (!token.is_cancelled()) {
        pthread_kill(watcher.native_handle(), SIGUSR1);
    }
    watcher.join();

    return exit_code;
}
