#include "launchpad/access.hpp"
#include "launchpad/config.hpp"
#include "launchpad/coordinator.hpp"
#include "launchpad/errors.hpp"
#include "launchpad/http_client.hpp"
#include "launchpad/logging.hpp"

#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>
#include <vector>

using namespace launchpad;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        spdlog::error("usage: {} <config.json>", argv[0]);
        return 2;
    }

    try {
        CoordinatorConfig config = CoordinatorConfig::from_file(argv[1]);
        setup_logging(config.general.log_level);

        spdlog::info("==============================================");
        spdlog::info("Launchpad cross-chain coordinator");
        spdlog::info("==============================================");

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        auto allow_list = std::make_shared<AllowList>(config.admin);
        for (const auto& caller : config.allowed_callers) {
            allow_list->authorize(config.admin, caller, true);
        }

        CrossChainCoordinator coordinator(config, allow_list);
        for (const auto& chain : config.chains) {
            coordinator.add_chain(std::make_shared<HttpChainClient>(
                chain.chain_id, chain.relayer_url, config.retry.call_timeout));
        }
        std::vector<std::shared_ptr<HttpEventSource>> sources;
        for (const auto& chain : config.chains) {
            sources.push_back(std::make_shared<HttpEventSource>(chain.chain_id, chain.relayer_url));
            coordinator.add_event_source(sources.back());
            spdlog::info("Chain {} ({}){} via {}", chain.chain_id, chain.name,
                         chain.origin ? " [origin]" : "", chain.relayer_url);
        }

        coordinator.start();

        // Parked legs are retried once a minute
        auto last_redispatch = std::chrono::steady_clock::now();
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            auto now = std::chrono::steady_clock::now();
            if (now - last_redispatch >= std::chrono::minutes(1)) {
                last_redispatch = now;
                if (!coordinator.dead_letters().empty()) {
                    coordinator.redispatch_dead_letters();
                }
            }
        }

        coordinator.stop();

        // Relayers resume from these cursors on the next start
        for (const auto& source : sources) {
            spdlog::info("Chain {} event cursor at {}", source->chain_id(), source->cursor());
        }

        auto stats = coordinator.get_stats();
        spdlog::info("Handled {} events ({} rejected, {} discarded), {} deployments, "
                     "{} syncs, {} migrations, {} dead letters, {} bad relayer replies",
                     stats.events_handled, stats.events_rejected, stats.events_discarded,
                     stats.deployments, stats.syncs_sent, stats.migrations, stats.dead_lettered,
                     stats.source_errors);
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const LaunchpadError& e) {
        spdlog::critical("Fatal {} error: {}", to_string(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
