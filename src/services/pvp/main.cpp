/// @file main.cpp
/// @brief Arena server entry point.
///
/// Standalone executable hosting the PVP engine: matchmaking queue,
/// match lifecycle, spectators and seasonal Elo rankings.

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "arena/foundation/arena_logger.hpp"
#include "arena/foundation/arena_metrics.hpp"
#include "arena/foundation/config_manager.hpp"
#include "arena/service/pvp_engine.hpp"
#include "arena/service/pvp_store.hpp"
#include "arena/service/season_registry.hpp"
#include "arena/service/service_runner.hpp"
#include "arena/version.hpp"

namespace {

using arena::foundation::ArenaResult;

ArenaResult<void> bootstrapSeason(arena::service::SeasonRegistry& seasons,
                                  const arena::service::BootstrapSeason& spec) {
    auto now = std::chrono::system_clock::now();
    auto end = now + std::chrono::hours(24) * spec.durationDays;

    auto created = seasons.createSeason(spec.name, spec.number,
                                        arena::service::SeasonType::Regular, now, end);
    if (!created) {
        return ArenaResult<void>::err(created.error());
    }

    auto activated = seasons.activateSeason(created.value().seasonId);
    if (!activated) {
        return ArenaResult<void>::err(activated.error());
    }
    return ArenaResult<void>::ok();
}

} // namespace

int main(int argc, char* argv[]) {
    arena::service::SignalHandler signals;

    auto configPath = arena::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "/etc/arena/config.yaml";
    }

    arena::foundation::ConfigManager config;
    auto loadResult = arena::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    arena::service::applyLogLevels(config);
    auto engineCfg = arena::service::buildEngineConfig(config);

    auto store = std::make_shared<arena::service::InMemoryPvpStore>();
    auto seasons = std::make_shared<arena::service::SeasonRegistry>();

    if (auto bootstrap = arena::service::readBootstrapSeason(config)) {
        auto seeded = bootstrapSeason(*seasons, *bootstrap);
        if (!seeded) {
            std::cerr << "Failed to create season '" << bootstrap->name << "': "
                      << seeded.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    arena::service::PvpEngine engine(engineCfg, store, seasons);

    std::cout << "Arena server " << ARENA_VERSION_STRING << " started"
              << " (rating_range: " << engineCfg.queue.defaultRatingRange
              << ", initial_rating: " << engineCfg.initialRating << ")\n";

    arena::service::GracefulShutdown shutdown;
    shutdown.addHook("stats", [&engine]() {
        auto stats = engine.stats();
        std::cout << "Matches created: " << stats.matchesCreated
                  << ", finished: " << stats.matchesFinished
                  << ", still queued: " << stats.queuedPlayers << "\n";
        return ArenaResult<void>::ok();
    });
    shutdown.addHook("metrics", []() {
        std::cout << arena::foundation::ArenaMetrics::instance().scrape();
        return ArenaResult<void>::ok();
    });
    shutdown.addHook("logger", []() {
        return arena::foundation::ArenaLogger::instance().flush();
    });

    signals.waitForShutdown();

    std::cout << "Shutting down arena server...\n";
    auto failures = shutdown.execute();
    std::cout << "Arena server stopped\n";
    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
