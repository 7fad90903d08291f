/// @file service_runner.cpp
/// @brief Implementation of the arena server entry-point utilities.

#include "arena/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string_view>
#include <thread>

#include "arena/foundation/arena_logger.hpp"

namespace arena::service {

using foundation::ArenaResult;
using foundation::ArenaLogger;
using foundation::ConfigManager;
using foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

std::size_t GracefulShutdown::execute() {
    std::size_t failures = 0;
    for (const auto& hook : hooks_) {
        auto result = hook.callback();
        if (!result) {
            ++failures;
            foundation::LogContext ctx;
            ctx.extra["hook"] = hook.name;
            ctx.extra["error"] = std::string(result.error().message());
            ARENA_LOG_CTX(foundation::LogLevel::Error, LogCategory::Core,
                          "Shutdown hook failed", ctx);
        }
    }
    return failures;
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

// -- Config loading ----------------------------------------------------------

ArenaResult<void> loadConfig(ConfigManager& config, const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("ARENA_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

// -- Config translation ------------------------------------------------------

EngineConfig buildEngineConfig(const ConfigManager& config) {
    EngineConfig cfg;

    auto range = config.get<int>("arena.queue.default_rating_range");
    if (range) {
        cfg.queue.defaultRatingRange = range.value();
    }

    auto wait = config.get<int>("arena.queue.wait_seconds_per_entry");
    if (wait) {
        cfg.queue.waitPerEntry = std::chrono::seconds(wait.value());
    }

    auto initial = config.get<int>("arena.rating.initial_rating");
    if (initial) {
        cfg.initialRating = initial.value();
    }

    auto rankingLimit = config.get<unsigned int>("arena.ranking.default_limit");
    if (rankingLimit) {
        cfg.rankingListLimit = rankingLimit.value();
    }

    auto activeLimit = config.get<unsigned int>("arena.matches.active_limit");
    if (activeLimit) {
        cfg.activeMatchLimit = activeLimit.value();
    }

    auto historyLimit = config.get<unsigned int>("arena.matches.history_limit");
    if (historyLimit) {
        cfg.historyLimit = historyLimit.value();
    }

    return cfg;
}

std::size_t applyLogLevels(const ConfigManager& config) {
    constexpr std::string_view prefix = "arena.log.";
    std::size_t applied = 0;

    for (const auto& key : config.keysWithPrefix("arena.log")) {
        auto category = foundation::parseLogCategory(std::string_view(key).substr(prefix.size()));
        if (!category) {
            ARENA_LOG_WARN(LogCategory::Config, "Unknown log category: " + key);
            continue;
        }

        auto levelName = config.get<std::string>(key);
        auto level = levelName ? foundation::parseLogLevel(levelName.value()) : std::nullopt;
        if (!level) {
            ARENA_LOG_WARN(LogCategory::Config, "Invalid log level for " + key);
            continue;
        }

        ArenaLogger::instance().setCategoryLevel(*category, *level);
        ++applied;
    }
    return applied;
}

std::optional<BootstrapSeason> readBootstrapSeason(const ConfigManager& config) {
    auto name = config.get<std::string>("arena.season.name");
    if (!name || name.value().empty()) {
        return std::nullopt;
    }

    BootstrapSeason season;
    season.name = name.value();
    season.number = config.getOr<unsigned int>("arena.season.number", season.number);
    season.durationDays =
        config.getOr<unsigned int>("arena.season.duration_days", season.durationDays);
    return season;
}

} // namespace arena::service
