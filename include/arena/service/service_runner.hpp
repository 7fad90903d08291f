#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities for the arena server executable.
///
/// Provides signal handling, configuration loading, graceful shutdown
/// coordination, CLI argument parsing and the translation of loaded
/// configuration into an EngineConfig.

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "arena/foundation/arena_result.hpp"
#include "arena/foundation/config_manager.hpp"
#include "arena/service/pvp_types.hpp"

namespace arena::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. The handler
/// performs a relaxed store on a lock-free atomic, which is
/// async-signal-safe. The destructor restores the default handlers so a
/// second signal terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<foundation::ArenaResult<void>()>;

/// Runs named shutdown hooks in registration order.
///
/// A failing hook is logged and does not stop the ones after it.
///
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("stats", [&] { logStats(engine); return ArenaResult<void>::ok(); });
///   shutdown.addHook("logger", [] { return ArenaLogger::instance().flush(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Execute every hook once.
    ///
    /// @return Number of hooks that reported an error.
    std::size_t execute();

    [[nodiscard]] std::size_t hookCount() const;

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
};

/// Bootstrap season described by the `arena.season.*` keys.
struct BootstrapSeason {
    std::string name;
    uint32_t number = 1;
    uint32_t durationDays = 90;
};

/// Load a YAML configuration file into @p config.
///
/// The path is resolved in order:
///   1. ARENA_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath
///
/// @return Success or ConfigLoadFailed.
[[nodiscard]] foundation::ArenaResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Build the engine configuration from `arena.*` keys; absent keys keep defaults.
[[nodiscard]] EngineConfig buildEngineConfig(const foundation::ConfigManager& config);

/// Apply `arena.log.<category>` minimum levels to the global logger.
///
/// @return Number of categories whose level was changed.
std::size_t applyLogLevels(const foundation::ConfigManager& config);

/// Bootstrap season from `arena.season.*`; empty when no name is configured.
[[nodiscard]] std::optional<BootstrapSeason>
readBootstrapSeason(const foundation::ConfigManager& config);

} // namespace arena::service
