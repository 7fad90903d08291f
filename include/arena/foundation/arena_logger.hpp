#pragma once

/// @file arena_logger.hpp
/// @brief ArenaLogger wrapping kcenon logger interfaces for structured
///        engine logging.
///
/// Provides category-based filtering, structured logging with match,
/// player and season context, and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "arena/foundation/arena_result.hpp"
#include "arena/foundation/types.hpp"

namespace arena::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Service lifecycle
    Queue    = 1, ///< Matchmaking queue
    Match    = 2, ///< Match state machine
    Rating   = 3, ///< Elo updates and rankings
    Spectate = 4, ///< Spectator registry
    Season   = 5, ///< Season registry
    Config   = 6  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Queue", "Match", "Rating", "Spectate", "Season", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in configuration files ("info", "WARNING").
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a category name ("queue", "Match").
[[nodiscard]] std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.matchId = MatchId(7);
///   ctx.extra["delta"] = "+20";
///   logger.logWithContext(LogLevel::Info, LogCategory::Rating,
///                         "Rating updated", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<MatchId> matchId;
    std::optional<SeasonId> seasonId;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Queue    | Debug         |
/// | Match    | Info          |
/// | Rating   | Info          |
/// | Spectate | Debug         |
/// | Season   | Info          |
/// | Config   | Info          |
class ArenaLogger {
public:
    ArenaLogger();
    ~ArenaLogger();

    ArenaLogger(const ArenaLogger&) = delete;
    ArenaLogger& operator=(const ArenaLogger&) = delete;
    ArenaLogger(ArenaLogger&&) noexcept;
    ArenaLogger& operator=(ArenaLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    ArenaResult<void> flush();

    /// Get the global ArenaLogger singleton instance.
    static ArenaLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace arena::foundation

// ---------------------------------------------------------------------------
// Convenience macros (macros are global, so they live outside the namespace)
// ---------------------------------------------------------------------------

/// @name ARENA_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// ARENA_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef ARENA_MIN_LOG_LEVEL
    #define ARENA_MIN_LOG_LEVEL 0
#endif

#define ARENA_LOG(level, cat, msg)                                                   \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= ARENA_MIN_LOG_LEVEL &&                        \
            ::arena::foundation::ArenaLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::arena::foundation::ArenaLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define ARENA_LOG_CTX(level, cat, msg, ctx)                                          \
    do {                                                                             \
        if (static_cast<int>(level) >= ARENA_MIN_LOG_LEVEL &&                        \
            ::arena::foundation::ArenaLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::arena::foundation::ArenaLogger::instance().logWithContext(             \
                (level), (cat), (msg), (ctx));                                       \
        }                                                                            \
    } while (0)

#define ARENA_LOG_DEBUG(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Debug, (cat), (msg))

#define ARENA_LOG_INFO(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Info, (cat), (msg))

#define ARENA_LOG_WARN(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Warning, (cat), (msg))

#define ARENA_LOG_ERROR(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Error, (cat), (msg))

/// @}
