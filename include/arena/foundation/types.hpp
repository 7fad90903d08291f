#pragma once

/// @file types.hpp
/// @brief Strong ID types and clock aliases shared by the engine.

#include <chrono>
#include <cstdint>
#include <functional>

namespace arena::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types (e.g., MatchId and PlayerId)
/// at compile time while keeping the same underlying representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

// Tag types for strong IDs
struct PlayerIdTag {};
struct MatchIdTag {};
struct SeasonIdTag {};
struct SpectatorIdTag {};

/// Unique identifier for player accounts.
using PlayerId = StrongId<PlayerIdTag>;

/// Unique identifier for a PVP match.
using MatchId = StrongId<MatchIdTag>;

/// Unique identifier for a rating season.
using SeasonId = StrongId<SeasonIdTag>;

/// Unique identifier for a spectator record.
using SpectatorId = StrongId<SpectatorIdTag>;

/// Invalid/null sentinel for any ID type.
template <typename Tag, typename T>
constexpr StrongId<Tag, T> NULL_ID{};

/// Wall-clock timestamp used for all persisted times.
using Timestamp = std::chrono::system_clock::time_point;

/// Injectable time source. Defaults to the system clock.
using ClockFn = std::function<Timestamp()>;

/// Return a ClockFn bound to std::chrono::system_clock.
inline ClockFn systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

} // namespace arena::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<arena::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const arena::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
