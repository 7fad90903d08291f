#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the PVP arena engine.

#include <cstdint>
#include <string_view>

namespace arena::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0802,

    // PVP (0x0900 - 0x09FF)
    NoActiveSeason = 0x0900,
    MatchNotFound = 0x0901,
    InvalidStatus = 0x0902,
    InvalidWinner = 0x0903,
    SpectateNotAllowed = 0x0904,
    RankingNotFound = 0x0905,
    SeasonNotFound = 0x0906,
    InvalidSeason = 0x0907,

    // Store (0x0A00 - 0x0AFF)
    StoreUnavailable = 0x0A00,
    StoreWriteFailed = 0x0A01,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "PVP";
        case 0x0A00: return "Store";
        default: return "Unknown";
    }
}

} // namespace arena::foundation
