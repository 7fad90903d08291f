#pragma once

/// @file arena_result.hpp
/// @brief ArenaResult<T> type alias for engine error handling.

#include "arena/core/result.hpp"
#include "arena/foundation/arena_error.hpp"

namespace arena::foundation {

/// Result type specialized with ArenaError.
///
/// Every engine and store method that can fail returns ArenaResult<T>
/// instead of throwing exceptions.
///
/// Example:
/// @code
///   ArenaResult<SeasonId> activeSeason() const {
///       if (!active_) {
///           return ArenaResult<SeasonId>::err(
///               ArenaError(ErrorCode::NoActiveSeason, "no active season"));
///       }
///       return ArenaResult<SeasonId>::ok(*active_);
///   }
/// @endcode
template <typename T>
using ArenaResult = arena::Result<T, ArenaError>;

}  // namespace arena::foundation
