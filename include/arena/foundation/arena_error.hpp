#pragma once

/// @file arena_error.hpp
/// @brief Engine error type used with Result<T, ArenaError>.

#include <string>
#include <string_view>
#include <utility>

#include "arena/foundation/error_code.hpp"

namespace arena::foundation {

/// Error type carrying a categorized code and a human-readable message.
class ArenaError {
public:
    ArenaError() = default;

    explicit ArenaError(ErrorCode code)
        : code_(code) {}

    ArenaError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace arena::foundation
