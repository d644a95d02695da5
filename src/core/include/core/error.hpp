/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <string_view>

namespace vista::core {

    /// Error codes for scene operations
    enum class ErrorCode {
        SUCCESS = 0,

        // Validation (200-299)
        INVALID_ARGUMENT = 200,
        INVALID_CULLING = 201,
        INVALID_CAMERA_VIEW = 202,
        INVALID_TICK_LOCATION = 203,
        INVALID_AXES_LOCATION = 204,
        INVALID_GRID_LOCATION = 205,
        INVALID_PADDING = 206,
        INVALID_COLOR = 207,
        INVALID_FONT_FAMILY = 208,

        // Numeric (300-399)
        DEGENERATE_TRANSFORM = 300,

        // Configuration (400-499)
        CONFIG_NOT_FOUND = 400,
        MALFORMED_CONFIG = 401,
        WRITE_FAILURE = 402,

        // Resources (500-599)
        NO_FREE_SLOT = 500,
    };

    constexpr std::string_view error_code_to_string(ErrorCode code) {
        switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::INVALID_CULLING: return "Invalid culling mode";
        case ErrorCode::INVALID_CAMERA_VIEW: return "Invalid camera view";
        case ErrorCode::INVALID_TICK_LOCATION: return "Invalid tick location";
        case ErrorCode::INVALID_AXES_LOCATION: return "Invalid axes location";
        case ErrorCode::INVALID_GRID_LOCATION: return "Invalid grid location";
        case ErrorCode::INVALID_PADDING: return "Invalid padding";
        case ErrorCode::INVALID_COLOR: return "Invalid color";
        case ErrorCode::INVALID_FONT_FAMILY: return "Invalid font family";
        case ErrorCode::DEGENERATE_TRANSFORM: return "Degenerate transform";
        case ErrorCode::CONFIG_NOT_FOUND: return "Config not found";
        case ErrorCode::MALFORMED_CONFIG: return "Malformed config";
        case ErrorCode::WRITE_FAILURE: return "Write failed";
        case ErrorCode::NO_FREE_SLOT: return "No free slot";
        default: return "Unknown error";
        }
    }

    /// Structured error with code and message
    struct Error {
        ErrorCode code;
        std::string message;

        Error(ErrorCode c, std::string msg)
            : code(c),
              message(std::move(msg)) {}

        [[nodiscard]] std::string format() const {
            return fmt::format("[{}] {}", error_code_to_string(code), message);
        }

        [[nodiscard]] bool is(ErrorCode c) const { return code == c; }

        [[nodiscard]] bool is_validation_error() const {
            const int c = static_cast<int>(code);
            return c >= 200 && c < 300;
        }

        [[nodiscard]] bool is_numeric_error() const {
            const int c = static_cast<int>(code);
            return c >= 300 && c < 400;
        }

        [[nodiscard]] bool is_config_error() const {
            const int c = static_cast<int>(code);
            return c >= 400 && c < 500;
        }
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    inline std::unexpected<Error> make_error(ErrorCode code, std::string message) {
        return std::unexpected(Error{code, std::move(message)});
    }

} // namespace vista::core
