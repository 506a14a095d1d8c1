/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include <expected>
#include <format>
#include <string>

namespace gv::loader {

    // Whole-asset decode failures
    enum class DecodeError {
        TooSmall,
        MalformedAsset
    };

    inline std::string to_string(DecodeError error) {
        switch (error) {
        case DecodeError::TooSmall: return "Asset too small";
        case DecodeError::MalformedAsset: return "Malformed asset";
        default: return "Unknown error";
        }
    }

    struct DecodeErrorInfo {
        DecodeError code;
        std::string details;

        DecodeErrorInfo(DecodeError c, std::string_view d = "")
            : code(c),
              details(d) {
            if (!details.empty()) {
                LOG_WARN("DecodeError::{} - {}", to_string(code), details);
            } else {
                LOG_WARN("DecodeError::{}", to_string(code));
            }
        }

        std::string message() const {
            if (details.empty()) {
                return to_string(code);
            }
            return std::format("{}: {}", to_string(code), details);
        }
    };

    // Failures reading a single accessor. These stay local to one primitive
    enum class AccessorError {
        InvalidAccessor,
        BufferUnavailable,
        OutOfBounds
    };

    inline std::string to_string(AccessorError error) {
        switch (error) {
        case AccessorError::InvalidAccessor: return "Invalid accessor";
        case AccessorError::BufferUnavailable: return "Buffer unavailable";
        case AccessorError::OutOfBounds: return "Accessor out of bounds";
        default: return "Unknown error";
        }
    }

    struct AccessorErrorInfo {
        AccessorError code;
        std::string details;

        std::string message() const {
            if (details.empty()) {
                return to_string(code);
            }
            return std::format("{}: {}", to_string(code), details);
        }
    };

    template <typename T>
    using DecodeResult = std::expected<T, DecodeErrorInfo>;

    template <typename T>
    using AccessorResult = std::expected<T, AccessorErrorInfo>;

} // namespace gv::loader
