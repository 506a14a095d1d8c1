/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include "rendering/graphics_device.hpp"
#include <expected>
#include <format>
#include <optional>
#include <string>

namespace gv::rendering {

    // Fatal errors while setting up a viewer's GPU state
    enum class InitError {
        MissingContext,
        ShaderCompileFailed,
        ProgramLinkFailed,
        MissingUniform,
        ResourceCreationFailed
    };

    inline std::string to_string(InitError error) {
        switch (error) {
        case InitError::MissingContext: return "No graphics context available";
        case InitError::ShaderCompileFailed: return "Shader compilation failed";
        case InitError::ProgramLinkFailed: return "Program link failed";
        case InitError::MissingUniform: return "Required uniform not found";
        case InitError::ResourceCreationFailed: return "Failed to create GPU resources";
        default: return "Unknown error";
        }
    }

    // Extended error information
    struct InitErrorInfo {
        InitError code;
        std::string details;
        std::optional<ShaderStage> stage; // set for ShaderCompileFailed

        InitErrorInfo(InitError c, std::string_view d = "", std::optional<ShaderStage> s = std::nullopt)
            : code(c),
              details(d),
              stage(s) {
            LOG_ERROR("InitError::{}", message());
        }

        std::string message() const {
            std::string head = to_string(code);
            if (stage) {
                head = std::format("{} ({})", head, to_string(*stage));
            }
            if (details.empty()) {
                return head;
            }
            return std::format("{}: {}", head, details);
        }
    };

    // Result type for initialization
    template <typename T>
    using Result = std::expected<T, InitErrorInfo>;

    // Helper to create error results
    template <typename T>
    inline Result<T> make_error(InitError code, std::string_view details = "",
                                std::optional<ShaderStage> stage = std::nullopt) {
        return std::unexpected(InitErrorInfo{code, details, stage});
    }

} // namespace gv::rendering
