/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include <glm/glm.hpp>
#include <nlohmann/json_fwd.hpp>

namespace gv {
    namespace param {

        // What the scene accumulator does when a rebased index no longer fits in 16 bits
        enum class IndexOverflowPolicy {
            Skip, // reject the primitive that overflows, keep accumulating the rest
            Clamp // clamp the rebased index to 65535
        };

        std::string_view to_string(IndexOverflowPolicy policy);
        std::expected<IndexOverflowPolicy, std::string> parse_index_overflow_policy(std::string_view name);

        struct CameraParameters {
            glm::vec3 position = {3.0f, 3.0f, 5.0f};
            glm::vec3 target = {0.0f, 0.0f, 0.0f};
            float fov_degrees = 45.0f;
            float near_plane = 0.1f;
            float far_plane = 100.0f;
            float orbit_sensitivity = 0.01f; // radians per input unit
            float polar_epsilon = 0.1f;      // keeps theta inside [eps, pi - eps]

            nlohmann::json to_json() const;
            static CameraParameters from_json(const nlohmann::json& j);
        };

        struct RenderParameters {
            glm::vec4 clear_color = {0.1f, 0.1f, 0.1f, 1.0f};
            glm::vec3 mesh_color = {0.8f, 0.4f, 0.2f};

            nlohmann::json to_json() const;
            static RenderParameters from_json(const nlohmann::json& j);
        };

        struct LoadingParameters {
            IndexOverflowPolicy index_overflow_policy = IndexOverflowPolicy::Skip;
            bool placeholder_on_decode_failure = false;

            nlohmann::json to_json() const;
            static LoadingParameters from_json(const nlohmann::json& j);
        };

        struct WindowParameters {
            int width = 1280;
            int height = 720;
            std::string title = "glTF Viewer";

            nlohmann::json to_json() const;
            static WindowParameters from_json(const nlohmann::json& j);
        };

        struct ViewerParameters {
            CameraParameters camera;
            RenderParameters render;
            LoadingParameters loading;
            WindowParameters window;

            // Viewer mode specific
            std::filesystem::path asset_path = "";

            nlohmann::json to_json() const;
            static ViewerParameters from_json(const nlohmann::json& j);
        };

        // Checks value ranges the renderer relies on
        std::expected<void, std::string> validate(const ViewerParameters& params);

        std::expected<ViewerParameters, std::string> read_viewer_params_from_json(const std::filesystem::path& path);

        std::expected<void, std::string> save_viewer_params_to_json(
            const ViewerParameters& params,
            const std::filesystem::path& output_path);
    } // namespace param
} // namespace gv
