/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <numbers>
#include <set>
#include <sstream>
#include <string>

namespace gv {
    namespace param {
        namespace {

            /**
             * @brief Read and parse a JSON configuration file
             * @param path Path to the JSON file
             * @return Expected JSON object or error message
             */
            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(std::format("Configuration file does not exist: {}", path.string()));
                }

                std::ifstream file(path);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Could not open configuration file: {}", path.string()));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(std::format("JSON parsing error in {}: {}", path.string(), e.what()));
                }
            }

            // Keys that are not part of a section are reported, not rejected
            void warn_unknown_keys(const nlohmann::json& json, std::string_view section,
                                   const std::set<std::string>& known) {
                if (!json.is_object())
                    return;
                for (const auto& [key, value] : json.items()) {
                    if (!known.contains(key)) {
                        LOG_WARN("Unknown parameter '{}' in section '{}' will be ignored", key, section);
                    }
                }
            }

            nlohmann::json vec_to_json(const glm::vec3& v) {
                return nlohmann::json::array({v.x, v.y, v.z});
            }

            nlohmann::json vec_to_json(const glm::vec4& v) {
                return nlohmann::json::array({v.x, v.y, v.z, v.w});
            }

            glm::vec3 vec3_from_json(const nlohmann::json& j, std::string_view key) {
                if (!j.is_array() || j.size() != 3) {
                    throw std::invalid_argument(std::format("'{}' must be an array of 3 numbers", key));
                }
                return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>()};
            }

            glm::vec4 vec4_from_json(const nlohmann::json& j, std::string_view key) {
                if (!j.is_array() || j.size() != 4) {
                    throw std::invalid_argument(std::format("'{}' must be an array of 4 numbers", key));
                }
                return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), j[3].get<float>()};
            }
        } // namespace

        std::string_view to_string(IndexOverflowPolicy policy) {
            switch (policy) {
            case IndexOverflowPolicy::Skip: return "skip";
            case IndexOverflowPolicy::Clamp: return "clamp";
            default: return "unknown";
            }
        }

        std::expected<IndexOverflowPolicy, std::string> parse_index_overflow_policy(std::string_view name) {
            if (name == "skip")
                return IndexOverflowPolicy::Skip;
            if (name == "clamp")
                return IndexOverflowPolicy::Clamp;
            return std::unexpected(std::format("Invalid index overflow policy '{}' (expected skip or clamp)", name));
        }

        nlohmann::json CameraParameters::to_json() const {
            nlohmann::json json;
            json["position"] = vec_to_json(position);
            json["target"] = vec_to_json(target);
            json["fov_degrees"] = fov_degrees;
            json["near_plane"] = near_plane;
            json["far_plane"] = far_plane;
            json["orbit_sensitivity"] = orbit_sensitivity;
            json["polar_epsilon"] = polar_epsilon;
            return json;
        }

        CameraParameters CameraParameters::from_json(const nlohmann::json& json) {
            warn_unknown_keys(json, "camera",
                              {"position", "target", "fov_degrees", "near_plane", "far_plane",
                               "orbit_sensitivity", "polar_epsilon"});

            CameraParameters params;
            if (json.contains("position")) {
                params.position = vec3_from_json(json["position"], "camera.position");
            }
            if (json.contains("target")) {
                params.target = vec3_from_json(json["target"], "camera.target");
            }
            if (json.contains("fov_degrees")) {
                params.fov_degrees = json["fov_degrees"];
            }
            if (json.contains("near_plane")) {
                params.near_plane = json["near_plane"];
            }
            if (json.contains("far_plane")) {
                params.far_plane = json["far_plane"];
            }
            if (json.contains("orbit_sensitivity")) {
                params.orbit_sensitivity = json["orbit_sensitivity"];
            }
            if (json.contains("polar_epsilon")) {
                params.polar_epsilon = json["polar_epsilon"];
            }
            return params;
        }

        nlohmann::json RenderParameters::to_json() const {
            nlohmann::json json;
            json["clear_color"] = vec_to_json(clear_color);
            json["mesh_color"] = vec_to_json(mesh_color);
            return json;
        }

        RenderParameters RenderParameters::from_json(const nlohmann::json& json) {
            warn_unknown_keys(json, "render", {"clear_color", "mesh_color"});

            RenderParameters params;
            if (json.contains("clear_color")) {
                params.clear_color = vec4_from_json(json["clear_color"], "render.clear_color");
            }
            if (json.contains("mesh_color")) {
                params.mesh_color = vec3_from_json(json["mesh_color"], "render.mesh_color");
            }
            return params;
        }

        nlohmann::json LoadingParameters::to_json() const {
            nlohmann::json json;
            json["index_overflow_policy"] = std::string(to_string(index_overflow_policy));
            json["placeholder_on_decode_failure"] = placeholder_on_decode_failure;
            return json;
        }

        LoadingParameters LoadingParameters::from_json(const nlohmann::json& json) {
            warn_unknown_keys(json, "loading", {"index_overflow_policy", "placeholder_on_decode_failure"});

            LoadingParameters params;
            if (json.contains("index_overflow_policy")) {
                auto policy = parse_index_overflow_policy(json["index_overflow_policy"].get<std::string>());
                if (!policy) {
                    throw std::invalid_argument(policy.error());
                }
                params.index_overflow_policy = *policy;
            }
            if (json.contains("placeholder_on_decode_failure")) {
                params.placeholder_on_decode_failure = json["placeholder_on_decode_failure"];
            }
            return params;
        }

        nlohmann::json WindowParameters::to_json() const {
            nlohmann::json json;
            json["width"] = width;
            json["height"] = height;
            json["title"] = title;
            return json;
        }

        WindowParameters WindowParameters::from_json(const nlohmann::json& json) {
            warn_unknown_keys(json, "window", {"width", "height", "title"});

            WindowParameters params;
            if (json.contains("width")) {
                params.width = json["width"];
            }
            if (json.contains("height")) {
                params.height = json["height"];
            }
            if (json.contains("title")) {
                params.title = json["title"];
            }
            return params;
        }

        nlohmann::json ViewerParameters::to_json() const {
            nlohmann::json json;
            json["camera"] = camera.to_json();
            json["render"] = render.to_json();
            json["loading"] = loading.to_json();
            json["window"] = window.to_json();
            return json;
        }

        ViewerParameters ViewerParameters::from_json(const nlohmann::json& json) {
            if (!json.is_object()) {
                throw std::invalid_argument("Viewer parameters must be a JSON object");
            }
            warn_unknown_keys(json, "root", {"camera", "render", "loading", "window"});

            ViewerParameters params;
            if (json.contains("camera")) {
                params.camera = CameraParameters::from_json(json["camera"]);
            }
            if (json.contains("render")) {
                params.render = RenderParameters::from_json(json["render"]);
            }
            if (json.contains("loading")) {
                params.loading = LoadingParameters::from_json(json["loading"]);
            }
            if (json.contains("window")) {
                params.window = WindowParameters::from_json(json["window"]);
            }
            return params;
        }

        std::expected<void, std::string> validate(const ViewerParameters& params) {
            const auto& cam = params.camera;
            if (glm::length(cam.position - cam.target) <= 0.0f) {
                return std::unexpected("camera.position must differ from camera.target");
            }
            if (!(cam.fov_degrees > 0.0f && cam.fov_degrees < 180.0f)) {
                return std::unexpected(std::format("camera.fov_degrees must be in (0, 180), got {}", cam.fov_degrees));
            }
            if (!(cam.near_plane > 0.0f)) {
                return std::unexpected(std::format("camera.near_plane must be positive, got {}", cam.near_plane));
            }
            if (!(cam.far_plane > cam.near_plane)) {
                return std::unexpected(std::format("camera.far_plane ({}) must exceed camera.near_plane ({})",
                                                   cam.far_plane, cam.near_plane));
            }
            if (!(cam.polar_epsilon > 0.0f && cam.polar_epsilon < std::numbers::pi_v<float> / 2.0f)) {
                return std::unexpected(std::format("camera.polar_epsilon must be in (0, pi/2), got {}", cam.polar_epsilon));
            }
            if (params.window.width <= 0 || params.window.height <= 0) {
                return std::unexpected(std::format("window size must be positive, got {}x{}",
                                                   params.window.width, params.window.height));
            }
            return {};
        }

        std::expected<ViewerParameters, std::string> read_viewer_params_from_json(const std::filesystem::path& path) {
            auto json_result = read_json_file(path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            try {
                ViewerParameters params = ViewerParameters::from_json(*json_result);
                if (auto valid = validate(params); !valid) {
                    return std::unexpected(std::format("Invalid parameters in {}: {}", path.string(), valid.error()));
                }
                LOG_DEBUG("Loaded viewer parameters from {}", path.string());
                return params;
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error parsing viewer parameters from {}: {}", path.string(), e.what()));
            }
        }

        std::expected<void, std::string> save_viewer_params_to_json(
            const ViewerParameters& params,
            const std::filesystem::path& output_path) {

            try {
                if (output_path.has_parent_path()) {
                    std::filesystem::create_directories(output_path.parent_path());
                }

                std::ofstream file(output_path);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Could not open file for writing: {}", output_path.string()));
                }

                file << params.to_json().dump(4);
                if (!file.good()) {
                    return std::unexpected(std::format("Failed to write parameters to {}", output_path.string()));
                }
                LOG_DEBUG("Saved viewer parameters to {}", output_path.string());
                return {};
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error saving viewer parameters: {}", e.what()));
            }
        }

    } // namespace param
} // namespace gv
