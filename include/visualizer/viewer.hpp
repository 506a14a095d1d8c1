/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "geometry/orbit_camera.hpp"
#include "rendering/gpu_resources.hpp"
#include "rendering/graphics_device.hpp"
#include "rendering/rendering_error.hpp"
#include "scene/scene_accumulator.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace gv::visualizer {

    // What the host hands to the viewer: a device with a current context and its framebuffer size
    struct RenderSurface {
        rendering::IGraphicsDevice* device = nullptr;
        glm::ivec2 framebuffer_size{0, 0};
    };

    enum class ViewerState : uint8_t {
        Empty,   // nothing uploaded yet
        Loading, // only observable inside load()
        Ready
    };

    inline std::string_view to_string(ViewerState state) {
        switch (state) {
        case ViewerState::Empty: return "Empty";
        case ViewerState::Loading: return "Loading";
        case ViewerState::Ready: return "Ready";
        default: return "Unknown";
        }
    }

    enum class LoadError {
        EmptyInput,
        TooSmall,
        MalformedAsset,
        UploadFailed,
        FileReadFailed
    };

    inline std::string to_string(LoadError error) {
        switch (error) {
        case LoadError::EmptyInput: return "Empty input";
        case LoadError::TooSmall: return "Asset too small";
        case LoadError::MalformedAsset: return "Malformed asset";
        case LoadError::UploadFailed: return "GPU upload failed";
        case LoadError::FileReadFailed: return "Could not read file";
        default: return "Unknown error";
        }
    }

    struct LoadErrorInfo {
        LoadError code;
        std::string details;

        std::string message() const {
            if (details.empty()) {
                return to_string(code);
            }
            return std::format("{}: {}", to_string(code), details);
        }
    };

    using LoadResult = std::expected<void, LoadErrorInfo>;

    /**
     * @brief Loads glTF assets into one vertex/index buffer pair and draws them with an orbit camera
     *
     * A failed load leaves the previous state and geometry in place. A successful load
     * always ends in Ready, with the placeholder cube when the asset has nothing to draw.
     * Single-threaded; load() and render() must not overlap.
     */
    class Viewer {
    public:
        static rendering::Result<std::unique_ptr<Viewer>> create(const RenderSurface& surface,
                                                                 const param::ViewerParameters& params);

        ~Viewer() = default;

        Viewer(const Viewer&) = delete;
        Viewer& operator=(const Viewer&) = delete;

        // Decode, flatten and upload an asset held in memory
        LoadResult load(std::span<const uint8_t> bytes);

        // Same as load(); external buffers resolve relative to the file's directory
        LoadResult loadFile(const std::filesystem::path& path);

        // Replace the geometry with the placeholder cube
        LoadResult loadPlaceholder();

        // Draw the current geometry; nothing happens while there are no indices
        void render();

        void orbit(float delta_x, float delta_y);
        void resize(uint32_t width, uint32_t height);

        // Getters
        ViewerState getState() const { return state_; }
        const scene::SceneBuffers& getGeometry() const { return geometry_; }
        uint32_t getIndexCount() const { return geometry_.index_count; }
        const geometry::OrbitCamera& getCamera() const { return camera_; }
        const param::ViewerParameters& getParameters() const { return params_; }

    private:
        Viewer(rendering::IGraphicsDevice& device,
               const param::ViewerParameters& params,
               rendering::GpuResources gpu,
               glm::ivec2 framebuffer_size);

        LoadResult loadFromMemory(std::span<const uint8_t> bytes, const std::filesystem::path& base_directory);

        // Swap in new buffers; on failure the previous GPU contents are restored
        LoadResult commit(scene::SceneBuffers buffers, ViewerState previous);

        rendering::IGraphicsDevice& device_;
        param::ViewerParameters params_;
        rendering::GpuResources gpu_;
        geometry::OrbitCamera camera_;
        scene::SceneBuffers geometry_;
        ViewerState state_ = ViewerState::Empty;
    };

} // namespace gv::visualizer
