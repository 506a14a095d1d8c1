/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "rendering/graphics_device.hpp"
#include "rendering/rendering_error.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace gv::rendering {

    // Program, uniform locations and the vertex/index buffer pair of one viewer.
    // Everything is released through the device when this object dies.
    class GpuResources {
    public:
        // Compiles the fixed mesh shaders, links them, resolves both uniforms and creates the buffers
        static Result<GpuResources> initialize(IGraphicsDevice& device);

        ~GpuResources();

        GpuResources(GpuResources&& other) noexcept;
        GpuResources& operator=(GpuResources&& other) noexcept;
        GpuResources(const GpuResources&) = delete;
        GpuResources& operator=(const GpuResources&) = delete;

        // Full rewrite of both buffers
        std::expected<void, std::string> upload(std::span<const float> vertices, std::span<const uint16_t> indices);

        // Zero-sized upload of both buffers
        std::expected<void, std::string> clear();

        // Issue the draw for the current buffers
        void draw(uint32_t index_count, const glm::mat4& mvp, const glm::vec3& color);

        DeviceHandle program() const { return program_; }
        DeviceHandle vertexBuffer() const { return vertex_buffer_; }
        DeviceHandle indexBuffer() const { return index_buffer_; }
        int32_t mvpLocation() const { return mvp_location_; }
        int32_t colorLocation() const { return color_location_; }

    private:
        explicit GpuResources(IGraphicsDevice& device) : device_(&device) {}
        void release();

        IGraphicsDevice* device_ = nullptr;
        DeviceHandle program_ = 0;
        DeviceHandle vertex_buffer_ = 0;
        DeviceHandle index_buffer_ = 0;
        int32_t mvp_location_ = -1;
        int32_t color_location_ = -1;
    };

} // namespace gv::rendering
