/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <glm/glm.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gv::rendering {

    // Opaque device object name; 0 is never a valid handle
    using DeviceHandle = uint32_t;

    enum class ShaderStage : uint8_t {
        Vertex,
        Fragment
    };

    enum class BufferTarget : uint8_t {
        Vertex, // array buffer
        Index   // element array buffer
    };

    inline std::string_view to_string(ShaderStage stage) {
        switch (stage) {
        case ShaderStage::Vertex: return "vertex";
        case ShaderStage::Fragment: return "fragment";
        default: return "unknown";
        }
    }

    /**
     * @brief Minimal graphics API surface the viewer draws through
     *
     * The OpenGL implementation lives in gv_gl. Every call assumes the
     * device's context is current on the calling thread.
     */
    class IGraphicsDevice {
    public:
        virtual ~IGraphicsDevice() = default;

        // Shaders and programs. Failures carry the driver's info log
        virtual std::expected<DeviceHandle, std::string> compileShader(ShaderStage stage, std::string_view source) = 0;
        virtual std::expected<DeviceHandle, std::string> linkProgram(DeviceHandle vertex_shader, DeviceHandle fragment_shader) = 0;
        virtual void deleteShader(DeviceHandle shader) = 0;
        virtual void deleteProgram(DeviceHandle program) = 0;
        virtual std::optional<int32_t> uniformLocation(DeviceHandle program, std::string_view name) = 0;

        // Buffers. Uploads replace the whole content; an empty span leaves a zero-sized buffer
        virtual std::expected<DeviceHandle, std::string> createBuffer(BufferTarget target) = 0;
        virtual std::expected<void, std::string> uploadBuffer(BufferTarget target, DeviceHandle buffer,
                                                              std::span<const std::byte> data) = 0;
        virtual void deleteBuffer(DeviceHandle buffer) = 0;

        // Fixed-function state
        virtual void setViewport(int32_t x, int32_t y, uint32_t width, uint32_t height) = 0;
        virtual void setClearColor(const glm::vec4& color) = 0;
        virtual void enableDepthTest() = 0;
        virtual void clear() = 0; // color and depth

        // Drawing
        virtual void useProgram(DeviceHandle program) = 0;
        virtual void setUniformMat4(int32_t location, const glm::mat4& value) = 0;
        virtual void setUniformVec3(int32_t location, const glm::vec3& value) = 0;
        // Attribute 0 reads tightly packed float xyz from vertex_buffer
        virtual void bindGeometry(DeviceHandle vertex_buffer, DeviceHandle index_buffer) = 0;
        // Triangle list of 16-bit indices
        virtual void drawIndexedTriangles(uint32_t index_count) = 0;
    };

} // namespace gv::rendering
