/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "gl_resources.hpp"
#include "rendering/graphics_device.hpp"
#include <memory>
#include <unordered_map>

namespace gv::rendering {

    // IGraphicsDevice on the OpenGL 3.3 core context current on this thread
    class GLDevice final : public IGraphicsDevice {
    public:
        // Requires a current context with loaded GL entry points
        static GLResult<std::unique_ptr<GLDevice>> create();

        std::expected<DeviceHandle, std::string> compileShader(ShaderStage stage, std::string_view source) override;
        std::expected<DeviceHandle, std::string> linkProgram(DeviceHandle vertex_shader, DeviceHandle fragment_shader) override;
        void deleteShader(DeviceHandle shader) override;
        void deleteProgram(DeviceHandle program) override;
        std::optional<int32_t> uniformLocation(DeviceHandle program, std::string_view name) override;

        std::expected<DeviceHandle, std::string> createBuffer(BufferTarget target) override;
        std::expected<void, std::string> uploadBuffer(BufferTarget target, DeviceHandle buffer,
                                                      std::span<const std::byte> data) override;
        void deleteBuffer(DeviceHandle buffer) override;

        void setViewport(int32_t x, int32_t y, uint32_t width, uint32_t height) override;
        void setClearColor(const glm::vec4& color) override;
        void enableDepthTest() override;
        void clear() override;

        void useProgram(DeviceHandle program) override;
        void setUniformMat4(int32_t location, const glm::mat4& value) override;
        void setUniformVec3(int32_t location, const glm::vec3& value) override;
        void bindGeometry(DeviceHandle vertex_buffer, DeviceHandle index_buffer) override;
        void drawIndexedTriangles(uint32_t index_count) override;

    private:
        explicit GLDevice(VertexArrayObject vao) : vao_(std::move(vao)) {}

        VertexArrayObject vao_;
        // Buffers still alive are released with the device
        std::unordered_map<GLuint, BufferObject> buffers_;
    };

} // namespace gv::rendering
