/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/gpu_resources.hpp"
#include "core/logger.hpp"
#include "shader_sources.hpp"
#include <format>
#include <utility>

namespace gv::rendering {

    Result<GpuResources> GpuResources::initialize(IGraphicsDevice& device) {
        LOG_TIMER_TRACE("GpuResources::initialize");

        // Partially built resources are released by the destructor on every error path
        GpuResources resources(device);

        auto vertex_shader = device.compileShader(ShaderStage::Vertex, shaders::MESH_VERTEX);
        if (!vertex_shader) {
            return make_error<GpuResources>(InitError::ShaderCompileFailed, vertex_shader.error(), ShaderStage::Vertex);
        }

        auto fragment_shader = device.compileShader(ShaderStage::Fragment, shaders::MESH_FRAGMENT);
        if (!fragment_shader) {
            device.deleteShader(*vertex_shader);
            return make_error<GpuResources>(InitError::ShaderCompileFailed, fragment_shader.error(), ShaderStage::Fragment);
        }

        auto program = device.linkProgram(*vertex_shader, *fragment_shader);
        // Shaders are not needed once linking has been attempted
        device.deleteShader(*vertex_shader);
        device.deleteShader(*fragment_shader);
        if (!program) {
            return make_error<GpuResources>(InitError::ProgramLinkFailed, program.error());
        }
        resources.program_ = *program;

        auto mvp_location = device.uniformLocation(resources.program_, shaders::MVP_UNIFORM);
        if (!mvp_location) {
            return make_error<GpuResources>(InitError::MissingUniform, shaders::MVP_UNIFORM);
        }
        auto color_location = device.uniformLocation(resources.program_, shaders::COLOR_UNIFORM);
        if (!color_location) {
            return make_error<GpuResources>(InitError::MissingUniform, shaders::COLOR_UNIFORM);
        }
        resources.mvp_location_ = *mvp_location;
        resources.color_location_ = *color_location;

        auto vertex_buffer = device.createBuffer(BufferTarget::Vertex);
        if (!vertex_buffer) {
            return make_error<GpuResources>(InitError::ResourceCreationFailed,
                                            std::format("vertex buffer: {}", vertex_buffer.error()));
        }
        resources.vertex_buffer_ = *vertex_buffer;

        auto index_buffer = device.createBuffer(BufferTarget::Index);
        if (!index_buffer) {
            return make_error<GpuResources>(InitError::ResourceCreationFailed,
                                            std::format("index buffer: {}", index_buffer.error()));
        }
        resources.index_buffer_ = *index_buffer;

        LOG_DEBUG("GPU resources ready: program {}, vertex buffer {}, index buffer {}",
                  resources.program_, resources.vertex_buffer_, resources.index_buffer_);
        return resources;
    }

    GpuResources::~GpuResources() {
        release();
    }

    GpuResources::GpuResources(GpuResources&& other) noexcept
        : device_(std::exchange(other.device_, nullptr)),
          program_(std::exchange(other.program_, 0)),
          vertex_buffer_(std::exchange(other.vertex_buffer_, 0)),
          index_buffer_(std::exchange(other.index_buffer_, 0)),
          mvp_location_(std::exchange(other.mvp_location_, -1)),
          color_location_(std::exchange(other.color_location_, -1)) {}

    GpuResources& GpuResources::operator=(GpuResources&& other) noexcept {
        if (this != &other) {
            release();
            device_ = std::exchange(other.device_, nullptr);
            program_ = std::exchange(other.program_, 0);
            vertex_buffer_ = std::exchange(other.vertex_buffer_, 0);
            index_buffer_ = std::exchange(other.index_buffer_, 0);
            mvp_location_ = std::exchange(other.mvp_location_, -1);
            color_location_ = std::exchange(other.color_location_, -1);
        }
        return *this;
    }

    void GpuResources::release() {
        if (!device_)
            return;
        if (index_buffer_)
            device_->deleteBuffer(std::exchange(index_buffer_, 0));
        if (vertex_buffer_)
            device_->deleteBuffer(std::exchange(vertex_buffer_, 0));
        if (program_)
            device_->deleteProgram(std::exchange(program_, 0));
    }

    std::expected<void, std::string> GpuResources::upload(std::span<const float> vertices,
                                                          std::span<const uint16_t> indices) {
        if (auto result = device_->uploadBuffer(BufferTarget::Vertex, vertex_buffer_, std::as_bytes(vertices)); !result) {
            return std::unexpected(std::format("vertex upload failed: {}", result.error()));
        }
        if (auto result = device_->uploadBuffer(BufferTarget::Index, index_buffer_, std::as_bytes(indices)); !result) {
            return std::unexpected(std::format("index upload failed: {}", result.error()));
        }
        LOG_TRACE("Uploaded {} vertex floats, {} indices", vertices.size(), indices.size());
        return {};
    }

    std::expected<void, std::string> GpuResources::clear() {
        return upload({}, {});
    }

    void GpuResources::draw(uint32_t index_count, const glm::mat4& mvp, const glm::vec3& color) {
        device_->clear();
        device_->useProgram(program_);
        device_->setUniformMat4(mvp_location_, mvp);
        device_->setUniformVec3(color_location_, color);
        device_->bindGeometry(vertex_buffer_, index_buffer_);
        device_->drawIndexedTriangles(index_count);
    }

} // namespace gv::rendering
