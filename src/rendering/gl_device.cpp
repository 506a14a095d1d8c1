/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "gl_device.hpp"
#include "shader_sources.hpp"
#include <format>
#include <glm/gtc/type_ptr.hpp>
#include <string>
#include <vector>

namespace gv::rendering {

    namespace {

        GLenum to_gl(BufferTarget target) {
            return target == BufferTarget::Index ? GL_ELEMENT_ARRAY_BUFFER : GL_ARRAY_BUFFER;
        }

        std::string shader_info_log(GLuint shader) {
            GLint length = 0;
            glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
            if (length <= 1)
                return "no info log";
            std::string log(static_cast<size_t>(length), '\0');
            glGetShaderInfoLog(shader, length, nullptr, log.data());
            log.resize(log.find('\0') == std::string::npos ? log.size() : log.find('\0'));
            return log;
        }

        std::string program_info_log(GLuint program) {
            GLint length = 0;
            glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
            if (length <= 1)
                return "no info log";
            std::string log(static_cast<size_t>(length), '\0');
            glGetProgramInfoLog(program, length, nullptr, log.data());
            log.resize(log.find('\0') == std::string::npos ? log.size() : log.find('\0'));
            return log;
        }

    } // namespace

    GLResult<std::unique_ptr<GLDevice>> GLDevice::create() {
        auto vao = VertexArrayObject::generate();
        if (!vao) {
            return std::unexpected(vao.error());
        }
        LOG_DEBUG("OpenGL device: {} / {}",
                  reinterpret_cast<const char*>(glGetString(GL_RENDERER)),
                  reinterpret_cast<const char*>(glGetString(GL_VERSION)));
        return std::unique_ptr<GLDevice>(new GLDevice(std::move(*vao)));
    }

    std::expected<DeviceHandle, std::string> GLDevice::compileShader(ShaderStage stage, std::string_view source) {
        const GLuint shader = glCreateShader(stage == ShaderStage::Vertex ? GL_VERTEX_SHADER : GL_FRAGMENT_SHADER);
        if (shader == 0) {
            return std::unexpected(std::format("Failed to create {} shader object: {}",
                                               to_string(stage), gl_error_name(take_gl_error())));
        }

        const GLchar* code = source.data();
        const GLint length = static_cast<GLint>(source.size());
        glShaderSource(shader, 1, &code, &length);
        glCompileShader(shader);
        log_gl_errors("glCompileShader");

        GLint status = GL_FALSE;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
        if (status != GL_TRUE) {
            auto log = shader_info_log(shader);
            glDeleteShader(shader);
            return std::unexpected(std::move(log));
        }
        LOG_TRACE("{} shader compiled", to_string(stage));
        return shader;
    }

    std::expected<DeviceHandle, std::string> GLDevice::linkProgram(DeviceHandle vertex_shader, DeviceHandle fragment_shader) {
        const GLuint program = glCreateProgram();
        if (program == 0) {
            return std::unexpected(std::format("Failed to create program object: {}", gl_error_name(take_gl_error())));
        }

        glAttachShader(program, vertex_shader);
        glAttachShader(program, fragment_shader);
        glBindAttribLocation(program, shaders::POSITION_LOCATION, shaders::POSITION_ATTRIBUTE.data());
        glLinkProgram(program);
        log_gl_errors("glLinkProgram");

        GLint status = GL_FALSE;
        glGetProgramiv(program, GL_LINK_STATUS, &status);
        glDetachShader(program, vertex_shader);
        glDetachShader(program, fragment_shader);

        if (status != GL_TRUE) {
            auto log = program_info_log(program);
            glDeleteProgram(program);
            return std::unexpected(std::move(log));
        }
        return program;
    }

    void GLDevice::deleteShader(DeviceHandle shader) {
        glDeleteShader(shader);
    }

    void GLDevice::deleteProgram(DeviceHandle program) {
        glDeleteProgram(program);
    }

    std::optional<int32_t> GLDevice::uniformLocation(DeviceHandle program, std::string_view name) {
        const std::string uniform_name(name);
        const GLint location = glGetUniformLocation(program, uniform_name.c_str());
        if (location < 0) {
            return std::nullopt;
        }
        return location;
    }

    std::expected<DeviceHandle, std::string> GLDevice::createBuffer(BufferTarget target) {
        auto vbo = BufferObject::generate();
        if (!vbo) {
            return std::unexpected(vbo.error().what());
        }
        const GLuint id = vbo->id();
        buffers_.emplace(id, std::move(*vbo));
        LOG_TRACE("Created {} buffer {}", target == BufferTarget::Index ? "index" : "vertex", id);
        return id;
    }

    std::expected<void, std::string> GLDevice::uploadBuffer(BufferTarget target, DeviceHandle buffer,
                                                             std::span<const std::byte> data) {
        if (!buffers_.contains(buffer)) {
            return std::unexpected(std::format("unknown buffer {}", buffer));
        }

        // Element array bindings are vertex array state
        ScopedVertexArray bound(vao_);
        take_gl_error();

        const GLenum gl_target = to_gl(target);
        glBindBuffer(gl_target, buffer);
        glBufferData(gl_target, static_cast<GLsizeiptr>(data.size()), data.empty() ? nullptr : data.data(), GL_STATIC_DRAW);

        if (const GLenum err = glGetError(); err != GL_NO_ERROR) {
            return std::unexpected(std::format("glBufferData of {} bytes: {}", data.size(), gl_error_name(err)));
        }
        return {};
    }

    void GLDevice::deleteBuffer(DeviceHandle buffer) {
        buffers_.erase(buffer);
    }

    void GLDevice::setViewport(int32_t x, int32_t y, uint32_t width, uint32_t height) {
        glViewport(x, y, static_cast<GLsizei>(width), static_cast<GLsizei>(height));
    }

    void GLDevice::setClearColor(const glm::vec4& color) {
        glClearColor(color.r, color.g, color.b, color.a);
    }

    void GLDevice::enableDepthTest() {
        glEnable(GL_DEPTH_TEST);
        glDepthFunc(GL_LEQUAL);
    }

    void GLDevice::clear() {
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    }

    void GLDevice::useProgram(DeviceHandle program) {
        glUseProgram(program);
    }

    void GLDevice::setUniformMat4(int32_t location, const glm::mat4& value) {
        glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(value));
    }

    void GLDevice::setUniformVec3(int32_t location, const glm::vec3& value) {
        glUniform3fv(location, 1, glm::value_ptr(value));
    }

    void GLDevice::bindGeometry(DeviceHandle vertex_buffer, DeviceHandle index_buffer) {
        glBindVertexArray(vao_.id());
        glBindBuffer(GL_ARRAY_BUFFER, vertex_buffer);
        // Tightly packed vec3 positions
        glEnableVertexAttribArray(shaders::POSITION_LOCATION);
        glVertexAttribPointer(shaders::POSITION_LOCATION, 3, GL_FLOAT, GL_FALSE, 3 * sizeof(float), nullptr);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, index_buffer);
    }

    void GLDevice::drawIndexedTriangles(uint32_t index_count) {
        glDrawElements(GL_TRIANGLES, static_cast<GLsizei>(index_count), GL_UNSIGNED_SHORT, nullptr);
        log_gl_errors("glDrawElements");
    }

} // namespace gv::rendering
