/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include <expected>
#include <filesystem>
#include <format>
#include <glad/glad.h>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace gv::rendering {

    inline std::string gl_error_name(GLenum error) {
        switch (error) {
        case GL_NO_ERROR: return "GL_NO_ERROR";
        case GL_INVALID_ENUM: return "GL_INVALID_ENUM";
        case GL_INVALID_VALUE: return "GL_INVALID_VALUE";
        case GL_INVALID_OPERATION: return "GL_INVALID_OPERATION";
        case GL_INVALID_FRAMEBUFFER_OPERATION: return "GL_INVALID_FRAMEBUFFER_OPERATION";
        case GL_OUT_OF_MEMORY: return "GL_OUT_OF_MEMORY";
        default: return std::format("0x{:04x}", error);
        }
    }

    // Empties the error queue and returns the oldest entry
    inline GLenum take_gl_error() {
        const GLenum first = glGetError();
        if (first != GL_NO_ERROR) {
            while (glGetError() != GL_NO_ERROR) {}
        }
        return first;
    }

    // Logs whatever the last GL call left in the error queue, attributed to the caller
    inline void log_gl_errors(std::string_view call, std::source_location loc = std::source_location::current()) {
        for (GLenum err = glGetError(); err != GL_NO_ERROR; err = glGetError()) {
            core::Logger::get().log_internal(core::LogLevel::Error, loc, "{} raised {}", call, gl_error_name(err));
        }
    }

    struct GLError {
        std::string message;
        std::source_location location;

        std::string what() const {
            return std::format("{} ({}:{})", message,
                               std::filesystem::path(location.file_name()).filename().string(),
                               location.line());
        }
    };

    template <typename T>
    using GLResult = std::expected<T, GLError>;

    enum class GLObjectKind {
        VertexArray,
        Buffer
    };

    /**
     * @brief Owns one GL object name of the given kind
     *
     * Created only through generate(); the name is deleted on destruction
     * and ownership moves with the object.
     */
    template <GLObjectKind Kind>
    class GLObject {
    public:
        GLObject() = default;
        ~GLObject() { release(); }

        GLObject(GLObject&& other) noexcept : id_(std::exchange(other.id_, 0)) {}
        GLObject& operator=(GLObject&& other) noexcept {
            if (this != &other) {
                release();
                id_ = std::exchange(other.id_, 0);
            }
            return *this;
        }

        GLObject(const GLObject&) = delete;
        GLObject& operator=(const GLObject&) = delete;

        static GLResult<GLObject> generate(std::source_location loc = std::source_location::current()) {
            take_gl_error();
            GLuint id = 0;
            if constexpr (Kind == GLObjectKind::VertexArray) {
                glGenVertexArrays(1, &id);
            } else {
                glGenBuffers(1, &id);
            }
            if (const GLenum err = take_gl_error(); err != GL_NO_ERROR || id == 0) {
                return std::unexpected(GLError{
                    std::format("could not generate {} name: {}", kind_name(), gl_error_name(err)), loc});
            }
            GLObject object;
            object.id_ = id;
            return object;
        }

        static constexpr std::string_view kind_name() {
            return Kind == GLObjectKind::VertexArray ? "vertex array" : "buffer";
        }

        GLuint id() const { return id_; }
        explicit operator bool() const { return id_ != 0; }

    private:
        void release() {
            if (id_ == 0)
                return;
            if constexpr (Kind == GLObjectKind::VertexArray) {
                glDeleteVertexArrays(1, &id_);
            } else {
                glDeleteBuffers(1, &id_);
            }
            id_ = 0;
        }

        GLuint id_ = 0;
    };

    using VertexArrayObject = GLObject<GLObjectKind::VertexArray>;
    using BufferObject = GLObject<GLObjectKind::Buffer>;

    // Binds a vertex array for one scope and puts the previous binding back
    class ScopedVertexArray {
    public:
        explicit ScopedVertexArray(const VertexArrayObject& vao) {
            glGetIntegerv(GL_VERTEX_ARRAY_BINDING, &previous_);
            glBindVertexArray(vao.id());
        }
        ~ScopedVertexArray() { glBindVertexArray(static_cast<GLuint>(previous_)); }

        ScopedVertexArray(const ScopedVertexArray&) = delete;
        ScopedVertexArray& operator=(const ScopedVertexArray&) = delete;

    private:
        GLint previous_ = 0;
    };

} // namespace gv::rendering
