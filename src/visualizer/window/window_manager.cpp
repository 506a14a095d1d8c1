/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "window_manager.hpp"
#include "core/logger.hpp"
#include <format>
// clang-format off
// glad has to come before GLFW pulls in any GL header
#include <glad/glad.h>
#include <GLFW/glfw3.h>
// clang-format on

namespace gv::visualizer {

    WindowManager::WindowManager(WindowConfig config)
        : config_(std::move(config)) {}

    WindowManager::~WindowManager() {
        if (window_)
            glfwDestroyWindow(window_);
        if (glfw_ready_)
            glfwTerminate();
    }

    std::expected<void, std::string> WindowManager::open() {
        glfwSetErrorCallback([](int code, const char* description) {
            LOG_ERROR("GLFW error {}: {}", code, description);
        });
        if (glfwInit() != GLFW_TRUE) {
            return std::unexpected("GLFW initialization failed");
        }
        glfw_ready_ = true;

        // OpenGL 3.3 core with a depth buffer
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
        glfwWindowHint(GLFW_DEPTH_BITS, 24);

        window_ = glfwCreateWindow(config_.width, config_.height, config_.title.c_str(), nullptr, nullptr);
        if (!window_) {
            return std::unexpected(std::format("could not create a {}x{} window with an OpenGL 3.3 context",
                                               config_.width, config_.height));
        }

        glfwMakeContextCurrent(window_);
        if (gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress)) == 0) {
            return std::unexpected("could not load OpenGL entry points");
        }

        glfwSwapInterval(config_.vsync ? 1 : 0);
        installCallbacks();
        queryFramebufferSize();

        LOG_INFO("Window '{}' open, framebuffer {}x{}", config_.title, framebuffer_size_.x, framebuffer_size_.y);
        return {};
    }

    WindowManager& WindowManager::owner(GLFWwindow* window) {
        return *static_cast<WindowManager*>(glfwGetWindowUserPointer(window));
    }

    void WindowManager::installCallbacks() {
        glfwSetWindowUserPointer(window_, this);

        glfwSetFramebufferSizeCallback(window_, [](GLFWwindow* window, int width, int height) {
            auto& self = owner(window);
            self.framebuffer_size_ = {width, height};
            if (self.callbacks_.on_framebuffer_resize)
                self.callbacks_.on_framebuffer_resize(width, height);
        });

        glfwSetMouseButtonCallback(window_, [](GLFWwindow* window, int button, int action, int) {
            if (button != GLFW_MOUSE_BUTTON_LEFT)
                return;
            auto& self = owner(window);
            if (action == GLFW_PRESS) {
                glm::dvec2 cursor;
                glfwGetCursorPos(window, &cursor.x, &cursor.y);
                self.drag_anchor_ = cursor;
            } else if (action == GLFW_RELEASE) {
                self.drag_anchor_.reset();
            }
        });

        glfwSetCursorPosCallback(window_, [](GLFWwindow* window, double x, double y) {
            auto& self = owner(window);
            if (!self.drag_anchor_)
                return;
            const glm::dvec2 cursor{x, y};
            const glm::dvec2 delta = cursor - *self.drag_anchor_;
            self.drag_anchor_ = cursor;
            if (self.callbacks_.on_drag)
                self.callbacks_.on_drag(static_cast<float>(delta.x), static_cast<float>(delta.y));
        });

        glfwSetDropCallback(window_, [](GLFWwindow* window, int count, const char** paths) {
            auto& self = owner(window);
            if (count <= 0 || !self.callbacks_.on_file_drop)
                return;
            if (count > 1)
                LOG_WARN("{} files dropped, only {} is loaded", count, paths[0]);
            self.callbacks_.on_file_drop(std::filesystem::path(paths[0]));
        });
    }

    void WindowManager::queryFramebufferSize() {
        glfwGetFramebufferSize(window_, &framebuffer_size_.x, &framebuffer_size_.y);
    }

    void WindowManager::pollEvents() {
        glfwPollEvents();
    }

    void WindowManager::swapBuffers() {
        glfwSwapBuffers(window_);
    }

    bool WindowManager::shouldClose() const {
        return glfwWindowShouldClose(window_) == GLFW_TRUE;
    }

} // namespace gv::visualizer
