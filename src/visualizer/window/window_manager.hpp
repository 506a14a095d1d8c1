/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <glm/glm.hpp>
#include <optional>
#include <string>

struct GLFWwindow;

namespace gv::visualizer {

    // Input the window forwards to the application
    struct WindowCallbacks {
        std::function<void(int width, int height)> on_framebuffer_resize;
        std::function<void(float delta_x, float delta_y)> on_drag;
        std::function<void(const std::filesystem::path&)> on_file_drop;
    };

    struct WindowConfig {
        std::string title;
        int width = 0;
        int height = 0;
        bool vsync = true;
    };

    /**
     * @brief GLFW window owning an OpenGL 3.3 core context
     *
     * open() makes the context current on the calling thread and loads the GL
     * entry points. Left-button drags are reported as cursor deltas.
     */
    class WindowManager {
    public:
        explicit WindowManager(WindowConfig config);
        ~WindowManager();

        WindowManager(const WindowManager&) = delete;
        WindowManager& operator=(const WindowManager&) = delete;

        std::expected<void, std::string> open();

        void setCallbacks(WindowCallbacks callbacks) { callbacks_ = std::move(callbacks); }

        void pollEvents();
        void swapBuffers();
        bool shouldClose() const;

        glm::ivec2 getFramebufferSize() const { return framebuffer_size_; }

    private:
        void queryFramebufferSize();
        void installCallbacks();

        static WindowManager& owner(GLFWwindow* window);

        WindowConfig config_;
        GLFWwindow* window_ = nullptr;
        bool glfw_ready_ = false;
        glm::ivec2 framebuffer_size_{0, 0};
        WindowCallbacks callbacks_;

        // Cursor position at the last drag event, set while the left button is held
        std::optional<glm::dvec2> drag_anchor_;
    };

} // namespace gv::visualizer
