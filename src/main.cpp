/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "rendering/gl_device.hpp"
#include "visualizer/viewer.hpp"
#include "visualizer/window/window_manager.hpp"

#include <algorithm>
#include <print>

int main(int argc, char* argv[]) {
    // Also initializes the logger from --log-level
    auto params_result = gv::args::parse_args_and_params(argc, argv);
    if (!params_result) {
        LOG_ERROR("Failed to parse arguments: {}", params_result.error());
        std::println(stderr, "Error: {}", params_result.error());
        return -1;
    }

    auto params = std::move(*params_result);
    if (!params) {
        // --help
        return 0;
    }

    LOG_INFO("========================================");
    LOG_INFO("glTF Viewer");
    LOG_INFO("========================================");

    gv::visualizer::WindowManager window({.title = params->window.title,
                                          .width = params->window.width,
                                          .height = params->window.height});
    if (auto opened = window.open(); !opened) {
        LOG_ERROR("{}", opened.error());
        std::println(stderr, "Error: {}", opened.error());
        return -1;
    }

    auto device = gv::rendering::GLDevice::create();
    if (!device) {
        LOG_ERROR("{}", device.error().what());
        std::println(stderr, "Error: {}", device.error().message);
        return -1;
    }

    const gv::visualizer::RenderSurface surface{device->get(), window.getFramebufferSize()};
    auto viewer_result = gv::visualizer::Viewer::create(surface, *params);
    if (!viewer_result) {
        std::println(stderr, "Error: {}", viewer_result.error().message());
        return -1;
    }
    auto& viewer = *viewer_result;

    if (!params->asset_path.empty()) {
        if (auto loaded = viewer->loadFile(params->asset_path); !loaded) {
            LOG_ERROR("Failed to load {}: {}", params->asset_path.string(), loaded.error().message());
            std::println(stderr, "Error: {}", loaded.error().message());
        }
    }
    if (viewer->getState() != gv::visualizer::ViewerState::Ready) {
        if (auto loaded = viewer->loadPlaceholder(); !loaded) {
            std::println(stderr, "Error: {}", loaded.error().message());
            return -1;
        }
    }

    window.setCallbacks(gv::visualizer::WindowCallbacks{
        .on_framebuffer_resize = [&viewer](int width, int height) {
            viewer->resize(static_cast<uint32_t>(std::max(width, 0)), static_cast<uint32_t>(std::max(height, 0)));
        },
        .on_drag = [&viewer](float delta_x, float delta_y) {
            viewer->orbit(delta_x, delta_y);
        },
        .on_file_drop = [&viewer](const std::filesystem::path& path) {
            if (auto loaded = viewer->loadFile(path); !loaded) {
                LOG_ERROR("Failed to load dropped file {}: {}", path.string(), loaded.error().message());
            }
        }});

    while (!window.shouldClose()) {
        window.pollEvents();
        viewer->render();
        window.swapBuffers();
    }

    LOG_INFO("Viewer closed");
    gv::core::Logger::get().flush();
    return 0;
}
