/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <string_view>

namespace gv::rendering::shaders {

    // Uniform and attribute names shared with the sources below
    constexpr std::string_view MVP_UNIFORM = "u_mvp_matrix";
    constexpr std::string_view COLOR_UNIFORM = "u_color";
    constexpr std::string_view POSITION_ATTRIBUTE = "a_position";
    constexpr unsigned POSITION_LOCATION = 0;

    constexpr std::string_view MESH_VERTEX = R"(#version 330 core
layout(location = 0) in vec3 a_position;

uniform mat4 u_mvp_matrix;

void main() {
    gl_Position = u_mvp_matrix * vec4(a_position, 1.0);
}
)";

    constexpr std::string_view MESH_FRAGMENT = R"(#version 330 core
uniform vec3 u_color;

out vec4 fragColor;

void main() {
    fragColor = vec4(u_color, 1.0);
}
)";

} // namespace gv::rendering::shaders
