/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "loader/gltf_types.hpp"

namespace gv::loader {

    std::string_view to_string(ContainerKind kind) {
        switch (kind) {
        case ContainerKind::Binary: return "binary (GLB)";
        case ContainerKind::Text: return "text (glTF JSON)";
        default: return "unknown";
        }
    }

    std::string_view to_string(Topology topology) {
        switch (topology) {
        case Topology::Points: return "POINTS";
        case Topology::Lines: return "LINES";
        case Topology::LineLoop: return "LINE_LOOP";
        case Topology::LineStrip: return "LINE_STRIP";
        case Topology::Triangles: return "TRIANGLES";
        case Topology::TriangleStrip: return "TRIANGLE_STRIP";
        case Topology::TriangleFan: return "TRIANGLE_FAN";
        default: return "UNKNOWN";
        }
    }

} // namespace gv::loader
