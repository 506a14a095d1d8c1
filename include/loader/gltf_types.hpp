/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// cgltf types, defined in <cgltf.h>
struct cgltf_accessor;
struct cgltf_data;

namespace gv::loader {

    // Advisory only, both kinds go through the same parse
    enum class ContainerKind : uint8_t {
        Binary, // starts with the ASCII signature "glTF"
        Text
    };

    // glTF primitive.mode
    enum class Topology : uint8_t {
        Points = 0,
        Lines = 1,
        LineLoop = 2,
        LineStrip = 3,
        Triangles = 4,
        TriangleStrip = 5,
        TriangleFan = 6
    };

    std::string_view to_string(ContainerKind kind);
    std::string_view to_string(Topology topology);

    // Accessors point into the parsed document owned by the DecodedScene
    struct Primitive {
        Topology mode = Topology::Triangles;
        const cgltf_accessor* positions = nullptr;
        const cgltf_accessor* indices = nullptr;
    };

    struct Mesh {
        std::optional<std::string> name;
        std::vector<Primitive> primitives;
    };

    // Everything the flattener needs. Immutable once decode() returns it
    struct DecodedScene {
        ContainerKind kind = ContainerKind::Text;
        std::vector<Mesh> meshes;

        // Informational
        size_t scene_count = 0;
        size_t node_count = 0;
        size_t buffer_count = 0;
        size_t unresolved_buffers = 0;

        // Parsed document together with the bytes it was parsed from
        std::shared_ptr<const cgltf_data> document;

        size_t primitiveCount() const {
            size_t total = 0;
            for (const auto& mesh : meshes)
                total += mesh.primitives.size();
            return total;
        }
    };

} // namespace gv::loader
