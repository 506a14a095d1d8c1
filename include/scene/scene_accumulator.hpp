/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "loader/accessor_reader.hpp"
#include "loader/gltf_types.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gv::scene {

    struct AccumulateOptions {
        param::IndexOverflowPolicy overflow_policy = param::IndexOverflowPolicy::Skip;
    };

    struct AccumulateStats {
        size_t primitives = 0; // visited
        size_t appended = 0;
        size_t skipped = 0; // no POSITION or no geometry
        size_t failed = 0;  // flatten error or overflow rejection
        size_t clamped_indices = 0;
    };

    // One vertex buffer and one 16-bit index buffer for the whole scene
    struct SceneBuffers {
        std::vector<float> vertices; // xyz triples
        std::vector<uint16_t> indices;
        uint32_t index_count = 0;
        bool placeholder = false;
        AccumulateStats stats;

        size_t vertexCount() const { return vertices.size() / 3; }
        bool empty() const { return vertices.empty() || indices.empty(); }
    };

    /**
     * @brief Flatten every primitive of every mesh, in file order, into one buffer pair
     *
     * Indices are rebased by the running vertex count (kept in 32 bits) and narrowed
     * to 16 bits only when written. Failing primitives are logged and skipped.
     * The result is empty when nothing renderable was found; callers substitute
     * make_placeholder_cube() in that case.
     */
    SceneBuffers accumulate(const loader::DecodedScene& scene,
                            const loader::AccessorReader& reader,
                            const AccumulateOptions& options = {});

    // Axis-aligned cube with corners at +-1: 8 vertices, 36 indices
    SceneBuffers make_placeholder_cube();

} // namespace gv::scene
