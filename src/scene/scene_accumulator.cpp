/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/scene_accumulator.hpp"
#include "core/logger.hpp"
#include "scene/primitive_flattener.hpp"
#include <algorithm>
#include <limits>

namespace gv::scene {

    namespace placeholder_constants {
        // clang-format off
        constexpr float CUBE_VERTICES[] = {
            // front
            -1.0f, -1.0f,  1.0f,
             1.0f, -1.0f,  1.0f,
             1.0f,  1.0f,  1.0f,
            -1.0f,  1.0f,  1.0f,
            // back
            -1.0f, -1.0f, -1.0f,
            -1.0f,  1.0f, -1.0f,
             1.0f,  1.0f, -1.0f,
             1.0f, -1.0f, -1.0f,
        };

        constexpr uint16_t CUBE_INDICES[] = {
            0, 1, 2, 0, 2, 3, // front
            4, 5, 6, 4, 6, 7, // back
            4, 0, 3, 4, 3, 5, // left
            1, 7, 6, 1, 6, 2, // right
            3, 2, 6, 3, 6, 5, // top
            4, 7, 1, 4, 1, 0, // bottom
        };
        // clang-format on
    } // namespace placeholder_constants

    SceneBuffers make_placeholder_cube() {
        using namespace placeholder_constants;
        SceneBuffers buffers;
        buffers.vertices.assign(std::begin(CUBE_VERTICES), std::end(CUBE_VERTICES));
        buffers.indices.assign(std::begin(CUBE_INDICES), std::end(CUBE_INDICES));
        buffers.index_count = static_cast<uint32_t>(buffers.indices.size());
        buffers.placeholder = true;
        return buffers;
    }

    SceneBuffers accumulate(const loader::DecodedScene& scene,
                            const loader::AccessorReader& reader,
                            const AccumulateOptions& options) {
        LOG_TIMER_DEBUG("Accumulate scene geometry");

        SceneBuffers out;
        auto& stats = out.stats;
        uint32_t vertex_offset = 0;

        for (size_t mesh_index = 0; mesh_index < scene.meshes.size(); ++mesh_index) {
            const auto& mesh = scene.meshes[mesh_index];
            const auto mesh_name = mesh.name.value_or("<unnamed>");

            for (size_t prim_index = 0; prim_index < mesh.primitives.size(); ++prim_index) {
                ++stats.primitives;

                auto flattened = flatten(mesh.primitives[prim_index], reader);
                if (!flattened) {
                    LOG_WARN("Mesh {} '{}' primitive {} skipped: {}",
                             mesh_index, mesh_name, prim_index, flattened.error().message());
                    ++stats.failed;
                    continue;
                }
                if (!*flattened) {
                    ++stats.skipped;
                    continue;
                }

                FlattenedPrimitive& primitive = **flattened;

                if (const size_t remainder = primitive.indices.size() % 3; remainder != 0) {
                    LOG_WARN("Mesh {} '{}' primitive {}: dropping {} index(es) of an incomplete triangle",
                             mesh_index, mesh_name, prim_index, remainder);
                    primitive.indices.resize(primitive.indices.size() - remainder);
                    if (primitive.indices.empty()) {
                        ++stats.skipped;
                        continue;
                    }
                }

                const size_t vertex_count = primitive.vertexCount();
                if (vertex_count > std::numeric_limits<uint32_t>::max() - vertex_offset) {
                    LOG_WARN("Mesh {} '{}' primitive {} skipped: {}", mesh_index, mesh_name, prim_index,
                             FlattenErrorInfo{FlattenError::TooManyVertices, "vertex counter exhausted"}.message());
                    ++stats.failed;
                    continue;
                }

                const uint32_t max_local = *std::max_element(primitive.indices.begin(), primitive.indices.end());
                const bool overflows = static_cast<uint64_t>(vertex_offset) + max_local > MAX_INDEX_16;

                if (overflows && options.overflow_policy == param::IndexOverflowPolicy::Skip) {
                    LOG_WARN("Mesh {} '{}' primitive {} skipped: {}", mesh_index, mesh_name, prim_index,
                             FlattenErrorInfo{FlattenError::TooManyVertices,
                                              std::format("index {} rebased by {} exceeds {}",
                                                          max_local, vertex_offset, MAX_INDEX_16)}
                                 .message());
                    ++stats.failed;
                    continue;
                }

                out.vertices.insert(out.vertices.end(), primitive.vertices.begin(), primitive.vertices.end());
                out.indices.reserve(out.indices.size() + primitive.indices.size());

                size_t clamped = 0;
                for (const uint16_t index : primitive.indices) {
                    const uint64_t rebased = static_cast<uint64_t>(vertex_offset) + index;
                    if (rebased > MAX_INDEX_16) {
                        ++clamped;
                        out.indices.push_back(static_cast<uint16_t>(MAX_INDEX_16));
                    } else {
                        out.indices.push_back(static_cast<uint16_t>(rebased));
                    }
                }
                if (clamped > 0) {
                    LOG_WARN("Mesh {} '{}' primitive {}: {} rebased index(es) clamped to {}",
                             mesh_index, mesh_name, prim_index, clamped, MAX_INDEX_16);
                    stats.clamped_indices += clamped;
                }

                LOG_DEBUG("Mesh {} '{}' primitive {}: {} vertices, {} indices, offset {}",
                          mesh_index, mesh_name, prim_index, vertex_count, primitive.indices.size(), vertex_offset);

                vertex_offset += static_cast<uint32_t>(vertex_count);
                ++stats.appended;
            }
        }

        out.index_count = static_cast<uint32_t>(out.indices.size());

        LOG_INFO("Accumulated {} vertices, {} indices from {}/{} primitive(s) ({} skipped, {} failed)",
                 out.vertexCount(), out.index_count, stats.appended, stats.primitives, stats.skipped, stats.failed);
        return out;
    }

} // namespace gv::scene
