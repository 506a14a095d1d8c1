/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/primitive_flattener.hpp"
#include "core/logger.hpp"
#include <numeric>
#include <type_traits>
#include <variant>

namespace gv::scene {

    namespace {

        FlattenErrorInfo from_accessor_error(const loader::AccessorErrorInfo& error) {
            switch (error.code) {
            case loader::AccessorError::BufferUnavailable:
                return {FlattenError::BufferUnavailable, error.details};
            case loader::AccessorError::OutOfBounds:
                return {FlattenError::OutOfBounds, error.details};
            default:
                return {FlattenError::InvalidAccessor, error.details};
            }
        }

        std::vector<uint16_t> narrow_indices(const loader::IndexData& data) {
            return std::visit([](const auto& source) {
                using T = typename std::decay_t<decltype(source)>::value_type;
                std::vector<uint16_t> out;
                out.reserve(source.size());
                if constexpr (sizeof(T) <= sizeof(uint16_t)) {
                    out.assign(source.begin(), source.end());
                } else {
                    for (const auto value : source)
                        out.push_back(narrow_index(value));
                }
                return out;
            },
                              data);
        }

    } // namespace

    uint16_t narrow_index(uint32_t value) {
        if (value > MAX_INDEX_16) {
            LOG_WARN("Index {} does not fit in 16 bits, clamped to {}", value, MAX_INDEX_16);
            return static_cast<uint16_t>(MAX_INDEX_16);
        }
        return static_cast<uint16_t>(value);
    }

    std::expected<std::optional<FlattenedPrimitive>, FlattenErrorInfo> flatten(
        const loader::Primitive& primitive,
        const loader::AccessorReader& reader) {

        if (!primitive.positions) {
            LOG_DEBUG("Primitive has no POSITION attribute, skipped");
            return std::nullopt;
        }

        if (primitive.mode != loader::Topology::Triangles) {
            LOG_WARN("Primitive topology {} is drawn as a triangle list", loader::to_string(primitive.mode));
        }

        auto positions = reader.readPositions(*primitive.positions);
        if (!positions) {
            return std::unexpected(from_accessor_error(positions.error()));
        }

        FlattenedPrimitive result;
        result.vertices = std::move(*positions);
        const size_t vertex_count = result.vertexCount();

        if (primitive.indices) {
            auto indices = reader.readIndices(*primitive.indices);
            if (!indices) {
                return std::unexpected(from_accessor_error(indices.error()));
            }
            result.indices = narrow_indices(*indices);
        } else {
            // Non-indexed geometry draws its vertices in order
            if (vertex_count > size_t{MAX_INDEX_16} + 1) {
                return std::unexpected(FlattenErrorInfo{FlattenError::TooManyVertices,
                                                        std::format("{} non-indexed vertices", vertex_count)});
            }
            result.indices.resize(vertex_count);
            std::iota(result.indices.begin(), result.indices.end(), uint16_t{0});
        }

        if (result.vertices.empty() || result.indices.empty()) {
            LOG_DEBUG("Primitive yields no geometry, skipped");
            return std::nullopt;
        }

        for (size_t i = 0; i < result.indices.size(); ++i) {
            if (result.indices[i] >= vertex_count) {
                return std::unexpected(FlattenErrorInfo{FlattenError::IndexOutOfRange,
                                                        std::format("index[{}] = {} but only {} vertices",
                                                                    i, result.indices[i], vertex_count)});
            }
        }

        LOG_TRACE("Flattened primitive: {} vertices, {} indices", vertex_count, result.indices.size());
        return result;
    }

} // namespace gv::scene
