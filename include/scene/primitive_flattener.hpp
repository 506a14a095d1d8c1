/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "loader/accessor_reader.hpp"
#include "loader/gltf_types.hpp"
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <vector>

namespace gv::scene {

    // Per-primitive failures. The accumulator logs them and moves on
    enum class FlattenError {
        InvalidAccessor,
        BufferUnavailable,
        OutOfBounds,
        IndexOutOfRange,
        TooManyVertices
    };

    inline std::string to_string(FlattenError error) {
        switch (error) {
        case FlattenError::InvalidAccessor: return "Invalid accessor";
        case FlattenError::BufferUnavailable: return "Buffer unavailable";
        case FlattenError::OutOfBounds: return "Accessor out of bounds";
        case FlattenError::IndexOutOfRange: return "Index out of range";
        case FlattenError::TooManyVertices: return "Too many vertices for 16-bit indices";
        default: return "Unknown error";
        }
    }

    struct FlattenErrorInfo {
        FlattenError code;
        std::string details;

        std::string message() const {
            if (details.empty()) {
                return to_string(code);
            }
            return std::format("{}: {}", to_string(code), details);
        }
    };

    // Flat xyz vertices and 16-bit indices of one primitive, each index < vertices.size() / 3
    struct FlattenedPrimitive {
        std::vector<float> vertices;
        std::vector<uint16_t> indices;

        size_t vertexCount() const { return vertices.size() / 3; }
    };

    constexpr uint32_t MAX_INDEX_16 = 65535;

    // min(value, 65535); clamping is logged
    uint16_t narrow_index(uint32_t value);

    /**
     * @brief Extract positions and 16-bit indices of a primitive
     * @param primitive Primitive of a DecodedScene
     * @param reader Reader over the same DecodedScene
     * @return nullopt when the primitive has no POSITION or yields no geometry
     */
    std::expected<std::optional<FlattenedPrimitive>, FlattenErrorInfo> flatten(
        const loader::Primitive& primitive,
        const loader::AccessorReader& reader);

} // namespace gv::scene
