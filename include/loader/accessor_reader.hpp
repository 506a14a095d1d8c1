/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "loader/gltf_types.hpp"
#include "loader/loader_error.hpp"
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

namespace gv::loader {

    // Index data keeps the width it was stored with
    using IndexData = std::variant<std::vector<uint8_t>, std::vector<uint16_t>, std::vector<uint32_t>>;

    // Upper bound on elements of an accessor not backed by buffer data (zero-filled or sparse only)
    constexpr size_t MAX_UNBACKED_ELEMENTS = size_t{1} << 20;

    /**
     * @brief Reads typed accessor data out of a DecodedScene
     *
     * Every byte range an accessor touches (its bufferView, sparse indices and
     * values) is checked against the view and the resolved buffer before cgltf
     * reads it, so a malformed accessor fails alone. Keeps the parsed document alive.
     */
    class AccessorReader {
    public:
        explicit AccessorReader(const DecodedScene& scene) : document_(scene.document) {}

        // VEC3/FLOAT accessor as a flat xyz sequence
        AccessorResult<std::vector<float>> readPositions(const cgltf_accessor& accessor) const;

        // SCALAR accessor of UNSIGNED_BYTE, UNSIGNED_SHORT or UNSIGNED_INT
        AccessorResult<IndexData> readIndices(const cgltf_accessor& accessor) const;

    private:
        AccessorResult<void> checkReadable(const cgltf_accessor& accessor) const;

        std::shared_ptr<const cgltf_data> document_;
    };

} // namespace gv::loader
