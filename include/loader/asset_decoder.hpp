/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "loader/gltf_types.hpp"
#include "loader/loader_error.hpp"
#include <cstdint>
#include <filesystem>
#include <span>

namespace gv::loader {

    struct DecodeOptions {
        // Directory that relative buffer URIs are resolved against.
        // Empty disables external buffer files.
        std::filesystem::path base_directory;
    };

    /**
     * @brief Detect the container kind from the first four bytes
     * @param bytes Raw asset bytes, at least 4 long
     */
    ContainerKind detect_container(std::span<const uint8_t> bytes);

    /**
     * @brief Decode a glTF 2.0 asset (.glb or .gltf) into its mesh list and data tables
     * @param bytes Raw asset bytes
     * @param options Buffer resolution options
     * @return DecodedScene on success, TooSmall or MalformedAsset on failure
     *
     * Buffers that cannot be resolved do not fail the decode; they are left
     * without data and only the primitives reading them fail later.
     */
    DecodeResult<DecodedScene> decode(std::span<const uint8_t> bytes, const DecodeOptions& options = {});

} // namespace gv::loader
