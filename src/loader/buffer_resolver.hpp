/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cgltf.h>
#include <cstddef>
#include <filesystem>

namespace gv::loader {

    /**
     * @brief Attach data to every buffer of a parsed document
     *
     * Buffer 0 without a uri binds the GLB BIN chunk, base64 data: URIs are
     * decoded and any other uri is read from base_directory (empty disables
     * external files). Unlike cgltf_load_buffers a failing buffer does not
     * fail the rest: it is logged and left without data.
     *
     * @return Number of buffers left without data
     */
    size_t resolve_buffers(cgltf_data& data, const std::filesystem::path& base_directory);

} // namespace gv::loader
