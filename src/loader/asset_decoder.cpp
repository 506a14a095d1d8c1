/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#define CGLTF_IMPLEMENTATION
#include <cgltf.h>

#include "loader/asset_decoder.hpp"
#include "buffer_resolver.hpp"
#include "core/logger.hpp"
#include <format>
#include <string_view>

namespace gv::loader {

    namespace {

        constexpr size_t MIN_ASSET_SIZE = 4;

        bool is_valid_utf8(std::span<const uint8_t> bytes) {
            size_t i = 0;
            while (i < bytes.size()) {
                const uint8_t lead = bytes[i];
                size_t extra = 0;
                uint32_t min_code = 0;
                if (lead < 0x80) {
                    ++i;
                    continue;
                } else if ((lead & 0xE0) == 0xC0) {
                    extra = 1;
                    min_code = 0x80;
                } else if ((lead & 0xF0) == 0xE0) {
                    extra = 2;
                    min_code = 0x800;
                } else if ((lead & 0xF8) == 0xF0) {
                    extra = 3;
                    min_code = 0x10000;
                } else {
                    return false;
                }

                if (i + extra >= bytes.size())
                    return false;

                uint32_t code = lead & (0x3F >> extra);
                for (size_t k = 1; k <= extra; ++k) {
                    const uint8_t cont = bytes[i + k];
                    if ((cont & 0xC0) != 0x80)
                        return false;
                    code = (code << 6) | (cont & 0x3F);
                }
                // Overlong forms, surrogates and values past U+10FFFF
                if (code < min_code || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF))
                    return false;
                i += extra + 1;
            }
            return true;
        }

        std::string_view describe(cgltf_result result) {
            switch (result) {
            case cgltf_result_success: return "success";
            case cgltf_result_data_too_short: return "data too short";
            case cgltf_result_unknown_format: return "unknown format";
            case cgltf_result_invalid_json: return "invalid JSON";
            case cgltf_result_invalid_gltf: return "invalid glTF";
            case cgltf_result_invalid_options: return "invalid options";
            case cgltf_result_file_not_found: return "file not found";
            case cgltf_result_io_error: return "I/O error";
            case cgltf_result_out_of_memory: return "out of memory";
            case cgltf_result_legacy_gltf: return "legacy glTF";
            default: return "unknown cgltf error";
            }
        }

        std::optional<Topology> to_topology(cgltf_primitive_type type) {
            switch (type) {
            case cgltf_primitive_type_points: return Topology::Points;
            case cgltf_primitive_type_lines: return Topology::Lines;
            case cgltf_primitive_type_line_loop: return Topology::LineLoop;
            case cgltf_primitive_type_line_strip: return Topology::LineStrip;
            case cgltf_primitive_type_triangles: return Topology::Triangles;
            case cgltf_primitive_type_triangle_strip: return Topology::TriangleStrip;
            case cgltf_primitive_type_triangle_fan: return Topology::TriangleFan;
            default: return std::nullopt;
            }
        }

        // cgltf keeps pointers into the bytes it parsed (the GLB BIN chunk), so both live together
        struct ParsedAsset {
            std::vector<uint8_t> bytes;
            cgltf_data* data = nullptr;

            ParsedAsset() = default;
            ParsedAsset(const ParsedAsset&) = delete;
            ParsedAsset& operator=(const ParsedAsset&) = delete;
            ~ParsedAsset() {
                if (data)
                    cgltf_free(data);
            }
        };

        DecodeResult<std::vector<Mesh>> collect_meshes(const cgltf_data& data) {
            std::vector<Mesh> meshes;
            meshes.reserve(data.meshes_count);

            for (cgltf_size m = 0; m < data.meshes_count; ++m) {
                const cgltf_mesh& source = data.meshes[m];
                Mesh mesh;
                if (source.name)
                    mesh.name = source.name;

                for (cgltf_size p = 0; p < source.primitives_count; ++p) {
                    const cgltf_primitive& prim = source.primitives[p];
                    const auto mode = to_topology(prim.type);
                    if (!mode) {
                        return std::unexpected(DecodeErrorInfo{DecodeError::MalformedAsset,
                                                               std::format("mesh {} primitive {} has an unknown mode", m, p)});
                    }

                    Primitive primitive;
                    primitive.mode = *mode;
                    primitive.indices = prim.indices;
                    for (cgltf_size a = 0; a < prim.attributes_count; ++a) {
                        if (prim.attributes[a].type == cgltf_attribute_type_position) {
                            primitive.positions = prim.attributes[a].data;
                            break;
                        }
                    }
                    mesh.primitives.push_back(primitive);
                }

                LOG_DEBUG("Mesh {} '{}': {} primitive(s)", m, mesh.name.value_or("<unnamed>"), mesh.primitives.size());
                meshes.push_back(std::move(mesh));
            }
            return meshes;
        }

    } // namespace

    ContainerKind detect_container(std::span<const uint8_t> bytes) {
        if (bytes.size() >= MIN_ASSET_SIZE &&
            bytes[0] == 'g' && bytes[1] == 'l' && bytes[2] == 'T' && bytes[3] == 'F') {
            return ContainerKind::Binary;
        }
        return ContainerKind::Text;
    }

    DecodeResult<DecodedScene> decode(std::span<const uint8_t> bytes, const DecodeOptions& options) {
        LOG_TIMER_DEBUG("Decode glTF asset");

        if (bytes.size() < MIN_ASSET_SIZE) {
            return std::unexpected(DecodeErrorInfo{DecodeError::TooSmall,
                                                   std::format("{} byte(s), need at least {}", bytes.size(), MIN_ASSET_SIZE)});
        }

        const ContainerKind kind = detect_container(bytes);
        LOG_INFO("Detected {} container ({} bytes)", to_string(kind), bytes.size());
        if (kind == ContainerKind::Text && !is_valid_utf8(bytes)) {
            LOG_WARN("Asset is not valid UTF-8, passing it to the parser unchanged");
        }

        auto asset = std::make_shared<ParsedAsset>();
        asset->bytes.assign(bytes.begin(), bytes.end());

        const cgltf_options parse_options{};
        if (const cgltf_result result = cgltf_parse(&parse_options, asset->bytes.data(), asset->bytes.size(), &asset->data);
            result != cgltf_result_success) {
            return std::unexpected(DecodeErrorInfo{DecodeError::MalformedAsset,
                                                   std::format("cgltf_parse: {}", describe(result))});
        }

        cgltf_data& data = *asset->data;
        if (!data.asset.version || data.asset.version[0] != '2') {
            return std::unexpected(DecodeErrorInfo{DecodeError::MalformedAsset,
                                                   std::format("unsupported asset.version '{}'",
                                                               data.asset.version ? data.asset.version : "")});
        }

        auto meshes = collect_meshes(data);
        if (!meshes) {
            return std::unexpected(meshes.error());
        }

        DecodedScene scene;
        scene.kind = kind;
        scene.meshes = std::move(*meshes);
        scene.scene_count = data.scenes_count;
        scene.node_count = data.nodes_count;
        scene.buffer_count = data.buffers_count;
        scene.unresolved_buffers = resolve_buffers(data, options.base_directory);
        if (scene.unresolved_buffers > 0) {
            LOG_WARN("{} of {} buffer(s) could not be resolved", scene.unresolved_buffers, scene.buffer_count);
        }
        scene.document = std::shared_ptr<const cgltf_data>(asset, asset->data);

        LOG_INFO("Decoded glTF: {} scene(s), {} node(s), {} mesh(es), {} primitive(s)",
                 scene.scene_count, scene.node_count, scene.meshes.size(), scene.primitiveCount());
        return scene;
    }

} // namespace gv::loader
