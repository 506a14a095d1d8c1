/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "buffer_resolver.hpp"
#include "core/logger.hpp"
#include <cstdlib>
#include <cstring>
#include <expected>
#include <format>
#include <fstream>
#include <string>
#include <string_view>

namespace gv::loader {

    namespace {

        constexpr std::string_view DATA_URI_PREFIX = "data:";
        constexpr std::string_view BASE64_MARKER = ";base64";

        using BufferData = std::expected<void*, std::string>;

        BufferData bind_glb_chunk(const cgltf_data& data, const cgltf_buffer& buffer) {
            if (!data.bin) {
                return std::unexpected(std::string("no uri and no GLB BIN chunk to bind"));
            }
            if (data.bin_size < buffer.size) {
                return std::unexpected(std::format("BIN chunk holds {} bytes but byteLength is {}",
                                                   data.bin_size, buffer.size));
            }
            return const_cast<void*>(data.bin);
        }

        BufferData decode_data_uri(std::string_view uri, const cgltf_buffer& buffer) {
            const size_t comma = uri.find(',');
            if (comma == std::string_view::npos || !uri.substr(0, comma).ends_with(BASE64_MARKER)) {
                return std::unexpected(std::string("data: uri is not base64 encoded"));
            }

            const cgltf_options options{};
            void* decoded = nullptr;
            if (cgltf_load_buffer_base64(&options, buffer.size, uri.data() + comma + 1, &decoded) != cgltf_result_success) {
                return std::unexpected(std::format("data: uri does not decode to {} bytes", buffer.size));
            }
            return decoded;
        }

        BufferData read_external(std::string_view uri, const cgltf_buffer& buffer,
                                 const std::filesystem::path& base_directory) {
            if (base_directory.empty()) {
                return std::unexpected(std::format("external file '{}' without a base directory", uri));
            }

            // cgltf decodes percent escapes in place
            std::string relative(uri);
            relative.resize(cgltf_decode_uri(relative.data()));
            const auto path = base_directory / std::filesystem::u8path(relative);

            std::ifstream file(path, std::ios::binary | std::ios::ate);
            if (!file) {
                return std::unexpected(std::format("cannot open {}", path.string()));
            }
            const auto file_size = static_cast<size_t>(file.tellg());
            if (file_size < buffer.size) {
                return std::unexpected(std::format("{} holds {} bytes but byteLength is {}",
                                                   path.string(), file_size, buffer.size));
            }

            // Released by cgltf_free through the default allocator
            void* bytes = std::malloc(buffer.size > 0 ? buffer.size : 1);
            if (!bytes) {
                return std::unexpected(std::format("cannot allocate {} bytes", buffer.size));
            }
            file.seekg(0);
            if (!file.read(static_cast<char*>(bytes), static_cast<std::streamsize>(buffer.size))) {
                std::free(bytes);
                return std::unexpected(std::format("read of {} failed", path.string()));
            }
            return bytes;
        }

    } // namespace

    size_t resolve_buffers(cgltf_data& data, const std::filesystem::path& base_directory) {
        size_t unresolved = 0;

        for (cgltf_size i = 0; i < data.buffers_count; ++i) {
            cgltf_buffer& buffer = data.buffers[i];
            if (buffer.data)
                continue;

            BufferData resolved;
            cgltf_data_free_method free_method = cgltf_data_free_method_memory_free;
            if (!buffer.uri) {
                if (i == 0) {
                    resolved = bind_glb_chunk(data, buffer);
                } else {
                    resolved = std::unexpected(std::string("no uri and not the first buffer"));
                }
                free_method = cgltf_data_free_method_none;
            } else if (std::string_view uri(buffer.uri); uri.starts_with(DATA_URI_PREFIX)) {
                resolved = decode_data_uri(uri, buffer);
            } else {
                resolved = read_external(uri, buffer, base_directory);
            }

            if (!resolved) {
                LOG_WARN("Buffer {} unavailable: {}", i, resolved.error());
                ++unresolved;
                continue;
            }

            buffer.data = *resolved;
            buffer.data_free_method = free_method;
            LOG_TRACE("Buffer {} resolved ({} bytes)", i, buffer.size);
        }
        return unresolved;
    }

} // namespace gv::loader
