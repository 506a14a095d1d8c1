/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "loader/accessor_reader.hpp"
#include "core/logger.hpp"
#include <cgltf.h>
#include <cstring>
#include <format>
#include <functional>
#include <string>

namespace gv::loader {

    namespace {

        std::string_view to_string(cgltf_type type) {
            switch (type) {
            case cgltf_type_scalar: return "SCALAR";
            case cgltf_type_vec2: return "VEC2";
            case cgltf_type_vec3: return "VEC3";
            case cgltf_type_vec4: return "VEC4";
            case cgltf_type_mat2: return "MAT2";
            case cgltf_type_mat3: return "MAT3";
            case cgltf_type_mat4: return "MAT4";
            default: return "INVALID";
            }
        }

        std::string_view to_string(cgltf_component_type type) {
            switch (type) {
            case cgltf_component_type_r_8: return "BYTE";
            case cgltf_component_type_r_8u: return "UNSIGNED_BYTE";
            case cgltf_component_type_r_16: return "SHORT";
            case cgltf_component_type_r_16u: return "UNSIGNED_SHORT";
            case cgltf_component_type_r_32u: return "UNSIGNED_INT";
            case cgltf_component_type_r_32f: return "FLOAT";
            default: return "INVALID";
            }
        }

        // Width of an unsigned index component, 0 for anything else
        size_t index_size(cgltf_component_type type) {
            switch (type) {
            case cgltf_component_type_r_8u: return 1;
            case cgltf_component_type_r_16u: return 2;
            case cgltf_component_type_r_32u: return 4;
            default: return 0;
            }
        }

        uint32_t read_index_at(const uint8_t* src, size_t width) {
            switch (width) {
            case 1: return *src;
            case 2: {
                uint16_t v = 0;
                std::memcpy(&v, src, sizeof(v));
                return v;
            }
            default: {
                uint32_t v = 0;
                std::memcpy(&v, src, sizeof(v));
                return v;
            }
            }
        }

        AccessorErrorInfo error(AccessorError code, std::string details) {
            return AccessorErrorInfo{code, std::move(details)};
        }

        // Elements at offset + k * stride, k < count, all end inside size bytes. Written so nothing can wrap
        bool fits(size_t size, size_t offset, size_t element_size, size_t stride, size_t count) {
            if (offset > size || element_size > size - offset)
                return false;
            return count - 1 <= (size - offset - element_size) / stride;
        }

        AccessorResult<void> check_view(const cgltf_buffer_view& view, size_t offset, size_t element_size,
                                        size_t stride, size_t count, std::string_view what) {
            if (!view.buffer) {
                return std::unexpected(error(AccessorError::InvalidAccessor, std::format("{} view has no buffer", what)));
            }
            const cgltf_buffer& buffer = *view.buffer;
            if (!buffer.data) {
                return std::unexpected(error(AccessorError::BufferUnavailable,
                                             std::format("{} reads a buffer that was not resolved", what)));
            }
            if (view.offset > buffer.size || view.size > buffer.size - view.offset) {
                return std::unexpected(error(AccessorError::OutOfBounds,
                                             std::format("{} view [{}, +{}) exceeds its {} byte buffer",
                                                         what, view.offset, view.size, buffer.size)));
            }
            if (!fits(view.size, offset, element_size, stride, count)) {
                return std::unexpected(error(AccessorError::OutOfBounds,
                                             std::format("{} of {} x {} bytes (stride {}, offset {}) exceeds its {} byte view",
                                                         what, count, element_size, stride, offset, view.size)));
            }
            return {};
        }

    } // namespace

    AccessorResult<void> AccessorReader::checkReadable(const cgltf_accessor& accessor) const {
        const size_t element_size = cgltf_calc_size(accessor.type, accessor.component_type);
        if (element_size == 0 || accessor.count == 0) {
            return std::unexpected(error(AccessorError::InvalidAccessor, "accessor is empty"));
        }

        if (accessor.buffer_view) {
            const cgltf_buffer_view& view = *accessor.buffer_view;
            const size_t stride = view.stride != 0 ? view.stride : element_size;
            if (stride < element_size) {
                return std::unexpected(error(AccessorError::InvalidAccessor,
                                             std::format("stride {} is smaller than the element size {}", stride, element_size)));
            }
            if (auto in_view = check_view(view, accessor.offset, element_size, stride, accessor.count, "accessor"); !in_view) {
                return in_view;
            }
        } else if (accessor.count > MAX_UNBACKED_ELEMENTS) {
            return std::unexpected(error(AccessorError::InvalidAccessor,
                                         std::format("{} elements without a bufferView, limit is {}",
                                                     accessor.count, MAX_UNBACKED_ELEMENTS)));
        }

        if (!accessor.is_sparse)
            return {};

        const cgltf_accessor_sparse& sparse = accessor.sparse;
        const size_t width = index_size(sparse.indices_component_type);
        if (!sparse.indices_buffer_view || !sparse.values_buffer_view || width == 0 || sparse.count == 0) {
            return std::unexpected(error(AccessorError::InvalidAccessor, "incomplete sparse storage"));
        }
        if (sparse.count > accessor.count) {
            return std::unexpected(error(AccessorError::InvalidAccessor,
                                         std::format("{} sparse values for {} elements", sparse.count, accessor.count)));
        }
        if (auto in_view = check_view(*sparse.indices_buffer_view, sparse.indices_byte_offset, width, width,
                                      sparse.count, "sparse indices");
            !in_view) {
            return in_view;
        }
        if (auto in_view = check_view(*sparse.values_buffer_view, sparse.values_byte_offset, element_size, element_size,
                                      sparse.count, "sparse values");
            !in_view) {
            return in_view;
        }

        // cgltf writes each sparse value at its target without checking it
        const uint8_t* targets = cgltf_buffer_view_data(sparse.indices_buffer_view) + sparse.indices_byte_offset;
        for (size_t k = 0; k < sparse.count; ++k) {
            const uint32_t target = read_index_at(targets + k * width, width);
            if (target >= accessor.count) {
                return std::unexpected(error(AccessorError::OutOfBounds,
                                             std::format("sparse index {} past count {}", target, accessor.count)));
            }
        }
        LOG_TRACE("Accessor has {} sparse substitution(s)", sparse.count);
        return {};
    }

    AccessorResult<std::vector<float>> AccessorReader::readPositions(const cgltf_accessor& accessor) const {
        if (accessor.type != cgltf_type_vec3 || accessor.component_type != cgltf_component_type_r_32f) {
            return std::unexpected(error(AccessorError::InvalidAccessor,
                                         std::format("POSITION accessor is {}/{}, expected VEC3/FLOAT",
                                                     to_string(accessor.type), to_string(accessor.component_type))));
        }
        if (auto readable = checkReadable(accessor); !readable) {
            return std::unexpected(readable.error());
        }

        std::vector<float> positions(accessor.count * 3);
        if (cgltf_accessor_unpack_floats(&accessor, positions.data(), positions.size()) != positions.size()) {
            return std::unexpected(error(AccessorError::InvalidAccessor, "cgltf could not unpack the positions"));
        }
        return positions;
    }

    AccessorResult<IndexData> AccessorReader::readIndices(const cgltf_accessor& accessor) const {
        if (accessor.type != cgltf_type_scalar || index_size(accessor.component_type) == 0) {
            return std::unexpected(error(AccessorError::InvalidAccessor,
                                         std::format("index accessor is {}/{}, expected an unsigned SCALAR",
                                                     to_string(accessor.type), to_string(accessor.component_type))));
        }
        if (auto readable = checkReadable(accessor); !readable) {
            return std::unexpected(readable.error());
        }

        auto read = [&accessor]<typename T>(std::vector<T> out) -> AccessorResult<IndexData> {
            if (accessor.is_sparse || !accessor.buffer_view) {
                // cgltf_accessor_read_index does not apply sparse storage
                std::vector<float> values(out.size());
                if (cgltf_accessor_unpack_floats(&accessor, values.data(), values.size()) != values.size()) {
                    return std::unexpected(error(AccessorError::InvalidAccessor, "cgltf could not unpack the indices"));
                }
                for (size_t i = 0; i < out.size(); ++i)
                    out[i] = static_cast<T>(values[i]);
            } else {
                for (size_t i = 0; i < out.size(); ++i)
                    out[i] = static_cast<T>(cgltf_accessor_read_index(&accessor, i));
            }
            return IndexData{std::move(out)};
        };

        switch (accessor.component_type) {
        case cgltf_component_type_r_8u: return read(std::vector<uint8_t>(accessor.count));
        case cgltf_component_type_r_16u: return read(std::vector<uint16_t>(accessor.count));
        default: return read(std::vector<uint32_t>(accessor.count));
        }
    }

} // namespace gv::loader
