/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "visualizer/viewer.hpp"
#include "core/logger.hpp"
#include "loader/accessor_reader.hpp"
#include "loader/asset_decoder.hpp"
#include <algorithm>
#include <fstream>
#include <vector>

namespace gv::visualizer {

    namespace {

        uint32_t to_extent(int value) {
            return static_cast<uint32_t>(std::max(value, 0));
        }

        LoadErrorInfo from_decode_error(const loader::DecodeErrorInfo& error) {
            switch (error.code) {
            case loader::DecodeError::TooSmall:
                return {LoadError::TooSmall, error.details};
            default:
                return {LoadError::MalformedAsset, error.details};
            }
        }

        std::expected<std::vector<uint8_t>, std::string> read_file(const std::filesystem::path& path) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
                return std::unexpected(std::format("{} is not a regular file", path.string()));
            }

            std::ifstream file(path, std::ios::binary | std::ios::ate);
            if (!file.is_open()) {
                return std::unexpected(std::format("could not open {}", path.string()));
            }
            const auto size = file.tellg();
            if (size < 0) {
                return std::unexpected(std::format("could not determine size of {}", path.string()));
            }

            std::vector<uint8_t> bytes(static_cast<size_t>(size));
            file.seekg(0);
            if (!bytes.empty() && !file.read(reinterpret_cast<char*>(bytes.data()), size)) {
                return std::unexpected(std::format("failed reading {}", path.string()));
            }
            return bytes;
        }

    } // namespace

    rendering::Result<std::unique_ptr<Viewer>> Viewer::create(const RenderSurface& surface,
                                                              const param::ViewerParameters& params) {
        if (!surface.device) {
            return rendering::make_error<std::unique_ptr<Viewer>>(rendering::InitError::MissingContext,
                                                                  "render surface has no graphics device");
        }

        auto& device = *surface.device;
        device.enableDepthTest();
        device.setClearColor(params.render.clear_color);
        device.setViewport(0, 0, to_extent(surface.framebuffer_size.x), to_extent(surface.framebuffer_size.y));

        auto gpu = rendering::GpuResources::initialize(device);
        if (!gpu) {
            return std::unexpected(gpu.error());
        }

        LOG_INFO("Viewer initialized ({}x{})", surface.framebuffer_size.x, surface.framebuffer_size.y);
        return std::unique_ptr<Viewer>(new Viewer(device, params, std::move(*gpu), surface.framebuffer_size));
    }

    Viewer::Viewer(rendering::IGraphicsDevice& device,
                   const param::ViewerParameters& params,
                   rendering::GpuResources gpu,
                   glm::ivec2 framebuffer_size)
        : device_(device),
          params_(params),
          gpu_(std::move(gpu)),
          camera_(params.camera, to_extent(framebuffer_size.x), to_extent(framebuffer_size.y)) {
    }

    LoadResult Viewer::load(std::span<const uint8_t> bytes) {
        return loadFromMemory(bytes, {});
    }

    LoadResult Viewer::loadFile(const std::filesystem::path& path) {
        LOG_INFO("Loading {}", path.string());

        auto bytes = read_file(path);
        if (!bytes) {
            LOG_ERROR("{}", bytes.error());
            return std::unexpected(LoadErrorInfo{LoadError::FileReadFailed, bytes.error()});
        }

        auto base_directory = path.parent_path();
        if (base_directory.empty()) {
            base_directory = ".";
        }
        return loadFromMemory(*bytes, base_directory);
    }

    LoadResult Viewer::loadPlaceholder() {
        const ViewerState previous = state_;
        state_ = ViewerState::Loading;
        LOG_INFO("Loading placeholder cube");
        return commit(scene::make_placeholder_cube(), previous);
    }

    LoadResult Viewer::loadFromMemory(std::span<const uint8_t> bytes, const std::filesystem::path& base_directory) {
        LOG_TIMER("Asset load");

        if (bytes.empty()) {
            LOG_WARN("Load called with no data");
            return std::unexpected(LoadErrorInfo{LoadError::EmptyInput, ""});
        }

        const ViewerState previous = state_;
        state_ = ViewerState::Loading;

        scene::SceneBuffers buffers;
        auto decoded = loader::decode(bytes, loader::DecodeOptions{base_directory});

        if (!decoded) {
            auto error = from_decode_error(decoded.error());
            if (error.code == LoadError::MalformedAsset && params_.loading.placeholder_on_decode_failure) {
                LOG_WARN("Asset could not be decoded, showing placeholder cube instead");
                buffers = scene::make_placeholder_cube();
            } else {
                state_ = previous;
                return std::unexpected(std::move(error));
            }
        } else {
            const loader::AccessorReader reader(*decoded);
            buffers = scene::accumulate(*decoded, reader,
                                        scene::AccumulateOptions{params_.loading.index_overflow_policy});
            if (buffers.empty()) {
                LOG_WARN("Asset has no renderable geometry, showing placeholder cube");
                auto stats = buffers.stats;
                buffers = scene::make_placeholder_cube();
                buffers.stats = stats;
            }
        }

        return commit(std::move(buffers), previous);
    }

    LoadResult Viewer::commit(scene::SceneBuffers buffers, ViewerState previous) {
        // Old contents are discarded only now that the new buffers exist
        auto uploaded = gpu_.clear();
        if (uploaded) {
            uploaded = gpu_.upload(buffers.vertices, buffers.indices);
        }

        if (!uploaded) {
            LOG_ERROR("Upload failed: {}", uploaded.error());
            if (auto restored = gpu_.upload(geometry_.vertices, geometry_.indices); !restored) {
                LOG_ERROR("Could not restore previous geometry: {}", restored.error());
            }
            state_ = previous;
            return std::unexpected(LoadErrorInfo{LoadError::UploadFailed, uploaded.error()});
        }

        geometry_ = std::move(buffers);
        state_ = ViewerState::Ready;
        LOG_INFO("Viewer ready: {} vertices, {} indices{}",
                 geometry_.vertexCount(), geometry_.index_count, geometry_.placeholder ? " (placeholder)" : "");
        return {};
    }

    void Viewer::render() {
        if (geometry_.index_count == 0) {
            return;
        }
        gpu_.draw(geometry_.index_count, camera_.getMvpMatrix(), params_.render.mesh_color);
    }

    void Viewer::orbit(float delta_x, float delta_y) {
        camera_.orbit(delta_x, delta_y);
    }

    void Viewer::resize(uint32_t width, uint32_t height) {
        if (width == 0 || height == 0) {
            LOG_DEBUG("Ignoring resize to {}x{}", width, height);
            return;
        }
        device_.setViewport(0, 0, width, height);
        camera_.resize(width, height);
    }

} // namespace gv::visualizer
