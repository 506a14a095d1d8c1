/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "geometry/orbit_camera.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>
#include <numbers>

namespace gv {
    namespace geometry {

        namespace {
            constexpr glm::vec3 WORLD_UP{0.0f, 1.0f, 0.0f};
        }

        OrbitCamera::OrbitCamera(const param::CameraParameters& params, uint32_t width, uint32_t height)
            : position_(params.position),
              target_(params.target),
              distance_(glm::length(params.position - params.target)),
              fov_degrees_(params.fov_degrees),
              near_plane_(params.near_plane),
              far_plane_(params.far_plane),
              sensitivity_(params.orbit_sensitivity),
              polar_epsilon_(params.polar_epsilon),
              viewport_(std::max(width, 1u), std::max(height, 1u)) {
            if (width == 0 || height == 0) {
                LOG_WARN("Camera created for a {}x{} viewport, using {}x{}", width, height, viewport_.x, viewport_.y);
            }
            updateView();
            updateProjection();
        }

        float OrbitCamera::getTheta() const {
            if (distance_ <= 0.0f)
                return 0.0f;
            const glm::vec3 offset = position_ - target_;
            return std::acos(std::clamp(offset.y / glm::length(offset), -1.0f, 1.0f));
        }

        float OrbitCamera::getPhi() const {
            const glm::vec3 offset = position_ - target_;
            return std::atan2(offset.z, offset.x);
        }

        void OrbitCamera::orbit(float delta_x, float delta_y) {
            if (distance_ <= 0.0f) {
                LOG_WARN("Camera sits on its target, orbit ignored");
                return;
            }

            float theta = getTheta() + delta_y * sensitivity_;
            const float phi = getPhi() + delta_x * sensitivity_;

            theta = std::clamp(theta, polar_epsilon_, std::numbers::pi_v<float> - polar_epsilon_);

            const glm::vec3 offset{
                distance_ * std::sin(theta) * std::cos(phi),
                distance_ * std::cos(theta),
                distance_ * std::sin(theta) * std::sin(phi)};

            position_ = target_ + offset;
            updateView();

            LOG_TRACE("Orbit: theta={:.3f} phi={:.3f} position=({:.3f}, {:.3f}, {:.3f})",
                      theta, phi, position_.x, position_.y, position_.z);
        }

        void OrbitCamera::resize(uint32_t width, uint32_t height) {
            if (width == 0 || height == 0) {
                LOG_DEBUG("Ignoring resize to {}x{}", width, height);
                return;
            }
            viewport_ = glm::uvec2(width, height);
            updateProjection();
        }

        glm::mat4 OrbitCamera::getMvpMatrix(const glm::mat4& model) const {
            return projection_ * view_ * model;
        }

        void OrbitCamera::updateView() {
            view_ = glm::lookAt(position_, target_, WORLD_UP);
        }

        void OrbitCamera::updateProjection() {
            const float aspect = static_cast<float>(viewport_.x) / static_cast<float>(viewport_.y);
            projection_ = glm::perspective(glm::radians(fov_degrees_), aspect, near_plane_, far_plane_);
        }

    } // namespace geometry
} // namespace gv
