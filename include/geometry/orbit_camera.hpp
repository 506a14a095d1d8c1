/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <cstdint>
#include <glm/glm.hpp>

namespace gv {
    namespace geometry {

        // Camera orbiting a fixed target on a sphere of constant radius.
        // The polar angle theta is measured from world up (0,1,0), phi around it.
        class OrbitCamera {
        public:
            OrbitCamera(const param::CameraParameters& params, uint32_t width, uint32_t height);

            // Rotate around the target; deltas are input units scaled by the sensitivity
            void orbit(float delta_x, float delta_y);

            // Updates the projection aspect ratio. Zero-sized viewports are ignored
            void resize(uint32_t width, uint32_t height);

            // projection * view * model
            glm::mat4 getMvpMatrix(const glm::mat4& model = glm::mat4(1.0f)) const;

            // Getters
            const glm::vec3& getPosition() const { return position_; }
            const glm::vec3& getTarget() const { return target_; }
            float getDistance() const { return distance_; }
            float getTheta() const;
            float getPhi() const;
            const glm::mat4& getViewMatrix() const { return view_; }
            const glm::mat4& getProjectionMatrix() const { return projection_; }
            glm::uvec2 getViewportSize() const { return viewport_; }
            float getSensitivity() const { return sensitivity_; }
            float getPolarEpsilon() const { return polar_epsilon_; }

        private:
            void updateView();
            void updateProjection();

            glm::vec3 position_;
            glm::vec3 target_;
            float distance_;
            float fov_degrees_;
            float near_plane_;
            float far_plane_;
            float sensitivity_;
            float polar_epsilon_;
            glm::uvec2 viewport_;
            glm::mat4 view_{1.0f};
            glm::mat4 projection_{1.0f};
        };

    } // namespace geometry
} // namespace gv
