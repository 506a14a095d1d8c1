#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <gtest/gtest.h>
#include <numbers>
#include <random>

#include "geometry/orbit_camera.hpp"

constexpr int RANDOM_SEED = 8128;
using namespace gv::geometry;
using gv::param::CameraParameters;

class OrbitCameraTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(RANDOM_SEED);
        delta_dist = std::uniform_real_distribution<float>(-500.0f, 500.0f);
    }

    bool matricesEqual(const glm::mat4& a, const glm::mat4& b, float tolerance = 1e-5f) {
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                if (std::abs(a[i][j] - b[i][j]) > tolerance) {
                    return false;
                }
            }
        }
        return true;
    }

    bool vectorsEqual(const glm::vec3& a, const glm::vec3& b, float tolerance = 1e-4f) {
        return glm::length(a - b) < tolerance;
    }

    CameraParameters params;
    std::mt19937 rng;
    std::uniform_real_distribution<float> delta_dist;
};

TEST_F(OrbitCameraTest, InitialMatricesMatchParameters) {
    OrbitCamera camera(params, 800, 600);

    const glm::mat4 view = glm::lookAt(params.position, params.target, glm::vec3(0, 1, 0));
    const glm::mat4 projection = glm::perspective(glm::radians(params.fov_degrees), 800.0f / 600.0f,
                                                  params.near_plane, params.far_plane);

    EXPECT_TRUE(matricesEqual(camera.getViewMatrix(), view));
    EXPECT_TRUE(matricesEqual(camera.getProjectionMatrix(), projection));
    EXPECT_TRUE(matricesEqual(camera.getMvpMatrix(), projection * view));
    EXPECT_FLOAT_EQ(camera.getDistance(), glm::length(params.position - params.target));
}

TEST_F(OrbitCameraTest, ModelMatrixIsAppliedLast) {
    OrbitCamera camera(params, 640, 480);
    const glm::mat4 model = glm::translate(glm::mat4(1.0f), glm::vec3(1, 2, 3));
    EXPECT_TRUE(matricesEqual(camera.getMvpMatrix(model), camera.getMvpMatrix() * model));
}

TEST_F(OrbitCameraTest, OrbitKeepsDistanceToTarget) {
    params.target = {1.0f, -2.0f, 0.5f};
    OrbitCamera camera(params, 800, 600);
    const float distance = camera.getDistance();

    for (int i = 0; i < 100; ++i) {
        camera.orbit(delta_dist(rng), delta_dist(rng));
        EXPECT_NEAR(glm::length(camera.getPosition() - camera.getTarget()), distance, 1e-4f);
    }
}

TEST_F(OrbitCameraTest, PolarAngleStaysAwayFromPoles) {
    OrbitCamera camera(params, 800, 600);
    const float eps = params.polar_epsilon;

    camera.orbit(0.0f, 10000.0f);
    EXPECT_NEAR(camera.getTheta(), std::numbers::pi_v<float> - eps, 1e-4f);

    camera.orbit(0.0f, -10000.0f);
    EXPECT_NEAR(camera.getTheta(), eps, 1e-4f);
}

TEST_F(OrbitCameraTest, HorizontalDragRotatesAzimuth) {
    OrbitCamera camera(params, 800, 600);
    const float phi = camera.getPhi();
    const float theta = camera.getTheta();

    camera.orbit(10.0f, 0.0f);
    EXPECT_NEAR(camera.getPhi(), phi + 10.0f * params.orbit_sensitivity, 1e-4f);
    EXPECT_NEAR(camera.getTheta(), theta, 1e-4f);
}

TEST_F(OrbitCameraTest, ZeroDeltaLeavesPositionUnchanged) {
    OrbitCamera camera(params, 800, 600);
    const glm::vec3 before = camera.getPosition();
    const glm::mat4 before_view = camera.getViewMatrix();
    camera.orbit(0.0f, 0.0f);
    EXPECT_TRUE(vectorsEqual(camera.getPosition(), before));
    EXPECT_TRUE(matricesEqual(camera.getViewMatrix(), before_view));
}

TEST_F(OrbitCameraTest, ResizeUpdatesAspectRatio) {
    OrbitCamera camera(params, 800, 600);
    const glm::vec3 before_position = camera.getPosition();
    const glm::mat4 before_view = camera.getViewMatrix();
    camera.resize(1000, 500);

    const glm::mat4 projection = glm::perspective(glm::radians(params.fov_degrees), 2.0f,
                                                  params.near_plane, params.far_plane);
    EXPECT_TRUE(matricesEqual(camera.getProjectionMatrix(), projection));
    EXPECT_EQ(camera.getViewportSize(), glm::uvec2(1000, 500));
    EXPECT_TRUE(matricesEqual(camera.getViewMatrix(), before_view));
    EXPECT_TRUE(vectorsEqual(camera.getPosition(), before_position));
}

TEST_F(OrbitCameraTest, ZeroSizedResizeIsIgnored) {
    OrbitCamera camera(params, 800, 600);
    const glm::mat4 before = camera.getProjectionMatrix();

    camera.resize(0, 600);
    camera.resize(800, 0);

    EXPECT_TRUE(matricesEqual(camera.getProjectionMatrix(), before));
    EXPECT_EQ(camera.getViewportSize(), glm::uvec2(800, 600));
}
