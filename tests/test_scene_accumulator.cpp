#include "gltf_test_utils.hpp"
#include "loader/accessor_reader.hpp"
#include "scene/primitive_flattener.hpp"
#include "scene/scene_accumulator.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace gv::scene;
using namespace gv::test;
using gv::loader::AccessorReader;
using gv::loader::DecodedScene;
using gv::param::IndexOverflowPolicy;

class SceneAccumulatorTest : public ::testing::Test {
protected:
    static SceneBuffers run(const DecodedScene& scene, IndexOverflowPolicy policy = IndexOverflowPolicy::Skip) {
        AccessorReader reader(scene);
        return accumulate(scene, reader, AccumulateOptions{policy});
    }

    // Two non-indexed primitives whose combined vertex count passes the 16-bit limit
    DecodedScene overflowingScene() {
        builder.addPrimitive(builder.addPositions(line_of_vertices(64998)));
        builder.addPrimitive(builder.addPositions(line_of_vertices(999)));
        return builder.build();
    }

    SceneBuilder builder;
};

TEST_F(SceneAccumulatorTest, RebasesIndicesAcrossMeshes) {
    const auto quad = unit_quad();
    const auto tri = single_triangle();
    builder.addPrimitive(builder.addPositions(quad.positions), builder.addIndices16(quad.indices));
    builder.addPrimitive(builder.addPositions(tri.positions), builder.addIndices16(tri.indices));

    const SceneBuffers buffers = run(builder.build());
    EXPECT_EQ(buffers.vertexCount(), 7u);
    EXPECT_EQ(buffers.indices, (std::vector<uint16_t>{0, 1, 2, 0, 2, 3, 4, 5, 6}));
    EXPECT_EQ(buffers.index_count, 9u);
    EXPECT_EQ(buffers.stats.appended, 2u);
    EXPECT_FALSE(buffers.placeholder);
}

TEST_F(SceneAccumulatorTest, EveryIndexAddressesAnAppendedVertex) {
    const auto quad = unit_quad();
    for (int i = 0; i < 5; ++i) {
        builder.addPrimitive(builder.addPositions(quad.positions), builder.addIndices16(quad.indices));
    }

    const SceneBuffers buffers = run(builder.build());
    ASSERT_FALSE(buffers.empty());
    EXPECT_EQ(buffers.indices.size() % 3, 0u);
    EXPECT_LT(*std::max_element(buffers.indices.begin(), buffers.indices.end()), buffers.vertexCount());
}

TEST_F(SceneAccumulatorTest, DropsIncompleteTrailingTriangle) {
    builder.addPrimitive(builder.addPositions(line_of_vertices(4)), builder.addIndices16({0, 1, 2, 3}));

    const SceneBuffers buffers = run(builder.build());
    EXPECT_EQ(buffers.indices, (std::vector<uint16_t>{0, 1, 2}));
}

TEST_F(SceneAccumulatorTest, FailingPrimitiveDoesNotStopTheRest) {
    const auto tri = single_triangle();
    builder.addPrimitive(builder.addPositions(line_of_vertices(3)), builder.addIndices16({0, 1, 7}));
    builder.addPrimitive(std::nullopt);
    builder.addPrimitive(builder.addPositions(tri.positions), builder.addIndices16(tri.indices));

    const SceneBuffers buffers = run(builder.build());
    EXPECT_EQ(buffers.stats.primitives, 3u);
    EXPECT_EQ(buffers.stats.failed, 1u);
    EXPECT_EQ(buffers.stats.skipped, 1u);
    EXPECT_EQ(buffers.stats.appended, 1u);
    EXPECT_EQ(buffers.indices, (std::vector<uint16_t>{0, 1, 2}));
}

TEST_F(SceneAccumulatorTest, EmptySceneProducesNoGeometry) {
    const SceneBuffers buffers = run(builder.build());
    EXPECT_TRUE(buffers.empty());
    EXPECT_EQ(buffers.index_count, 0u);
}

TEST_F(SceneAccumulatorTest, SkipPolicyRejectsOverflowingPrimitive) {
    const SceneBuffers buffers = run(overflowingScene(), IndexOverflowPolicy::Skip);
    EXPECT_EQ(buffers.stats.appended, 1u);
    EXPECT_EQ(buffers.stats.failed, 1u);
    EXPECT_EQ(buffers.vertexCount(), 64998u);
    EXPECT_EQ(buffers.stats.clamped_indices, 0u);
}

TEST_F(SceneAccumulatorTest, ClampPolicyKeepsOverflowingPrimitive) {
    const SceneBuffers buffers = run(overflowingScene(), IndexOverflowPolicy::Clamp);
    EXPECT_EQ(buffers.stats.appended, 2u);
    EXPECT_EQ(buffers.vertexCount(), 64998u + 999u);
    // Local indices 538..998 rebase past 65535
    EXPECT_EQ(buffers.stats.clamped_indices, 461u);
    EXPECT_EQ(buffers.indices.back(), MAX_INDEX_16);
}

TEST_F(SceneAccumulatorTest, PlaceholderCubeIsWellFormed) {
    const SceneBuffers cube = make_placeholder_cube();
    EXPECT_TRUE(cube.placeholder);
    EXPECT_EQ(cube.vertexCount(), 8u);
    EXPECT_EQ(cube.index_count, 36u);
    EXPECT_EQ(cube.indices.size(), 36u);
    for (const uint16_t index : cube.indices) {
        EXPECT_LT(index, 8u);
    }
}
