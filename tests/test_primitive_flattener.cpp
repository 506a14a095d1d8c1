#include "gltf_test_utils.hpp"
#include "loader/accessor_reader.hpp"
#include "scene/primitive_flattener.hpp"

#include <gtest/gtest.h>

using namespace gv::scene;
using namespace gv::test;
using gv::loader::AccessorReader;
using gv::loader::DecodedScene;
using gv::loader::Topology;

class PrimitiveFlattenerTest : public ::testing::Test {
protected:
    // Flattens the only primitive of a scene
    static auto flattenOnly(const DecodedScene& scene) {
        AccessorReader reader(scene);
        return flatten(scene.meshes.at(0).primitives.at(0), reader);
    }

    SceneBuilder builder;
};

TEST_F(PrimitiveFlattenerTest, IndexedTriangle) {
    const auto positions = builder.addPositions({0, 0, 0, 1, 0, 0, 0, 1, 0});
    const auto indices = builder.addIndices16({0, 1, 2});
    builder.addPrimitive(positions, indices);

    auto result = flattenOnly(builder.build());
    ASSERT_TRUE(result) << result.error().message();
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ((*result)->vertexCount(), 3u);
    EXPECT_EQ((*result)->indices, (std::vector<uint16_t>{0, 1, 2}));
}

TEST_F(PrimitiveFlattenerTest, MissingPositionIsSkipped) {
    builder.addPrimitive(std::nullopt);

    auto result = flattenOnly(builder.build());
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->has_value());
}

TEST_F(PrimitiveFlattenerTest, NonIndexedGetsSequentialIndices) {
    const auto positions = builder.addPositions(line_of_vertices(6));
    builder.addPrimitive(positions);

    auto result = flattenOnly(builder.build());
    ASSERT_TRUE(result);
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ((*result)->indices, (std::vector<uint16_t>{0, 1, 2, 3, 4, 5}));
}

TEST_F(PrimitiveFlattenerTest, NonTriangleTopologyIsStillFlattened) {
    const auto positions = builder.addPositions(line_of_vertices(3));
    builder.addPrimitive(positions, std::nullopt, Topology::LineStrip);

    auto result = flattenOnly(builder.build());
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->has_value());
}

TEST_F(PrimitiveFlattenerTest, IndexPastVertexCountIsRejected) {
    const auto positions = builder.addPositions(line_of_vertices(3));
    const auto indices = builder.addIndices16({0, 1, 3});
    builder.addPrimitive(positions, indices);

    auto result = flattenOnly(builder.build());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, FlattenError::IndexOutOfRange);
}

TEST_F(PrimitiveFlattenerTest, WideIndicesAreClampedThenRangeChecked) {
    const auto positions = builder.addPositions(line_of_vertices(3));
    const auto indices = builder.addIndices32({0, 1, 70000});
    builder.addPrimitive(positions, indices);

    auto result = flattenOnly(builder.build());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, FlattenError::IndexOutOfRange);
}

TEST_F(PrimitiveFlattenerTest, UnresolvedBufferFailsThePrimitive) {
    const auto positions = builder.addPositions(line_of_vertices(3));
    builder.addPrimitive(positions);

    auto result = flattenOnly(builder.build(false));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, FlattenError::BufferUnavailable);
}

TEST_F(PrimitiveFlattenerTest, TooManyNonIndexedVertices) {
    const auto positions = builder.addPositions(line_of_vertices(MAX_INDEX_16 + 2));
    builder.addPrimitive(positions);

    auto result = flattenOnly(builder.build());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, FlattenError::TooManyVertices);
}

TEST(NarrowIndexTest, ClampsToSixteenBits) {
    EXPECT_EQ(narrow_index(0), 0);
    EXPECT_EQ(narrow_index(65535), 65535);
    EXPECT_EQ(narrow_index(65536), 65535);
    EXPECT_EQ(narrow_index(4000000000u), 65535);
}
