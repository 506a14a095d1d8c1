#include "core/logger.hpp"
#include "gltf_test_utils.hpp"
#include "loader/accessor_reader.hpp"
#include "loader/asset_decoder.hpp"

#include <cgltf.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>
#include <variant>

using namespace gv::loader;
using namespace gv::test;

class AssetDecoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = std::filesystem::temp_directory_path() / "gv_decoder_test";
        std::filesystem::create_directories(temp_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }

    // Minimal document around a caller supplied buffer list
    static json base_document() {
        json document;
        document["asset"] = {{"version", "2.0"}};
        return document;
    }

    std::filesystem::path temp_dir;
};

TEST_F(AssetDecoderTest, RejectsInputShorterThanFourBytes) {
    const std::vector<uint8_t> bytes{'g', 'l', 'T'};
    auto result = decode(bytes);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DecodeError::TooSmall);
}

TEST_F(AssetDecoderTest, DetectsContainerFromSignature) {
    const std::vector<uint8_t> binary{'g', 'l', 'T', 'F', 0, 0};
    const std::vector<uint8_t> text{'{', ' ', '}', ' '};
    EXPECT_EQ(detect_container(binary), ContainerKind::Binary);
    EXPECT_EQ(detect_container(text), ContainerKind::Text);
}

TEST_F(AssetDecoderTest, DecodesBinaryContainer) {
    auto bytes = make_mesh_glb({single_triangle()});

    auto result = decode(bytes);
    ASSERT_TRUE(result) << result.error().message();

    const DecodedScene& scene = *result;
    EXPECT_EQ(scene.kind, ContainerKind::Binary);
    ASSERT_EQ(scene.meshes.size(), 1u);
    ASSERT_EQ(scene.meshes[0].primitives.size(), 1u);
    EXPECT_EQ(scene.meshes[0].primitives[0].mode, Topology::Triangles);
    EXPECT_NE(scene.meshes[0].primitives[0].positions, nullptr);
    EXPECT_NE(scene.meshes[0].primitives[0].indices, nullptr);
    EXPECT_EQ(scene.buffer_count, 1u);
    EXPECT_EQ(scene.unresolved_buffers, 0u);
    ASSERT_NE(scene.document, nullptr);
    EXPECT_NE(scene.document->buffers[0].data, nullptr);
}

TEST_F(AssetDecoderTest, DecodesTextContainerWithDataUri) {
    auto bytes = make_mesh_gltf({unit_quad()});

    auto result = decode(bytes);
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result->kind, ContainerKind::Text);
    EXPECT_EQ(result->primitiveCount(), 1u);
    EXPECT_EQ(result->unresolved_buffers, 0u);

    AccessorReader reader(*result);
    auto positions = reader.readPositions(*result->meshes.at(0).primitives.at(0).positions);
    ASSERT_TRUE(positions);
    EXPECT_EQ(positions->size(), 12u);
    EXPECT_FLOAT_EQ((*positions)[3], 1.0f);
}

TEST_F(AssetDecoderTest, RejectsWrongBinaryVersion) {
    auto bytes = make_mesh_glb({single_triangle()});
    bytes[4] = 1; // version field

    auto result = decode(bytes);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DecodeError::MalformedAsset);
}

TEST_F(AssetDecoderTest, RejectsDeclaredLengthPastEnd) {
    auto bytes = make_mesh_glb({single_triangle()});
    bytes[8] = 0xFF;
    bytes[9] = 0xFF;

    auto result = decode(bytes);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DecodeError::MalformedAsset);
}

TEST_F(AssetDecoderTest, RejectsInvalidJson) {
    auto result = decode(to_bytes("{ \"asset\": "));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DecodeError::MalformedAsset);
}

TEST_F(AssetDecoderTest, RejectsUnsupportedVersion) {
    json document;
    document["asset"] = {{"version", "1.0"}};
    auto result = decode(make_gltf_text(document));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DecodeError::MalformedAsset);
}

TEST_F(AssetDecoderTest, RejectsDanglingReference) {
    std::vector<uint8_t> bin;
    json document = make_document({single_triangle()}, bin);
    document["accessors"][0]["bufferView"] = 42;

    auto result = decode(make_glb(document, bin));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DecodeError::MalformedAsset);
}

TEST_F(AssetDecoderTest, DocumentWithoutMeshesDecodes) {
    auto result = decode(make_gltf_text(base_document()));
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->meshes.empty());
}

TEST_F(AssetDecoderTest, MissingExternalBufferIsNotFatal) {
    std::vector<uint8_t> bin;
    json document = make_document({single_triangle()}, bin);
    document["buffers"][0]["uri"] = "missing.bin";

    auto result = decode(make_gltf_text(document), DecodeOptions{temp_dir});
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result->unresolved_buffers, 1u);

    AccessorReader reader(*result);
    auto positions = reader.readPositions(*result->meshes.at(0).primitives.at(0).positions);
    ASSERT_FALSE(positions);
    EXPECT_EQ(positions.error().code, AccessorError::BufferUnavailable);
}

TEST_F(AssetDecoderTest, ResolvesExternalBufferRelativeToBaseDirectory) {
    std::vector<uint8_t> bin;
    json document = make_document({single_triangle()}, bin);
    document["buffers"][0]["uri"] = "mesh%20data.bin";
    {
        std::ofstream file(temp_dir / "mesh data.bin", std::ios::binary);
        file.write(reinterpret_cast<const char*>(bin.data()), static_cast<std::streamsize>(bin.size()));
    }

    auto result = decode(make_gltf_text(document), DecodeOptions{temp_dir});
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result->unresolved_buffers, 0u);

    AccessorReader reader(*result);
    auto positions = reader.readPositions(*result->meshes.at(0).primitives.at(0).positions);
    ASSERT_TRUE(positions) << positions.error().message();
    EXPECT_EQ(positions->size(), 9u);
}

TEST_F(AssetDecoderTest, TruncatedDataUriLeavesBufferUnavailable) {
    std::vector<uint8_t> bin;
    json document = make_document({single_triangle()}, bin);
    std::vector<uint8_t> half(bin.begin(), bin.begin() + bin.size() / 2);
    document["buffers"][0]["uri"] = data_uri(half);

    auto result = decode(make_gltf_text(document));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->unresolved_buffers, 1u);
}

TEST_F(AssetDecoderTest, UnknownPrimitiveModeIsMalformed) {
    std::vector<uint8_t> bin;
    json document = make_document({single_triangle()}, bin);
    document["meshes"][0]["primitives"][0]["mode"] = 9;

    auto result = decode(make_glb(document, bin));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DecodeError::MalformedAsset);
}

TEST_F(AssetDecoderTest, DecodeErrorsAreLoggedAsWarnings) {
    gv::core::Logger::get().init(gv::core::LogLevel::Info);
    auto captured = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(4);
    spdlog::default_logger()->sinks().push_back(captured);

    const DecodeErrorInfo too_small(DecodeError::TooSmall);
    ASSERT_EQ(captured->last_raw(1).size(), 1u);
    EXPECT_EQ(captured->last_raw(1)[0].level, spdlog::level::warn);

    const DecodeErrorInfo malformed(DecodeError::MalformedAsset, "cgltf_parse: invalid JSON");
    EXPECT_EQ(captured->last_raw(1)[0].level, spdlog::level::warn);

    gv::core::Logger::get().init(gv::core::LogLevel::Info);
}

class AccessorReaderTest : public ::testing::Test {
protected:
    // One buffer holding bytes, the given views, and accessor 0 as POSITION or as indices of one primitive
    void assemble(const std::vector<uint8_t>& bytes, json views, json accessor, bool as_indices = false) {
        json document;
        document["asset"] = {{"version", "2.0"}};
        document["buffers"] = json::array({{{"byteLength", bytes.size()}}});
        document["bufferViews"] = std::move(views);
        document["accessors"] = json::array({std::move(accessor)});
        json primitive = {{"attributes", json::object()}};
        if (as_indices) {
            primitive["indices"] = 0;
        } else {
            primitive["attributes"]["POSITION"] = 0;
        }
        document["meshes"] = json::array({{{"primitives", json::array({primitive})}}});

        auto decoded = decode(make_glb(document, bytes));
        ASSERT_TRUE(decoded) << decoded.error().message();
        scene = std::move(*decoded);
    }

    AccessorResult<std::vector<float>> positions() const {
        const AccessorReader reader(scene);
        return reader.readPositions(*scene.meshes.at(0).primitives.at(0).positions);
    }

    AccessorResult<IndexData> indices() const {
        const AccessorReader reader(scene);
        return reader.readIndices(*scene.meshes.at(0).primitives.at(0).indices);
    }

    static json view(size_t offset, size_t length) {
        return {{"buffer", 0}, {"byteOffset", offset}, {"byteLength", length}};
    }

    DecodedScene scene;
};

TEST_F(AccessorReaderTest, HonoursByteStride) {
    // Interleaved position + one padding float per vertex
    std::vector<uint8_t> bytes;
    append_floats(bytes, {1.0f, 2.0f, 3.0f, 99.0f, 4.0f, 5.0f, 6.0f, 99.0f});
    json strided = view(0, bytes.size());
    strided["byteStride"] = 16;
    assemble(bytes, json::array({strided}),
             {{"bufferView", 0}, {"componentType", 5126}, {"type", "VEC3"}, {"count", 2}});

    auto result = positions();
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(*result, (std::vector<float>{1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f}));
}

TEST_F(AccessorReaderTest, ZeroFillsWithoutBufferViewAndAppliesSparse) {
    std::vector<uint8_t> bytes;
    append_u16s(bytes, {1, 0});               // sparse indices (u16), padded to 4
    append_floats(bytes, {7.0f, 8.0f, 9.0f}); // value for vertex 1
    assemble(bytes, json::array({view(0, 4), view(4, 12)}),
             {{"componentType", 5126},
              {"type", "VEC3"},
              {"count", 3},
              {"sparse",
               {{"count", 1},
                {"indices", {{"bufferView", 0}, {"componentType", 5123}}},
                {"values", {{"bufferView", 1}}}}}});

    auto result = positions();
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(*result, (std::vector<float>{0, 0, 0, 7.0f, 8.0f, 9.0f, 0, 0, 0}));
}

TEST_F(AccessorReaderTest, SparseIndexPastCountIsOutOfBounds) {
    std::vector<uint8_t> bytes;
    append_u16s(bytes, {5, 0});
    append_floats(bytes, {7.0f, 8.0f, 9.0f});
    assemble(bytes, json::array({view(0, 4), view(4, 12)}),
             {{"componentType", 5126},
              {"type", "VEC3"},
              {"count", 2},
              {"sparse",
               {{"count", 1},
                {"indices", {{"bufferView", 0}, {"componentType", 5123}}},
                {"values", {{"bufferView", 1}}}}}});

    auto result = positions();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, AccessorError::OutOfBounds);
}

TEST_F(AccessorReaderTest, ReadPastViewIsOutOfBounds) {
    std::vector<uint8_t> bytes;
    append_floats(bytes, {1.0f, 2.0f, 3.0f});
    assemble(bytes, json::array({view(0, bytes.size())}),
             {{"bufferView", 0}, {"componentType", 5126}, {"type", "VEC3"}, {"count", 2}});

    auto result = positions();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, AccessorError::OutOfBounds);
}

TEST_F(AccessorReaderTest, HugeCountWithoutBufferViewIsRejected) {
    std::vector<uint8_t> bytes;
    append_floats(bytes, {0.0f});
    assemble(bytes, json::array(),
             {{"componentType", 5126}, {"type", "VEC3"}, {"count", uint64_t{1000000000000000}}});

    auto result = positions();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, AccessorError::InvalidAccessor);
}

TEST_F(AccessorReaderTest, CountThatWrapsTheByteRangeIsOutOfBounds) {
    // 2^62 elements of stride 16 wrap a 64-bit byte count back to a small value
    std::vector<uint8_t> bytes(64, 0);
    json strided = view(0, 64);
    strided["byteStride"] = 16;
    assemble(bytes, json::array({strided}),
             {{"bufferView", 0},
              {"byteOffset", 4},
              {"componentType", 5126},
              {"type", "VEC3"},
              {"count", uint64_t{1} << 62}});

    auto result = positions();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, AccessorError::OutOfBounds);
}

TEST_F(AccessorReaderTest, HugeIndexCountWithoutBufferViewIsRejected) {
    std::vector<uint8_t> bytes;
    append_u32s(bytes, {0});
    assemble(bytes, json::array(),
             {{"componentType", 5125}, {"type", "SCALAR"}, {"count", uint64_t{1000000000000000}}}, true);

    auto result = indices();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, AccessorError::InvalidAccessor);
}

TEST_F(AccessorReaderTest, RejectsNonVec3Positions) {
    std::vector<uint8_t> bytes;
    append_floats(bytes, {1.0f, 2.0f});
    assemble(bytes, json::array({view(0, bytes.size())}),
             {{"bufferView", 0}, {"componentType", 5126}, {"type", "VEC2"}, {"count", 1}});

    auto result = positions();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, AccessorError::InvalidAccessor);
}

TEST_F(AccessorReaderTest, IndicesKeepTheirStoredWidth) {
    std::vector<uint8_t> bytes;
    append_u32s(bytes, {0, 70000, 2});
    assemble(bytes, json::array({view(0, bytes.size())}),
             {{"bufferView", 0}, {"componentType", 5125}, {"type", "SCALAR"}, {"count", 3}}, true);

    auto result = indices();
    ASSERT_TRUE(result) << result.error().message();
    ASSERT_TRUE(std::holds_alternative<std::vector<uint32_t>>(*result));
    EXPECT_EQ(std::get<std::vector<uint32_t>>(*result)[1], 70000u);
}

TEST_F(AccessorReaderTest, RejectsFloatIndices) {
    std::vector<uint8_t> bytes;
    append_floats(bytes, {0.0f});
    assemble(bytes, json::array({view(0, bytes.size())}),
             {{"bufferView", 0}, {"componentType", 5126}, {"type", "SCALAR"}, {"count", 1}}, true);

    auto result = indices();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, AccessorError::InvalidAccessor);
}
