#include "gtest/gtest.h"
#include "Builder/TangentSpaceBuilder.h"

namespace {

using namespace Nif;
namespace TangentSpace = Builder::TangentSpaceBuilder;

Assets::TriShapeAsset MakeShape(size_t numVertices) {
    Assets::TriShapeAsset shape;
    shape.name = "Tri Test";
    shape.positions.resize(numVertices, Types::Vector3(0, 0, 0));
    return shape;
}

TEST(TangentSpaceBuilderTest, TangentsFollowFlippedV) {
    std::vector<glm::vec3> tangents, bitangents;
    TangentSpace::ConvertTangents({glm::vec3(0, 0, 1), glm::vec3(0, 0, 1)}, {glm::vec3(1, 0, 0), glm::vec3(1, 0, 0)}, {1.f, -1.f}, 2, tangents, bitangents);

    ASSERT_EQ(tangents.size(), 2u);
    EXPECT_FLOAT_EQ(tangents[0].y, -1.f);
    EXPECT_FLOAT_EQ(tangents[1].y, 1.f);
    EXPECT_FLOAT_EQ(bitangents[0].x, 1.f);
    EXPECT_FLOAT_EQ(bitangents[1].x, 1.f);
}

TEST(TangentSpaceBuilderTest, ConvertRejectsCountMismatch) {
    std::vector<glm::vec3> tangents, bitangents;
    try {
        TangentSpace::ConvertTangents({glm::vec3(0, 0, 1)}, {glm::vec3(1, 0, 0)}, {1.f}, 2, tangents, bitangents);
        FAIL() << "expected TangentCountMismatch";
    } catch (const ExportException& e) {
        EXPECT_EQ(e.kind, ExportException::EErrorKind::TangentCountMismatch);
    }
}

TEST(TangentSpaceBuilderTest, BlobIsLittleEndianTangentsThenBitangents) {
    const std::vector<uint8_t> blob = TangentSpace::PackBlob({glm::vec3(1, 0, 0)}, {glm::vec3(0, 2, 0)});
    ASSERT_EQ(blob.size(), 24u);
    EXPECT_EQ(blob[0], 0x00);
    EXPECT_EQ(blob[1], 0x00);
    EXPECT_EQ(blob[2], 0x80);
    EXPECT_EQ(blob[3], 0x3F);
    for (size_t i = 4; i < 16; i++) {
        EXPECT_EQ(blob[i], 0x00) << "byte " << i;
    }
    EXPECT_EQ(blob[19], 0x40);
}

TEST(TangentSpaceBuilderTest, OutputDependsOnGame) {
    Options options;
    options.game = EGameProfile::Oblivion;
    EXPECT_TRUE(TangentSpace::UseBinaryBlob(options));
    options.game = EGameProfile::Skyrim;
    EXPECT_FALSE(TangentSpace::UseBinaryBlob(options));
    options.tangentOutput = Options::ETangentOutput::BinaryBlob;
    EXPECT_TRUE(TangentSpace::UseBinaryBlob(options));
    options.game = EGameProfile::Oblivion;
    options.tangentOutput = Options::ETangentOutput::Arrays;
    EXPECT_FALSE(TangentSpace::UseBinaryBlob(options));
}

TEST(TangentSpaceBuilderTest, ApplyWritesBlob) {
    Assets::TriShapeAsset shape = MakeShape(2);
    Options options;
    options.game = EGameProfile::Oblivion;
    TangentSpace::Apply(shape, {glm::vec3(1, 0, 0), glm::vec3(1, 0, 0)}, {glm::vec3(0, 1, 0), glm::vec3(0, 1, 0)}, options);

    EXPECT_EQ(shape.tangentBlobName, TangentSpace::BlobName);
    EXPECT_EQ(shape.tangentBlob.size(), 48u);
    EXPECT_TRUE(shape.tangents.empty());
    EXPECT_EQ(shape.extraVectorsFlags, 0);
}

TEST(TangentSpaceBuilderTest, ApplyWritesArrays) {
    Assets::TriShapeAsset shape = MakeShape(1);
    Options options;
    options.game = EGameProfile::Fallout3;
    TangentSpace::Apply(shape, {glm::vec3(1, 0, 0)}, {glm::vec3(0, 1, 0)}, options);

    EXPECT_TRUE(shape.tangentBlob.empty());
    EXPECT_EQ(shape.extraVectorsFlags, TangentSpace::ExtraVectorsFlags);
    ASSERT_EQ(shape.tangents.size(), 1u);
    EXPECT_FLOAT_EQ(shape.tangents[0].x, 1.f);
    ASSERT_EQ(shape.bitangents.size(), 1u);
    EXPECT_FLOAT_EQ(shape.bitangents[0].y, 1.f);

    EXPECT_THROW(TangentSpace::Apply(shape, {}, {}, options), ExportException);
}

}  // namespace
