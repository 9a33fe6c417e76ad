#include "gtest/gtest.h"
#include "Builder/SkinPartitioner.h"

namespace {

using namespace Nif;
using Builder::PartitionSettings;
using Builder::SkinPartitioner;
using Builder::VertexInfluences;

Types::Triangle MakeTriangle(uint16_t v1, uint16_t v2, uint16_t v3) {
    Types::Triangle triangle;
    triangle.v1 = v1;
    triangle.v2 = v2;
    triangle.v3 = v3;
    return triangle;
}

/** One bone per vertex, bone index equal to the vertex index. */
VertexInfluences MakeRigidInfluences(int numVertices) {
    VertexInfluences influences(numVertices);
    for (int vertex = 0; vertex < numVertices; vertex++) {
        influences[vertex].emplace_back(vertex, 1.f);
    }
    return influences;
}

PartitionSettings MakeSettings(uint32_t maxBonesPerPartition, uint32_t maxBonesPerVertex) {
    PartitionSettings settings;
    settings.maxBonesPerPartition = maxBonesPerPartition;
    settings.maxBonesPerVertex = maxBonesPerVertex;
    return settings;
}

TEST(SkinPartitionerTest, FitVertexWeightsKeepsHeaviest) {
    std::vector<std::pair<int, float>> influences = {{2, 0.3f}, {0, 0.3f}, {1, 0.4f}};
    const float lost = SkinPartitioner::FitVertexWeights(influences, 2, Options::EWeightFitPolicy::Truncate);
    EXPECT_FLOAT_EQ(lost, 0.3f);
    ASSERT_EQ(influences.size(), 2u);
    EXPECT_EQ(influences[0].first, 1);
    EXPECT_FLOAT_EQ(influences[0].second, 0.4f);
    // equal weights: lower bone index wins
    EXPECT_EQ(influences[1].first, 0);
    EXPECT_FLOAT_EQ(influences[1].second, 0.3f);
}

TEST(SkinPartitionerTest, FitVertexWeightsRedistributes) {
    std::vector<std::pair<int, float>> influences = {{2, 0.3f}, {0, 0.3f}, {1, 0.4f}};
    const float lost = SkinPartitioner::FitVertexWeights(influences, 2, Options::EWeightFitPolicy::Redistribute);
    EXPECT_FLOAT_EQ(lost, 0.3f);
    ASSERT_EQ(influences.size(), 2u);
    EXPECT_NEAR(influences[0].second, 0.4f / 0.7f, 1e-5f);
    EXPECT_NEAR(influences[1].second, 0.3f / 0.7f, 1e-5f);
    EXPECT_NEAR(influences[0].second + influences[1].second, 1.f, 1e-5f);

    std::vector<std::pair<int, float>> single = {{4, 1.f}};
    EXPECT_FLOAT_EQ(SkinPartitioner::FitVertexWeights(single, 4, Options::EWeightFitPolicy::Redistribute), 0.f);
    EXPECT_FLOAT_EQ(single[0].second, 1.f);
}

TEST(SkinPartitionerTest, BodyPartOrder) {
    EXPECT_EQ(SkinPartitioner::SortBodyParts({5, 3, 3, 7, 1}, {7, 9}), (std::vector<int>{7, 1, 3, 5}));
    EXPECT_EQ(SkinPartitioner::SortBodyParts({5, 3}, {}), (std::vector<int>{3, 5}));
}

TEST(SkinPartitionerTest, PartitionsRespectBoneBudget) {
    const std::vector<Types::Triangle> triangles = {MakeTriangle(0, 1, 2), MakeTriangle(3, 4, 5)};
    const SkinPartitioner partitioner(MakeSettings(4, 4));
    const Builder::PartitionResult result = partitioner.Build(triangles, {0, 0}, MakeRigidInfluences(6), 6);

    ASSERT_EQ(result.partitions.size(), 2u);
    EXPECT_EQ(result.partitions[0].bones, (std::vector<uint16_t>{0, 1, 2}));
    EXPECT_EQ(result.partitions[1].bones, (std::vector<uint16_t>{3, 4, 5}));
    size_t numTriangles = 0;
    for (const auto& partition : result.partitions) {
        EXPECT_LE(partition.bones.size(), 4u);
        EXPECT_EQ(partition.numWeightsPerVertex, 1u);
        numTriangles += partition.triangles.size();
    }
    EXPECT_EQ(numTriangles, triangles.size());
    EXPECT_FLOAT_EQ(result.lostWeight, 0.f);
}

TEST(SkinPartitionerTest, TriangleBonesAreFittedToBudget) {
    VertexInfluences influences(3);
    influences[0] = {{0, 0.5f}, {1, 0.5f}};
    influences[1] = {{2, 1.f}};
    influences[2] = {{3, 0.9f}, {0, 0.1f}};

    const SkinPartitioner partitioner(MakeSettings(3, 4));
    const Builder::PartitionResult result = partitioner.Build({MakeTriangle(0, 1, 2)}, {0}, influences, 4);

    // bone 1 is the lightest bone that is not the only influence of a corner
    EXPECT_FLOAT_EQ(result.lostWeight, 0.5f);
    ASSERT_EQ(result.fittedInfluences[0].size(), 1u);
    EXPECT_EQ(result.fittedInfluences[0][0].first, 0);
    EXPECT_FLOAT_EQ(result.fittedInfluences[0][0].second, 1.f);
    ASSERT_EQ(result.partitions.size(), 1u);
    EXPECT_EQ(result.partitions[0].bones, (std::vector<uint16_t>{0, 2, 3}));
    EXPECT_EQ(result.partitions[0].numWeightsPerVertex, 2u);
}

TEST(SkinPartitionerTest, BodyPartsAreNeverMixed) {
    // two triangles sharing an edge and their bone
    const std::vector<Types::Triangle> triangles = {MakeTriangle(0, 1, 2), MakeTriangle(0, 2, 3)};
    VertexInfluences influences(4);
    for (auto& vertexInfluences : influences) {
        vertexInfluences.emplace_back(0, 1.f);
    }

    PartitionSettings settings = MakeSettings(4, 4);
    settings.bodyPartOrder = {20};
    const Builder::PartitionResult result = SkinPartitioner(settings).Build(triangles, {10, 20}, influences, 1);

    ASSERT_EQ(result.partitions.size(), 2u);
    EXPECT_EQ(result.partitions[0].bodyPart, 20);
    EXPECT_EQ(result.partitions[0].vertexMap, (std::vector<uint16_t>{0, 2, 3}));
    EXPECT_EQ(result.partitions[1].bodyPart, 10);
    EXPECT_EQ(result.partitions[1].vertexMap, (std::vector<uint16_t>{0, 1, 2}));
}

TEST(SkinPartitionerTest, BoneTablesAreSharedWhenTheyFit) {
    const std::vector<Types::Triangle> triangles = {MakeTriangle(0, 1, 2), MakeTriangle(3, 4, 5)};
    VertexInfluences influences(6);
    influences[0] = {{0, 1.f}};
    influences[1] = {{1, 1.f}};
    influences[2] = {{0, 1.f}};
    for (int vertex = 3; vertex < 6; vertex++) {
        influences[vertex] = {{2, 1.f}};
    }

    PartitionSettings settings = MakeSettings(3, 4);
    settings.bMaximizeBoneSharing = true;
    const Builder::PartitionResult result = SkinPartitioner(settings).Build(triangles, {1, 2}, influences, 3);

    ASSERT_EQ(result.partitions.size(), 2u);
    EXPECT_EQ(result.partitions[0].bones, (std::vector<uint16_t>{0, 1, 2}));
    EXPECT_EQ(result.partitions[1].bones, (std::vector<uint16_t>{0, 1, 2}));
    // partition 1 only uses bone 2, at slot 2 of the shared table
    EXPECT_EQ(result.partitions[1].boneIndices[0][0], 2);
}

TEST(SkinPartitionerTest, PaddingFillsBoneTableAndWeightSlots) {
    const std::vector<Types::Triangle> triangles = {MakeTriangle(0, 1, 2), MakeTriangle(3, 4, 5)};
    PartitionSettings settings = MakeSettings(4, 4);
    settings.bPadBones = true;
    const Builder::PartitionResult result = SkinPartitioner(settings).Build(triangles, {0, 0}, MakeRigidInfluences(6), 6);

    ASSERT_EQ(result.partitions.size(), 2u);
    EXPECT_EQ(result.partitions[0].bones, (std::vector<uint16_t>{0, 1, 2, 3}));
    EXPECT_EQ(result.partitions[1].bones, (std::vector<uint16_t>{0, 3, 4, 5}));

    const Assets::SkinPartitionAsset& partition = result.partitions[1];
    EXPECT_EQ(partition.numWeightsPerVertex, 4u);
    ASSERT_EQ(partition.vertexMap, (std::vector<uint16_t>{3, 4, 5}));
    EXPECT_EQ(partition.boneIndices[0], (std::vector<uint8_t>{1, 0, 0, 0}));
    EXPECT_EQ(partition.vertexWeights[0], (std::vector<float>{1.f, 0.f, 0.f, 0.f}));
}

TEST(SkinPartitionerTest, FullBoneTableUsesLastByteIndex) {
    const std::vector<Types::Triangle> triangles = {MakeTriangle(0, 1, 2)};
    VertexInfluences influences(3);
    influences[0].emplace_back(299, 1.f);
    influences[1].emplace_back(0, 1.f);
    influences[2].emplace_back(1, 1.f);
    PartitionSettings settings = MakeSettings(Configuration::MaxBonesPerPartition, 4);
    settings.bPadBones = true;

    const Builder::PartitionResult result = SkinPartitioner(settings).Build(triangles, {0}, influences, 300);
    ASSERT_EQ(result.partitions.size(), 1u);
    const Assets::SkinPartitionAsset& partition = result.partitions[0];
    ASSERT_EQ(partition.bones.size(), 256u);
    EXPECT_EQ(partition.bones.back(), 299);
    EXPECT_EQ(partition.boneIndices[0], (std::vector<uint8_t>{255, 0, 0, 0}));

    EXPECT_THROW(SkinPartitioner(MakeSettings(Configuration::MaxBonesPerPartition + 1, 4)).Build(triangles, {0}, influences, 300), AssertException);
}

TEST(SkinPartitionerTest, VertexMapFollowsFirstUse) {
    const std::vector<Types::Triangle> triangles = {MakeTriangle(2, 1, 0), MakeTriangle(2, 0, 3)};
    const Builder::PartitionResult result = SkinPartitioner(MakeSettings(4, 4)).Build(triangles, {0, 0}, MakeRigidInfluences(4), 4);

    ASSERT_EQ(result.partitions.size(), 1u);
    const Assets::SkinPartitionAsset& partition = result.partitions[0];
    EXPECT_EQ(partition.vertexMap, (std::vector<uint16_t>{2, 1, 0, 3}));
    ASSERT_EQ(partition.triangles.size(), 2u);
    EXPECT_EQ(partition.triangles[0].v1, 0);
    EXPECT_EQ(partition.triangles[0].v2, 1);
    EXPECT_EQ(partition.triangles[0].v3, 2);
    EXPECT_EQ(partition.triangles[1].v1, 0);
    EXPECT_EQ(partition.triangles[1].v2, 2);
    EXPECT_EQ(partition.triangles[1].v3, 3);
}

}  // namespace
