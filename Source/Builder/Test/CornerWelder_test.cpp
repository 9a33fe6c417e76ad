#include "gtest/gtest.h"
#include "Builder/CornerWelder.h"

namespace {

using Nif::Builder::CornerWelder;
using Nif::Builder::FaceCorner;

FaceCorner MakeCorner(int sourceIndex, glm::vec2 uv, glm::vec3 normal = glm::vec3(0, 0, 1)) {
    FaceCorner corner;
    corner.sourceIndex = sourceIndex;
    corner.position = glm::vec3(static_cast<float>(sourceIndex), 0, 0);
    corner.uvs.push_back(uv);
    corner.normal = normal;
    return corner;
}

TEST(CornerWelderTest, SharedCornersAreWelded) {
    CornerWelder welder(1e-4f, 4);
    std::vector<uint16_t> first, second;
    ASSERT_TRUE(welder.AddPolygon({MakeCorner(0, {0, 0}), MakeCorner(1, {1, 0}), MakeCorner(2, {1, 1})}, first));
    ASSERT_TRUE(welder.AddPolygon({MakeCorner(0, {0, 0}), MakeCorner(2, {1, 1}), MakeCorner(3, {0, 1})}, second));

    EXPECT_EQ(welder.GetNumVertices(), 4u);
    EXPECT_EQ(first, (std::vector<uint16_t>{0, 1, 2}));
    EXPECT_EQ(second, (std::vector<uint16_t>{0, 2, 3}));
}

TEST(CornerWelderTest, UVSeamSplitsSourceVertex) {
    CornerWelder welder(1e-4f, 1);
    const uint16_t a = welder.AddCorner(MakeCorner(0, {0, 0}));
    const uint16_t b = welder.AddCorner(MakeCorner(0, {0.5f, 0}));

    EXPECT_NE(a, b);
    ASSERT_EQ(welder.GetSourceVertexMap()[0].size(), 2u);
    EXPECT_EQ(welder.GetSourceVertexMap()[0][0], a);
    EXPECT_EQ(welder.GetSourceVertexMap()[0][1], b);
    EXPECT_EQ(welder.GetVertices()[b].sourceIndex, 0);
}

TEST(CornerWelderTest, DifferentSourceVerticesAreNeverMerged) {
    CornerWelder welder(1e-4f, 2);
    FaceCorner first = MakeCorner(0, {0, 0});
    FaceCorner second = MakeCorner(1, {0, 0});
    second.position = first.position;

    EXPECT_NE(welder.AddCorner(first), welder.AddCorner(second));
    EXPECT_EQ(welder.GetNumVertices(), 2u);
}

TEST(CornerWelderTest, EpsilonDecidesWelding) {
    CornerWelder welder(0.01f, 1);
    const uint16_t base = welder.AddCorner(MakeCorner(0, {0.5f, 0.5f}));
    EXPECT_EQ(welder.AddCorner(MakeCorner(0, {0.505f, 0.5f})), base);
    EXPECT_NE(welder.AddCorner(MakeCorner(0, {0.52f, 0.5f})), base);

    // normals and colors take part as well
    EXPECT_NE(welder.AddCorner(MakeCorner(0, {0.5f, 0.5f}, glm::vec3(1, 0, 0))), base);
    FaceCorner colored = MakeCorner(0, {0.5f, 0.5f});
    colored.color = glm::vec4(1, 0, 0, 1);
    EXPECT_EQ(welder.AddCorner(colored), base);
}

TEST(CornerWelderTest, FirstMatchingVertexWins) {
    CornerWelder welder(0.1f, 1);
    const uint16_t a = welder.AddCorner(MakeCorner(0, {0.f, 0.f}));
    const uint16_t b = welder.AddCorner(MakeCorner(0, {0.15f, 0.f}));
    ASSERT_NE(a, b);

    // within epsilon of both, the earlier one is used
    EXPECT_EQ(welder.AddCorner(MakeCorner(0, {0.08f, 0.f})), a);
    EXPECT_EQ(welder.GetNumVertices(), 2u);
}

TEST(CornerWelderTest, WeldedVertexKeepsFirstCornerData) {
    CornerWelder welder(0.1f, 1);
    const uint16_t a = welder.AddCorner(MakeCorner(0, {0.f, 0.f}));
    welder.AddCorner(MakeCorner(0, {0.05f, 0.f}));
    EXPECT_FLOAT_EQ(welder.GetVertices()[a].uvs[0].x, 0.f);
}

TEST(CornerWelderTest, DegeneratePolygonIsIgnored) {
    CornerWelder welder(1e-4f, 2);
    std::vector<uint16_t> indices = {7};
    EXPECT_FALSE(welder.AddPolygon({MakeCorner(0, {0, 0}), MakeCorner(1, {0, 0})}, indices));
    EXPECT_TRUE(indices.empty());
    EXPECT_EQ(welder.GetNumVertices(), 0u);
}

TEST(CornerWelderTest, VertexBufferCapacity) {
    const size_t capacity = Nif::Configuration::MaxVertexCount;
    CornerWelder welder(1e-4f, capacity + 1);
    for (size_t i = 0; i < capacity; i++) {
        welder.AddCorner(MakeCorner(static_cast<int>(i), {0, 0}));
    }
    EXPECT_EQ(welder.GetNumVertices(), capacity);

    // a corner matching an existing vertex still fits
    EXPECT_EQ(welder.AddCorner(MakeCorner(0, {0, 0})), 0);

    try {
        welder.AddCorner(MakeCorner(static_cast<int>(capacity), {0, 0}));
        FAIL() << "expected CapacityExceeded";
    } catch (const Nif::ExportException& e) {
        EXPECT_EQ(e.kind, Nif::ExportException::EErrorKind::CapacityExceeded);
    }
}

}  // namespace
