#include "gtest/gtest.h"
#include "Builder/Triangulator.h"

namespace {

using namespace Nif::Builder;

void ExpectTriangle(const Nif::Types::Triangle& triangle, uint16_t v1, uint16_t v2, uint16_t v3) {
    EXPECT_EQ(triangle.v1, v1);
    EXPECT_EQ(triangle.v2, v2);
    EXPECT_EQ(triangle.v3, v3);
}

TEST(TriangulatorTest, MirroringFollowsScaleSum) {
    EXPECT_FALSE(Triangulator::IsMirrored(glm::vec3(1, 1, 1)));
    EXPECT_FALSE(Triangulator::IsMirrored(glm::vec3(-1, 1, 1)));
    EXPECT_TRUE(Triangulator::IsMirrored(glm::vec3(-1, -1, 1)));
    EXPECT_TRUE(Triangulator::IsMirrored(glm::vec3(-1, 0.5f, 0.5f)));
}

TEST(TriangulatorTest, TriangleIsKept) {
    std::vector<Nif::Types::Triangle> triangles;
    EXPECT_EQ(Triangulator::FanPolygon({4, 5, 6}, false, triangles), 1);
    ASSERT_EQ(triangles.size(), 1u);
    ExpectTriangle(triangles[0], 4, 5, 6);
}

TEST(TriangulatorTest, QuadIsFanned) {
    std::vector<Nif::Types::Triangle> triangles;
    EXPECT_EQ(Triangulator::FanPolygon({0, 1, 2, 3}, false, triangles), 2);
    ASSERT_EQ(triangles.size(), 2u);
    ExpectTriangle(triangles[0], 0, 1, 2);
    ExpectTriangle(triangles[1], 0, 2, 3);
}

TEST(TriangulatorTest, MirroredQuadIsReversed) {
    std::vector<Nif::Types::Triangle> triangles;
    EXPECT_EQ(Triangulator::FanPolygon({0, 1, 2, 3}, true, triangles), 2);
    ASSERT_EQ(triangles.size(), 2u);
    ExpectTriangle(triangles[0], 0, 2, 1);
    ExpectTriangle(triangles[1], 0, 3, 2);
}

TEST(TriangulatorTest, DegeneratePolygonAddsNothing) {
    std::vector<Nif::Types::Triangle> triangles;
    EXPECT_EQ(Triangulator::FanPolygon({0, 1}, false, triangles), 0);
    EXPECT_TRUE(triangles.empty());
}

TEST(TriangulatorTest, NgonIsRejected) {
    std::vector<Nif::Types::Triangle> triangles;
    EXPECT_THROW(Triangulator::FanPolygon({0, 1, 2, 3, 4}, false, triangles), Nif::AssertException);
}

TEST(TriangulatorTest, TriangleBufferCapacity) {
    std::vector<Nif::Types::Triangle> triangles(Nif::Configuration::MaxTriangleCount - 1);
    // the second triangle of the quad does not fit anymore
    try {
        Triangulator::FanPolygon({0, 1, 2, 3}, false, triangles);
        FAIL() << "expected CapacityExceeded";
    } catch (const Nif::ExportException& e) {
        EXPECT_EQ(e.kind, Nif::ExportException::EErrorKind::CapacityExceeded);
    }
    EXPECT_EQ(triangles.size(), static_cast<size_t>(Nif::Configuration::MaxTriangleCount));
}

}  // namespace
