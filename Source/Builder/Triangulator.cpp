#include "Triangulator.h"

namespace Nif { namespace Builder {

bool Triangulator::IsMirrored(const glm::vec3& scale) { return (scale.x + scale.y + scale.z) <= 0.f; }

int Triangulator::FanPolygon(const std::vector<uint16_t>& cornerIndices, bool bMirrored, std::vector<Types::Triangle>& outTriangles) {
    const int numCorners = static_cast<int>(cornerIndices.size());
    if (numCorners < 3) {
        return 0;
    }
    // host meshes are triangulated or quads at this point
    ASSERT(numCorners == 3 || numCorners == 4);

    for (int i = 0; i < numCorners - 2; i++) {
        if (outTriangles.size() >= Configuration::MaxTriangleCount) {
            throw ExportException(ExportException::EErrorKind::CapacityExceeded, fmt::format("Too many polygons, at most {:d} triangles are allowed per material. Decimate your mesh and try again.", Configuration::MaxTriangleCount));
        }
        Types::Triangle triangle;
        triangle.v1 = cornerIndices[0];
        if (!bMirrored) {
            triangle.v2 = cornerIndices[1 + i];
            triangle.v3 = cornerIndices[2 + i];
        } else {
            triangle.v2 = cornerIndices[2 + i];
            triangle.v3 = cornerIndices[1 + i];
        }
        outTriangles.push_back(triangle);
    }
    return numCorners - 2;
}

}}  // namespace Nif::Builder
