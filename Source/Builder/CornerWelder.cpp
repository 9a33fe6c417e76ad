#include "CornerWelder.h"

namespace Nif { namespace Builder {

CornerWelder::CornerWelder(float inEpsilon, size_t sourceVertexCount) : epsilon(inEpsilon), sourceVertexMap(sourceVertexCount) {}

bool CornerWelder::IsNewCornerData(const FaceCorner& corner, const WeldedVertex& existing, float epsilon) {
    // uvs
    if (!existing.uvs.empty()) {
        ASSERT(corner.uvs.size() == existing.uvs.size());
        for (size_t layer = 0; layer < existing.uvs.size(); layer++) {
            if (!Maths::IsNearlyEqual(corner.uvs[layer], existing.uvs[layer], epsilon)) {
                return true;
            }
        }
    }
    // normals
    if (existing.normal) {
        if (!corner.normal || !Maths::IsNearlyEqual(*corner.normal, *existing.normal, epsilon)) {
            return true;
        }
    }
    // vertex colors
    if (existing.color) {
        if (!corner.color || !Maths::IsNearlyEqual(*corner.color, *existing.color, epsilon)) {
            return true;
        }
    }
    return false;
}

uint16_t CornerWelder::AddCorner(const FaceCorner& corner) {
    ASSERT(corner.sourceIndex >= 0 && static_cast<size_t>(corner.sourceIndex) < sourceVertexMap.size());

    std::vector<uint16_t>& candidates = sourceVertexMap[corner.sourceIndex];
    // only vertices of the same source vertex can be merged
    for (const uint16_t candidate : candidates) {
        if (!IsNewCornerData(corner, vertices[candidate], epsilon)) {
            return candidate;
        }
    }

    if (vertices.size() >= Configuration::MaxVertexCount) {
        throw ExportException(ExportException::EErrorKind::CapacityExceeded, fmt::format("Too many vertices, at most {:d} are allowed per material. Decimate your mesh and try again.", Configuration::MaxVertexCount));
    }

    const uint16_t weldedIndex = static_cast<uint16_t>(vertices.size());
    vertices.emplace_back(corner);
    candidates.push_back(weldedIndex);
    return weldedIndex;
}

bool CornerWelder::AddPolygon(const std::vector<FaceCorner>& corners, std::vector<uint16_t>& outIndices) {
    outIndices.clear();
    if (corners.size() < 3) {
        return false;
    }
    outIndices.reserve(corners.size());
    for (const FaceCorner& corner : corners) {
        outIndices.push_back(AddCorner(corner));
    }
    return true;
}

}}  // namespace Nif::Builder
