#pragma once
#include <optional>
#include <vector>
#include "NifMesh.h"
#include "NifMesh.private.h"

namespace Nif { namespace Builder {

/**
 * Attributes of one polygon corner. Position is identical for every corner of the same source vertex, so only uvs,
 * normal and color take part in welding.
 */
struct FaceCorner {
    int sourceIndex = -1;
    glm::vec3 position = glm::vec3(0);
    std::optional<glm::vec3> normal;
    /** One entry per uv layer. */
    std::vector<glm::vec2> uvs;
    std::optional<glm::vec4> color;
    std::optional<glm::vec3> tangent;
    std::optional<float> bitangentSign;
};

/** Output vertex. Created by the first corner carrying a new attribute combination and never changed afterwards. */
struct WeldedVertex {
    int sourceIndex = -1;
    glm::vec3 position = glm::vec3(0);
    std::optional<glm::vec3> normal;
    std::vector<glm::vec2> uvs;
    std::optional<glm::vec4> color;
    std::optional<glm::vec3> tangent;
    std::optional<float> bitangentSign;

    WeldedVertex() = default;

    explicit WeldedVertex(const FaceCorner& corner)
        : sourceIndex(corner.sourceIndex), position(corner.position), normal(corner.normal), uvs(corner.uvs), color(corner.color), tangent(corner.tangent), bitangentSign(corner.bitangentSign) {}
};

/** Source vertex index -> welded vertices created from it, in creation order. */
using SourceVertexMap = std::vector<std::vector<uint16_t>>;

class CornerWelder {
public:
    CornerWelder(float inEpsilon, size_t sourceVertexCount);

    /**
     * Returns the welded vertex for this corner. The first earlier vertex of the same source vertex matching within
     * epsilon wins, otherwise a new one is appended.
     * Throws ExportException(CapacityExceeded) when the buffer is full.
     */
    uint16_t AddCorner(const FaceCorner& corner);

    /**
     * Welds every corner of a polygon.
     * @return false for polygons with less than 3 corners, nothing is welded then.
     */
    bool AddPolygon(const std::vector<FaceCorner>& corners, std::vector<uint16_t>& outIndices);

    const std::vector<WeldedVertex>& GetVertices() const { return vertices; }

    const SourceVertexMap& GetSourceVertexMap() const { return sourceVertexMap; }

    size_t GetNumVertices() const { return vertices.size(); }

    /**
     * True if any attribute present on the existing vertex differs by more than epsilon in one of its components.
     */
    static bool IsNewCornerData(const FaceCorner& corner, const WeldedVertex& existing, float epsilon);

private:
    float epsilon;
    std::vector<WeldedVertex> vertices;
    SourceVertexMap sourceVertexMap;
};

}}  // namespace Nif::Builder
