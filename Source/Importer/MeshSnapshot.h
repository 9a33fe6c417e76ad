#pragma once
#include <string>
#include <vector>
#include <memory>
#include "NifMesh.private.h"

namespace Nif { namespace Importer {

/**
 * Evaluated, modifier-applied mesh as handed over by the geometry host. Read only once built, it is shared by every
 * material group export of the mesh.
 */
struct MeshSnapshot {
    struct Loop {
        int vertexIndex = 0;
        glm::vec3 normal = glm::vec3(0);
        glm::vec3 tangent = glm::vec3(0);
        float bitangentSign = 1.f;
    };

    struct Polygon {
        /** Indices into loops, in winding order. */
        std::vector<int> loops;
        int materialIndex = 0;
        bool bSmooth = true;
        glm::vec3 normal = glm::vec3(0);
        /** -1 when the polygon is not assigned to a body part. */
        int bodyPart = -1;
    };

    struct Material {
        std::string name;
        /** Skyrim shaders with model space normal maps take no vertex normals. */
        bool bModelSpaceNormals = false;
    };

    struct GroupWeight {
        int group;
        float weight;
    };

    std::string name;

    glm::mat4 worldTransform = glm::mat4(1);
    glm::vec3 scale = glm::vec3(1);
    bool bDisplayAsWire = false;

    std::vector<glm::vec3> positions;

    /** Vertex group assignment of every source vertex. */
    std::vector<std::vector<GroupWeight>> vertexGroups;
    std::vector<std::string> groupNames;

    std::vector<Loop> loops;
    /** [uv layer][loop] */
    std::vector<std::vector<glm::vec2>> uvLayers;
    /** Per loop, empty when the mesh has no vertex colors. */
    std::vector<glm::vec4> colors;

    std::vector<Polygon> polygons;
    /** A null entry is a material slot without material. */
    std::vector<std::shared_ptr<Material>> materials;

    bool bHasBodyParts = false;
    /** Loop tangents and signs are valid. */
    bool bHasTangents = false;
    std::vector<int> bodyPartOrder;

    bool HasVertexColors() const { return !colors.empty(); }

    int GetGroupIndex(const std::string& groupName) const {
        for (int i = 0; i < static_cast<int>(groupNames.size()); i++) {
            if (groupNames[i] == groupName) {
                return i;
            }
        }
        return -1;
    }
};

}}  // namespace Nif::Importer
