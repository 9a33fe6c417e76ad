#pragma once
#include <memory>
#include <vector>
#include "NifMesh.h"
#include "CornerWelder.h"
#include "Importer/Armature.h"
#include "Importer/MeshSnapshot.h"

namespace Nif { namespace Builder {

class MeshExporter {
public:
    /**
     * Exports one shape per material group of the mesh, ordered by material index. Groups without vertices are
     * skipped. Any ExportException aborts the whole mesh, nothing is returned then.
     * @param armature	Optional, the mesh is skinned when some vertex groups are named after its bones.
     */
    static std::vector<std::shared_ptr<Assets::TriShapeAsset>> Export(const Importer::MeshSnapshot& snapshot, std::shared_ptr<Importer::Armature> armature, std::shared_ptr<Options> options);

    /**
     * Exports the polygons of one material slot, -1 takes every polygon.
     * @return nullptr if the group has no vertices.
     */
    static std::shared_ptr<Assets::TriShapeAsset> ExportMaterialGroup(const Importer::MeshSnapshot& snapshot, int materialIndex, std::shared_ptr<Importer::Armature> armature, const Options& options);

private:
    /** Throws UnassignedBodyPart listing every polygon of the group without a tag, -1 checks every polygon. */
    static void CheckBodyParts(const Importer::MeshSnapshot& snapshot, int materialIndex);

    static void ExportSkin(Assets::TriShapeAsset& shape, const Importer::MeshSnapshot& snapshot, const std::vector<glm::vec3>& positions, const SourceVertexMap& vertexMap, Importer::Armature& armature, bool bUseBodyParts, const Options& options);
};

}}  // namespace Nif::Builder
