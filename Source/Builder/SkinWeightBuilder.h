#pragma once
#include <string>
#include <utility>
#include <vector>
#include "CornerWelder.h"
#include "Importer/MeshSnapshot.h"

namespace Nif { namespace Builder {

/**
 * Normalized skin weights of one material group, keyed by welded vertex index.
 */
struct SkinWeights {
    /** Influencing bones in armature order. Bones without any remapped weight are not listed. */
    std::vector<std::string> boneNames;
    /** Parallel to boneNames: (welded vertex, weight) pairs in ascending vertex order. */
    std::vector<std::vector<std::pair<uint16_t, float>>> boneVertexWeights;
    /** Per welded vertex: (index into boneNames, weight). */
    std::vector<std::vector<std::pair<int, float>>> vertexInfluences;
};

namespace SkinWeightBuilder {

/**
 * Influences are the vertex groups named after a bone, listed in bone order.
 */
std::vector<std::string> GetInfluencingBones(const Importer::MeshSnapshot& snapshot, const std::vector<std::string>& boneNames);

/**
 * Normalizes the raw group weights of every source vertex and copies them onto each welded vertex created from it.
 * Throws ExportException(UnweightedVertex) listing every source vertex whose weights sum to zero.
 */
SkinWeights Build(const Importer::MeshSnapshot& snapshot, const SourceVertexMap& vertexMap, size_t numWeldedVertices, const std::vector<std::string>& influencingBones);

}  // namespace SkinWeightBuilder

}}  // namespace Nif::Builder
