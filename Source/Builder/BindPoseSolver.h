#pragma once
#include <string>
#include <utility>
#include <vector>
#include "Importer/Armature.h"
#include "Importer/MeshSnapshot.h"

namespace Nif { namespace Builder {

struct BindPose {
    std::string skeletonRoot;
    std::string sceneRoot;
    /** Inverse of the geometry transform relative to the skeleton root. */
    glm::mat4 overallTransform = glm::mat4(1);
    /** Inverse bind transform per bone, parallel to the bone list given to Solve. */
    std::vector<glm::mat4> boneTransforms;
};

namespace BindPoseSolver {

/**
 * Computes the skin and per bone bind transforms. Bone matrices are sampled with the armature held in rest pose.
 * Throws ExportException(MissingSkeletonRoot) if the skeleton root node cannot be found and
 * ExportException(MissingBone) if the armature cannot resolve one of the bones.
 */
BindPose Solve(const Importer::MeshSnapshot& snapshot, Importer::Armature& armature, const std::vector<std::string>& boneNames, const Options& options);

/**
 * Bounding sphere of the vertices weighted to one bone: centroid and maximum distance. The center is expressed in bone
 * space through the bone's skin transform.
 */
void ComputeBoundingSphere(const std::vector<glm::vec3>& positions, const std::vector<std::pair<uint16_t, float>>& vertexWeights, const glm::mat4& skinTransform, glm::vec3& outCenter, float& outRadius);

}  // namespace BindPoseSolver

}}  // namespace Nif::Builder
