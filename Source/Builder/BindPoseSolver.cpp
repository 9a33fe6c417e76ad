#include "BindPoseSolver.h"
#include <mutex>

namespace Nif { namespace Builder {

static void WarnOnDegenerateMatrix(const glm::mat4& mat, const std::string& owner) {
    glm::vec3 axisX, axisY, axisZ;
    Maths::GetMatrixScaledAxes(mat, axisX, axisY, axisZ);
    if (Maths::IsNearlyZero(axisX, SMALL_NUMBER) || Maths::IsNearlyZero(axisY, SMALL_NUMBER) || Maths::IsNearlyZero(axisZ, SMALL_NUMBER)) {
        LOG_WARN(fmt::format("Bind matrix of {} has NIL axes (X=({}, {}, {}) Y=({}, {}, {}) Z=({}, {}, {})), its inverse is not reliable.", owner, axisX.x, axisX.y, axisX.z, axisY.x, axisY.y, axisY.z, axisZ.x, axisZ.y, axisZ.z));
    }
}

BindPose BindPoseSolver::Solve(const Importer::MeshSnapshot& snapshot, Importer::Armature& armature, const std::vector<std::string>& boneNames, const Options& options) {
    BindPose bindPose;
    glm::mat4 rootWorld, rootLocal;
    {
        // node lookups evaluate host transforms, same lock as the rest pose sampling below
        std::lock_guard<std::mutex> lock(armature.GetPoseMutex());
        bindPose.skeletonRoot = options.skeletonRootName.empty() ? armature.GetName() : options.skeletonRootName;
        if (!armature.FindNode(bindPose.skeletonRoot, rootWorld, rootLocal)) {
            throw ExportException(ExportException::EErrorKind::MissingSkeletonRoot, fmt::format("Skeleton root '{}' not found.", bindPose.skeletonRoot));
        }

        if (options.sceneRootName.empty()) {
            LOG_WARN(fmt::format("Scene root was not set for mesh {}, using skeleton root {} instead.", snapshot.name, bindPose.skeletonRoot));
            bindPose.sceneRoot = bindPose.skeletonRoot;
        } else {
            glm::mat4 sceneWorld, sceneLocal;
            if (armature.FindNode(options.sceneRootName, sceneWorld, sceneLocal)) {
                bindPose.sceneRoot = options.sceneRootName;
            } else {
                LOG_WARN(fmt::format("Scene root {} not found for mesh {}, using skeleton root {} instead.", options.sceneRootName, snapshot.name, bindPose.skeletonRoot));
                bindPose.sceneRoot = bindPose.skeletonRoot;
            }
        }

        for (const std::string& boneName : boneNames) {
            if (!armature.HasBone(boneName)) {
                throw ExportException(ExportException::EErrorKind::MissingBone, fmt::format("Bone '{}' not found in armature {}.", boneName, armature.GetName()));
            }
        }
    }

    // geometry relative to the skeleton root, then the root's own transform
    const glm::mat4 meshRelativeToRoot = Maths::InverseNonFast(rootWorld) * snapshot.worldTransform;
    const glm::mat4 geometryTransform = rootLocal * meshRelativeToRoot;
    WarnOnDegenerateMatrix(geometryTransform, snapshot.name);
    bindPose.overallTransform = Maths::InverseNonFast(geometryTransform);

    {
        Importer::ScopedRestPose restPose(armature);
        bindPose.boneTransforms.reserve(boneNames.size());
        for (const std::string& boneName : boneNames) {
            const glm::mat4 bind = bindPose.overallTransform * armature.GetBoneMatrix(boneName);
            WarnOnDegenerateMatrix(bind, boneName);
            bindPose.boneTransforms.push_back(Maths::InverseNonFast(bind));
        }
    }
    return bindPose;
}

void BindPoseSolver::ComputeBoundingSphere(const std::vector<glm::vec3>& positions, const std::vector<std::pair<uint16_t, float>>& vertexWeights, const glm::mat4& skinTransform, glm::vec3& outCenter, float& outRadius) {
    outCenter = glm::vec3(0);
    outRadius = 0.f;
    if (vertexWeights.empty()) {
        return;
    }
    glm::vec3 centroid(0);
    for (const auto& item : vertexWeights) {
        ASSERT(item.first < positions.size());
        centroid += positions[item.first];
    }
    centroid /= static_cast<float>(vertexWeights.size());
    for (const auto& item : vertexWeights) {
        outRadius = Maths::Max(outRadius, glm::distance(centroid, positions[item.first]));
    }
    outCenter = glm::vec3(skinTransform * glm::vec4(centroid, 1.f));
}

}}  // namespace Nif::Builder
