#pragma once
#include <map>
#include <string>
#include <vector>
#include "Scene.h"

namespace Nif { namespace Importer {

/**
 * Armature over the fbx skeleton driving a skinned mesh node. The skeleton root is found by walking up from the first
 * cluster link. Rest pose reads bind matrices, Pose evaluates the node transforms at time zero.
 */
class FbxArmature : public Armature {
public:
    FbxArmature(Scene& scene, FbxNode* meshNode, const std::vector<FbxCluster*>& clusters);

    bool IsValid() const { return rootNode != nullptr; }

    std::string GetName() const override;

    std::vector<std::string> GetBoneNames() const override;

    bool FindNode(const std::string& nodeName, glm::mat4& outWorld, glm::mat4& outLocal) const override;

    glm::mat4 GetBoneMatrix(const std::string& boneName) const override;

    EPosePosition GetPosePosition() const override { return posePosition; }

    void SetPosePosition(EPosePosition position) override { posePosition = position; }

private:
    glm::mat4 GetGlobalMatrix(FbxNode* link) const;

    FbxScene* fbxScene = nullptr;
    FbxNode* rootNode = nullptr;
    std::string rootName;

    /** Parents before children. */
    std::vector<FbxNode*> sortedLinks;
    std::map<std::string, FbxNode*> linksByName;
    std::map<FbxNode*, glm::mat4> bindMatrices;

    EPosePosition posePosition = EPosePosition::Pose;
};

}}  // namespace Nif::Importer
