#include "FbxArmature.h"

namespace Nif { namespace Importer {

FbxArmature::FbxArmature(Scene& scene, FbxNode* meshNode, const std::vector<FbxCluster*>& clusters) {
    fbxScene = scene.GetSceneInfo()->scene;
    for (FbxCluster* cluster : clusters) {
        if (cluster->GetLink()) {
            rootNode = scene.GetRootSkeleton(cluster->GetLink());
            break;
        }
    }
    if (!rootNode) {
        return;
    }
    rootName = ImporterHelper::MakeName(ImporterHelper::UTF8ToNative(rootNode->GetName()));
    scene.RecursiveBuildSkeleton(rootNode, sortedLinks);

    FbxPose* bindPose = scene.RetrievePoseFromBindPose(meshNode);
    if (!bindPose) {
        LOG_WARN(fmt::format("No bind pose found for {}, cluster link matrices are used.", ImporterHelper::UTF8ToNative(meshNode->GetName())));
    }

    std::vector<std::string> linksWithoutBindPose;
    for (FbxNode* link : sortedLinks) {
        linksByName[ImporterHelper::MakeName(ImporterHelper::UTF8ToNative(link->GetName()))] = link;

        bool bIsLinkFound = false;
        FbxAMatrix linkMatrix;
        if (bindPose) {
            int poseLinkIndex = bindPose->Find(link);
            if (poseLinkIndex >= 0) {
                // bind pose matrices are always global
                FbxMatrix noneAffineMatrix = bindPose->GetMatrix(poseLinkIndex);
                linkMatrix = *(FbxAMatrix*)(double*)&noneAffineMatrix;
                bIsLinkFound = true;
            }
        }
        if (!bIsLinkFound) {
            for (FbxCluster* cluster : clusters) {
                if (link == cluster->GetLink()) {
                    cluster->GetTransformLinkMatrix(linkMatrix);
                    bIsLinkFound = true;
                    break;
                }
            }
        }
        if (!bIsLinkFound) {
            linksWithoutBindPose.push_back(ImporterHelper::UTF8ToNative(link->GetName()));
            linkMatrix = link->EvaluateGlobalTransform();
        }
        bindMatrices[link] = FbxDataConverter::ConvertMatrix(linkMatrix);
    }

    if (!linksWithoutBindPose.empty()) {
        LOG_DEBUG(fmt::format("Nodes without bind matrix use their current transform: {}", Utils::Join(linksWithoutBindPose, ", ")));
    }
}

std::string FbxArmature::GetName() const { return rootName; }

std::vector<std::string> FbxArmature::GetBoneNames() const {
    std::vector<std::string> boneNames;
    for (FbxNode* link : sortedLinks) {
        boneNames.push_back(ImporterHelper::MakeName(ImporterHelper::UTF8ToNative(link->GetName())));
    }
    return boneNames;
}

bool FbxArmature::FindNode(const std::string& nodeName, glm::mat4& outWorld, glm::mat4& outLocal) const {
    for (int nodeIndex = 0; nodeIndex < fbxScene->GetNodeCount(); nodeIndex++) {
        FbxNode* node = fbxScene->GetNode(nodeIndex);
        if (ImporterHelper::MakeName(ImporterHelper::UTF8ToNative(node->GetName())) == nodeName) {
            outWorld = FbxDataConverter::ConvertMatrix(node->EvaluateGlobalTransform());
            outLocal = FbxDataConverter::ConvertMatrix(node->EvaluateLocalTransform());
            return true;
        }
    }
    return false;
}

glm::mat4 FbxArmature::GetGlobalMatrix(FbxNode* link) const {
    if (posePosition == EPosePosition::Rest) {
        auto found = bindMatrices.find(link);
        if (found != bindMatrices.end()) {
            return found->second;
        }
    }
    return FbxDataConverter::ConvertMatrix(link->EvaluateGlobalTransform());
}

glm::mat4 FbxArmature::GetBoneMatrix(const std::string& boneName) const {
    auto found = linksByName.find(boneName);
    if (found == linksByName.end()) {
        throw ExportException(ExportException::EErrorKind::MissingBone, fmt::format("Bone {} is not part of skeleton {}.", boneName, rootName));
    }
    return Maths::InverseNonFast(GetGlobalMatrix(rootNode)) * GetGlobalMatrix(found->second);
}

}}  // namespace Nif::Importer
