#include <algorithm>
#include "Scene.h"
#include "FbxArmature.h"
#include "mikktspace.h"

namespace Nif { namespace Importer {

/**
 * mikktspace user data, tangents are written back into the snapshot loops.
 */
class MikkTSpace {
public:
    explicit MikkTSpace(MeshSnapshot& inSnapshot) : snapshot(inSnapshot) {}

    const glm::vec3& GetCornerNormal(int faceIdx, int vertIdx) const {
        const MeshSnapshot::Polygon& polygon = snapshot.polygons[faceIdx];
        return polygon.bSmooth ? snapshot.loops[polygon.loops[vertIdx]].normal : polygon.normal;
    }

    MeshSnapshot& snapshot;
};

static int MikkGetNumFaces(const SMikkTSpaceContext* context) {
    MikkTSpace* userData = (MikkTSpace*)(context->m_pUserData);
    return static_cast<int>(userData->snapshot.polygons.size());
}

static int MikkGetNumVertsOfFace(const SMikkTSpaceContext* context, const int faceIdx) {
    MikkTSpace* userData = (MikkTSpace*)(context->m_pUserData);
    return static_cast<int>(userData->snapshot.polygons[faceIdx].loops.size());
}

static void MikkGetPosition(const SMikkTSpaceContext* context, float position[3], const int faceIdx, const int vertIdx) {
    MikkTSpace* userData = (MikkTSpace*)(context->m_pUserData);
    const MeshSnapshot& snapshot = userData->snapshot;
    const glm::vec3& vertexPosition = snapshot.positions[snapshot.loops[snapshot.polygons[faceIdx].loops[vertIdx]].vertexIndex];
    position[0] = vertexPosition.x;
    position[1] = vertexPosition.y;
    position[2] = vertexPosition.z;
}

static void MikkGetNormal(const SMikkTSpaceContext* context, float normal[3], const int faceIdx, const int vertIdx) {
    MikkTSpace* userData = (MikkTSpace*)(context->m_pUserData);
    const glm::vec3& vertexNormal = userData->GetCornerNormal(faceIdx, vertIdx);
    normal[0] = vertexNormal.x;
    normal[1] = vertexNormal.y;
    normal[2] = vertexNormal.z;
}

static void MikkGetTexCoord(const SMikkTSpaceContext* context, float UV[2], const int faceIdx, const int vertIdx) {
    MikkTSpace* userData = (MikkTSpace*)(context->m_pUserData);
    const MeshSnapshot& snapshot = userData->snapshot;
    const glm::vec2& texCoord = snapshot.uvLayers[0][snapshot.polygons[faceIdx].loops[vertIdx]];
    UV[0] = texCoord.x;
    UV[1] = texCoord.y;
}

static void MikkSetTSpaceBasic(const SMikkTSpaceContext* context, const float tangent[3], const float bitangentSign, const int faceIdx, const int vertIdx) {
    MikkTSpace* userData = (MikkTSpace*)(context->m_pUserData);
    MeshSnapshot::Loop& loop = userData->snapshot.loops[userData->snapshot.polygons[faceIdx].loops[vertIdx]];
    loop.tangent = glm::vec3(tangent[0], tangent[1], tangent[2]);
    loop.bitangentSign = bitangentSign;
}

FbxNode* Scene::GetRootSkeleton(FbxNode* link) {
    FbxNode* rootBone = link;

    // mesh and dummy are used as bone if they are in the skeleton hierarchy
    while (rootBone && rootBone->GetParent()) {
        bool bIsBlenderArmatureBone = false;
        if (sceneInfo->bIsCreateByBlender) {
            // blender writes a null node named "armature" above the real root bone, it is not part of the skeleton
            const char* rootBoneParentName = rootBone->GetParent()->GetName();
            FbxNode* grandFather = rootBone->GetParent()->GetParent();
            bIsBlenderArmatureBone = (grandFather == nullptr || grandFather == sceneInfo->scene->GetRootNode()) && (Utils::InsensitiveCaseEquals(rootBoneParentName, "armature"));
        }

        FbxNodeAttribute* attr = rootBone->GetParent()->GetNodeAttribute();
        if (attr && (attr->GetAttributeType() == FbxNodeAttribute::eMesh || (attr->GetAttributeType() == FbxNodeAttribute::eNull && !bIsBlenderArmatureBone) || attr->GetAttributeType() == FbxNodeAttribute::eSkeleton) && rootBone->GetParent() != sceneInfo->scene->GetRootNode()) {
            // a skinned mesh can be ancestor of its bones
            if (attr->GetAttributeType() == FbxNodeAttribute::eMesh) {
                FbxMesh* mesh = (FbxMesh*)attr;
                if (mesh->GetDeformerCount(FbxDeformer::eSkin) > 0) {
                    break;
                }
            }
            rootBone = rootBone->GetParent();
        } else {
            break;
        }
    }

    return rootBone;
}

FbxPose* Scene::RetrievePoseFromBindPose(FbxNode* node) {
    const int poseCount = sceneInfo->scene->GetPoseCount();
    for (int poseIndex = 0; poseIndex < poseCount; poseIndex++) {
        FbxPose* currentPose = sceneInfo->scene->GetPose(poseIndex);
        if (!currentPose || !currentPose->IsBindPose()) {
            continue;
        }

        std::string poseName = currentPose->GetName();
        FbxStatus status;
        NodeList pMissingAncestors, pMissingDeformers, pMissingDeformersAncestors, pWrongMatrices;
        if (currentPose->IsValidBindPoseVerbose(node, pMissingAncestors, pMissingDeformers, pMissingDeformersAncestors, pWrongMatrices, 0.0001, &status)) {
            LOG_INFO(fmt::format("Bind pose {} found for {}.", poseName, ImporterHelper::UTF8ToNative(node->GetName())));
            return currentPose;
        }

        // add missing ancestors and check again
        for (int i = 0; i < pMissingAncestors.GetCount(); i++) {
            FbxAMatrix mat = pMissingAncestors.GetAt(i)->EvaluateGlobalTransform(FBXSDK_TIME_ZERO);
            currentPose->Add(pMissingAncestors.GetAt(i), mat);
        }
        if (currentPose->IsValidBindPose(node)) {
            LOG_INFO(fmt::format("Bind pose {} found for {}.", poseName, ImporterHelper::UTF8ToNative(node->GetName())));
            return currentPose;
        }

        // retry from the closest null group above the node
        FbxNode* parentNode = node->GetParent();
        while (parentNode) {
            FbxNodeAttribute* attr = parentNode->GetNodeAttribute();
            if (attr && attr->GetAttributeType() == FbxNodeAttribute::eNull) {
                break;
            }
            parentNode = parentNode->GetParent();
        }
        if (parentNode && currentPose->IsValidBindPose(parentNode)) {
            LOG_INFO(fmt::format("Bind pose {} found for {}.", poseName, ImporterHelper::UTF8ToNative(node->GetName())));
            return currentPose;
        }
        LOG_INFO(fmt::format("Bind pose {} is not valid for {}: {}.", poseName, ImporterHelper::UTF8ToNative(node->GetName()), status.GetErrorString()));
    }

    return nullptr;
}

void Scene::RecursiveBuildSkeleton(FbxNode* link, std::vector<FbxNode*>& outSortedLinks) {
    bool isSkeleton = false;
    {
        FbxNodeAttribute* attr = link->GetNodeAttribute();
        if (attr) {
            FbxNodeAttribute::EType atrType = attr->GetAttributeType();
            if (atrType == FbxNodeAttribute::eSkeleton || atrType == FbxNodeAttribute::eMesh || atrType == FbxNodeAttribute::eNull) {
                isSkeleton = true;
            }
        }
    }
    if (isSkeleton) {
        outSortedLinks.push_back(link);
        for (int childIndex = 0; childIndex < link->GetChildCount(); childIndex++) {
            RecursiveBuildSkeleton(link->GetChild(childIndex), outSortedLinks);
        }
    }
}

std::shared_ptr<Scene::MeshEntry> Scene::ProcessMesh(FbxNode* node) {
    FbxMesh* fbxMesh = node->GetMesh();
    if (!fbxMesh) {
        return nullptr;
    }

    std::shared_ptr<MeshEntry> entry = std::make_shared<MeshEntry>();
    entry->snapshot = ImportMesh(node, fbxMesh);
    if (!entry->snapshot) {
        return nullptr;
    }

    // the mesh may have been replaced by the triangulation
    fbxMesh = node->GetMesh();
    std::vector<FbxCluster*> clusters = ImportVertexGroups(fbxMesh, *entry->snapshot);
    if (!clusters.empty()) {
        std::shared_ptr<FbxArmature> armature = std::make_shared<FbxArmature>(*this, node, clusters);
        if (armature->IsValid()) {
            entry->armature = armature;
        } else {
            LOG_WARN(fmt::format("Mesh {} has skin clusters without skeleton, exported unskinned.", entry->snapshot->name));
        }
    }
    return entry;
}

std::vector<FbxCluster*> Scene::ImportVertexGroups(FbxMesh* fbxMesh, MeshSnapshot& snapshot) {
    std::vector<FbxCluster*> clusters;
    const int skinCount = fbxMesh->GetDeformerCount(FbxDeformer::eSkin);
    for (int skinIndex = 0; skinIndex < skinCount; skinIndex++) {
        FbxSkin* skin = (FbxSkin*)fbxMesh->GetDeformer(skinIndex, FbxDeformer::eSkin);
        for (int clusterIndex = 0; clusterIndex < skin->GetClusterCount(); clusterIndex++) {
            FbxCluster* cluster = skin->GetCluster(clusterIndex);
            if (!cluster || !cluster->GetLink() || ImporterHelper::IsMayaCompensationCluster(cluster)) {
                continue;
            }
            clusters.push_back(cluster);

            const std::string groupName = ImporterHelper::MakeName(ImporterHelper::UTF8ToNative(cluster->GetLink()->GetName()));
            int groupIndex = snapshot.GetGroupIndex(groupName);
            if (groupIndex < 0) {
                groupIndex = static_cast<int>(snapshot.groupNames.size());
                snapshot.groupNames.push_back(groupName);
            }

            const int controlPointIndicesCount = cluster->GetControlPointIndicesCount();
            const int* controlPointIndices = cluster->GetControlPointIndices();
            const double* weights = cluster->GetControlPointWeights();
            for (int i = 0; i < controlPointIndicesCount; i++) {
                const int controlPointIndex = controlPointIndices[i];
                if (controlPointIndex < 0 || controlPointIndex >= static_cast<int>(snapshot.vertexGroups.size())) {
                    continue;
                }
                snapshot.vertexGroups[controlPointIndex].push_back({groupIndex, static_cast<float>(weights[i])});
            }
        }
    }
    return clusters;
}

void Scene::ImportPolygonGroups(FbxMesh* fbxMesh, MeshSnapshot& snapshot) {
    FbxLayer* baseLayer = fbxMesh->GetLayer(0);
    const FbxLayerElementPolygonGroup* polygonGroups = baseLayer ? baseLayer->GetPolygonGroups() : nullptr;
    if (!polygonGroups || polygonGroups->GetMappingMode() != FbxLayerElement::eByPolygon) {
        return;
    }

    const FbxLayerElementArrayTemplate<int>& indexArray = polygonGroups->GetIndexArray();
    for (int polygonIndex = 0; polygonIndex < static_cast<int>(snapshot.polygons.size()) && polygonIndex < indexArray.GetCount(); polygonIndex++) {
        snapshot.polygons[polygonIndex].bodyPart = indexArray.GetAt(polygonIndex);
    }
    snapshot.bHasBodyParts = true;
}

std::shared_ptr<MeshSnapshot> Scene::ImportMesh(FbxNode* node, FbxMesh* fbxMesh) {
    std::shared_ptr<MeshSnapshot> snapshot = std::make_shared<MeshSnapshot>();
    snapshot->name = ImporterHelper::MakeName(ImporterHelper::UTF8ToNative(node->GetName()));

    fbxMesh->RemoveBadPolygons();

    // smoothing by edge is converted before any triangulation
    const int layerSmoothingCount = fbxMesh->GetLayerCount(FbxLayerElement::eSmoothing);
    for (int i = 0; i < layerSmoothingCount; i++) {
        FbxLayerElementSmoothing const* smoothingInfo = fbxMesh->GetLayer(i)->GetSmoothing();
        if (smoothingInfo && smoothingInfo->GetMappingMode() != FbxLayerElement::eByPolygon) {
            Importer::GetInstance()->geometryConverter->ComputePolygonSmoothingFromEdgeSmoothing(fbxMesh, i);
        }
    }

    bool bNeedsTriangulation = false;
    for (int polygonIndex = 0; polygonIndex < fbxMesh->GetPolygonCount(); polygonIndex++) {
        if (fbxMesh->GetPolygonSize(polygonIndex) > 4) {
            bNeedsTriangulation = true;
            break;
        }
    }
    if (bNeedsTriangulation) {
        LOG_INFO(fmt::format("Triangulating mesh {} ...", snapshot->name));
        const bool bReplace = true;
        FbxNodeAttribute* convertedNode = Importer::GetInstance()->geometryConverter->Triangulate(fbxMesh, bReplace);
        if (convertedNode != nullptr && convertedNode->GetAttributeType() == FbxNodeAttribute::eMesh) {
            fbxMesh = convertedNode->GetNode()->GetMesh();
        } else {
            LOG_ERROR(fmt::format("Failed to triangulate mesh {}.", snapshot->name));
            return nullptr;
        }
    }

    FbxLayer* baseLayer = fbxMesh->GetLayer(0);
    if (baseLayer == nullptr) {
        LOG_ERROR(fmt::format("No geometry info found for mesh {}.", snapshot->name));
        return nullptr;
    }

    const FbxAMatrix globalTransform = node->EvaluateGlobalTransform();
    snapshot->worldTransform = FbxDataConverter::ConvertMatrix(globalTransform);
    snapshot->scale = FbxDataConverter::ConvertScale(globalTransform.GetS());
    snapshot->bDisplayAsWire = node->GetShadingMode() == FbxNode::eWireFrame;

    // control points
    const int controlPointsCount = fbxMesh->GetControlPointsCount();
    snapshot->positions.resize(controlPointsCount);
    snapshot->vertexGroups.resize(controlPointsCount);
    {
        bool bInvalidPositionFound = false;
        for (int controlPointIndex = 0; controlPointIndex < controlPointsCount; controlPointIndex++) {
            glm::vec3 position = FbxDataConverter::ConvertPos(fbxMesh->GetControlPoints()[controlPointIndex]);
            if (Maths::ContainsNaN(position)) {
                bInvalidPositionFound = true;
                position = glm::vec3(0);
            }
            snapshot->positions[controlPointIndex] = position;
        }
        if (bInvalidPositionFound) {
            LOG_WARN(fmt::format("Position info for mesh {} contains NaN.", snapshot->name));
        }
    }

    // materials
    const int materialCount = node->GetMaterialCount();
    for (int materialIndex = 0; materialIndex < materialCount; materialIndex++) {
        FbxSurfaceMaterial* fbxMaterial = node->GetMaterial(materialIndex);
        if (!fbxMaterial) {
            snapshot->materials.push_back(nullptr);
            continue;
        }
        std::shared_ptr<MeshSnapshot::Material> material = std::make_shared<MeshSnapshot::Material>();
        material->name = ImporterHelper::MakeName(ImporterHelper::UTF8ToNative(fbxMaterial->GetName()));
        FbxProperty modelSpaceNormals = fbxMaterial->FindProperty("ModelSpaceNormals");
        material->bModelSpaceNormals = modelSpaceNormals.IsValid() && modelSpaceNormals.Get<FbxBool>();
        snapshot->materials.push_back(material);
    }
    FbxLayerElementMaterial* layerElementMaterial = baseLayer->GetMaterials();
    FbxLayerElement::EMappingMode materialMappingMode = layerElementMaterial ? layerElementMaterial->GetMappingMode() : FbxLayerElement::eByPolygon;

    // uv sets, duplicated names are removed
    std::vector<FbxLayerElementUV const*> layerElementUVs;
    {
        std::vector<std::string> UVSets;
        for (int UVLayerIndex = 0; UVLayerIndex < fbxMesh->GetLayerCount(); UVLayerIndex++) {
            FbxLayer* layer = fbxMesh->GetLayer(UVLayerIndex);
            FbxArray<FbxLayerElementUV const*> eleUVs = layer->GetUVSets();
            for (int UVIndex = 0; UVIndex < layer->GetUVSetCount(); UVIndex++) {
                FbxLayerElementUV const* elementUV = eleUVs[UVIndex];
                if (!elementUV) {
                    continue;
                }
                std::string localUVSetName = ImporterHelper::UTF8ToNative(elementUV->GetName());
                if (localUVSetName.empty()) {
                    localUVSetName = "UVmap_" + std::to_string(UVLayerIndex);
                }
                if (std::find(UVSets.begin(), UVSets.end(), localUVSetName) == UVSets.end()) {
                    UVSets.push_back(localUVSetName);
                    layerElementUVs.push_back(elementUV);
                }
            }
        }
    }

    FbxLayerElementSmoothing const* smoothingInfo = baseLayer->GetSmoothing();
    FbxLayerElement::EReferenceMode smoothingReferenceMode = smoothingInfo ? smoothingInfo->GetReferenceMode() : FbxLayerElement::eDirect;
    if (smoothingInfo && smoothingInfo->GetMappingMode() != FbxLayerElement::eByPolygon) {
        LOG_WARN(fmt::format("Mesh {} contains unsupported smoothing group info.", snapshot->name));
        smoothingInfo = nullptr;
    }

    FbxLayerElementNormal* layerElementNormal = baseLayer->GetNormals();
    FbxLayerElementVertexColor* layerElementVertexColor = baseLayer->GetVertexColors();

    const int polygonCount = fbxMesh->GetPolygonCount();
    snapshot->polygons.resize(polygonCount);
    snapshot->uvLayers.resize(layerElementUVs.size());
    for (int polygonIndex = 0; polygonIndex < polygonCount; polygonIndex++) {
        MeshSnapshot::Polygon& polygon = snapshot->polygons[polygonIndex];
        const int polygonSize = fbxMesh->GetPolygonSize(polygonIndex);

        polygon.bSmooth = layerElementNormal != nullptr;
        if (smoothingInfo) {
            int smoothingIndex = (smoothingReferenceMode == FbxLayerElement::eDirect) ? polygonIndex : smoothingInfo->GetIndexArray().GetAt(polygonIndex);
            polygon.bSmooth = polygon.bSmooth && smoothingInfo->GetDirectArray().GetAt(smoothingIndex) != 0;
        }

        polygon.materialIndex = 0;
        if (materialCount > 0 && layerElementMaterial) {
            int index = materialMappingMode == FbxLayerElement::eAllSame ? layerElementMaterial->GetIndexArray().GetAt(0) : layerElementMaterial->GetIndexArray().GetAt(polygonIndex);
            if (index >= 0 && index < materialCount) {
                polygon.materialIndex = index;
            } else {
                LOG_WARN(fmt::format("Inconsistent material index {:d} on polygon {:d} of mesh {}.", index, polygonIndex, snapshot->name));
            }
        }

        // newell normal, used for flat shading
        glm::vec3 faceNormal(0);
        for (int vertexIndex = 0; vertexIndex < polygonSize; vertexIndex++) {
            const glm::vec3& current = snapshot->positions[fbxMesh->GetPolygonVertex(polygonIndex, vertexIndex)];
            const glm::vec3& next = snapshot->positions[fbxMesh->GetPolygonVertex(polygonIndex, (vertexIndex + 1) % polygonSize)];
            faceNormal += glm::cross(current, next);
        }
        polygon.normal = Maths::IsNearlyZero(faceNormal, SMALL_NUMBER) ? glm::vec3(0, 0, 1) : glm::normalize(faceNormal);

        for (int vertexIndex = 0; vertexIndex < polygonSize; vertexIndex++) {
            const int loopIndex = static_cast<int>(snapshot->loops.size());
            const int controlPointIndex = fbxMesh->GetPolygonVertex(polygonIndex, vertexIndex);
            polygon.loops.push_back(loopIndex);

            MeshSnapshot::Loop loop;
            loop.vertexIndex = controlPointIndex;
            loop.normal = polygon.normal;
            if (layerElementNormal) {
                int normalMapIndex;
                switch (layerElementNormal->GetMappingMode()) {
                    case FbxLayerElement::eByControlPoint: normalMapIndex = controlPointIndex; break;
                    case FbxLayerElement::eByPolygon: normalMapIndex = polygonIndex; break;
                    case FbxLayerElement::eAllSame: normalMapIndex = 0; break;
                    default: normalMapIndex = loopIndex; break;
                }
                int normalValueIndex = (layerElementNormal->GetReferenceMode() == FbxLayerElement::eDirect) ? normalMapIndex : layerElementNormal->GetIndexArray().GetAt(normalMapIndex);
                glm::vec3 normal = FbxDataConverter::ConvertDir(layerElementNormal->GetDirectArray().GetAt(normalValueIndex));
                if (!Maths::IsNearlyZero(normal, SMALL_NUMBER)) {
                    loop.normal = glm::normalize(normal);
                }
            }
            snapshot->loops.push_back(loop);

            for (size_t UVLayerIndex = 0; UVLayerIndex < layerElementUVs.size(); UVLayerIndex++) {
                FbxLayerElementUV const* elementUV = layerElementUVs[UVLayerIndex];
                int UVMapIndex = (elementUV->GetMappingMode() == FbxLayerElement::eByControlPoint) ? controlPointIndex : loopIndex;
                int UVIndex = (elementUV->GetReferenceMode() == FbxLayerElement::eDirect) ? UVMapIndex : elementUV->GetIndexArray().GetAt(UVMapIndex);
                FbxVector2 UVVector = elementUV->GetDirectArray().GetAt(UVIndex);
                snapshot->uvLayers[UVLayerIndex].push_back(glm::vec2(static_cast<float>(UVVector[0]), static_cast<float>(UVVector[1])));
            }

            if (layerElementVertexColor) {
                int colorMapIndex = (layerElementVertexColor->GetMappingMode() == FbxLayerElement::eByControlPoint) ? controlPointIndex : loopIndex;
                int colorIndex = (layerElementVertexColor->GetReferenceMode() == FbxLayerElement::eDirect) ? colorMapIndex : layerElementVertexColor->GetIndexArray().GetAt(colorMapIndex);
                FbxColor vertexColor = layerElementVertexColor->GetDirectArray().GetAt(colorIndex);
                snapshot->colors.push_back(glm::vec4(float(vertexColor.mRed), float(vertexColor.mGreen), float(vertexColor.mBlue), float(vertexColor.mAlpha)));
            }
        }
    }

    ImportPolygonGroups(fbxMesh, *snapshot);

    if (layerElementNormal && !snapshot->uvLayers.empty()) {
        ComputeTangents(*snapshot);
    }

    LOG_DEBUG(fmt::format("Mesh {} imported: {:d} vertices, {:d} polygons, {:d} uv layers.", snapshot->name, snapshot->positions.size(), snapshot->polygons.size(), snapshot->uvLayers.size()));
    return snapshot;
}

void Scene::ComputeTangents(MeshSnapshot& snapshot) {
    MikkTSpace mikkTSpace(snapshot);

    SMikkTSpaceInterface mikkTInterface;
    mikkTInterface.m_getNormal = MikkGetNormal;
    mikkTInterface.m_getNumFaces = MikkGetNumFaces;
    mikkTInterface.m_getNumVerticesOfFace = MikkGetNumVertsOfFace;
    mikkTInterface.m_getPosition = MikkGetPosition;
    mikkTInterface.m_getTexCoord = MikkGetTexCoord;
    mikkTInterface.m_setTSpaceBasic = MikkSetTSpaceBasic;
    mikkTInterface.m_setTSpace = nullptr;

    SMikkTSpaceContext mikkTContext;
    mikkTContext.m_pInterface = &mikkTInterface;
    mikkTContext.m_pUserData = (void*)(&mikkTSpace);

    snapshot.bHasTangents = genTangSpaceDefault(&mikkTContext) != 0;
    if (!snapshot.bHasTangents) {
        LOG_WARN(fmt::format("Failed to compute tangent space of mesh {}.", snapshot.name));
    }
}

}}  // namespace Nif::Importer
