#include "Scene.h"
#include <algorithm>
#include <cstring>
#include <set>
#include "FbxArmature.h"
#include "Builder/MeshExporter.h"

namespace Nif { namespace Importer {

Importer::Importer() {
    sdkManager = FbxManager::Create();
    FbxIOSettings* ios = FbxIOSettings::Create(sdkManager, IOSROOT);
    sdkManager->SetIOSettings(ios);
    geometryConverter = std::make_shared<FbxGeometryConverter>(sdkManager);
}

Importer::~Importer() {
    geometryConverter = nullptr;
    if (sdkManager) {
        sdkManager->Destroy();
    }
    sdkManager = nullptr;
}

std::shared_ptr<Importer> Importer::StaticInstance = nullptr;

std::shared_ptr<Importer> Importer::GetInstance() {
    if (!StaticInstance) {
        struct make_shared_enabler : public Importer {};
        StaticInstance = std::make_shared<make_shared_enabler>();
    }
    return StaticInstance;
}

std::string ImporterHelper::MakeName(const char* name) {
    static const char specialChars[] = {'.', ',', '/', '`', '%', ':'};

    std::string result = name ? name : "";
    for (char& c : result) {
        if (std::find(std::begin(specialChars), std::end(specialChars), c) != std::end(specialChars)) {
            c = '_';
        }
    }
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    while (!result.empty() && result.front() == ' ') {
        result.erase(result.begin());
    }
    return result;
}

std::string ImporterHelper::MakeName(const std::string& str) { return MakeName(str.c_str()); }

std::string ImporterHelper::NativeToUTF8(const std::string& str) {
#if _WIN32
    char* u8cstr = nullptr;
    FbxAnsiToUTF8(str.c_str(), u8cstr);
    if (!u8cstr) {
        return str;
    }
    std::string u8str = u8cstr;
    FbxFree(u8cstr);
    return u8str;
#else
    return str;
#endif
}

std::string ImporterHelper::UTF8ToNative(const std::string& str) {
#if _WIN32
    char* ansiCstr = nullptr;
    FbxUTF8ToAnsi(str.c_str(), ansiCstr);
    if (!ansiCstr) {
        return str;
    }
    std::string ansiStr = ansiCstr;
    FbxFree(ansiCstr);
    return ansiStr;
#else
    return str;
#endif
}

bool ImporterHelper::IsMayaCompensationCluster(FbxCluster* cluster) {
    // Maya adds clusters with this user data to compensate inherited scale, they carry no skinning
    const char* userDataId = cluster->GetUserDataID();
    const char* userData = cluster->GetUserData();
    return userDataId && userData && strcmp(userDataId, "Maya_ClusterHint") == 0 && strcmp(userData, "CompensationCluster") == 0;
}

SceneInfo::~SceneInfo() {
    if (importer) {
        importer->Destroy();
        importer = nullptr;
    }
    if (scene) {
        scene->Destroy();
        scene = nullptr;
    }
}

std::shared_ptr<SceneInfo> Importer::GetFileSceneInfo(const std::string& filename) {
    int SDKMajor, SDKMinor, SDKRevision;
    std::shared_ptr<SceneInfo> result = std::make_shared<SceneInfo>();
    result->importer = FbxImporter::Create(sdkManager, "");

    FbxManager::GetFileFormatVersion(SDKMajor, SDKMinor, SDKRevision);

    const bool importSuccess = result->importer->Initialize(ImporterHelper::NativeToUTF8(filename).c_str());

    FbxIOFileHeaderInfo* fileHeaderInfo = result->importer->GetFileHeaderInfo();
    if (fileHeaderInfo) {
        // Blender writes "Blender (stable FBX IO) - 2.78 (sub 0) - 3.7.7", it is needed to skip the armature dummy
        // node above the root bone
        std::string creatorStr(fileHeaderInfo->mCreator.Buffer());
        if (creatorStr.rfind("Blender", 0) == 0) {
            result->bIsCreateByBlender = true;
        }
    }
    if (!importSuccess) {
        std::string detail = ImporterHelper::UTF8ToNative(result->importer->GetStatus().GetErrorString());
        LOG_ERROR(fmt::format("Cannot open fbx file {}: {}", filename, detail));
        if (result->importer->GetStatus().GetCode() == FbxStatus::eInvalidFileVersion) {
            LOG_ERROR(fmt::format("Fbx file version is not supported by fbx sdk {:d}.{:d}.{:d}.", SDKMajor, SDKMinor, SDKRevision));
        }
        return nullptr;
    }

    int fileMajor = 0, fileMinor = 0, fileRevision = 0;
    result->importer->GetFileVersion(fileMajor, fileMinor, fileRevision);
    result->fileVersion = fmt::format("{:d}.{:d}.{:d}", fileMajor, fileMinor, fileRevision);
    if ((fileMajor << 16 | fileMinor << 8 | fileRevision) != (SDKMajor << 16 | SDKMinor << 8 | SDKRevision)) {
        LOG_WARN(fmt::format("Fbx file version {} differs from fbx sdk version {:d}.{:d}.{:d}, the result may be unexpected.", result->fileVersion, SDKMajor, SDKMinor, SDKRevision));
    }

    const std::string::size_type separator = filename.find_last_of("/\\");
    result->fileBasePath = separator == std::string::npos ? "" : filename.substr(0, separator);

    result->scene = FbxScene::Create(sdkManager, "");
    LOG_INFO(fmt::format("Loading scene from {}.", filename));

    (*(result->importer->GetIOSettings())).SetBoolProp(IMP_FBX_MATERIAL, true);
    (*(result->importer->GetIOSettings())).SetBoolProp(IMP_FBX_TEXTURE, false);
    (*(result->importer->GetIOSettings())).SetBoolProp(IMP_FBX_LINK, true);
    (*(result->importer->GetIOSettings())).SetBoolProp(IMP_FBX_SHAPE, false);
    (*(result->importer->GetIOSettings())).SetBoolProp(IMP_FBX_GOBO, false);
    (*(result->importer->GetIOSettings())).SetBoolProp(IMP_FBX_ANIMATION, false);
    (*(result->importer->GetIOSettings())).SetBoolProp(IMP_SKINS, true);
    (*(result->importer->GetIOSettings())).SetBoolProp(IMP_DEFORMATION, true);
    (*(result->importer->GetIOSettings())).SetBoolProp(IMP_FBX_GLOBAL_SETTINGS, true);

    if (!result->importer->Import(result->scene)) {
        std::string errorMessage = ImporterHelper::UTF8ToNative(result->importer->GetStatus().GetErrorString());
        LOG_ERROR(fmt::format("Failed to load fbx scene: {}", errorMessage));
        return nullptr;
    }

    // bones and vertex groups are matched by name, node names have to be unique
    {
        std::set<std::string> allNodeName;
        int currentNameIndex = 1;
        for (int nodeIndex = 0; nodeIndex < result->scene->GetNodeCount(); nodeIndex++) {
            FbxNode* node = result->scene->GetNode(nodeIndex);
            std::string nodeName = ImporterHelper::MakeName(ImporterHelper::UTF8ToNative(node->GetName()));
            if (nodeName.empty()) {
                do {
                    nodeName = "ncl1_" + std::to_string(currentNameIndex++);
                } while (allNodeName.find(nodeName) != allNodeName.end());
                LOG_WARN(fmt::format("Unnamed node renamed to {}.", nodeName));
            }
            if (allNodeName.find(nodeName) != allNodeName.end()) {
                std::string uniqueNodeName;
                do {
                    uniqueNodeName = nodeName + std::to_string(currentNameIndex++);
                } while (allNodeName.find(uniqueNodeName) != allNodeName.end());
                LOG_WARN(fmt::format("Duplicated node name, renamed {} -> {}.", nodeName, uniqueNodeName));
                nodeName = uniqueNodeName;
            }
            node->SetName(ImporterHelper::NativeToUTF8(nodeName).c_str());
            allNodeName.insert(nodeName);

            FbxNodeAttribute* attr = node->GetNodeAttribute();
            if (attr && attr->GetAttributeType() == FbxNodeAttribute::eMesh) {
                result->meshNodes.push_back(node);
            }
        }
    }

    FbxDocumentInfo* docInfo = result->scene->GetSceneInfo();
    if (docInfo) {
        result->lastSavedVendor = ImporterHelper::UTF8ToNative(docInfo->LastSaved_ApplicationVendor.Get().Buffer());
        result->lastSavedAppName = ImporterHelper::UTF8ToNative(docInfo->LastSaved_ApplicationName.Get().Buffer());
    }

    LOG_INFO(fmt::format("Fbx scene loaded, {:d} mesh nodes.", result->meshNodes.size()));
    return result;
}

glm::vec3 FbxDataConverter::ConvertPos(FbxVector4 vector) {
    glm::vec3 out;
    out.x = (float)(vector[0]);
    out.y = (float)(vector[1]);
    out.z = (float)(vector[2]);
    return out;
}

glm::vec3 FbxDataConverter::ConvertDir(FbxVector4 vector) {
    glm::vec3 out;
    out[0] = (float)(vector[0]);
    out[1] = (float)(vector[1]);
    out[2] = (float)(vector[2]);
    return out;
}

glm::vec3 FbxDataConverter::ConvertScale(FbxDouble3 vector) { return glm::vec3((float)vector[0], (float)vector[1], (float)vector[2]); }

glm::vec3 FbxDataConverter::ConvertScale(FbxVector4 vector) { return glm::vec3((float)vector[0], (float)vector[1], (float)vector[2]); }

glm::mat4 FbxDataConverter::ConvertMatrix(const FbxAMatrix& matrix) {
    glm::mat4 out;
    // fbx rows hold the basis vectors, which are glm columns
    for (int i = 0; i < 4; ++i) {
        const FbxVector4 row = matrix.GetRow(i);
        out[i][0] = (float)(row[0]);
        out[i][1] = (float)(row[1]);
        out[i][2] = (float)(row[2]);
        out[i][3] = (float)(row[3]);
    }
    return out;
}

}}  // namespace Nif::Importer

namespace Nif {

std::vector<std::shared_ptr<Assets::TriShapeAsset>> ExportFbx(const std::string& filePath, std::shared_ptr<Options> options) {
    std::vector<std::shared_ptr<Assets::TriShapeAsset>> shapes;
    std::shared_ptr<Importer::SceneInfo> sceneInfo = Importer::Importer::GetInstance()->GetFileSceneInfo(filePath);
    if (!sceneInfo) {
        LOG_ERROR(fmt::format("Nothing exported from {}.", filePath));
        return shapes;
    }

    Importer::Scene scene(sceneInfo);
    for (FbxNode* meshNode : sceneInfo->meshNodes) {
        const std::string nodeName = Importer::ImporterHelper::MakeName(meshNode->GetName());
        try {
            std::shared_ptr<Importer::Scene::MeshEntry> entry = scene.ProcessMesh(meshNode);
            if (!entry) {
                continue;
            }
            std::vector<std::shared_ptr<Assets::TriShapeAsset>> meshShapes = Builder::MeshExporter::Export(*entry->snapshot, entry->armature, options);
            shapes.insert(shapes.end(), meshShapes.begin(), meshShapes.end());
        } catch (const ExportException& e) {
            LOG_ERROR(fmt::format("Mesh {} skipped, {}: {} [{}]", nodeName, ExportException::GetKindName(e.kind), e.message, Utils::Join(e.offendingIndices, ", ")));
        } catch (const AssertException& e) {
            LOG_ERROR(fmt::format("Mesh {} skipped: {}", nodeName, e.message));
        }
    }
    return shapes;
}

}  // namespace Nif
