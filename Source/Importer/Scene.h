#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "fbxsdk.h"
#undef snprintf
#include "Armature.h"
#include "MeshSnapshot.h"
#include "NifMesh.h"
#include "NifMesh.private.h"

namespace Nif { namespace Importer {

/**
 * FBX basic data conversion class.
 */
class FbxDataConverter {
public:
    static glm::vec3 ConvertPos(FbxVector4 vector);
    static glm::vec3 ConvertDir(FbxVector4 vector);
    static glm::vec3 ConvertScale(FbxDouble3 vector);
    static glm::vec3 ConvertScale(FbxVector4 vector);
    static glm::mat4 ConvertMatrix(const FbxAMatrix& matrix);
};

class SceneInfo {
public:
    ~SceneInfo();

    FbxImporter* importer = nullptr;
    FbxScene* scene = nullptr;

    bool bIsCreateByBlender = false;

    std::string fileBasePath;
    std::string fileVersion;
    std::string lastSavedVendor;
    std::string lastSavedAppName;

    /** Every node carrying a mesh attribute, in scene order. */
    std::vector<FbxNode*> meshNodes;
};

class FbxArmature;

class Scene {
public:
    struct MeshEntry {
        std::shared_ptr<MeshSnapshot> snapshot;
        /** nullptr for a mesh without skin deformer. */
        std::shared_ptr<FbxArmature> armature;
    };

    explicit Scene(std::shared_ptr<SceneInfo> inSceneInfo) : sceneInfo(inSceneInfo) {}

    /** Converts one mesh node, nullptr if the node has no usable geometry. */
    std::shared_ptr<MeshEntry> ProcessMesh(FbxNode* node);

    FbxNode* GetRootSkeleton(FbxNode* link);

    FbxPose* RetrievePoseFromBindPose(FbxNode* node);

    void RecursiveBuildSkeleton(FbxNode* link, std::vector<FbxNode*>& outSortedLinks);

    std::shared_ptr<SceneInfo> GetSceneInfo() const { return sceneInfo; }

private:
    std::shared_ptr<MeshSnapshot> ImportMesh(FbxNode* node, FbxMesh* fbxMesh);

    void ImportPolygonGroups(FbxMesh* fbxMesh, MeshSnapshot& snapshot);

    std::vector<FbxCluster*> ImportVertexGroups(FbxMesh* fbxMesh, MeshSnapshot& snapshot);

    static void ComputeTangents(MeshSnapshot& snapshot);

    std::shared_ptr<SceneInfo> sceneInfo;
};

class ImporterHelper {
public:
    static std::string MakeName(const char* name);
    static std::string MakeName(const std::string& str);
    static std::string NativeToUTF8(const std::string& str);
    static std::string UTF8ToNative(const std::string& str);

    static bool IsMayaCompensationCluster(FbxCluster* cluster);
};

/**
 * Main importer, owns the fbx sdk manager.
 */
class Importer {
public:
    static std::shared_ptr<Importer> GetInstance();

    /** nullptr when the file cannot be opened or imported, errors are logged. */
    std::shared_ptr<SceneInfo> GetFileSceneInfo(const std::string& filename);

    virtual ~Importer();

    FbxManager* sdkManager = nullptr;

    std::shared_ptr<FbxGeometryConverter> geometryConverter;

protected:
    Importer();

    static std::shared_ptr<Importer> StaticInstance;
};

}}  // namespace Nif::Importer
