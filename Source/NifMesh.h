#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <iostream>

#pragma warning(disable : 4251)
#pragma warning(disable : 4275)

#ifdef _WIN32
#ifdef NIF_DLL
#define NIF_PORT __declspec(dllexport)
#else
#define NIF_PORT __declspec(dllimport)
#endif
#else
#if __has_attribute(visibility)
#define NIF_PORT __attribute__((visibility("default")))
#else
#define NIF_PORT
#endif
#endif

namespace Nif {

namespace Configuration {
NIF_PORT extern float VertexComparsionThreshold;
NIF_PORT extern float WeightLossThreshold;
NIF_PORT extern uint32_t DefaultBonesPerPartition;
NIF_PORT extern uint32_t DefaultBonesPerVertex;

/** Format limits, shared by the vertex and the triangle buffer of one material group. */
constexpr uint32_t MaxVertexCount = 65535;
constexpr uint32_t MaxTriangleCount = 65535;

/** Partition bone indices are stored in one byte. */
constexpr uint32_t MaxBonesPerPartition = 256;
}  // namespace Configuration

enum class NIF_PORT EGameProfile {
    Morrowind = 0,
    Oblivion,
    Fallout3,
    Skyrim,
    CivilizationIV,
    SidMeiersRailroads,
    EmpireEarth2,
    Divinity2,
};

class NIF_PORT Options {
public:
    enum class NIF_PORT EWeightFitPolicy {
        /** Discarded weight mass is spread over the retained weights, so they sum to one again. */
        Redistribute = 0,
        /** Discarded weight mass is dropped. */
        Truncate,
    };

    enum class NIF_PORT ETangentOutput {
        /** Binary extra data on Oblivion, extra vertex arrays elsewhere. */
        Auto = 0,
        Arrays,
        BinaryBlob,
    };

    EGameProfile game = EGameProfile::Oblivion;

    /** Threshold to compare uv, normal and color equality of two face corners. */
    float epsilon = Configuration::VertexComparsionThreshold;

    /** Lost weight above this value is reported after partitioning. */
    float weightLossThreshold = Configuration::WeightLossThreshold;

    uint32_t maxBonesPerPartition = Configuration::DefaultBonesPerPartition;

    uint32_t maxBonesPerVertex = Configuration::DefaultBonesPerVertex;

    bool bPadBones = false;

    EWeightFitPolicy weightFitPolicy = EWeightFitPolicy::Redistribute;

    bool bExportTangents = true;

    ETangentOutput tangentOutput = ETangentOutput::Auto;

    /** Node used as skeleton root, the armature name when empty. */
    std::string skeletonRootName = "";

    std::string sceneRootName = "";

    /** Body part tags listed here get their partitions first, in this order. */
    std::vector<int> bodyPartOrder;

    /** Run the material groups of one mesh on worker threads. */
    bool bParallelMaterialGroups = false;

    void Validate() const;
};

namespace GameProfile {
NIF_PORT std::string GetName(EGameProfile game);
NIF_PORT bool FromName(const std::string& name, EGameProfile& outGame);
/** 0 when the profile has no recommendation. */
NIF_PORT uint32_t GetRecommendedBonesPerPartition(EGameProfile game);
NIF_PORT bool MaximizesBoneSharing(EGameProfile game);
NIF_PORT bool SupportsBodyParts(EGameProfile game);
NIF_PORT bool SupportsMultipleUVLayers(EGameProfile game);
NIF_PORT bool SupportsTangentSpace(EGameProfile game);
NIF_PORT uint16_t GetDefaultShapeFlags(EGameProfile game, const std::string& shapeName, bool bDisplayAsWire);
}  // namespace GameProfile

namespace Types {

struct NIF_PORT Vector2 {
    Vector2() = default;
    Vector2(float x, float y);
    float x;
    float y;
};

struct NIF_PORT Vector3 {
    Vector3() = default;
    Vector3(float x, float y, float z);
    float x;
    float y;
    float z;
};

struct NIF_PORT Vector4 {
    Vector4() = default;
    Vector4(float x, float y, float z, float w);
    float x;
    float y;
    float z;
    float w;
};

/** Column major, same layout as glm::mat4. */
struct NIF_PORT Matrix4 {
    float data[16];
};

struct NIF_PORT Triangle {
    uint16_t v1;
    uint16_t v2;
    uint16_t v3;
};

}  // namespace Types

namespace Assets {

class NIF_PORT Asset {
public:
    std::string name;
};

class NIF_PORT SkinPartitionAsset {
public:
    /** Indices into SkinAsset::bones. */
    std::vector<uint16_t> bones;
    /** Partition vertex -> shape vertex. */
    std::vector<uint16_t> vertexMap;
    /** numWeightsPerVertex slots per partition vertex. */
    std::vector<std::vector<float>> vertexWeights;
    /** Indices into this partition's bone table, parallel to vertexWeights. */
    std::vector<std::vector<uint8_t>> boneIndices;
    /** Partition local vertex indices. */
    std::vector<Types::Triangle> triangles;
    uint32_t numWeightsPerVertex = 0;
    int bodyPart = 0;
};

class NIF_PORT SkinAsset : public Asset {
public:
    struct NIF_PORT Bone {
        std::string name;
        Types::Matrix4 skinTransform;
        Types::Vector3 boundingSphereOffset;
        float boundingSphereRadius = 0.f;
        std::vector<std::pair<uint16_t, float>> vertexWeights;
    };

public:
    std::string skeletonRoot;
    std::string sceneRoot;
    Types::Matrix4 overallTransform;
    std::vector<Bone> bones;
    std::vector<SkinPartitionAsset> partitions;
    /** Set when the shape carries body part tags (dismember skin instance). */
    bool bHasBodyParts = false;
    float lostWeight = 0.f;
};

class NIF_PORT TriShapeAsset : public Asset {
public:
    int materialIndex = 0;
    std::string materialName;
    uint16_t flags = 0;
    std::vector<Types::Vector3> positions;
    std::vector<Types::Vector3> normals;
    std::vector<Types::Vector4> colors;
    /** One array per uv layer, V already flipped. */
    std::vector<std::vector<Types::Vector2>> uvSets;
    std::vector<Types::Vector3> tangents;
    std::vector<Types::Vector3> bitangents;
    uint16_t extraVectorsFlags = 0;
    std::string tangentBlobName;
    std::vector<uint8_t> tangentBlob;
    std::vector<Types::Triangle> triangles;
    /** Body part tag of every triangle. */
    std::vector<int> triangleBodyParts;
    std::shared_ptr<SkinAsset> skin = nullptr;
};

}  // namespace Assets

namespace Utils {
enum class NIF_PORT ELogLevel {
    Info,
    Error,
    Warn,
    Critical,
    Debug,
};

std::function<void(ELogLevel, std::string)> NIF_PORT GetDefaultLogger(const std::string& logFilePath);

std::function<void(ELogLevel, std::string)> NIF_PORT GetGlobalLogger();

void NIF_PORT SetGlobalLogger(std::function<void(ELogLevel, std::string)> logger);

}  // namespace Utils

class NIF_PORT AssertException : public std::exception {
public:
    AssertException(const std::string& msg);

    virtual const char* what() const throw();

    const std::string message;
};

class NIF_PORT ExportException : public std::exception {
public:
    enum class NIF_PORT EErrorKind {
        CapacityExceeded,
        MissingSkeletonRoot,
        UnweightedVertex,
        UnassignedBodyPart,
        TangentCountMismatch,
        UnsupportedGeometry,
        MissingBone,
        InvalidOptions,
    };

    ExportException(EErrorKind inKind, const std::string& msg, const std::vector<int>& inOffending = {});

    virtual const char* what() const throw();

    static std::string GetKindName(EErrorKind kind);

    const EErrorKind kind;
    const std::string message;
    /** Every offending source vertex or polygon, sorted. */
    const std::vector<int> offendingIndices;
};

/**
 * Loads an fbx file and exports every mesh node into shapes. Meshes failing with an ExportException are logged and skipped.
 */
std::vector<std::shared_ptr<Assets::TriShapeAsset>> NIF_PORT ExportFbx(const std::string& filePath, std::shared_ptr<Options> options);

}  // namespace Nif
