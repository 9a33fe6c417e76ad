#include "MeshExporter.h"
#include <future>
#include <mutex>
#include "BindPoseSolver.h"
#include "SkinPartitioner.h"
#include "SkinWeightBuilder.h"
#include "TangentSpaceBuilder.h"
#include "Triangulator.h"

namespace Nif { namespace Builder {

std::vector<std::shared_ptr<Assets::TriShapeAsset>> MeshExporter::Export(const Importer::MeshSnapshot& snapshot, std::shared_ptr<Importer::Armature> armature, std::shared_ptr<Options> options) {
    ASSERT(options != nullptr);
    options->Validate();

    std::vector<std::shared_ptr<Assets::TriShapeAsset>> shapes;
    if (snapshot.positions.empty()) {
        LOG_WARN(fmt::format("Mesh {} has no vertices, skipped.", snapshot.name));
        return shapes;
    }

    // report every unassigned polygon of the mesh at once, not only those of the first failing group
    if (GameProfile::SupportsBodyParts(options->game) && snapshot.bHasBodyParts) {
        CheckBodyParts(snapshot, -1);
    }

    // if mesh has no materials, every polygon goes into a single group
    std::vector<int> materialIndices;
    if (snapshot.materials.empty()) {
        materialIndices.push_back(-1);
    } else {
        for (int materialIndex = 0; materialIndex < static_cast<int>(snapshot.materials.size()); materialIndex++) {
            materialIndices.push_back(materialIndex);
        }
    }

    std::vector<std::shared_ptr<Assets::TriShapeAsset>> groupShapes;
    if (options->bParallelMaterialGroups && materialIndices.size() > 1) {
        // the snapshot is only read, armature access is serialized on its pose mutex
        std::vector<std::future<std::shared_ptr<Assets::TriShapeAsset>>> futures;
        for (const int materialIndex : materialIndices) {
            futures.push_back(std::async(std::launch::async, [&snapshot, materialIndex, armature, options]() { return ExportMaterialGroup(snapshot, materialIndex, armature, *options); }));
        }
        // wait for all groups before rethrowing, workers reference the snapshot
        for (auto& future : futures) {
            future.wait();
        }
        for (auto& future : futures) {
            groupShapes.push_back(future.get());
        }
    } else {
        for (const int materialIndex : materialIndices) {
            groupShapes.push_back(ExportMaterialGroup(snapshot, materialIndex, armature, *options));
        }
    }

    for (auto& shape : groupShapes) {
        if (shape) {
            shapes.push_back(shape);
        }
    }
    LOG_INFO(fmt::format("Exported mesh {} into {:d} shapes.", snapshot.name, shapes.size()));
    return shapes;
}

void MeshExporter::CheckBodyParts(const Importer::MeshSnapshot& snapshot, int materialIndex) {
    std::vector<int> polygonsWithoutBodyPart;
    for (int polygonIndex = 0; polygonIndex < static_cast<int>(snapshot.polygons.size()); polygonIndex++) {
        const Importer::MeshSnapshot::Polygon& polygon = snapshot.polygons[polygonIndex];
        if (materialIndex >= 0 && polygon.materialIndex != materialIndex) {
            continue;
        }
        if (polygon.loops.size() >= 3 && polygon.bodyPart < 0) {
            polygonsWithoutBodyPart.push_back(polygonIndex);
        }
    }
    if (!polygonsWithoutBodyPart.empty()) {
        throw ExportException(ExportException::EErrorKind::UnassignedBodyPart,
                              fmt::format("Mesh {} has {:d} polygons not assigned to any body part: {}", snapshot.name, polygonsWithoutBodyPart.size(), Utils::Join(polygonsWithoutBodyPart, ", ")), polygonsWithoutBodyPart);
    }
}

std::shared_ptr<Assets::TriShapeAsset> MeshExporter::ExportMaterialGroup(const Importer::MeshSnapshot& snapshot, int materialIndex, std::shared_ptr<Importer::Armature> armature, const Options& options) {
    std::shared_ptr<Importer::MeshSnapshot::Material> material = nullptr;
    if (materialIndex >= 0) {
        ASSERT(materialIndex < static_cast<int>(snapshot.materials.size()));
        material = snapshot.materials[materialIndex];
    }

    // normals are only needed for lighting, skyrim model space normal maps replace them
    bool bHasNormals = material != nullptr;
    if (material && options.game == EGameProfile::Skyrim && material->bModelSpaceNormals) {
        bHasNormals = false;
    }

    const size_t numUVLayers = snapshot.uvLayers.size();
    if (numUVLayers > 1 && !GameProfile::SupportsMultipleUVLayers(options.game)) {
        throw ExportException(ExportException::EErrorKind::UnsupportedGeometry, fmt::format("{} does not support multiple UV layers, mesh {} has {:d}.", GameProfile::GetName(options.game), snapshot.name, numUVLayers));
    }
    const bool bHasColors = snapshot.HasVertexColors();
    const bool bUseTangents = options.bExportTangents && bHasNormals && numUVLayers > 0 && snapshot.bHasTangents && GameProfile::SupportsTangentSpace(options.game);
    const bool bUseBodyParts = GameProfile::SupportsBodyParts(options.game) && snapshot.bHasBodyParts;
    const bool bMirrored = Triangulator::IsMirrored(snapshot.scale);
    if (bUseBodyParts) {
        CheckBodyParts(snapshot, materialIndex);
    }

    CornerWelder welder(options.epsilon, snapshot.positions.size());
    std::vector<Types::Triangle> triangles;
    std::vector<int> triangleBodyParts;

    std::vector<FaceCorner> corners;
    std::vector<uint16_t> cornerIndices;
    for (int polygonIndex = 0; polygonIndex < static_cast<int>(snapshot.polygons.size()); polygonIndex++) {
        const Importer::MeshSnapshot::Polygon& polygon = snapshot.polygons[polygonIndex];
        if (materialIndex >= 0 && polygon.materialIndex != materialIndex) {
            continue;
        }
        if (polygon.loops.size() < 3) {
            continue;
        }

        const int bodyPart = bUseBodyParts ? polygon.bodyPart : 0;

        corners.clear();
        for (const int loopIndex : polygon.loops) {
            ASSERT(loopIndex >= 0 && loopIndex < static_cast<int>(snapshot.loops.size()));
            const Importer::MeshSnapshot::Loop& loop = snapshot.loops[loopIndex];
            FaceCorner corner;
            corner.sourceIndex = loop.vertexIndex;
            ASSERT(loop.vertexIndex >= 0 && loop.vertexIndex < static_cast<int>(snapshot.positions.size()));
            corner.position = snapshot.positions[loop.vertexIndex];
            // smooth = vertex normal, non-smooth = face normal
            if (bHasNormals) {
                corner.normal = polygon.bSmooth ? loop.normal : polygon.normal;
            }
            for (size_t layer = 0; layer < numUVLayers; layer++) {
                corner.uvs.push_back(snapshot.uvLayers[layer][loopIndex]);
            }
            if (bHasColors) {
                corner.color = snapshot.colors[loopIndex];
            }
            if (bUseTangents) {
                corner.tangent = loop.tangent;
                corner.bitangentSign = loop.bitangentSign;
            }
            corners.push_back(corner);
        }

        if (!welder.AddPolygon(corners, cornerIndices)) {
            continue;
        }
        const int numAdded = Triangulator::FanPolygon(cornerIndices, bMirrored, triangles);
        triangleBodyParts.insert(triangleBodyParts.end(), numAdded, bodyPart);
    }

    const std::vector<WeldedVertex>& vertices = welder.GetVertices();
    if (vertices.empty()) {
        LOG_WARN(fmt::format("Material group {:d} of mesh {} has no vertices, skipped.", materialIndex, snapshot.name));
        return nullptr;
    }

    std::shared_ptr<Assets::TriShapeAsset> shape = std::make_shared<Assets::TriShapeAsset>();
    shape->name = "Tri " + snapshot.name;
    // multi material meshes: add material index
    if (snapshot.materials.size() > 1) {
        shape->name = fmt::format("{}: {:d}", shape->name, materialIndex);
    }
    shape->materialIndex = Maths::Max(materialIndex, 0);
    shape->materialName = material ? material->name : "";
    shape->flags = GameProfile::GetDefaultShapeFlags(options.game, shape->name, snapshot.bDisplayAsWire);

    std::vector<glm::vec3> positions;
    for (const WeldedVertex& vertex : vertices) {
        positions.push_back(vertex.position);
        Types::Vector3 position;
        shape->positions.push_back(Types::ConvertFromGLM(position, vertex.position));
        if (bHasNormals) {
            Types::Vector3 normal;
            shape->normals.push_back(Types::ConvertFromGLM(normal, *vertex.normal));
        }
        if (bHasColors) {
            Types::Vector4 color;
            shape->colors.push_back(Types::ConvertFromGLM(color, *vertex.color));
        }
    }
    shape->uvSets.resize(numUVLayers);
    for (size_t layer = 0; layer < numUVLayers; layer++) {
        for (const WeldedVertex& vertex : vertices) {
            // flip V to the target texture convention
            shape->uvSets[layer].push_back(Types::Vector2(vertex.uvs[layer].x, 1.f - vertex.uvs[layer].y));
        }
    }
    shape->triangles = triangles;
    shape->triangleBodyParts = triangleBodyParts;

    if (bUseTangents) {
        std::vector<glm::vec3> normals, tangents, outTangents, outBitangents;
        std::vector<float> bitangentSigns;
        for (const WeldedVertex& vertex : vertices) {
            normals.push_back(*vertex.normal);
            tangents.push_back(vertex.tangent ? *vertex.tangent : glm::vec3(0));
            bitangentSigns.push_back(vertex.bitangentSign ? *vertex.bitangentSign : 1.f);
        }
        TangentSpaceBuilder::ConvertTangents(normals, tangents, bitangentSigns, vertices.size(), outTangents, outBitangents);
        TangentSpaceBuilder::Apply(*shape, outTangents, outBitangents, options);
    }

    if (armature) {
        ExportSkin(*shape, snapshot, positions, welder.GetSourceVertexMap(), *armature, bUseBodyParts, options);
    }
    return shape;
}

void MeshExporter::ExportSkin(Assets::TriShapeAsset& shape, const Importer::MeshSnapshot& snapshot, const std::vector<glm::vec3>& positions, const SourceVertexMap& vertexMap, Importer::Armature& armature, bool bUseBodyParts, const Options& options) {
    std::vector<std::string> boneNames;
    {
        std::lock_guard<std::mutex> lock(armature.GetPoseMutex());
        boneNames = armature.GetBoneNames();
    }
    const std::vector<std::string> influencingBones = SkinWeightBuilder::GetInfluencingBones(snapshot, boneNames);
    if (influencingBones.empty()) {
        return;
    }

    const SkinWeights weights = SkinWeightBuilder::Build(snapshot, vertexMap, positions.size(), influencingBones);
    const BindPose bindPose = BindPoseSolver::Solve(snapshot, armature, weights.boneNames, options);

    std::shared_ptr<Assets::SkinAsset> skin = std::make_shared<Assets::SkinAsset>();
    skin->name = shape.name;
    skin->skeletonRoot = bindPose.skeletonRoot;
    skin->sceneRoot = bindPose.sceneRoot;
    skin->bHasBodyParts = bUseBodyParts;
    Types::ConvertFromGLM(skin->overallTransform, bindPose.overallTransform);
    for (size_t boneIndex = 0; boneIndex < weights.boneNames.size(); boneIndex++) {
        Assets::SkinAsset::Bone bone;
        bone.name = weights.boneNames[boneIndex];
        Types::ConvertFromGLM(bone.skinTransform, bindPose.boneTransforms[boneIndex]);
        bone.vertexWeights = weights.boneVertexWeights[boneIndex];
        skin->bones.push_back(bone);
    }

    // warn on bad config settings
    if (options.game == EGameProfile::Oblivion && options.bPadBones) {
        LOG_WARN("Using pad bones on Oblivion export. Disable the pad bones option to get higher quality skin partitions.");
    }
    const uint32_t recommendedBones = GameProfile::GetRecommendedBonesPerPartition(options.game);
    if (recommendedBones > 0) {
        if (options.maxBonesPerPartition < recommendedBones) {
            LOG_WARN(fmt::format("Using less than {:d} bones per partition on {} export. Set it to {:d} to get higher quality skin partitions.", recommendedBones, GameProfile::GetName(options.game), recommendedBones));
        } else if (options.maxBonesPerPartition > recommendedBones) {
            LOG_WARN(fmt::format("Using more than {:d} bones per partition on {} export. This may cause issues in-game.", recommendedBones, GameProfile::GetName(options.game)));
        }
    }

    PartitionSettings settings(options);
    if (settings.bodyPartOrder.empty()) {
        settings.bodyPartOrder = snapshot.bodyPartOrder;
    }
    const SkinPartitioner partitioner(settings);
    PartitionResult partitionResult = partitioner.Build(shape.triangles, shape.triangleBodyParts, weights.vertexInfluences, static_cast<int>(skin->bones.size()));
    skin->partitions = partitionResult.partitions;
    skin->lostWeight = partitionResult.lostWeight;
    if (partitionResult.lostWeight > options.weightLossThreshold) {
        LOG_WARN(fmt::format("Lost {:f} in vertex weights while creating a skin partition for mesh {} (shape {}).", partitionResult.lostWeight, snapshot.name, shape.name));
    }

    // bone vertex lists follow the fitted weights, zero weights and shed weights are gone from the partitions too
    for (auto& bone : skin->bones) {
        bone.vertexWeights.clear();
    }
    for (size_t vertexIndex = 0; vertexIndex < partitionResult.fittedInfluences.size(); vertexIndex++) {
        for (const auto& influence : partitionResult.fittedInfluences[vertexIndex]) {
            skin->bones[influence.first].vertexWeights.emplace_back(static_cast<uint16_t>(vertexIndex), influence.second);
        }
    }

    for (size_t boneIndex = 0; boneIndex < skin->bones.size(); boneIndex++) {
        Assets::SkinAsset::Bone& bone = skin->bones[boneIndex];
        glm::vec3 center;
        BindPoseSolver::ComputeBoundingSphere(positions, bone.vertexWeights, bindPose.boneTransforms[boneIndex], center, bone.boundingSphereRadius);
        Types::ConvertFromGLM(bone.boundingSphereOffset, center);
    }

    shape.skin = skin;
}

}}  // namespace Nif::Builder
