#include "SkinPartitioner.h"
#include <algorithm>
#include <map>
#include <set>

namespace Nif { namespace Builder {

namespace {

size_t CountNewBones(const std::vector<int>& bones, const std::vector<int>& toAdd) {
    size_t count = 0;
    for (const int bone : toAdd) {
        if (std::find(bones.begin(), bones.end(), bone) == bones.end()) {
            count++;
        }
    }
    return count;
}

void MergeBones(std::vector<int>& bones, const std::vector<int>& toAdd) {
    for (const int bone : toAdd) {
        if (std::find(bones.begin(), bones.end(), bone) == bones.end()) {
            bones.push_back(bone);
        }
    }
    std::sort(bones.begin(), bones.end());
}

std::vector<uint16_t> GetDistinctCorners(const Types::Triangle& triangle) {
    std::vector<uint16_t> corners = {triangle.v1};
    if (triangle.v2 != triangle.v1) {
        corners.push_back(triangle.v2);
    }
    if (triangle.v3 != triangle.v1 && triangle.v3 != triangle.v2) {
        corners.push_back(triangle.v3);
    }
    return corners;
}

struct PartitionBuild {
    int bodyPart = 0;
    std::vector<int> bones;
    std::vector<int> faces;
};

}  // namespace

PartitionSettings::PartitionSettings(const Options& options)
    : maxBonesPerPartition(options.maxBonesPerPartition),
      maxBonesPerVertex(options.maxBonesPerVertex),
      bPadBones(options.bPadBones),
      weightFitPolicy(options.weightFitPolicy),
      bMaximizeBoneSharing(GameProfile::MaximizesBoneSharing(options.game)),
      bodyPartOrder(options.bodyPartOrder) {}

// Fill patches so every triangle belongs to exactly one island. Two triangles are connected when they share an edge
// (two vertex indices), a shared single vertex (bowtie) is not enough.
std::vector<std::vector<int>> PolygonShellsHelper::FillPolygonPatches(const std::vector<Types::Triangle>& triangles, const std::vector<int>& faceIndices) {
    const int numFace = static_cast<int>(faceIndices.size());

    // Store a map containing connected faces for each vertex index
    std::map<int, std::vector<int>> vertexIndexToAdjacentFaces;
    for (int localFace = 0; localFace < numFace; ++localFace) {
        ASSERT(faceIndices[localFace] >= 0 && faceIndices[localFace] < static_cast<int>(triangles.size()));
        for (const uint16_t vertexIndex : GetDistinctCorners(triangles[faceIndices[localFace]])) {
            vertexIndexToAdjacentFaces[vertexIndex].push_back(localFace);
        }
    }

    std::vector<std::vector<int>> patches;
    // Mark added face so we do not add them more then once
    std::vector<bool> faceAdded(numFace, false);
    std::vector<int> triangleQueue;
    for (int localFace = 0; localFace < numFace; ++localFace) {
        if (faceAdded[localFace]) {
            continue;
        }
        std::vector<int> patch;
        triangleQueue.clear();
        triangleQueue.push_back(localFace);
        faceAdded[localFace] = true;
        while (!triangleQueue.empty()) {
            const int currentFace = triangleQueue.back();
            triangleQueue.pop_back();
            patch.push_back(faceIndices[currentFace]);

            std::map<int, int> adjacentFaceCommonVertices;
            for (const uint16_t vertexIndex : GetDistinctCorners(triangles[faceIndices[currentFace]])) {
                for (const int adjacentFace : vertexIndexToAdjacentFaces[vertexIndex]) {
                    if (faceAdded[adjacentFace] || adjacentFace == currentFace) {
                        continue;
                    }
                    int& commonVertexCount = adjacentFaceCommonVertices[adjacentFace];
                    commonVertexCount++;
                    if (commonVertexCount > 1) {
                        triangleQueue.push_back(adjacentFace);
                        faceAdded[adjacentFace] = true;
                    }
                }
            }
        }
        // keep the source order inside one patch
        std::sort(patch.begin(), patch.end());
        patches.push_back(patch);
    }
    return patches;
}

std::vector<int> PolygonShellsHelper::GatherShellUsingSameBones(const int parentPatchIndex, const std::vector<std::vector<int>>& patchBones, std::vector<bool>& patchConsumed, const uint32_t maxBones) {
    ASSERT(parentPatchIndex >= 0 && parentPatchIndex < static_cast<int>(patchBones.size()));
    std::vector<int> children;
    std::vector<int> uniqueBones = patchBones[parentPatchIndex];
    if (uniqueBones.size() > maxBones) {
        return children;
    }
    for (int patchIndex = parentPatchIndex + 1; patchIndex < static_cast<int>(patchBones.size()); ++patchIndex) {
        if (patchConsumed[patchIndex]) {
            continue;
        }
        if (uniqueBones.size() + CountNewBones(uniqueBones, patchBones[patchIndex]) <= maxBones) {
            MergeBones(uniqueBones, patchBones[patchIndex]);
            patchConsumed[patchIndex] = true;
            children.push_back(patchIndex);
        }
    }
    return children;
}

SkinPartitioner::SkinPartitioner(const PartitionSettings& inSettings) : settings(inSettings) {}

float SkinPartitioner::FitVertexWeights(std::vector<std::pair<int, float>>& vertexInfluences, uint32_t maxBonesPerVertex, Options::EWeightFitPolicy policy) {
    std::sort(vertexInfluences.begin(), vertexInfluences.end(), [](const std::pair<int, float>& a, const std::pair<int, float>& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });

    float keptWeight = 0.f;
    float lostWeight = 0.f;
    std::vector<std::pair<int, float>> fitted;
    for (size_t i = 0; i < vertexInfluences.size(); i++) {
        const std::pair<int, float>& influence = vertexInfluences[i];
        if (fitted.size() < maxBonesPerVertex && influence.second > 0.f) {
            fitted.push_back(influence);
            keptWeight += influence.second;
        } else {
            lostWeight += Maths::Max(influence.second, 0.f);
        }
    }
    if (policy == Options::EWeightFitPolicy::Redistribute && lostWeight > 0.f && keptWeight > 0.f) {
        const float scale = (keptWeight + lostWeight) / keptWeight;
        for (auto& influence : fitted) {
            influence.second *= scale;
        }
    }
    vertexInfluences = fitted;
    return lostWeight;
}

std::vector<int> SkinPartitioner::CollectTriangleBones(const Types::Triangle& triangle, const VertexInfluences& influences) {
    std::vector<int> bones;
    for (const uint16_t vertexIndex : GetDistinctCorners(triangle)) {
        ASSERT(vertexIndex < influences.size());
        for (const auto& influence : influences[vertexIndex]) {
            if (std::find(bones.begin(), bones.end(), influence.first) == bones.end()) {
                bones.push_back(influence.first);
            }
        }
    }
    std::sort(bones.begin(), bones.end());
    return bones;
}

float SkinPartitioner::FitTriangleBones(const Types::Triangle& triangle, VertexInfluences& influences) const {
    float lostWeight = 0.f;
    const std::vector<uint16_t> corners = GetDistinctCorners(triangle);
    while (CollectTriangleBones(triangle, influences).size() > settings.maxBonesPerPartition) {
        std::map<int, float> boneWeights;
        std::set<int> soleBones;
        for (const uint16_t vertexIndex : corners) {
            if (influences[vertexIndex].size() == 1) {
                soleBones.insert(influences[vertexIndex][0].first);
            }
            for (const auto& influence : influences[vertexIndex]) {
                boneWeights[influence.first] += influence.second;
            }
        }

        // a bone carrying a vertex alone can never be removed, at most 3 such bones exist
        int removedBone = -1;
        float removedBoneWeight = 0.f;
        for (const auto& item : boneWeights) {
            if (soleBones.count(item.first) > 0) {
                continue;
            }
            if (removedBone < 0 || item.second < removedBoneWeight) {
                removedBone = item.first;
                removedBoneWeight = item.second;
            }
        }
        ASSERT(removedBone >= 0);

        for (const uint16_t vertexIndex : corners) {
            std::vector<std::pair<int, float>>& vertexInfluences = influences[vertexIndex];
            auto found = std::find_if(vertexInfluences.begin(), vertexInfluences.end(), [removedBone](const std::pair<int, float>& influence) { return influence.first == removedBone; });
            if (found == vertexInfluences.end()) {
                continue;
            }
            const float removedWeight = found->second;
            vertexInfluences.erase(found);
            lostWeight += removedWeight;

            if (settings.weightFitPolicy == Options::EWeightFitPolicy::Redistribute) {
                float keptWeight = 0.f;
                for (const auto& influence : vertexInfluences) {
                    keptWeight += influence.second;
                }
                if (keptWeight > 0.f) {
                    const float scale = (keptWeight + removedWeight) / keptWeight;
                    for (auto& influence : vertexInfluences) {
                        influence.second *= scale;
                    }
                }
            }
        }
    }
    return lostWeight;
}

std::vector<int> SkinPartitioner::SortBodyParts(const std::vector<int>& triangleBodyParts, const std::vector<int>& bodyPartOrder) {
    std::set<int> usedBodyParts(triangleBodyParts.begin(), triangleBodyParts.end());
    std::vector<int> sorted;
    for (const int bodyPart : bodyPartOrder) {
        if (usedBodyParts.count(bodyPart) > 0 && std::find(sorted.begin(), sorted.end(), bodyPart) == sorted.end()) {
            sorted.push_back(bodyPart);
        }
    }
    for (const int bodyPart : usedBodyParts) {
        if (std::find(sorted.begin(), sorted.end(), bodyPart) == sorted.end()) {
            sorted.push_back(bodyPart);
        }
    }
    return sorted;
}

// Partitions whose bones fit together get one common bone table, first fit in partition order.
void SkinPartitioner::ShareBones(std::vector<std::vector<int>>& partitionBones) const {
    std::vector<bool> clustered(partitionBones.size(), false);
    for (size_t first = 0; first < partitionBones.size(); first++) {
        if (clustered[first]) {
            continue;
        }
        clustered[first] = true;
        std::vector<size_t> members = {first};
        std::vector<int> sharedBones = partitionBones[first];
        for (size_t other = first + 1; other < partitionBones.size(); other++) {
            if (clustered[other]) {
                continue;
            }
            if (sharedBones.size() + CountNewBones(sharedBones, partitionBones[other]) <= settings.maxBonesPerPartition) {
                MergeBones(sharedBones, partitionBones[other]);
                clustered[other] = true;
                members.push_back(other);
            }
        }
        for (const size_t member : members) {
            partitionBones[member] = sharedBones;
        }
    }
}

PartitionResult SkinPartitioner::Build(const std::vector<Types::Triangle>& triangles, const std::vector<int>& triangleBodyParts, const VertexInfluences& influences, int numBones) const {
    ASSERT(triangles.size() == triangleBodyParts.size());
    const uint32_t maxBones = settings.maxBonesPerPartition;
    ASSERT(maxBones >= 3 && maxBones <= Configuration::MaxBonesPerPartition && settings.maxBonesPerVertex >= 1);

    PartitionResult result;
    result.fittedInfluences = influences;

    // fit every vertex to the per vertex bone budget
    for (auto& vertexInfluences : result.fittedInfluences) {
        result.lostWeight += FitVertexWeights(vertexInfluences, settings.maxBonesPerVertex, settings.weightFitPolicy);
    }
    // then every triangle to the per partition budget
    for (const Types::Triangle& triangle : triangles) {
        result.lostWeight += FitTriangleBones(triangle, result.fittedInfluences);
    }

    std::vector<std::vector<int>> triangleBones(triangles.size());
    for (size_t faceIndex = 0; faceIndex < triangles.size(); faceIndex++) {
        triangleBones[faceIndex] = CollectTriangleBones(triangles[faceIndex], result.fittedInfluences);
    }

    std::vector<PartitionBuild> builds;
    for (const int bodyPart : SortBodyParts(triangleBodyParts, settings.bodyPartOrder)) {
        std::vector<int> faceIndices;
        for (size_t faceIndex = 0; faceIndex < triangles.size(); faceIndex++) {
            if (triangleBodyParts[faceIndex] == bodyPart) {
                faceIndices.push_back(static_cast<int>(faceIndex));
            }
        }

        // Find the shells of this body part and gather shells using the same bones
        const std::vector<std::vector<int>> patches = PolygonShellsHelper::FillPolygonPatches(triangles, faceIndices);
        std::vector<std::vector<int>> patchBones(patches.size());
        for (size_t patchIndex = 0; patchIndex < patches.size(); patchIndex++) {
            for (const int faceIndex : patches[patchIndex]) {
                MergeBones(patchBones[patchIndex], triangleBones[faceIndex]);
            }
        }
        std::vector<int> orderedFaces;
        std::vector<bool> patchConsumed(patches.size(), false);
        for (int patchIndex = 0; patchIndex < static_cast<int>(patches.size()); ++patchIndex) {
            if (patchConsumed[patchIndex]) {
                continue;
            }
            patchConsumed[patchIndex] = true;
            const std::vector<int> children = PolygonShellsHelper::GatherShellUsingSameBones(patchIndex, patchBones, patchConsumed, maxBones);
            orderedFaces.insert(orderedFaces.end(), patches[patchIndex].begin(), patches[patchIndex].end());
            for (const int child : children) {
                orderedFaces.insert(orderedFaces.end(), patches[child].begin(), patches[child].end());
            }
        }

        // assign each triangle to the partition of this body part needing the least new bones
        const size_t firstBuild = builds.size();
        for (const int faceIndex : orderedFaces) {
            const std::vector<int>& bones = triangleBones[faceIndex];
            int bestBuild = -1;
            size_t bestNewBones = 0;
            for (size_t buildIndex = firstBuild; buildIndex < builds.size(); buildIndex++) {
                const size_t newBones = CountNewBones(builds[buildIndex].bones, bones);
                if (builds[buildIndex].bones.size() + newBones > maxBones) {
                    continue;
                }
                if (bestBuild < 0 || newBones < bestNewBones) {
                    bestBuild = static_cast<int>(buildIndex);
                    bestNewBones = newBones;
                }
            }
            if (bestBuild < 0) {
                PartitionBuild build;
                build.bodyPart = bodyPart;
                builds.push_back(build);
                bestBuild = static_cast<int>(builds.size() - 1);
            }
            MergeBones(builds[bestBuild].bones, bones);
            builds[bestBuild].faces.push_back(faceIndex);
        }
    }

    std::vector<std::vector<int>> partitionBones;
    for (const PartitionBuild& build : builds) {
        partitionBones.push_back(build.bones);
    }
    if (settings.bMaximizeBoneSharing) {
        ShareBones(partitionBones);
    }
    if (settings.bPadBones) {
        for (auto& bones : partitionBones) {
            for (int bone = 0; bone < numBones && bones.size() < maxBones; bone++) {
                if (std::find(bones.begin(), bones.end(), bone) == bones.end()) {
                    bones.push_back(bone);
                }
            }
            std::sort(bones.begin(), bones.end());
        }
    }

    for (size_t buildIndex = 0; buildIndex < builds.size(); buildIndex++) {
        const PartitionBuild& build = builds[buildIndex];
        Assets::SkinPartitionAsset partition;
        partition.bodyPart = build.bodyPart;
        for (const int bone : partitionBones[buildIndex]) {
            partition.bones.push_back(static_cast<uint16_t>(bone));
        }

        // vertices in order of first use
        std::map<uint16_t, uint16_t> localIndices;
        auto GetLocalIndex = [&partition, &localIndices](uint16_t vertexIndex) {
            auto found = localIndices.find(vertexIndex);
            if (found != localIndices.end()) {
                return found->second;
            }
            const uint16_t localIndex = static_cast<uint16_t>(partition.vertexMap.size());
            partition.vertexMap.push_back(vertexIndex);
            localIndices[vertexIndex] = localIndex;
            return localIndex;
        };
        for (const int faceIndex : build.faces) {
            const Types::Triangle& triangle = triangles[faceIndex];
            Types::Triangle localTriangle;
            localTriangle.v1 = GetLocalIndex(triangle.v1);
            localTriangle.v2 = GetLocalIndex(triangle.v2);
            localTriangle.v3 = GetLocalIndex(triangle.v3);
            partition.triangles.push_back(localTriangle);
        }

        uint32_t numWeightsPerVertex = 1;
        for (const uint16_t vertexIndex : partition.vertexMap) {
            numWeightsPerVertex = Maths::Max(numWeightsPerVertex, static_cast<uint32_t>(result.fittedInfluences[vertexIndex].size()));
        }
        partition.numWeightsPerVertex = settings.bPadBones ? settings.maxBonesPerVertex : numWeightsPerVertex;

        for (const uint16_t vertexIndex : partition.vertexMap) {
            std::vector<float> weights;
            std::vector<uint8_t> boneIndices;
            for (const auto& influence : result.fittedInfluences[vertexIndex]) {
                auto found = std::find(partition.bones.begin(), partition.bones.end(), static_cast<uint16_t>(influence.first));
                ASSERT(found != partition.bones.end());
                boneIndices.push_back(static_cast<uint8_t>(found - partition.bones.begin()));
                weights.push_back(influence.second);
            }
            weights.resize(partition.numWeightsPerVertex, 0.f);
            boneIndices.resize(partition.numWeightsPerVertex, 0);
            partition.vertexWeights.push_back(weights);
            partition.boneIndices.push_back(boneIndices);
        }
        result.partitions.push_back(partition);
    }
    return result;
}

}}  // namespace Nif::Builder
