#include "SkinWeightBuilder.h"
#include <algorithm>
#include <map>

namespace Nif { namespace Builder {

std::vector<std::string> SkinWeightBuilder::GetInfluencingBones(const Importer::MeshSnapshot& snapshot, const std::vector<std::string>& boneNames) {
    std::vector<std::string> influences;
    for (const std::string& boneName : boneNames) {
        if (snapshot.GetGroupIndex(boneName) >= 0) {
            influences.push_back(boneName);
        }
    }
    return influences;
}

SkinWeights SkinWeightBuilder::Build(const Importer::MeshSnapshot& snapshot, const SourceVertexMap& vertexMap, size_t numWeldedVertices, const std::vector<std::string>& influencingBones) {
    const int numSourceVertices = static_cast<int>(snapshot.positions.size());

    // group index -> influence index
    std::map<int, int> groupToInfluence;
    for (int influenceIndex = 0; influenceIndex < static_cast<int>(influencingBones.size()); influenceIndex++) {
        const int groupIndex = snapshot.GetGroupIndex(influencingBones[influenceIndex]);
        ASSERT(groupIndex >= 0);
        groupToInfluence[groupIndex] = influenceIndex;
    }

    // raw weights per influence and normalization factors
    std::vector<std::vector<std::pair<int, float>>> rawWeights(influencingBones.size());
    std::vector<float> vertexNorm(numSourceVertices, 0.f);
    for (int vertexIndex = 0; vertexIndex < numSourceVertices; vertexIndex++) {
        if (vertexIndex >= static_cast<int>(snapshot.vertexGroups.size())) {
            continue;
        }
        for (const Importer::MeshSnapshot::GroupWeight& groupWeight : snapshot.vertexGroups[vertexIndex]) {
            auto found = groupToInfluence.find(groupWeight.group);
            if (found == groupToInfluence.end()) {
                continue;
            }
            rawWeights[found->second].emplace_back(vertexIndex, groupWeight.weight);
            vertexNorm[vertexIndex] += groupWeight.weight;
        }
    }

    std::vector<int> unweightedVertices;
    for (int vertexIndex = 0; vertexIndex < numSourceVertices; vertexIndex++) {
        if (vertexNorm[vertexIndex] == 0.f) {
            unweightedVertices.push_back(vertexIndex);
        }
    }
    if (!unweightedVertices.empty()) {
        throw ExportException(ExportException::EErrorKind::UnweightedVertex,
                              fmt::format("Cannot export mesh {} with {:d} unweighted vertices, every vertex must be assigned to at least one bone group: {}", snapshot.name, unweightedVertices.size(), Utils::Join(unweightedVertices, ", ")), unweightedVertices);
    }

    SkinWeights result;
    result.vertexInfluences.resize(numWeldedVertices);
    for (int influenceIndex = 0; influenceIndex < static_cast<int>(influencingBones.size()); influenceIndex++) {
        std::map<uint16_t, float> weldedWeights;
        for (const auto& item : rawWeights[influenceIndex]) {
            const int sourceIndex = item.first;
            if (sourceIndex >= static_cast<int>(vertexMap.size())) {
                continue;
            }
            // source vertices outside this material group have no welded copies, repeated group entries add up
            for (const uint16_t weldedIndex : vertexMap[sourceIndex]) {
                weldedWeights[weldedIndex] += item.second / vertexNorm[sourceIndex];
            }
        }
        if (weldedWeights.empty()) {
            LOG_DEBUG(fmt::format("Bone {} has no vertex in this group, dropped from skin.", influencingBones[influenceIndex]));
            continue;
        }
        const int boneIndex = static_cast<int>(result.boneNames.size());
        result.boneNames.push_back(influencingBones[influenceIndex]);
        result.boneVertexWeights.emplace_back(weldedWeights.begin(), weldedWeights.end());
        for (const auto& item : weldedWeights) {
            ASSERT(item.first < numWeldedVertices);
            result.vertexInfluences[item.first].emplace_back(boneIndex, item.second);
        }
    }
    return result;
}

}}  // namespace Nif::Builder
