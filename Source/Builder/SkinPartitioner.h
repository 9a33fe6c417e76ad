#pragma once
#include <utility>
#include <vector>
#include "NifMesh.h"
#include "NifMesh.private.h"

namespace Nif { namespace Builder {

/** Per vertex: (bone index, weight). */
using VertexInfluences = std::vector<std::vector<std::pair<int, float>>>;

struct PartitionSettings {
    uint32_t maxBonesPerPartition = Configuration::DefaultBonesPerPartition;
    uint32_t maxBonesPerVertex = Configuration::DefaultBonesPerVertex;
    bool bPadBones = false;
    Options::EWeightFitPolicy weightFitPolicy = Options::EWeightFitPolicy::Redistribute;
    bool bMaximizeBoneSharing = false;
    /** Body part tags partitioned first, in this order. */
    std::vector<int> bodyPartOrder;

    PartitionSettings() = default;

    PartitionSettings(const Options& options);
};

struct PartitionResult {
    std::vector<Assets::SkinPartitionAsset> partitions;
    /** Weights after fitting, sorted by descending weight. */
    VertexInfluences fittedInfluences;
    /** Total weight mass discarded while fitting vertices and triangles. */
    float lostWeight = 0.f;
};

/**
 * Helpers grouping connected triangles into shells and merging shells that fit in one bone budget.
 */
class PolygonShellsHelper {
public:
    /** Triangles connected by a shared edge, in discovery order. */
    static std::vector<std::vector<int>> FillPolygonPatches(const std::vector<Types::Triangle>& triangles, const std::vector<int>& faceIndices);

    /**
     * Merges every later unconsumed patch whose bones fit together with the parent's into maxBones.
     * @return the patches merged into the parent, in order.
     */
    static std::vector<int> GatherShellUsingSameBones(const int parentPatchIndex, const std::vector<std::vector<int>>& patchBones, std::vector<bool>& patchConsumed, const uint32_t maxBones);
};

class SkinPartitioner {
public:
    explicit SkinPartitioner(const PartitionSettings& inSettings);

    /**
     * Splits triangles into partitions of at most maxBonesPerPartition bones, never mixing body part tags. Every
     * triangle ends up in exactly one partition.
     * @param numBones	Size of the skin's bone list, padding bones are taken from it.
     */
    PartitionResult Build(const std::vector<Types::Triangle>& triangles, const std::vector<int>& triangleBodyParts, const VertexInfluences& influences, int numBones) const;

    /**
     * Keeps the maxBonesPerVertex largest weights of a vertex, ties broken by bone index.
     * @return discarded weight mass.
     */
    static float FitVertexWeights(std::vector<std::pair<int, float>>& vertexInfluences, uint32_t maxBonesPerVertex, Options::EWeightFitPolicy policy);

    /** Tags of the priority list first (when used), then the others ascending. */
    static std::vector<int> SortBodyParts(const std::vector<int>& triangleBodyParts, const std::vector<int>& bodyPartOrder);

    static std::vector<int> CollectTriangleBones(const Types::Triangle& triangle, const VertexInfluences& influences);

private:
    /**
     * Removes the lightest bones from the corners of a triangle until its bones fit into one partition.
     * @return discarded weight mass.
     */
    float FitTriangleBones(const Types::Triangle& triangle, VertexInfluences& influences) const;

    void ShareBones(std::vector<std::vector<int>>& partitionBones) const;

    PartitionSettings settings;
};

}}  // namespace Nif::Builder
