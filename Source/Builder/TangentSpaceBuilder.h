#pragma once
#include <string>
#include <vector>
#include "NifMesh.h"
#include "NifMesh.private.h"

namespace Nif { namespace Builder {

namespace TangentSpaceBuilder {

/** Name of the binary extra data block holding the tangent space. */
extern const char* const BlobName;

/** Extra vectors flag announcing tangent and bitangent arrays. */
constexpr uint16_t ExtraVectorsFlags = 16;

/**
 * Converts host tangents with bitangent signs into the target convention: the V axis is flipped, so the emitted
 * tangent is -bitangent and the emitted bitangent is the host tangent.
 * Throws ExportException(TangentCountMismatch) if the arrays do not match the vertex count.
 */
void ConvertTangents(const std::vector<glm::vec3>& normals, const std::vector<glm::vec3>& tangents, const std::vector<float>& bitangentSigns, size_t numVertices, std::vector<glm::vec3>& outTangents, std::vector<glm::vec3>& outBitangents);

bool UseBinaryBlob(const Options& options);

/** Writes all tangents then all bitangents as little endian float32. */
std::vector<uint8_t> PackBlob(const std::vector<glm::vec3>& tangents, const std::vector<glm::vec3>& bitangents);

/**
 * Stores the tangent space on the shape, as arrays or as binary extra data depending on options.
 */
void Apply(Assets::TriShapeAsset& shape, const std::vector<glm::vec3>& tangents, const std::vector<glm::vec3>& bitangents, const Options& options);

}  // namespace TangentSpaceBuilder

}}  // namespace Nif::Builder
