#include "TangentSpaceBuilder.h"
#include <cstring>

namespace Nif { namespace Builder {

const char* const TangentSpaceBuilder::BlobName = "Tangent space (binormal & tangent vectors)";

static void AppendFloat(std::vector<uint8_t>& bytes, float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    bytes.push_back(static_cast<uint8_t>(bits & 0xFF));
    bytes.push_back(static_cast<uint8_t>((bits >> 8) & 0xFF));
    bytes.push_back(static_cast<uint8_t>((bits >> 16) & 0xFF));
    bytes.push_back(static_cast<uint8_t>((bits >> 24) & 0xFF));
}

void TangentSpaceBuilder::ConvertTangents(const std::vector<glm::vec3>& normals, const std::vector<glm::vec3>& tangents, const std::vector<float>& bitangentSigns, size_t numVertices, std::vector<glm::vec3>& outTangents, std::vector<glm::vec3>& outBitangents) {
    if (normals.size() != numVertices || tangents.size() != numVertices || bitangentSigns.size() != numVertices) {
        throw ExportException(ExportException::EErrorKind::TangentCountMismatch, fmt::format("Tangent space needs one entry per vertex: {:d} vertices, {:d} normals, {:d} tangents, {:d} signs.", numVertices, normals.size(), tangents.size(), bitangentSigns.size()));
    }
    outTangents.resize(numVertices);
    outBitangents.resize(numVertices);
    for (size_t i = 0; i < numVertices; i++) {
        const glm::vec3 bitangent = bitangentSigns[i] * glm::cross(normals[i], tangents[i]);
        outTangents[i] = -bitangent;
        outBitangents[i] = tangents[i];
    }
}

bool TangentSpaceBuilder::UseBinaryBlob(const Options& options) {
    switch (options.tangentOutput) {
        case Options::ETangentOutput::BinaryBlob: return true;
        case Options::ETangentOutput::Arrays: return false;
        default: return options.game == EGameProfile::Oblivion;
    }
}

std::vector<uint8_t> TangentSpaceBuilder::PackBlob(const std::vector<glm::vec3>& tangents, const std::vector<glm::vec3>& bitangents) {
    std::vector<uint8_t> bytes;
    bytes.reserve((tangents.size() + bitangents.size()) * 3 * sizeof(float));
    for (const glm::vec3& tangent : tangents) {
        AppendFloat(bytes, tangent.x);
        AppendFloat(bytes, tangent.y);
        AppendFloat(bytes, tangent.z);
    }
    for (const glm::vec3& bitangent : bitangents) {
        AppendFloat(bytes, bitangent.x);
        AppendFloat(bytes, bitangent.y);
        AppendFloat(bytes, bitangent.z);
    }
    return bytes;
}

void TangentSpaceBuilder::Apply(Assets::TriShapeAsset& shape, const std::vector<glm::vec3>& tangents, const std::vector<glm::vec3>& bitangents, const Options& options) {
    if (tangents.size() != shape.positions.size() || bitangents.size() != shape.positions.size()) {
        throw ExportException(ExportException::EErrorKind::TangentCountMismatch, fmt::format("Shape {} has {:d} vertices but {:d} tangents and {:d} bitangents.", shape.name, shape.positions.size(), tangents.size(), bitangents.size()));
    }
    if (UseBinaryBlob(options)) {
        shape.tangentBlobName = BlobName;
        shape.tangentBlob = PackBlob(tangents, bitangents);
        return;
    }
    shape.extraVectorsFlags = ExtraVectorsFlags;
    shape.tangents.clear();
    shape.bitangents.clear();
    for (size_t i = 0; i < tangents.size(); i++) {
        Types::Vector3 vec;
        shape.tangents.push_back(Types::ConvertFromGLM(vec, tangents[i]));
        shape.bitangents.push_back(Types::ConvertFromGLM(vec, bitangents[i]));
    }
}

}}  // namespace Nif::Builder
