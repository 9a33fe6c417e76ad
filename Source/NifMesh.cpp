#include "NifMesh.h"
#include "NifMesh.private.h"
#include <algorithm>
#include <map>
#ifdef _MSC_VER
#include <Windows.h>
#endif

namespace Nif {
namespace Configuration {
float VertexComparsionThreshold = 0.005f;
float WeightLossThreshold = 0.005f;
uint32_t DefaultBonesPerPartition = 18;
uint32_t DefaultBonesPerVertex = 4;
}  // namespace Configuration

AssertException::AssertException(const std::string& msg) : message(msg) {}

const char* AssertException::what() const throw() { return message.c_str(); }

ExportException::ExportException(EErrorKind inKind, const std::string& msg, const std::vector<int>& inOffending) : kind(inKind), message(msg), offendingIndices(inOffending) {}

const char* ExportException::what() const throw() { return message.c_str(); }

std::string ExportException::GetKindName(EErrorKind kind) {
    switch (kind) {
        case EErrorKind::CapacityExceeded: return "CapacityExceeded";
        case EErrorKind::MissingSkeletonRoot: return "MissingSkeletonRoot";
        case EErrorKind::UnweightedVertex: return "UnweightedVertex";
        case EErrorKind::UnassignedBodyPart: return "UnassignedBodyPart";
        case EErrorKind::TangentCountMismatch: return "TangentCountMismatch";
        case EErrorKind::UnsupportedGeometry: return "UnsupportedGeometry";
        case EErrorKind::MissingBone: return "MissingBone";
        case EErrorKind::InvalidOptions: return "InvalidOptions";
        default: return "Unknown";
    }
}

void Options::Validate() const {
    if (maxBonesPerPartition < 3) {
        throw ExportException(ExportException::EErrorKind::InvalidOptions, fmt::format("At least 3 bones per partition are required, got {:d}.", maxBonesPerPartition));
    }
    if (maxBonesPerPartition > Configuration::MaxBonesPerPartition) {
        throw ExportException(ExportException::EErrorKind::InvalidOptions, fmt::format("At most {:d} bones per partition are supported, got {:d}.", Configuration::MaxBonesPerPartition, maxBonesPerPartition));
    }
    if (maxBonesPerVertex < 1) {
        throw ExportException(ExportException::EErrorKind::InvalidOptions, "At least 1 bone per vertex is required.");
    }
    if (!(epsilon > 0.f)) {
        throw ExportException(ExportException::EErrorKind::InvalidOptions, fmt::format("Comparison threshold must be positive, got {}.", epsilon));
    }
}

namespace GameProfile {

static const std::map<EGameProfile, std::string> GameNames = {
    {EGameProfile::Morrowind, "MORROWIND"},
    {EGameProfile::Oblivion, "OBLIVION"},
    {EGameProfile::Fallout3, "FALLOUT_3"},
    {EGameProfile::Skyrim, "SKYRIM"},
    {EGameProfile::CivilizationIV, "CIVILIZATION_IV"},
    {EGameProfile::SidMeiersRailroads, "SID_MEIER_S_RAILROADS"},
    {EGameProfile::EmpireEarth2, "EMPIRE_EARTH_II"},
    {EGameProfile::Divinity2, "DIVINITY_2"},
};

std::string GetName(EGameProfile game) {
    auto found = GameNames.find(game);
    return found == GameNames.end() ? "UNKNOWN" : found->second;
}

bool FromName(const std::string& name, EGameProfile& outGame) {
    for (const auto& item : GameNames) {
        if (Utils::InsensitiveCaseEquals(item.second, name)) {
            outGame = item.first;
            return true;
        }
    }
    return false;
}

uint32_t GetRecommendedBonesPerPartition(EGameProfile game) {
    switch (game) {
        case EGameProfile::Oblivion: return 18;
        case EGameProfile::Fallout3: return 18;
        case EGameProfile::Skyrim: return 24;
        default: return 0;
    }
}

bool MaximizesBoneSharing(EGameProfile game) { return game == EGameProfile::Fallout3 || game == EGameProfile::Skyrim; }

bool SupportsBodyParts(EGameProfile game) { return game == EGameProfile::Fallout3 || game == EGameProfile::Skyrim; }

bool SupportsMultipleUVLayers(EGameProfile game) { return !(game == EGameProfile::Fallout3 || game == EGameProfile::Skyrim); }

bool SupportsTangentSpace(EGameProfile game) { return game == EGameProfile::Oblivion || game == EGameProfile::Fallout3 || game == EGameProfile::Skyrim; }

uint16_t GetDefaultShapeFlags(EGameProfile game, const std::string& shapeName, bool bDisplayAsWire) {
    switch (game) {
        case EGameProfile::Oblivion:
        case EGameProfile::Fallout3:
        case EGameProfile::Skyrim: return 0x000E;
        case EGameProfile::SidMeiersRailroads:
        case EGameProfile::CivilizationIV: return 0x0010;
        case EGameProfile::EmpireEarth2: return 0x0016;
        case EGameProfile::Divinity2: {
            std::string lowerName = shapeName;
            Utils::ToLowerCase(lowerName);
            const std::string suffix = lowerName.size() >= 3 ? lowerName.substr(lowerName.size() - 3) : lowerName;
            return (suffix == "med" || suffix == "low") ? 0x0014 : 0x0016;
        }
        default:
            // use triangles as bounding box, hidden when displayed as wire
            return bDisplayAsWire ? 0x0005 : 0x0004;
    }
}

}  // namespace GameProfile

namespace Types {

Vector2::Vector2(float inX, float inY) : x(inX), y(inY) {}

Vector3::Vector3(float inX, float inY, float inZ) : x(inX), y(inY), z(inZ) {}

Vector4::Vector4(float inX, float inY, float inZ, float inW) : x(inX), y(inY), z(inZ), w(inW) {}

Vector2& ConvertFromGLM(Vector2& vec1, const glm::vec2& vec2) {
    vec1.x = vec2.x;
    vec1.y = vec2.y;
    return vec1;
}

Vector3& ConvertFromGLM(Vector3& vec1, const glm::vec3& vec2) {
    vec1.x = vec2.x;
    vec1.y = vec2.y;
    vec1.z = vec2.z;
    return vec1;
}

Vector4& ConvertFromGLM(Vector4& vec1, const glm::vec4& vec2) {
    vec1.x = vec2.x;
    vec1.y = vec2.y;
    vec1.z = vec2.z;
    vec1.w = vec2.w;
    return vec1;
}

Matrix4& ConvertFromGLM(Matrix4& mat1, const glm::mat4& mat2) {
    for (int j = 0; j < 4; j++) {
        for (int k = 0; k < 4; k++) {
            mat1.data[4 * j + k] = mat2[j][k];
        }
    }
    return mat1;
}

glm::mat4 ConvertToGLM(const Matrix4& mat) {
    glm::mat4 result(1);
    for (int j = 0; j < 4; j++) {
        for (int k = 0; k < 4; k++) {
            result[j][k] = mat.data[4 * j + k];
        }
    }
    return result;
}
}  // namespace Types

namespace Utils {

std::function<void(ELogLevel, std::string)> GlobalLogger = [](ELogLevel, std::string) {};

DefaultLogInstance::DefaultLogInstance(const std::string& logFilePath) {
    auto stdcout_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    stdcout_sink->set_level(spdlog::level::debug);
    stdcout_sink->set_pattern("[%Y-%m-%d %H:%M:%S][thread %t][%^%l%$] %v");

    auto stdcerr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    stdcerr_sink->set_level(spdlog::level::err);
    stdcerr_sink->set_pattern("[%Y-%m-%d %H:%M:%S][thread %t][%^%l%$] %v");

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFilePath, 16 * 1024 * 1024, 0);
    file_sink->set_level(spdlog::level::debug);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S][thread %t][%^%l%$] %v");

    logger = std::shared_ptr<spdlog::logger>{new spdlog::logger("nif_export", {stdcout_sink, stdcerr_sink, file_sink})};
    logger->set_level(spdlog::level::debug);
}

void DefaultLogInstance::Log(ELogLevel level, std::string message) {
    if (!logger) {
        return;
    }
    switch (level) {
        case Nif::Utils::ELogLevel::Info: logger->info(message); break;
        case Nif::Utils::ELogLevel::Error: logger->error(message); break;
        case Nif::Utils::ELogLevel::Warn: logger->warn(message); break;
        case Nif::Utils::ELogLevel::Critical: logger->critical(message); break;
        case Nif::Utils::ELogLevel::Debug: logger->debug(message); break;
        default: break;
    }
}

std::map<std::string, std::shared_ptr<DefaultLogInstance>> Loggers;

std::function<void(ELogLevel, std::string)> GetDefaultLogger(const std::string& logFilePath) {
    if (Loggers.find(logFilePath) == Loggers.end()) {
        Loggers.emplace(logFilePath, std::make_shared<DefaultLogInstance>(logFilePath));
    }
    return std::bind(&DefaultLogInstance::Log, Loggers[logFilePath], std::placeholders::_1, std::placeholders::_2);
}

std::function<void(ELogLevel, std::string)> GetGlobalLogger() { return GlobalLogger; }

void SetGlobalLogger(std::function<void(ELogLevel, std::string)> logger) { GlobalLogger = logger; }

}  // namespace Utils

namespace Maths {

template <>
bool IsNearlyEqual<glm::vec2>(const glm::vec2& A, const glm::vec2& B, float errorTolerance) {
    return (Maths::Abs<float>(A.x - B.x) <= errorTolerance) && (Maths::Abs<float>(A.y - B.y) <= errorTolerance);
}

template <>
bool IsNearlyEqual<glm::vec3>(const glm::vec3& A, const glm::vec3& B, float errorTolerance) {
    return (Maths::Abs<float>(A.x - B.x) <= errorTolerance) && (Maths::Abs<float>(A.y - B.y) <= errorTolerance) && (Maths::Abs<float>(A.z - B.z) <= errorTolerance);
}

template <>
bool IsNearlyEqual<glm::vec4>(const glm::vec4& A, const glm::vec4& B, float errorTolerance) {
    return (Maths::Abs<float>(A.x - B.x) <= errorTolerance) && (Maths::Abs<float>(A.y - B.y) <= errorTolerance) && (Maths::Abs<float>(A.z - B.z) <= errorTolerance) && (Maths::Abs<float>(A.w - B.w) <= errorTolerance);
}

template <>
bool IsNearlyZero<glm::vec3>(const glm::vec3& vec, float tolerance) {
    return Maths::Abs(vec.x) <= tolerance && Maths::Abs(vec.y) <= tolerance && Maths::Abs(vec.z) <= tolerance;
}

bool ContainsNaN(const glm::vec3& vec) { return std::isnan(vec.x) || std::isnan(vec.y) || std::isnan(vec.z); }

void GetMatrixScaledAxes(const glm::mat4& mat, glm::vec3& x, glm::vec3& y, glm::vec3& z) {
    x.x = mat[0][0];
    x.y = mat[0][1];
    x.z = mat[0][2];
    y.x = mat[1][0];
    y.y = mat[1][1];
    y.z = mat[1][2];
    z.x = mat[2][0];
    z.y = mat[2][1];
    z.z = mat[2][2];
}

glm::mat4 InverseNonFast(const glm::mat4& mat) { return glm::mat4(glm::inverse(glm::dmat4(mat))); }

}  // namespace Maths

namespace Utils {

#ifdef _MSC_VER
std::string ANSItoUTF8(std::string& strAnsi) {
#ifdef _DEBUG
    return strAnsi;
#else
    UINT nLen = MultiByteToWideChar(CP_ACP, NULL, strAnsi.data(), -1, NULL, NULL);
    WCHAR* wszBuffer = new WCHAR[nLen + 1];
    nLen = MultiByteToWideChar(CP_ACP, NULL, strAnsi.data(), -1, wszBuffer, nLen);
    wszBuffer[nLen] = 0;
    nLen = WideCharToMultiByte(CP_UTF8, NULL, wszBuffer, -1, NULL, NULL, NULL, NULL);
    CHAR* szBuffer = new CHAR[nLen + 1];
    nLen = WideCharToMultiByte(CP_UTF8, NULL, wszBuffer, -1, szBuffer, nLen, NULL, NULL);
    szBuffer[nLen] = 0;
    strAnsi = std::string(szBuffer);
    delete[] wszBuffer;
    delete[] szBuffer;
    return strAnsi;
#endif
}
#endif

bool InsensitiveCaseEquals(const std::string& a, const std::string& b) {
    size_t sz = a.size();
    if (b.size() != sz) return false;
    for (size_t i = 0; i < sz; i++)
        if (tolower(a[i]) != tolower(b[i])) return false;
    return true;
}

void ToLowerCase(std::string& data) {
    std::transform(data.begin(), data.end(), data.begin(), [](unsigned char c) { return std::tolower(c); });
}

}  // namespace Utils

}  // namespace Nif
