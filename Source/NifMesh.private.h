#pragma once
#include <glm/ext/matrix_transform.hpp>  // glm::translate, glm::scale
#include <glm/gtc/matrix_inverse.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <glm/mat4x4.hpp>  // glm::mat4
#include <glm/vec2.hpp>    // glm::vec2
#include <glm/vec3.hpp>    // glm::vec3
#include <glm/vec4.hpp>    // glm::vec4
#include <glm/geometric.hpp>
#include <cmath>
#include <ostream>
#include <sstream>
#include <iterator>
#include "NifMesh.h"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "spdlog/sinks/rotating_file_sink.h"

namespace Nif {
namespace Types {

Vector2& ConvertFromGLM(Vector2& vec1, const glm::vec2& vec2);

Vector3& ConvertFromGLM(Vector3& vec1, const glm::vec3& vec2);

Vector4& ConvertFromGLM(Vector4& vec1, const glm::vec4& vec2);

Matrix4& ConvertFromGLM(Matrix4& mat1, const glm::mat4& mat2);

glm::mat4 ConvertToGLM(const Matrix4& mat);

}  // namespace Types
namespace Maths {

/** Returns higher value in a generic way */
template <class T>
constexpr T Max(const T A, const T B) {
    return (A >= B) ? A : B;
}

/** Returns lower value in a generic way */
template <class T>
constexpr T Min(const T A, const T B) {
    return (A <= B) ? A : B;
}

/** Computes absolute value in a generic way */
template <class T>
constexpr T Abs(const T A) {
    return (A >= (T)0) ? A : -A;
}

/**
 *	Checks if two floating point numbers are nearly equal.
 *	@param A				First number to compare
 *	@param B				Second number to compare
 *	@param ErrorTolerance	Maximum allowed difference for considering them as 'nearly equal'
 *	@return					true if A and B are nearly equal
 */
template <class T>
bool IsNearlyEqual(const T& A, const T& B, float errorTolerance = 1.e-8f) {
    return Abs<T>(A - B) <= errorTolerance;
}

template <>
bool IsNearlyEqual<glm::vec2>(const glm::vec2& A, const glm::vec2& B, float errorTolerance);

template <>
bool IsNearlyEqual<glm::vec3>(const glm::vec3& A, const glm::vec3& B, float errorTolerance);

template <>
bool IsNearlyEqual<glm::vec4>(const glm::vec4& A, const glm::vec4& B, float errorTolerance);

/**
 *	Checks if a floating point number is nearly zero.
 *	@param Value			Number to compare
 *	@param ErrorTolerance	Maximum allowed difference for considering Value as 'nearly zero'
 *	@return					true if Value is nearly zero
 */
template <class T>
bool IsNearlyZero(const T& value, float errorTolerance = 1.e-8f) {
    return Maths::Abs(value) <= errorTolerance;
}

template <>
bool IsNearlyZero<glm::vec3>(const glm::vec3& vec, float tolerance);

bool ContainsNaN(const glm::vec3& vec);

void GetMatrixScaledAxes(const glm::mat4& mat, glm::vec3& x, glm::vec3& y, glm::vec3& z);

/**
 * General 4x4 inverse evaluated in double precision. Does not assume a rigid (orthonormal) transform.
 */
glm::mat4 InverseNonFast(const glm::mat4& mat);

}  // namespace Maths
namespace Utils {
class DefaultLogInstance {
public:
    DefaultLogInstance(const std::string& logFilePath);
    void Log(ELogLevel level, std::string message);
    std::shared_ptr<spdlog::logger> logger = nullptr;
};

bool InsensitiveCaseEquals(const std::string& a, const std::string& b);

void ToLowerCase(std::string& data);

/*! note: delimiter cannot contain NUL characters
 */
template <typename Range, typename Value = typename Range::value_type>
std::string Join(Range const& elements, const char* const delimiter) {
    std::ostringstream os;
    auto b = begin(elements), e = end(elements);

    if (b != e) {
        std::copy(b, prev(e), std::ostream_iterator<Value>(os, delimiter));
        b = prev(e);
    }
    if (b != e) {
        os << *b;
    }

    return os.str();
}
#ifdef _MSC_VER
std::string ANSItoUTF8(std::string& strAnsi);
#endif
}  // namespace Utils
}  // namespace Nif

#define SMALL_NUMBER (1.e-8f)

#define ASSERT(expr)                                                                                                                                           \
    if (!(expr)) {                                                                                                                                             \
        throw Nif::AssertException("Assert failed, file: " + std::string(__FILE__) + ", line: " + std::to_string(__LINE__) + ", expr: " + std::string(#expr)); \
    }

#ifdef _MSC_VER
#define LOG_DEBUG(str) \
    { Nif::Utils::GetGlobalLogger()(Nif::Utils::ELogLevel::Debug, Nif::Utils::ANSItoUTF8(std::string(str))); }
#define LOG_WARN(str) \
    { Nif::Utils::GetGlobalLogger()(Nif::Utils::ELogLevel::Warn, Nif::Utils::ANSItoUTF8(std::string(str))); }
#define LOG_INFO(str) \
    { Nif::Utils::GetGlobalLogger()(Nif::Utils::ELogLevel::Info, Nif::Utils::ANSItoUTF8(std::string(str))); }
#define LOG_ERROR(str) \
    { Nif::Utils::GetGlobalLogger()(Nif::Utils::ELogLevel::Error, Nif::Utils::ANSItoUTF8(std::string(str))); }
#define LOG_CRITICAL(str) \
    { Nif::Utils::GetGlobalLogger()(Nif::Utils::ELogLevel::Critical, Nif::Utils::ANSItoUTF8(std::string(str))); }
#else
#define LOG_DEBUG(str) \
    { Nif::Utils::GetGlobalLogger()(Nif::Utils::ELogLevel::Debug, std::string(str)); }
#define LOG_WARN(str) \
    { Nif::Utils::GetGlobalLogger()(Nif::Utils::ELogLevel::Warn, std::string(str)); }
#define LOG_INFO(str) \
    { Nif::Utils::GetGlobalLogger()(Nif::Utils::ELogLevel::Info, std::string(str)); }
#define LOG_ERROR(str) \
    { Nif::Utils::GetGlobalLogger()(Nif::Utils::ELogLevel::Error, std::string(str)); }
#define LOG_CRITICAL(str) \
    { Nif::Utils::GetGlobalLogger()(Nif::Utils::ELogLevel::Critical, std::string(str)); }
#endif
