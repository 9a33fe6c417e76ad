#pragma once
#include <vector>
#include "NifMesh.h"
#include "NifMesh.private.h"

namespace Nif { namespace Builder {

namespace Triangulator {

/**
 * Mirrored geometry (negative scale sum) needs reversed winding to keep faces pointing outwards.
 */
bool IsMirrored(const glm::vec3& scale);

/**
 * Fans a convex triangle or quad into (f0, f1+i, f2+i) triangles, or (f0, f2+i, f1+i) when mirrored.
 * Throws ExportException(CapacityExceeded) when outTriangles would grow past the format limit.
 * @return number of triangles added.
 */
int FanPolygon(const std::vector<uint16_t>& cornerIndices, bool bMirrored, std::vector<Types::Triangle>& outTriangles);

}  // namespace Triangulator

}}  // namespace Nif::Builder
