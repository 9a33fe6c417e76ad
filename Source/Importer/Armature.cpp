#include "Armature.h"
#include <algorithm>

namespace Nif { namespace Importer {

bool Armature::HasBone(const std::string& boneName) const {
    const std::vector<std::string> boneNames = GetBoneNames();
    return std::find(boneNames.begin(), boneNames.end(), boneName) != boneNames.end();
}

ScopedRestPose::ScopedRestPose(Armature& inArmature) : armature(inArmature), lock(inArmature.GetPoseMutex()), previousPosition(inArmature.GetPosePosition()) {
    armature.SetPosePosition(Armature::EPosePosition::Rest);
}

ScopedRestPose::~ScopedRestPose() {
    try {
        armature.SetPosePosition(previousPosition);
    } catch (const std::exception& e) {
        LOG_ERROR(fmt::format("Failed to restore pose position of armature {}: {}", armature.GetName(), e.what()));
    }
}

}}  // namespace Nif::Importer
