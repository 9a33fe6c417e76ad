#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "NifMesh.private.h"

namespace Nif { namespace Importer {

/**
 * Skeleton collaborator of the host scene. The pose position and node evaluation are shared mutable state of the host:
 * every read goes through ScopedRestPose or holds the pose mutex, so material groups exported in parallel never touch
 * the host concurrently.
 */
class Armature {
public:
    enum class EPosePosition { Pose, Rest };

    virtual ~Armature() = default;

    virtual std::string GetName() const = 0;

    virtual std::vector<std::string> GetBoneNames() const = 0;

    bool HasBone(const std::string& boneName) const;

    /**
     * Looks up a node of the skeleton hierarchy (bones and the armature object itself).
     * @param outWorld	Node transform in world space.
     * @param outLocal	Node transform relative to its parent.
     * @return			false if no node has this name.
     */
    virtual bool FindNode(const std::string& nodeName, glm::mat4& outWorld, glm::mat4& outLocal) const = 0;

    /** Bone matrix in armature space, evaluated in the current pose position. */
    virtual glm::mat4 GetBoneMatrix(const std::string& boneName) const = 0;

    virtual EPosePosition GetPosePosition() const = 0;

    virtual void SetPosePosition(EPosePosition position) = 0;

    std::mutex& GetPoseMutex() const { return poseMutex; }

private:
    mutable std::mutex poseMutex;
};

/**
 * Holds the armature in its rest pose for the lifetime of the guard, then puts back the previous pose position.
 * Concurrent exports sharing the armature are serialized on its pose mutex.
 */
class ScopedRestPose {
public:
    explicit ScopedRestPose(Armature& inArmature);

    ~ScopedRestPose();

    ScopedRestPose(const ScopedRestPose&) = delete;
    ScopedRestPose& operator=(const ScopedRestPose&) = delete;

private:
    Armature& armature;
    std::lock_guard<std::mutex> lock;
    Armature::EPosePosition previousPosition;
};

}}  // namespace Nif::Importer
