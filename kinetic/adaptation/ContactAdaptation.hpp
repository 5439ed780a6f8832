#pragma once

#include "curves/Curve.hpp"
#include <map>
#include <optional>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

namespace Kinetic {

/**
 * @brief Per-frame ground contact test for a tracked point
 *
 * A frame is in contact when the vertical curve sits within contactThreshold
 * of the ground level and its vertical speed is below velocityThreshold.
 * Answers are memoized per (vertical curve, frame) until the ground level
 * changes or ClearCache is called. Not thread-safe.
 */
class ContactDetector {
public:
    explicit ContactDetector(float contactThreshold = 0.05f, float velocityThreshold = 0.1f);

    /**
     * @brief Check contact of an x/y/z point at a frame
     * @return false when fewer than three curves are given
     */
    bool IsInContact(const std::vector<ICurve*>& point, int frame);

    /**
     * @brief Move the ground; drops every memoized answer
     */
    void SetGroundLevel(float groundLevel);
    [[nodiscard]] float GetGroundLevel() const { return m_groundLevel; }

    void SetContactThreshold(float threshold);
    [[nodiscard]] float GetContactThreshold() const { return m_contactThreshold; }

    void SetVelocityThreshold(float threshold);
    [[nodiscard]] float GetVelocityThreshold() const { return m_velocityThreshold; }

    void ClearCache() { m_cache.clear(); }
    [[nodiscard]] size_t GetCachedCount() const { return m_cache.size(); }

private:
    float m_groundLevel = 0.0f;
    float m_contactThreshold = 0.05f;
    float m_velocityThreshold = 0.1f;
    std::map<std::pair<CurveId, int>, bool> m_cache;
};

/**
 * @brief World/local constraint weighting for one frame
 */
struct ContactDriveState {
    float contactWeight = 0.0f;     // smoothed toward 1 in contact, 0 otherwise
    float worldInfluence = 0.0f;
    float localInfluence = 1.0f;
    bool inContact = false;
};

/**
 * @brief Drives world/local space blending from contact state
 *
 * Each Update moves the contact weight a fixed fraction (blendSpeed) toward
 * its target. The caller owns the state between frames.
 */
class AdaptiveContactDriver {
public:
    AdaptiveContactDriver(ContactDetector& detector,
                          std::vector<ICurve*> point,
                          float blendSpeed = 0.3f,
                          float blendFactor = 1.0f);

    /**
     * @brief Next state for a frame given the previous one
     */
    [[nodiscard]] ContactDriveState Update(int frame, const ContactDriveState& previous) const;

    /**
     * @brief One smoothing step from a previous weight and the contact flag
     */
    [[nodiscard]] static ContactDriveState Step(float previousWeight, bool inContact,
                                                float blendSpeed, float blendFactor);

    void SetBlendSpeed(float speed) { m_blendSpeed = speed; }
    [[nodiscard]] float GetBlendSpeed() const { return m_blendSpeed; }

    void SetBlendFactor(float factor) { m_blendFactor = factor; }
    [[nodiscard]] float GetBlendFactor() const { return m_blendFactor; }

private:
    ContactDetector& m_detector;
    std::vector<ICurve*> m_point;
    float m_blendSpeed = 0.3f;
    float m_blendFactor = 1.0f;
};

struct RootMotionSample {
    bool moved = false;
    glm::vec3 delta{0.0f};
};

/**
 * @brief Detects significant root translation between samples
 */
class RootMotionDetector {
public:
    explicit RootMotionDetector(float motionThreshold = 0.01f);

    /**
     * @brief Compare a position against a reference
     *
     * Without a reference there is nothing to compare and no motion is
     * reported.
     */
    [[nodiscard]] RootMotionSample Detect(const std::optional<glm::vec3>& reference,
                                          const glm::vec3& current) const;

    /**
     * @brief Detect against the tracked reference, moving it when motion is found
     *
     * The first call only establishes the reference.
     */
    RootMotionSample Track(const glm::vec3& current);

    /**
     * @brief Track the x/y/z position of a root point at a frame
     */
    RootMotionSample Track(const std::vector<ICurve*>& root, int frame);

    void Reset() { m_reference.reset(); }

    [[nodiscard]] const std::optional<glm::vec3>& GetReference() const { return m_reference; }
    [[nodiscard]] float GetMotionThreshold() const { return m_motionThreshold; }

private:
    float m_motionThreshold = 0.01f;
    std::optional<glm::vec3> m_reference;
};

} // namespace Kinetic
