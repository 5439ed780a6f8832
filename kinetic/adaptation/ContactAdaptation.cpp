#include "adaptation/ContactAdaptation.hpp"
#include "analysis/MotionAnalyzer.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <limits>
#include <utility>

namespace Kinetic {

// =============================================================================
// ContactDetector
// =============================================================================

ContactDetector::ContactDetector(float contactThreshold, float velocityThreshold)
    : m_contactThreshold(contactThreshold)
    , m_velocityThreshold(velocityThreshold) {
}

bool ContactDetector::IsInContact(const std::vector<ICurve*>& point, int frame) {
    if (point.size() < 3 || !point[2]) {
        return false;
    }

    const ICurve& vertical = *point[2];
    auto key = std::make_pair(vertical.GetId(), frame);
    auto it = m_cache.find(key);
    if (it != m_cache.end()) {
        return it->second;
    }

    float f = static_cast<float>(frame);
    // A failed evaluation reads as infinitely high, never in contact
    float height = MotionAnalyzer::SafeEvaluate(vertical, f, std::numeric_limits<float>::infinity());
    bool inContact = height <= m_groundLevel + m_contactThreshold;
    if (inContact) {
        inContact = std::abs(MotionAnalyzer::Velocity(vertical, f)) < m_velocityThreshold;
    }

    m_cache.emplace(key, inContact);
    return inContact;
}

void ContactDetector::SetGroundLevel(float groundLevel) {
    m_groundLevel = groundLevel;
    m_cache.clear();
}

void ContactDetector::SetContactThreshold(float threshold) {
    m_contactThreshold = threshold;
    m_cache.clear();
}

void ContactDetector::SetVelocityThreshold(float threshold) {
    m_velocityThreshold = threshold;
    m_cache.clear();
}

// =============================================================================
// AdaptiveContactDriver
// =============================================================================

AdaptiveContactDriver::AdaptiveContactDriver(ContactDetector& detector,
                                             std::vector<ICurve*> point,
                                             float blendSpeed,
                                             float blendFactor)
    : m_detector(detector)
    , m_point(std::move(point))
    , m_blendSpeed(blendSpeed)
    , m_blendFactor(blendFactor) {
}

ContactDriveState AdaptiveContactDriver::Update(int frame, const ContactDriveState& previous) const {
    bool inContact = m_detector.IsInContact(m_point, frame);
    ContactDriveState state = Step(previous.contactWeight, inContact, m_blendSpeed, m_blendFactor);

    if (state.inContact != previous.inContact) {
        KINETIC_LOG_TRACE("Frame {}: contact {}", frame, inContact ? "started" : "ended");
    }
    return state;
}

ContactDriveState AdaptiveContactDriver::Step(float previousWeight, bool inContact,
                                              float blendSpeed, float blendFactor) {
    float target = inContact ? 1.0f : 0.0f;

    ContactDriveState state;
    state.inContact = inContact;
    state.contactWeight = previousWeight + (target - previousWeight) * blendSpeed;
    state.worldInfluence = state.contactWeight * blendFactor;
    state.localInfluence = 1.0f - state.worldInfluence;
    return state;
}

// =============================================================================
// RootMotionDetector
// =============================================================================

RootMotionDetector::RootMotionDetector(float motionThreshold)
    : m_motionThreshold(motionThreshold) {
}

RootMotionSample RootMotionDetector::Detect(const std::optional<glm::vec3>& reference,
                                            const glm::vec3& current) const {
    RootMotionSample sample;
    if (!reference) {
        return sample;
    }

    sample.delta = current - *reference;
    sample.moved = glm::length(sample.delta) > m_motionThreshold;
    return sample;
}

RootMotionSample RootMotionDetector::Track(const glm::vec3& current) {
    if (!m_reference) {
        m_reference = current;
        return RootMotionSample{};
    }

    RootMotionSample sample = Detect(m_reference, current);
    if (sample.moved) {
        m_reference = current;
    }
    return sample;
}

RootMotionSample RootMotionDetector::Track(const std::vector<ICurve*>& root, int frame) {
    return Track(MotionAnalyzer::SamplePoint(root, static_cast<float>(frame)));
}

} // namespace Kinetic
