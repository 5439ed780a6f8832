#include "analysis/MotionAnalyzer.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <exception>

namespace Kinetic {

const char* MotionTypeToString(MotionType type) {
    switch (type) {
        case MotionType::Fast:      return "fast";
        case MotionType::Sustained: return "sustained";
        case MotionType::Quick:     return "quick";
        case MotionType::Smooth:    return "smooth";
        case MotionType::Slow:      return "slow";
    }
    return "slow";
}

float Percentile(std::vector<float> values, float percentile) {
    if (values.empty()) {
        return 0.0f;
    }
    std::sort(values.begin(), values.end());

    float rank = std::clamp(percentile, 0.0f, 100.0f) / 100.0f * static_cast<float>(values.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = static_cast<size_t>(std::ceil(rank));
    float fraction = rank - static_cast<float>(lower);
    return values[lower] + (values[upper] - values[lower]) * fraction;
}

namespace {

/**
 * @brief Finite difference with one-sided fallbacks at the range edges
 */
template<typename Sampler>
float Difference(const FrameRange& range, float frame, int window, Sampler&& sample) {
    float w = static_cast<float>(window);
    bool hasBefore = frame - w >= static_cast<float>(range.start);
    bool hasAfter = frame + w <= static_cast<float>(range.end);

    if (hasBefore && hasAfter) {
        return (sample(frame + w) - sample(frame - w)) / (2.0f * w);
    }
    if (hasAfter) {
        return (sample(frame + w) - sample(frame)) / w;
    }
    if (hasBefore) {
        return (sample(frame) - sample(frame - w)) / w;
    }
    return 0.0f;
}

bool HasPoint(const std::vector<ICurve*>& curves) {
    return curves.size() >= 3 && curves[0] && curves[1] && curves[2];
}

} // namespace

MotionAnalyzer::MotionAnalyzer(AnalysisCache* cache)
    : m_cache(cache) {
}

// =============================================================================
// Derivatives
// =============================================================================

float MotionAnalyzer::SafeEvaluate(const ICurve& curve, float frame, float fallback) {
    try {
        float value = curve.Evaluate(frame);
        return std::isfinite(value) ? value : fallback;
    } catch (const std::exception& e) {
        KINETIC_LOG_TRACE("Curve {} failed to evaluate at {}: {}", curve.GetId(), frame, e.what());
        return fallback;
    }
}

float MotionAnalyzer::Velocity(const ICurve& curve, float frame, int window) {
    if (!std::isfinite(frame) || window < 1) {
        return 0.0f;
    }

    try {
        FrameRange range = curve.GetRange();
        if (!range.IsValid()) {
            return 0.0f;
        }

        float velocity = Difference(range, frame, window,
                                    [&curve](float f) { return curve.Evaluate(f); });
        return std::isfinite(velocity) ? velocity : 0.0f;
    } catch (const std::exception& e) {
        KINETIC_LOG_TRACE("Velocity of curve {} at {} unavailable: {}", curve.GetId(), frame, e.what());
        return 0.0f;
    }
}

float MotionAnalyzer::Acceleration(const ICurve& curve, float frame, int window) {
    if (!std::isfinite(frame) || window < 1) {
        return 0.0f;
    }

    try {
        FrameRange range = curve.GetRange();
        if (!range.IsValid()) {
            return 0.0f;
        }

        float acceleration = Difference(range, frame, window,
                                        [&curve, window](float f) { return Velocity(curve, f, window); });
        return std::isfinite(acceleration) ? acceleration : 0.0f;
    } catch (const std::exception& e) {
        KINETIC_LOG_TRACE("Acceleration of curve {} at {} unavailable: {}", curve.GetId(), frame, e.what());
        return 0.0f;
    }
}

glm::vec3 MotionAnalyzer::SamplePoint(const std::vector<ICurve*>& curves, float frame) {
    glm::vec3 point(0.0f);
    for (size_t axis = 0; axis < 3 && axis < curves.size(); ++axis) {
        if (curves[axis]) {
            point[static_cast<glm::length_t>(axis)] = SafeEvaluate(*curves[axis], frame);
        }
    }
    return point;
}

// =============================================================================
// Segmentation
// =============================================================================

MotionType MotionAnalyzer::ClassifyMotion(float peakEnergy, int duration, float averageVelocity) {
    if (peakEnergy > 2.0f) {
        return MotionType::Fast;
    }
    if (peakEnergy > 0.5f) {
        return duration > 20 ? MotionType::Sustained : MotionType::Quick;
    }
    return averageVelocity > 0.3f ? MotionType::Smooth : MotionType::Slow;
}

std::vector<MovementRegion> MotionAnalyzer::DetectMovementRegions(const ICurve& curve,
                                                                  float velocityThreshold,
                                                                  int minDuration) const {
    if (!m_cache) {
        return ScanMovementRegions(curve, velocityThreshold, minDuration);
    }

    CacheKey key{curve.GetId(), AnalysisKind::MovementRegions,
                 velocityThreshold, static_cast<float>(minDuration)};
    return m_cache->GetOrCompute<std::vector<MovementRegion>>(key, [&]() {
        return ScanMovementRegions(curve, velocityThreshold, minDuration);
    });
}

std::vector<MovementRegion> MotionAnalyzer::ScanMovementRegions(const ICurve& curve,
                                                                float velocityThreshold,
                                                                int minDuration) const {
    std::vector<MovementRegion> regions;

    FrameRange range;
    try {
        range = curve.GetRange();
    } catch (const std::exception& e) {
        KINETIC_LOG_WARN("Curve {} has no usable range: {}", curve.GetId(), e.what());
        return regions;
    }
    if (!range.IsValid()) {
        return regions;
    }

    bool inRegion = false;
    int regionStart = 0;
    float peakEnergy = 0.0f;
    float velocitySum = 0.0f;
    int velocityCount = 0;

    auto closeRegion = [&](int regionEnd) {
        int duration = regionEnd - regionStart + 1;
        if (duration >= minDuration) {
            float averageVelocity = velocityCount > 0 ? velocitySum / static_cast<float>(velocityCount) : 0.0f;
            MovementRegion region;
            region.startFrame = regionStart;
            region.endFrame = regionEnd;
            region.peakEnergy = peakEnergy;
            region.motionType = ClassifyMotion(peakEnergy, duration, averageVelocity);
            regions.push_back(region);
        }
        inRegion = false;
    };

    for (int frame = range.start; frame <= range.end; ++frame) {
        float f = static_cast<float>(frame);
        float speed = std::abs(Velocity(curve, f));
        float energy = speed + 0.5f * std::abs(Acceleration(curve, f));

        if (energy > velocityThreshold) {
            if (!inRegion) {
                inRegion = true;
                regionStart = frame;
                peakEnergy = energy;
                velocitySum = 0.0f;
                velocityCount = 0;
            } else {
                peakEnergy = std::max(peakEnergy, energy);
            }
            velocitySum += speed;
            ++velocityCount;
        } else if (inRegion) {
            closeRegion(frame - 1);
        }
    }

    if (inRegion) {
        closeRegion(range.end);
    }

    KINETIC_LOG_DEBUG("Curve {}: {} movement regions in [{}, {}]",
                      curve.GetId(), regions.size(), range.start, range.end);
    return regions;
}

// =============================================================================
// Contacts
// =============================================================================

std::vector<ContactPhase> MotionAnalyzer::DetectContactPhases(const std::vector<ICurve*>& curves,
                                                              float groundThreshold,
                                                              float stabilityThreshold) const {
    if (!HasPoint(curves)) {
        KINETIC_LOG_DEBUG("Contact detection needs x/y/z curves, got {}", curves.size());
        return {};
    }

    const ICurve& vertical = *curves[2];
    if (!m_cache) {
        return ScanContactPhases(vertical, groundThreshold, stabilityThreshold);
    }

    CacheKey key{vertical.GetId(), AnalysisKind::ContactPhases, groundThreshold, stabilityThreshold};
    return m_cache->GetOrCompute<std::vector<ContactPhase>>(key, [&]() {
        return ScanContactPhases(vertical, groundThreshold, stabilityThreshold);
    });
}

std::vector<ContactPhase> MotionAnalyzer::ScanContactPhases(const ICurve& vertical,
                                                            float groundThreshold,
                                                            float stabilityThreshold) const {
    std::vector<ContactPhase> phases;

    FrameRange range;
    try {
        range = vertical.GetRange();
    } catch (const std::exception& e) {
        KINETIC_LOG_WARN("Curve {} has no usable range: {}", vertical.GetId(), e.what());
        return phases;
    }
    if (!range.IsValid()) {
        return phases;
    }

    std::vector<float> heights;
    heights.reserve(static_cast<size_t>(range.Length()));
    for (int frame = range.start; frame <= range.end; ++frame) {
        heights.push_back(SafeEvaluate(vertical, static_cast<float>(frame)));
    }

    float groundLevel = Percentile(heights, AnalysisDefaults::GroundPercentile);
    float adaptiveThreshold = groundLevel + groundThreshold;
    float exitHeight = 1.5f * adaptiveThreshold;
    float exitVelocity = 2.0f * stabilityThreshold;

    bool inContact = false;
    int contactStart = 0;

    auto closePhase = [&](int contactEnd) {
        ContactPhase phase{contactStart, contactEnd};
        if (phase.Duration() >= AnalysisDefaults::MinContactDuration) {
            phases.push_back(phase);
        }
        inContact = false;
    };

    for (int frame = range.start; frame <= range.end; ++frame) {
        float height = heights[static_cast<size_t>(frame - range.start)];
        float speed = std::abs(Velocity(vertical, static_cast<float>(frame)));

        if (!inContact) {
            if (height <= adaptiveThreshold && speed < stabilityThreshold) {
                inContact = true;
                contactStart = frame;
            }
        } else if (speed > exitVelocity || height > exitHeight) {
            // The frame that breaks contact closes the phase
            closePhase(frame);
        }
    }

    if (inContact) {
        closePhase(range.end);
    }

    KINETIC_LOG_DEBUG("Curve {}: ground {:.4f}, {} contact phases",
                      vertical.GetId(), groundLevel, phases.size());
    return phases;
}

std::vector<int> MotionAnalyzer::DetectFootSliding(const std::vector<ICurve*>& curves,
                                                   float sensitivity,
                                                   float groundThreshold,
                                                   float stabilityThreshold) const {
    std::vector<int> slidingFrames;
    if (!HasPoint(curves)) {
        KINETIC_LOG_DEBUG("Sliding detection needs x/y/z curves, got {}", curves.size());
        return slidingFrames;
    }

    const ICurve& curveX = *curves[0];
    const ICurve& curveY = *curves[1];

    for (const ContactPhase& phase : DetectContactPhases(curves, groundThreshold, stabilityThreshold)) {
        float movement = 0.0f;
        float peakVelocity = 0.0f;
        glm::vec3 previous = SamplePoint(curves, static_cast<float>(phase.startFrame));

        for (int frame = phase.startFrame; frame <= phase.endFrame; ++frame) {
            float f = static_cast<float>(frame);
            glm::vec3 position = SamplePoint(curves, f);
            if (frame > phase.startFrame) {
                glm::vec3 delta = glm::abs(position - previous);
                movement += std::max(delta.x, delta.y);
            }
            previous = position;

            float horizontalVelocity = std::max(std::abs(Velocity(curveX, f)),
                                                std::abs(Velocity(curveY, f)));
            peakVelocity = std::max(peakVelocity, horizontalVelocity);
        }

        float duration = static_cast<float>(phase.Duration());
        float movementLimit = (0.02f + 0.005f * duration) / sensitivity;
        float velocityLimit = (0.03f + 0.002f * duration) / sensitivity;

        if (movement > movementLimit || peakVelocity > velocityLimit) {
            KINETIC_LOG_DEBUG("Sliding in [{}, {}]: movement {:.4f} (limit {:.4f}), peak velocity {:.4f} (limit {:.4f})",
                              phase.startFrame, phase.endFrame, movement, movementLimit,
                              peakVelocity, velocityLimit);
            for (int frame = phase.startFrame; frame <= phase.endFrame; ++frame) {
                slidingFrames.push_back(frame);
            }
        }
    }

    return slidingFrames;
}

// =============================================================================
// Energy
// =============================================================================

EnergyProfile MotionAnalyzer::CalculateEnergyProfile(const std::vector<ICurve*>& curves,
                                                     std::optional<FrameRange> frameRange) const {
    EnergyProfile profile;

    FrameRange range;
    if (frameRange) {
        range = *frameRange;
    } else {
        bool any = false;
        for (const ICurve* curve : curves) {
            if (!curve) continue;
            FrameRange curveRange;
            try {
                curveRange = curve->GetRange();
            } catch (const std::exception& e) {
                KINETIC_LOG_WARN("Curve {} left out of the energy range: {}", curve->GetId(), e.what());
                continue;
            }
            if (!curveRange.IsValid()) continue;
            if (!any) {
                range = curveRange;
                any = true;
            } else {
                range.start = std::min(range.start, curveRange.start);
                range.end = std::max(range.end, curveRange.end);
            }
        }
        if (!any) {
            return profile;
        }
    }
    if (!range.IsValid() || curves.empty()) {
        return profile;
    }

    profile.Reserve(static_cast<size_t>(range.Length()));

    for (int frame = range.start; frame <= range.end; ++frame) {
        float f = static_cast<float>(frame);
        float kinetic = 0.0f;
        float potential = 0.0f;
        float velocitySum = 0.0f;
        float accelerationSum = 0.0f;

        for (size_t i = 0; i < curves.size(); ++i) {
            const ICurve* curve = curves[i];
            if (!curve) continue;

            float velocity = Velocity(*curve, f);
            kinetic += velocity * velocity;
            velocitySum += std::abs(velocity);
            accelerationSum += std::abs(Acceleration(*curve, f));

            if (i % 3 == 2) {
                potential += std::max(0.0f, SafeEvaluate(*curve, f));
            }
        }

        profile.frames.push_back(frame);
        profile.kinetic.push_back(kinetic);
        profile.potential.push_back(potential);
        profile.total.push_back(kinetic + potential);
        profile.velocity.push_back(velocitySum);
        profile.acceleration.push_back(accelerationSum);
    }

    return profile;
}

} // namespace Kinetic
