#include "blending/BlendingEngine.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <numeric>
#include <utility>

namespace Kinetic {

namespace {

std::optional<float> TryEvaluate(const ICurve& curve, int frame) {
    try {
        float value = curve.Evaluate(static_cast<float>(frame));
        if (std::isfinite(value)) {
            return value;
        }
    } catch (const std::exception& e) {
        KINETIC_LOG_TRACE("Curve {} failed to evaluate at {}: {}", curve.GetId(), frame, e.what());
    }
    return std::nullopt;
}

std::optional<FrameRange> TryRange(const ICurve& curve) {
    try {
        FrameRange range = curve.GetRange();
        if (range.IsValid()) {
            return range;
        }
    } catch (const std::exception& e) {
        KINETIC_LOG_WARN("Curve {} has no usable range: {}", curve.GetId(), e.what());
    }
    return std::nullopt;
}

/**
 * @brief Split ascending unique frames into maximal consecutive runs
 */
std::vector<FrameRange> ConsecutiveRuns(const std::vector<int>& frames) {
    std::vector<FrameRange> runs;
    for (int frame : frames) {
        if (!runs.empty() && frame == runs.back().end + 1) {
            runs.back().end = frame;
        } else {
            runs.push_back(FrameRange{frame, frame});
        }
    }
    return runs;
}

} // namespace

BlendingEngine::BlendingEngine(const MotionAnalyzer& analyzer, float energyPreservation)
    : m_analyzer(analyzer)
    , m_energyPreservation(energyPreservation) {
}

// =============================================================================
// Helpers
// =============================================================================

float BlendingEngine::MotionTypeMultiplier(MotionType type) {
    switch (type) {
        case MotionType::Fast:      return 1.2f;
        case MotionType::Sustained: return 1.0f;
        case MotionType::Quick:     return 0.9f;
        case MotionType::Smooth:    return 0.8f;
        case MotionType::Slow:      return 0.6f;
    }
    return 1.0f;
}

float BlendingEngine::VelocityWeight(const std::vector<MovementRegion>& regions,
                                     int frame,
                                     float energyPreservation,
                                     bool inContact) {
    float weight = OutsideRegionWeight;

    auto region = std::find_if(regions.begin(), regions.end(),
                               [frame](const MovementRegion& r) { return r.Contains(frame); });
    if (region != regions.end()) {
        float energyFactor = std::min(1.0f, region->peakEnergy / 2.0f);
        weight = std::clamp(energyFactor * MotionTypeMultiplier(region->motionType) * energyPreservation,
                            MinRegionWeight, MaxRegionWeight);
    }

    if (inContact) {
        weight *= ContactWeightScale;
    }
    return weight;
}

float BlendingEngine::ApplyBlendMode(AdjustmentLayer::BlendMode mode,
                                     float current,
                                     float baseValue,
                                     float layerValue,
                                     float influence) {
    switch (mode) {
        case AdjustmentLayer::BlendMode::Add:
            return current + (layerValue - baseValue) * influence;
        case AdjustmentLayer::BlendMode::Subtract:
            return current - (layerValue - baseValue) * influence;
        case AdjustmentLayer::BlendMode::Multiply:
            return current * (1.0f + (layerValue - 1.0f) * influence);
        case AdjustmentLayer::BlendMode::Replace:
            return Lerp(current, layerValue, influence);
        case AdjustmentLayer::BlendMode::Screen:
            return 1.0f - (1.0f - current) * (1.0f - layerValue * influence);
        case AdjustmentLayer::BlendMode::Overlay:
            // Overlay needs the base curve's regions; LayeredAdjustments handles it
            break;
    }
    return current;
}

float BlendingEngine::SmoothLerp(float a, float b, float t) {
    float eased = t * t * (3.0f - 2.0f * t);
    return Lerp(a, b, eased);
}

// =============================================================================
// Blending
// =============================================================================

FrameValues BlendingEngine::VelocityAwareBlend(const ICurve& base,
                                               const ICurve& adjustment,
                                               float influence,
                                               float energyPreservation,
                                               const std::set<int>& contactFrames,
                                               float regionThreshold) const {
    FrameValues result;

    auto baseRange = TryRange(base);
    auto adjustmentRange = TryRange(adjustment);
    if (!baseRange && !adjustmentRange) {
        return result;
    }

    FrameRange range = baseRange ? *baseRange : *adjustmentRange;
    if (baseRange && adjustmentRange) {
        range.start = std::min(baseRange->start, adjustmentRange->start);
        range.end = std::max(baseRange->end, adjustmentRange->end);
    }

    std::vector<MovementRegion> regions = m_analyzer.DetectMovementRegions(base, regionThreshold);

    for (int frame = range.start; frame <= range.end; ++frame) {
        auto baseValue = TryEvaluate(base, frame);
        auto adjustmentValue = TryEvaluate(adjustment, frame);
        if (!baseValue || !adjustmentValue) {
            continue;
        }

        bool inContact = contactFrames.count(frame) > 0;
        float weight = VelocityWeight(regions, frame, energyPreservation, inContact);
        result[frame] = *baseValue + (*adjustmentValue - *baseValue) * weight * influence;
    }

    return result;
}

std::optional<FrameValues> BlendingEngine::LayeredAdjustments(const ICurve* base,
                                                              const AdjustmentLayerStack& layers,
                                                              float globalInfluence,
                                                              const std::vector<ICurve*>& contactCurves) const {
    if (!base) {
        return std::nullopt;
    }

    FrameValues result;
    auto range = TryRange(*base);
    if (!range) {
        return result;
    }

    const auto& stack = layers.GetLayers();

    // Overlay layers blend against the whole base curve, so resolve them once
    std::vector<std::optional<FrameValues>> overlays(stack.size());
    for (size_t i = 0; i < stack.size(); ++i) {
        const AdjustmentLayer& layer = *stack[i];
        if (layer.GetBlendMode() != AdjustmentLayer::BlendMode::Overlay ||
            !layer.IsActive() || !layer.IsVisible() || !layer.HasSourceCurve()) {
            continue;
        }

        std::set<int> contactFrames;
        if (layer.GetPreserveContacts() && contactCurves.size() >= 3) {
            contactFrames = CollectContactFrames(contactCurves, layer);
        }

        overlays[i] = VelocityAwareBlend(*base, *layer.GetSourceCurve(),
                                         layer.GetInfluence() * globalInfluence,
                                         m_energyPreservation * layer.GetVelocitySensitivity(),
                                         contactFrames,
                                         layer.GetEnergyThreshold());
    }

    for (int frame = range->start; frame <= range->end; ++frame) {
        auto baseValue = TryEvaluate(*base, frame);
        if (!baseValue) {
            continue;
        }

        float current = *baseValue;
        for (size_t i = 0; i < stack.size(); ++i) {
            const AdjustmentLayer& layer = *stack[i];
            if (!layer.ContributesAt(frame)) {
                continue;
            }

            if (overlays[i]) {
                auto it = overlays[i]->find(frame);
                if (it != overlays[i]->end()) {
                    current = it->second;
                }
                continue;
            }

            auto layerValue = TryEvaluate(*layer.GetSourceCurve(), frame);
            if (!layerValue) {
                continue;
            }
            current = ApplyBlendMode(layer.GetBlendMode(), current, *baseValue, *layerValue,
                                     layer.GetInfluence() * globalInfluence);
        }

        result[frame] = current;
    }

    KINETIC_LOG_DEBUG("Folded {} layers into curve {} over [{}, {}]",
                      stack.size(), base->GetId(), range->start, range->end);
    return result;
}

std::set<int> BlendingEngine::CollectContactFrames(const std::vector<ICurve*>& curves,
                                                   const AdjustmentLayer& layer) const {
    std::set<int> frames;
    for (const ContactPhase& phase : m_analyzer.DetectContactPhases(curves, layer.GetContactThreshold())) {
        for (int frame = phase.startFrame; frame <= phase.endFrame; ++frame) {
            frames.insert(frame);
        }
    }
    return frames;
}

// =============================================================================
// Foot Sliding
// =============================================================================

bool BlendingEngine::FixFootSliding(const std::vector<ICurve*>& curves,
                                    const std::vector<int>& slidingFrames,
                                    float influence,
                                    bool preserveMotionFlow) const {
    if (curves.size() < 3 || !curves[0] || !curves[1]) {
        KINETIC_LOG_DEBUG("Sliding fix needs x/y/z curves, got {}", curves.size());
        return false;
    }
    if (slidingFrames.empty()) {
        return false;
    }

    std::vector<int> frames = slidingFrames;
    std::sort(frames.begin(), frames.end());
    frames.erase(std::unique(frames.begin(), frames.end()), frames.end());

    std::vector<FrameRange> runs = ConsecutiveRuns(frames);

    for (const FrameRange& run : runs) {
        float center = static_cast<float>(run.start + run.end) / 2.0f;
        float half = static_cast<float>(run.end - run.start) / 2.0f;

        for (size_t axis = 0; axis < 2; ++axis) {
            ICurve& curve = *curves[axis];

            // Sample the whole run before writing so the target is stable
            std::vector<std::pair<int, float>> samples;
            std::vector<float> values;
            for (int frame = run.start; frame <= run.end; ++frame) {
                if (auto value = TryEvaluate(curve, frame)) {
                    samples.emplace_back(frame, *value);
                    values.push_back(*value);
                }
            }
            if (values.empty()) {
                continue;
            }

            float target = preserveMotionFlow
                ? Percentile(values, 50.0f)
                : std::accumulate(values.begin(), values.end(), 0.0f) / static_cast<float>(values.size());

            for (const auto& [frame, current] : samples) {
                float frameInfluence = influence;
                if (half > 0.0f) {
                    frameInfluence = influence * (1.0f - 0.5f * std::abs(static_cast<float>(frame) - center) / half);
                }

                try {
                    curve.Upsert(frame, Lerp(current, target, frameInfluence));
                } catch (const std::exception& e) {
                    KINETIC_LOG_WARN("Could not write frame {} of curve {}: {}", frame, curve.GetId(), e.what());
                }
            }
        }
    }

    KINETIC_LOG_INFO("Corrected {} sliding frames in {} runs", frames.size(), runs.size());
    return true;
}

} // namespace Kinetic
