#pragma once

#include "analysis/MotionAnalyzer.hpp"
#include "blending/AdjustmentLayer.hpp"
#include "curves/Curve.hpp"
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace Kinetic {

/**
 * @brief Blended value per integer frame
 */
using FrameValues = std::map<int, float>;

/**
 * @brief Motion-aware blending of adjustment curves
 *
 * Blends are weighted by the movement regions of the base curve so that
 * corrections land on the moving parts of an animation and leave holds and
 * ground contacts mostly untouched.
 *
 * The engine borrows a MotionAnalyzer; region and contact queries go through
 * that analyzer's cache.
 */
class BlendingEngine {
public:
    static constexpr float OutsideRegionWeight = 0.05f;
    static constexpr float ContactWeightScale = 0.1f;
    static constexpr float MinRegionWeight = 0.1f;
    static constexpr float MaxRegionWeight = 1.0f;

    explicit BlendingEngine(const MotionAnalyzer& analyzer, float energyPreservation = 1.0f);

    void SetEnergyPreservation(float preservation) { m_energyPreservation = preservation; }
    [[nodiscard]] float GetEnergyPreservation() const { return m_energyPreservation; }

    // =========================================================================
    // Blending
    // =========================================================================

    /**
     * @brief Blend an adjustment into a base curve, weighted by base motion
     *
     * Covers the union of both curve ranges. Frames where either curve fails
     * to evaluate are left out of the result.
     *
     * @param base Curve whose movement regions drive the weights
     * @param adjustment Curve blended toward
     * @param influence Overall strength
     * @param energyPreservation Scales the per-region weight
     * @param contactFrames Frames whose weight is scaled down by ContactWeightScale
     * @param regionThreshold Energy threshold for region detection on the base
     */
    [[nodiscard]] FrameValues VelocityAwareBlend(
        const ICurve& base,
        const ICurve& adjustment,
        float influence = 1.0f,
        float energyPreservation = 1.0f,
        const std::set<int>& contactFrames = {},
        float regionThreshold = AnalysisDefaults::VelocityThreshold) const;

    /**
     * @brief Fold a layer stack into a base curve, frame by frame
     *
     * Layers apply in stack order. A layer is skipped when it is inactive,
     * hidden, has no source curve or its frame range excludes the frame.
     * An empty stack yields the base values unchanged.
     *
     * @param base Base curve; null yields nullopt
     * @param layers Layer stack
     * @param globalInfluence Multiplies every layer's influence
     * @param contactCurves x/y/z curves of the point used for contact
     *        preservation by Overlay layers; may be empty
     */
    [[nodiscard]] std::optional<FrameValues> LayeredAdjustments(
        const ICurve* base,
        const AdjustmentLayerStack& layers,
        float globalInfluence = 1.0f,
        const std::vector<ICurve*>& contactCurves = {}) const;

    /**
     * @brief Pull sliding frames toward a stable horizontal position
     *
     * Frames are grouped into consecutive runs. Each run of the x and y curves
     * is blended toward its median (preserveMotionFlow) or mean, strongest at
     * the run centre and half strength at its edges.
     *
     * @return false for fewer than three curves or no sliding frames
     */
    bool FixFootSliding(const std::vector<ICurve*>& curves,
                        const std::vector<int>& slidingFrames,
                        float influence = 1.0f,
                        bool preserveMotionFlow = true) const;

    /**
     * @brief Frames inside contact phases, detected with the layer's contact threshold
     */
    [[nodiscard]] std::set<int> CollectContactFrames(const std::vector<ICurve*>& curves,
                                                     const AdjustmentLayer& layer) const;

    // =========================================================================
    // Helpers
    // =========================================================================

    /**
     * @brief Blend weight of a frame given the base curve's movement regions
     */
    [[nodiscard]] static float VelocityWeight(const std::vector<MovementRegion>& regions,
                                              int frame,
                                              float energyPreservation,
                                              bool inContact = false);

    [[nodiscard]] static float MotionTypeMultiplier(MotionType type);

    /**
     * @brief Combine a layer value with the running value (non-Overlay modes)
     */
    [[nodiscard]] static float ApplyBlendMode(AdjustmentLayer::BlendMode mode,
                                              float current,
                                              float baseValue,
                                              float layerValue,
                                              float influence);

    [[nodiscard]] static float Lerp(float a, float b, float t) { return a + (b - a) * t; }

    /**
     * @brief Lerp with smoothstep easing of t
     *
     * t is not clamped; outside [0, 1] the cubic keeps extrapolating.
     */
    [[nodiscard]] static float SmoothLerp(float a, float b, float t);

private:
    const MotionAnalyzer& m_analyzer;
    float m_energyPreservation = 1.0f;
};

} // namespace Kinetic
