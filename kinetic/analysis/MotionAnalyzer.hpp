#pragma once

#include "analysis/AnalysisCache.hpp"
#include "analysis/MotionTypes.hpp"
#include "curves/Curve.hpp"
#include <optional>
#include <vector>
#include <glm/glm.hpp>

namespace Kinetic {

/**
 * @brief Defaults for the analysis entry points
 */
struct AnalysisDefaults {
    static constexpr int VelocityWindow = 2;
    static constexpr float VelocityThreshold = 0.1f;
    static constexpr int MinRegionDuration = 3;
    static constexpr float GroundThreshold = 0.05f;
    static constexpr float StabilityThreshold = 0.02f;
    static constexpr float SlidingSensitivity = 1.0f;
    static constexpr int MinContactDuration = 3;
    static constexpr float GroundPercentile = 25.0f;
};

/**
 * @brief Motion analysis over animation curves
 *
 * Estimates derivatives, segments curves into movement regions, finds ground
 * contacts of a tracked point and flags contact phases that slide.
 *
 * Multi-curve entry points take a tracked point as its x/y/z curves in that
 * order; z is the vertical axis. Fewer than three curves yields an empty
 * result rather than an error.
 *
 * Region and contact detection are memoized in the AnalysisCache passed at
 * construction. Without a cache every call recomputes.
 */
class MotionAnalyzer {
public:
    explicit MotionAnalyzer(AnalysisCache* cache = nullptr);

    // =========================================================================
    // Derivatives
    // =========================================================================

    /**
     * @brief First derivative at a frame
     *
     * Central difference when both f-w and f+w are inside the curve range,
     * forward difference near the start, backward difference near the end.
     * Any evaluation failure yields 0.0; this never throws.
     */
    [[nodiscard]] static float Velocity(const ICurve& curve, float frame,
                                        int window = AnalysisDefaults::VelocityWindow);

    /**
     * @brief Second derivative as the velocity of the velocity, same window
     */
    [[nodiscard]] static float Acceleration(const ICurve& curve, float frame,
                                            int window = AnalysisDefaults::VelocityWindow);

    /**
     * @brief Evaluate without throwing, returning fallback on failure
     */
    [[nodiscard]] static float SafeEvaluate(const ICurve& curve, float frame, float fallback = 0.0f);

    // =========================================================================
    // Segmentation
    // =========================================================================

    /**
     * @brief Find spans where |v| + 0.5|a| exceeds the threshold
     * @param curve Curve to scan over every integer frame of its range
     * @param velocityThreshold Energy threshold
     * @param minDuration Shortest region kept, in frames
     */
    [[nodiscard]] std::vector<MovementRegion> DetectMovementRegions(
        const ICurve& curve,
        float velocityThreshold = AnalysisDefaults::VelocityThreshold,
        int minDuration = AnalysisDefaults::MinRegionDuration) const;

    /**
     * @brief Classify a region from its peak energy, length and mean |velocity|
     */
    [[nodiscard]] static MotionType ClassifyMotion(float peakEnergy, int duration, float averageVelocity);

    // =========================================================================
    // Contacts
    // =========================================================================

    /**
     * @brief Grounded phases of a tracked point
     *
     * Ground level is the 25th percentile of the sampled heights. A frame
     * enters contact below ground + groundThreshold with |vz| under the
     * stability threshold, and leaves only when |vz| exceeds twice that or the
     * height exceeds 1.5x the adaptive threshold.
     */
    [[nodiscard]] std::vector<ContactPhase> DetectContactPhases(
        const std::vector<ICurve*>& curves,
        float groundThreshold = AnalysisDefaults::GroundThreshold,
        float stabilityThreshold = AnalysisDefaults::StabilityThreshold) const;

    /**
     * @brief Frames of contact phases whose horizontal motion is too large
     *
     * Phases come from DetectContactPhases with the given thresholds, so
     * every reported frame lies inside one of those phases.
     *
     * @return Ascending frame numbers
     */
    [[nodiscard]] std::vector<int> DetectFootSliding(
        const std::vector<ICurve*>& curves,
        float sensitivity = AnalysisDefaults::SlidingSensitivity,
        float groundThreshold = AnalysisDefaults::GroundThreshold,
        float stabilityThreshold = AnalysisDefaults::StabilityThreshold) const;

    // =========================================================================
    // Energy
    // =========================================================================

    /**
     * @brief Per-frame kinetic/potential energy over a set of curves
     *
     * Curves are read as consecutive x/y/z triples; every third curve counts
     * as a height for potential energy. Defaults to the union of the curve
     * ranges.
     */
    [[nodiscard]] EnergyProfile CalculateEnergyProfile(
        const std::vector<ICurve*>& curves,
        std::optional<FrameRange> frameRange = std::nullopt) const;

    /**
     * @brief Position of a tracked point at a frame, fail-soft per axis
     */
    [[nodiscard]] static glm::vec3 SamplePoint(const std::vector<ICurve*>& curves, float frame);

    [[nodiscard]] AnalysisCache* GetCache() const { return m_cache; }
    void SetCache(AnalysisCache* cache) { m_cache = cache; }

private:
    [[nodiscard]] std::vector<MovementRegion> ScanMovementRegions(
        const ICurve& curve, float velocityThreshold, int minDuration) const;

    [[nodiscard]] std::vector<ContactPhase> ScanContactPhases(
        const ICurve& vertical, float groundThreshold, float stabilityThreshold) const;

    AnalysisCache* m_cache = nullptr;
};

/**
 * @brief Linearly interpolated percentile (0-100) of a sample set
 */
[[nodiscard]] float Percentile(std::vector<float> values, float percentile);

} // namespace Kinetic
