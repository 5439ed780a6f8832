#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Kinetic {

/**
 * @brief Stable identity of a curve, used as the analysis cache key
 */
using CurveId = uint64_t;

/**
 * @brief Largest key frame magnitude a curve may span
 */
inline constexpr int MaxCurveFrame = 1000000;

/**
 * @brief Inclusive integer frame range
 */
struct FrameRange {
    int start = 0;
    int end = 0;

    [[nodiscard]] bool Contains(int frame) const { return frame >= start && frame <= end; }
    [[nodiscard]] bool IsValid() const { return end >= start; }
    [[nodiscard]] int Length() const { return end - start + 1; }

    bool operator==(const FrameRange& other) const = default;
};

/**
 * @brief Raised by curve adapters when a frame cannot be evaluated
 */
class CurveEvaluationError : public std::runtime_error {
public:
    explicit CurveEvaluationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Capability interface for a single animation channel
 *
 * Implemented by adapters over whatever owns the keyframes. The analysis and
 * blending code only borrows curves for the duration of a call.
 */
class ICurve {
public:
    virtual ~ICurve() = default;

    /**
     * @brief Evaluate the curve at a (possibly fractional) frame
     * @throws CurveEvaluationError if the curve has no valid sample there
     */
    [[nodiscard]] virtual float Evaluate(float frame) const = 0;

    /**
     * @brief Frame range covered by the curve's keyframes
     * @throws CurveEvaluationError if the keys cannot be expressed as frames
     */
    [[nodiscard]] virtual FrameRange GetRange() const = 0;

    /**
     * @brief Write a value at a frame
     *
     * Overwrites a keyframe lying within +/-0.5 frames, otherwise inserts one.
     */
    virtual void Upsert(int frame, float value) = 0;

    /**
     * @brief Identity; no two live curves share one
     */
    [[nodiscard]] virtual CurveId GetId() const = 0;
};

/**
 * @brief Allocate a fresh process-unique curve id
 */
CurveId NextCurveId();

} // namespace Kinetic
