#pragma once

#include "curves/Curve.hpp"
#include <string>
#include <vector>

namespace Kinetic {

/**
 * @brief Scalar keyframe
 */
struct CurveKey {
    float frame = 0.0f;
    float value = 0.0f;

    bool operator<(const CurveKey& other) const { return frame < other.frame; }
};

/**
 * @brief Interpolation between consecutive keys
 */
enum class CurveInterpolation {
    Constant,
    Linear,
    CatmullRom
};

[[nodiscard]] const char* CurveInterpolationToString(CurveInterpolation interpolation);
[[nodiscard]] CurveInterpolation StringToCurveInterpolation(const std::string& name);

/**
 * @brief In-memory keyframe curve implementing ICurve
 *
 * Values before the first key and after the last key hold the end values.
 * Copies receive a new identity so they never alias a cached analysis of the
 * original.
 */
class KeyframeCurve : public ICurve {
public:
    KeyframeCurve();
    explicit KeyframeCurve(std::vector<CurveKey> keys,
                           CurveInterpolation interpolation = CurveInterpolation::Linear);

    KeyframeCurve(const KeyframeCurve& other);
    KeyframeCurve& operator=(const KeyframeCurve& other);
    KeyframeCurve(KeyframeCurve&& other) noexcept;
    KeyframeCurve& operator=(KeyframeCurve&& other) noexcept;

    /**
     * @brief Build a curve with one key per integer frame starting at startFrame
     */
    static KeyframeCurve FromSamples(int startFrame, const std::vector<float>& values,
                                     CurveInterpolation interpolation = CurveInterpolation::Linear);

    // ICurve
    [[nodiscard]] float Evaluate(float frame) const override;
    [[nodiscard]] FrameRange GetRange() const override;
    void Upsert(int frame, float value) override;
    [[nodiscard]] CurveId GetId() const override { return m_id; }

    void SetKeys(std::vector<CurveKey> keys);
    [[nodiscard]] const std::vector<CurveKey>& GetKeys() const { return m_keys; }
    [[nodiscard]] size_t GetKeyCount() const { return m_keys.size(); }

    void SetInterpolation(CurveInterpolation interpolation) { m_interpolation = interpolation; }
    [[nodiscard]] CurveInterpolation GetInterpolation() const { return m_interpolation; }

private:
    [[nodiscard]] size_t FindSegment(float frame) const;

    std::vector<CurveKey> m_keys;
    CurveInterpolation m_interpolation = CurveInterpolation::Linear;
    CurveId m_id;
};

} // namespace Kinetic
