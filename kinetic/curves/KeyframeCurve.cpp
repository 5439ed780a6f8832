#include "curves/KeyframeCurve.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <string>

namespace Kinetic {

CurveId NextCurveId() {
    static std::atomic<CurveId> s_nextId{1};
    return s_nextId.fetch_add(1);
}

const char* CurveInterpolationToString(CurveInterpolation interpolation) {
    switch (interpolation) {
        case CurveInterpolation::Constant:   return "constant";
        case CurveInterpolation::Linear:     return "linear";
        case CurveInterpolation::CatmullRom: return "catmull_rom";
    }
    return "linear";
}

CurveInterpolation StringToCurveInterpolation(const std::string& name) {
    if (name == "constant") return CurveInterpolation::Constant;
    if (name == "catmull_rom" || name == "smooth") return CurveInterpolation::CatmullRom;
    return CurveInterpolation::Linear;
}

namespace {

// Uniform Catmull-Rom with tension 0.5
float CatmullRom(float p0, float p1, float p2, float p3, float t) {
    float m1 = 0.5f * (p2 - p0);
    float m2 = 0.5f * (p3 - p1);
    float t2 = t * t;
    float t3 = t2 * t;
    return (2.0f * t3 - 3.0f * t2 + 1.0f) * p1 +
           (t3 - 2.0f * t2 + t) * m1 +
           (-2.0f * t3 + 3.0f * t2) * p2 +
           (t3 - t2) * m2;
}

} // namespace

// =============================================================================
// KeyframeCurve
// =============================================================================

KeyframeCurve::KeyframeCurve()
    : m_id(NextCurveId()) {
}

KeyframeCurve::KeyframeCurve(std::vector<CurveKey> keys, CurveInterpolation interpolation)
    : m_interpolation(interpolation)
    , m_id(NextCurveId()) {
    SetKeys(std::move(keys));
}

KeyframeCurve::KeyframeCurve(const KeyframeCurve& other)
    : m_keys(other.m_keys)
    , m_interpolation(other.m_interpolation)
    , m_id(NextCurveId()) {
}

KeyframeCurve& KeyframeCurve::operator=(const KeyframeCurve& other) {
    if (this != &other) {
        m_keys = other.m_keys;
        m_interpolation = other.m_interpolation;
        m_id = NextCurveId();
    }
    return *this;
}

KeyframeCurve::KeyframeCurve(KeyframeCurve&& other) noexcept
    : m_keys(std::move(other.m_keys))
    , m_interpolation(other.m_interpolation)
    , m_id(other.m_id) {
    other.m_keys.clear();
    other.m_id = NextCurveId();
}

KeyframeCurve& KeyframeCurve::operator=(KeyframeCurve&& other) noexcept {
    if (this != &other) {
        m_keys = std::move(other.m_keys);
        m_interpolation = other.m_interpolation;
        m_id = other.m_id;
        other.m_keys.clear();
        other.m_id = NextCurveId();
    }
    return *this;
}

KeyframeCurve KeyframeCurve::FromSamples(int startFrame, const std::vector<float>& values,
                                         CurveInterpolation interpolation) {
    std::vector<CurveKey> keys;
    keys.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        keys.push_back({static_cast<float>(startFrame + static_cast<int>(i)), values[i]});
    }
    return KeyframeCurve(std::move(keys), interpolation);
}

void KeyframeCurve::SetKeys(std::vector<CurveKey> keys) {
    m_keys = std::move(keys);
    std::stable_sort(m_keys.begin(), m_keys.end());
}

FrameRange KeyframeCurve::GetRange() const {
    if (m_keys.empty()) {
        // Empty curves report an inverted range so frame loops never run
        return {0, -1};
    }
    const float limit = static_cast<float>(MaxCurveFrame);
    if (m_keys.front().frame < -limit || m_keys.back().frame > limit) {
        throw CurveEvaluationError("Key frames outside +/-" + std::to_string(MaxCurveFrame));
    }
    return {static_cast<int>(std::floor(m_keys.front().frame)),
            static_cast<int>(std::ceil(m_keys.back().frame))};
}

size_t KeyframeCurve::FindSegment(float frame) const {
    auto it = std::upper_bound(m_keys.begin(), m_keys.end(), frame,
                               [](float f, const CurveKey& key) { return f < key.frame; });
    size_t upper = static_cast<size_t>(it - m_keys.begin());
    return upper == 0 ? 0 : upper - 1;
}

float KeyframeCurve::Evaluate(float frame) const {
    if (m_keys.empty()) {
        throw CurveEvaluationError("curve has no keyframes");
    }
    if (!std::isfinite(frame)) {
        throw CurveEvaluationError("non-finite frame");
    }

    if (frame <= m_keys.front().frame) return m_keys.front().value;
    if (frame >= m_keys.back().frame) return m_keys.back().value;

    size_t i = FindSegment(frame);
    const CurveKey& k0 = m_keys[i];
    const CurveKey& k1 = m_keys[i + 1];

    float span = k1.frame - k0.frame;
    float t = span > 1e-6f ? (frame - k0.frame) / span : 0.0f;

    switch (m_interpolation) {
        case CurveInterpolation::Constant:
            return k0.value;

        case CurveInterpolation::Linear:
            return k0.value + (k1.value - k0.value) * t;

        case CurveInterpolation::CatmullRom: {
            float before = i > 0 ? m_keys[i - 1].value : k0.value;
            float after = i + 2 < m_keys.size() ? m_keys[i + 2].value : k1.value;
            return CatmullRom(before, k0.value, k1.value, after, t);
        }
    }
    return k0.value;
}

void KeyframeCurve::Upsert(int frame, float value) {
    float target = static_cast<float>(frame);
    for (auto& key : m_keys) {
        if (std::abs(key.frame - target) < 0.5f) {
            key.value = value;
            return;
        }
    }

    CurveKey key{target, value};
    m_keys.insert(std::upper_bound(m_keys.begin(), m_keys.end(), key), key);
}

} // namespace Kinetic
