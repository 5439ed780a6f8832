#pragma once

#include <string>
#include <vector>

namespace Kinetic {

/**
 * @brief Character of a movement region, decided by peak energy and duration
 */
enum class MotionType {
    Fast,
    Sustained,
    Quick,
    Smooth,
    Slow
};

[[nodiscard]] const char* MotionTypeToString(MotionType type);

/**
 * @brief Contiguous span of frames whose motion energy exceeds a threshold
 */
struct MovementRegion {
    int startFrame = 0;
    int endFrame = 0;           // inclusive
    float peakEnergy = 0.0f;
    MotionType motionType = MotionType::Slow;

    [[nodiscard]] int Duration() const { return endFrame - startFrame + 1; }
    [[nodiscard]] bool Contains(int frame) const { return frame >= startFrame && frame <= endFrame; }

    bool operator==(const MovementRegion& other) const = default;
};

/**
 * @brief Inclusive frame span where a tracked point is grounded
 */
struct ContactPhase {
    int startFrame = 0;
    int endFrame = 0;

    [[nodiscard]] int Duration() const { return endFrame - startFrame + 1; }
    [[nodiscard]] bool Contains(int frame) const { return frame >= startFrame && frame <= endFrame; }

    bool operator==(const ContactPhase& other) const = default;
};

/**
 * @brief Per-frame energy breakdown, all sequences aligned to frames
 */
struct EnergyProfile {
    std::vector<int> frames;
    std::vector<float> kinetic;
    std::vector<float> potential;
    std::vector<float> total;
    std::vector<float> velocity;
    std::vector<float> acceleration;

    [[nodiscard]] size_t Size() const { return frames.size(); }
    [[nodiscard]] bool Empty() const { return frames.empty(); }

    void Reserve(size_t count) {
        frames.reserve(count);
        kinetic.reserve(count);
        potential.reserve(count);
        total.reserve(count);
        velocity.reserve(count);
        acceleration.reserve(count);
    }
};

} // namespace Kinetic
