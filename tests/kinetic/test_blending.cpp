/**
 * @file test_blending.cpp
 * @brief Unit tests for velocity-aware blending, layer folding and sliding correction
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "analysis/AnalysisCache.hpp"
#include "analysis/MotionAnalyzer.hpp"
#include "blending/BlendingEngine.hpp"
#include "curves/KeyframeCurve.hpp"

#include "mocks/MockCurve.hpp"
#include "utils/TestHelpers.hpp"

#include <cmath>
#include <set>

using namespace Kinetic;
using namespace Kinetic::Test;
using ::testing::NiceMock;

using BlendMode = AdjustmentLayer::BlendMode;

// =============================================================================
// Helper Tests
// =============================================================================

TEST(BlendHelpersTest, Lerp) {
    EXPECT_FLOAT_EQ(0.0f, BlendingEngine::Lerp(0.0f, 10.0f, 0.0f));
    EXPECT_FLOAT_EQ(2.5f, BlendingEngine::Lerp(0.0f, 10.0f, 0.25f));
    EXPECT_FLOAT_EQ(10.0f, BlendingEngine::Lerp(0.0f, 10.0f, 1.0f));
}

TEST(BlendHelpersTest, SmoothLerpEases) {
    EXPECT_FLOAT_EQ(0.0f, BlendingEngine::SmoothLerp(0.0f, 10.0f, 0.0f));
    EXPECT_FLOAT_EQ(5.0f, BlendingEngine::SmoothLerp(0.0f, 10.0f, 0.5f));
    EXPECT_FLOAT_EQ(10.0f, BlendingEngine::SmoothLerp(0.0f, 10.0f, 1.0f));
    // smoothstep(0.25) = 0.15625
    EXPECT_FLOAT_EQ(1.5625f, BlendingEngine::SmoothLerp(0.0f, 10.0f, 0.25f));
}

TEST(BlendHelpersTest, SmoothLerpExtrapolatesOutsideUnitRange) {
    // t^2 (3 - 2t): -4 at t = 2, 5 at t = -1
    EXPECT_FLOAT_EQ(-40.0f, BlendingEngine::SmoothLerp(0.0f, 10.0f, 2.0f));
    EXPECT_FLOAT_EQ(50.0f, BlendingEngine::SmoothLerp(0.0f, 10.0f, -1.0f));
}

TEST(BlendHelpersTest, VelocityWeightOutsideRegions) {
    EXPECT_FLOAT_EQ(BlendingEngine::OutsideRegionWeight,
                    BlendingEngine::VelocityWeight({}, 5, 1.0f));
    EXPECT_FLOAT_EQ(BlendingEngine::OutsideRegionWeight * BlendingEngine::ContactWeightScale,
                    BlendingEngine::VelocityWeight({}, 5, 1.0f, true));
}

TEST(BlendHelpersTest, VelocityWeightByMotionType) {
    MovementRegion region;
    region.startFrame = 0;
    region.endFrame = 10;
    region.peakEnergy = 1.0f;

    region.motionType = MotionType::Quick;
    EXPECT_FLOAT_EQ(0.45f, BlendingEngine::VelocityWeight({region}, 5, 1.0f));

    region.motionType = MotionType::Slow;
    EXPECT_FLOAT_EQ(0.3f, BlendingEngine::VelocityWeight({region}, 5, 1.0f));

    // Clamped to [0.1, 1.0]
    region.peakEnergy = 4.0f;
    region.motionType = MotionType::Fast;
    EXPECT_FLOAT_EQ(1.0f, BlendingEngine::VelocityWeight({region}, 5, 1.0f));

    region.peakEnergy = 0.05f;
    region.motionType = MotionType::Slow;
    EXPECT_FLOAT_EQ(0.1f, BlendingEngine::VelocityWeight({region}, 5, 1.0f));
}

TEST(BlendHelpersTest, MotionTypeMultipliers) {
    EXPECT_FLOAT_EQ(1.2f, BlendingEngine::MotionTypeMultiplier(MotionType::Fast));
    EXPECT_FLOAT_EQ(1.0f, BlendingEngine::MotionTypeMultiplier(MotionType::Sustained));
    EXPECT_FLOAT_EQ(0.9f, BlendingEngine::MotionTypeMultiplier(MotionType::Quick));
    EXPECT_FLOAT_EQ(0.8f, BlendingEngine::MotionTypeMultiplier(MotionType::Smooth));
    EXPECT_FLOAT_EQ(0.6f, BlendingEngine::MotionTypeMultiplier(MotionType::Slow));
}

// =============================================================================
// Blend Mode Arithmetic
// =============================================================================

TEST(BlendModeTest, BaseTwoLayerThree) {
    struct Case {
        BlendMode mode;
        float influence;
        float expected;
    };

    const Case cases[] = {
        {BlendMode::Add, 0.0f, 2.0f},
        {BlendMode::Add, 0.5f, 2.5f},
        {BlendMode::Add, 1.0f, 3.0f},
        {BlendMode::Subtract, 0.0f, 2.0f},
        {BlendMode::Subtract, 0.5f, 1.5f},
        {BlendMode::Subtract, 1.0f, 1.0f},
        {BlendMode::Multiply, 0.0f, 2.0f},
        {BlendMode::Multiply, 0.5f, 4.0f},
        {BlendMode::Multiply, 1.0f, 6.0f},
        {BlendMode::Replace, 0.0f, 2.0f},
        {BlendMode::Replace, 0.5f, 2.5f},
        {BlendMode::Replace, 1.0f, 3.0f},
        {BlendMode::Screen, 0.0f, 2.0f},
        {BlendMode::Screen, 0.5f, 0.5f},
        {BlendMode::Screen, 1.0f, -1.0f},
    };

    for (const Case& c : cases) {
        float result = BlendingEngine::ApplyBlendMode(c.mode, 2.0f, 2.0f, 3.0f, c.influence);
        EXPECT_NEAR(c.expected, result, 1e-5f) << BlendModeToString(c.mode)
                                               << " at influence " << c.influence;
    }
}

TEST(BlendModeTest, OverlayIsLeftToTheEngine) {
    EXPECT_FLOAT_EQ(2.0f, BlendingEngine::ApplyBlendMode(BlendMode::Overlay, 2.0f, 2.0f, 3.0f, 1.0f));
}

// =============================================================================
// Engine Fixture
// =============================================================================

class BlendingEngineTest : public ::testing::Test {
protected:
    AnalysisCache cache;
    MotionAnalyzer analyzer{&cache};
    BlendingEngine engine{analyzer};
};

// =============================================================================
// VelocityAwareBlend Tests
// =============================================================================

TEST_F(BlendingEngineTest, StillBaseBarelyMoves) {
    KeyframeCurve base = MakeConstantCurve(0, 20, 0.0f);
    KeyframeCurve adjustment = MakeConstantCurve(0, 20, 1.0f);

    FrameValues result = engine.VelocityAwareBlend(base, adjustment, 1.0f);

    ASSERT_EQ(21u, result.size());
    for (const auto& [frame, value] : result) {
        EXPECT_FLOAT_EQ(BlendingEngine::OutsideRegionWeight, value) << "frame " << frame;
    }
}

TEST_F(BlendingEngineTest, MovingBaseTakesMoreAdjustment) {
    KeyframeCurve base = MakeBurstCurve();
    KeyframeCurve adjustment = MakeConstantCurve(0, 60, 1.0f);

    FrameValues result = engine.VelocityAwareBlend(base, adjustment, 1.0f);

    // Frame 5 is a hold, frame 30 is inside the fast burst
    float holdOffset = result.at(5) - base.Evaluate(5.0f);
    float burstOffset = result.at(30) - base.Evaluate(30.0f);
    EXPECT_NEAR(BlendingEngine::OutsideRegionWeight, holdOffset, 1e-5f);
    EXPECT_GT(std::abs(burstOffset), std::abs(holdOffset));
}

TEST_F(BlendingEngineTest, ZeroInfluenceReturnsBase) {
    KeyframeCurve base = MakeBurstCurve();
    KeyframeCurve adjustment = MakeConstantCurve(0, 60, 5.0f);

    FrameValues result = engine.VelocityAwareBlend(base, adjustment, 0.0f);

    for (const auto& [frame, value] : result) {
        EXPECT_FLOAT_EQ(base.Evaluate(static_cast<float>(frame)), value);
    }
}

TEST_F(BlendingEngineTest, ContactFramesAreDampened) {
    KeyframeCurve base = MakeConstantCurve(0, 10, 0.0f);
    KeyframeCurve adjustment = MakeConstantCurve(0, 10, 1.0f);

    FrameValues result = engine.VelocityAwareBlend(base, adjustment, 1.0f, 1.0f, {3, 4});

    EXPECT_FLOAT_EQ(BlendingEngine::OutsideRegionWeight * BlendingEngine::ContactWeightScale, result.at(3));
    EXPECT_FLOAT_EQ(BlendingEngine::OutsideRegionWeight, result.at(5));
}

TEST_F(BlendingEngineTest, CoversUnionOfRanges) {
    KeyframeCurve base = MakeConstantCurve(0, 10, 0.0f);
    KeyframeCurve adjustment = MakeConstantCurve(5, 20, 1.0f);

    FrameValues result = engine.VelocityAwareBlend(base, adjustment);

    EXPECT_EQ(0, result.begin()->first);
    EXPECT_EQ(20, result.rbegin()->first);
}

// =============================================================================
// LayeredAdjustments Tests
// =============================================================================

TEST_F(BlendingEngineTest, NullBaseIsUnavailable) {
    AdjustmentLayerStack stack;

    EXPECT_FALSE(engine.LayeredAdjustments(nullptr, stack).has_value());
}

TEST_F(BlendingEngineTest, EmptyStackIsIdentity) {
    KeyframeCurve base = MakeBurstCurve();
    AdjustmentLayerStack stack;

    auto result = engine.LayeredAdjustments(&base, stack);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(61u, result->size());
    for (const auto& [frame, value] : *result) {
        EXPECT_FLOAT_EQ(base.Evaluate(static_cast<float>(frame)), value);
    }
}

TEST_F(BlendingEngineTest, SkippedLayersAreIdentity) {
    KeyframeCurve base = MakeConstantCurve(0, 10, 2.0f);
    KeyframeCurve source = MakeConstantCurve(0, 10, 3.0f);
    AdjustmentLayerStack stack;

    stack.AddLayer("inactive");
    stack.GetLayer(0)->SetBlendMode(BlendMode::Add);
    stack.GetLayer(0)->SetSourceCurve(&source);
    stack.GetLayer(0)->SetActive(false);

    stack.AddLayer("hidden");
    stack.GetLayer(1)->SetBlendMode(BlendMode::Add);
    stack.GetLayer(1)->SetSourceCurve(&source);
    stack.GetLayer(1)->SetVisible(false);

    stack.AddLayer("no source");
    stack.GetLayer(2)->SetBlendMode(BlendMode::Add);

    auto result = engine.LayeredAdjustments(&base, stack);

    ASSERT_TRUE(result.has_value());
    for (const auto& [frame, value] : *result) {
        EXPECT_FLOAT_EQ(2.0f, value);
    }
}

TEST_F(BlendingEngineTest, AddLayerWithGlobalInfluence) {
    KeyframeCurve base = MakeConstantCurve(0, 10, 2.0f);
    KeyframeCurve source = MakeConstantCurve(0, 10, 3.0f);
    AdjustmentLayerStack stack;
    stack.AddLayer("add");
    stack.GetLayer(0)->SetBlendMode(BlendMode::Add);
    stack.GetLayer(0)->SetSourceCurve(&source);
    stack.GetLayer(0)->SetInfluence(1.0f);

    auto result = engine.LayeredAdjustments(&base, stack, 0.5f);

    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(2.5f, result->at(4));
}

TEST_F(BlendingEngineTest, LayersApplyInStackOrder) {
    KeyframeCurve base = MakeConstantCurve(0, 10, 2.0f);
    KeyframeCurve three = MakeConstantCurve(0, 10, 3.0f);
    KeyframeCurve half = MakeConstantCurve(0, 10, 0.5f);
    AdjustmentLayerStack stack;

    stack.AddLayer("add");
    stack.GetLayer(0)->SetBlendMode(BlendMode::Add);
    stack.GetLayer(0)->SetSourceCurve(&three);

    stack.AddLayer("scale");
    stack.GetLayer(1)->SetBlendMode(BlendMode::Multiply);
    stack.GetLayer(1)->SetSourceCurve(&half);

    auto result = engine.LayeredAdjustments(&base, stack);

    // (2 + (3 - 2)) * 0.5
    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(1.5f, result->at(0));
}

TEST_F(BlendingEngineTest, FrameRangeLimitsLayer) {
    KeyframeCurve base = MakeConstantCurve(0, 10, 2.0f);
    KeyframeCurve source = MakeConstantCurve(0, 10, 3.0f);
    AdjustmentLayerStack stack;
    stack.AddLayer("ranged");
    stack.GetLayer(0)->SetBlendMode(BlendMode::Replace);
    stack.GetLayer(0)->SetSourceCurve(&source);
    stack.GetLayer(0)->SetFrameRange(3, 5);

    auto result = engine.LayeredAdjustments(&base, stack);

    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(2.0f, result->at(2));
    EXPECT_FLOAT_EQ(3.0f, result->at(3));
    EXPECT_FLOAT_EQ(3.0f, result->at(5));
    EXPECT_FLOAT_EQ(2.0f, result->at(6));
}

TEST_F(BlendingEngineTest, FailingLayerDoesNotContribute) {
    KeyframeCurve base = MakeConstantCurve(0, 10, 2.0f);
    NiceMock<MockCurve> broken;
    broken.ThrowOnEvaluate(FrameRange{0, 10});

    AdjustmentLayerStack stack;
    stack.AddLayer("broken");
    stack.GetLayer(0)->SetBlendMode(BlendMode::Add);
    stack.GetLayer(0)->SetSourceCurve(&broken);

    auto result = engine.LayeredAdjustments(&base, stack);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(11u, result->size());
    EXPECT_FLOAT_EQ(2.0f, result->at(7));
}

TEST_F(BlendingEngineTest, OverlayLayerFollowsVelocityWeights) {
    KeyframeCurve base = MakeConstantCurve(0, 10, 0.0f);
    KeyframeCurve source = MakeConstantCurve(0, 10, 1.0f);
    AdjustmentLayerStack stack;
    stack.AddLayer("overlay");
    stack.GetLayer(0)->SetSourceCurve(&source);

    auto result = engine.LayeredAdjustments(&base, stack);

    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(BlendingEngine::OutsideRegionWeight, result->at(5));
}

TEST_F(BlendingEngineTest, CollectContactFramesUsesLayerThreshold) {
    KeyframeCurve x = MakeConstantCurve(0, 20, 0.0f);
    KeyframeCurve y = MakeConstantCurve(0, 20, 0.0f);
    KeyframeCurve z = MakeLiftOffCurve();
    AdjustmentLayer layer;

    std::set<int> frames = engine.CollectContactFrames({&x, &y, &z}, layer);

    ASSERT_EQ(11u, frames.size());
    EXPECT_EQ(0, *frames.begin());
    EXPECT_EQ(10, *frames.rbegin());
}

TEST_F(BlendingEngineTest, OverlayDampensContactFrames) {
    KeyframeCurve x = MakeConstantCurve(0, 20, 0.0f);
    KeyframeCurve y = MakeConstantCurve(0, 20, 0.0f);
    KeyframeCurve z = MakeLiftOffCurve();
    KeyframeCurve source = MakeConstantCurve(0, 20, 1.0f);
    AdjustmentLayerStack stack;
    stack.AddLayer("overlay");
    stack.GetLayer(0)->SetSourceCurve(&source);

    auto result = engine.LayeredAdjustments(&x, stack, 1.0f, {&x, &y, &z});

    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(BlendingEngine::OutsideRegionWeight * BlendingEngine::ContactWeightScale, result->at(5));
    EXPECT_FLOAT_EQ(BlendingEngine::OutsideRegionWeight, result->at(15));

    stack.GetLayer(0)->SetPreserveContacts(false);
    result = engine.LayeredAdjustments(&x, stack, 1.0f, {&x, &y, &z});
    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(BlendingEngine::OutsideRegionWeight, result->at(5));
}

// =============================================================================
// FixFootSliding Tests
// =============================================================================

class FootSlidingFixTest : public BlendingEngineTest {
protected:
    void SetUp() override {
        x = KeyframeCurve::FromSamples(10, {5.1f, 4.9f, 5.1f, 4.9f, 5.1f, 5.0f, 4.9f, 5.1f, 4.9f, 5.1f, 4.9f});
        y = MakeConstantCurve(10, 20, 1.0f);
        z = MakeConstantCurve(10, 20, 0.0f);
    }

    std::vector<ICurve*> Point() { return {&x, &y, &z}; }

    std::vector<int> Frames(int start, int end) {
        std::vector<int> frames;
        for (int f = start; f <= end; ++f) frames.push_back(f);
        return frames;
    }

    KeyframeCurve x;
    KeyframeCurve y;
    KeyframeCurve z;
};

TEST_F(FootSlidingFixTest, ConvergesTowardMedian) {
    ASSERT_TRUE(engine.FixFootSliding(Point(), Frames(10, 20), 1.0f, true));

    // Centre takes full influence, edges half
    EXPECT_NEAR(5.0f, x.Evaluate(15.0f), 1e-5f);
    EXPECT_NEAR(5.05f, x.Evaluate(10.0f), 1e-5f);
    EXPECT_NEAR(4.95f, x.Evaluate(20.0f), 1e-5f);
    EXPECT_NEAR(1.0f, y.Evaluate(15.0f), 1e-5f);
}

TEST_F(FootSlidingFixTest, ReducesSpreadAroundTarget) {
    ASSERT_TRUE(engine.FixFootSliding(Point(), Frames(10, 20), 1.0f, true));

    for (int f = 10; f <= 20; ++f) {
        EXPECT_LE(std::abs(x.Evaluate(static_cast<float>(f)) - 5.0f), 0.05f + 1e-5f) << "frame " << f;
    }
}

TEST_F(FootSlidingFixTest, MeanTargetWithoutMotionFlow) {
    x = KeyframeCurve::FromSamples(0, {0.0f, 0.0f, 6.0f, 6.0f});
    y = MakeConstantCurve(0, 3, 0.0f);

    ASSERT_TRUE(engine.FixFootSliding(Point(), {0, 1, 2}, 1.0f, false));

    // Mean of the run is 2; the median would be 0
    EXPECT_NEAR(1.0f, x.Evaluate(0.0f), 1e-5f);
    EXPECT_NEAR(2.0f, x.Evaluate(1.0f), 1e-5f);
    EXPECT_NEAR(4.0f, x.Evaluate(2.0f), 1e-5f);
    EXPECT_FLOAT_EQ(6.0f, x.Evaluate(3.0f));
}

TEST_F(FootSlidingFixTest, SeparateRunsUseTheirOwnTargets) {
    x = KeyframeCurve::FromSamples(0, {1.0f, 1.2f, 1.0f, 9.0f, 9.0f, 3.0f, 3.4f, 3.0f});
    y = MakeConstantCurve(0, 7, 0.0f);

    ASSERT_TRUE(engine.FixFootSliding(Point(), {0, 1, 2, 5, 6, 7}, 1.0f, true));

    EXPECT_NEAR(1.0f, x.Evaluate(1.0f), 1e-5f);
    EXPECT_NEAR(3.0f, x.Evaluate(6.0f), 1e-5f);
    EXPECT_FLOAT_EQ(9.0f, x.Evaluate(3.0f));
}

TEST_F(FootSlidingFixTest, RejectsInsufficientInput) {
    EXPECT_FALSE(engine.FixFootSliding({&x, &y}, Frames(10, 20)));
    EXPECT_FALSE(engine.FixFootSliding(Point(), {}));
}
