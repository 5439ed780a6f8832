/**
 * @file test_layer_stack.cpp
 * @brief Unit tests for adjustment layers and the layer stack
 */

#include <gtest/gtest.h>

#include "blending/AdjustmentLayer.hpp"
#include "curves/KeyframeCurve.hpp"

#include "utils/TestHelpers.hpp"

#include <memory>

using namespace Kinetic;
using namespace Kinetic::Test;

using BlendMode = AdjustmentLayer::BlendMode;
using MoveDirection = AdjustmentLayerStack::MoveDirection;

// =============================================================================
// AdjustmentLayer Tests
// =============================================================================

TEST(AdjustmentLayerTest, Defaults) {
    AdjustmentLayer layer("Cleanup");

    EXPECT_EQ("Cleanup", layer.GetName());
    EXPECT_EQ(BlendMode::Overlay, layer.GetBlendMode());
    EXPECT_FLOAT_EQ(1.0f, layer.GetInfluence());
    EXPECT_TRUE(layer.IsActive());
    EXPECT_TRUE(layer.IsVisible());
    EXPECT_TRUE(layer.GetPreserveContacts());
    EXPECT_FALSE(layer.HasSourceCurve());
    EXPECT_FALSE(layer.GetFrameRange().has_value());
}

TEST(AdjustmentLayerTest, InfluenceIsNotClamped) {
    AdjustmentLayer layer;
    layer.SetInfluence(1.75f);

    EXPECT_FLOAT_EQ(1.75f, layer.GetInfluence());
}

TEST(AdjustmentLayerTest, ContributesOnlyWithSourceInsideRange) {
    KeyframeCurve source = MakeConstantCurve(0, 10, 1.0f);
    AdjustmentLayer layer;

    EXPECT_FALSE(layer.ContributesAt(5));

    layer.SetSourceCurve(&source);
    EXPECT_TRUE(layer.ContributesAt(5));

    layer.SetFrameRange(6, 8);
    EXPECT_FALSE(layer.ContributesAt(5));
    EXPECT_TRUE(layer.ContributesAt(6));
    EXPECT_TRUE(layer.ContributesAt(8));

    layer.ClearFrameRange();
    layer.SetActive(false);
    EXPECT_FALSE(layer.ContributesAt(5));
}

TEST(AdjustmentLayerTest, EnumNames) {
    EXPECT_STREQ("multiply", BlendModeToString(BlendMode::Multiply));
    EXPECT_EQ(BlendMode::Screen, BlendModeFromString("screen").value_or(BlendMode::Overlay));
    EXPECT_FALSE(BlendModeFromString("dodge").has_value());

    EXPECT_EQ(AdjustmentLayer::LayerType::FootContact,
              LayerTypeFromString("foot_contact").value_or(AdjustmentLayer::LayerType::General));
    EXPECT_EQ(AdjustmentLayer::TargetScope::Location,
              TargetScopeFromString("location").value_or(AdjustmentLayer::TargetScope::Custom));
}

// =============================================================================
// AdjustmentLayerStack Tests
// =============================================================================

class LayerStackTest : public ::testing::Test {
protected:
    void SetUp() override {
        stack.AddLayer("A");
        stack.AddLayer("B");
        stack.AddLayer("C");
    }

    std::string NameAt(size_t index) const { return stack.GetLayer(index)->GetName(); }

    AdjustmentLayerStack stack;
};

TEST_F(LayerStackTest, AddMakesLayerActive) {
    EXPECT_EQ(3u, stack.GetLayerCount());
    EXPECT_EQ(2u, stack.GetActiveIndex());
    EXPECT_EQ("C", stack.GetActiveLayer()->GetName());

    size_t index = stack.AddLayer(std::make_unique<AdjustmentLayer>("D"));
    EXPECT_EQ(3u, index);
    EXPECT_EQ(3u, stack.GetActiveIndex());
}

TEST_F(LayerStackTest, RemoveClampsActiveIndex) {
    stack.RemoveLayer(2);

    EXPECT_EQ(2u, stack.GetLayerCount());
    EXPECT_EQ(1u, stack.GetActiveIndex());
    EXPECT_EQ(-1, stack.GetLayerIndex("C"));
}

TEST_F(LayerStackTest, RemoveOutOfRangeIsIgnored) {
    stack.RemoveLayer(10);

    EXPECT_EQ(3u, stack.GetLayerCount());
}

TEST_F(LayerStackTest, RemoveLastLayerResetsActive) {
    stack.RemoveLayer(0);
    stack.RemoveLayer(0);
    stack.RemoveLayer(0);

    EXPECT_TRUE(stack.IsEmpty());
    EXPECT_EQ(0u, stack.GetActiveIndex());
    EXPECT_EQ(nullptr, stack.GetActiveLayer());
}

TEST_F(LayerStackTest, MoveSwapsAndFollows) {
    stack.MoveLayer(2, MoveDirection::Up);

    EXPECT_EQ("C", NameAt(1));
    EXPECT_EQ("B", NameAt(2));
    EXPECT_EQ(1u, stack.GetActiveIndex());

    stack.MoveLayer(0, MoveDirection::Down);
    EXPECT_EQ("C", NameAt(0));
    EXPECT_EQ("A", NameAt(1));
    EXPECT_EQ(1u, stack.GetActiveIndex());
}

TEST_F(LayerStackTest, MoveAtBoundaryIsNoOp) {
    stack.MoveLayer(0, MoveDirection::Up);
    stack.MoveLayer(2, MoveDirection::Down);

    EXPECT_EQ("A", NameAt(0));
    EXPECT_EQ("C", NameAt(2));
    EXPECT_EQ(2u, stack.GetActiveIndex());
}

TEST_F(LayerStackTest, DuplicateAppendsCopy) {
    stack.GetLayer(0)->SetInfluence(0.4f);
    stack.GetLayer(0)->SetBlendMode(BlendMode::Add);

    auto index = stack.DuplicateLayer(0);

    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(3u, *index);
    EXPECT_EQ("A Copy", NameAt(3));
    EXPECT_FLOAT_EQ(0.4f, stack.GetLayer(3)->GetInfluence());
    EXPECT_EQ(BlendMode::Add, stack.GetLayer(3)->GetBlendMode());
    EXPECT_FALSE(stack.DuplicateLayer(42).has_value());
}

TEST_F(LayerStackTest, SoloTogglesVisibility) {
    stack.SoloLayer(1);

    EXPECT_TRUE(stack.IsInSoloMode());
    EXPECT_EQ(1u, stack.GetActiveIndex());
    EXPECT_FALSE(stack.GetLayer(0)->IsVisible());
    EXPECT_TRUE(stack.GetLayer(1)->IsVisible());
    EXPECT_FALSE(stack.GetLayer(2)->IsVisible());

    stack.SoloLayer(1);

    EXPECT_FALSE(stack.IsInSoloMode());
    for (const auto& layer : stack.GetLayers()) {
        EXPECT_TRUE(layer->IsVisible());
    }
}

TEST_F(LayerStackTest, ClearResetsEverything) {
    stack.SoloLayer(0);
    stack.ClearLayers();

    EXPECT_TRUE(stack.IsEmpty());
    EXPECT_EQ(0u, stack.GetActiveIndex());
    EXPECT_FALSE(stack.IsInSoloMode());
}

TEST_F(LayerStackTest, LookupByName) {
    EXPECT_EQ(1, stack.GetLayerIndex("B"));
    ASSERT_NE(nullptr, stack.GetLayer("B"));
    EXPECT_EQ(nullptr, stack.GetLayer("Z"));
}

// =============================================================================
// Serialization Tests
// =============================================================================

TEST_F(LayerStackTest, JsonRestoresSettings) {
    AdjustmentLayer* layer = stack.GetLayer(1);
    layer->SetBlendMode(BlendMode::Screen);
    layer->SetLayerType(AdjustmentLayer::LayerType::RootMotion);
    layer->SetInfluence(0.25f);
    layer->SetActive(false);
    layer->SetFrameRange(4, 12);
    layer->SetContactThreshold(0.02f);

    std::string json = stack.ToJson();

    AdjustmentLayerStack restored;
    ASSERT_TRUE(restored.FromJson(json));
    ASSERT_EQ(3u, restored.GetLayerCount());
    EXPECT_EQ(2u, restored.GetActiveIndex());

    const AdjustmentLayer* loaded = restored.GetLayer(1);
    EXPECT_EQ("B", loaded->GetName());
    EXPECT_EQ(BlendMode::Screen, loaded->GetBlendMode());
    EXPECT_EQ(AdjustmentLayer::LayerType::RootMotion, loaded->GetLayerType());
    EXPECT_FLOAT_EQ(0.25f, loaded->GetInfluence());
    EXPECT_FALSE(loaded->IsActive());
    EXPECT_FLOAT_EQ(0.02f, loaded->GetContactThreshold());
    ASSERT_TRUE(loaded->GetFrameRange().has_value());
    EXPECT_EQ(4, loaded->GetFrameRange()->start);
    EXPECT_EQ(12, loaded->GetFrameRange()->end);
    EXPECT_FALSE(loaded->HasSourceCurve());
}

TEST_F(LayerStackTest, MalformedJsonLeavesStackUnchanged) {
    EXPECT_FALSE(stack.FromJson("{ \"layers\": [ "));
    EXPECT_FALSE(stack.FromJson(R"({"groups": []})"));

    EXPECT_EQ(3u, stack.GetLayerCount());
    EXPECT_EQ("A", NameAt(0));
}

TEST(LayerStackJsonTest, UnknownBlendModeFallsBackToOverlay) {
    AdjustmentLayerStack stack;

    ASSERT_TRUE(stack.FromJson(R"({"layers": [ {"name": "odd", "blend_mode": "dodge"} ]})"));

    ASSERT_EQ(1u, stack.GetLayerCount());
    EXPECT_EQ(BlendMode::Overlay, stack.GetLayer(0)->GetBlendMode());
}
