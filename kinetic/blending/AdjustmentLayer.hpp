#pragma once

#include "curves/Curve.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Kinetic {

/**
 * @brief Adjustment layer applied on top of a base curve
 *
 * A layer pairs a source curve with the settings that decide how strongly
 * and in which mode it is folded into the base. The source curve is borrowed;
 * the caller keeps it alive while the layer refers to it.
 */
class AdjustmentLayer {
public:
    /**
     * @brief Blend mode for combining a layer with the running value
     */
    enum class BlendMode {
        Overlay,        // Velocity-aware blend toward the layer
        Add,            // Add the layer's offset from the base
        Subtract,       // Subtract the layer's offset from the base
        Multiply,       // Scale by the layer value
        Replace,        // Lerp toward the layer value
        Screen          // 1 - (1 - a)(1 - b)
    };

    /**
     * @brief What the layer is meant to correct, for callers and tools
     */
    enum class LayerType {
        General,
        FootContact,
        RootMotion,
        Secondary
    };

    /**
     * @brief Channels the layer is meant to touch, for callers and tools
     */
    enum class TargetScope {
        AllChannels,
        Location,
        Rotation,
        Scale,
        Custom
    };

    AdjustmentLayer() = default;
    explicit AdjustmentLayer(const std::string& name);

    // =========================================================================
    // Configuration
    // =========================================================================

    void SetName(const std::string& name) { m_name = name; }
    [[nodiscard]] const std::string& GetName() const { return m_name; }

    void SetBlendMode(BlendMode mode) { m_blendMode = mode; }
    [[nodiscard]] BlendMode GetBlendMode() const { return m_blendMode; }

    void SetLayerType(LayerType type) { m_layerType = type; }
    [[nodiscard]] LayerType GetLayerType() const { return m_layerType; }

    void SetTargetScope(TargetScope scope) { m_targetScope = scope; }
    [[nodiscard]] TargetScope GetTargetScope() const { return m_targetScope; }

    /**
     * @brief Layer influence, nominally 0-2; not clamped
     */
    void SetInfluence(float influence) { m_influence = influence; }
    [[nodiscard]] float GetInfluence() const { return m_influence; }

    // =========================================================================
    // Source
    // =========================================================================

    void SetSourceCurve(ICurve* curve) { m_sourceCurve = curve; }
    [[nodiscard]] ICurve* GetSourceCurve() const { return m_sourceCurve; }
    [[nodiscard]] bool HasSourceCurve() const { return m_sourceCurve != nullptr; }

    // =========================================================================
    // Frame Range
    // =========================================================================

    /**
     * @brief Restrict the layer to [start, end]
     */
    void SetFrameRange(int start, int end) { m_frameRange = FrameRange{start, end}; }
    void ClearFrameRange() { m_frameRange.reset(); }
    [[nodiscard]] const std::optional<FrameRange>& GetFrameRange() const { return m_frameRange; }

    /**
     * @brief True when the layer has no frame range or the range holds frame
     */
    [[nodiscard]] bool CoversFrame(int frame) const {
        return !m_frameRange || m_frameRange->Contains(frame);
    }

    // =========================================================================
    // Analysis Settings
    // =========================================================================

    void SetPreserveContacts(bool preserve) { m_preserveContacts = preserve; }
    [[nodiscard]] bool GetPreserveContacts() const { return m_preserveContacts; }

    void SetEnergyThreshold(float threshold) { m_energyThreshold = threshold; }
    [[nodiscard]] float GetEnergyThreshold() const { return m_energyThreshold; }

    void SetContactThreshold(float threshold) { m_contactThreshold = threshold; }
    [[nodiscard]] float GetContactThreshold() const { return m_contactThreshold; }

    void SetVelocitySensitivity(float sensitivity) { m_velocitySensitivity = sensitivity; }
    [[nodiscard]] float GetVelocitySensitivity() const { return m_velocitySensitivity; }

    // =========================================================================
    // State
    // =========================================================================

    void SetActive(bool active) { m_active = active; }
    [[nodiscard]] bool IsActive() const { return m_active; }

    void SetVisible(bool visible) { m_visible = visible; }
    [[nodiscard]] bool IsVisible() const { return m_visible; }

    /**
     * @brief Check if the layer takes part in blending at a frame
     */
    [[nodiscard]] bool ContributesAt(int frame) const {
        return m_active && m_visible && m_sourceCurve && CoversFrame(frame);
    }

private:
    std::string m_name = "Layer";
    LayerType m_layerType = LayerType::General;
    TargetScope m_targetScope = TargetScope::AllChannels;
    BlendMode m_blendMode = BlendMode::Overlay;
    float m_influence = 1.0f;

    ICurve* m_sourceCurve = nullptr;
    std::optional<FrameRange> m_frameRange;

    bool m_preserveContacts = true;
    float m_energyThreshold = 0.1f;
    float m_contactThreshold = 0.05f;
    float m_velocitySensitivity = 1.0f;

    bool m_active = true;
    bool m_visible = true;
};

[[nodiscard]] const char* BlendModeToString(AdjustmentLayer::BlendMode mode);
[[nodiscard]] std::optional<AdjustmentLayer::BlendMode> BlendModeFromString(const std::string& name);

[[nodiscard]] const char* LayerTypeToString(AdjustmentLayer::LayerType type);
[[nodiscard]] std::optional<AdjustmentLayer::LayerType> LayerTypeFromString(const std::string& name);

[[nodiscard]] const char* TargetScopeToString(AdjustmentLayer::TargetScope scope);
[[nodiscard]] std::optional<AdjustmentLayer::TargetScope> TargetScopeFromString(const std::string& name);

/**
 * @brief Ordered stack of adjustment layers
 *
 * Stack order is application order. The stack tracks one active index that
 * editing operations act on and follow.
 */
class AdjustmentLayerStack {
public:
    enum class MoveDirection {
        Up,         // toward index 0
        Down        // toward the end
    };

    AdjustmentLayerStack() = default;

    AdjustmentLayerStack(const AdjustmentLayerStack&) = delete;
    AdjustmentLayerStack& operator=(const AdjustmentLayerStack&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    /**
     * @brief Append a layer and make it active
     * @return Layer index
     */
    size_t AddLayer(std::unique_ptr<AdjustmentLayer> layer);

    /**
     * @brief Append a default layer with a name
     */
    size_t AddLayer(const std::string& name);

    /**
     * @brief Remove layer at index, clamping the active index
     */
    void RemoveLayer(size_t index);

    /**
     * @brief Swap a layer with its neighbour
     *
     * No-op at the stack boundaries. The active index follows the moved layer.
     */
    void MoveLayer(size_t index, MoveDirection direction);

    /**
     * @brief Append a copy of a layer named "<name> Copy"
     * @return Index of the copy, or nullopt for a bad index
     */
    std::optional<size_t> DuplicateLayer(size_t index);

    /**
     * @brief Make a layer active and toggle solo mode
     *
     * With solo on only the active layer is visible; toggling off makes every
     * layer visible again.
     */
    void SoloLayer(size_t index);

    /**
     * @brief Clear all layers
     */
    void ClearLayers();

    [[nodiscard]] size_t GetLayerCount() const { return m_layers.size(); }
    [[nodiscard]] bool IsEmpty() const { return m_layers.empty(); }

    [[nodiscard]] AdjustmentLayer* GetLayer(size_t index);
    [[nodiscard]] const AdjustmentLayer* GetLayer(size_t index) const;
    [[nodiscard]] AdjustmentLayer* GetLayer(const std::string& name);
    [[nodiscard]] int GetLayerIndex(const std::string& name) const;

    [[nodiscard]] size_t GetActiveIndex() const { return m_activeIndex; }
    [[nodiscard]] AdjustmentLayer* GetActiveLayer();

    [[nodiscard]] bool IsInSoloMode() const { return m_soloMode; }

    [[nodiscard]] const std::vector<std::unique_ptr<AdjustmentLayer>>& GetLayers() const { return m_layers; }

    // =========================================================================
    // Serialization
    // =========================================================================

    /**
     * @brief Serialize layer settings; source curves are not written
     */
    [[nodiscard]] std::string ToJson() const;

    /**
     * @brief Replace the stack with layers read from JSON
     *
     * Loaded layers have no source curve. On a parse error the stack is left
     * unchanged and false is returned.
     */
    bool FromJson(const std::string& json);

private:
    std::vector<std::unique_ptr<AdjustmentLayer>> m_layers;
    size_t m_activeIndex = 0;
    bool m_soloMode = false;
};

} // namespace Kinetic
