#include "blending/AdjustmentLayer.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <utility>
#include <nlohmann/json.hpp>

namespace Kinetic {

// =============================================================================
// AdjustmentLayer
// =============================================================================

AdjustmentLayer::AdjustmentLayer(const std::string& name)
    : m_name(name) {
}

const char* BlendModeToString(AdjustmentLayer::BlendMode mode) {
    switch (mode) {
        case AdjustmentLayer::BlendMode::Overlay:  return "overlay";
        case AdjustmentLayer::BlendMode::Add:      return "add";
        case AdjustmentLayer::BlendMode::Subtract: return "subtract";
        case AdjustmentLayer::BlendMode::Multiply: return "multiply";
        case AdjustmentLayer::BlendMode::Replace:  return "replace";
        case AdjustmentLayer::BlendMode::Screen:   return "screen";
    }
    return "overlay";
}

std::optional<AdjustmentLayer::BlendMode> BlendModeFromString(const std::string& name) {
    if (name == "overlay")  return AdjustmentLayer::BlendMode::Overlay;
    if (name == "add")      return AdjustmentLayer::BlendMode::Add;
    if (name == "subtract") return AdjustmentLayer::BlendMode::Subtract;
    if (name == "multiply") return AdjustmentLayer::BlendMode::Multiply;
    if (name == "replace")  return AdjustmentLayer::BlendMode::Replace;
    if (name == "screen")   return AdjustmentLayer::BlendMode::Screen;
    return std::nullopt;
}

const char* LayerTypeToString(AdjustmentLayer::LayerType type) {
    switch (type) {
        case AdjustmentLayer::LayerType::General:     return "general";
        case AdjustmentLayer::LayerType::FootContact: return "foot_contact";
        case AdjustmentLayer::LayerType::RootMotion:  return "root_motion";
        case AdjustmentLayer::LayerType::Secondary:   return "secondary";
    }
    return "general";
}

std::optional<AdjustmentLayer::LayerType> LayerTypeFromString(const std::string& name) {
    if (name == "general")      return AdjustmentLayer::LayerType::General;
    if (name == "foot_contact") return AdjustmentLayer::LayerType::FootContact;
    if (name == "root_motion")  return AdjustmentLayer::LayerType::RootMotion;
    if (name == "secondary")    return AdjustmentLayer::LayerType::Secondary;
    return std::nullopt;
}

const char* TargetScopeToString(AdjustmentLayer::TargetScope scope) {
    switch (scope) {
        case AdjustmentLayer::TargetScope::AllChannels: return "all_channels";
        case AdjustmentLayer::TargetScope::Location:    return "location";
        case AdjustmentLayer::TargetScope::Rotation:    return "rotation";
        case AdjustmentLayer::TargetScope::Scale:       return "scale";
        case AdjustmentLayer::TargetScope::Custom:      return "custom";
    }
    return "all_channels";
}

std::optional<AdjustmentLayer::TargetScope> TargetScopeFromString(const std::string& name) {
    if (name == "all_channels") return AdjustmentLayer::TargetScope::AllChannels;
    if (name == "location")     return AdjustmentLayer::TargetScope::Location;
    if (name == "rotation")     return AdjustmentLayer::TargetScope::Rotation;
    if (name == "scale")        return AdjustmentLayer::TargetScope::Scale;
    if (name == "custom")       return AdjustmentLayer::TargetScope::Custom;
    return std::nullopt;
}

// =============================================================================
// AdjustmentLayerStack
// =============================================================================

size_t AdjustmentLayerStack::AddLayer(std::unique_ptr<AdjustmentLayer> layer) {
    if (!layer) {
        layer = std::make_unique<AdjustmentLayer>();
    }
    m_layers.push_back(std::move(layer));
    m_activeIndex = m_layers.size() - 1;
    return m_activeIndex;
}

size_t AdjustmentLayerStack::AddLayer(const std::string& name) {
    return AddLayer(std::make_unique<AdjustmentLayer>(name));
}

void AdjustmentLayerStack::RemoveLayer(size_t index) {
    if (index >= m_layers.size()) {
        return;
    }

    m_layers.erase(m_layers.begin() + static_cast<ptrdiff_t>(index));

    if (m_layers.empty()) {
        m_activeIndex = 0;
    } else if (m_activeIndex >= m_layers.size()) {
        m_activeIndex = m_layers.size() - 1;
    }
}

void AdjustmentLayerStack::MoveLayer(size_t index, MoveDirection direction) {
    if (index >= m_layers.size()) {
        return;
    }

    size_t target;
    if (direction == MoveDirection::Up) {
        if (index == 0) return;
        target = index - 1;
    } else {
        if (index + 1 >= m_layers.size()) return;
        target = index + 1;
    }

    std::swap(m_layers[index], m_layers[target]);
    m_activeIndex = target;
}

std::optional<size_t> AdjustmentLayerStack::DuplicateLayer(size_t index) {
    if (index >= m_layers.size()) {
        return std::nullopt;
    }

    auto copy = std::make_unique<AdjustmentLayer>(*m_layers[index]);
    copy->SetName(m_layers[index]->GetName() + " Copy");
    m_layers.push_back(std::move(copy));
    return m_layers.size() - 1;
}

void AdjustmentLayerStack::SoloLayer(size_t index) {
    if (index >= m_layers.size()) {
        return;
    }

    m_activeIndex = index;
    m_soloMode = !m_soloMode;

    for (size_t i = 0; i < m_layers.size(); ++i) {
        m_layers[i]->SetVisible(!m_soloMode || i == m_activeIndex);
    }
}

void AdjustmentLayerStack::ClearLayers() {
    m_layers.clear();
    m_activeIndex = 0;
    m_soloMode = false;
}

AdjustmentLayer* AdjustmentLayerStack::GetLayer(size_t index) {
    return index < m_layers.size() ? m_layers[index].get() : nullptr;
}

const AdjustmentLayer* AdjustmentLayerStack::GetLayer(size_t index) const {
    return index < m_layers.size() ? m_layers[index].get() : nullptr;
}

AdjustmentLayer* AdjustmentLayerStack::GetLayer(const std::string& name) {
    for (auto& layer : m_layers) {
        if (layer->GetName() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

int AdjustmentLayerStack::GetLayerIndex(const std::string& name) const {
    for (size_t i = 0; i < m_layers.size(); ++i) {
        if (m_layers[i]->GetName() == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

AdjustmentLayer* AdjustmentLayerStack::GetActiveLayer() {
    return GetLayer(m_activeIndex);
}

// =============================================================================
// Serialization
// =============================================================================

std::string AdjustmentLayerStack::ToJson() const {
    nlohmann::json layers = nlohmann::json::array();

    for (const auto& layer : m_layers) {
        nlohmann::json entry;
        entry["name"] = layer->GetName();
        entry["layer_type"] = LayerTypeToString(layer->GetLayerType());
        entry["target_scope"] = TargetScopeToString(layer->GetTargetScope());
        entry["blend_mode"] = BlendModeToString(layer->GetBlendMode());
        entry["influence"] = layer->GetInfluence();
        entry["active"] = layer->IsActive();
        entry["visible"] = layer->IsVisible();
        entry["preserve_contacts"] = layer->GetPreserveContacts();
        entry["energy_threshold"] = layer->GetEnergyThreshold();
        entry["contact_threshold"] = layer->GetContactThreshold();
        entry["velocity_sensitivity"] = layer->GetVelocitySensitivity();
        if (const auto& range = layer->GetFrameRange()) {
            entry["frame_start"] = range->start;
            entry["frame_end"] = range->end;
        }
        layers.push_back(entry);
    }

    nlohmann::json document;
    document["layers"] = layers;
    document["active_index"] = m_activeIndex;
    document["solo"] = m_soloMode;
    return document.dump(2);
}

bool AdjustmentLayerStack::FromJson(const std::string& json) {
    std::vector<std::unique_ptr<AdjustmentLayer>> layers;
    size_t activeIndex = 0;
    bool soloMode = false;

    try {
        nlohmann::json document = nlohmann::json::parse(json);
        if (!document.contains("layers") || !document["layers"].is_array()) {
            KINETIC_LOG_ERROR("Layer document has no 'layers' array");
            return false;
        }

        for (const auto& entry : document["layers"]) {
            auto layer = std::make_unique<AdjustmentLayer>(entry.value("name", std::string("Layer")));

            std::string mode = entry.value("blend_mode", std::string("overlay"));
            if (auto parsed = BlendModeFromString(mode)) {
                layer->SetBlendMode(*parsed);
            } else {
                KINETIC_LOG_WARN("Unknown blend mode '{}' on layer '{}', using overlay", mode, layer->GetName());
            }
            if (auto parsed = LayerTypeFromString(entry.value("layer_type", std::string("general")))) {
                layer->SetLayerType(*parsed);
            }
            if (auto parsed = TargetScopeFromString(entry.value("target_scope", std::string("all_channels")))) {
                layer->SetTargetScope(*parsed);
            }

            layer->SetInfluence(entry.value("influence", 1.0f));
            layer->SetActive(entry.value("active", true));
            layer->SetVisible(entry.value("visible", true));
            layer->SetPreserveContacts(entry.value("preserve_contacts", true));
            layer->SetEnergyThreshold(entry.value("energy_threshold", 0.1f));
            layer->SetContactThreshold(entry.value("contact_threshold", 0.05f));
            layer->SetVelocitySensitivity(entry.value("velocity_sensitivity", 1.0f));

            if (entry.contains("frame_start") && entry.contains("frame_end")) {
                layer->SetFrameRange(entry["frame_start"].get<int>(), entry["frame_end"].get<int>());
            }

            layers.push_back(std::move(layer));
        }

        activeIndex = document.value("active_index", static_cast<size_t>(0));
        soloMode = document.value("solo", false);
    } catch (const nlohmann::json::exception& e) {
        KINETIC_LOG_ERROR("Failed to parse layer document: {}", e.what());
        return false;
    }

    m_layers = std::move(layers);
    m_activeIndex = m_layers.empty() ? 0 : std::min(activeIndex, m_layers.size() - 1);
    m_soloMode = soloMode;

    KINETIC_LOG_DEBUG("Loaded {} adjustment layers", m_layers.size());
    return true;
}

} // namespace Kinetic
