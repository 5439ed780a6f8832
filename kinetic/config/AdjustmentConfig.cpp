#include "config/AdjustmentConfig.hpp"
#include "core/Logger.hpp"
#include <fstream>
#include <iomanip>

namespace Kinetic {

namespace {

std::vector<std::string> SplitKey(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // namespace

AdjustmentConfig::AdjustmentConfig()
    : m_data(Defaults()) {
}

nlohmann::json AdjustmentConfig::Defaults() {
    nlohmann::json config;
    config["preset"] = "custom";

    AnalysisSettings analysis;
    config["analysis"]["velocity_threshold"] = analysis.velocityThreshold;
    config["analysis"]["min_duration"] = analysis.minDuration;
    config["analysis"]["ground_threshold"] = analysis.groundThreshold;
    config["analysis"]["stability_threshold"] = analysis.stabilityThreshold;
    config["analysis"]["sensitivity"] = analysis.sensitivity;

    BlendingSettings blending;
    config["blending"]["energy_preservation"] = blending.energyPreservation;
    config["blending"]["influence"] = blending.influence;
    config["blending"]["preserve_motion_flow"] = blending.preserveMotionFlow;

    CacheSettings cache;
    config["cache"]["enabled"] = cache.enabled;
    config["cache"]["size"] = cache.size;

    AdaptationSettings adaptation;
    config["adaptation"]["contact_threshold"] = adaptation.contactThreshold;
    config["adaptation"]["velocity_threshold"] = adaptation.velocityThreshold;
    config["adaptation"]["blend_speed"] = adaptation.blendSpeed;
    config["adaptation"]["blend_factor"] = adaptation.blendFactor;
    config["adaptation"]["root_motion_threshold"] = adaptation.rootMotionThreshold;

    LoggingSettings logging;
    config["logging"]["level"] = logging.level;
    config["logging"]["file"] = logging.file;

    return config;
}

void AdjustmentConfig::Reset() {
    m_data = Defaults();
}

// =============================================================================
// Loading
// =============================================================================

bool AdjustmentConfig::Load(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        KINETIC_LOG_ERROR("Config file not found: {}", filepath.string());
        return false;
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            KINETIC_LOG_ERROR("Failed to open config file: {}", filepath.string());
            return false;
        }

        nlohmann::json document = nlohmann::json::parse(file);
        if (!ApplyDocument(document)) {
            return false;
        }
    } catch (const nlohmann::json::exception& e) {
        KINETIC_LOG_ERROR("Failed to parse config file {}: {}", filepath.string(), e.what());
        return false;
    }

    m_filepath = filepath;
    KINETIC_LOG_INFO("Loaded configuration from: {}", filepath.string());
    return true;
}

bool AdjustmentConfig::LoadFromString(const std::string& json) {
    try {
        return ApplyDocument(nlohmann::json::parse(json));
    } catch (const nlohmann::json::exception& e) {
        KINETIC_LOG_ERROR("Failed to parse config: {}", e.what());
        return false;
    }
}

bool AdjustmentConfig::ApplyDocument(const nlohmann::json& document) {
    if (!document.is_object()) {
        KINETIC_LOG_ERROR("Config root must be a JSON object");
        return false;
    }

    nlohmann::json previous = m_data;
    m_data = Defaults();

    if (document.contains("preset")) {
        const auto& preset = document["preset"];
        if (!preset.is_string() || !ApplyPreset(preset.get<std::string>())) {
            KINETIC_LOG_ERROR("Unknown preset in config: {}", preset.dump());
            m_data = std::move(previous);
            return false;
        }
    }

    // Explicit keys win over the preset
    m_data.merge_patch(document);
    return true;
}

bool AdjustmentConfig::Save(const std::filesystem::path& filepath) const {
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        KINETIC_LOG_ERROR("No config file path set, cannot save");
        return false;
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            KINETIC_LOG_ERROR("Failed to open config file for writing: {}", path.string());
            return false;
        }

        file << std::setw(4) << m_data << std::endl;
        KINETIC_LOG_INFO("Saved configuration to: {}", path.string());
        return true;
    } catch (const std::exception& e) {
        KINETIC_LOG_ERROR("Failed to save config file: {}", e.what());
        return false;
    }
}

bool AdjustmentConfig::Reload() {
    if (m_filepath.empty()) {
        KINETIC_LOG_WARN("No config file path set, cannot reload");
        return false;
    }
    return Load(m_filepath);
}

bool AdjustmentConfig::Has(const std::string& key) const {
    return NavigateToKey(key) != nullptr;
}

nlohmann::json* AdjustmentConfig::NavigateToKey(const std::string& key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& part : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) return nullptr;
            *current = nlohmann::json::object();
        }
        if (!current->contains(part)) {
            if (!create) return nullptr;
            (*current)[part] = nlohmann::json::object();
        }
        current = &(*current)[part];
    }
    return current;
}

const nlohmann::json* AdjustmentConfig::NavigateToKey(const std::string& key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& part : SplitKey(key)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(part);
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

// =============================================================================
// Presets
// =============================================================================

const std::vector<std::string>& AdjustmentConfig::GetPresetNames() {
    static const std::vector<std::string> names = {
        "mocap_cleanup", "keyframe_polish", "procedural_blend", "contact_fix", "custom"
    };
    return names;
}

bool AdjustmentConfig::ApplyPreset(const std::string& name) {
    if (name == "mocap_cleanup") {
        // Noisy capture data: default thresholds, full strength, median targets
        Set("analysis.velocity_threshold", 0.1);
        Set("analysis.min_duration", 3);
        Set("analysis.sensitivity", 1.0);
        Set("blending.energy_preservation", 1.0);
        Set("blending.influence", 1.0);
        Set("blending.preserve_motion_flow", true);
    } else if (name == "keyframe_polish") {
        // Clean hand keys: pick up subtle motion, apply gently
        Set("analysis.velocity_threshold", 0.05);
        Set("analysis.min_duration", 2);
        Set("analysis.sensitivity", 0.8);
        Set("blending.energy_preservation", 0.8);
        Set("blending.influence", 0.6);
        Set("blending.preserve_motion_flow", true);
    } else if (name == "procedural_blend") {
        Set("analysis.velocity_threshold", 0.15);
        Set("analysis.min_duration", 4);
        Set("analysis.sensitivity", 1.0);
        Set("blending.energy_preservation", 1.2);
        Set("blending.influence", 0.8);
        Set("blending.preserve_motion_flow", false);
    } else if (name == "contact_fix") {
        // Tight contact windows, aggressive sliding detection
        Set("analysis.ground_threshold", 0.03);
        Set("analysis.stability_threshold", 0.015);
        Set("analysis.sensitivity", 1.5);
        Set("blending.influence", 1.0);
        Set("blending.preserve_motion_flow", true);
        Set("adaptation.contact_threshold", 0.03);
    } else if (name != "custom") {
        return false;
    }

    Set("preset", name);
    KINETIC_LOG_DEBUG("Applied preset '{}'", name);
    return true;
}

// =============================================================================
// Typed Sections
// =============================================================================

AnalysisSettings AdjustmentConfig::GetAnalysis() const {
    AnalysisSettings defaults;
    AnalysisSettings settings;
    settings.velocityThreshold = Get("analysis.velocity_threshold", defaults.velocityThreshold);
    settings.minDuration = Get("analysis.min_duration", defaults.minDuration);
    settings.groundThreshold = Get("analysis.ground_threshold", defaults.groundThreshold);
    settings.stabilityThreshold = Get("analysis.stability_threshold", defaults.stabilityThreshold);
    settings.sensitivity = Get("analysis.sensitivity", defaults.sensitivity);
    return settings;
}

BlendingSettings AdjustmentConfig::GetBlending() const {
    BlendingSettings defaults;
    BlendingSettings settings;
    settings.energyPreservation = Get("blending.energy_preservation", defaults.energyPreservation);
    settings.influence = Get("blending.influence", defaults.influence);
    settings.preserveMotionFlow = Get("blending.preserve_motion_flow", defaults.preserveMotionFlow);
    return settings;
}

CacheSettings AdjustmentConfig::GetCache() const {
    CacheSettings defaults;
    CacheSettings settings;
    settings.enabled = Get("cache.enabled", defaults.enabled);
    settings.size = Get("cache.size", defaults.size);
    return settings;
}

AdaptationSettings AdjustmentConfig::GetAdaptation() const {
    AdaptationSettings defaults;
    AdaptationSettings settings;
    settings.contactThreshold = Get("adaptation.contact_threshold", defaults.contactThreshold);
    settings.velocityThreshold = Get("adaptation.velocity_threshold", defaults.velocityThreshold);
    settings.blendSpeed = Get("adaptation.blend_speed", defaults.blendSpeed);
    settings.blendFactor = Get("adaptation.blend_factor", defaults.blendFactor);
    settings.rootMotionThreshold = Get("adaptation.root_motion_threshold", defaults.rootMotionThreshold);
    return settings;
}

LoggingSettings AdjustmentConfig::GetLogging() const {
    LoggingSettings defaults;
    LoggingSettings settings;
    settings.level = Get("logging.level", defaults.level);
    settings.file = Get("logging.file", defaults.file);
    return settings;
}

} // namespace Kinetic
