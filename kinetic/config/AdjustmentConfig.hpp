#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Kinetic {

/**
 * @brief Motion analysis settings
 */
struct AnalysisSettings {
    float velocityThreshold = 0.1f;
    int minDuration = 3;            // frames
    float groundThreshold = 0.05f;
    float stabilityThreshold = 0.02f;
    float sensitivity = 1.0f;       // foot sliding
};

/**
 * @brief Blending settings
 */
struct BlendingSettings {
    float energyPreservation = 1.0f;
    float influence = 1.0f;
    bool preserveMotionFlow = true;
};

/**
 * @brief Analysis cache settings
 */
struct CacheSettings {
    bool enabled = true;
    size_t size = 0;                // 0 = unbounded
};

/**
 * @brief Contact adaptation settings
 */
struct AdaptationSettings {
    float contactThreshold = 0.05f;
    float velocityThreshold = 0.1f;
    float blendSpeed = 0.3f;
    float blendFactor = 1.0f;
    float rootMotionThreshold = 0.01f;
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;               // empty = console only
};

/**
 * @brief JSON-based settings for analysis, blending and adaptation
 *
 * Values live in a JSON document addressed by dot-separated keys
 * ("analysis.velocity_threshold"). A document may name a workflow preset;
 * the preset is applied first and explicit keys in the document override it.
 * Keys the document leaves out keep their defaults.
 */
class AdjustmentConfig {
public:
    AdjustmentConfig();

    /**
     * @brief Load configuration from a JSON file
     * @return true if loaded; on failure the current values are kept
     */
    bool Load(const std::filesystem::path& filepath);

    /**
     * @brief Load configuration from a JSON string
     */
    bool LoadFromString(const std::string& json);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    bool Save(const std::filesystem::path& filepath = "") const;

    /**
     * @brief Reload configuration from disk
     */
    bool Reload();

    /**
     * @brief Get a configuration value with type safety
     * @param key Dot-separated key path
     * @param defaultValue Value to return if the key is missing or has the wrong type
     */
    template<typename T>
    T Get(const std::string& key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(const std::string& key, const T& value);

    [[nodiscard]] bool Has(const std::string& key) const;

    [[nodiscard]] const nlohmann::json& GetJson() const { return m_data; }

    // =========================================================================
    // Presets
    // =========================================================================

    /**
     * @brief Overwrite settings with a workflow preset
     * @return false for an unknown preset name
     */
    bool ApplyPreset(const std::string& name);

    [[nodiscard]] std::string GetPreset() const { return Get<std::string>("preset", "custom"); }

    [[nodiscard]] static const std::vector<std::string>& GetPresetNames();

    /**
     * @brief Reset every value to its default
     */
    void Reset();

    [[nodiscard]] static nlohmann::json Defaults();

    // =========================================================================
    // Typed Sections
    // =========================================================================

    [[nodiscard]] AnalysisSettings GetAnalysis() const;
    [[nodiscard]] BlendingSettings GetBlending() const;
    [[nodiscard]] CacheSettings GetCache() const;
    [[nodiscard]] AdaptationSettings GetAdaptation() const;
    [[nodiscard]] LoggingSettings GetLogging() const;

private:
    bool ApplyDocument(const nlohmann::json& document);

    nlohmann::json* NavigateToKey(const std::string& key, bool create);
    const nlohmann::json* NavigateToKey(const std::string& key) const;

    nlohmann::json m_data;
    std::filesystem::path m_filepath;
};

// Template implementations
template<typename T>
T AdjustmentConfig::Get(const std::string& key, const T& defaultValue) const {
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
}

template<typename T>
void AdjustmentConfig::Set(const std::string& key, const T& value) {
    if (auto* node = NavigateToKey(key, true)) {
        *node = value;
    }
}

} // namespace Kinetic
