#pragma once

#include "adaptation/ContactAdaptation.hpp"
#include "analysis/AnalysisCache.hpp"
#include "analysis/MotionAnalyzer.hpp"
#include "blending/AdjustmentLayer.hpp"
#include "blending/BlendingEngine.hpp"
#include "config/AdjustmentConfig.hpp"
#include "curves/CurveChannelMap.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Kinetic {

/**
 * @brief Analysis results for one tracked point
 */
struct PointAnalysis {
    std::string entityId;
    std::map<Channel, std::vector<MovementRegion>> regions;
    std::vector<ContactPhase> contactPhases;
    std::vector<int> slidingFrames;
    EnergyProfile energy;
};

/**
 * @brief Ties configuration, cache, analyzer, engine and layers together
 *
 * The session owns the analysis cache and hands it to its analyzer. Curves
 * are resolved by entity and channel through the session's CurveChannelMap;
 * the curves themselves stay owned by the caller.
 */
class AdjustmentSession {
public:
    explicit AdjustmentSession(const AdjustmentConfig& config = AdjustmentConfig{});

    AdjustmentSession(const AdjustmentSession&) = delete;
    AdjustmentSession& operator=(const AdjustmentSession&) = delete;

    /**
     * @brief Replace the configuration and re-apply cache and blending settings
     */
    void ApplyConfig(const AdjustmentConfig& config);
    [[nodiscard]] const AdjustmentConfig& GetConfig() const { return m_config; }

    void SetChannels(const CurveChannelMap& channels) { m_channels = channels; }
    [[nodiscard]] CurveChannelMap& GetChannels() { return m_channels; }
    [[nodiscard]] const CurveChannelMap& GetChannels() const { return m_channels; }

    // =========================================================================
    // Operations
    // =========================================================================

    /**
     * @brief Regions per channel, contacts, sliding and energy of an entity
     *
     * Contact, sliding and energy results need all three channels and are
     * left empty otherwise.
     *
     * @return nullopt for an unknown entity
     */
    [[nodiscard]] std::optional<PointAnalysis> AnalyzePoint(const std::string& entityId) const;

    /**
     * @brief Detect and correct foot sliding on an entity's curves
     *
     * Clears the analysis cache after writing, since the corrected curves
     * keep their identities.
     *
     * @return true if any frames were corrected
     */
    bool FixSliding(const std::string& entityId);

    /**
     * @brief Fold the layer stack into one channel of an entity
     */
    [[nodiscard]] std::optional<FrameValues> ApplyLayers(const std::string& entityId, Channel channel) const;

    // =========================================================================
    // Contact Adaptation
    // =========================================================================

    /**
     * @brief World/local driver for an entity, tuned by the adaptation settings
     *
     * The driver borrows the session's ContactDetector, so it must not outlive
     * the session.
     *
     * @return nullopt unless the entity has all three channels
     */
    [[nodiscard]] std::optional<AdaptiveContactDriver> MakeContactDriver(const std::string& entityId);

    [[nodiscard]] RootMotionDetector MakeRootMotionDetector() const;

    [[nodiscard]] ContactDetector& GetContactDetector() { return m_contactDetector; }

    void ClearCache() { m_cache.Clear(); }
    [[nodiscard]] CacheStats GetCacheStats() const { return m_cache.GetStats(); }

    [[nodiscard]] AdjustmentLayerStack& GetLayers() { return m_layers; }
    [[nodiscard]] const AdjustmentLayerStack& GetLayers() const { return m_layers; }

    [[nodiscard]] const MotionAnalyzer& GetAnalyzer() const { return m_analyzer; }
    [[nodiscard]] const BlendingEngine& GetEngine() const { return m_engine; }
    [[nodiscard]] AnalysisCache& GetCache() { return m_cache; }

private:
    AdjustmentConfig m_config;
    AnalysisCache m_cache;
    MotionAnalyzer m_analyzer;
    BlendingEngine m_engine;
    AdjustmentLayerStack m_layers;
    CurveChannelMap m_channels;
    ContactDetector m_contactDetector;
};

} // namespace Kinetic
