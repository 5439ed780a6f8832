#include "session/AdjustmentSession.hpp"
#include "core/Logger.hpp"
#include <utility>

namespace Kinetic {

AdjustmentSession::AdjustmentSession(const AdjustmentConfig& config)
    : m_config(config)
    , m_cache(config.GetCache().size)
    , m_analyzer(&m_cache)
    , m_engine(m_analyzer, config.GetBlending().energyPreservation)
    , m_contactDetector(config.GetAdaptation().contactThreshold, config.GetAdaptation().velocityThreshold) {
    m_cache.SetEnabled(config.GetCache().enabled);
}

void AdjustmentSession::ApplyConfig(const AdjustmentConfig& config) {
    m_config = config;

    CacheSettings cache = m_config.GetCache();
    m_cache.SetCapacity(cache.size);
    m_cache.SetEnabled(cache.enabled);
    m_cache.Clear();

    m_engine.SetEnergyPreservation(m_config.GetBlending().energyPreservation);

    AdaptationSettings adaptation = m_config.GetAdaptation();
    m_contactDetector.SetContactThreshold(adaptation.contactThreshold);
    m_contactDetector.SetVelocityThreshold(adaptation.velocityThreshold);
    KINETIC_LOG_DEBUG("Session using preset '{}'", m_config.GetPreset());
}

std::optional<PointAnalysis> AdjustmentSession::AnalyzePoint(const std::string& entityId) const {
    if (!m_channels.Contains(entityId)) {
        KINETIC_LOG_WARN("Unknown entity '{}'", entityId);
        return std::nullopt;
    }

    AnalysisSettings settings = m_config.GetAnalysis();

    PointAnalysis analysis;
    analysis.entityId = entityId;

    for (Channel channel : {Channel::X, Channel::Y, Channel::Z}) {
        if (ICurve* curve = m_channels.Find(entityId, channel)) {
            analysis.regions[channel] = m_analyzer.DetectMovementRegions(
                *curve, settings.velocityThreshold, settings.minDuration);
        }
    }

    std::vector<ICurve*> point = m_channels.GetPoint(entityId);
    if (!point.empty()) {
        analysis.contactPhases = m_analyzer.DetectContactPhases(
            point, settings.groundThreshold, settings.stabilityThreshold);
        analysis.slidingFrames = m_analyzer.DetectFootSliding(
            point, settings.sensitivity, settings.groundThreshold, settings.stabilityThreshold);
        analysis.energy = m_analyzer.CalculateEnergyProfile(point);
    }

    return analysis;
}

bool AdjustmentSession::FixSliding(const std::string& entityId) {
    std::vector<ICurve*> point = m_channels.GetPoint(entityId);
    if (point.empty()) {
        KINETIC_LOG_WARN("Entity '{}' has no complete x/y/z point", entityId);
        return false;
    }

    AnalysisSettings settings = m_config.GetAnalysis();
    std::vector<int> sliding = m_analyzer.DetectFootSliding(
        point, settings.sensitivity, settings.groundThreshold, settings.stabilityThreshold);
    if (sliding.empty()) {
        KINETIC_LOG_INFO("No sliding detected on '{}'", entityId);
        return false;
    }

    BlendingSettings blending = m_config.GetBlending();
    bool fixed = m_engine.FixFootSliding(point, sliding, blending.influence, blending.preserveMotionFlow);
    if (fixed) {
        m_cache.Clear();
        m_contactDetector.ClearCache();
    }
    return fixed;
}

std::optional<FrameValues> AdjustmentSession::ApplyLayers(const std::string& entityId, Channel channel) const {
    return m_engine.LayeredAdjustments(m_channels.Find(entityId, channel),
                                       m_layers,
                                       m_config.GetBlending().influence,
                                       m_channels.GetPoint(entityId));
}

// =============================================================================
// Contact Adaptation
// =============================================================================

std::optional<AdaptiveContactDriver> AdjustmentSession::MakeContactDriver(const std::string& entityId) {
    std::vector<ICurve*> point = m_channels.GetPoint(entityId);
    if (point.empty()) {
        KINETIC_LOG_WARN("Entity '{}' has no complete x/y/z point", entityId);
        return std::nullopt;
    }

    AdaptationSettings adaptation = m_config.GetAdaptation();
    return AdaptiveContactDriver(m_contactDetector, std::move(point),
                                 adaptation.blendSpeed, adaptation.blendFactor);
}

RootMotionDetector AdjustmentSession::MakeRootMotionDetector() const {
    return RootMotionDetector(m_config.GetAdaptation().rootMotionThreshold);
}

} // namespace Kinetic
