/**
 * @file curve_report.cpp
 * @brief Command-line report of motion analysis over a curve document
 *
 * Usage:
 *   kinetic_curve_report curves.json [options]
 *
 * Options:
 *   --config <file>         Adjustment config (JSON)
 *   --fix-sliding           Correct foot sliding on every entity
 *   --output <file>         Where to write corrected curves (with --fix-sliding)
 *   --influence <value>     Override blending.influence
 *   --sensitivity <value>   Override analysis.sensitivity
 *   --verbose               Debug logging and per-region detail
 *   --help                  Show this help
 */

#include "config/AdjustmentConfig.hpp"
#include "core/Logger.hpp"
#include "curves/CurveIO.hpp"
#include "session/AdjustmentSession.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

// ============================================================================
// Configuration
// ============================================================================

struct ToolConfig {
    std::string inputFile;
    std::string configFile;
    std::string outputFile;

    bool fixSliding = false;
    bool verbose = false;

    bool overrideInfluence = false;
    float influence = 1.0f;
    bool overrideSensitivity = false;
    float sensitivity = 1.0f;
};

// ============================================================================
// Helper Functions
// ============================================================================

void PrintUsage() {
    std::cout << R"(
kinetic_curve_report - Motion analysis report for animation curves

Usage:
  kinetic_curve_report curves.json [options]

Options:
  --config <file>         Adjustment config (JSON)
  --fix-sliding           Correct foot sliding on every entity
  --output <file>         Where to write corrected curves (with --fix-sliding)
  --influence <value>     Override blending.influence
  --sensitivity <value>   Override analysis.sensitivity
  --verbose               Debug logging and per-region detail
  --help                  Show this help

Presets (config "preset" key):
  mocap_cleanup, keyframe_polish, procedural_blend, contact_fix, custom
)";
}

bool ParseArguments(int argc, char* argv[], ToolConfig& config) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg == "--config" && i + 1 < argc) {
            config.configFile = argv[++i];
        }
        else if (arg == "--output" && i + 1 < argc) {
            config.outputFile = argv[++i];
        }
        else if (arg == "--influence" && i + 1 < argc) {
            config.influence = static_cast<float>(std::atof(argv[++i]));
            config.overrideInfluence = true;
        }
        else if (arg == "--sensitivity" && i + 1 < argc) {
            config.sensitivity = static_cast<float>(std::atof(argv[++i]));
            config.overrideSensitivity = true;
        }
        else if (arg == "--fix-sliding") {
            config.fixSliding = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
        }
        else if (config.inputFile.empty()) {
            config.inputFile = arg;
        }
        else {
            std::cerr << "Ignoring extra argument: " << arg << "\n";
        }
    }

    if (config.inputFile.empty()) {
        return false;
    }
    if (config.fixSliding && config.outputFile.empty()) {
        std::cerr << "Error: --fix-sliding needs --output\n";
        return false;
    }
    return true;
}

// ============================================================================
// Report
// ============================================================================

void PrintAnalysis(const Kinetic::PointAnalysis& analysis, bool verbose) {
    std::cout << "Entity: " << analysis.entityId << "\n";

    for (const auto& [channel, regions] : analysis.regions) {
        std::cout << "  " << Kinetic::ChannelToString(channel) << ": "
                  << regions.size() << " movement regions\n";
        if (!verbose) continue;
        for (const auto& region : regions) {
            std::cout << "    [" << region.startFrame << ", " << region.endFrame << "] "
                      << Kinetic::MotionTypeToString(region.motionType)
                      << " peak " << region.peakEnergy << "\n";
        }
    }

    std::cout << "  Contact phases: " << analysis.contactPhases.size() << "\n";
    for (const auto& phase : analysis.contactPhases) {
        std::cout << "    [" << phase.startFrame << ", " << phase.endFrame << "]\n";
    }

    std::cout << "  Sliding frames: " << analysis.slidingFrames.size() << "\n";
    if (verbose && !analysis.slidingFrames.empty()) {
        std::cout << "   ";
        for (int frame : analysis.slidingFrames) {
            std::cout << " " << frame;
        }
        std::cout << "\n";
    }

    if (!analysis.energy.Empty()) {
        const auto& total = analysis.energy.total;
        float peak = *std::max_element(total.begin(), total.end());
        float mean = std::accumulate(total.begin(), total.end(), 0.0f) / static_cast<float>(total.size());
        std::cout << "  Energy: mean " << mean << ", peak " << peak
                  << " over " << analysis.energy.Size() << " frames\n";
    }
}

void PrintAdaptation(Kinetic::AdjustmentSession& session, const Kinetic::PointAnalysis& analysis) {
    auto driver = session.MakeContactDriver(analysis.entityId);
    if (!driver) {
        return;
    }
    std::vector<Kinetic::ICurve*> point = session.GetChannels().GetPoint(analysis.entityId);
    Kinetic::RootMotionDetector rootMotion = session.MakeRootMotionDetector();

    Kinetic::ContactDriveState state;
    int contactFrames = 0;
    int moves = 0;
    float peakWorld = 0.0f;
    for (int frame : analysis.energy.frames) {
        state = driver->Update(frame, state);
        if (state.inContact) ++contactFrames;
        peakWorld = std::max(peakWorld, state.worldInfluence);
        if (rootMotion.Track(point, frame).moved) ++moves;
    }

    std::cout << "  Contact drive: " << contactFrames << " frames, peak world influence "
              << peakWorld << "\n";
    std::cout << "  Root motion: " << moves << " moves\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    ToolConfig toolConfig;
    if (!ParseArguments(argc, argv, toolConfig)) {
        PrintUsage();
        return 1;
    }

    Kinetic::AdjustmentConfig config;
    if (!toolConfig.configFile.empty() && !config.Load(toolConfig.configFile)) {
        std::cerr << "Error: Could not load config: " << toolConfig.configFile << "\n";
        return 1;
    }
    if (toolConfig.overrideInfluence) {
        config.Set("blending.influence", toolConfig.influence);
    }
    if (toolConfig.overrideSensitivity) {
        config.Set("analysis.sensitivity", toolConfig.sensitivity);
    }

    // Loading the config may already have started console-only logging
    Kinetic::LoggingSettings logging = config.GetLogging();
    Kinetic::Logger::Shutdown();
    Kinetic::Logger::Initialize(logging.file);
    Kinetic::Logger::SetLevel(toolConfig.verbose ? spdlog::level::debug
                                                 : Kinetic::Logger::ParseLevel(logging.level));

    APP_LOG_INFO("Loading curves: {}", toolConfig.inputFile);
    auto document = Kinetic::CurveIO::Load(toolConfig.inputFile);
    if (!document) {
        std::cerr << "Error: Could not load curve document: " << toolConfig.inputFile << "\n";
        Kinetic::Logger::Shutdown();
        return 1;
    }

    Kinetic::AdjustmentSession session(config);
    session.SetChannels(document->channels);

    std::cout << "Preset: " << config.GetPreset() << "\n";
    std::cout << "Entities: " << document->channels.GetEntityCount() << "\n\n";

    size_t fixedCount = 0;
    for (const std::string& entityId : document->channels.GetEntityIds()) {
        auto analysis = session.AnalyzePoint(entityId);
        if (!analysis) {
            continue;
        }
        PrintAnalysis(*analysis, toolConfig.verbose);
        PrintAdaptation(session, *analysis);
        std::cout << "\n";

        if (toolConfig.fixSliding && session.FixSliding(entityId)) {
            ++fixedCount;
            std::cout << "  Corrected sliding on " << entityId << "\n\n";
        }
    }

    Kinetic::CacheStats stats = session.GetCacheStats();
    std::cout << "Cache: " << stats.entryCount << " entries, ~" << stats.approxMemory / 1024 << " KB, "
              << stats.hits << " hits, " << stats.misses << " misses\n";

    int exitCode = 0;
    if (toolConfig.fixSliding) {
        std::cout << "Corrected " << fixedCount << " entities\n";
        if (Kinetic::CurveIO::Save(*document, toolConfig.outputFile)) {
            std::cout << "Saved: " << toolConfig.outputFile << "\n";
        } else {
            std::cerr << "Error: Could not write " << toolConfig.outputFile << "\n";
            exitCode = 1;
        }
    }

    Kinetic::Logger::Shutdown();
    return exitCode;
}
