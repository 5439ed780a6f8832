#pragma once

#include "curves/CurveChannelMap.hpp"
#include "curves/KeyframeCurve.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Kinetic {

/**
 * @brief Curves loaded from a JSON curve document
 *
 * Owns the curves and exposes them through a CurveChannelMap.
 *
 * Document layout:
 * @code
 * { "entities": [ { "id": "foot_l",
 *                   "channels": { "x": { "interpolation": "linear",
 *                                        "keys": [[0, 0.0], [1, 0.1]] } } } ] }
 * @endcode
 */
struct CurveDocument {
    struct Entry {
        std::string entityId;
        Channel channel = Channel::X;
        std::unique_ptr<KeyframeCurve> curve;
    };

    std::vector<Entry> entries;
    CurveChannelMap channels;

    void Add(const std::string& entityId, Channel channel, KeyframeCurve curve);
};

namespace CurveIO {

[[nodiscard]] std::optional<CurveDocument> FromJson(const nlohmann::json& document);
[[nodiscard]] nlohmann::json ToJson(const CurveDocument& document);

[[nodiscard]] std::optional<CurveDocument> Load(const std::filesystem::path& filepath);
bool Save(const CurveDocument& document, const std::filesystem::path& filepath);

} // namespace CurveIO

} // namespace Kinetic
