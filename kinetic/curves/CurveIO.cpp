#include "curves/CurveIO.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>

namespace Kinetic {

void CurveDocument::Add(const std::string& entityId, Channel channel, KeyframeCurve curve) {
    Entry entry;
    entry.entityId = entityId;
    entry.channel = channel;
    entry.curve = std::make_unique<KeyframeCurve>(std::move(curve));
    channels.Register(entityId, channel, entry.curve.get());
    entries.push_back(std::move(entry));
}

namespace CurveIO {

std::optional<CurveDocument> FromJson(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("entities") || !document["entities"].is_array()) {
        KINETIC_LOG_ERROR("Curve document is missing an 'entities' array");
        return std::nullopt;
    }

    CurveDocument result;

    try {
        for (const auto& entity : document["entities"]) {
            std::string id = entity.value("id", "");
            if (id.empty()) {
                KINETIC_LOG_WARN("Skipping curve entity without an id");
                continue;
            }
            if (!entity.contains("channels") || !entity["channels"].is_object()) {
                KINETIC_LOG_WARN("Entity '{}' has no channels", id);
                continue;
            }

            for (const auto& item : entity["channels"].items()) {
                const std::string& channelName = item.key();
                const nlohmann::json& channelJson = item.value();
                Channel channel;
                if (!StringToChannel(channelName, channel)) {
                    KINETIC_LOG_WARN("Entity '{}': unknown channel '{}'", id, channelName);
                    continue;
                }

                std::vector<CurveKey> keys;
                for (const auto& key : channelJson.at("keys")) {
                    double frame = 0.0;
                    double value = 0.0;
                    if (key.is_array() && key.size() >= 2) {
                        frame = key[0].get<double>();
                        value = key[1].get<double>();
                    } else if (key.is_object()) {
                        frame = key.at("frame").get<double>();
                        value = key.at("value").get<double>();
                    } else {
                        continue;
                    }

                    if (!std::isfinite(frame) || std::abs(frame) > MaxCurveFrame) {
                        KINETIC_LOG_ERROR("Entity '{}' channel '{}': key frame {} outside +/-{}",
                                          id, channelName, key.dump(), MaxCurveFrame);
                        return std::nullopt;
                    }
                    if (!std::isfinite(value) || std::abs(value) > std::numeric_limits<float>::max()) {
                        KINETIC_LOG_ERROR("Entity '{}' channel '{}': key value {} is not a float",
                                          id, channelName, key.dump());
                        return std::nullopt;
                    }
                    keys.push_back({static_cast<float>(frame), static_cast<float>(value)});
                }

                auto interpolation = StringToCurveInterpolation(channelJson.value("interpolation", "linear"));
                result.Add(id, channel, KeyframeCurve(std::move(keys), interpolation));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        KINETIC_LOG_ERROR("Malformed curve document: {}", e.what());
        return std::nullopt;
    }

    return std::optional<CurveDocument>(std::move(result));
}

nlohmann::json ToJson(const CurveDocument& document) {
    nlohmann::json entities = nlohmann::json::array();

    for (const auto& id : document.channels.GetEntityIds()) {
        nlohmann::json entity;
        entity["id"] = id;
        entity["channels"] = nlohmann::json::object();

        for (const auto& entry : document.entries) {
            if (entry.entityId != id) continue;

            nlohmann::json keys = nlohmann::json::array();
            for (const auto& key : entry.curve->GetKeys()) {
                keys.push_back({key.frame, key.value});
            }

            entity["channels"][ChannelToString(entry.channel)] = {
                {"interpolation", CurveInterpolationToString(entry.curve->GetInterpolation())},
                {"keys", keys}
            };
        }
        entities.push_back(entity);
    }

    nlohmann::json result;
    result["entities"] = entities;
    return result;
}

std::optional<CurveDocument> Load(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        KINETIC_LOG_ERROR("Failed to open curve document: {}", filepath.string());
        return std::nullopt;
    }

    try {
        auto document = nlohmann::json::parse(file);
        return FromJson(document);
    } catch (const nlohmann::json::exception& e) {
        KINETIC_LOG_ERROR("Failed to parse curve document {}: {}", filepath.string(), e.what());
        return std::nullopt;
    }
}

bool Save(const CurveDocument& document, const std::filesystem::path& filepath) {
    try {
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            KINETIC_LOG_ERROR("Failed to open curve document for writing: {}", filepath.string());
            return false;
        }

        file << std::setw(2) << ToJson(document) << std::endl;
        KINETIC_LOG_INFO("Saved curves to: {}", filepath.string());
        return true;
    } catch (const std::exception& e) {
        KINETIC_LOG_ERROR("Failed to save curve document: {}", e.what());
        return false;
    }
}

} // namespace CurveIO

} // namespace Kinetic
