#pragma once

#include "curves/Curve.hpp"
#include <array>
#include <map>
#include <string>
#include <vector>

namespace Kinetic {

/**
 * @brief Position channel of a tracked point
 */
enum class Channel {
    X = 0,
    Y = 1,
    Z = 2
};

[[nodiscard]] const char* ChannelToString(Channel channel);
[[nodiscard]] bool StringToChannel(const std::string& name, Channel& outChannel);

/**
 * @brief (entity, channel) -> curve lookup built once by the caller
 *
 * Curves are borrowed; the map never owns them. Analysis entry points that
 * need a tracked point take the x/y/z triple in that order, which GetPoint()
 * produces.
 */
class CurveChannelMap {
public:
    void Register(const std::string& entityId, Channel channel, ICurve* curve);
    void Remove(const std::string& entityId);
    void Clear() { m_entities.clear(); }

    [[nodiscard]] ICurve* Find(const std::string& entityId, Channel channel) const;

    /**
     * @brief x/y/z curves of an entity, or an empty vector if any channel is missing
     */
    [[nodiscard]] std::vector<ICurve*> GetPoint(const std::string& entityId) const;

    [[nodiscard]] std::vector<std::string> GetEntityIds() const;
    [[nodiscard]] bool Contains(const std::string& entityId) const;
    [[nodiscard]] size_t GetEntityCount() const { return m_entities.size(); }

private:
    std::map<std::string, std::array<ICurve*, 3>> m_entities;
};

} // namespace Kinetic
