#include "curves/CurveChannelMap.hpp"

namespace Kinetic {

const char* ChannelToString(Channel channel) {
    switch (channel) {
        case Channel::X: return "x";
        case Channel::Y: return "y";
        case Channel::Z: return "z";
    }
    return "x";
}

bool StringToChannel(const std::string& name, Channel& outChannel) {
    if (name == "x" || name == "X") { outChannel = Channel::X; return true; }
    if (name == "y" || name == "Y") { outChannel = Channel::Y; return true; }
    if (name == "z" || name == "Z") { outChannel = Channel::Z; return true; }
    return false;
}

void CurveChannelMap::Register(const std::string& entityId, Channel channel, ICurve* curve) {
    auto it = m_entities.find(entityId);
    if (it == m_entities.end()) {
        it = m_entities.emplace(entityId, std::array<ICurve*, 3>{nullptr, nullptr, nullptr}).first;
    }
    it->second[static_cast<size_t>(channel)] = curve;
}

void CurveChannelMap::Remove(const std::string& entityId) {
    m_entities.erase(entityId);
}

ICurve* CurveChannelMap::Find(const std::string& entityId, Channel channel) const {
    auto it = m_entities.find(entityId);
    return it != m_entities.end() ? it->second[static_cast<size_t>(channel)] : nullptr;
}

std::vector<ICurve*> CurveChannelMap::GetPoint(const std::string& entityId) const {
    auto it = m_entities.find(entityId);
    if (it == m_entities.end()) {
        return {};
    }
    for (ICurve* curve : it->second) {
        if (!curve) return {};
    }
    return {it->second[0], it->second[1], it->second[2]};
}

std::vector<std::string> CurveChannelMap::GetEntityIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_entities.size());
    for (const auto& [id, curves] : m_entities) {
        ids.push_back(id);
    }
    return ids;
}

bool CurveChannelMap::Contains(const std::string& entityId) const {
    return m_entities.find(entityId) != m_entities.end();
}

} // namespace Kinetic
