#include "analysis/AnalysisCache.hpp"
#include "core/Logger.hpp"
#include <functional>

namespace Kinetic {

size_t CacheKeyHash::operator()(const CacheKey& key) const {
    size_t seed = std::hash<CurveId>{}(key.curve);
    auto combine = [&seed](size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
    };
    combine(std::hash<uint8_t>{}(static_cast<uint8_t>(key.kind)));
    combine(std::hash<float>{}(key.param0));
    combine(std::hash<float>{}(key.param1));
    return seed;
}

AnalysisCache::AnalysisCache(size_t capacity)
    : m_capacity(capacity) {
}

std::optional<CachedResult> AnalysisCache::Lookup(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        ++m_misses;
        return std::nullopt;
    }
    ++m_hits;
    return it->second;
}

CachedResult AnalysisCache::Store(const CacheKey& key, CachedResult value) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto [it, inserted] = m_entries.try_emplace(key, std::move(value));
    if (inserted) {
        m_insertionOrder.push_back(key);
        // Evicts from the front, so the entry just inserted survives
        EvictOverCapacity();
    }
    return it->second;
}

void AnalysisCache::EvictOverCapacity() {
    if (m_capacity == 0) {
        return;
    }
    while (m_entries.size() > m_capacity && !m_insertionOrder.empty()) {
        m_entries.erase(m_insertionOrder.front());
        m_insertionOrder.pop_front();
    }
}

void AnalysisCache::Clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = m_entries.size();
    m_entries.clear();
    m_insertionOrder.clear();
    KINETIC_LOG_DEBUG("Analysis cache cleared ({} entries)", count);
}

CacheStats AnalysisCache::GetStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheStats stats;
    stats.entryCount = m_entries.size();
    stats.approxMemory = m_entries.size() * APPROX_ENTRY_BYTES;
    stats.hits = m_hits;
    stats.misses = m_misses;
    stats.capacity = m_capacity;
    stats.enabled = m_enabled;
    return stats;
}

size_t AnalysisCache::Size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool AnalysisCache::Contains(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.find(key) != m_entries.end();
}

void AnalysisCache::SetCapacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_capacity = capacity;
    EvictOverCapacity();
}

size_t AnalysisCache::GetCapacity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_capacity;
}

void AnalysisCache::SetEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_enabled = enabled;
}

bool AnalysisCache::IsEnabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled;
}

} // namespace Kinetic
