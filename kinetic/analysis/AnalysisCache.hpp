#pragma once

#include "analysis/MotionTypes.hpp"
#include "curves/Curve.hpp"
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace Kinetic {

/**
 * @brief Which analysis produced a cached result
 */
enum class AnalysisKind : uint8_t {
    MovementRegions,
    ContactPhases
};

/**
 * @brief Cache key: curve identity, analysis kind and the analysis parameters
 */
struct CacheKey {
    CurveId curve = 0;
    AnalysisKind kind = AnalysisKind::MovementRegions;
    float param0 = 0.0f;
    float param1 = 0.0f;

    bool operator==(const CacheKey& other) const = default;
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const;
};

using CachedResult = std::variant<std::vector<MovementRegion>, std::vector<ContactPhase>>;

struct CacheStats {
    size_t entryCount = 0;
    size_t approxMemory = 0;    // bytes, coarse estimate of 1KB per entry
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t capacity = 0;        // 0 = unbounded
    bool enabled = true;
};

/**
 * @brief Thread-safe memo of per-curve analysis results
 *
 * One mutex guards the table; it is held for lookups and inserts only, never
 * while the analysis runs. Two callers missing on the same key may both
 * compute; the first insert wins and later results are discarded.
 *
 * Entries never expire on their own. With a non-zero capacity the oldest
 * inserted entries are evicted once the table grows past it.
 */
class AnalysisCache {
public:
    static constexpr size_t APPROX_ENTRY_BYTES = 1024;

    explicit AnalysisCache(size_t capacity = 0);

    AnalysisCache(const AnalysisCache&) = delete;
    AnalysisCache& operator=(const AnalysisCache&) = delete;

    /**
     * @brief Get a cached result or compute and store it
     * @tparam T Result type (one of the CachedResult alternatives)
     * @param key Cache key
     * @param compute Callable returning T, invoked without the lock held
     */
    template<typename T, typename Func>
    T GetOrCompute(const CacheKey& key, Func&& compute);

    /**
     * @brief Drop every entry
     */
    void Clear();

    [[nodiscard]] CacheStats GetStats() const;
    [[nodiscard]] size_t Size() const;
    [[nodiscard]] bool Contains(const CacheKey& key) const;

    void SetCapacity(size_t capacity);
    [[nodiscard]] size_t GetCapacity() const;

    /**
     * @brief Disabled caches compute every request and store nothing
     */
    void SetEnabled(bool enabled);
    [[nodiscard]] bool IsEnabled() const;

private:
    [[nodiscard]] std::optional<CachedResult> Lookup(const CacheKey& key);
    CachedResult Store(const CacheKey& key, CachedResult value);
    void EvictOverCapacity();

    mutable std::mutex m_mutex;
    std::unordered_map<CacheKey, CachedResult, CacheKeyHash> m_entries;
    std::list<CacheKey> m_insertionOrder;   // oldest first
    size_t m_capacity = 0;
    bool m_enabled = true;
    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
};

// Template implementation
template<typename T, typename Func>
T AnalysisCache::GetOrCompute(const CacheKey& key, Func&& compute) {
    if (!IsEnabled()) {
        return compute();
    }

    if (auto cached = Lookup(key)) {
        if (auto* value = std::get_if<T>(&*cached)) {
            return std::move(*value);
        }
    }

    CachedResult stored = Store(key, CachedResult(compute()));
    return std::get<T>(std::move(stored));
}

} // namespace Kinetic
