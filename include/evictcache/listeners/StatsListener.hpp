#pragma once

#include <evictcache/listeners/ICacheListener.hpp>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

/**
 * @brief События, которые считает StatsListener
 */
enum class CacheEvent : size_t {
    Hit,
    Miss,
    Insert,
    Update,
    Evict,
    Remove,
    Clear,
    Count_
};

/**
 * @brief Снимок счётчиков на момент вызова snapshot()
 */
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t inserts = 0;
    uint64_t updates = 0;
    uint64_t evictions = 0;
    uint64_t removes = 0;
    uint64_t clears = 0;

    uint64_t lookups() const { return hits + misses; }

    double hitRate() const {
        return lookups() == 0 ? 0.0
                              : static_cast<double>(hits) / static_cast<double>(lookups());
    }
};

/**
 * @brief Слушатель-счётчик событий кэша
 *
 * По одному atomic-счётчику на CacheEvent. Хватает, чтобы
 * сравнить политики на одной нагрузке: hit rate и число вытеснений.
 *
 * @code
 *   auto stats = std::make_shared<StatsListener<std::string, Row>>();
 *   cache.addListener(stats);
 *   ...
 *   std::cout << stats->snapshot().hitRate() << "\n";
 * @endcode
 */
template<typename K, typename V>
class StatsListener : public ICacheListener<K, V> {
public:
    void onHit(const K&) override { bump(CacheEvent::Hit); }
    void onMiss(const K&) override { bump(CacheEvent::Miss); }
    void onInsert(const K&, const V&) override { bump(CacheEvent::Insert); }
    void onUpdate(const K&, const V&, const V&) override { bump(CacheEvent::Update); }
    void onEvict(const K&, const V&) override { bump(CacheEvent::Evict); }
    void onRemove(const K&) override { bump(CacheEvent::Remove); }
    void onClear(size_t) override { bump(CacheEvent::Clear); }

    uint64_t count(CacheEvent event) const {
        return counters_[index(event)].load(std::memory_order_relaxed);
    }

    uint64_t hits() const { return count(CacheEvent::Hit); }
    uint64_t misses() const { return count(CacheEvent::Miss); }
    uint64_t inserts() const { return count(CacheEvent::Insert); }
    uint64_t updates() const { return count(CacheEvent::Update); }
    uint64_t evictions() const { return count(CacheEvent::Evict); }
    uint64_t removes() const { return count(CacheEvent::Remove); }
    uint64_t clears() const { return count(CacheEvent::Clear); }

    /// Число вызовов get(): попадания + промахи
    uint64_t totalRequests() const { return hits() + misses(); }

    /// Доля попаданий, 0.0 если get() ещё не вызывали
    double hitRate() const { return snapshot().hitRate(); }

    CacheStats snapshot() const {
        CacheStats stats;
        stats.hits = hits();
        stats.misses = misses();
        stats.inserts = inserts();
        stats.updates = updates();
        stats.evictions = evictions();
        stats.removes = removes();
        stats.clears = clears();
        return stats;
    }

    void reset() {
        for (auto& counter : counters_) {
            counter.store(0, std::memory_order_relaxed);
        }
    }

private:
    static constexpr size_t index(CacheEvent event) {
        return static_cast<size_t>(event);
    }

    void bump(CacheEvent event) {
        counters_[index(event)].fetch_add(1, std::memory_order_relaxed);
    }

    std::array<std::atomic<uint64_t>, static_cast<size_t>(CacheEvent::Count_)> counters_{};
};
