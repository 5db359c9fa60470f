#pragma once

#include <evictcache/IEvictionPolicy.hpp>
#include <evictcache/utils/KeyOrder.hpp>
#include <cstdint>
#include <iterator>
#include <limits>
#include <map>
#include <stdexcept>
#include <unordered_map>

/**
 * @brief LFU: вытесняется ключ с наименьшим числом обращений
 * @tparam K Тип ключа
 *
 * Частота нового ключа 1, каждое onAccess() прибавляет 1.
 * Ключи с одинаковой частотой лежат в одной корзине (KeyOrder)
 * в том порядке, в каком они эту частоту получили. Из нескольких
 * ключей с минимальной частотой уходит тот, кто получил её раньше.
 *
 *   put A, B, C        -> 1:[A, B, C]
 *   get B, get A       -> 1:[C]  2:[B, A]
 *   remove C           -> 2:[B, A]
 *   selectVictim       -> B
 *
 * Корзины упорядочены по частоте, минимум всегда buckets_.begin().
 * Поиск корзины O(log F), F = число различных частот; переход в
 * соседнюю корзину вставляется по подсказке. Частота достигает
 * максимума uint64_t и дальше не растёт.
 */
template<typename K>
class LFUPolicy : public IEvictionPolicy<K> {
public:
    void onAccess(const K& key) override {
        auto it = frequencies_.find(key);
        if (it == frequencies_.end()) {
            return;
        }

        auto bucket = buckets_.find(it->second);
        if (it->second == std::numeric_limits<uint64_t>::max()) {
            bucket->second.moveToBack(key);
            return;
        }

        ++it->second;
        auto next = buckets_.try_emplace(std::next(bucket), it->second);
        next->second.pushBack(key);
        bucket->second.erase(key);
        if (bucket->second.empty()) {
            buckets_.erase(bucket);
        }
    }

    void onInsert(const K& key) override {
        if (!frequencies_.emplace(key, 1).second) {
            return;
        }
        buckets_.try_emplace(buckets_.begin(), 1)->second.pushBack(key);
    }

    void onRemove(const K& key) override {
        auto it = frequencies_.find(key);
        if (it == frequencies_.end()) {
            return;
        }

        auto bucket = buckets_.find(it->second);
        bucket->second.erase(key);
        if (bucket->second.empty()) {
            buckets_.erase(bucket);
        }
        frequencies_.erase(it);
    }

    K selectVictim() override {
        if (buckets_.empty()) {
            throw std::logic_error("Cannot select victim from empty LFU policy");
        }
        return buckets_.begin()->second.front();
    }

    bool empty() const override { return frequencies_.empty(); }
    size_t size() const override { return frequencies_.size(); }

    void clear() override {
        frequencies_.clear();
        buckets_.clear();
    }

    std::string name() const override { return "LFU"; }

    /// Число обращений к ключу, 0 если ключ не отслеживается
    uint64_t frequency(const K& key) const {
        auto it = frequencies_.find(key);
        return it == frequencies_.end() ? 0 : it->second;
    }

    /// Наименьшая частота среди ключей; 0 для пустой политики
    uint64_t minFrequency() const {
        return buckets_.empty() ? 0 : buckets_.begin()->first;
    }

private:
    std::unordered_map<K, uint64_t> frequencies_;
    std::map<uint64_t, KeyOrder<K>> buckets_;
};
