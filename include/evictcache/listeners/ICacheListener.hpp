#pragma once

#include <cstddef>

/**
 * @brief Наблюдатель за EvictionCache
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Хуки вызываются синхронно, в порядке addListener(), после того
 * как хранилище и политика уже согласованы. Пустые реализации по
 * умолчанию: переопределяйте только то, что нужно.
 *
 * put() нового ключа в полный кэш даёт onEvict(жертва), затем onInsert.
 * peek() и contains() событий не порождают.
 */
template<typename K, typename V>
class ICacheListener {
public:
    virtual ~ICacheListener() = default;

    virtual void onHit(const K& /*key*/) {}
    virtual void onMiss(const K& /*key*/) {}
    virtual void onInsert(const K& /*key*/, const V& /*value*/) {}
    virtual void onUpdate(const K& /*key*/, const V& /*oldValue*/, const V& /*newValue*/) {}
    virtual void onEvict(const K& /*key*/, const V& /*value*/) {}
    virtual void onRemove(const K& /*key*/) {}
    virtual void onClear(size_t /*count*/) {}
};
