#pragma once

#include <cstddef>
#include <optional>

/**
 * @brief Кэш ключ-значение ограниченной ёмкости
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Реализации: EvictionCache и декоратор ThreadSafeCache.
 * Отсутствие ключа не ошибка: get/peek возвращают std::nullopt,
 * remove/contains возвращают false.
 */
template<typename K, typename V>
class ICache {
public:
    virtual ~ICache() = default;

    /**
     * @brief Значение по ключу; попадание учитывается политикой вытеснения
     */
    virtual std::optional<V> get(const K& key) = 0;

    /**
     * @brief Значение по ключу без влияния на порядок вытеснения
     */
    virtual std::optional<V> peek(const K& key) const = 0;

    /**
     * @brief Вставить новый ключ или заменить значение существующего
     *
     * Новый ключ в полном кэше сначала вытесняет одну жертву.
     */
    virtual void put(const K& key, const V& value) = 0;

    /// @return false, если ключа не было
    virtual bool remove(const K& key) = 0;

    virtual void clear() = 0;

    virtual size_t size() const = 0;
    virtual bool contains(const K& key) const = 0;
    virtual size_t capacity() const = 0;
};
