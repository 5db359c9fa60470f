#pragma once

#include <evictcache/ICache.hpp>
#include <evictcache/IEvictionPolicy.hpp>
#include <evictcache/listeners/ICacheListener.hpp>
#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Кэш фиксированной ёмкости с политикой вытеснения
 * @tparam K Тип ключа (hashable)
 * @tparam V Тип значения (копируемый)
 *
 * Значения лежат в unordered_map, порядок вытеснения ведёт политика
 * (IEvictionPolicy). Кэш владеет политикой и держит её согласованной
 * с хранилищем: политика отслеживает ровно те ключи, что есть в data_.
 *
 * Инварианты:
 * - size() <= capacity()
 * - вытеснение происходит только при put() нового ключа в полный кэш,
 *   и ровно одно
 *
 * Не потокобезопасен, для общего доступа есть ThreadSafeCache.
 *
 * @code
 *   EvictionCache<std::string, int> cache(2, std::make_unique<LFUPolicy<std::string>>());
 *   cache.put("a", 1);
 *   cache.put("b", 2);
 *   cache.get("a");
 *   cache.put("c", 3);   // вытеснен "b": у него меньше обращений
 * @endcode
 */
template<typename K, typename V>
class EvictionCache : public ICache<K, V> {
public:
    using Listener = ICacheListener<K, V>;

    /**
     * @param capacity Ёмкость, > 0
     * @param evictionPolicy Пустая политика, кэш забирает владение
     * @throws std::invalid_argument при capacity == 0, nullptr
     *         или политике, уже отслеживающей ключи
     */
    EvictionCache(size_t capacity, std::unique_ptr<IEvictionPolicy<K>> evictionPolicy)
        : capacity_(capacity)
        , policy_(std::move(evictionPolicy))
    {
        if (capacity_ == 0) {
            throw std::invalid_argument("Cache capacity must be greater than 0");
        }
        if (!policy_) {
            throw std::invalid_argument("Eviction policy cannot be null");
        }
        if (!policy_->empty()) {
            throw std::invalid_argument("Eviction policy must not track keys before use");
        }
    }

    std::optional<V> get(const K& key) override {
        auto it = data_.find(key);
        if (it == data_.end()) {
            notify(&Listener::onMiss, key);
            return std::nullopt;
        }

        policy_->onAccess(key);
        notify(&Listener::onHit, key);
        return it->second;
    }

    std::optional<V> peek(const K& key) const override {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * Повторный put() существующего ключа заменяет значение и
     * считается обращением (как get), размер не меняется.
     *
     * Вытеснение и вставка завершаются до уведомлений: onEvict и
     * onInsert вызываются, когда хранилище и политика уже согласованы,
     * поэтому исключение из слушателя не оставляет put() наполовину.
     */
    void put(const K& key, const V& value) override {
        auto it = data_.find(key);
        if (it != data_.end()) {
            V previous = std::exchange(it->second, value);
            policy_->onAccess(key);
            notify(&Listener::onUpdate, key, previous, value);
            return;
        }

        std::optional<std::pair<K, V>> evicted;
        if (data_.size() == capacity_) {
            evicted = evictOne();
        }

        data_.emplace(key, value);
        policy_->onInsert(key);

        if (evicted) {
            notify(&Listener::onEvict, evicted->first, evicted->second);
        }
        notify(&Listener::onInsert, key, value);
    }

    bool remove(const K& key) override {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return false;
        }

        data_.erase(it);
        policy_->onRemove(key);
        notify(&Listener::onRemove, key);
        return true;
    }

    void clear() override {
        const size_t dropped = data_.size();
        data_.clear();
        policy_->clear();
        notify(&Listener::onClear, dropped);
    }

    size_t size() const override { return data_.size(); }

    bool contains(const K& key) const override { return data_.count(key) != 0; }

    size_t capacity() const override { return capacity_; }

    /// "FIFO", "LIFO", "LRU", "MRU" или "LFU"
    std::string policyName() const { return policy_->name(); }

    /// Политика только для чтения (диагностика и тесты)
    const IEvictionPolicy<K>& evictionPolicy() const { return *policy_; }

    void addListener(std::shared_ptr<Listener> listener) {
        if (listener) {
            listeners_.push_back(std::move(listener));
        }
    }

    void removeListener(const std::shared_ptr<Listener>& listener) {
        listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                         listeners_.end());
    }

private:
    /// Убирает жертву из хранилища и политики, слушателей не трогает
    std::pair<K, V> evictOne() {
        // Копия: после onRemove() ссылка внутрь политики недействительна
        const K victim = policy_->selectVictim();

        auto it = data_.find(victim);
        if (it == data_.end()) {
            throw std::logic_error("Eviction policy selected a key that is not cached");
        }

        std::pair<K, V> evicted(victim, std::move(it->second));
        data_.erase(it);
        policy_->onRemove(victim);
        return evicted;
    }

    template<typename... Params, typename... Args>
    void notify(void (Listener::*hook)(Params...), const Args&... args) {
        for (const auto& listener : listeners_) {
            ((*listener).*hook)(args...);
        }
    }

    size_t capacity_;
    std::unordered_map<K, V> data_;
    std::unique_ptr<IEvictionPolicy<K>> policy_;
    std::vector<std::shared_ptr<Listener>> listeners_;
};
