#pragma once

#include <evictcache/ICache.hpp>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <utility>

/**
 * @brief Декоратор ICache с одной блокировкой на весь кэш
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Всё, что трогает политику вытеснения, идёт под эксклюзивной
 * блокировкой, включая get(): попадание меняет порядок LRU/MRU
 * и частоты LFU. peek(), contains(), size(), capacity() политику
 * не трогают и берут разделяемую блокировку.
 *
 * @code
 *   ThreadSafeCache<std::string, Row> cache(
 *       makeCache<std::string, Row>(CacheConfig::fromString("lru:4096")));
 * @endcode
 */
template<typename K, typename V>
class ThreadSafeCache : public ICache<K, V> {
    using ReadLock = std::shared_lock<std::shared_mutex>;
    using WriteLock = std::unique_lock<std::shared_mutex>;

public:
    /**
     * @throws std::invalid_argument если inner == nullptr
     */
    explicit ThreadSafeCache(std::unique_ptr<ICache<K, V>> inner)
        : inner_(std::move(inner))
    {
        if (!inner_) {
            throw std::invalid_argument("Inner cache cannot be null");
        }
    }

    std::optional<V> get(const K& key) override {
        WriteLock lock(mutex_);
        return inner_->get(key);
    }

    void put(const K& key, const V& value) override {
        WriteLock lock(mutex_);
        inner_->put(key, value);
    }

    bool remove(const K& key) override {
        WriteLock lock(mutex_);
        return inner_->remove(key);
    }

    void clear() override {
        WriteLock lock(mutex_);
        inner_->clear();
    }

    std::optional<V> peek(const K& key) const override {
        ReadLock lock(mutex_);
        return inner_->peek(key);
    }

    bool contains(const K& key) const override {
        ReadLock lock(mutex_);
        return inner_->contains(key);
    }

    size_t size() const override {
        ReadLock lock(mutex_);
        return inner_->size();
    }

    size_t capacity() const override {
        ReadLock lock(mutex_);
        return inner_->capacity();
    }

    /**
     * @brief Несколько операций как одна: функция получает внутренний кэш
     *        под эксклюзивной блокировкой
     *
     * Загрузка по промаху без гонки между проверкой и вставкой:
     * @code
     *   cache.withExclusiveLock([&](ICache<K, V>& inner) {
     *       if (!inner.contains(key)) {
     *           inner.put(key, load(key));
     *       }
     *   });
     * @endcode
     *
     * Вызывать методы самого декоратора изнутри нельзя: mutex не рекурсивный.
     */
    template<typename Func>
    decltype(auto) withExclusiveLock(Func&& operation) {
        WriteLock lock(mutex_);
        return std::forward<Func>(operation)(*inner_);
    }

private:
    std::unique_ptr<ICache<K, V>> inner_;
    mutable std::shared_mutex mutex_;
};
