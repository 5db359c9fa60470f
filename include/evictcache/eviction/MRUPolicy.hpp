#pragma once

#include <evictcache/IEvictionPolicy.hpp>
#include <evictcache/utils/KeyOrder.hpp>
#include <stdexcept>

/**
 * @brief Политика вытеснения MRU (Most Recently Used)
 * @tparam K Тип ключа
 *
 * Учёт такой же, как у LRU, но вытесняется самый свежий элемент.
 * Подходит для циклического сканирования, когда только что прочитанное
 * понадобится позже всего.
 *
 * Пример работы:
 *   put(A), put(B)  -> порядок: [A, B]
 *   get(A)          -> порядок: [B, A]
 *   selectVictim()  -> вернёт A
 *
 * @note При ёмкости 1 каждая новая вставка вытесняет единственный элемент.
 */
template<typename K>
class MRUPolicy : public IEvictionPolicy<K> {
public:
    void onAccess(const K& key) override {
        order_.moveToBack(key);
    }

    void onInsert(const K& key) override {
        order_.pushBack(key);
    }

    void onRemove(const K& key) override {
        order_.erase(key);
    }

    K selectVictim() override {
        if (order_.empty()) {
            throw std::logic_error("Cannot select victim from empty MRU policy");
        }
        return order_.back();
    }

    bool empty() const override {
        return order_.empty();
    }

    size_t size() const override {
        return order_.size();
    }

    void clear() override {
        order_.clear();
    }

    std::string name() const override {
        return "MRU";
    }

private:
    /// front() = LRU, back() = MRU
    KeyOrder<K> order_;
};
