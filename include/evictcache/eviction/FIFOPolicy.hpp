#pragma once

#include <evictcache/IEvictionPolicy.hpp>
#include <evictcache/utils/KeyOrder.hpp>
#include <stdexcept>

/**
 * @brief Политика вытеснения FIFO (First In, First Out)
 * @tparam K Тип ключа
 *
 * Вытесняет элемент, вставленный раньше всех.
 * Обращения (get и обновление значения) порядок не меняют.
 *
 * Пример работы:
 *   put(A), put(B), put(C) -> порядок: [A, B, C]
 *   get(A), put(A, ...)    -> порядок: [A, B, C]  (без изменений)
 *   selectVictim()         -> вернёт A
 */
template<typename K>
class FIFOPolicy : public IEvictionPolicy<K> {
public:
    void onAccess(const K& key) override {
        (void)key;
    }

    void onInsert(const K& key) override {
        order_.pushBack(key);
    }

    void onRemove(const K& key) override {
        order_.erase(key);
    }

    K selectVictim() override {
        if (order_.empty()) {
            throw std::logic_error("Cannot select victim from empty FIFO policy");
        }
        return order_.front();
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
        return "FIFO";
    }

private:
    /// Порядок вставки: front() = самый старый
    KeyOrder<K> order_;
};
