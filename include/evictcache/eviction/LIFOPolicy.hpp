#pragma once

#include <evictcache/IEvictionPolicy.hpp>
#include <evictcache/utils/KeyOrder.hpp>
#include <stdexcept>

/**
 * @brief Политика вытеснения LIFO (Last In, First Out)
 * @tparam K Тип ключа
 *
 * Вытесняет элемент, вставленный последним. Старые элементы
 * остаются в кэше, пока их не удалят явно.
 * Обращения порядок не меняют.
 *
 * Пример работы:
 *   put(A), put(B)  -> порядок: [A, B]
 *   put(C)          -> вытеснен B, порядок: [A, C]
 */
template<typename K>
class LIFOPolicy : public IEvictionPolicy<K> {
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
            throw std::logic_error("Cannot select victim from empty LIFO policy");
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
        return "LIFO";
    }

private:
    /// Порядок вставки: back() = последний вставленный
    KeyOrder<K> order_;
};
