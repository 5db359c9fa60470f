#pragma once

#include <iterator>
#include <list>
#include <unordered_map>
#include <vector>
#include <cstddef>
#include <stdexcept>

/**
 * @brief Упорядоченное множество ключей с O(1) перестановкой
 * @tparam K Тип ключа
 *
 * Структуры данных:
 * - std::list<K> order_ — двусвязный список ключей
 *   front() = самый старый, back() = самый новый
 * - std::unordered_map<K, iterator> keyToIterator_ — позиция ключа в списке
 *
 * Общая основа для всех политик:
 * - FIFO/LIFO: порядок вставки
 * - LRU/MRU: порядок обращений
 * - LFU: порядок внутри одной частоты
 *
 * Сложность всех операций: O(1)
 *
 * Пример работы:
 *   pushBack(A), pushBack(B), pushBack(C) -> [A, B, C]
 *   moveToBack(A)                         -> [B, C, A]
 *   front() = B, back() = A
 */
template<typename K>
class KeyOrder {
public:
    /**
     * @brief Добавить ключ в конец (самая новая позиция)
     * @return false, если ключ уже есть (порядок не меняется)
     */
    bool pushBack(const K& key) {
        if (keyToIterator_.find(key) != keyToIterator_.end()) {
            return false;
        }
        order_.push_back(key);
        keyToIterator_[key] = std::prev(order_.end());
        return true;
    }

    /**
     * @brief Переместить ключ в конец
     * @return false, если ключа нет
     *
     * std::list::splice перемещает узел без копирования/аллокации — O(1).
     * Итератор в keyToIterator_ остаётся валидным.
     */
    bool moveToBack(const K& key) {
        auto it = keyToIterator_.find(key);
        if (it == keyToIterator_.end()) {
            return false;
        }
        order_.splice(order_.end(), order_, it->second);
        return true;
    }

    /**
     * @brief Удалить ключ
     * @return true, если ключ был удалён
     */
    bool erase(const K& key) {
        auto it = keyToIterator_.find(key);
        if (it == keyToIterator_.end()) {
            return false;
        }
        order_.erase(it->second);
        keyToIterator_.erase(it);
        return true;
    }

    /**
     * @brief Самый старый ключ
     * @throws std::logic_error если порядок пуст
     */
    const K& front() const {
        if (order_.empty()) {
            throw std::logic_error("KeyOrder is empty");
        }
        return order_.front();
    }

    /**
     * @brief Самый новый ключ
     * @throws std::logic_error если порядок пуст
     */
    const K& back() const {
        if (order_.empty()) {
            throw std::logic_error("KeyOrder is empty");
        }
        return order_.back();
    }

    bool contains(const K& key) const {
        return keyToIterator_.find(key) != keyToIterator_.end();
    }

    size_t size() const {
        return order_.size();
    }

    bool empty() const {
        return order_.empty();
    }

    void clear() {
        order_.clear();
        keyToIterator_.clear();
    }

    /**
     * @brief Снимок порядка от самого старого к самому новому
     */
    std::vector<K> keys() const {
        return std::vector<K>(order_.begin(), order_.end());
    }

private:
    std::list<K> order_;
    std::unordered_map<K, typename std::list<K>::iterator> keyToIterator_;
};
