#pragma once

#include <evictcache/IEvictionPolicy.hpp>
#include <evictcache/utils/KeyOrder.hpp>
#include <stdexcept>

/**
 * @brief LRU: вытесняется ключ, к которому дольше всех не обращались
 * @tparam K Тип ключа
 *
 * order_ от давнего к свежему. Вставка и обращение ставят ключ в
 * конец, жертва берётся из начала.
 *
 *   put A, B, C   -> [A, B, C]
 *   get A         -> [B, C, A]
 *   selectVictim  -> B
 */
template<typename K>
class LRUPolicy : public IEvictionPolicy<K> {
public:
    void onAccess(const K& key) override { order_.moveToBack(key); }
    void onInsert(const K& key) override { order_.pushBack(key); }
    void onRemove(const K& key) override { order_.erase(key); }

    K selectVictim() override {
        if (order_.empty()) {
            throw std::logic_error("Cannot select victim from empty LRU policy");
        }
        return order_.front();
    }

    bool empty() const override { return order_.empty(); }
    size_t size() const override { return order_.size(); }
    void clear() override { order_.clear(); }
    std::string name() const override { return "LRU"; }

private:
    KeyOrder<K> order_;
};
