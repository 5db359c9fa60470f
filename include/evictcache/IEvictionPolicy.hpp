#pragma once

#include <cstddef>
#include <string>

/**
 * @brief Политика вытеснения: решает, какой ключ уйдёт из полного кэша
 * @tparam K Тип ключа
 *
 * Политика знает только ключи и свою метаинформацию (порядок или
 * частоты), значения хранит EvictionCache. Кэш сообщает ей о каждом
 * событии, поэтому множество ключей политики всегда совпадает
 * с содержимым кэша.
 *
 * Вытеснение в два шага: selectVictim() только называет ключ,
 * удаляет его кэш, после чего вызывает onRemove(victim).
 */
template<typename K>
class IEvictionPolicy {
public:
    virtual ~IEvictionPolicy() = default;

    /// Попадание get() или повторный put() существующего ключа
    virtual void onAccess(const K& key) = 0;

    /// Новый ключ. Повторная вставка отслеживаемого ключа игнорируется.
    virtual void onInsert(const K& key) = 0;

    /// Ключ ушёл из кэша: remove() или вытеснение
    virtual void onRemove(const K& key) = 0;

    /**
     * @brief Кандидат на вытеснение; состояние не меняется
     * @throws std::logic_error если политика пуста
     */
    virtual K selectVictim() = 0;

    virtual bool empty() const = 0;
    virtual size_t size() const = 0;
    virtual void clear() = 0;

    /// "FIFO", "LIFO", "LRU", "MRU", "LFU"
    virtual std::string name() const = 0;
};
