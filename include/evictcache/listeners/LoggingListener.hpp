#pragma once

#include <evictcache/listeners/ICacheListener.hpp>
#include <iostream>
#include <string>

/**
 * @brief Уровень подробности LoggingListener
 *
 * Debug — каждое обращение (hit, miss, insert, update).
 * Info  — только события, меняющие состав кэша без участия клиента
 *         и массовые операции (evict, remove, clear).
 */
enum class LogLevel {
    Debug,
    Info,
    Off
};

/**
 * @brief Слушатель для логирования событий кэша в поток
 * @tparam K Тип ключа (должен поддерживать вывод в ostream)
 * @tparam V Тип значения (должен поддерживать вывод в ostream)
 *
 * Формат строки: "[<prefix>] EVENT: подробности"
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener<std::string, int>>("users");
 *   cache.addListener(logger);
 *
 * LogLevel::Off глушит вывод, не снимая слушателя с кэша.
 */
template<typename K, typename V>
class LoggingListener : public ICacheListener<K, V> {
public:
    /**
     * @param prefix Префикс для всех сообщений (например, имя кэша)
     * @param os Поток вывода (по умолчанию std::cout)
     * @param level Минимальный уровень выводимых событий
     */
    explicit LoggingListener(const std::string& prefix = "Cache",
                             std::ostream& os = std::cout,
                             LogLevel level = LogLevel::Debug)
        : prefix_(prefix)
        , os_(os)
        , level_(level)
    {}

    void onHit(const K& key) override {
        if (!enabled(LogLevel::Debug)) return;
        os_ << "[" << prefix_ << "] HIT: " << key << "\n";
    }

    void onMiss(const K& key) override {
        if (!enabled(LogLevel::Debug)) return;
        os_ << "[" << prefix_ << "] MISS: " << key << "\n";
    }

    void onInsert(const K& key, const V& value) override {
        if (!enabled(LogLevel::Debug)) return;
        os_ << "[" << prefix_ << "] INSERT: " << key << " = " << value << "\n";
    }

    void onUpdate(const K& key, const V& oldValue, const V& newValue) override {
        if (!enabled(LogLevel::Debug)) return;
        os_ << "[" << prefix_ << "] UPDATE: " << key
            << " (" << oldValue << " -> " << newValue << ")\n";
    }

    void onEvict(const K& key, const V& value) override {
        if (!enabled(LogLevel::Info)) return;
        os_ << "[" << prefix_ << "] EVICT: " << key << " = " << value << "\n";
    }

    void onRemove(const K& key) override {
        if (!enabled(LogLevel::Info)) return;
        os_ << "[" << prefix_ << "] REMOVE: " << key << "\n";
    }

    void onClear(size_t count) override {
        if (!enabled(LogLevel::Info)) return;
        os_ << "[" << prefix_ << "] CLEAR: " << count << " elements\n";
    }

    LogLevel level() const { return level_; }
    void setLevel(LogLevel level) { level_ = level; }

private:
    bool enabled(LogLevel eventLevel) const {
        return level_ != LogLevel::Off &&
               static_cast<int>(eventLevel) >= static_cast<int>(level_);
    }

    std::string prefix_;
    std::ostream& os_;
    LogLevel level_;
};
