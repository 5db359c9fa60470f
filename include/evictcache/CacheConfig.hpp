#pragma once

#include <evictcache/EvictionCache.hpp>
#include <evictcache/eviction/FIFOPolicy.hpp>
#include <evictcache/eviction/LIFOPolicy.hpp>
#include <evictcache/eviction/LRUPolicy.hpp>
#include <evictcache/eviction/MRUPolicy.hpp>
#include <evictcache/eviction/LFUPolicy.hpp>
#include <array>
#include <cctype>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * @brief Доступные политики вытеснения
 */
enum class PolicyKind {
    FIFO,
    LIFO,
    LRU,
    MRU,
    LFU
};

/**
 * @brief Все политики в порядке объявления (для перебора в тестах и бенчмарках)
 */
inline constexpr std::array<PolicyKind, 5> allPolicyKinds() {
    return {PolicyKind::FIFO, PolicyKind::LIFO, PolicyKind::LRU,
            PolicyKind::MRU, PolicyKind::LFU};
}

inline std::string toString(PolicyKind kind) {
    switch (kind) {
        case PolicyKind::FIFO: return "FIFO";
        case PolicyKind::LIFO: return "LIFO";
        case PolicyKind::LRU:  return "LRU";
        case PolicyKind::MRU:  return "MRU";
        case PolicyKind::LFU:  return "LFU";
    }
    throw std::invalid_argument("Unknown policy kind");
}

/**
 * @brief Разобрать имя политики без учёта регистра ("lru", "LFU", ...)
 * @return PolicyKind или std::nullopt для неизвестного имени
 */
inline std::optional<PolicyKind> parsePolicyKind(std::string_view text) {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    for (PolicyKind kind : allPolicyKinds()) {
        if (toString(kind) == upper) {
            return kind;
        }
    }
    return std::nullopt;
}

/**
 * @brief Создать политику вытеснения по её виду
 * @tparam K Тип ключа
 */
template<typename K>
std::unique_ptr<IEvictionPolicy<K>> makeEvictionPolicy(PolicyKind kind) {
    switch (kind) {
        case PolicyKind::FIFO: return std::make_unique<FIFOPolicy<K>>();
        case PolicyKind::LIFO: return std::make_unique<LIFOPolicy<K>>();
        case PolicyKind::LRU:  return std::make_unique<LRUPolicy<K>>();
        case PolicyKind::MRU:  return std::make_unique<MRUPolicy<K>>();
        case PolicyKind::LFU:  return std::make_unique<LFUPolicy<K>>();
    }
    throw std::invalid_argument("Unknown policy kind");
}

/**
 * @brief Конфигурация кэша
 *
 * Задаётся кодом или строкой вида "<policy>[:<capacity>]":
 * @code
 *   auto config = CacheConfig::fromString("lfu:256");
 *   auto cache = makeCache<std::string, Row>(config);
 * @endcode
 */
struct CacheConfig {
    /// Максимальное количество элементов
    size_t capacity = 1024;

    /// Политика вытеснения
    PolicyKind policy = PolicyKind::LRU;

    /**
     * @brief Проверить конфигурацию
     * @throws std::invalid_argument при нулевой ёмкости
     */
    void validate() const {
        if (capacity == 0) {
            throw std::invalid_argument("Cache capacity must be greater than 0");
        }
    }

    /**
     * @brief Разобрать конфигурацию из строки "<policy>[:<capacity>]"
     * @throws std::invalid_argument при неизвестной политике,
     *         нечисловой или нулевой ёмкости
     */
    static CacheConfig fromString(std::string_view text) {
        CacheConfig config;

        std::string_view policyPart = text;
        std::string_view capacityPart;
        size_t colon = text.find(':');
        if (colon != std::string_view::npos) {
            policyPart = text.substr(0, colon);
            capacityPart = text.substr(colon + 1);
        }

        auto kind = parsePolicyKind(policyPart);
        if (!kind) {
            throw std::invalid_argument("Unknown eviction policy: " + std::string(policyPart));
        }
        config.policy = *kind;

        if (colon != std::string_view::npos) {
            config.capacity = parseCapacity(capacityPart);
        }

        config.validate();
        return config;
    }

private:
    static size_t parseCapacity(std::string_view text) {
        if (text.empty()) {
            throw std::invalid_argument("Cache capacity is missing");
        }

        size_t value = 0;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Cache capacity is not a number: " + std::string(text));
            }
            size_t digit = static_cast<size_t>(c - '0');
            if (value > (static_cast<size_t>(-1) - digit) / 10) {
                throw std::invalid_argument("Cache capacity is too large: " + std::string(text));
            }
            value = value * 10 + digit;
        }
        return value;
    }
};

/**
 * @brief Создать кэш по конфигурации
 * @throws std::invalid_argument если конфигурация некорректна
 */
template<typename K, typename V>
std::unique_ptr<EvictionCache<K, V>> makeCache(const CacheConfig& config) {
    config.validate();
    return std::make_unique<EvictionCache<K, V>>(
        config.capacity, makeEvictionPolicy<K>(config.policy));
}
