#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Паттерны доступа для сравнения политик
 *
 * Каждый генератор возвращает готовую последовательность ключей
 * из диапазона [0, keyRange). Одинаковый seed даёт одинаковую
 * последовательность, поэтому все политики видят одну и ту же нагрузку.
 */

struct WorkloadParams {
    size_t keyRange = 2'000;
    size_t operations = 200'000;
    uint32_t seed = 42;

    /// Zipf: s=1.0 классика, больше — круче хвост
    double zipfExponent = 1.0;

    /// Temporal: доля обращений к окну недавних ключей
    double hotRatio = 0.7;
    size_t recentWindow = 100;

    /// Scan: длина цикла в ключах
    size_t scanLength = 0;
};

struct Workload {
    std::string name;
    std::string description;
    std::vector<int> keys;
};

/**
 * @brief Равномерное распределение, baseline
 */
inline Workload uniformWorkload(const WorkloadParams& p) {
    Workload w{"uniform", "all keys equally likely", {}};
    w.keys.reserve(p.operations);

    std::mt19937 rng(p.seed);
    std::uniform_int_distribution<int> dist(0, static_cast<int>(p.keyRange - 1));
    for (size_t i = 0; i < p.operations; ++i) {
        w.keys.push_back(dist(rng));
    }
    return w;
}

/**
 * @brief Степенной закон: p(k) ~ 1 / k^s
 *
 * Ключ 0 самый популярный.
 */
inline Workload zipfWorkload(const WorkloadParams& p) {
    Workload w{"zipf", "power law, s=" + std::to_string(p.zipfExponent).substr(0, 4), {}};
    w.keys.reserve(p.operations);

    std::vector<double> cumulative(p.keyRange);
    double total = 0.0;
    for (size_t i = 0; i < p.keyRange; ++i) {
        total += 1.0 / std::pow(static_cast<double>(i + 1), p.zipfExponent);
        cumulative[i] = total;
    }

    std::mt19937 rng(p.seed);
    std::uniform_real_distribution<double> dist(0.0, total);
    for (size_t i = 0; i < p.operations; ++i) {
        auto it = std::lower_bound(cumulative.begin(), cumulative.end(), dist(rng));
        size_t key = std::min(static_cast<size_t>(it - cumulative.begin()), p.keyRange - 1);
        w.keys.push_back(static_cast<int>(key));
    }
    return w;
}

/**
 * @brief Временная локальность
 *
 * hotRatio обращений повторяет один из последних recentWindow ключей,
 * остальные равномерны по всему диапазону.
 */
inline Workload temporalWorkload(const WorkloadParams& p) {
    if (p.hotRatio < 0.0 || p.hotRatio > 1.0) {
        throw std::invalid_argument("hotRatio must be in [0, 1]");
    }

    Workload w{"temporal", "recent keys are re-accessed", {}};
    w.keys.reserve(p.operations);

    std::mt19937 rng(p.seed);
    std::uniform_int_distribution<int> anyKey(0, static_cast<int>(p.keyRange - 1));
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    for (size_t i = 0; i < p.operations; ++i) {
        size_t recent = std::min(w.keys.size(), p.recentWindow);
        int key;
        if (recent > 0 && coin(rng) < p.hotRatio) {
            std::uniform_int_distribution<size_t> back(1, recent);
            key = w.keys[w.keys.size() - back(rng)];
        } else {
            key = anyKey(rng);
        }
        w.keys.push_back(key);
    }
    return w;
}

/**
 * @brief Циклический проход по scanLength ключам
 *
 * Если цикл чуть длиннее кэша, LRU и FIFO промахиваются всегда,
 * а MRU и LIFO сохраняют часть цикла.
 */
inline Workload scanWorkload(const WorkloadParams& p) {
    size_t length = p.scanLength > 0 ? p.scanLength : p.keyRange;
    Workload w{"scan", "cyclic scan over " + std::to_string(length) + " keys", {}};
    w.keys.reserve(p.operations);

    for (size_t i = 0; i < p.operations; ++i) {
        w.keys.push_back(static_cast<int>(i % length));
    }
    return w;
}
