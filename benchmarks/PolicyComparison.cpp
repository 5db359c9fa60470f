#include "workloads/Workloads.hpp"

#include <evictcache/CacheConfig.hpp>
#include <evictcache/EvictionCache.hpp>
#include <evictcache/listeners/StatsListener.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

/**
 * @brief Сравнение политик вытеснения по hit rate
 *
 * Для каждой нагрузки прогоняем read-through: get, при промахе put.
 * Все политики получают одну и ту же последовательность ключей.
 *
 * Запуск:
 *   evictcache_policy_comparison [light|standard|heavy] [capacity]
 */

struct RunResult {
    double hitRate;
    uint64_t evictions;
    double timeMs;
};

RunResult runWorkload(PolicyKind kind, size_t capacity, const std::vector<int>& keys) {
    CacheConfig config;
    config.policy = kind;
    config.capacity = capacity;

    auto cache = makeCache<int, int>(config);
    auto stats = std::make_shared<StatsListener<int, int>>();
    cache->addListener(stats);

    auto start = std::chrono::high_resolution_clock::now();
    for (int key : keys) {
        if (!cache->get(key).has_value()) {
            cache->put(key, key);
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return RunResult{stats->hitRate(), stats->evictions(), duration.count()};
}

void printWorkload(const Workload& workload, size_t capacity) {
    std::cout << "\n--- " << workload.name << ": " << workload.description << " ---\n";
    std::cout << std::left << std::setw(8) << "Policy"
              << std::right << std::setw(12) << "Hit Rate"
              << std::setw(14) << "Evictions"
              << std::setw(14) << "Time (ms)" << "\n";
    std::cout << std::string(48, '-') << "\n";

    for (PolicyKind kind : allPolicyKinds()) {
        RunResult r = runWorkload(kind, capacity, workload.keys);
        std::cout << std::left << std::setw(8) << toString(kind)
                  << std::right << std::setw(11) << std::fixed << std::setprecision(2)
                  << (r.hitRate * 100) << "%"
                  << std::setw(14) << r.evictions
                  << std::setw(14) << std::setprecision(1) << r.timeMs << "\n";
    }
}

int main(int argc, char* argv[]) {
    try {
        WorkloadParams params;
        size_t capacity = 500;

        std::string preset = argc > 1 ? argv[1] : "standard";
        if (preset == "light") {
            params.operations = 20'000;
        } else if (preset == "heavy") {
            params.keyRange = 20'000;
            params.operations = 2'000'000;
            capacity = 5'000;
        } else if (preset != "standard") {
            throw std::invalid_argument("Unknown preset: " + preset);
        }

        if (argc > 2) {
            CacheConfig parsed = CacheConfig::fromString("lru:" + std::string(argv[2]));
            capacity = parsed.capacity;
        }

        params.recentWindow = capacity / 5;
        params.scanLength = capacity + capacity / 10;

        std::cout << "=== Eviction Policy Comparison ===\n";
        std::cout << "Capacity: " << capacity
                  << ", key range: " << params.keyRange
                  << ", operations: " << params.operations << "\n";

        printWorkload(uniformWorkload(params), capacity);
        printWorkload(zipfWorkload(params), capacity);
        printWorkload(temporalWorkload(params), capacity);
        printWorkload(scanWorkload(params), capacity);

        std::cout << "\n=== Comparison complete ===\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
