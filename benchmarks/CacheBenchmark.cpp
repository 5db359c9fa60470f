#include <evictcache/CacheConfig.hpp>
#include <evictcache/EvictionCache.hpp>
#include <evictcache/concurrency/ThreadSafeCache.hpp>
#include <evictcache/listeners/LoggingListener.hpp>
#include <evictcache/listeners/StatsListener.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Бенчмарк пропускной способности кэша
 *
 * Для каждой политики измеряем:
 * - put с вытеснением на каждой операции
 * - get при 100% попаданий (для LRU/MRU/LFU это ещё и перестановка)
 * - смешанную нагрузку 80/20
 *
 * Отдельно: стоимость слушателей и ThreadSafeCache под конкуренцией.
 */

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

std::unique_ptr<EvictionCache<int, int>> makeIntCache(PolicyKind kind, size_t capacity) {
    CacheConfig config;
    config.policy = kind;
    config.capacity = capacity;
    return makeCache<int, int>(config);
}

// ==================== По политикам ====================

void benchmarkEvictingPut(PolicyKind kind, size_t cacheSize, size_t numOperations) {
    auto cache = makeIntCache(kind, cacheSize);

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache->put(static_cast<int>(i), static_cast<int>(i));
        }
    });

    printResult(toString(kind) + " put (evict every op)", timeMs, numOperations);
}

void benchmarkHitGet(PolicyKind kind, size_t cacheSize, size_t numOperations) {
    auto cache = makeIntCache(kind, cacheSize);
    for (size_t i = 0; i < cacheSize; ++i) {
        cache->put(static_cast<int>(i), static_cast<int>(i));
    }

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache->get(static_cast<int>(i % cacheSize));
        }
    });

    printResult(toString(kind) + " get (100% hit)", timeMs, numOperations);
}

void benchmarkMixedWorkload(PolicyKind kind, size_t cacheSize, size_t numOperations) {
    auto cache = makeIntCache(kind, cacheSize);

    std::mt19937 rng(42);
    std::uniform_int_distribution<int> keyDist(0, static_cast<int>(cacheSize * 2));
    std::uniform_int_distribution<int> opDist(0, 99);

    std::vector<std::pair<int, int>> operations(numOperations);
    for (auto& op : operations) {
        op = {keyDist(rng), opDist(rng)};
    }

    double timeMs = measureMs([&]() {
        for (const auto& [key, op] : operations) {
            if (op < 80) {
                cache->get(key);
            } else {
                cache->put(key, key * 10);
            }
        }
    });

    printResult(toString(kind) + " mixed (80% read, 20% write)", timeMs, numOperations);
}

// ==================== Слушатели ====================

void benchmarkListenerOverhead(size_t cacheSize, size_t numOperations) {
    std::cout << "\n--- Listener overhead (LRU, unique keys) ---\n";

    auto run = [&](const std::string& name, auto&& setup) {
        auto cache = makeIntCache(PolicyKind::LRU, cacheSize);
        setup(*cache);
        double timeMs = measureMs([&]() {
            for (size_t i = 0; i < numOperations; ++i) {
                int key = static_cast<int>(i);
                if (!cache->get(key).has_value()) {
                    cache->put(key, key);
                }
            }
        });
        printResult(name, timeMs, numOperations);
    };

    run("No listeners", [](EvictionCache<int, int>&) {});

    run("StatsListener", [](EvictionCache<int, int>& cache) {
        cache.addListener(std::make_shared<StatsListener<int, int>>());
    });

    // Поток в памяти, чтобы не мерить консоль
    std::ostringstream sink;
    run("LoggingListener (Info level)", [&sink](EvictionCache<int, int>& cache) {
        cache.addListener(std::make_shared<LoggingListener<int, int>>(
            "bench", sink, LogLevel::Info));
    });

    run("LoggingListener (Off)", [&sink](EvictionCache<int, int>& cache) {
        cache.addListener(std::make_shared<LoggingListener<int, int>>(
            "bench", sink, LogLevel::Off));
    });
}

// ==================== Многопоточность ====================

void benchmarkThreadSafeCache(size_t cacheSize, size_t opsPerThread) {
    std::cout << "\n--- ThreadSafeCache (LRU, 80% get / 20% put) ---\n";

    for (int numThreads : {1, 2, 4, 8}) {
        ThreadSafeCache<int, int> cache(makeIntCache(PolicyKind::LRU, cacheSize));

        double timeMs = measureMs([&]() {
            std::vector<std::thread> threads;
            for (int t = 0; t < numThreads; ++t) {
                threads.emplace_back([&cache, t, cacheSize, opsPerThread]() {
                    std::mt19937 rng(42 + t);
                    std::uniform_int_distribution<int> keyDist(0, static_cast<int>(cacheSize * 2));
                    std::uniform_int_distribution<int> opDist(0, 99);
                    for (size_t i = 0; i < opsPerThread; ++i) {
                        int key = keyDist(rng);
                        if (opDist(rng) < 80) {
                            cache.get(key);
                        } else {
                            cache.put(key, key);
                        }
                    }
                });
            }
            for (auto& th : threads) {
                th.join();
            }
        });

        printResult(std::to_string(numThreads) + " thread(s)", timeMs,
                    opsPerThread * numThreads);
    }
}

// ==================== Main ====================

int main() {
    const size_t SMALL_CACHE = 1000;
    const size_t LARGE_CACHE = 100000;
    const size_t NUM_OPS = 1000000;

    std::cout << "=== Cache Benchmark ===\n";
    std::cout << "Operations: " << NUM_OPS << "\n";

    try {
        for (PolicyKind kind : allPolicyKinds()) {
            std::cout << "\n--- " << toString(kind) << " ---\n";
            benchmarkEvictingPut(kind, SMALL_CACHE, NUM_OPS);
            benchmarkHitGet(kind, LARGE_CACHE, NUM_OPS);
            benchmarkMixedWorkload(kind, LARGE_CACHE, NUM_OPS);
        }

        benchmarkListenerOverhead(SMALL_CACHE, NUM_OPS / 2);
        benchmarkThreadSafeCache(SMALL_CACHE * 10, NUM_OPS / 4);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
