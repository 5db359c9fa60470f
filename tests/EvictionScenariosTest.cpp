#include <gtest/gtest.h>
#include <evictcache/CacheConfig.hpp>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Сценарии вытеснения для всех пяти политик
 *
 * Проверяем:
 * - Эталонные сценарии на ёмкости 2 для каждой политики
 * - Инварианты, общие для всех политик (параметризованные тесты)
 */

namespace {

std::unique_ptr<EvictionCache<std::string, int>> makeStringCache(PolicyKind kind, size_t capacity) {
    return std::make_unique<EvictionCache<std::string, int>>(
        capacity, makeEvictionPolicy<std::string>(kind));
}

/**
 * @brief Порядок вытеснения: заполняем кэш и по одному вставляем новые ключи,
 *        фиксируя, какой ключ пропал после каждой вставки
 */
std::vector<int> drainOrder(EvictionCache<int, int>& cache, int firstNewKey, int count) {
    std::vector<int> evicted;
    for (int i = 0; i < count; ++i) {
        std::vector<int> before;
        for (int k = 0; k < firstNewKey + i; ++k) {
            if (cache.contains(k)) {
                before.push_back(k);
            }
        }
        cache.put(firstNewKey + i, 0);
        for (int k : before) {
            if (!cache.contains(k)) {
                evicted.push_back(k);
            }
        }
    }
    return evicted;
}

}  // namespace

// ==================== Эталонные сценарии ====================

TEST(EvictionScenariosTest, FIFOEvictsOldestInserted) {
    auto cache = makeStringCache(PolicyKind::FIFO, 2);
    cache->put("A", 1);
    cache->put("B", 2);
    cache->put("C", 3);

    EXPECT_FALSE(cache->get("A").has_value());
    EXPECT_EQ(cache->get("B").value(), 2);
}

TEST(EvictionScenariosTest, LIFOEvictsNewestInserted) {
    auto cache = makeStringCache(PolicyKind::LIFO, 2);
    cache->put("A", 1);
    cache->put("B", 2);
    cache->put("C", 3);

    EXPECT_FALSE(cache->get("B").has_value());
    EXPECT_EQ(cache->get("A").value(), 1);
}

TEST(EvictionScenariosTest, LRUEvictsLeastRecentlyUsed) {
    auto cache = makeStringCache(PolicyKind::LRU, 2);
    cache->put("A", 1);
    cache->put("B", 2);
    cache->get("A");
    cache->put("C", 3);

    EXPECT_FALSE(cache->get("B").has_value());
    EXPECT_EQ(cache->get("A").value(), 1);
}

TEST(EvictionScenariosTest, MRUEvictsMostRecentlyUsed) {
    auto cache = makeStringCache(PolicyKind::MRU, 2);
    cache->put("A", 1);
    cache->put("B", 2);
    cache->get("A");
    cache->put("C", 3);

    EXPECT_FALSE(cache->get("A").has_value());
    EXPECT_EQ(cache->get("B").value(), 2);
}

TEST(EvictionScenariosTest, LFUEvictsLeastFrequentlyUsed) {
    auto cache = makeStringCache(PolicyKind::LFU, 2);
    cache->put("A", 1);
    cache->put("B", 2);
    cache->get("A");
    cache->put("C", 3);

    EXPECT_FALSE(cache->get("B").has_value());
    EXPECT_EQ(cache->get("A").value(), 1);
}

TEST(EvictionScenariosTest, MRUCapacityOneEvictsSoleEntry) {
    auto cache = makeStringCache(PolicyKind::MRU, 1);
    cache->put("A", 1);
    cache->put("B", 2);
    cache->put("C", 3);

    EXPECT_EQ(cache->size(), 1);
    EXPECT_FALSE(cache->contains("A"));
    EXPECT_FALSE(cache->contains("B"));
    EXPECT_EQ(cache->get("C").value(), 3);
}

TEST(EvictionScenariosTest, FIFOReinsertKeepsOriginalPosition) {
    auto cache = makeStringCache(PolicyKind::FIFO, 2);
    cache->put("A", 1);
    cache->put("B", 2);
    cache->put("A", 10);  // только значение
    cache->put("C", 3);

    EXPECT_FALSE(cache->contains("A"));
    EXPECT_TRUE(cache->contains("B"));
}

TEST(EvictionScenariosTest, LIFOReinsertKeepsOriginalPosition) {
    auto cache = makeStringCache(PolicyKind::LIFO, 2);
    cache->put("A", 1);
    cache->put("B", 2);
    cache->put("A", 10);
    cache->put("C", 3);

    EXPECT_TRUE(cache->contains("A"));
    EXPECT_FALSE(cache->contains("B"));
}

TEST(EvictionScenariosTest, LRUReinsertRefreshesRecency) {
    auto cache = makeStringCache(PolicyKind::LRU, 2);
    cache->put("A", 1);
    cache->put("B", 2);
    cache->put("A", 10);
    cache->put("C", 3);

    EXPECT_TRUE(cache->contains("A"));
    EXPECT_FALSE(cache->contains("B"));
}

TEST(EvictionScenariosTest, MRUReinsertRefreshesRecency) {
    auto cache = makeStringCache(PolicyKind::MRU, 2);
    cache->put("A", 1);
    cache->put("B", 2);
    cache->put("A", 10);
    cache->put("C", 3);

    EXPECT_FALSE(cache->contains("A"));
    EXPECT_TRUE(cache->contains("B"));
}

// ==================== Инварианты для всех политик ====================

class AllPoliciesTest : public ::testing::TestWithParam<PolicyKind> {};

TEST_P(AllPoliciesTest, SizeNeverExceedsCapacity) {
    EvictionCache<int, int> cache(8, makeEvictionPolicy<int>(GetParam()));
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> keyDist(0, 63);

    for (int i = 0; i < 2000; ++i) {
        int key = keyDist(rng);
        if (i % 3 == 0) {
            cache.get(key);
        } else {
            cache.put(key, i);
        }
        ASSERT_LE(cache.size(), cache.capacity());
        ASSERT_EQ(cache.evictionPolicy().size(), cache.size());
    }
}

TEST_P(AllPoliciesTest, FullAfterEvictingPut) {
    EvictionCache<int, int> cache(4, makeEvictionPolicy<int>(GetParam()));
    for (int i = 0; i < 4; ++i) {
        cache.put(i, i);
    }

    for (int i = 4; i < 20; ++i) {
        cache.put(i, i);
        EXPECT_EQ(cache.size(), 4);
        EXPECT_TRUE(cache.contains(i));
    }
}

TEST_P(AllPoliciesTest, RePutNeverChangesSize) {
    EvictionCache<int, int> cache(3, makeEvictionPolicy<int>(GetParam()));
    cache.put(1, 1);
    cache.put(2, 2);

    for (int i = 0; i < 10; ++i) {
        cache.put(1, i);
        cache.put(2, i);
        EXPECT_EQ(cache.size(), 2);
    }

    cache.put(3, 3);
    size_t full = cache.size();
    cache.put(3, 30);
    cache.put(1, 10);
    EXPECT_EQ(cache.size(), full);
}

TEST_P(AllPoliciesTest, ContainsDoesNotAlterEvictionOrder) {
    // Одна и та же последовательность, во втором кэше — с contains()
    EvictionCache<int, int> baseline(3, makeEvictionPolicy<int>(GetParam()));
    EvictionCache<int, int> inspected(3, makeEvictionPolicy<int>(GetParam()));

    for (auto* cache : {&baseline, &inspected}) {
        cache->put(0, 0);
        cache->put(1, 1);
        cache->put(2, 2);
        cache->get(1);
    }
    for (int round = 0; round < 5; ++round) {
        for (int k = 0; k < 3; ++k) {
            inspected.contains(k);
            inspected.peek(k);
        }
    }

    EXPECT_EQ(drainOrder(baseline, 10, 3), drainOrder(inspected, 10, 3));
}

TEST_P(AllPoliciesTest, GetMissDoesNotAlterEvictionOrder) {
    EvictionCache<int, int> baseline(3, makeEvictionPolicy<int>(GetParam()));
    EvictionCache<int, int> inspected(3, makeEvictionPolicy<int>(GetParam()));

    for (auto* cache : {&baseline, &inspected}) {
        cache->put(0, 0);
        cache->put(1, 1);
        cache->put(2, 2);
    }
    for (int missing = 100; missing < 110; ++missing) {
        inspected.get(missing);
    }

    EXPECT_EQ(drainOrder(baseline, 10, 3), drainOrder(inspected, 10, 3));
}

TEST_P(AllPoliciesTest, RemovePreservesRelativeOrderOfOthers) {
    // Удалённый ключ 1 должен выглядеть так, будто его никогда не было
    EvictionCache<int, int> baseline(4, makeEvictionPolicy<int>(GetParam()));
    EvictionCache<int, int> removed(4, makeEvictionPolicy<int>(GetParam()));

    baseline.put(0, 0);
    baseline.put(2, 2);
    baseline.put(3, 3);
    baseline.get(2);

    removed.put(0, 0);
    removed.put(1, 1);
    removed.put(2, 2);
    removed.put(3, 3);
    removed.get(2);
    removed.remove(1);

    baseline.put(4, 4);
    removed.put(4, 4);

    EXPECT_EQ(removed.size(), 4);
    EXPECT_EQ(drainOrder(baseline, 10, 3), drainOrder(removed, 10, 3));
}

TEST_P(AllPoliciesTest, ClearResetsPolicy) {
    EvictionCache<int, int> cache(3, makeEvictionPolicy<int>(GetParam()));
    cache.put(1, 1);
    cache.put(2, 2);

    cache.clear();

    EXPECT_EQ(cache.size(), 0);
    EXPECT_TRUE(cache.evictionPolicy().empty());
    cache.put(3, 3);
    EXPECT_EQ(cache.evictionPolicy().size(), 1);
}

TEST_P(AllPoliciesTest, PolicyTracksStoreUnderRandomOperations) {
    EvictionCache<int, int> cache(16, makeEvictionPolicy<int>(GetParam()));

    std::mt19937 rng(123);
    std::uniform_int_distribution<int> keyDist(0, 40);
    std::uniform_int_distribution<int> opDist(0, 99);

    for (int i = 0; i < 5000; ++i) {
        int key = keyDist(rng);
        int op = opDist(rng);
        if (op < 45) {
            cache.put(key, i);
        } else if (op < 85) {
            cache.get(key);
        } else if (op < 95) {
            cache.remove(key);
        } else if (op < 99) {
            cache.peek(key);
        } else {
            cache.clear();
        }

        ASSERT_LE(cache.size(), cache.capacity());
        ASSERT_EQ(cache.evictionPolicy().size(), cache.size()) << "step " << i;
    }
}

TEST_P(AllPoliciesTest, PolicyNameMatchesKind) {
    EvictionCache<int, int> cache(1, makeEvictionPolicy<int>(GetParam()));

    EXPECT_EQ(cache.policyName(), toString(GetParam()));
}

INSTANTIATE_TEST_SUITE_P(
    EvictionPolicies,
    AllPoliciesTest,
    ::testing::Values(PolicyKind::FIFO, PolicyKind::LIFO, PolicyKind::LRU,
                      PolicyKind::MRU, PolicyKind::LFU),
    [](const ::testing::TestParamInfo<PolicyKind>& info) {
        return toString(info.param);
    });
