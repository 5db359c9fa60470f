#include <gtest/gtest.h>
#include <evictcache/eviction/LRUPolicy.hpp>
#include <string>
#include <vector>

/**
 * @brief Тесты для LRUPolicy
 *
 * Порядок вытеснения проверяем целиком: drain() вынимает жертв
 * по одной, как это делал бы кэш.
 */

namespace {

std::vector<std::string> drain(LRUPolicy<std::string>& policy) {
    std::vector<std::string> order;
    while (!policy.empty()) {
        order.push_back(policy.selectVictim());
        policy.onRemove(order.back());
    }
    return order;
}

using Keys = std::vector<std::string>;

}  // namespace

TEST(LRUPolicyTest, FreshPolicy) {
    LRUPolicy<std::string> policy;

    EXPECT_TRUE(policy.empty());
    EXPECT_EQ(policy.size(), 0);
    EXPECT_EQ(policy.name(), "LRU");
    EXPECT_THROW(policy.selectVictim(), std::logic_error);
}

TEST(LRUPolicyTest, WithoutAccessesEvictsInInsertionOrder) {
    LRUPolicy<std::string> policy;
    for (const char* page : {"/home", "/cart", "/login"}) {
        policy.onInsert(page);
    }

    EXPECT_EQ(drain(policy), (Keys{"/home", "/cart", "/login"}));
}

TEST(LRUPolicyTest, SelectVictimIsStable) {
    LRUPolicy<std::string> policy;
    policy.onInsert("x");
    policy.onInsert("y");

    EXPECT_EQ(policy.selectVictim(), "x");
    EXPECT_EQ(policy.selectVictim(), "x");
    EXPECT_EQ(policy.size(), 2);
}

TEST(LRUPolicyTest, AccessedKeyGoesToTheEnd) {
    LRUPolicy<std::string> policy;
    policy.onInsert("a");
    policy.onInsert("b");
    policy.onInsert("c");
    policy.onInsert("d");

    policy.onAccess("b");
    policy.onAccess("a");

    EXPECT_EQ(drain(policy), (Keys{"c", "d", "b", "a"}));
}

TEST(LRUPolicyTest, AccessToNewestChangesNothing) {
    LRUPolicy<std::string> policy;
    policy.onInsert("a");
    policy.onInsert("b");

    policy.onAccess("b");
    policy.onAccess("b");

    EXPECT_EQ(drain(policy), (Keys{"a", "b"}));
}

TEST(LRUPolicyTest, UnknownKeysAreIgnored) {
    LRUPolicy<std::string> policy;
    policy.onInsert("a");
    policy.onInsert("b");

    policy.onAccess("ghost");
    policy.onRemove("ghost");

    EXPECT_EQ(drain(policy), (Keys{"a", "b"}));
}

TEST(LRUPolicyTest, RemoveKeepsRelativeOrder) {
    LRUPolicy<std::string> policy;
    for (const char* key : {"a", "b", "c", "d"}) {
        policy.onInsert(key);
    }
    policy.onAccess("a");

    policy.onRemove("c");

    EXPECT_EQ(policy.size(), 3);
    EXPECT_EQ(drain(policy), (Keys{"b", "d", "a"}));
}

TEST(LRUPolicyTest, ReinsertAfterRemoveIsNewest) {
    LRUPolicy<std::string> policy;
    policy.onInsert("a");
    policy.onInsert("b");

    policy.onRemove("a");
    policy.onInsert("a");

    EXPECT_EQ(drain(policy), (Keys{"b", "a"}));
}

TEST(LRUPolicyTest, ClearForgetsEverything) {
    LRUPolicy<std::string> policy;
    policy.onInsert("a");
    policy.onInsert("b");

    policy.clear();
    policy.onInsert("c");

    EXPECT_EQ(drain(policy), (Keys{"c"}));
}

TEST(LRUPolicyTest, IntegerKeysLongSequence) {
    LRUPolicy<int> policy;
    for (int i = 0; i < 100; ++i) {
        policy.onInsert(i);
    }
    // Чётные ключи "прочитаны", нечётные остались в начале
    for (int i = 0; i < 100; i += 2) {
        policy.onAccess(i);
    }

    EXPECT_EQ(policy.selectVictim(), 1);
    policy.onRemove(1);
    EXPECT_EQ(policy.selectVictim(), 3);
}
