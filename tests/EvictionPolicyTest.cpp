#include <gtest/gtest.h>
#include <monicache/eviction/FIFOPolicy.hpp>
#include <monicache/eviction/EphemeralFIFOPolicy.hpp>
#include <monicache/eviction/LRUPolicy.hpp>
#include <monicache/eviction/MRUPolicy.hpp>
#include <string>
#include <vector>

/**
 * @brief Тесты для FIFOPolicy, EphemeralFIFOPolicy, LRUPolicy, MRUPolicy
 *
 * Проверяем политики отдельно от Cache:
 * - выбор жертвы
 * - влияние onAccess / onUpdate на порядок
 * - порядок keys()
 * - удаление и граничные случаи
 */

using Keys = std::vector<std::string>;

// ==================== FIFOPolicy ====================

TEST(FIFOPolicyTest, EmptyOnCreate) {
    FIFOPolicy<std::string> policy;
    EXPECT_TRUE(policy.empty());
    EXPECT_TRUE(policy.keys().empty());
}

TEST(FIFOPolicyTest, SelectVictimThrowsWhenEmpty) {
    FIFOPolicy<std::string> policy;
    EXPECT_THROW(policy.selectVictim(), std::logic_error);
}

TEST(FIFOPolicyTest, SelectVictimReturnsOldest) {
    FIFOPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onInsert("C");

    EXPECT_EQ(policy.selectVictim(), "A");
}

TEST(FIFOPolicyTest, AccessAndUpdateDoNotChangeOrder) {
    FIFOPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onInsert("C");

    policy.onAccess("A");
    policy.onUpdate("A");
    policy.onAccess("B");

    EXPECT_EQ(policy.selectVictim(), "A");
    EXPECT_EQ(policy.keys(), (Keys{"A", "B", "C"}));
}

TEST(FIFOPolicyTest, RemoveUpdatesVictim) {
    FIFOPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onInsert("C");

    policy.onRemove("A");
    policy.onRemove("nonexistent");  // Не должно падать

    EXPECT_EQ(policy.selectVictim(), "B");
    EXPECT_EQ(policy.keys(), (Keys{"B", "C"}));
}

TEST(FIFOPolicyTest, ReinsertGoesToBack) {
    FIFOPolicy<int> policy;
    policy.onInsert(1);
    policy.onInsert(2);
    policy.onRemove(1);
    policy.onInsert(1);

    EXPECT_EQ(policy.selectVictim(), 2);
    EXPECT_EQ(policy.keys(), (std::vector<int>{2, 1}));
}

TEST(FIFOPolicyTest, ClearMakesEmpty) {
    FIFOPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.clear();

    EXPECT_TRUE(policy.empty());
    EXPECT_TRUE(policy.keys().empty());
}

TEST(FIFOPolicyTest, DoesNotConsumeOnRead) {
    FIFOPolicy<std::string> policy;
    EXPECT_FALSE(policy.consumeOnRead());
}

// ==================== EphemeralFIFOPolicy ====================

TEST(EphemeralFIFOPolicyTest, ConsumesOnRead) {
    EphemeralFIFOPolicy<std::string> policy;
    EXPECT_TRUE(policy.consumeOnRead());
}

TEST(EphemeralFIFOPolicyTest, EvictsOldestLikeFIFO) {
    EphemeralFIFOPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onUpdate("A");

    EXPECT_EQ(policy.selectVictim(), "A");
    EXPECT_EQ(policy.keys(), (Keys{"A", "B"}));
}

// ==================== LRUPolicy ====================

TEST(LRUPolicyTest, SelectVictimThrowsWhenEmpty) {
    LRUPolicy<std::string> policy;
    EXPECT_THROW(policy.selectVictim(), std::logic_error);
}

TEST(LRUPolicyTest, SelectVictimReturnsOldest) {
    LRUPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onInsert("C");

    EXPECT_EQ(policy.selectVictim(), "A");
}

TEST(LRUPolicyTest, AccessMovesToMostRecent) {
    // [A, B, C] -> get(A) -> [B, C, A], LRU = B
    LRUPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onInsert("C");

    policy.onAccess("A");

    EXPECT_EQ(policy.selectVictim(), "B");
    EXPECT_EQ(policy.keys(), (Keys{"B", "C", "A"}));
}

TEST(LRUPolicyTest, UpdateMovesToMostRecent) {
    LRUPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");

    policy.onUpdate("A");

    EXPECT_EQ(policy.selectVictim(), "B");
    EXPECT_EQ(policy.keys(), (Keys{"B", "A"}));
}

TEST(LRUPolicyTest, MultipleAccessesChangeOrder) {
    LRUPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onInsert("C");
    policy.onInsert("D");

    policy.onAccess("A");
    policy.onAccess("B");

    EXPECT_EQ(policy.selectVictim(), "C");
}

TEST(LRUPolicyTest, AccessNonExistentKeyDoesNothing) {
    LRUPolicy<std::string> policy;
    policy.onInsert("A");

    policy.onAccess("NonExistent");

    EXPECT_EQ(policy.selectVictim(), "A");
    EXPECT_EQ(policy.keys(), (Keys{"A"}));
}

TEST(LRUPolicyTest, RemoveMiddleElement) {
    LRUPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onInsert("C");

    policy.onRemove("B");

    EXPECT_EQ(policy.selectVictim(), "A");
    EXPECT_EQ(policy.keys(), (Keys{"A", "C"}));
}

// ==================== MRUPolicy ====================

TEST(MRUPolicyTest, SelectVictimThrowsWhenEmpty) {
    MRUPolicy<std::string> policy;
    EXPECT_THROW(policy.selectVictim(), std::logic_error);
}

TEST(MRUPolicyTest, SelectVictimReturnsNewest) {
    MRUPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onInsert("C");

    EXPECT_EQ(policy.selectVictim(), "C");
}

TEST(MRUPolicyTest, AccessMakesKeyTheVictim) {
    MRUPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onInsert("C");

    policy.onAccess("A");

    EXPECT_EQ(policy.selectVictim(), "A");
    EXPECT_EQ(policy.keys(), (Keys{"B", "C", "A"}));
}

TEST(MRUPolicyTest, UpdateMakesKeyTheVictim) {
    MRUPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");

    policy.onUpdate("A");

    EXPECT_EQ(policy.selectVictim(), "A");
}

TEST(MRUPolicyTest, RemoveVictimFallsBackToPrevious) {
    MRUPolicy<std::string> policy;
    policy.onInsert("A");
    policy.onInsert("B");
    policy.onInsert("C");

    policy.onRemove("C");

    EXPECT_EQ(policy.selectVictim(), "B");
}

TEST(MRUPolicyTest, ClearMakesEmpty) {
    MRUPolicy<int> policy;
    policy.onInsert(1);
    policy.clear();

    EXPECT_TRUE(policy.empty());
    EXPECT_THROW(policy.selectVictim(), std::logic_error);
}
