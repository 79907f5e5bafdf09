#include <gtest/gtest.h>
#include <monicache/Caches.hpp>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Поведение готовых кэшей (Caches.hpp) для каждой политики
 *
 * Общие свойства проверяются typed-тестами сразу для всех
 * потокобезопасных и однопоточных вариантов, сценарии вытеснения —
 * отдельно для каждой политики.
 */

using Keys = std::vector<std::string>;

// ==================== Общие свойства всех политик ====================

template<typename CacheType>
class AnyPolicyCacheTest : public ::testing::Test {};

using AllCaches = ::testing::Types<
    FIFOCache<std::string, int>,
    EphemeralFIFOCache<std::string, int>,
    LRUCache<std::string, int>,
    MRUCache<std::string, int>,
    LFUCache<std::string, int>,
    SimpleFIFOCache<std::string, int>,
    SimpleEphemeralFIFOCache<std::string, int>,
    SimpleLRUCache<std::string, int>,
    SimpleMRUCache<std::string, int>,
    SimpleLFUCache<std::string, int>>;

TYPED_TEST_SUITE(AnyPolicyCacheTest, AllCaches);

TYPED_TEST(AnyPolicyCacheTest, RejectsZeroCapacity) {
    EXPECT_THROW(TypeParam cache(0), std::invalid_argument);
}

TYPED_TEST(AnyPolicyCacheTest, HoldsUpToCapacityWithLastWrittenValues) {
    TypeParam cache(5);
    for (int i = 0; i < 5; ++i) {
        cache.set("k" + std::to_string(i), i);
    }
    cache.set("k2", 200);

    EXPECT_EQ(cache.size(), 5u);
    EXPECT_EQ(cache.keys().size(), 5u);
    for (int i = 0; i < 5; ++i) {
        const std::string key = "k" + std::to_string(i);
        EXPECT_TRUE(cache.contains(key));
    }
    // Последним читаем k2: для одноразового кэша чтение удаляет ключ
    auto value = cache.get("k2");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 200);
}

TYPED_TEST(AnyPolicyCacheTest, NeverExceedsCapacity) {
    TypeParam cache(3);
    for (int i = 0; i < 50; ++i) {
        cache.set("k" + std::to_string(i), i);
        if (i % 3 == 0) {
            cache.get("k" + std::to_string(i / 2));
        }
        EXPECT_LE(cache.size(), 3u);
    }
}

TYPED_TEST(AnyPolicyCacheTest, CapacityPlusOneDistinctKeysLeavesCapacity) {
    TypeParam cache(4);
    for (int i = 0; i < 5; ++i) {
        cache.set("k" + std::to_string(i), i);
    }

    EXPECT_EQ(cache.size(), 4u);
    EXPECT_EQ(cache.capacity(), 4u);
}

TYPED_TEST(AnyPolicyCacheTest, ClearEmptiesEverything) {
    TypeParam cache(4);
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);

    cache.clear();

    EXPECT_TRUE(cache.keys().empty());
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_FALSE(cache.get("c").has_value());
}

TYPED_TEST(AnyPolicyCacheTest, ReusableAfterClear) {
    TypeParam cache(2);
    cache.set("a", 1);
    cache.clear();
    cache.set("b", 2);
    cache.set("c", 3);
    cache.set("d", 4);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains("d"));
}

TYPED_TEST(AnyPolicyCacheTest, GetMissingKeyHasNoSideEffects) {
    TypeParam cache(2);
    cache.set("a", 1);
    const auto before = cache.keys();

    EXPECT_FALSE(cache.get("missing").has_value());

    EXPECT_EQ(cache.keys(), before);
    EXPECT_EQ(cache.size(), 1u);
}

// ==================== FIFO ====================

TEST(FIFOCacheTest, GetDoesNotChangeEvictionOrder) {
    FIFOCache<std::string, int> cache(3);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.set("C", 3);

    cache.get("A");
    cache.get("A");
    cache.set("D", 4);   // вытесняет A несмотря на чтения
    cache.set("E", 5);   // вытесняет B

    EXPECT_EQ(cache.keys(), (Keys{"C", "D", "E"}));
    EXPECT_FALSE(cache.get("A").has_value());
    EXPECT_FALSE(cache.get("B").has_value());
}

TEST(FIFOCacheTest, UpdateKeepsPositionAndDoesNotEvict) {
    FIFOCache<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);

    cache.set("A", 10);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.keys(), (Keys{"A", "B"}));

    cache.set("C", 3);   // A всё ещё самый старый

    EXPECT_EQ(cache.keys(), (Keys{"B", "C"}));
}

// ==================== Ephemeral FIFO ====================

TEST(EphemeralFIFOCacheTest, SecondReadReturnsNothing) {
    EphemeralFIFOCache<std::string, int> cache(2);
    cache.set("A", 1);

    auto first = cache.get("A");
    auto second = cache.get("A");

    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 1);
    EXPECT_FALSE(second.has_value());
}

TEST(EphemeralFIFOCacheTest, EvictsOldestAndKeepsPositionOnUpdate) {
    EphemeralFIFOCache<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.set("A", 10);
    cache.set("C", 3);

    EXPECT_EQ(cache.keys(), (Keys{"B", "C"}));
}

TEST(EphemeralFIFOCacheTest, ReadFreesSlot) {
    EphemeralFIFOCache<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);

    cache.get("A");
    cache.set("C", 3);   // место свободно — вытеснения нет

    EXPECT_EQ(cache.keys(), (Keys{"B", "C"}));
}

// ==================== LRU ====================

TEST(LRUCacheTest, EvictsLeastRecentlyUsed) {
    LRUCache<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 1);
    cache.get("A");
    cache.set("C", 1);

    EXPECT_FALSE(cache.get("B").has_value());
    EXPECT_EQ(cache.get("A").value(), 1);
    EXPECT_EQ(cache.get("C").value(), 1);
}

TEST(LRUCacheTest, UpdateRefreshesRecency) {
    LRUCache<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.set("A", 3);
    cache.set("C", 4);

    EXPECT_EQ(cache.keys(), (Keys{"A", "C"}));
}

// ==================== MRU ====================

TEST(MRUCacheTest, EvictsMostRecentlyUsed) {
    MRUCache<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.get("B");
    cache.set("C", 3);

    EXPECT_FALSE(cache.contains("B"));
    EXPECT_EQ(cache.get("A").value(), 1);
    EXPECT_EQ(cache.get("C").value(), 3);
}

TEST(MRUCacheTest, NewestWriteAlwaysSurvives) {
    MRUCache<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.set("C", 3);   // вытесняет B
    cache.set("D", 4);   // вытесняет C

    EXPECT_EQ(cache.keys(), (Keys{"A", "D"}));
}

TEST(MRUCacheTest, ReadMakesKeyTheNextVictim) {
    MRUCache<std::string, int> cache(3);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.set("C", 3);
    cache.get("A");
    cache.set("D", 4);

    EXPECT_FALSE(cache.contains("A"));
    EXPECT_EQ(cache.keys(), (Keys{"B", "C", "D"}));
}

// ==================== LFU ====================

TEST(LFUCacheTest, EvictsLeastFrequentlyUsed) {
    LFUCache<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.get("A");
    cache.set("C", 3);

    EXPECT_FALSE(cache.contains("B"));
    EXPECT_EQ(cache.get("A").value(), 1);
    EXPECT_EQ(cache.get("C").value(), 3);
}

TEST(LFUCacheTest, SetDoesNotResetFrequency) {
    LFUCache<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.get("A");
    cache.get("A");
    cache.get("B");
    cache.set("A", 10);   // частота A остаётся 3
    cache.set("C", 3);    // вытесняет B (частота 2)

    EXPECT_FALSE(cache.contains("B"));
    EXPECT_EQ(cache.get("A").value(), 10);
}

TEST(LFUCacheTest, TieEvictsOldestInserted) {
    LFUCache<std::string, int> cache(3);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.set("C", 3);
    cache.set("D", 4);

    EXPECT_EQ(cache.keys(), (Keys{"B", "C", "D"}));
}

TEST(LFUCacheTest, TieAfterReadsEvictsOldestInserted) {
    LFUCache<std::string, int> cache(3);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.set("C", 3);
    cache.get("C");
    cache.get("B");
    cache.get("A");   // у всех частота 2, A читали последним
    cache.set("D", 4);

    EXPECT_EQ(cache.keys(), (Keys{"B", "C", "D"}));
}

TEST(LFUCacheTest, ToStringUsesInsertionOrder) {
    LFUCache<std::string, int> cache(3);
    cache.set("A", 1);
    cache.set("B", 2);
    cache.get("B");

    EXPECT_EQ(cache.toString(), "{A: 1, B: 2}");
}

// ==================== Значения без operator<< ====================

namespace {

struct Quote {
    double bid;
    double ask;
};

}  // namespace

TEST(NonStreamableValueTest, CacheWorksWithPlainStruct) {
    LRUCache<std::string, Quote> quotes(2);
    quotes.set("EURUSD", Quote{1.0850, 1.0852});
    quotes.set("GBPUSD", Quote{1.2710, 1.2713});

    auto quote = quotes.get("EURUSD");
    ASSERT_TRUE(quote.has_value());
    EXPECT_DOUBLE_EQ(quote->bid, 1.0850);
    EXPECT_DOUBLE_EQ(quote->ask, 1.0852);

    quotes.set("USDJPY", Quote{149.10, 149.12});
    EXPECT_FALSE(quotes.contains("GBPUSD"));
}

TEST(NonStreamableValueTest, ToStringPrintsValuePlaceholder) {
    LRUCache<std::string, Quote> quotes(2);
    quotes.set("EURUSD", Quote{1.0850, 1.0852});
    quotes.set("GBPUSD", Quote{1.2710, 1.2713});

    EXPECT_EQ(quotes.toString(), "{EURUSD: <value>, GBPUSD: <value>}");
}

TEST(NonStreamableValueTest, StreamableTraitDetectsOperator) {
    EXPECT_TRUE(is_streamable_v<int>);
    EXPECT_TRUE(is_streamable_v<std::string>);
    EXPECT_FALSE(is_streamable_v<Quote>);
}
