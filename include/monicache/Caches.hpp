#pragma once

#include <monicache/Cache.hpp>
#include <monicache/concurrency/ThreadSafeCache.hpp>
#include <monicache/eviction/FIFOPolicy.hpp>
#include <monicache/eviction/EphemeralFIFOPolicy.hpp>
#include <monicache/eviction/LRUPolicy.hpp>
#include <monicache/eviction/MRUPolicy.hpp>
#include <monicache/eviction/LFUPolicy.hpp>
#include <memory>

/**
 * @brief Готовые кэши с фиксированной политикой
 *
 * Simple*Cache — однопоточные (Cache + политика).
 * *Cache      — потокобезопасные (ThreadSafeCache поверх того же Cache).
 *
 * Пример:
 * @code
 *   LRUCache<std::string, int> cache(100);
 *   cache.set("a", 1);
 * @endcode
 *
 * @throws std::invalid_argument если capacity == 0
 */

/**
 * @brief Собрать потокобезопасный кэш с политикой Policy
 */
template<typename K, typename V, template<typename> class Policy>
std::unique_ptr<ICache<K, V>> makeThreadSafeCache(size_t capacity) {
    return std::make_unique<ThreadSafeCache<K, V>>(
        std::make_unique<Cache<K, V>>(capacity, std::make_unique<Policy<K>>()));
}

// ==================== Однопоточные ====================

template<typename K, typename V>
class SimpleFIFOCache : public Cache<K, V> {
public:
    explicit SimpleFIFOCache(size_t capacity)
        : Cache<K, V>(capacity, std::make_unique<FIFOPolicy<K>>()) {}
};

template<typename K, typename V>
class SimpleEphemeralFIFOCache : public Cache<K, V> {
public:
    explicit SimpleEphemeralFIFOCache(size_t capacity)
        : Cache<K, V>(capacity, std::make_unique<EphemeralFIFOPolicy<K>>()) {}
};

template<typename K, typename V>
class SimpleLRUCache : public Cache<K, V> {
public:
    explicit SimpleLRUCache(size_t capacity)
        : Cache<K, V>(capacity, std::make_unique<LRUPolicy<K>>()) {}
};

template<typename K, typename V>
class SimpleMRUCache : public Cache<K, V> {
public:
    explicit SimpleMRUCache(size_t capacity)
        : Cache<K, V>(capacity, std::make_unique<MRUPolicy<K>>()) {}
};

template<typename K, typename V>
class SimpleLFUCache : public Cache<K, V> {
public:
    explicit SimpleLFUCache(size_t capacity)
        : Cache<K, V>(capacity, std::make_unique<LFUPolicy<K>>()) {}
};

// ==================== Потокобезопасные ====================

template<typename K, typename V>
class FIFOCache : public ThreadSafeCache<K, V> {
public:
    explicit FIFOCache(size_t capacity)
        : ThreadSafeCache<K, V>(std::make_unique<SimpleFIFOCache<K, V>>(capacity)) {}
};

template<typename K, typename V>
class EphemeralFIFOCache : public ThreadSafeCache<K, V> {
public:
    explicit EphemeralFIFOCache(size_t capacity)
        : ThreadSafeCache<K, V>(std::make_unique<SimpleEphemeralFIFOCache<K, V>>(capacity)) {}
};

template<typename K, typename V>
class LRUCache : public ThreadSafeCache<K, V> {
public:
    explicit LRUCache(size_t capacity)
        : ThreadSafeCache<K, V>(std::make_unique<SimpleLRUCache<K, V>>(capacity)) {}
};

template<typename K, typename V>
class MRUCache : public ThreadSafeCache<K, V> {
public:
    explicit MRUCache(size_t capacity)
        : ThreadSafeCache<K, V>(std::make_unique<SimpleMRUCache<K, V>>(capacity)) {}
};

template<typename K, typename V>
class LFUCache : public ThreadSafeCache<K, V> {
public:
    explicit LFUCache(size_t capacity)
        : ThreadSafeCache<K, V>(std::make_unique<SimpleLFUCache<K, V>>(capacity)) {}
};
