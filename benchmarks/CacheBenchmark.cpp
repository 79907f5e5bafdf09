#include <monicache/Caches.hpp>
#include <monicache/ICache.hpp>
#include <monicache/monitoring/MonitoredCache.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Бенчмарк кэшей
 *
 * Измеряем:
 * - Throughput set/get для каждой политики (ops/sec)
 * - Цену обёрток: Simple* -> ThreadSafeCache -> MonitoredCache
 * - Hit rate политик при неравномерном (zipf-подобном) доступе
 * - Масштабирование ThreadSafeCache по числу потоков
 */

// ==================== Утилиты ====================

using CacheFactory = std::function<std::unique_ptr<ICache<int, int>>(size_t)>;

struct NamedFactory {
    std::string name;
    CacheFactory make;
};

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::steady_clock::now();
    func();
    auto end = std::chrono::steady_clock::now();

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

AlertConfig makeQuietAlerts() {
    AlertConfig config;
    config.notifyCallback = [](const std::string&) {};
    return config;
}

/**
 * @brief Ключи с перекосом: ключ k выбирается с весом 1 / (k + 1)
 */
std::vector<int> makeSkewedKeys(size_t count, int keyRange, unsigned seed) {
    std::vector<double> weights(static_cast<size_t>(keyRange));
    for (int k = 0; k < keyRange; ++k) {
        weights[static_cast<size_t>(k)] = 1.0 / (k + 1);
    }

    std::mt19937 rng(seed);
    std::discrete_distribution<int> dist(weights.begin(), weights.end());

    std::vector<int> keys(count);
    for (auto& key : keys) {
        key = dist(rng);
    }
    return keys;
}

std::vector<NamedFactory> singleThreadedFactories() {
    return {
        {"FIFO", [](size_t c) { return std::unique_ptr<ICache<int, int>>(new SimpleFIFOCache<int, int>(c)); }},
        {"LRU",  [](size_t c) { return std::unique_ptr<ICache<int, int>>(new SimpleLRUCache<int, int>(c)); }},
        {"MRU",  [](size_t c) { return std::unique_ptr<ICache<int, int>>(new SimpleMRUCache<int, int>(c)); }},
        {"LFU",  [](size_t c) { return std::unique_ptr<ICache<int, int>>(new SimpleLFUCache<int, int>(c)); }},
    };
}

std::vector<NamedFactory> threadSafeFactories() {
    return {
        {"ThreadSafe FIFO", [](size_t c) { return makeThreadSafeCache<int, int, FIFOPolicy>(c); }},
        {"ThreadSafe LRU",  [](size_t c) { return makeThreadSafeCache<int, int, LRUPolicy>(c); }},
        {"ThreadSafe MRU",  [](size_t c) { return makeThreadSafeCache<int, int, MRUPolicy>(c); }},
        {"ThreadSafe LFU",  [](size_t c) { return makeThreadSafeCache<int, int, LFUPolicy>(c); }},
    };
}

std::vector<NamedFactory> monitoredFactories() {
    return {
        {"Monitored FIFO", [](size_t c) { return std::unique_ptr<ICache<int, int>>(new MonitoredFIFOCache<int, int>(c, makeQuietAlerts())); }},
        {"Monitored LRU",  [](size_t c) { return std::unique_ptr<ICache<int, int>>(new MonitoredLRUCache<int, int>(c, makeQuietAlerts())); }},
        {"Monitored MRU",  [](size_t c) { return std::unique_ptr<ICache<int, int>>(new MonitoredMRUCache<int, int>(c, makeQuietAlerts())); }},
        {"Monitored LFU",  [](size_t c) { return std::unique_ptr<ICache<int, int>>(new MonitoredLFUCache<int, int>(c, makeQuietAlerts())); }},
    };
}

// ==================== Базовые бенчмарки ====================

void benchmarkSequentialSet(const NamedFactory& factory, size_t cacheSize, size_t numOperations) {
    auto cache = factory.make(cacheSize);

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache->set(static_cast<int>(i), static_cast<int>(i * 10));
        }
    });

    printResult(factory.name + " sequential set", timeMs, numOperations);
}

void benchmarkSequentialGet(const NamedFactory& factory, size_t cacheSize, size_t numOperations) {
    auto cache = factory.make(cacheSize);
    for (size_t i = 0; i < cacheSize; ++i) {
        cache->set(static_cast<int>(i), static_cast<int>(i));
    }

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache->get(static_cast<int>(i % cacheSize));
        }
    });

    printResult(factory.name + " get (100% hit)", timeMs, numOperations);
}

/**
 * @brief Read-through под перекосом: промах -> set
 */
void benchmarkSkewedHitRate(const NamedFactory& factory, size_t cacheSize,
                            const std::vector<int>& keys) {
    auto cache = factory.make(cacheSize);
    size_t hits = 0;

    double timeMs = measureMs([&]() {
        for (int key : keys) {
            if (cache->get(key).has_value()) {
                ++hits;
            } else {
                cache->set(key, key * 10);
            }
        }
    });

    printResult(factory.name + " skewed read-through", timeMs, keys.size());
    std::cout << "   Hit rate: " << std::fixed << std::setprecision(2)
              << (100.0 * hits / keys.size()) << "%\n";
}

// ==================== Многопоточность ====================

void benchmarkConcurrentMixed(const NamedFactory& factory, size_t cacheSize,
                              int numThreads, int opsPerThread) {
    auto cache = factory.make(cacheSize);
    const int keyRange = static_cast<int>(cacheSize * 2);

    double timeMs = measureMs([&]() {
        std::vector<std::thread> threads;
        for (int t = 0; t < numThreads; ++t) {
            threads.emplace_back([&cache, t, opsPerThread, keyRange]() {
                std::mt19937 rng(static_cast<unsigned>(t + 1));
                std::uniform_int_distribution<int> keyDist(0, keyRange - 1);
                std::uniform_int_distribution<int> opDist(0, 99);
                for (int i = 0; i < opsPerThread; ++i) {
                    int key = keyDist(rng);
                    if (opDist(rng) < 80) {
                        cache->get(key);
                    } else {
                        cache->set(key, i);
                    }
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    });

    printResult(factory.name + " mixed 80/20, threads=" + std::to_string(numThreads),
                timeMs, static_cast<size_t>(numThreads) * opsPerThread);
}

// ==================== Main ====================

int main() {
    const size_t SMALL_CACHE = 1000;
    const size_t LARGE_CACHE = 100000;
    const size_t NUM_OPS = 1000000;

    std::vector<NamedFactory> all;
    for (auto group : {singleThreadedFactories(), threadSafeFactories(), monitoredFactories()}) {
        all.insert(all.end(), group.begin(), group.end());
    }

    std::cout << "=== Cache Benchmark ===\n";
    std::cout << "Operations: " << NUM_OPS << "\n\n";

    std::cout << "--- Sequential set (size=" << SMALL_CACHE << ", eviction-heavy) ---\n";
    for (const auto& factory : all) {
        benchmarkSequentialSet(factory, SMALL_CACHE, NUM_OPS);
    }

    std::cout << "\n--- Get (size=" << LARGE_CACHE << ") ---\n";
    for (const auto& factory : all) {
        benchmarkSequentialGet(factory, LARGE_CACHE, NUM_OPS);
    }

    std::cout << "\n--- Skewed access (range=" << SMALL_CACHE * 10 << ") ---\n";
    auto skewedKeys = makeSkewedKeys(NUM_OPS, static_cast<int>(SMALL_CACHE * 10), 42);
    for (const auto& factory : singleThreadedFactories()) {
        benchmarkSkewedHitRate(factory, SMALL_CACHE, skewedKeys);
    }

    const int maxThreads = static_cast<int>(std::max(2u, std::thread::hardware_concurrency()));
    std::cout << "\n--- Concurrent mixed workload ---\n";
    for (const auto& factory : threadSafeFactories()) {
        for (int threads = 1; threads <= maxThreads; threads *= 2) {
            benchmarkConcurrentMixed(factory, SMALL_CACHE, threads,
                                     static_cast<int>(NUM_OPS) / threads);
        }
    }

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
