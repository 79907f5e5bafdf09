#include <monicache/Caches.hpp>
#include <monicache/listeners/LoggingListener.hpp>
#include <monicache/monitoring/MonitoredCache.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Демонстрация библиотеки кэширования
 *
 * Сценарии:
 * 1. Одна и та же последовательность операций на разных политиках
 * 2. Одноразовые значения (EphemeralFIFO)
 * 3. Логирование событий через LoggingListener
 * 4. Метрики и оповещения MonitoredCache
 * 5. Общий кэш для нескольких потоков
 */

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

/**
 * @brief Прогоняет сценарий: a, b, c; читаем a дважды и c один раз; добавляем d
 */
template<typename CacheType>
void runScenario(const std::string& name) {
    CacheType cache(3);

    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);
    cache.get("a");
    cache.get("a");
    cache.get("c");
    cache.set("d", 4);

    std::cout << "  " << std::left << std::setw(6) << name
              << cache.toString() << "\n";
}

/**
 * @brief Демо 1: Сравнение политик
 *
 * Ёмкость 3, четвёртая вставка вытесняет одного:
 * FIFO — самого старого, LRU — давно не читанного,
 * MRU — последнего прочитанного, LFU — реже всех читанного.
 */
void demoPolicies() {
    printSeparator("Demo 1: Eviction Policies");

    std::cout << "set a, b, c -> get a, get a, get c -> set d\n\n";

    runScenario<FIFOCache<std::string, int>>("FIFO");
    runScenario<LRUCache<std::string, int>>("LRU");
    runScenario<MRUCache<std::string, int>>("MRU");
    runScenario<LFUCache<std::string, int>>("LFU");
}

/**
 * @brief Демо 2: Одноразовые токены
 */
void demoEphemeral() {
    printSeparator("Demo 2: One-shot Tokens (EphemeralFIFO)");

    EphemeralFIFOCache<std::string, std::string> tokens(100);
    tokens.set("session-42", "c0ffee");

    auto first = tokens.get("session-42");
    auto second = tokens.get("session-42");

    std::cout << "  First read:  " << first.value_or("<none>") << "\n";
    std::cout << "  Second read: " << second.value_or("<none>") << "\n";
    std::cout << "  Size after reads: " << tokens.size() << "\n";
}

/**
 * @brief Демо 3: События кэша в лог
 */
void demoLogging() {
    printSeparator("Demo 3: Logging Listener");

    SimpleLRUCache<std::string, int> cache(2);
    cache.addListener(std::make_shared<LoggingListener<std::string, int>>("lru", std::cout));

    cache.set("x", 10);
    cache.set("y", 20);
    cache.get("x");
    cache.set("y", 21);
    cache.set("z", 30);
    cache.get("y");
    cache.remove("x");
    cache.clear();
}

/**
 * @brief Демо 4: Метрики и оповещения
 *
 * Маленький кэш и широкий набор ключей дают низкий hit rate и
 * много вытеснений — оба порога срабатывают.
 */
void demoMonitoring() {
    printSeparator("Demo 4: Monitored Cache");

    std::mutex outputMutex;
    AlertConfig config;
    config.notifyCallback = [&outputMutex](const std::string& message) {
        std::lock_guard<std::mutex> lock(outputMutex);
        std::cout << "  [alert] " << message << "\n";
    };
    config.evictionsPerMinuteThreshold = 100;
    config.alertCheckInterval = std::chrono::milliseconds(200);

    MonitoredLRUCache<int, int> cache(10, config);

    for (int i = 0; i < 200; ++i) {
        int key = (i * 7) % 50;
        if (!cache.get(key).has_value()) {
            cache.set(key, key * key);
        }
    }

    {
        std::lock_guard<std::mutex> lock(outputMutex);
        const auto& metrics = cache.metrics();
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "  Requests:  " << metrics.totalRequests() << "\n";
        std::cout << "  Hit rate:  " << metrics.hitRate() * 100 << "%\n";
        std::cout << "  Evictions: " << metrics.evictions() << "\n";
        std::cout << "  Avg hit latency: " << metrics.averageLatency().count() << " us\n";
        std::cout << "  p95 hit latency: " << metrics.getLatencyPercentile(95).count() << " us\n\n";
        std::cout << "  Waiting for the background check...\n";
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
}

/**
 * @brief Демо 5: Общий кэш для нескольких потоков
 */
void demoConcurrency() {
    printSeparator("Demo 5: Shared Cache Across Threads");

    LFUCache<int, int> cache(64);
    std::vector<std::thread> workers;

    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&cache, t]() {
            for (int i = 0; i < 10000; ++i) {
                int key = (i * (t + 1)) % 128;
                if (!cache.get(key).has_value()) {
                    cache.set(key, i);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::cout << "  4 threads x 10000 read-through operations\n";
    std::cout << "  Size: " << cache.size() << " / " << cache.capacity() << "\n";
}

int main() {
    std::cout << "=== monicache Demo ===\n";

    try {
        demoPolicies();
        demoEphemeral();
        demoLogging();
        demoMonitoring();
        demoConcurrency();

        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "  Demo Complete!\n";
        std::cout << std::string(60, '=') << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
