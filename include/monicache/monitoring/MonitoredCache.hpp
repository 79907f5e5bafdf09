#pragma once

#include <monicache/Cache.hpp>
#include <monicache/ICache.hpp>
#include <monicache/concurrency/ThreadSafeCache.hpp>
#include <monicache/eviction/EphemeralFIFOPolicy.hpp>
#include <monicache/eviction/FIFOPolicy.hpp>
#include <monicache/eviction/LFUPolicy.hpp>
#include <monicache/eviction/LRUPolicy.hpp>
#include <monicache/eviction/MRUPolicy.hpp>
#include <monicache/listeners/EvictionMetricsListener.hpp>
#include <monicache/listeners/ICacheListener.hpp>
#include <monicache/monitoring/AlertConfig.hpp>
#include <monicache/monitoring/CacheAlertManager.hpp>
#include <monicache/monitoring/CacheMetrics.hpp>

#include <chrono>
#include <memory>
#include <vector>

/**
 * @brief Потокобезопасный кэш с метриками и оповещениями
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Состав:
 * - Cache + политика вытеснения внутри ThreadSafeCache
 * - CacheMetrics: hit/miss и задержка каждого get(), вытеснения
 *   через EvictionMetricsListener
 * - CacheAlertManager: запускается в конструкторе и работает,
 *   пока жив кэш; деструктор останавливает его поток
 *
 * Замеряется только get(). set/remove/clear/keys проходят насквозь
 * без записи метрик.
 *
 * Пример:
 * @code
 *   AlertConfig config;
 *   config.notifyCallback = [](const std::string& msg) { std::cerr << msg << "\n"; };
 *
 *   MonitoredLRUCache<std::string, int> cache(1000, config);
 *   cache.set("a", 1);
 *   cache.get("a");
 *   cache.metrics().hitRate();  // 1.0
 * @endcode
 */
template<typename K, typename V>
class MonitoredCache : public ICache<K, V> {
public:
    using Listeners = std::vector<std::shared_ptr<ICacheListener<K, V>>>;

    /**
     * @brief Конструктор
     * @param capacity Максимальная ёмкость (должна быть > 0)
     * @param evictionPolicy Политика вытеснения
     * @param alertConfig Пороги и callback оповещений
     * @param listeners Дополнительные слушатели (например, LoggingListener)
     * @throws std::invalid_argument при нулевой ёмкости, пустой политике
     *         или некорректном alertConfig
     */
    MonitoredCache(size_t capacity,
                   std::unique_ptr<IEvictionPolicy<K>> evictionPolicy,
                   AlertConfig alertConfig,
                   const Listeners& listeners = {})
        : metrics_(std::make_shared<CacheMetrics>())
        , cache_(makeInner(capacity, std::move(evictionPolicy), metrics_, listeners))
        , alertManager_(metrics_, std::move(alertConfig))
    {
        alertManager_.monitor();
    }

    // Запрещаем копирование
    MonitoredCache(const MonitoredCache&) = delete;
    MonitoredCache& operator=(const MonitoredCache&) = delete;

    /**
     * @brief Получить значение и записать hit/miss
     *
     * Время замеряется вокруг вызова, включая ожидание блокировки кэша.
     */
    std::optional<V> get(const K& key) override {
        const auto start = std::chrono::steady_clock::now();
        auto result = cache_->get(key);
        const auto elapsed = std::chrono::duration_cast<CacheMetrics::Duration>(
            std::chrono::steady_clock::now() - start);

        if (result.has_value()) {
            metrics_->recordHit(elapsed);
        } else {
            metrics_->recordMiss();
        }
        return result;
    }

    void set(const K& key, const V& value) override {
        cache_->set(key, value);
    }

    bool remove(const K& key) override {
        return cache_->remove(key);
    }

    /**
     * @brief Очистить кэш; мониторинг продолжает работать
     */
    void clear() override {
        cache_->clear();
    }

    std::vector<K> keys() const override {
        return cache_->keys();
    }

    size_t size() const override {
        return cache_->size();
    }

    bool contains(const K& key) const override {
        return cache_->contains(key);
    }

    size_t capacity() const override {
        return cache_->capacity();
    }

    std::string toString() const override {
        return cache_->toString();
    }

    /**
     * @brief Накопленная статистика (только чтение)
     */
    const CacheMetrics& metrics() const { return *metrics_; }

    CacheAlertManager& alertManager() { return alertManager_; }

private:
    static std::unique_ptr<ICache<K, V>> makeInner(
        size_t capacity,
        std::unique_ptr<IEvictionPolicy<K>> evictionPolicy,
        const std::shared_ptr<CacheMetrics>& metrics,
        const Listeners& listeners)
    {
        auto inner = std::make_unique<Cache<K, V>>(capacity, std::move(evictionPolicy));
        inner->addListener(std::make_shared<EvictionMetricsListener<K, V>>(metrics));
        for (const auto& listener : listeners) {
            inner->addListener(listener);
        }
        return std::make_unique<ThreadSafeCache<K, V>>(std::move(inner));
    }

private:
    // Порядок важен: alertManager_ разрушается первым и останавливает поток
    std::shared_ptr<CacheMetrics> metrics_;
    std::unique_ptr<ICache<K, V>> cache_;
    CacheAlertManager alertManager_;
};

// ==================== Готовые мониторинговые кэши ====================

template<typename K, typename V>
class MonitoredFIFOCache : public MonitoredCache<K, V> {
public:
    MonitoredFIFOCache(size_t capacity, AlertConfig alertConfig)
        : MonitoredCache<K, V>(capacity, std::make_unique<FIFOPolicy<K>>(),
                               std::move(alertConfig)) {}
};

template<typename K, typename V>
class MonitoredEphemeralFIFOCache : public MonitoredCache<K, V> {
public:
    MonitoredEphemeralFIFOCache(size_t capacity, AlertConfig alertConfig)
        : MonitoredCache<K, V>(capacity, std::make_unique<EphemeralFIFOPolicy<K>>(),
                               std::move(alertConfig)) {}
};

template<typename K, typename V>
class MonitoredLRUCache : public MonitoredCache<K, V> {
public:
    MonitoredLRUCache(size_t capacity, AlertConfig alertConfig)
        : MonitoredCache<K, V>(capacity, std::make_unique<LRUPolicy<K>>(),
                               std::move(alertConfig)) {}
};

template<typename K, typename V>
class MonitoredMRUCache : public MonitoredCache<K, V> {
public:
    MonitoredMRUCache(size_t capacity, AlertConfig alertConfig)
        : MonitoredCache<K, V>(capacity, std::make_unique<MRUPolicy<K>>(),
                               std::move(alertConfig)) {}
};

template<typename K, typename V>
class MonitoredLFUCache : public MonitoredCache<K, V> {
public:
    MonitoredLFUCache(size_t capacity, AlertConfig alertConfig)
        : MonitoredCache<K, V>(capacity, std::make_unique<LFUPolicy<K>>(),
                               std::move(alertConfig)) {}
};
