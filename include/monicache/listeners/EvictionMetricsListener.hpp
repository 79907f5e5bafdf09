#pragma once

#include <monicache/listeners/ICacheListener.hpp>
#include <monicache/monitoring/CacheMetrics.hpp>
#include <memory>
#include <stdexcept>

/**
 * @brief Передаёт вытеснения кэша в CacheMetrics
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Hit/miss сюда не попадают: их вместе с задержкой пишет MonitoredCache,
 * который замеряет время вокруг get(). Явные remove() и clear()
 * вытеснениями не считаются.
 */
template<typename K, typename V>
class EvictionMetricsListener : public ICacheListener<K, V> {
public:
    explicit EvictionMetricsListener(std::shared_ptr<CacheMetrics> metrics)
        : metrics_(std::move(metrics))
    {
        if (!metrics_) {
            throw std::invalid_argument("Metrics cannot be null");
        }
    }

    void onEvict(const K& key, const V& value) override {
        (void)key; (void)value;
        metrics_->recordEviction();
    }

private:
    std::shared_ptr<CacheMetrics> metrics_;
};
