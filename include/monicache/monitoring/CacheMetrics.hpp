#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <vector>

/**
 * @brief Снимок статистики кэша для проверки порогов
 *
 * Все поля, кроме evictionsPerMinute, считаются по всей накопленной
 * истории. Окно применяется только к вытеснениям.
 */
struct CacheStats {
    double hitRate = 0.0;
    double missRate = 0.0;
    std::chrono::microseconds averageLatency{0};
    std::chrono::microseconds p95Latency{0};
    std::chrono::microseconds p99Latency{0};
    uint64_t evictionsPerMinute = 0;
};

/**
 * @brief Метрики производительности кэша
 *
 * Собирает:
 * - hits/misses — для hit rate и miss rate
 * - задержку каждого попадания — для среднего и перцентилей
 * - моменты вытеснений — для частоты вытеснений в минуту
 *
 * Все методы потокобезопасны: свой мьютекс, не связанный с мьютексом кэша.
 * Записи копятся до reset(); частоту сброса выбирает вызывающий код.
 *
 * Пример:
 * @code
 *   CacheMetrics metrics;
 *   metrics.recordHit(std::chrono::milliseconds(10));
 *   metrics.recordMiss();
 *   metrics.hitRate();                 // 0.5
 *   metrics.getLatencyPercentile(95);  // 10ms
 * @endcode
 */
class CacheMetrics {
public:
    using Duration = std::chrono::microseconds;
    using Clock = std::chrono::steady_clock;

    // ==================== Запись ====================

    /**
     * @brief Попадание с измеренной задержкой
     */
    void recordHit(Duration latency) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++hits_;
        latencies_.push_back(latency);
    }

    void recordMiss() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++misses_;
    }

    /**
     * @brief Вытеснение: запоминаем текущий момент
     */
    void recordEviction() {
        std::lock_guard<std::mutex> lock(mutex_);
        evictions_.push_back(Clock::now());
    }

    /**
     * @brief Сбросить всё в начальное состояние
     */
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        hits_ = 0;
        misses_ = 0;
        latencies_.clear();
        evictions_.clear();
    }

    // ==================== Геттеры ====================

    uint64_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    uint64_t misses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

    uint64_t totalRequests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_ + misses_;
    }

    /**
     * @brief Число вытеснений с последнего reset()
     */
    uint64_t evictions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return evictions_.size();
    }

    /**
     * @brief Доля попаданий (0.0 - 1.0), 0.0 если запросов не было
     */
    double hitRate() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hitRateLocked();
    }

    /**
     * @brief Доля промахов (0.0 - 1.0), 0.0 если запросов не было
     */
    double missRate() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return missRateLocked();
    }

    /**
     * @brief Средняя задержка попадания, усечённая до микросекунд
     */
    Duration averageLatency() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return averageLatencyLocked();
    }

    /**
     * @brief Задержка для заданного перцентиля
     * @param percentile Перцентиль в диапазоне [0, 100]
     * @return 0 если замеров нет
     * @throws std::invalid_argument если percentile вне [0, 100] или NaN
     *
     * Индекс = floor((n - 1) * p / 100) по отсортированной копии.
     * Для p = 50 и чётного n — среднее двух центральных значений.
     * Сортировка на каждый вызов: объём ограничен частотой reset().
     */
    Duration getLatencyPercentile(double percentile) const {
        // NaN не проходит ни одно сравнение
        if (!(percentile >= 0.0 && percentile <= 100.0)) {
            throw std::invalid_argument("Percentile must be within [0, 100]");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return percentileLocked(percentile);
    }

    /**
     * @brief Снимок статистики для проверки порогов
     * @param window Окно, за которое считаются вытеснения
     * @throws std::invalid_argument если окно короче 1 мс
     *
     * evictionsPerMinute = (вытеснения после now - window) * 60000 / window_ms
     */
    CacheStats getRecentStats(std::chrono::milliseconds window) const {
        if (window.count() <= 0) {
            throw std::invalid_argument("Stats window must be at least 1 ms");
        }

        std::lock_guard<std::mutex> lock(mutex_);

        const auto windowStart = Clock::now() - window;
        const auto recentEvictions = static_cast<uint64_t>(
            std::count_if(evictions_.begin(), evictions_.end(),
                [windowStart](const Clock::time_point& t) {
                    return t > windowStart;
                }));

        CacheStats stats;
        stats.hitRate = hitRateLocked();
        stats.missRate = missRateLocked();
        stats.averageLatency = averageLatencyLocked();
        stats.p95Latency = percentileLocked(95);
        stats.p99Latency = percentileLocked(99);
        stats.evictionsPerMinute =
            recentEvictions * 60000 / static_cast<uint64_t>(window.count());
        return stats;
    }

private:
    double hitRateLocked() const {
        uint64_t total = hits_ + misses_;
        if (total == 0) return 0.0;
        return static_cast<double>(hits_) / static_cast<double>(total);
    }

    double missRateLocked() const {
        uint64_t total = hits_ + misses_;
        if (total == 0) return 0.0;
        return static_cast<double>(misses_) / static_cast<double>(total);
    }

    Duration averageLatencyLocked() const {
        if (latencies_.empty()) {
            return Duration::zero();
        }
        Duration total = Duration::zero();
        for (const auto& latency : latencies_) {
            total += latency;
        }
        return total / static_cast<Duration::rep>(latencies_.size());
    }

    Duration percentileLocked(double percentile) const {
        if (latencies_.empty()) {
            return Duration::zero();
        }

        std::vector<Duration> sorted(latencies_);
        std::sort(sorted.begin(), sorted.end());
        const size_t n = sorted.size();

        // Медиана при чётном числе замеров — среднее двух центральных
        if (percentile == 50.0 && n % 2 == 0) {
            return (sorted[n / 2 - 1] + sorted[n / 2]) / 2;
        }

        auto index = static_cast<size_t>(
            static_cast<double>(n - 1) * percentile / 100.0);
        return sorted[std::min(index, n - 1)];
    }

private:
    mutable std::mutex mutex_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    std::vector<Duration> latencies_;
    std::vector<Clock::time_point> evictions_;
};
