#pragma once

#include <monicache/monitoring/AlertConfig.hpp>
#include <monicache/monitoring/CacheMetrics.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

/**
 * @brief Периодическая проверка метрик кэша и оповещения
 *
 * Состояния: Idle (создан) -> Monitoring (после monitor()).
 * Каждые alertCheckInterval фоновый поток берёт
 * metrics.getRecentStats(alertCheckInterval) и проверяет шесть порогов
 * независимо друг от друга:
 * - hit rate ниже hitRateThreshold
 * - miss rate выше missRateThreshold
 * - p95 / p99 / средняя задержка выше порога (в целых миллисекундах)
 * - вытеснений в минуту больше evictionsPerMinuteThreshold
 *
 * На каждое нарушение — один вызов notifyCallback. Сам менеджер ничего
 * не накапливает.
 *
 * Поток один на экземпляр; stop() и деструктор его останавливают и
 * дожидаются завершения. Исключение из notifyCallback пишется в std::cerr,
 * проверки продолжаются.
 *
 * Метрики, конфигурация и флаги живут в State под shared_ptr, поток держит
 * свою копию указателя. Поэтому notifyCallback может вызвать stop(),
 * monitor() и даже разрушить менеджер (или владеющий им кэш): поток,
 * который не может дождаться сам себя, отсоединяется и завершается после
 * текущей проверки, не трогая разрушенный объект.
 *
 * Кэш менеджер не блокирует — у CacheMetrics свой мьютекс.
 */
class CacheAlertManager {
public:
    /**
     * @brief Конструктор
     * @param metrics Источник статистики (разделяемое владение с кэшем)
     * @param config Пороги и callback
     * @throws std::invalid_argument если metrics == nullptr, callback пуст
     *         или интервал проверки не положительный
     */
    CacheAlertManager(std::shared_ptr<const CacheMetrics> metrics, AlertConfig config) {
        if (!metrics) {
            throw std::invalid_argument("Metrics cannot be null");
        }
        if (!config.notifyCallback) {
            throw std::invalid_argument("Alert notify callback cannot be empty");
        }
        if (config.alertCheckInterval.count() <= 0) {
            throw std::invalid_argument("Alert check interval must be positive");
        }
        state_ = std::make_shared<State>(std::move(metrics), std::move(config));
    }

    ~CacheAlertManager() {
        stop();
    }

    // Запрещаем копирование
    CacheAlertManager(const CacheAlertManager&) = delete;
    CacheAlertManager& operator=(const CacheAlertManager&) = delete;

    /**
     * @brief Запустить периодическую проверку
     *
     * Повторный вызов во время мониторинга ничего не делает.
     * После stop() мониторинг можно запустить снова.
     */
    void monitor() {
        std::thread previous;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->running) {
                return;
            }
            previous = std::move(worker_);
            state_->running = true;
            const uint64_t generation = ++state_->generation;
            worker_ = std::thread(&CacheAlertManager::workerLoop, state_, generation);
        }
        release(previous);
    }

    /**
     * @brief Остановить проверку и дождаться фонового потока
     *
     * Из notifyCallback поток дождаться сам себя не может: он отсоединяется
     * и выходит сразу после текущей проверки.
     */
    void stop() {
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->running = false;
            worker = std::move(worker_);
        }
        state_->condVar.notify_all();
        release(worker);
    }

    bool isMonitoring() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->running;
    }

    /**
     * @brief Выполнить одну проверку прямо сейчас, в вызывающем потоке
     * @return Количество нарушенных порогов (= число вызовов callback)
     */
    size_t checkNow() {
        // callback вправе разрушить менеджер, State должен пережить проверку
        std::shared_ptr<State> state = state_;
        return checkAlerts(*state);
    }

private:
    struct State {
        State(std::shared_ptr<const CacheMetrics> m, AlertConfig c)
            : metrics(std::move(m)), config(std::move(c)) {}

        std::shared_ptr<const CacheMetrics> metrics;
        const AlertConfig config;

        std::mutex mutex;
        std::condition_variable condVar;
        bool running = false;
        uint64_t generation = 0;  // номер текущего запуска monitor()
    };

    /**
     * @brief Поток живёт, пока запущен именно его запуск monitor()
     */
    static void workerLoop(std::shared_ptr<State> state, uint64_t generation) {
        auto active = [&state, generation] {
            return state->running && state->generation == generation;
        };

        std::unique_lock<std::mutex> lock(state->mutex);
        while (active()) {
            bool stopped = state->condVar.wait_for(lock, state->config.alertCheckInterval,
                                                   [&active] { return !active(); });
            if (stopped) {
                break;
            }
            lock.unlock();
            checkAlerts(*state);
            lock.lock();
        }
    }

    static void release(std::thread& worker) {
        if (!worker.joinable()) {
            return;
        }
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }

    static size_t checkAlerts(const State& state) {
        using std::chrono::duration_cast;
        using std::chrono::milliseconds;

        const AlertConfig& config = state.config;
        const CacheStats stats = state.metrics->getRecentStats(config.alertCheckInterval);
        size_t violations = 0;

        if (stats.hitRate < config.hitRateThreshold) {
            std::ostringstream msg;
            msg << "Warning: Low hit rate detected. Actual: " << stats.hitRate
                << " (Threshold: " << config.hitRateThreshold << ")";
            notify(config, msg.str());
            ++violations;
        }
        if (stats.missRate > config.missRateThreshold) {
            std::ostringstream msg;
            msg << "Warning: High miss rate detected. Actual: " << stats.missRate
                << " (Threshold: " << config.missRateThreshold << ")";
            notify(config, msg.str());
            ++violations;
        }

        const auto p95Ms = duration_cast<milliseconds>(stats.p95Latency).count();
        if (p95Ms > config.p95LatencyThresholdMs) {
            std::ostringstream msg;
            msg << "Warning: High p95 latency detected. Actual: " << p95Ms
                << "ms (Threshold: " << config.p95LatencyThresholdMs << "ms)";
            notify(config, msg.str());
            ++violations;
        }

        const auto p99Ms = duration_cast<milliseconds>(stats.p99Latency).count();
        if (p99Ms > config.p99LatencyThresholdMs) {
            std::ostringstream msg;
            msg << "Warning: High p99 latency detected. Actual: " << p99Ms
                << "ms (Threshold: " << config.p99LatencyThresholdMs << "ms)";
            notify(config, msg.str());
            ++violations;
        }

        const auto averageMs = duration_cast<milliseconds>(stats.averageLatency).count();
        if (averageMs > config.averageLatencyThresholdMs) {
            std::ostringstream msg;
            msg << "Warning: High average latency detected. Actual: " << averageMs
                << "ms (Threshold: " << config.averageLatencyThresholdMs << "ms)";
            notify(config, msg.str());
            ++violations;
        }

        if (stats.evictionsPerMinute > config.evictionsPerMinuteThreshold) {
            std::ostringstream msg;
            msg << "Warning: High eviction rate detected. Actual: "
                << stats.evictionsPerMinute << " evictions/min (Threshold: "
                << config.evictionsPerMinuteThreshold << " evictions/min)";
            notify(config, msg.str());
            ++violations;
        }

        return violations;
    }

    static void notify(const AlertConfig& config, const std::string& message) {
        try {
            config.notifyCallback(message);
        } catch (const std::exception& e) {
            std::cerr << "[CacheAlertManager] Notify callback error: "
                      << e.what() << std::endl;
        }
    }

private:
    std::shared_ptr<State> state_;
    std::thread worker_;  // под state_->mutex
};
