#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

/**
 * @brief Настройки оповещений о производительности кэша
 *
 * Обычная структура-значение: заполняется один раз и передаётся
 * в CacheAlertManager / MonitoredCache, дальше только читается.
 * Обязательное поле — notifyCallback, у остальных есть значения по умолчанию.
 *
 * Пример:
 * @code
 *   AlertConfig config;
 *   config.notifyCallback = [](const std::string& msg) { std::cerr << msg << "\n"; };
 *   config.hitRateThreshold = 0.8;
 *   config.alertCheckInterval = std::chrono::seconds(10);
 * @endcode
 */
struct AlertConfig {
    using NotifyCallback = std::function<void(const std::string&)>;

    /// Вызывается по одному разу на каждый нарушенный порог
    NotifyCallback notifyCallback;

    /// Оповещение, если hit rate ниже
    double hitRateThreshold = 0.5;

    /// Оповещение, если miss rate выше
    double missRateThreshold = 0.5;

    int64_t p95LatencyThresholdMs = 200;
    int64_t p99LatencyThresholdMs = 300;
    uint64_t evictionsPerMinuteThreshold = 1000;
    int64_t averageLatencyThresholdMs = 100;

    /// Период проверки и окно для подсчёта вытеснений
    std::chrono::milliseconds alertCheckInterval = std::chrono::minutes(1);
};
