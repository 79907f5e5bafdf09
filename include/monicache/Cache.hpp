#pragma once

#include <algorithm>
#include <monicache/ICache.hpp>
#include <monicache/eviction/IEvictionPolicy.hpp>
#include <monicache/listeners/ICacheListener.hpp>
#include <monicache/utils/Streamable.hpp>
#include <unordered_map>
#include <memory>
#include <sstream>
#include <vector>
#include <stdexcept>

/**
 * @brief Однопоточный кэш со сменной политикой вытеснения
 * @tparam K Тип ключа (должен быть hashable для unordered_map)
 * @tparam V Тип значения
 *
 * Архитектура:
 * - Данные хранятся в std::unordered_map<K, V> — O(1) доступ
 * - Порядок ключей и выбор жертвы — забота политики вытеснения (Strategy pattern)
 * - Слушатели получают уведомления о событиях (Observer pattern)
 *
 * Ёмкость — фиксированное число элементов. Инвариант: size() <= capacity().
 * Вытеснение происходит до вставки нового ключа, поэтому превышение ёмкости
 * не наблюдается даже кратковременно.
 *
 * toString() печатает K и V через operator<<; для типов без него
 * выводятся заглушки <key> и <value>.
 *
 * Пример использования:
 * @code
 *   auto cache = Cache<std::string, int>(100,
 *       std::make_unique<LRUPolicy<std::string>>());
 *   cache.set("a", 1);
 *   auto value = cache.get("a");  // 1
 * @endcode
 */
template<typename K, typename V>
class Cache : public ICache<K, V> {
public:
    /**
     * @brief Конструктор
     * @param capacity Максимальная ёмкость кэша (должна быть > 0)
     * @param evictionPolicy Политика вытеснения (ownership передаётся кэшу)
     */
    Cache(size_t capacity, std::unique_ptr<IEvictionPolicy<K>> evictionPolicy)
        : capacity_(capacity)
        , evictionPolicy_(std::move(evictionPolicy))
    {
        if (capacity_ == 0) {
            throw std::invalid_argument("Cache capacity must be greater than 0");
        }
        if (!evictionPolicy_) {
            throw std::invalid_argument("Eviction policy cannot be null");
        }
    }

    /**
     * @brief Получить значение по ключу
     *
     * Логика:
     * 1. Проверяем наличие ключа в data_
     * 2. Если нет — miss, порядок не меняется
     * 3. Если политика одноразовая (EphemeralFIFO) — забираем значение и удаляем элемент
     * 4. Иначе уведомляем политику о доступе и возвращаем значение
     */
    std::optional<V> get(const K& key) override {
        auto it = data_.find(key);
        if (it == data_.end()) {
            notifyMiss(key);
            return std::nullopt;
        }

        if (evictionPolicy_->consumeOnRead()) {
            V value = std::move(it->second);
            removeInternal(key, it);
            notifyHit(key);
            notifyRemove(key);
            return value;
        }

        evictionPolicy_->onAccess(key);
        notifyHit(key);
        return it->second;
    }

    /**
     * @brief Добавить или обновить значение
     *
     * Логика:
     * 1. Если ключ существует — заменяем значение, позицию двигает политика (onUpdate)
     * 2. Если ключ новый и кэш полон — вытесняем ровно одну жертву
     * 3. Вставляем новый ключ, регистрируем в политике
     */
    void set(const K& key, const V& value) override {
        auto it = data_.find(key);

        if (it != data_.end()) {
            V oldValue = it->second;
            it->second = value;
            evictionPolicy_->onUpdate(key);
            notifyUpdate(key, oldValue, value);
            return;
        }

        // Новый ключ — проверяем, нужно ли вытеснение
        if (data_.size() >= capacity_) {
            evict();
        }

        data_.emplace(key, value);
        evictionPolicy_->onInsert(key);
        notifyInsert(key, value);
    }

    /**
     * @brief Удалить значение по ключу
     * @return true если элемент существовал и был удалён
     */
    bool remove(const K& key) override {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return false;
        }

        removeInternal(key, it);
        notifyRemove(key);
        return true;
    }

    /**
     * @brief Очистить весь кэш
     *
     * Вытеснением не считается — onEvict не вызывается.
     */
    void clear() override {
        size_t count = data_.size();
        data_.clear();
        evictionPolicy_->clear();
        notifyClear(count);
    }

    std::vector<K> keys() const override {
        return evictionPolicy_->keys();
    }

    size_t size() const override {
        return data_.size();
    }

    bool contains(const K& key) const override {
        return data_.find(key) != data_.end();
    }

    size_t capacity() const override {
        return capacity_;
    }

    std::string toString() const override {
        std::ostringstream oss;
        oss << "{";
        bool first = true;
        for (const K& key : evictionPolicy_->keys()) {
            auto it = data_.find(key);
            if (it == data_.end()) {
                continue;
            }
            if (!first) {
                oss << ", ";
            }
            writeStreamable(oss, key, "<key>");
            oss << ": ";
            writeStreamable(oss, it->second, "<value>");
            first = false;
        }
        oss << "}";
        return oss.str();
    }

    // ==================== Управление слушателями ====================

    /**
     * @brief Добавить слушателя событий
     */
    void addListener(std::shared_ptr<ICacheListener<K, V>> listener) {
        if (listener) {
            listeners_.push_back(listener);
        }
    }

    /**
     * @brief Удалить слушателя
     */
    void removeListener(std::shared_ptr<ICacheListener<K, V>> listener) {
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
    }

private:
    /**
     * @brief Внутреннее удаление элемента (без уведомления listeners)
     */
    void removeInternal(const K& key,
                        typename std::unordered_map<K, V>::iterator it) {
        data_.erase(it);
        evictionPolicy_->onRemove(key);
    }

    /**
     * @brief Вытеснить один элемент по политике
     */
    void evict() {
        K victim = evictionPolicy_->selectVictim();

        auto it = data_.find(victim);
        if (it != data_.end()) {
            V value = it->second;
            removeInternal(victim, it);
            notifyEvict(victim, value);
        }
    }

    // ==================== Уведомления слушателей ====================

    void notifyHit(const K& key) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onHit(key);
        }
    }

    void notifyMiss(const K& key) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onMiss(key);
        }
    }

    void notifyInsert(const K& key, const V& value) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onInsert(key, value);
        }
    }

    void notifyUpdate(const K& key, const V& oldValue, const V& newValue) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onUpdate(key, oldValue, newValue);
        }
    }

    void notifyEvict(const K& key, const V& value) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onEvict(key, value);
        }
    }

    void notifyRemove(const K& key) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onRemove(key);
        }
    }

    void notifyClear(size_t count) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onClear(count);
        }
    }

private:
    size_t capacity_;
    std::unordered_map<K, V> data_;
    std::unique_ptr<IEvictionPolicy<K>> evictionPolicy_;
    std::vector<std::shared_ptr<ICacheListener<K, V>>> listeners_;
};
