#pragma once

#include "IEvictionPolicy.hpp"
#include <cstdint>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <vector>

/**
 * @brief Политика вытеснения LFU (Least Frequently Used)
 * @tparam K Тип ключа
 *
 * Вытесняет элемент, который читали реже всего.
 *
 * Правила счётчика:
 * - новый ключ получает частоту 1
 * - каждый успешный get() увеличивает частоту на 1
 * - set() существующего ключа частоту не трогает (ни сброса, ни увеличения)
 *
 * При равной минимальной частоте вытесняется самый старый по вставке ключ.
 *
 * Структуры данных:
 * - entries_: ключ → {частота, порядковый номер вставки}
 * - frequencyBuckets_: частота → (номер вставки → ключ); внутри группы
 *   begin() — самый старый ключ этой частоты
 * - insertionOrder_: номер вставки → ключ, его отдаёт keys()
 * - minFrequency_: минимальная частота среди всех ключей
 *
 * Сложность: O(log n) на операцию, keys() — O(n)
 *
 * Пример работы:
 *   set(A), set(B), set(C)     -> freq: A=1, B=1, C=1, minFreq=1
 *   get(A), get(A)             -> freq: A=3, B=1, C=1, minFreq=1
 *   get(C), get(B)             -> freq: A=3, B=2, C=2, minFreq=2
 *   selectVictim()             -> вернёт B (частота 2, вставлен раньше C)
 */
template<typename K>
class LFUPolicy : public IEvictionPolicy<K> {
public:
    LFUPolicy() : minFrequency_(0), nextSequence_(0) {}

    /**
     * @brief Чтение существующего ключа: частота f -> f + 1
     *
     * Если группа f опустела и была минимальной, минимум становится f + 1.
     * Для несуществующего ключа ничего не делает.
     */
    void onAccess(const K& key) override {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return;
        }

        Entry& entry = it->second;
        const uint32_t oldFreq = entry.frequency;

        removeFromBucket(oldFreq, entry.sequence);
        if (frequencyBuckets_.find(oldFreq) == frequencyBuckets_.end() &&
            minFrequency_ == oldFreq) {
            minFrequency_ = oldFreq + 1;
        }

        entry.frequency = oldFreq + 1;
        frequencyBuckets_[entry.frequency].emplace(entry.sequence, key);
    }

    /**
     * @brief Перезапись значения не влияет на частоту
     */
    void onUpdate(const K& key) override {
        (void)key;
    }

    /**
     * @brief Вставка нового ключа с частотой 1
     *
     * @note Вызывается только для НОВЫХ ключей.
     */
    void onInsert(const K& key) override {
        const uint64_t sequence = nextSequence_++;

        entries_[key] = Entry{1, sequence};
        frequencyBuckets_[1].emplace(sequence, key);
        insertionOrder_.emplace(sequence, key);

        minFrequency_ = 1;
    }

    /**
     * @brief Удаление ключа
     *
     * @note minFrequency_ может указывать на исчезнувшую группу,
     *       selectVictim() пересчитает его при необходимости.
     */
    void onRemove(const K& key) override {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return;
        }

        removeFromBucket(it->second.frequency, it->second.sequence);
        insertionOrder_.erase(it->second.sequence);
        entries_.erase(it);
    }

    /**
     * @brief Выбор жертвы для вытеснения
     *
     * @return Ключ с минимальной частотой; среди равных — самый старый по вставке
     * @throws std::logic_error если политика пуста
     */
    K selectVictim() override {
        if (empty()) {
            throw std::logic_error("Cannot select victim from empty LFU policy");
        }

        ensureValidMinFrequency();

        return frequencyBuckets_.at(minFrequency_).begin()->second;
    }

    /**
     * @brief Ключи в порядке вставки
     */
    std::vector<K> keys() const override {
        std::vector<K> result;
        result.reserve(insertionOrder_.size());
        for (const auto& pair : insertionOrder_) {
            result.push_back(pair.second);
        }
        return result;
    }

    bool empty() const override {
        return entries_.empty();
    }

    void clear() override {
        entries_.clear();
        frequencyBuckets_.clear();
        insertionOrder_.clear();
        minFrequency_ = 0;
    }

    // ==================== Методы для отладки и тестирования ====================

    /**
     * @brief Частота ключа или 0, если ключа нет
     */
    uint32_t getFrequency(const K& key) const {
        auto it = entries_.find(key);
        return (it != entries_.end()) ? it->second.frequency : 0;
    }

    uint32_t getMinFrequency() const {
        return minFrequency_;
    }

private:
    struct Entry {
        uint32_t frequency;
        uint64_t sequence;
    };

    void removeFromBucket(uint32_t frequency, uint64_t sequence) {
        auto bucketIt = frequencyBuckets_.find(frequency);
        if (bucketIt == frequencyBuckets_.end()) {
            return;
        }

        bucketIt->second.erase(sequence);
        if (bucketIt->second.empty()) {
            frequencyBuckets_.erase(bucketIt);
        }
    }

    /**
     * @brief После удалений minFrequency_ может указывать на пустую группу
     *
     * Поиск O(число различных частот), нужен только после remove().
     */
    void ensureValidMinFrequency() {
        if (frequencyBuckets_.find(minFrequency_) != frequencyBuckets_.end()) {
            return;
        }

        minFrequency_ = frequencyBuckets_.begin()->first;
        for (const auto& pair : frequencyBuckets_) {
            if (pair.first < minFrequency_) {
                minFrequency_ = pair.first;
            }
        }
    }

private:
    std::unordered_map<K, Entry> entries_;
    std::unordered_map<uint32_t, std::map<uint64_t, K>> frequencyBuckets_;
    std::map<uint64_t, K> insertionOrder_;

    uint32_t minFrequency_;
    uint64_t nextSequence_;
};
