#pragma once

#include "IEvictionPolicy.hpp"
#include <iterator>
#include <list>
#include <unordered_map>
#include <stdexcept>

/**
 * @brief Политика вытеснения FIFO (First In, First Out)
 * @tparam K Тип ключа
 *
 * Вытесняет элемент, который дольше всех находится в кэше.
 * Чтение и перезапись значения порядок не меняют.
 *
 * Структуры данных:
 * - std::list<K> order_ — ключи в порядке вставки: front() = самый старый
 * - std::unordered_map<K, iterator> keyToIterator_ — для O(1) удаления
 *
 * Пример работы:
 *   put(A), put(B), put(C) -> список: [A, B, C]
 *   get(A)                 -> список: [A, B, C]  (ничего не изменилось)
 *   selectVictim()         -> вернёт A
 */
template<typename K>
class FIFOPolicy : public IEvictionPolicy<K> {
public:
    void onAccess(const K& key) override { (void)key; }

    void onUpdate(const K& key) override { (void)key; }

    void onInsert(const K& key) override {
        order_.push_back(key);
        keyToIterator_[key] = std::prev(order_.end());
    }

    void onRemove(const K& key) override {
        auto it = keyToIterator_.find(key);
        if (it != keyToIterator_.end()) {
            order_.erase(it->second);
            keyToIterator_.erase(it);
        }
    }

    K selectVictim() override {
        if (order_.empty()) {
            throw std::logic_error("Cannot select victim from empty policy");
        }
        return order_.front();
    }

    std::vector<K> keys() const override {
        return std::vector<K>(order_.begin(), order_.end());
    }

    bool empty() const override {
        return order_.empty();
    }

    void clear() override {
        order_.clear();
        keyToIterator_.clear();
    }

private:
    /// Порядок вставки: front() = самый старый, back() = самый новый
    std::list<K> order_;

    std::unordered_map<K, typename std::list<K>::iterator> keyToIterator_;
};
