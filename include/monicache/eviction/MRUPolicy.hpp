#pragma once

#include "IEvictionPolicy.hpp"
#include <list>
#include <unordered_map>
#include <stdexcept>
#include <vector>

/**
 * @brief Политика вытеснения MRU (Most Recently Used)
 * @tparam K Тип ключа
 *
 * Вытесняет элемент, к которому обращались последним.
 * Полезна для циклических сканов, где только что прочитанное
 * понадобится позже всего.
 *
 * Порядок ведётся так же, как в LRUPolicy:
 * front() = самый свежий, back() = самый старый.
 * Жертва — front().
 *
 * Cache вызывает selectVictim() до вставки нового ключа, поэтому
 * вытесняется предыдущий самый свежий элемент, а только что записанный
 * ключ остаётся в кэше.
 *
 * Пример работы (capacity = 2):
 *   set(A), set(B)   -> список: [B, A]
 *   get(B)           -> список: [B, A]
 *   set(C)           -> вытесняется B, список: [C, A]
 */
template<typename K>
class MRUPolicy : public IEvictionPolicy<K> {
public:
    void onAccess(const K& key) override {
        auto it = keyToIterator_.find(key);
        if (it != keyToIterator_.end()) {
            order_.splice(order_.begin(), order_, it->second);
        }
    }

    void onUpdate(const K& key) override {
        onAccess(key);
    }

    void onInsert(const K& key) override {
        order_.push_front(key);
        keyToIterator_[key] = order_.begin();
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
        return std::vector<K>(order_.rbegin(), order_.rend());
    }

    bool empty() const override {
        return order_.empty();
    }

    void clear() override {
        order_.clear();
        keyToIterator_.clear();
    }

private:
    /// front() = самый свежий (жертва), back() = самый старый
    std::list<K> order_;

    std::unordered_map<K, typename std::list<K>::iterator> keyToIterator_;
};
