#pragma once

#include <monicache/ICache.hpp>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Обёртка, делающая любой ICache безопасным для нескольких потоков
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Одна блокировка std::shared_mutex на экземпляр:
 * - get, set, remove, clear берут её монопольно; get тоже пишет,
 *   потому что двигает ключ в порядке политики
 * - keys, contains, size, capacity, toString берут её разделяемо
 *   и возвращают копии, а не ссылки на внутреннее состояние
 *
 * Кэши с разными обёртками друг друга не блокируют. Внутри одного кэша
 * операции над разными ключами всё равно идут по очереди.
 *
 * @code
 *   ThreadSafeCache<std::string, int> cache(
 *       std::make_unique<Cache<std::string, int>>(
 *           1000, std::make_unique<LFUPolicy<std::string>>()));
 *
 *   std::thread writer([&] { cache.set("hits", 1); });
 *   std::thread reader([&] { cache.get("hits"); });
 * @endcode
 */
template<typename K, typename V>
class ThreadSafeCache : public ICache<K, V> {
public:
    /**
     * @param wrapped Кэш, который обёртка забирает во владение
     * @throws std::invalid_argument если wrapped пуст
     */
    explicit ThreadSafeCache(std::unique_ptr<ICache<K, V>> wrapped)
        : wrapped_(std::move(wrapped))
    {
        if (!wrapped_) {
            throw std::invalid_argument("Wrapped cache cannot be null");
        }
    }

    // ==================== Монопольная блокировка ====================

    std::optional<V> get(const K& key) override {
        std::unique_lock lock(mutex_);
        return wrapped_->get(key);
    }

    void set(const K& key, const V& value) override {
        std::unique_lock lock(mutex_);
        wrapped_->set(key, value);
    }

    bool remove(const K& key) override {
        std::unique_lock lock(mutex_);
        return wrapped_->remove(key);
    }

    void clear() override {
        std::unique_lock lock(mutex_);
        wrapped_->clear();
    }

    // ==================== Разделяемая блокировка ====================

    std::vector<K> keys() const override {
        std::shared_lock lock(mutex_);
        return wrapped_->keys();
    }

    size_t size() const override {
        std::shared_lock lock(mutex_);
        return wrapped_->size();
    }

    bool contains(const K& key) const override {
        std::shared_lock lock(mutex_);
        return wrapped_->contains(key);
    }

    size_t capacity() const override {
        std::shared_lock lock(mutex_);
        return wrapped_->capacity();
    }

    std::string toString() const override {
        std::shared_lock lock(mutex_);
        return wrapped_->toString();
    }

    // ==================== Составные операции ====================

    /**
     * @brief Несколько операций как одна: вызывает action(кэш) монопольно
     * @return То, что вернул action
     *
     * Так делается "прочитать и, если нет, записать" без гонки между
     * contains() и set():
     * @code
     *   cache.withExclusiveLock([&](ICache<std::string, int>& c) {
     *       if (!c.contains(key)) {
     *           c.set(key, load(key));
     *       }
     *   });
     * @endcode
     *
     * @warning Ссылку на кэш нельзя сохранять за пределами action.
     */
    template<typename Action>
    auto withExclusiveLock(Action&& action)
        -> decltype(action(std::declval<ICache<K, V>&>())) {
        std::unique_lock lock(mutex_);
        return action(*wrapped_);
    }

    /**
     * @brief То же для чтения: action получает const-ссылку под разделяемой блокировкой
     */
    template<typename Action>
    auto withSharedLock(Action&& action) const
        -> decltype(action(std::declval<const ICache<K, V>&>())) {
        std::shared_lock lock(mutex_);
        return action(*wrapped_);
    }

private:
    std::unique_ptr<ICache<K, V>> wrapped_;
    mutable std::shared_mutex mutex_;
};
