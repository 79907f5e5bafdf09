#pragma once

#include <vector>

/**
 * @brief Интерфейс политики вытеснения
 * @tparam K Тип ключа
 *
 * Политика хранит только ключи и их порядок. Значения живут в Cache.
 */
template<typename K>
class IEvictionPolicy {
public:
    virtual ~IEvictionPolicy() = default;

    /**
     * @brief Уведомление об успешном чтении ключа (get)
     */
    virtual void onAccess(const K& key) = 0;

    /**
     * @brief Уведомление о перезаписи значения существующего ключа (set)
     */
    virtual void onUpdate(const K& key) = 0;

    /**
     * @brief Уведомление о добавлении нового ключа
     */
    virtual void onInsert(const K& key) = 0;

    /**
     * @brief Уведомление об удалении ключа
     */
    virtual void onRemove(const K& key) = 0;

    /**
     * @brief Выбрать ключ для вытеснения
     * @return Ключ элемента, который следует удалить
     */
    virtual K selectVictim() = 0;

    /**
     * @brief Ключи в порядке хранения (от самого старого к самому новому)
     */
    virtual std::vector<K> keys() const = 0;

    /**
     * @brief Удалять ли элемент сразу после чтения
     */
    virtual bool consumeOnRead() const { return false; }

    /**
     * @brief Проверить, отслеживает ли политика какие-либо ключи
     */
    virtual bool empty() const = 0;

    /**
     * @brief Очистить все данные политики
     */
    virtual void clear() = 0;
};
