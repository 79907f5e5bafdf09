#pragma once

#include <optional>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Базовый интерфейс кэша
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Реализуется однопоточным Cache, потокобезопасным ThreadSafeCache
 * и MonitoredCache, поэтому декораторы пишутся один раз для всех политик.
 */
template <typename K, typename V>
class ICache
{
public:
    virtual ~ICache() = default;

    /**
     * @brief Получить значение по ключу
     * @param key Ключ
     * @return Значение, если ключ существует, иначе std::nullopt
     */
    virtual std::optional<V> get(const K &key) = 0;

    /**
     * @brief Поместить значение в кэш
     * @param key Ключ
     * @param value Значение
     */
    virtual void set(const K &key, const V &value) = 0;

    /**
     * @brief Удалить значение по ключу
     * @param key Ключ
     * @return true, если элемент был удален, иначе false
     */
    virtual bool remove(const K &key) = 0;

    /**
     * @brief Очистить кэш
     */
    virtual void clear() = 0;

    /**
     * @brief Получить копию ключей в порядке хранения
     * @return Ключи в порядке, который задаёт политика вытеснения
     */
    virtual std::vector<K> keys() const = 0;

    /**
     * @brief Получить текущий размер кэша
     * @return Размер кэша
     */
    virtual size_t size() const = 0;
    
    /**
     * @brief Проверить наличие ключа в кэше
     * @param key Ключ
     * @return true, если ключ существует, иначе false
     */
    virtual bool contains(const K &key) const = 0;

    /**
     * @brief Получить максимальную емкость кэша
     * @return Емкость кэша
     */
    virtual size_t capacity() const = 0;

    /**
     * @brief Строковое представление содержимого: {k1: v1, k2: v2}
     */
    virtual std::string toString() const = 0;
};
