#pragma once

#include "FIFOPolicy.hpp"

/**
 * @brief Одноразовый FIFO: элемент удаляется из кэша сразу после чтения
 * @tparam K Тип ключа
 *
 * Порядок и выбор жертвы — как у FIFOPolicy. Отличие только в том,
 * что Cache::get() забирает значение и удаляет ключ (consumeOnRead).
 * Повторный get() того же ключа вернёт std::nullopt.
 */
template<typename K>
class EphemeralFIFOPolicy : public FIFOPolicy<K> {
public:
    bool consumeOnRead() const override {
        return true;
    }
};
