#pragma once

#include <ostream>
#include <type_traits>
#include <utility>

/**
 * @brief true, если для T есть operator<<(std::ostream&, const T&)
 */
template<typename T, typename = void>
struct is_streamable : std::false_type {};

template<typename T>
struct is_streamable<T, std::void_t<decltype(
    std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template<typename T>
inline constexpr bool is_streamable_v = is_streamable<T>::value;

/**
 * @brief Вывести значение в поток или заглушку, если вывода для типа нет
 *
 * Нужен toString() и LoggingListener: кэш должен собираться для любых
 * K и V, а не только для печатаемых.
 */
template<typename T>
void writeStreamable(std::ostream& os, const T& value, const char* placeholder = "<?>") {
    if constexpr (is_streamable_v<T>) {
        os << value;
    } else {
        os << placeholder;
    }
}
