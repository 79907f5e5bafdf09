#pragma once

#include <monicache/listeners/ICacheListener.hpp>
#include <monicache/utils/Streamable.hpp>
#include <cstdint>
#include <iostream>
#include <string>

/**
 * @brief Слушатель для логирования событий кэша в поток
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Формат строки: "[prefix] EVENT: details".
 * Типы без operator<< печатаются как <key> / <value>.
 * Маска events выбирает, какие события писать: на горячем пути
 * обычно оставляют только вытеснения и очистки.
 *
 * Использование:
 * @code
 *   auto logger = std::make_shared<LoggingListener<std::string, int>>(
 *       "sessions", std::cerr,
 *       LoggingListener<std::string, int>::Evict | LoggingListener<std::string, int>::Clear);
 *   cache.addListener(logger);
 * @endcode
 *
 * Запись в поток не синхронизирована: события приходят под блокировкой
 * кэша, но разные кэши с общим потоком могут перемешать строки.
 */
template<typename K, typename V>
class LoggingListener : public ICacheListener<K, V> {
public:
    enum Event : uint32_t {
        Hit    = 1u << 0,
        Miss   = 1u << 1,
        Insert = 1u << 2,
        Update = 1u << 3,
        Evict  = 1u << 4,
        Remove = 1u << 5,
        Clear  = 1u << 6,
        All    = 0x7Fu
    };

    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений (например, имя кэша)
     * @param os Поток вывода (по умолчанию std::cout)
     * @param events Битовая маска событий Event
     */
    explicit LoggingListener(const std::string& prefix = "Cache",
                             std::ostream& os = std::cout,
                             uint32_t events = All)
        : prefix_(prefix)
        , os_(os)
        , events_(events)
    {}

    void onHit(const K& key) override {
        if (!enabled(Hit)) return;
        line("HIT", key) << "\n";
    }

    void onMiss(const K& key) override {
        if (!enabled(Miss)) return;
        line("MISS", key) << "\n";
    }

    void onInsert(const K& key, const V& value) override {
        if (!enabled(Insert)) return;
        line("INSERT", key) << " = ";
        writeStreamable(os_, value, "<value>");
        os_ << "\n";
    }

    void onUpdate(const K& key, const V& oldValue, const V& newValue) override {
        if (!enabled(Update)) return;
        line("UPDATE", key) << " (";
        writeStreamable(os_, oldValue, "<value>");
        os_ << " -> ";
        writeStreamable(os_, newValue, "<value>");
        os_ << ")\n";
    }

    void onEvict(const K& key, const V& value) override {
        if (!enabled(Evict)) return;
        line("EVICT", key) << " = ";
        writeStreamable(os_, value, "<value>");
        os_ << "\n";
    }

    void onRemove(const K& key) override {
        if (!enabled(Remove)) return;
        line("REMOVE", key) << "\n";
    }

    void onClear(size_t count) override {
        if (!enabled(Clear)) return;
        os_ << "[" << prefix_ << "] CLEAR: " << count << " elements\n";
    }

private:
    std::ostream& line(const char* event, const K& key) {
        os_ << "[" << prefix_ << "] " << event << ": ";
        writeStreamable(os_, key, "<key>");
        return os_;
    }

    bool enabled(Event event) const {
        return (events_ & event) != 0;
    }

    std::string prefix_;
    std::ostream& os_;
    uint32_t events_;
};
