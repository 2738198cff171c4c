// ==============================================================================
// ruleval/timestamp.hpp - Значение времени (RFC 3339)
// ==============================================================================
//
// Назначение:
// - Timestamp: момент времени в UTC с точностью до наносекунд
// - Парсинг RFC 3339 (Z или смещение +HH:MM / -HH:MM)
// - Сравнение и форматирование обратно в RFC 3339
// - Конвертация в секунды Unix epoch (для int(timestamp))
//
// ==============================================================================

#ifndef RULEVAL_TIMESTAMP_HPP
#define RULEVAL_TIMESTAMP_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ruleval {

/// Момент времени, нормализованный к UTC
struct Timestamp {
    std::int64_t seconds = 0;  // секунды от 1970-01-01T00:00:00Z
    std::int32_t nanos = 0;    // 0..999999999

    /// Парсить timestamp из строки
    /// Форматы: YYYY-MM-DDTHH:MM:SS[.f...](Z|+HH:MM|-HH:MM)
    /// Без суффикса зоны время считается UTC
    static std::optional<Timestamp> parse(std::string_view str);

    /// Создать из секунд Unix epoch
    static Timestamp from_unix(std::int64_t seconds) { return Timestamp{seconds, 0}; }

    bool operator<(const Timestamp& other) const;
    bool operator<=(const Timestamp& other) const;
    bool operator>(const Timestamp& other) const;
    bool operator>=(const Timestamp& other) const;
    bool operator==(const Timestamp& other) const;
    bool operator!=(const Timestamp& other) const { return !(*this == other); }

    /// Конвертировать в строку RFC 3339 (всегда UTC, суффикс Z)
    std::string to_string() const;
};

}  // namespace ruleval

#endif  // RULEVAL_TIMESTAMP_HPP
