// ==============================================================================
// timestamp.cpp - Реализация Timestamp (RFC 3339)
// ==============================================================================

#include "ruleval/timestamp.hpp"

#include <cstdio>

namespace ruleval {

namespace {

// Количество дней от 1970-01-01 для даты григорианского календаря
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

// Обратное преобразование: дни от epoch -> (год, месяц, день)
void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2 ? 1 : 0;
}

bool parse_digits(std::string_view s, int& out) {
    if (s.empty())
        return false;
    out = 0;
    for (char c : s) {
        if (c < '0' || c > '9')
            return false;
        out = out * 10 + (c - '0');
    }
    return true;
}

}  // namespace

std::optional<Timestamp> Timestamp::parse(std::string_view str) {
    // Минимальная длина: YYYY-MM-DDTHH:MM:SS = 19 символов
    if (str.size() < 19) {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!parse_digits(str.substr(0, 4), year) || str[4] != '-')
        return std::nullopt;
    if (!parse_digits(str.substr(5, 2), month) || month < 1 || month > 12 || str[7] != '-')
        return std::nullopt;
    if (!parse_digits(str.substr(8, 2), day) || day < 1 || day > 31)
        return std::nullopt;
    if (str[10] != 'T' && str[10] != 't' && str[10] != ' ')
        return std::nullopt;
    if (!parse_digits(str.substr(11, 2), hour) || hour > 23 || str[13] != ':')
        return std::nullopt;
    if (!parse_digits(str.substr(14, 2), minute) || minute > 59 || str[16] != ':')
        return std::nullopt;
    // 60 допускается для leap second
    if (!parse_digits(str.substr(17, 2), second) || second > 60)
        return std::nullopt;

    std::size_t pos = 19;
    std::int32_t nanos = 0;

    // Дробная часть секунды, нормализуем к наносекундам (9 цифр)
    if (pos < str.size() && str[pos] == '.') {
        ++pos;
        std::size_t frac_start = pos;
        std::size_t digits = 0;
        while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (str[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == frac_start) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    // Зона: Z, +HH:MM, -HH:MM или отсутствует (UTC)
    std::int64_t offset_seconds = 0;
    if (pos < str.size()) {
        char z = str[pos];
        if (z == 'Z' || z == 'z') {
            ++pos;
        } else if (z == '+' || z == '-') {
            int oh = 0, om = 0;
            if (str.size() < pos + 6 || !parse_digits(str.substr(pos + 1, 2), oh) ||
                str[pos + 3] != ':' || !parse_digits(str.substr(pos + 4, 2), om) || oh > 23 ||
                om > 59) {
                return std::nullopt;
            }
            offset_seconds = (oh * 3600 + om * 60) * (z == '-' ? -1 : 1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }

    if (pos != str.size()) {
        return std::nullopt;
    }

    std::int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                        static_cast<unsigned>(day));
    Timestamp ts;
    ts.seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    ts.nanos = nanos;
    return ts;
}

bool Timestamp::operator<(const Timestamp& other) const {
    if (seconds != other.seconds)
        return seconds < other.seconds;
    return nanos < other.nanos;
}

bool Timestamp::operator<=(const Timestamp& other) const {
    return !(other < *this);
}

bool Timestamp::operator>(const Timestamp& other) const {
    return other < *this;
}

bool Timestamp::operator>=(const Timestamp& other) const {
    return !(*this < other);
}

bool Timestamp::operator==(const Timestamp& other) const {
    return seconds == other.seconds && nanos == other.nanos;
}

std::string Timestamp::to_string() const {
    std::int64_t days = seconds / 86400;
    std::int64_t rem = seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }

    std::int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    int hour = static_cast<int>(rem / 3600);
    int minute = static_cast<int>((rem % 3600) / 60);
    int second = static_cast<int>(rem % 60);

    char buf[64];
    if (nanos > 0) {
        // Отбрасываем хвостовые нули дробной части
        char frac[16];
        std::snprintf(frac, sizeof(frac), "%09d", static_cast<int>(nanos));
        int len = 9;
        while (len > 1 && frac[len - 1] == '0') {
            --len;
        }
        frac[len] = '\0';
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%sZ",
                      static_cast<long long>(year), month, day, hour, minute, second, frac);
    } else {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                      static_cast<long long>(year), month, day, hour, minute, second);
    }
    return buf;
}

}  // namespace ruleval
