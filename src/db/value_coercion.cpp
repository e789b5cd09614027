#include "db/value_coercion.hpp"
#include "core/utils.hpp"
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <format>

namespace polydb {

namespace {

struct TimeOfDay {
    int hour = 0;
    int minute = 0;
    int second = 0;
    uint32_t nanos = 0;
};

constexpr int64_t kSecondsPerDay = 86400;

// Exactly n ASCII digits starting at pos
std::optional<int> read_digits(std::string_view s, size_t pos, size_t n) {
    if (pos + n > s.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (size_t i = 0; i < n; ++i) {
        const char c = s[pos + i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

// "YYYY-MM-DD"
std::optional<std::chrono::year_month_day> parse_ymd(std::string_view s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
        return std::nullopt;
    }
    const auto y = read_digits(s, 0, 4);
    const auto m = read_digits(s, 5, 2);
    const auto d = read_digits(s, 8, 2);
    if (!y || !m || !d) {
        return std::nullopt;
    }
    const std::chrono::year_month_day ymd{
        std::chrono::year{*y},
        std::chrono::month{static_cast<unsigned>(*m)},
        std::chrono::day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return ymd;
}

// "HH:MM:SS[.f]" with 1 to 9 fraction digits, consuming the whole view
std::optional<TimeOfDay> parse_time_of_day(std::string_view s) {
    if (s.size() < 8 || s[2] != ':' || s[5] != ':') {
        return std::nullopt;
    }
    const auto h = read_digits(s, 0, 2);
    const auto m = read_digits(s, 3, 2);
    const auto sec = read_digits(s, 6, 2);
    if (!h || !m || !sec || *h > 23 || *m > 59 || *sec > 59) {
        return std::nullopt;
    }

    TimeOfDay t{*h, *m, *sec, 0};
    if (s.size() == 8) {
        return t;
    }

    const std::string_view frac = s.substr(8);
    if (frac.size() < 2 || frac.size() > 10 || frac[0] != '.') {
        return std::nullopt;
    }
    for (size_t i = 1; i <= 9; ++i) {
        int digit = 0;
        if (i < frac.size()) {
            const char c = frac[i];
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            digit = c - '0';
        }
        t.nanos = t.nanos * 10 + static_cast<uint32_t>(digit);
    }
    return t;
}

// "+HH", "+HH:MM" or "+HH:MM:SS" (also "Z"), in seconds east of UTC
std::optional<int> parse_utc_offset(std::string_view s) {
    if (s == "Z" || s == "z") {
        return 0;
    }
    if (s.size() < 3 || (s[0] != '+' && s[0] != '-')) {
        return std::nullopt;
    }
    const int sign = s[0] == '-' ? -1 : 1;
    const auto h = read_digits(s, 1, 2);
    if (!h) {
        return std::nullopt;
    }
    int seconds = *h * 3600;
    size_t pos = 3;
    for (const int scale : {60, 1}) {
        if (pos == s.size()) {
            break;
        }
        if (s[pos] != ':') {
            return std::nullopt;
        }
        const auto part = read_digits(s, pos + 1, 2);
        if (!part || *part > 59) {
            return std::nullopt;
        }
        seconds += *part * scale;
        pos += 3;
    }
    if (pos != s.size()) {
        return std::nullopt;
    }
    return sign * seconds;
}

std::string format_fraction(uint32_t nanos) {
    if (nanos == 0) {
        return "";
    }
    if (nanos % 1000000 == 0) {
        return std::format(".{:03}", nanos / 1000000);
    }
    if (nanos % 1000 == 0) {
        return std::format(".{:06}", nanos / 1000);
    }
    return std::format(".{:09}", nanos);
}

std::string format_date(const std::chrono::year_month_day& ymd) {
    return std::format("{:04}-{:02}-{:02}",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()));
}

std::string format_time(const TimeOfDay& t) {
    return std::format("{:02}:{:02}:{:02}{}", t.hour, t.minute, t.second, format_fraction(t.nanos));
}

Value text_or_null(const std::optional<std::string>& text) {
    if (!text) {
        return std::monostate{};
    }
    return *text;
}

template<typename T>
Value read_integer(std::string_view text) {
    const auto parsed = utils::try_parse_int<T>(text);
    if (!parsed) {
        return std::monostate{};
    }
    return static_cast<int64_t>(*parsed);
}

Value read_text(const std::string& text) {
    if (!ValueCoercion::is_valid_utf8(text)) {
        return std::monostate{};
    }
    return text;
}

} // namespace

Value ValueCoercion::coerce(const RawCell& cell, const ColumnTypeInfo& type) {
    if (!cell) {
        return std::monostate{};
    }
    const std::string& text = *cell;

    switch (type.generic_type) {
        case GenericColumnType::SMALLINT:
            return read_integer<int16_t>(text);
        case GenericColumnType::INTEGER:
            return read_integer<int32_t>(text);
        case GenericColumnType::BIGINT:
            return read_integer<int64_t>(text);

        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION: {
            const auto d = parse_double(text);
            if (!d || !std::isfinite(*d)) {
                return std::monostate{};
            }
            return *d;
        }

        case GenericColumnType::BOOLEAN: {
            const auto b = parse_bool(text);
            if (!b) {
                return std::monostate{};
            }
            return *b;
        }

        case GenericColumnType::DATE:
            return text_or_null(normalize_date(text));
        case GenericColumnType::TIME:
            return text_or_null(normalize_time(text));
        case GenericColumnType::TIMESTAMP:
            return text_or_null(normalize_timestamp(text));
        case GenericColumnType::TIMESTAMP_TZ:
            return text_or_null(normalize_timestamp_tz(text));
        case GenericColumnType::UUID:
            return text_or_null(normalize_uuid(text));

        // Arbitrary precision stays textual so no digit is lost
        case GenericColumnType::NUMERIC:
        case GenericColumnType::TEXT:
        case GenericColumnType::VARCHAR:
        case GenericColumnType::CHAR:
        case GenericColumnType::JSON:
        case GenericColumnType::BLOB:
        case GenericColumnType::VENDOR_SPECIFIC:
        case GenericColumnType::UNKNOWN:
            return read_text(text);
    }
    return read_text(text);
}

std::optional<bool> ValueCoercion::parse_bool(std::string_view text) {
    const std::string lower = utils::to_lower(text);
    if (lower == "t" || lower == "true" || lower == "1") {
        return true;
    }
    if (lower == "f" || lower == "false" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::optional<double> ValueCoercion::parse_double(std::string_view text) {
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> ValueCoercion::normalize_date(std::string_view text) {
    const auto ymd = parse_ymd(text);
    if (!ymd) {
        return std::nullopt;
    }
    return format_date(*ymd);
}

std::optional<std::string> ValueCoercion::normalize_time(std::string_view text) {
    const auto t = parse_time_of_day(text);
    if (!t) {
        return std::nullopt;
    }
    return format_time(*t);
}

std::optional<std::string> ValueCoercion::normalize_timestamp(std::string_view text) {
    if (text.size() < 19 || (text[10] != ' ' && text[10] != 'T')) {
        return std::nullopt;
    }
    const auto ymd = parse_ymd(text.substr(0, 10));
    const auto t = parse_time_of_day(text.substr(11));
    if (!ymd || !t) {
        return std::nullopt;
    }
    return std::format("{} {}", format_date(*ymd), format_time(*t));
}

std::optional<std::string> ValueCoercion::normalize_timestamp_tz(std::string_view text) {
    if (text.size() < 20 || (text[10] != ' ' && text[10] != 'T')) {
        return std::nullopt;
    }
    const std::string_view rest = text.substr(11);
    const auto offset_pos = rest.find_first_of("+-Zz", 8);
    if (offset_pos == std::string_view::npos) {
        return std::nullopt;
    }

    const auto ymd = parse_ymd(text.substr(0, 10));
    const auto t = parse_time_of_day(rest.substr(0, offset_pos));
    const auto offset = parse_utc_offset(rest.substr(offset_pos));
    if (!ymd || !t || !offset) {
        return std::nullopt;
    }

    const int64_t local_days = std::chrono::sys_days{*ymd}.time_since_epoch().count();
    const int64_t utc_seconds = local_days * kSecondsPerDay
        + t->hour * 3600 + t->minute * 60 + t->second - *offset;

    int64_t days = utc_seconds / kSecondsPerDay;
    int64_t second_of_day = utc_seconds % kSecondsPerDay;
    if (second_of_day < 0) {
        second_of_day += kSecondsPerDay;
        --days;
    }

    const std::chrono::year_month_day utc_ymd{
        std::chrono::sys_days{std::chrono::days{days}}};
    const int year = static_cast<int>(utc_ymd.year());
    if (year < 0 || year > 9999) {
        return std::nullopt;
    }

    const TimeOfDay utc_time{
        static_cast<int>(second_of_day / 3600),
        static_cast<int>((second_of_day % 3600) / 60),
        static_cast<int>(second_of_day % 60),
        t->nanos};

    return std::format("{}T{}+00:00", format_date(utc_ymd), format_time(utc_time));
}

std::optional<std::string> ValueCoercion::normalize_uuid(std::string_view text) {
    if (text.size() != 36) {
        return std::nullopt;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') {
                return std::nullopt;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return utils::to_lower(text);
}

bool ValueCoercion::is_valid_utf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        uint32_t code = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= text.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code = (code << 6) | (cc & 0x3F);
        }

        // Overlong encodings, surrogates and values past U+10FFFF
        if ((extra == 1 && code < 0x80) ||
            (extra == 2 && code < 0x800) ||
            (extra == 3 && code < 0x10000) ||
            (code >= 0xD800 && code <= 0xDFFF) ||
            code > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace polydb
