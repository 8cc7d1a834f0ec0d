#include "domain/Date.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace domain {
namespace {

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

std::tm safeGmtime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

std::tm safeLocaltime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    return tm;
}

std::int32_t floorDiv(std::int64_t value, std::int64_t divisor) {
    auto q = value / divisor;
    if ((value % divisor) != 0 && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return static_cast<std::int32_t>(q);
}

bool readDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        if (std::isdigit(ch) == 0) {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

}  // namespace

Date dateFromYmd(int year, int month, int day) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_isdst = 0;
    const auto raw = timegm_compat(&tm);
    return fromUnixSeconds(static_cast<std::int64_t>(raw));
}

YearMonthDay toYmd(Date date) {
    const auto tm = safeGmtime(static_cast<std::time_t>(toUnixSeconds(date)));
    return YearMonthDay{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

int weekday(Date date) noexcept {
    // 1970-01-01 was a Thursday.
    const int offset = (date.days + 3) % 7;
    return offset < 0 ? offset + 7 : offset;
}

std::int64_t toUnixSeconds(Date date) noexcept {
    return static_cast<std::int64_t>(date.days) * kSecondsPerDay;
}

Date fromUnixSeconds(std::int64_t seconds) noexcept {
    return Date{floorDiv(seconds, kSecondsPerDay)};
}

std::optional<Date> parseDate(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }

    int year = 0;
    int month = 0;
    int day = 0;
    std::size_t consumed = 0;

    if (!readDigits(text, 0, 4, year)) {
        return std::nullopt;
    }
    if (text.size() >= 10 && (text[4] == '-' || text[4] == '/') && text[7] == text[4]) {
        if (!readDigits(text, 5, 2, month) || !readDigits(text, 8, 2, day)) {
            return std::nullopt;
        }
        consumed = 10;
    } else if (readDigits(text, 4, 2, month) && readDigits(text, 6, 2, day)) {
        consumed = 8;
    } else {
        return std::nullopt;
    }

    if (consumed < text.size()) {
        const char next = text[consumed];
        if (next != 'T' && next != ' ') {
            return std::nullopt;
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        return std::nullopt;
    }
    return dateFromYmd(year, month, day);
}

std::string formatDate(Date date) {
    const auto ymd = toYmd(date);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", ymd.year, ymd.month, ymd.day);
    return std::string{buffer};
}

Date localToday() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const auto tm = safeLocaltime(now);
    return dateFromYmd(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

}  // namespace domain
