#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace domain {

// Calendar date without time of day, stored as days since 1970-01-01.
struct Date {
    std::int32_t days{0};

    constexpr bool operator==(const Date& o) const noexcept { return days == o.days; }
    constexpr bool operator!=(const Date& o) const noexcept { return days != o.days; }
    constexpr bool operator<(const Date& o) const noexcept { return days < o.days; }
    constexpr bool operator<=(const Date& o) const noexcept { return days <= o.days; }
    constexpr bool operator>(const Date& o) const noexcept { return days > o.days; }
    constexpr bool operator>=(const Date& o) const noexcept { return days >= o.days; }
};

struct YearMonthDay {
    int year{1970};
    int month{1};
    int day{1};
};

constexpr std::int64_t kSecondsPerDay = 86'400;

constexpr Date addDays(Date date, std::int32_t delta) noexcept {
    return Date{date.days + delta};
}

constexpr std::int32_t daysBetween(Date from, Date to) noexcept {
    return to.days - from.days;
}

Date dateFromYmd(int year, int month, int day);
YearMonthDay toYmd(Date date);

// 0 = Monday ... 6 = Sunday.
int weekday(Date date) noexcept;

// Midnight UTC of the date.
std::int64_t toUnixSeconds(Date date) noexcept;
Date fromUnixSeconds(std::int64_t seconds) noexcept;

// Accepts YYYY-MM-DD, YYYY/MM/DD and YYYYMMDD, optionally followed by a time
// part separated by 'T' or a space. The time part is ignored.
std::optional<Date> parseDate(std::string_view text);
std::string formatDate(Date date);

// Calendar date of the local wall clock.
Date localToday();

}  // namespace domain
