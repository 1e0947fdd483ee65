#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

// Calendar day in UTC, stored as days since 1970-01-01.
// All due-date arithmetic happens at this granularity.
class Date {
public:
    Date() = default;

    static Date fromDays(std::int64_t days) { return Date(days); }
    static Date fromCivil(int year, unsigned month, unsigned day);
    static Date fromUnixTime(std::time_t t);
    static Date today();

    std::int64_t daysSinceEpoch() const { return days; }
    Date addDays(int n) const { return Date(days + n); }

    int year() const;
    unsigned month() const;
    unsigned day() const;

    // "YYYY-MM-DDT00:00:00.000Z"
    std::string toIsoString() const;
    // Accepts "YYYY-MM-DD" optionally followed by a time part, which is dropped
    static std::optional<Date> parseIso(const std::string& text);

    bool operator==(const Date& o) const { return days == o.days; }
    bool operator!=(const Date& o) const { return days != o.days; }
    bool operator<(const Date& o) const { return days < o.days; }
    bool operator<=(const Date& o) const { return days <= o.days; }
    bool operator>(const Date& o) const { return days > o.days; }
    bool operator>=(const Date& o) const { return days >= o.days; }

private:
    explicit Date(std::int64_t d) : days(d) {}

    std::int64_t days = 0;
};

// Full UTC timestamps, "YYYY-MM-DDTHH:MM:SS.000Z"
std::string formatTimestamp(std::time_t t);
std::optional<std::time_t> parseTimestamp(const std::string& text);
