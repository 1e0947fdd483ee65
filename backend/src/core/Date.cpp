#include "Date.hpp"
#include <cctype>
#include <spdlog/fmt/fmt.h>

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 24 * 60 * 60;

// Proleptic Gregorian conversions (H. Hinnant's days_from_civil / civil_from_days)
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
}

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

// Reads exactly `width` digits at `pos`
bool readNumber(const std::string& s, std::size_t pos, std::size_t width, int& out) {
    if (pos + width > s.size()) return false;
    int v = 0;
    for (std::size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

// Parses the leading "YYYY-MM-DD" and rejects impossible calendar days
bool readCivilDate(const std::string& s, Date& out) {
    int y = 0, m = 0, d = 0;
    if (!readNumber(s, 0, 4, y) || s.size() < 10 || s[4] != '-' || s[7] != '-') return false;
    if (!readNumber(s, 5, 2, m) || !readNumber(s, 8, 2, d)) return false;
    if (m < 1 || m > 12 || d < 1 || d > 31) return false;

    Date candidate = Date::fromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
    if (candidate.month() != static_cast<unsigned>(m) || candidate.day() != static_cast<unsigned>(d))
        return false;

    out = candidate;
    return true;
}

} // namespace

Date Date::fromCivil(int year, unsigned month, unsigned day) {
    return Date(daysFromCivil(year, month, day));
}

Date Date::fromUnixTime(std::time_t t) {
    return Date(floorDiv(static_cast<std::int64_t>(t), SECONDS_PER_DAY));
}

Date Date::today() {
    return fromUnixTime(std::time(nullptr));
}

int Date::year() const {
    std::int64_t y; unsigned m, d;
    civilFromDays(days, y, m, d);
    return static_cast<int>(y);
}

unsigned Date::month() const {
    std::int64_t y; unsigned m, d;
    civilFromDays(days, y, m, d);
    return m;
}

unsigned Date::day() const {
    std::int64_t y; unsigned m, d;
    civilFromDays(days, y, m, d);
    return d;
}

std::string Date::toIsoString() const {
    std::int64_t y; unsigned m, d;
    civilFromDays(days, y, m, d);

    return fmt::format("{:04}-{:02}-{:02}T00:00:00.000Z", y, m, d);
}

std::optional<Date> Date::parseIso(const std::string& text) {
    Date out;
    if (!readCivilDate(text, out)) return std::nullopt;
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') return std::nullopt;
    return out;
}

std::string formatTimestamp(std::time_t t) {
    const std::int64_t secs = static_cast<std::int64_t>(t);
    const std::int64_t dayNumber = floorDiv(secs, SECONDS_PER_DAY);
    const std::int64_t secOfDay = secs - dayNumber * SECONDS_PER_DAY;

    return fmt::format("{}{:02}:{:02}:{:02}.000Z",
        Date::fromDays(dayNumber).toIsoString().substr(0, 11),
        secOfDay / 3600, (secOfDay / 60) % 60, secOfDay % 60);
}

std::optional<std::time_t> parseTimestamp(const std::string& text) {
    Date date;
    if (!readCivilDate(text, date)) return std::nullopt;
    if (text.size() < 19 || text[10] != 'T' || text[13] != ':' || text[16] != ':') return std::nullopt;

    int hh = 0, mm = 0, ss = 0;
    if (!readNumber(text, 11, 2, hh) || !readNumber(text, 14, 2, mm) || !readNumber(text, 17, 2, ss))
        return std::nullopt;
    if (hh > 23 || mm > 59 || ss > 60) return std::nullopt;

    // Optional fraction, then an optional 'Z'
    std::size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) { ++pos; ++digits; }
        if (digits == 0) return std::nullopt;
    }
    if (pos < text.size() && text[pos] == 'Z') ++pos;
    if (pos != text.size()) return std::nullopt;

    const std::int64_t secs = date.daysSinceEpoch() * SECONDS_PER_DAY + hh * 3600 + mm * 60 + ss;
    return static_cast<std::time_t>(secs);
}
