#include "common/clock.h"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace darwin::client {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

bool readDigits(std::string_view text, size_t pos, size_t count, unsigned& out) {
    if (pos + count > text.size()) return false;
    unsigned value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + static_cast<unsigned>(text[i] - '0');
    }
    out = value;
    return true;
}

bool validDate(unsigned year, unsigned month, unsigned day) {
    if (year < 1970 || month < 1 || month > 12 || day < 1) return false;
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    unsigned limit = kDays[month - 1] + ((month == 2 && leap) ? 1 : 0);
    return day <= limit;
}

bool validTime(unsigned h, unsigned m, unsigned s) {
    return h < 24 && m < 60 && s < 60;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Timestamp
// ---------------------------------------------------------------------------

bool Timestamp::tryParse(std::string_view text, Timestamp& out) {
    unsigned y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;

    if (text.size() == 8 && text[2] == ':' && text[5] == ':') {
        if (!readDigits(text, 0, 2, h) || !readDigits(text, 3, 2, mi) ||
            !readDigits(text, 6, 2, s) || !validTime(h, mi, s)) {
            return false;
        }
        out = fromTimeOfDay(h, mi, s);
        return true;
    }

    if (text.size() == 8) {
        if (!readDigits(text, 0, 4, y) || !readDigits(text, 4, 2, mo) ||
            !readDigits(text, 6, 2, d) || !validDate(y, mo, d)) {
            return false;
        }
        out = fromDate(static_cast<int>(y), mo, d);
        return true;
    }

    if (text.size() == 19 && text[4] == '-' && text[7] == '-' && text[10] == ' ' &&
        text[13] == ':' && text[16] == ':') {
        if (!readDigits(text, 0, 4, y) || !readDigits(text, 5, 2, mo) ||
            !readDigits(text, 8, 2, d) || !readDigits(text, 11, 2, h) ||
            !readDigits(text, 14, 2, mi) || !readDigits(text, 17, 2, s) ||
            !validDate(y, mo, d) || !validTime(h, mi, s)) {
            return false;
        }
        out = fromDateTime(static_cast<int>(y), mo, d, h, mi, s);
        return true;
    }

    return false;
}

Timestamp Timestamp::fromDate(int year, unsigned month, unsigned day) {
    return {Clock::daysFromCivil(year, month, day) * kSecondsPerDay, Format::Date};
}

Timestamp Timestamp::fromDateTime(int year, unsigned month, unsigned day,
                                  unsigned hour, unsigned minute, unsigned second) {
    int64_t secs = Clock::daysFromCivil(year, month, day) * kSecondsPerDay +
                   hour * 3600 + minute * 60 + second;
    return {secs, Format::DateTime};
}

Timestamp Timestamp::fromTimeOfDay(unsigned hour, unsigned minute, unsigned second) {
    return {static_cast<int64_t>(hour * 3600 + minute * 60 + second), Format::TimeOfDay};
}

std::string Timestamp::toString() const {
    char buf[32];
    int64_t day_secs = seconds % kSecondsPerDay;
    if (day_secs < 0) day_secs += kSecondsPerDay;
    unsigned h = static_cast<unsigned>(day_secs / 3600);
    unsigned mi = static_cast<unsigned>((day_secs % 3600) / 60);
    unsigned s = static_cast<unsigned>(day_secs % 60);

    if (format == Format::TimeOfDay) {
        std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u", h, mi, s);
        return buf;
    }

    int y = 0;
    unsigned mo = 0, d = 0;
    int64_t days = (seconds - day_secs) / kSecondsPerDay;
    Clock::civilFromDays(days, y, mo, d);

    if (format == Format::Date) {
        std::snprintf(buf, sizeof(buf), "%04d%02u%02u", y, mo, d);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02u:%02u:%02u", y, mo, d, h, mi, s);
    }
    return buf;
}

// ---------------------------------------------------------------------------
// Clock
// ---------------------------------------------------------------------------

Timestamp Clock::localTimeOfDay() {
    std::time_t now = SystemClock::to_time_t(SystemClock::now());
    std::tm local{};
    localtime_r(&now, &local);
    return Timestamp::fromTimeOfDay(static_cast<unsigned>(local.tm_hour),
                                    static_cast<unsigned>(local.tm_min),
                                    static_cast<unsigned>(local.tm_sec));
}

std::string Clock::formatLocal(SystemClock::time_point tp) {
    std::time_t t = SystemClock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

// Howard Hinnant's days_from_civil / civil_from_days.
int64_t Clock::daysFromCivil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void Clock::civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(y + (month <= 2 ? 1 : 0));
}

} // namespace darwin::client
