#include <sortid/clock.hpp>
#include <cstdio>

namespace sortid::clock {

Result<uint64_t> to_unix_ms(MillisTimePoint tp) {
    auto since_epoch = tp.time_since_epoch().count();
    if (since_epoch < 0) {
        return Result<uint64_t>::ok(0);
    }
    auto ms = static_cast<uint64_t>(since_epoch);
    if (ms > MAX_TIMESTAMP_MS) {
        return SortidError(SortidError::Clock,
            "system time " + std::to_string(ms) + " ms exceeds the 48-bit timestamp range",
            "check the system clock");
    }
    return Result<uint64_t>::ok(ms);
}

Result<uint64_t> to_unix_ms(TimePoint tp) {
    return to_unix_ms(std::chrono::time_point_cast<std::chrono::milliseconds>(tp));
}

Result<uint64_t> now_ms() {
    return to_unix_ms(std::chrono::system_clock::now());
}

MillisTimePoint from_unix_ms(uint64_t ms) {
    return MillisTimePoint(std::chrono::milliseconds(static_cast<int64_t>(ms)));
}

// Days since 1970-01-01 to a proleptic Gregorian date
static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    if (m <= 2) ++y;
}

std::string format_iso8601(uint64_t ms) {
    const uint64_t ms_per_day = 86400000;
    int64_t days = static_cast<int64_t>(ms / ms_per_day);
    uint64_t rem = ms % ms_per_day;

    int64_t year;
    unsigned month, day;
    civil_from_days(days, year, month, day);

    unsigned hour = static_cast<unsigned>(rem / 3600000);
    unsigned minute = static_cast<unsigned>((rem / 60000) % 60);
    unsigned second = static_cast<unsigned>((rem / 1000) % 60);
    unsigned milli = static_cast<unsigned>(rem % 1000);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02u:%02u:%02u.%03uZ",
                  static_cast<long long>(year), month, day, hour, minute, second, milli);
    return buf;
}

} // namespace sortid::clock
