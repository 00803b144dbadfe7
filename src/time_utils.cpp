#include "time_utils.hpp"
#include "errors.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <optional>

namespace lc {
    namespace {
        void requireRange(int v, int lo, int hi, const char* what, const std::string& text) {
            if (v < lo || v > hi) throw ParseError(std::string("invalid ") + what + " in '" + text + "'");
        }

        std::string trim(const std::string& str) {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return "";
            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

        // Returns the zone offset in seconds, or nullopt if the suffix is not a zone designator
        std::optional<long> parseZoneSuffix(const std::string& suffix) {
            std::string s = trim(suffix);
            if (s.empty() || s == "Z" || s == "UTC" || s == "GMT") return 0L;
            if (s[0] != '+' && s[0] != '-') return std::nullopt;
            int hh = 0, mm = 0, n = 0;
            if (std::sscanf(s.c_str() + 1, "%2d:%2d%n", &hh, &mm, &n) != 2 || (size_t)(n + 1) != s.size()) {
                if (std::sscanf(s.c_str() + 1, "%2d%2d%n", &hh, &mm, &n) != 2 || (size_t)(n + 1) != s.size())
                    return std::nullopt;
            }
            if (hh > 14 || mm > 59) return std::nullopt;
            long off = hh * 3600L + mm * 60L;
            return (s[0] == '-') ? -off : off;
        }
    }

    std::mutex& zoneLock() {
        static std::mutex tz_mutex;
        return tz_mutex;
    }

    bool isLeapYear(int year) { return (year % 4 == 0 && (year % 100 != 0 || year % 400 == 0)); }

    int daysInMonth(int year, int month) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && isLeapYear(year)) return 29;
        return days[month - 1];
    }

    long daysFromCivil(const CivilDate& d) {
        int y = d.year - (d.month <= 2 ? 1 : 0);
        long era = (y >= 0 ? y : y - 399) / 400;
        long yoe = y - era * 400;
        long mp = (d.month + 9) % 12;
        long doy = (153 * mp + 2) / 5 + d.day - 1;
        long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    CivilDate civilFromDays(long z) {
        z += 719468;
        long era = (z >= 0 ? z : z - 146096) / 146097;
        long doe = z - era * 146097;
        long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        long y = yoe + era * 400;
        long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        long mp = (5 * doy + 2) / 153;
        int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
        int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
        return {static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
    }

    CivilDate addDays(const CivilDate& d, long n) { return civilFromDays(daysFromCivil(d) + n); }

    long daysBetween(const CivilDate& from, const CivilDate& to) { return daysFromCivil(to) - daysFromCivil(from); }

    CivilDate parseDate(const std::string& text) {
        std::string s = trim(text);
        int Y = 0, M = 0, D = 0, n = 0;
        if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &Y, &M, &D, &n) != 3 || (size_t)n != s.size())
            throw ParseError("expected YYYY-MM-DD, got '" + text + "'");
        requireRange(M, 1, 12, "month", text);
        requireRange(D, 1, daysInMonth(Y, M), "day", text);
        return {Y, M, D};
    }

    Instant parseInstant(const std::string& text) {
        std::string s = trim(text);
        if (s.size() < 10) throw ParseError("unparsable date/time '" + text + "'");

        CivilDate date = parseDate(s.substr(0, 10));
        int h = 0, m = 0, sec = 0;
        long offset = 0;

        if (s.size() > 10) {
            char sep = s[10];
            if (sep != ' ' && sep != 'T') throw ParseError("unparsable date/time '" + text + "'");
            int n = 0;
            if (std::sscanf(s.c_str() + 11, "%2d:%2d:%2d%n", &h, &m, &sec, &n) != 3)
                throw ParseError("expected HH:MM:SS in '" + text + "'");
            requireRange(h, 0, 23, "hour", text);
            requireRange(m, 0, 59, "minute", text);
            requireRange(sec, 0, 59, "second", text);
            auto zone = parseZoneSuffix(s.substr(11 + n));
            if (!zone) throw ParseError("unrecognised zone designator in '" + text + "'");
            offset = *zone;
        }

        long long seconds = daysFromCivil(date) * 86400LL + h * 3600LL + m * 60LL + sec - offset;
        return Instant(std::chrono::seconds(seconds));
    }

    Instant utcDayStart(const Instant& t) {
        double s = toUnixSeconds(t);
        long long day = static_cast<long long>(std::floor(s / SECONDS_PER_DAY));
        return Instant(std::chrono::seconds(day * 86400LL));
    }

    CivilDate utcDate(const Instant& t) {
        return civilFromDays(static_cast<long>(std::floor(toUnixSeconds(t) / SECONDS_PER_DAY)));
    }

    std::string formatUtc(const Instant& t, const char* fmt) {
        std::time_t tt = static_cast<std::time_t>(std::floor(toUnixSeconds(t)));
        std::tm gmt;
        gmtime_r(&tt, &gmt);
        char buf[64];
        std::strftime(buf, sizeof(buf), fmt, &gmt);
        return std::string(buf);
    }

    std::string formatTimeOfDayUtc(const Instant& t) { return formatUtc(t, "%H:%M:%S UTC"); }

    std::string formatDateTimeUtc(const Instant& t) { return formatUtc(t, "%Y-%m-%d %H:%M:%S UTC"); }

    std::string formatDate(const CivilDate& d) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
        return std::string(buf);
    }

    TimeZone::TimeZone(std::string name) : name_(std::move(name)) {
        if (name_.empty()) throw ConfigError("empty time zone name");
        if (name_ == "UTC" || name_ == "GMT") return;
        const char* tzdir = std::getenv("TZDIR");
        std::filesystem::path db = tzdir ? tzdir : "/usr/share/zoneinfo";
        if (name_.find("..") != std::string::npos || !std::filesystem::exists(db / name_))
            throw ConfigError("unknown time zone '" + name_ + "'");
    }

    template <typename Fn>
    auto TimeZone::withZone(Fn&& fn) const {
        std::lock_guard<std::mutex> lock(zoneLock());
        const char* prev = std::getenv("TZ");
        std::string saved = prev ? prev : "";
        setenv("TZ", name_.c_str(), 1);
        tzset();
        auto result = fn();
        if (prev) setenv("TZ", saved.c_str(), 1);
        else unsetenv("TZ");
        tzset();
        return result;
    }

    Instant TimeZone::toUtc(const CivilDate& date, int hour, int minute) const {
        std::time_t tt = withZone([&]() {
            std::tm t = {};
            t.tm_year = date.year - 1900;
            t.tm_mon = date.month - 1;
            t.tm_mday = date.day;
            t.tm_hour = hour;
            t.tm_min = minute;
            t.tm_isdst = -1;
            return std::mktime(&t);
        });
        if (tt == static_cast<std::time_t>(-1)) throw ConfigError("cannot resolve local time in zone " + name_);
        return Clock::from_time_t(tt);
    }

    CivilDate TimeZone::localDate(const Instant& t) const {
        std::time_t tt = static_cast<std::time_t>(std::floor(toUnixSeconds(t)));
        std::tm local = withZone([&]() {
            std::tm out;
            localtime_r(&tt, &out);
            return out;
        });
        return {local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
    }

    std::string TimeZone::format(const Instant& t, const char* fmt) const {
        std::time_t tt = static_cast<std::time_t>(std::floor(toUnixSeconds(t)));
        return withZone([&]() {
            std::tm out;
            localtime_r(&tt, &out);
            char buf[64];
            std::strftime(buf, sizeof(buf), fmt, &out);
            return std::string(buf);
        });
    }
}
