#pragma once
#include "types.hpp"
#include <mutex>
#include <string>

namespace lc {
    // Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS",
    // optionally followed by "Z", "UTC" or a +HH:MM / -HH:MM offset.
    // Text without a zone designator is taken as UTC. Throws ParseError.
    Instant parseInstant(const std::string& text);
    CivilDate parseDate(const std::string& text);

    bool isLeapYear(int year);
    int daysInMonth(int year, int month);

    // Days since 1970-01-01 and back
    long daysFromCivil(const CivilDate& d);
    CivilDate civilFromDays(long days);
    CivilDate addDays(const CivilDate& d, long n);
    long daysBetween(const CivilDate& from, const CivilDate& to);

    Instant utcDayStart(const Instant& t);
    CivilDate utcDate(const Instant& t);

    std::string formatUtc(const Instant& t, const char* fmt);
    std::string formatTimeOfDayUtc(const Instant& t);   // HH:MM:SS UTC
    std::string formatDateTimeUtc(const Instant& t);    // YYYY-MM-DD HH:MM:SS UTC
    std::string formatDate(const CivilDate& d);

    // Guards the process-wide TZ setting. Hold it around any localtime/mktime call.
    std::mutex& zoneLock();

    // Named civil time zone backed by the system zone database (TZ rules)
    class TimeZone {
    public:
        explicit TimeZone(std::string name);
        const std::string& name() const { return name_; }
        Instant toUtc(const CivilDate& date, int hour, int minute = 0) const;
        CivilDate localDate(const Instant& t) const;
        std::string format(const Instant& t, const char* fmt) const;
    private:
        std::string name_;
        template <typename Fn> auto withZone(Fn&& fn) const;
    };
}
