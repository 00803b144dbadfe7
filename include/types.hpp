#pragma once
#include <cmath>
#include <string>
#include <chrono>
#include <ctime>

namespace lc {
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Instant = TimePoint;

    struct Vector3 {
        double x, y, z;
        Vector3 operator+(const Vector3& other) const { return {x + other.x, y + other.y, z + other.z}; }
        Vector3 operator-(const Vector3& other) const { return {x - other.x, y - other.y, z - other.z}; }
        Vector3 operator*(double s) const { return {x * s, y * s, z * s}; }
        double dot(const Vector3& other) const { return x * other.x + y * other.y + z * other.z; }
        Vector3 cross(const Vector3& o) const { return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x}; }
        double magnitude() const { return std::sqrt(x*x + y*y + z*z); }
    };

    struct Geodetic { double lat_deg; double lon_deg; double elevation_m; };

    struct CivilDate {
        int year;
        int month;
        int day;
        bool operator==(const CivilDate& o) const { return year == o.year && month == o.month && day == o.day; }
        bool operator!=(const CivilDate& o) const { return !(*this == o); }
        bool operator<(const CivilDate& o) const {
            if (year != o.year) return year < o.year;
            if (month != o.month) return month < o.month;
            return day < o.day;
        }
    };

    enum class Body { SUN, MOON };

    constexpr double PI = 3.14159265358979323846;
    constexpr double DEG2RAD = PI / 180.0;
    constexpr double RAD2DEG = 180.0 / PI;
    constexpr double SECONDS_PER_DAY = 86400.0;

    inline double wrapDegrees(double deg) {
        double d = std::fmod(deg, 360.0);
        if (d < 0) d += 360.0;
        return d;
    }

    // Seconds since the Unix epoch, with sub-second resolution
    inline double toUnixSeconds(const TimePoint& t) {
        return std::chrono::duration<double>(t.time_since_epoch()).count();
    }

    inline TimePoint fromUnixSeconds(double seconds) {
        return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds)));
    }
}
