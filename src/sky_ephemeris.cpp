#include "sky_ephemeris.hpp"
#include "errors.hpp"
#include <cmath>
#include <cstdint>
#include <Eci.h>
#include <Vector.h>
#include <Observer.h>
#include <CoordTopocentric.h>
#include <SolarPosition.h>

namespace lc {
    namespace {
        // libsgp4 ticks are microseconds since 0001-01-01T00:00:00
        constexpr int64_t UNIX_EPOCH_TICKS = 62135596800LL * 1000000LL;
        constexpr double J2000 = 2451545.0;
        // TT - UT, seconds. Held constant; the series is only good to arcminutes anyway.
        constexpr double DELTA_T = 69.2;

        struct LonDistTerm { int d, m, mp, f; double sl; double sr; };
        struct LatTerm { int d, m, mp, f; double sb; };

        // Periodic terms in 1e-6 deg and 1e-3 km
        const LonDistTerm LON_DIST[] = {
            {0, 0, 1, 0, 6288774, -20905355}, {2, 0, -1, 0, 1274027, -3699111},
            {2, 0, 0, 0, 658314, -2955968},   {0, 0, 2, 0, 213618, -569925},
            {0, 1, 0, 0, -185116, 48888},     {0, 0, 0, 2, -114332, -3149},
            {2, 0, -2, 0, 58793, 246158},     {2, -1, -1, 0, 57066, -152138},
            {2, 0, 1, 0, 53322, -170733},     {2, -1, 0, 0, 45758, -204586},
            {0, 1, -1, 0, -40923, -129620},   {1, 0, 0, 0, -34720, 108743},
            {0, 1, 1, 0, -30383, 104755},     {2, 0, 0, -2, 15327, 10321},
            {0, 0, 1, 2, -12528, 0},          {0, 0, 1, -2, 10980, 79661},
            {4, 0, -1, 0, 10675, -34782},     {0, 0, 3, 0, 10034, -23210},
            {4, 0, -2, 0, 8548, -21636},      {2, 1, -1, 0, -7888, 24208},
            {2, 1, 0, 0, -6766, 30824},       {1, 0, -1, 0, -5163, -8379},
            {1, 1, 0, 0, 4987, -16675},       {2, -1, 1, 0, 4036, -12831},
            {2, 0, 2, 0, 3994, -10445},       {4, 0, 0, 0, 3861, -11650},
            {2, 0, -3, 0, 3665, 14403},       {0, 1, -2, 0, -2689, -7003},
            {2, 0, -1, 2, -2602, 0},          {2, -1, -2, 0, 2390, 10056},
            {1, 0, 1, 0, -2348, 6322},        {2, -2, 0, 0, 2236, -9884},
        };

        const LatTerm LAT[] = {
            {0, 0, 0, 1, 5128122}, {0, 0, 1, 1, 280602}, {0, 0, 1, -1, 277693},
            {2, 0, 0, -1, 173237}, {2, 0, -1, 1, 55413}, {2, 0, -1, -1, 46271},
            {2, 0, 0, 1, 32573},   {0, 0, 2, 1, 17198},  {2, 0, 1, -1, 9266},
            {0, 0, 2, -1, 8822},   {2, -1, 0, -1, 8216}, {2, 0, -2, -1, 4324},
            {2, 0, 1, 1, 4200},    {2, 1, 0, -1, -3359}, {2, -1, -1, 1, 2463},
            {2, -1, 0, 1, 2211},   {2, -1, -1, -1, 2065}, {0, 1, -1, -1, -1870},
            {4, 0, -1, -1, 1828},  {0, 1, 0, 1, -1794}, {0, 0, 0, 3, -1749},
            {0, 1, -1, 1, -1565},  {1, 0, 0, 1, -1491}, {0, 1, 1, 1, -1475},
            {0, 1, 1, -1, -1410},  {0, 1, 0, -1, -1344}, {1, 0, 0, -1, -1335},
        };

        double eccentricityFactor(int m, double E) {
            int k = std::abs(m);
            if (k == 1) return E;
            if (k == 2) return E * E;
            return 1.0;
        }

        Vector3 toVector3(const libsgp4::Vector& v) { return {v.x, v.y, v.z}; }
    }

    libsgp4::DateTime SkyEphemeris::toDateTime(const Instant& t) {
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
        return libsgp4::DateTime(static_cast<int64_t>(UNIX_EPOCH_TICKS + us));
    }

    double SkyEphemeris::meanObliquity(double jd_ut) {
        double T = (jd_ut - J2000) / 36525.0;
        return 23.439291111 - 0.0130041667 * T - 1.639e-7 * T * T + 5.036e-7 * T * T * T;
    }

    SkyEphemeris::EclipticPosition SkyEphemeris::moonEcliptic(double jd_ut) {
        double T = (jd_ut + DELTA_T / SECONDS_PER_DAY - J2000) / 36525.0;
        double T2 = T * T, T3 = T2 * T, T4 = T3 * T;

        double Lp = wrapDegrees(218.3164477 + 481267.88123421 * T - 0.0015786 * T2 + T3 / 538841.0 - T4 / 65194000.0);
        double D = wrapDegrees(297.8501921 + 445267.1114034 * T - 0.0018819 * T2 + T3 / 545868.0 - T4 / 113065000.0);
        double M = wrapDegrees(357.5291092 + 35999.0502909 * T - 0.0001536 * T2 + T3 / 24490000.0);
        double Mp = wrapDegrees(134.9633964 + 477198.8675055 * T + 0.0087414 * T2 + T3 / 69699.0 - T4 / 14712000.0);
        double F = wrapDegrees(93.2720950 + 483202.0175233 * T - 0.0036539 * T2 - T3 / 3526000.0 + T4 / 863310000.0);
        double A1 = wrapDegrees(119.75 + 131.849 * T);
        double A2 = wrapDegrees(53.09 + 479264.290 * T);
        double A3 = wrapDegrees(313.45 + 481266.484 * T);
        double E = 1.0 - 0.002516 * T - 0.0000074 * T2;

        double sl = 0.0, sr = 0.0, sb = 0.0;
        for (const auto& term : LON_DIST) {
            double arg = (term.d * D + term.m * M + term.mp * Mp + term.f * F) * DEG2RAD;
            double e = eccentricityFactor(term.m, E);
            sl += term.sl * e * std::sin(arg);
            sr += term.sr * e * std::cos(arg);
        }
        for (const auto& term : LAT) {
            double arg = (term.d * D + term.m * M + term.mp * Mp + term.f * F) * DEG2RAD;
            sb += term.sb * eccentricityFactor(term.m, E) * std::sin(arg);
        }

        // Venus, Jupiter and Earth-flattening corrections
        sl += 3958.0 * std::sin(A1 * DEG2RAD) + 1962.0 * std::sin((Lp - F) * DEG2RAD) + 318.0 * std::sin(A2 * DEG2RAD);
        sb += -2235.0 * std::sin(Lp * DEG2RAD) + 382.0 * std::sin(A3 * DEG2RAD)
              + 175.0 * std::sin((A1 - F) * DEG2RAD) + 175.0 * std::sin((A1 + F) * DEG2RAD)
              + 127.0 * std::sin((Lp - Mp) * DEG2RAD) - 115.0 * std::sin((Lp + Mp) * DEG2RAD);

        return {wrapDegrees(Lp + sl / 1.0e6), sb / 1.0e6, 385000.56 + sr / 1000.0};
    }

    Vector3 SkyEphemeris::checked(const Vector3& v, const char* what) {
        if (!std::isfinite(v.x) || !std::isfinite(v.y) || !std::isfinite(v.z) || v.magnitude() <= 0.0)
            throw EphemerisError(std::string("no valid position for ") + what);
        return v;
    }

    Vector3 SkyEphemeris::positionEci(Body body, const Instant& t) const {
        libsgp4::DateTime dt = toDateTime(t);
        if (body == Body::SUN) {
            libsgp4::SolarPosition solar;
            return checked(toVector3(solar.FindPosition(dt).Position()), "Sun");
        }

        double jd = dt.ToJulian();
        EclipticPosition moon = moonEcliptic(jd);
        double lam = moon.longitude_deg * DEG2RAD;
        double bet = moon.latitude_deg * DEG2RAD;
        double eps = meanObliquity(jd) * DEG2RAD;

        double xe = moon.distance_km * std::cos(bet) * std::cos(lam);
        double ye = moon.distance_km * std::cos(bet) * std::sin(lam);
        double ze = moon.distance_km * std::sin(bet);
        return checked({xe, ye * std::cos(eps) - ze * std::sin(eps), ye * std::sin(eps) + ze * std::cos(eps)}, "Moon");
    }

    double SkyEphemeris::elongation(const Instant& t) const {
        Vector3 sun = positionEci(Body::SUN, t);
        Vector3 moon = positionEci(Body::MOON, t);

        double sep = std::atan2(sun.cross(moon).magnitude(), sun.dot(moon)) * RAD2DEG;

        // Waxing while the Moon's ecliptic longitude leads the Sun's by less than 180 deg
        double eps = meanObliquity(toDateTime(t).ToJulian()) * DEG2RAD;
        auto eclipticLongitude = [eps](const Vector3& v) {
            return wrapDegrees(std::atan2(v.y * std::cos(eps) + v.z * std::sin(eps), v.x) * RAD2DEG);
        };
        double lead = wrapDegrees(eclipticLongitude(moon) - eclipticLongitude(sun));

        double elong = (lead < 180.0) ? sep : 360.0 - sep;
        if (!std::isfinite(elong)) throw EphemerisError("elongation is not finite");
        return (elong >= 360.0) ? 0.0 : elong;
    }

    LookAngle SkyEphemeris::altitudeAzimuthDistance(Body body, const ObserverLocation& obs, const Instant& t) const {
        Vector3 pos = positionEci(body, t);
        libsgp4::Observer site(obs.latitude(), obs.longitude(), obs.elevationMeters() / 1000.0);
        libsgp4::Eci eci(toDateTime(t), pos.x, pos.y, pos.z);
        libsgp4::CoordTopocentric topo = site.GetLookAngle(eci);

        LookAngle look{topo.elevation * RAD2DEG, wrapDegrees(topo.azimuth * RAD2DEG), topo.range};
        if (!std::isfinite(look.altitude_deg) || !std::isfinite(look.distance_km))
            throw EphemerisError("look angle is not finite");
        return look;
    }

    double SkyEphemeris::geocentricDistance(Body body, const Instant& t) const {
        return positionEci(body, t).magnitude();
    }
}
