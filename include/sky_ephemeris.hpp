#pragma once
#include "ephemeris.hpp"
#include <DateTime.h>

namespace lc {
    // Analytic ephemeris: Sun from libsgp4's SolarPosition, Moon from a
    // truncated ELP-2000/82 series (Meeus ch. 47), topocentric look angles
    // from libsgp4::Observer. Accuracy is a few arcminutes for the Moon.
    class SkyEphemeris : public Ephemeris {
    public:
        struct EclipticPosition {
            double longitude_deg;
            double latitude_deg;
            double distance_km;
        };

        double elongation(const Instant& t) const override;
        LookAngle altitudeAzimuthDistance(Body body, const ObserverLocation& obs, const Instant& t) const override;
        double geocentricDistance(Body body, const Instant& t) const override;

        // Geocentric equatorial (of date) position in km
        Vector3 positionEci(Body body, const Instant& t) const;

        static EclipticPosition moonEcliptic(double jd_ut);
        static double meanObliquity(double jd_ut);
        static libsgp4::DateTime toDateTime(const Instant& t);

    private:
        static Vector3 checked(const Vector3& v, const char* what);
    };
}
