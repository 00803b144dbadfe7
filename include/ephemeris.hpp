#pragma once
#include "types.hpp"
#include "observer.hpp"

namespace lc {
    struct LookAngle {
        double altitude_deg;
        double azimuth_deg;
        double distance_km;
    };

    // Position provider consumed by the event-detection core. Implementations
    // must be deterministic and safe to call concurrently from const methods.
    class Ephemeris {
    public:
        virtual ~Ephemeris() = default;

        // Sun-Moon elongation seen from Earth's centre, [0, 360). 180 = opposition.
        virtual double elongation(const Instant& t) const = 0;
        virtual LookAngle altitudeAzimuthDistance(Body body, const ObserverLocation& obs, const Instant& t) const = 0;
        virtual double geocentricDistance(Body body, const Instant& t) const = 0;

        virtual bool aboveHorizon(Body body, const ObserverLocation& obs, const Instant& t) const {
            return altitudeAzimuthDistance(body, obs, t).altitude_deg >= 0.0;
        }
    };
}
