#pragma once
#include "types.hpp"

namespace lc {
    // Fixed terrestrial observer. Immutable once constructed.
    class ObserverLocation {
    public:
        ObserverLocation(double lat_deg, double lon_deg, double elevation_m);
        static ObserverLocation columbus() { return ObserverLocation(39.9612, -82.9988, 275.0); }

        double latitude() const { return location_.lat_deg; }
        double longitude() const { return location_.lon_deg; }
        double elevationMeters() const { return location_.elevation_m; }
        Geodetic getLocation() const { return location_; }

    private:
        Geodetic location_;
    };
}
