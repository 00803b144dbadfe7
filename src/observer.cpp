#include "observer.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

namespace lc {
    ObserverLocation::ObserverLocation(double lat_deg, double lon_deg, double elevation_m)
        : location_{lat_deg, lon_deg, elevation_m} {
        if (!std::isfinite(lat_deg) || lat_deg < -90.0 || lat_deg > 90.0)
            throw ConfigError("latitude out of range [-90, 90]: " + std::to_string(lat_deg));
        if (!std::isfinite(lon_deg) || lon_deg < -180.0 || lon_deg > 180.0)
            throw ConfigError("longitude out of range [-180, 180]: " + std::to_string(lon_deg));
        if (!std::isfinite(elevation_m))
            throw ConfigError("elevation is not a finite number");
    }
}
