#pragma once
#include "ephemeris.hpp"
#include "horizon_finder.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lc {
    enum class EclipseType { NONE, PENUMBRAL, PARTIAL, TOTAL };

    const char* eclipseName(EclipseType type);
    bool eclipseFromName(const std::string& name, EclipseType& out);

    struct EclipseResult {
        EclipseType type;
        int depth;              // 0..100, truncated
        double offset_deg;      // |elongation - 180|
    };

    // One-dimensional shadow model: severity from the Moon's angular distance
    // to exact opposition, compared against umbra/penumbra radii at lunar distance.
    class EclipseDetector {
    public:
        static constexpr double EARTH_RADIUS_AT_MOON_DEG = 1.9;
        static constexpr double SUN_RADIUS_AT_MOON_DEG = 0.27;
        static constexpr double OPPOSITION_WINDOW_DEG = 5.0;
        static constexpr double UMBRA_RADIUS_DEG = EARTH_RADIUS_AT_MOON_DEG - SUN_RADIUS_AT_MOON_DEG;
        static constexpr double PENUMBRA_RADIUS_DEG = EARTH_RADIUS_AT_MOON_DEG + SUN_RADIUS_AT_MOON_DEG;

        explicit EclipseDetector(const Ephemeris& eph) : eph_(eph) {}

        static EclipseResult classify(double elongation_deg);
        EclipseResult detect(const Instant& t) const { return classify(eph_.elongation(t)); }

    private:
        const Ephemeris& eph_;
    };

    struct EclipseEvent {
        EclipseType type = EclipseType::NONE;
        int depth = 0;
        std::optional<Instant> time;

        bool found() const { return type != EclipseType::NONE; }
    };

    // Hourly search of the Moon's above-horizon window for the deepest eclipse sample
    class NightWindowSampler {
    public:
        static constexpr int SAMPLE_STEP_SECS = 3600;
        static constexpr int MAX_SAMPLES = 48;
        static constexpr int MAX_SPAN_HOURS = 48;

        explicit NightWindowSampler(const EclipseDetector& detector) : detector_(detector) {}

        // day_start is 00:00 UTC of the day the horizon result belongs to
        EclipseEvent search(const HorizonResult& horizon, const Instant& day_start) const;
        // Sample instants the search would evaluate; empty when the Moon is down all day
        static std::vector<Instant> sampleTimes(const HorizonResult& horizon, const Instant& day_start);

    private:
        const EclipseDetector& detector_;
    };
}
