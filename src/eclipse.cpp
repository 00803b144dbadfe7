#include "eclipse.hpp"
#include <cmath>

namespace lc {
    const char* eclipseName(EclipseType type) {
        switch (type) {
            case EclipseType::NONE: return "None";
            case EclipseType::PENUMBRAL: return "Penumbral";
            case EclipseType::PARTIAL: return "Partial";
            case EclipseType::TOTAL: return "Total";
        }
        return "None";
    }

    bool eclipseFromName(const std::string& name, EclipseType& out) {
        for (EclipseType t : {EclipseType::NONE, EclipseType::PENUMBRAL, EclipseType::PARTIAL, EclipseType::TOTAL}) {
            if (name == eclipseName(t)) { out = t; return true; }
        }
        return false;
    }

    EclipseResult EclipseDetector::classify(double elongation_deg) {
        double offset = std::abs(elongation_deg - 180.0);
        if (offset > OPPOSITION_WINDOW_DEG) return {EclipseType::NONE, 0, offset};

        if (offset < 0.5 * UMBRA_RADIUS_DEG)
            return {EclipseType::TOTAL, static_cast<int>(100.0 * (1.0 - offset / UMBRA_RADIUS_DEG)), offset};
        if (offset < UMBRA_RADIUS_DEG)
            return {EclipseType::PARTIAL, static_cast<int>(100.0 * (1.0 - offset / UMBRA_RADIUS_DEG)), offset};
        if (offset < PENUMBRA_RADIUS_DEG)
            return {EclipseType::PENUMBRAL, static_cast<int>(50.0 * (1.0 - offset / PENUMBRA_RADIUS_DEG)), offset};
        return {EclipseType::NONE, 0, offset};
    }

    std::vector<Instant> NightWindowSampler::sampleTimes(const HorizonResult& horizon, const Instant& day_start) {
        std::vector<Instant> times;
        if (horizon.isDownAllDay()) return times;

        Instant start = day_start;
        Instant end = day_start + std::chrono::hours(24);
        if (horizon.hasCrossings()) {
            if (horizon.rise()) start = *horizon.rise();
            if (horizon.set()) end = *horizon.set();
            // Moon sets on the following calendar day
            if (end < start) end += std::chrono::hours(24);
        }

        Instant hard_stop = start + std::chrono::hours(MAX_SPAN_HOURS);
        Instant t = start;
        while (t <= end && t <= hard_stop && static_cast<int>(times.size()) < MAX_SAMPLES) {
            times.push_back(t);
            t += std::chrono::seconds(SAMPLE_STEP_SECS);
        }
        return times;
    }

    EclipseEvent NightWindowSampler::search(const HorizonResult& horizon, const Instant& day_start) const {
        EclipseEvent best;
        for (const Instant& t : sampleTimes(horizon, day_start)) {
            EclipseResult r = detector_.detect(t);
            // Strictly greater: ties keep the earliest sample
            if (r.type != EclipseType::NONE && r.depth > best.depth) {
                best.type = r.type;
                best.depth = r.depth;
                best.time = t;
            }
        }
        return best;
    }
}
