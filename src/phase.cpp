#include "phase.hpp"
#include "types.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace lc {
    PhaseLabel PhaseClassifier::classify(double elongation_deg) {
        double e = wrapDegrees(elongation_deg);
        if (e < 22.5 || e >= 337.5) return PhaseLabel::NEW_MOON;
        if (e < 67.5) return PhaseLabel::WAXING_CRESCENT;
        if (e < 112.5) return PhaseLabel::FIRST_QUARTER;
        if (e < 157.5) return PhaseLabel::WAXING_GIBBOUS;
        if (e < 202.5) return PhaseLabel::FULL_MOON;
        if (e < 247.5) return PhaseLabel::WANING_GIBBOUS;
        if (e < 292.5) return PhaseLabel::LAST_QUARTER;
        return PhaseLabel::WANING_CRESCENT;
    }

    double PhaseClassifier::illumination(double elongation_deg) {
        double illum = (1.0 - std::abs(elongation_deg - 180.0) / 180.0) * 100.0;
        if (illum < 0.0) illum = 0.0;
        if (illum > 100.0) illum = 100.0;
        // Ties go to even on the exact binary value, as printf rounds
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%.1f", illum);
        return std::strtod(buf, nullptr);
    }

    const char* phaseName(PhaseLabel label) {
        switch (label) {
            case PhaseLabel::NEW_MOON: return "New Moon";
            case PhaseLabel::WAXING_CRESCENT: return "Waxing Crescent";
            case PhaseLabel::FIRST_QUARTER: return "First Quarter";
            case PhaseLabel::WAXING_GIBBOUS: return "Waxing Gibbous";
            case PhaseLabel::FULL_MOON: return "Full Moon";
            case PhaseLabel::WANING_GIBBOUS: return "Waning Gibbous";
            case PhaseLabel::LAST_QUARTER: return "Last Quarter";
            case PhaseLabel::WANING_CRESCENT: return "Waning Crescent";
        }
        return "Unknown";
    }

    bool phaseFromName(const std::string& name, PhaseLabel& out) {
        for (PhaseLabel p : ALL_PHASES) {
            if (name == phaseName(p)) { out = p; return true; }
        }
        return false;
    }
}
