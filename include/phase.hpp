#pragma once
#include <string>
#include <array>

namespace lc {
    enum class PhaseLabel {
        NEW_MOON,
        WAXING_CRESCENT,
        FIRST_QUARTER,
        WAXING_GIBBOUS,
        FULL_MOON,
        WANING_GIBBOUS,
        LAST_QUARTER,
        WANING_CRESCENT
    };

    struct PhaseInfo {
        PhaseLabel label;
        double illumination;   // percent, one decimal
    };

    class PhaseClassifier {
    public:
        // Eight 45 deg bands centred on the named phases; New Moon wraps through 0/360.
        static PhaseLabel classify(double elongation_deg);
        // (1 - |e - 180| / 180) * 100, rounded to 1 decimal (half to even)
        static double illumination(double elongation_deg);
        static PhaseInfo evaluate(double elongation_deg) { return {classify(elongation_deg), illumination(elongation_deg)}; }
    };

    const char* phaseName(PhaseLabel label);
    // Inverse of phaseName; false if the text is not a phase name
    bool phaseFromName(const std::string& name, PhaseLabel& out);

    constexpr std::array<PhaseLabel, 8> ALL_PHASES = {
        PhaseLabel::NEW_MOON, PhaseLabel::WAXING_CRESCENT, PhaseLabel::FIRST_QUARTER, PhaseLabel::WAXING_GIBBOUS,
        PhaseLabel::FULL_MOON, PhaseLabel::WANING_GIBBOUS, PhaseLabel::LAST_QUARTER, PhaseLabel::WANING_CRESCENT
    };
}
