#pragma once
#include "ephemeris.hpp"
#include <optional>
#include <vector>

namespace lc {
    enum class HorizonStrategy {
        DISCRETE_EVENT,   // coarse boolean scan + bisection on state changes and hidden arcs
        BISECTION         // 5-minute altitude samples + bisection on sign changes
    };

    // Outcome of one day's horizon search. Exactly one kind holds; rise/set are
    // only ever present for CROSSINGS.
    class HorizonResult {
    public:
        enum class Kind { CROSSINGS, UP_ALL_DAY, DOWN_ALL_DAY };

        static HorizonResult upAllDay() { return HorizonResult(Kind::UP_ALL_DAY, std::nullopt, std::nullopt); }
        static HorizonResult downAllDay() { return HorizonResult(Kind::DOWN_ALL_DAY, std::nullopt, std::nullopt); }
        // At least one of rise/set must be present
        static HorizonResult crossings(std::optional<Instant> rise, std::optional<Instant> set);

        Kind kind() const { return kind_; }
        bool isUpAllDay() const { return kind_ == Kind::UP_ALL_DAY; }
        bool isDownAllDay() const { return kind_ == Kind::DOWN_ALL_DAY; }
        bool hasCrossings() const { return kind_ == Kind::CROSSINGS; }
        const std::optional<Instant>& rise() const { return rise_; }
        const std::optional<Instant>& set() const { return set_; }

    private:
        HorizonResult(Kind kind, std::optional<Instant> rise, std::optional<Instant> set)
            : kind_(kind), rise_(rise), set_(set) {}
        Kind kind_;
        std::optional<Instant> rise_;
        std::optional<Instant> set_;
    };

    class HorizonFinder {
    public:
        struct Crossing { Instant time; bool rising; };

        static constexpr int SAMPLE_STEP_SECS = 300;          // bisection strategy: 288 samples/day
        static constexpr int MAX_BISECTION_ITER = 20;
        static constexpr double BISECTION_TOLERANCE_SECS = 0.01;
        static constexpr int DISCRETE_STEP_SECS = 3600;
        static constexpr double DISCRETE_TOLERANCE_SECS = 0.001;
        static constexpr int MAX_DISCRETE_ITER = 40;
        static constexpr double EXTREMUM_TOLERANCE_SECS = 1.0;
        static constexpr int MAX_EXTREMUM_ITER = 40;

        HorizonFinder(const Ephemeris& eph, const ObserverLocation& obs,
                      HorizonStrategy strategy = HorizonStrategy::DISCRETE_EVENT, Body body = Body::MOON);

        // Searches the UTC day [00:00, 24:00) containing t
        HorizonResult findDay(const Instant& t) const;
        HorizonResult find(const Instant& start, const Instant& end) const;
        // All horizon crossings in [start, end), chronological
        std::vector<Crossing> crossings(const Instant& start, const Instant& end) const;

        HorizonStrategy strategy() const { return strategy_; }

    private:
        const Ephemeris& eph_;
        ObserverLocation observer_;
        HorizonStrategy strategy_;
        Body body_;

        bool isUp(const Instant& t) const;
        double getAltitude(const Instant& t) const;
        std::vector<Crossing> scanBisection(const Instant& start, const Instant& end) const;
        std::vector<Crossing> scanDiscrete(const Instant& start, const Instant& end) const;
        double extremumTime(double lo, double hi, double sign) const;
        Instant refine(double lo, double hi, bool up_at_lo, double tolerance, int max_iter, bool use_altitude) const;
    };
}
