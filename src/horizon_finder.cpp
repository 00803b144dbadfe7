#include "horizon_finder.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace lc {
    HorizonResult HorizonResult::crossings(std::optional<Instant> rise, std::optional<Instant> set) {
        if (!rise && !set) throw std::invalid_argument("HorizonResult::crossings needs a rise or a set");
        return HorizonResult(Kind::CROSSINGS, rise, set);
    }

    HorizonFinder::HorizonFinder(const Ephemeris& eph, const ObserverLocation& obs, HorizonStrategy strategy, Body body)
        : eph_(eph), observer_(obs), strategy_(strategy), body_(body) {}

    bool HorizonFinder::isUp(const Instant& t) const {
        return eph_.aboveHorizon(body_, observer_, t);
    }

    double HorizonFinder::getAltitude(const Instant& t) const {
        return eph_.altitudeAzimuthDistance(body_, observer_, t).altitude_deg;
    }

    // Bracket [lo, hi] holds exactly one state change; halve until it is narrower than
    // tolerance or the iteration budget runs out, then take the midpoint.
    Instant HorizonFinder::refine(double lo, double hi, bool up_at_lo, double tolerance, int max_iter, bool use_altitude) const {
        for (int i = 0; i < max_iter && (hi - lo) > tolerance; ++i) {
            double mid = 0.5 * (lo + hi);
            Instant tm = fromUnixSeconds(mid);
            bool up = use_altitude ? (getAltitude(tm) >= 0.0) : isUp(tm);
            if (up == up_at_lo) lo = mid;
            else hi = mid;
        }
        return fromUnixSeconds(0.5 * (lo + hi));
    }

    std::vector<HorizonFinder::Crossing> HorizonFinder::scanBisection(const Instant& start, const Instant& end) const {
        std::vector<Crossing> results;
        double t0 = toUnixSeconds(start);
        double t1 = toUnixSeconds(end);
        double prev_t = t0;
        double prev_el = getAltitude(start);

        while (prev_t < t1) {
            double next_t = std::min(prev_t + SAMPLE_STEP_SECS, t1);
            double next_el = getAltitude(fromUnixSeconds(next_t));
            bool prev_up = prev_el >= 0.0;
            bool next_up = next_el >= 0.0;
            if (prev_up != next_up) {
                Instant crossing = refine(prev_t, next_t, prev_up, BISECTION_TOLERANCE_SECS, MAX_BISECTION_ITER, true);
                if (crossing < end) results.push_back({crossing, next_up});
            }
            prev_t = next_t;
            prev_el = next_el;
        }
        return results;
    }

    // Golden-section search for the extremum of altitude in [lo, hi]; sign +1 finds a
    // maximum, -1 a minimum. Assumes a single extremum inside the bracket.
    double HorizonFinder::extremumTime(double lo, double hi, double sign) const {
        const double inv_phi = 0.6180339887498949;
        double a = lo, b = hi;
        double c = b - inv_phi * (b - a);
        double d = a + inv_phi * (b - a);
        double fc = sign * getAltitude(fromUnixSeconds(c));
        double fd = sign * getAltitude(fromUnixSeconds(d));
        for (int i = 0; i < MAX_EXTREMUM_ITER && (b - a) > EXTREMUM_TOLERANCE_SECS; ++i) {
            if (fc > fd) {
                b = d; d = c; fd = fc;
                c = b - inv_phi * (b - a);
                fc = sign * getAltitude(fromUnixSeconds(c));
            } else {
                a = c; c = d; fc = fd;
                d = a + inv_phi * (b - a);
                fd = sign * getAltitude(fromUnixSeconds(d));
            }
        }
        return 0.5 * (a + b);
    }

    std::vector<HorizonFinder::Crossing> HorizonFinder::scanDiscrete(const Instant& start, const Instant& end) const {
        std::vector<Crossing> results;
        double t0 = toUnixSeconds(start);
        double t1 = toUnixSeconds(end);

        // Grid with one padding sample on each side so extrema near the edges are bracketed
        std::vector<double> times;
        times.push_back(t0 - DISCRETE_STEP_SECS);
        for (double t = t0; t < t1; t += DISCRETE_STEP_SECS) times.push_back(t);
        times.push_back(t1);
        times.push_back(t1 + DISCRETE_STEP_SECS);

        std::vector<bool> up(times.size());
        std::vector<double> alt(times.size());
        for (size_t i = 0; i < times.size(); ++i) {
            Instant ti = fromUnixSeconds(times[i]);
            up[i] = isUp(ti);
            alt[i] = getAltitude(ti);
        }

        // State changes between consecutive in-range samples
        for (size_t i = 2; i + 1 < times.size(); ++i) {
            if (up[i - 1] != up[i]) {
                Instant crossing = refine(times[i - 1], times[i], up[i - 1], DISCRETE_TOLERANCE_SECS, MAX_DISCRETE_ITER, false);
                if (crossing < end) results.push_back({crossing, up[i]});
            }
        }

        // An arc shorter than the step leaves no state change on the grid; it shows up as
        // a local altitude maximum among down samples (or minimum among up samples).
        for (size_t k = 1; k + 1 < times.size(); ++k) {
            if (up[k - 1] != up[k] || up[k] != up[k + 1]) continue;
            bool state = up[k];
            double sign = state ? -1.0 : 1.0;
            if (!(sign * alt[k] > sign * alt[k - 1] && sign * alt[k] >= sign * alt[k + 1])) continue;

            double lo = std::max(times[k - 1], t0);
            double hi = std::min(times[k + 1], t1);
            if (hi <= lo) continue;
            double peak = extremumTime(lo, hi, sign);
            if (isUp(fromUnixSeconds(peak)) == state) continue;

            Instant first = refine(lo, peak, state, DISCRETE_TOLERANCE_SECS, MAX_DISCRETE_ITER, false);
            Instant second = refine(peak, hi, !state, DISCRETE_TOLERANCE_SECS, MAX_DISCRETE_ITER, false);
            if (first < end) results.push_back({first, !state});
            if (second < end) results.push_back({second, state});
        }

        std::sort(results.begin(), results.end(), [](const Crossing& a, const Crossing& b) { return a.time < b.time; });
        return results;
    }

    std::vector<HorizonFinder::Crossing> HorizonFinder::crossings(const Instant& start, const Instant& end) const {
        if (strategy_ == HorizonStrategy::BISECTION) return scanBisection(start, end);
        return scanDiscrete(start, end);
    }

    HorizonResult HorizonFinder::find(const Instant& start, const Instant& end) const {
        auto events = crossings(start, end);
        if (events.empty()) {
            bool up_at_start = (strategy_ == HorizonStrategy::BISECTION) ? (getAltitude(start) >= 0.0) : isUp(start);
            return up_at_start ? HorizonResult::upAllDay() : HorizonResult::downAllDay();
        }

        std::optional<Instant> rise, set;
        for (const auto& e : events) {
            if (e.rising && !rise) rise = e.time;
            if (!e.rising && !set) set = e.time;
        }
        return HorizonResult::crossings(rise, set);
    }

    HorizonResult HorizonFinder::findDay(const Instant& t) const {
        Instant day_start = utcDayStart(t);
        return find(day_start, day_start + std::chrono::hours(24));
    }
}
