#include <iostream>
#include <cassert>
#include <cmath>
#include "synthetic_ephemeris.hpp"
#include "../include/horizon_finder.hpp"
#include "../include/time_utils.hpp"

using namespace lc;

static const double DAY0 = toUnixSeconds(parseInstant("2024-03-10"));
static const double PHASE_SHIFT = 1234.5;   // keeps crossings off the sampling grid

static double secondsInto(const Instant& t) { return toUnixSeconds(t) - DAY0; }

// Down at midnight, rises 06:20:34.5, sets 18:20:34.5
static void useDailyArc(SyntheticEphemeris& eph) {
    eph.altitude_fn = [](double t) { return -20.0 * std::cos(2.0 * PI * (t - DAY0 - PHASE_SHIFT) / 86400.0); };
}

void check_mutually_exclusive(const HorizonResult& r) {
    int n = (r.isUpAllDay() ? 1 : 0) + (r.isDownAllDay() ? 1 : 0) + (r.hasCrossings() ? 1 : 0);
    assert(n == 1);
    if (!r.hasCrossings()) assert(!r.rise() && !r.set());
}

void test_rise_and_set(HorizonStrategy strategy, const char* label) {
    SyntheticEphemeris eph;
    useDailyArc(eph);
    HorizonFinder finder(eph, ObserverLocation::columbus(), strategy);
    HorizonResult r = finder.findDay(parseInstant("2024-03-10 15:00:00"));
    check_mutually_exclusive(r);
    assert(r.hasCrossings());
    assert(r.rise() && r.set());

    double rise_err = secondsInto(*r.rise()) - (6 * 3600 + PHASE_SHIFT);
    double set_err = secondsInto(*r.set()) - (18 * 3600 + PHASE_SHIFT);
    std::cout << "Test (" << label << " rise/set): errors " << rise_err << "s, " << set_err << "s" << std::endl;
    assert(std::abs(rise_err) < 0.05);
    assert(std::abs(set_err) < 0.05);
}

void test_up_all_day() {
    SyntheticEphemeris eph;
    eph.altitude_fn = [](double) { return 12.0; };
    for (auto s : {HorizonStrategy::DISCRETE_EVENT, HorizonStrategy::BISECTION}) {
        HorizonFinder finder(eph, ObserverLocation::columbus(), s);
        HorizonResult r = finder.findDay(parseInstant("2024-03-10"));
        check_mutually_exclusive(r);
        assert(r.isUpAllDay());
        assert(!r.isDownAllDay());
        assert(!r.rise() && !r.set());
    }
    std::cout << "Test (Up all day): OK" << std::endl;
}

void test_down_all_day() {
    SyntheticEphemeris eph;
    eph.altitude_fn = [](double) { return -3.0; };
    for (auto s : {HorizonStrategy::DISCRETE_EVENT, HorizonStrategy::BISECTION}) {
        HorizonFinder finder(eph, ObserverLocation::columbus(), s);
        HorizonResult r = finder.findDay(parseInstant("2024-03-10"));
        check_mutually_exclusive(r);
        assert(r.isDownAllDay());
    }
    std::cout << "Test (Down all day): OK" << std::endl;
}

void test_set_without_rise() {
    // Up at midnight, sinks through the horizon at 10:00 and stays down
    SyntheticEphemeris eph;
    eph.altitude_fn = [](double t) { return 10.0 - (t - DAY0) / 3600.0; };
    for (auto s : {HorizonStrategy::DISCRETE_EVENT, HorizonStrategy::BISECTION}) {
        HorizonFinder finder(eph, ObserverLocation::columbus(), s);
        HorizonResult r = finder.findDay(parseInstant("2024-03-10"));
        check_mutually_exclusive(r);
        assert(r.hasCrossings());
        assert(!r.rise());
        assert(r.set());
        assert(std::abs(secondsInto(*r.set()) - 36000.0) < 0.05);
    }
    std::cout << "Test (Set without rise): OK" << std::endl;
}

void test_multiple_crossings_keep_first() {
    // Six-hour period: rises at 01:30, sets 04:30, rises again 07:30, ...
    SyntheticEphemeris eph;
    eph.altitude_fn = [](double t) { return -5.0 * std::cos(2.0 * PI * (t - DAY0 - PHASE_SHIFT) / 21600.0); };
    for (auto s : {HorizonStrategy::DISCRETE_EVENT, HorizonStrategy::BISECTION}) {
        HorizonFinder finder(eph, ObserverLocation::columbus(), s);
        auto all = finder.crossings(parseInstant("2024-03-10"), parseInstant("2024-03-11"));
        assert(all.size() == 8);
        for (size_t i = 1; i < all.size(); ++i) assert(all[i - 1].time < all[i].time);

        HorizonResult r = finder.findDay(parseInstant("2024-03-10"));
        assert(r.hasCrossings());
        assert(std::abs(secondsInto(*r.rise()) - (5400 + PHASE_SHIFT)) < 0.05);
        assert(std::abs(secondsInto(*r.set()) - (16200 + PHASE_SHIFT)) < 0.05);
    }
    std::cout << "Test (Multiple crossings): first rise and first set kept" << std::endl;
}

// Forty-minute arc centred on 12:30, between two hourly grid points
static double shortArc(double t) {
    double x = (t - DAY0 - 45000.0) / 1200.0;
    return 0.5 - 0.5 * x * x;
}

void test_short_arc_between_samples() {
    SyntheticEphemeris eph;
    eph.altitude_fn = shortArc;
    for (auto s : {HorizonStrategy::DISCRETE_EVENT, HorizonStrategy::BISECTION}) {
        HorizonFinder finder(eph, ObserverLocation::columbus(), s);
        HorizonResult r = finder.findDay(parseInstant("2024-03-10"));
        check_mutually_exclusive(r);
        assert(r.hasCrossings());
        assert(r.rise() && r.set());
        assert(std::abs(secondsInto(*r.rise()) - 43800.0) < 0.05);
        assert(std::abs(secondsInto(*r.set()) - 46200.0) < 0.05);
    }

    // Same shape inverted: up all day except a forty-minute dip
    eph.altitude_fn = [](double t) { return -shortArc(t); };
    for (auto s : {HorizonStrategy::DISCRETE_EVENT, HorizonStrategy::BISECTION}) {
        HorizonFinder finder(eph, ObserverLocation::columbus(), s);
        HorizonResult r = finder.findDay(parseInstant("2024-03-10"));
        check_mutually_exclusive(r);
        assert(r.hasCrossings());
        assert(std::abs(secondsInto(*r.set()) - 43800.0) < 0.05);
        assert(std::abs(secondsInto(*r.rise()) - 46200.0) < 0.05);
    }
    std::cout << "Test (Short arc between hourly samples): both strategies find 12:10 and 12:50" << std::endl;
}

void test_arc_too_low_stays_down() {
    // Peaks just below the horizon between grid points: still down all day
    SyntheticEphemeris eph;
    eph.altitude_fn = [](double t) { return shortArc(t) - 0.6; };
    HorizonFinder finder(eph, ObserverLocation::columbus(), HorizonStrategy::DISCRETE_EVENT);
    HorizonResult r = finder.findDay(parseInstant("2024-03-10"));
    check_mutually_exclusive(r);
    assert(r.isDownAllDay());
    std::cout << "Test (Sub-horizon peak): down all day" << std::endl;
}

void test_strategies_agree() {
    SyntheticEphemeris eph;
    useDailyArc(eph);
    HorizonFinder a(eph, ObserverLocation::columbus(), HorizonStrategy::DISCRETE_EVENT);
    HorizonFinder b(eph, ObserverLocation::columbus(), HorizonStrategy::BISECTION);
    HorizonResult ra = a.findDay(parseInstant("2024-03-10"));
    HorizonResult rb = b.findDay(parseInstant("2024-03-10"));
    double d_rise = std::abs(toUnixSeconds(*ra.rise()) - toUnixSeconds(*rb.rise()));
    double d_set = std::abs(toUnixSeconds(*ra.set()) - toUnixSeconds(*rb.set()));
    std::cout << "Test (Strategies agree): " << d_rise << "s, " << d_set << "s" << std::endl;
    assert(d_rise < 1.0 && d_set < 1.0);
}

void test_discrete_is_cheaper() {
    SyntheticEphemeris eph;
    useDailyArc(eph);
    HorizonFinder a(eph, ObserverLocation::columbus(), HorizonStrategy::DISCRETE_EVENT);
    a.findDay(parseInstant("2024-03-10"));
    long discrete_calls = eph.altitude_calls.load();
    eph.altitude_calls = 0;
    HorizonFinder b(eph, ObserverLocation::columbus(), HorizonStrategy::BISECTION);
    b.findDay(parseInstant("2024-03-10"));
    long bisection_calls = eph.altitude_calls.load();
    std::cout << "Test (Cost): discrete " << discrete_calls << " vs bisection " << bisection_calls << " evaluations" << std::endl;
    assert(bisection_calls >= 289);
    assert(discrete_calls < bisection_calls);
}

int main() {
    test_rise_and_set(HorizonStrategy::DISCRETE_EVENT, "Discrete");
    test_rise_and_set(HorizonStrategy::BISECTION, "Bisection");
    test_up_all_day();
    test_down_all_day();
    test_set_without_rise();
    test_multiple_crossings_keep_first();
    test_short_arc_between_samples();
    test_arc_too_low_stays_down();
    test_strategies_agree();
    test_discrete_is_cheaper();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
