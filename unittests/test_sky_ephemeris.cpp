#include <iostream>
#include <cassert>
#include <cmath>
#include "../include/sky_ephemeris.hpp"
#include "../include/phase.hpp"
#include "../include/eclipse.hpp"
#include "../include/horizon_finder.hpp"
#include "../include/batch_generator.hpp"
#include "../include/time_utils.hpp"

using namespace lc;

static const SkyEphemeris SKY{};

void test_known_phases() {
    struct Case { const char* when; PhaseLabel expected; };
    // Published instants of the principal phases, UTC
    const Case cases[] = {
        {"2024-01-11 11:57:00", PhaseLabel::NEW_MOON},
        {"2024-01-18 03:53:00", PhaseLabel::FIRST_QUARTER},
        {"2024-01-25 17:54:00", PhaseLabel::FULL_MOON},
        {"2024-02-02 23:18:00", PhaseLabel::LAST_QUARTER},
    };
    for (const auto& c : cases) {
        double e = SKY.elongation(parseInstant(c.when));
        PhaseInfo p = PhaseClassifier::evaluate(e);
        std::cout << "Test 1 (" << c.when << "): elongation " << e << " -> " << phaseName(p.label) << std::endl;
        assert(e >= 0.0 && e < 360.0);
        assert(p.label == c.expected);
    }

    double full = SKY.elongation(parseInstant("2024-01-25 17:54:00"));
    assert(std::abs(full - 180.0) < 1.0);
    assert(PhaseClassifier::illumination(full) > 99.0);
    double quarter = SKY.elongation(parseInstant("2024-01-18 03:53:00"));
    assert(std::abs(quarter - 90.0) < 1.0);
}

void test_waxing_increases_elongation() {
    Instant t = parseInstant("2024-01-12");
    double prev = SKY.elongation(t);
    for (int i = 1; i <= 12; ++i) {
        double cur = SKY.elongation(t + std::chrono::hours(24 * i));
        assert(cur > prev);
        prev = cur;
    }
    std::cout << "Test 2 (Elongation grows through a waxing fortnight): OK" << std::endl;
}

void test_total_eclipse_2022() {
    EclipseDetector detector(SKY);
    EclipseResult r = detector.detect(parseInstant("2022-11-08 10:59:00"));
    std::cout << "Test 3 (2022-11-08 10:59 UTC): " << eclipseName(r.type) << " depth " << r.depth
              << " offset " << r.offset_deg << std::endl;
    assert(r.type == EclipseType::TOTAL);

    // Three days later the Moon is well clear of the shadow
    assert(detector.detect(parseInstant("2022-11-11 10:59:00")).type == EclipseType::NONE);
}

void test_distances() {
    Instant t = parseInstant("2024-01-01");
    double lo = 1e9, hi = 0.0;
    for (int h = 0; h < 31 * 24; h += 6) {
        double d = SKY.geocentricDistance(Body::MOON, t + std::chrono::hours(h));
        lo = std::min(lo, d);
        hi = std::max(hi, d);
    }
    std::cout << "Test 4 (Moon distance, Jan 2024): " << lo << " - " << hi << " km" << std::endl;
    assert(lo > 356000.0 && hi < 407000.0);
    assert(hi - lo > 30000.0);

    double sun = SKY.geocentricDistance(Body::SUN, t);
    assert(sun > 1.47e8 && sun < 1.48e8);
}

void test_columbus_horizon() {
    ObserverLocation columbus = ObserverLocation::columbus();
    HorizonFinder discrete(SKY, columbus, HorizonStrategy::DISCRETE_EVENT);
    HorizonFinder bisection(SKY, columbus, HorizonStrategy::BISECTION);

    for (int d = 0; d < 7; ++d) {
        Instant day = parseInstant("2024-01-22") + std::chrono::hours(24 * d);
        HorizonResult a = discrete.findDay(day);
        HorizonResult b = bisection.findDay(day);
        assert(a.hasCrossings() && b.hasCrossings());
        assert(a.rise().has_value() == b.rise().has_value());
        assert(a.set().has_value() == b.set().has_value());

        for (const auto* ev : {&a.rise(), &a.set()}) {
            if (!*ev) continue;
            assert(utcDayStart(**ev) == day);
            double alt = SKY.altitudeAzimuthDistance(Body::MOON, columbus, **ev).altitude_deg;
            assert(std::abs(alt) < 0.01);
        }
        if (a.rise()) assert(std::abs(toUnixSeconds(*a.rise()) - toUnixSeconds(*b.rise())) < 1.0);
        if (a.set()) assert(std::abs(toUnixSeconds(*a.set()) - toUnixSeconds(*b.set())) < 1.0);
    }
    std::cout << "Test 5 (Columbus rise/set, strategies agree): OK" << std::endl;
}

void test_batch_finds_2022_eclipse() {
    BatchOptions opt;
    opt.timezone = "America/New_York";
    BatchGenerator gen(SKY, ObserverLocation::columbus(), opt);
    auto records = gen.generateRange({2022, 11, 4}, {2022, 11, 12});

    int found = 0;
    for (const auto& r : records) {
        if (!r.eclipse.found()) continue;
        found++;
        std::cout << "Test 6 (Batch eclipse): " << formatDate(r.date) << " " << eclipseName(r.eclipse.type)
                  << " " << r.eclipse.depth << "% at " << formatDateTimeUtc(*r.eclipse.time) << std::endl;
        assert(r.date == (CivilDate{2022, 11, 8}));
        assert(*r.eclipse.time >= parseInstant("2022-11-08 09:00:00"));
        assert(*r.eclipse.time <= parseInstant("2022-11-08 13:00:00"));
    }
    assert(found == 1);
}

int main() {
    test_known_phases();
    test_waxing_increases_elongation();
    test_total_eclipse_2022();
    test_distances();
    test_columbus_horizon();
    test_batch_finds_2022_eclipse();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
