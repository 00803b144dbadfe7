#pragma once
#include <atomic>
#include <functional>
#include "../include/ephemeris.hpp"

// Closed-form stand-in for a real ephemeris. Each quantity is a function of
// Unix seconds so tests can place crossings and oppositions exactly.
class SyntheticEphemeris : public lc::Ephemeris {
public:
    using Fn = std::function<double(double)>;

    Fn elongation_fn = [](double) { return 90.0; };
    Fn altitude_fn = [](double) { return 10.0; };
    Fn distance_fn = [](double) { return 384400.0; };
    mutable std::atomic<long> altitude_calls{0};

    double elongation(const lc::Instant& t) const override {
        return elongation_fn(lc::toUnixSeconds(t));
    }

    lc::LookAngle altitudeAzimuthDistance(lc::Body, const lc::ObserverLocation&, const lc::Instant& t) const override {
        altitude_calls++;
        return {altitude_fn(lc::toUnixSeconds(t)), 180.0, distance_fn(lc::toUnixSeconds(t))};
    }

    double geocentricDistance(lc::Body, const lc::Instant& t) const override {
        return distance_fn(lc::toUnixSeconds(t));
    }
};
