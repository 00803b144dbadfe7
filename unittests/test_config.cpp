#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>
#include "../include/config_manager.hpp"
#include "../include/observer.hpp"
#include "../include/errors.hpp"

using namespace lc;

static const char* TMP_CONFIG = "test_config_tmp.yaml";

static void writeFile(const std::string& text) {
    std::ofstream f(TMP_CONFIG);
    f << text;
}

void test_missing_file_gives_defaults() {
    std::remove(TMP_CONFIG);
    ConfigManager mgr(TMP_CONFIG);
    assert(!mgr.hasConfig());
    AppConfig cfg = mgr.load();
    assert(std::abs(cfg.lat - 39.9612) < 1e-9);
    assert(cfg.timezone == "America/New_York");
    assert(cfg.anchor_hour == 23 && cfg.threads == 1 && cfg.strategy == "discrete");
    assert(cfg.illumination_trigger == 85.0 && cfg.supermoon_km == 360000.0);
    std::cout << "Test 1 (Defaults): OK" << std::endl;
}

void test_load_values() {
    writeFile("# observer\n"
              "lat: 64.8378\n"
              "lon: -147.7164\r\n"
              "elevation_m: 136\n"
              "timezone: \"America/Anchorage\"\n"
              "strategy: bisection\n"
              "threads: 4\n"
              "anchor_hour: 21\n"
              "output: 'fairbanks.csv'\n"
              "\n");
    AppConfig cfg = ConfigManager(TMP_CONFIG).load();
    assert(std::abs(cfg.lat - 64.8378) < 1e-9);
    assert(std::abs(cfg.lon + 147.7164) < 1e-9);
    assert(cfg.elevation_m == 136.0);
    assert(cfg.timezone == "America/Anchorage");
    assert(cfg.strategy == "bisection");
    assert(cfg.threads == 4 && cfg.anchor_hour == 21);
    assert(cfg.output == "fairbanks.csv");
    assert(cfg.report_days == 30);
    std::cout << "Test 2 (Load): OK" << std::endl;
}

void test_bad_value_keeps_default() {
    writeFile("lat: north\nthreads: many\nlon: 10.5\nalt: 1200\n");
    AppConfig cfg = ConfigManager(TMP_CONFIG).load();
    assert(std::abs(cfg.lat - 39.9612) < 1e-9);
    assert(cfg.threads == 1);
    assert(cfg.lon == 10.5);
    // Legacy key for the observer height
    assert(cfg.elevation_m == 1200.0);
    std::cout << "Test 3 (Malformed values keep defaults): OK" << std::endl;
}

void test_save_round_trip() {
    AppConfig cfg;
    cfg.lat = -33.8688;
    cfg.lon = 151.2093;
    cfg.timezone = "Australia/Sydney";
    cfg.illumination_trigger = 90.0;
    cfg.report_days = 14;
    ConfigManager mgr(TMP_CONFIG);
    mgr.save(cfg);
    AppConfig back = mgr.load();
    assert(std::abs(back.lat - cfg.lat) < 1e-4);
    assert(std::abs(back.lon - cfg.lon) < 1e-4);
    assert(back.timezone == cfg.timezone);
    assert(back.illumination_trigger == 90.0);
    assert(back.report_days == 14);
    assert(back.log_file == cfg.log_file);
    std::remove(TMP_CONFIG);
    std::cout << "Test 4 (Save/load): OK" << std::endl;
}

void test_observer_validation() {
    ObserverLocation o(45.0, -120.0, 500.0);
    assert(o.latitude() == 45.0 && o.longitude() == -120.0 && o.elevationMeters() == 500.0);

    auto rejects = [](double lat, double lon) {
        try {
            ObserverLocation bad(lat, lon, 0.0);
        } catch (const ConfigError&) {
            return true;
        }
        return false;
    };
    assert(rejects(91.0, 0.0));
    assert(rejects(0.0, -181.0));
    assert(rejects(NAN, 0.0));
    assert(!rejects(90.0, 180.0));
    std::cout << "Test 5 (Observer validation): OK" << std::endl;
}

int main() {
    test_missing_file_gives_defaults();
    test_load_values();
    test_bad_value_keeps_default();
    test_save_round_trip();
    test_observer_validation();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
