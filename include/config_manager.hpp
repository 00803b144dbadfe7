#pragma once
#include <string>
#include <map>

namespace lc {
    struct AppConfig {
        // Observer (Columbus, OH unless configured)
        double lat = 39.9612;
        double lon = -82.9988;
        double elevation_m = 275.0;

        std::string timezone = "America/New_York";
        int anchor_hour = 23;                 // local clock hour of the daily sample
        double illumination_trigger = 85.0;   // % above which the eclipse search runs
        double supermoon_km = 360000.0;

        std::string strategy = "discrete";    // discrete | bisection
        int threads = 1;                      // 1 = strictly sequential

        std::string output = "lunar_data.csv";
        int report_days = 30;
        std::string log_file = "lunar_log.txt";
    };

    class ConfigManager {
    public:
        ConfigManager(const std::string& filename);
        AppConfig load();
        void save(const AppConfig& config);
        bool hasConfig() const;
    private:
        std::string filename_;
        std::map<std::string, std::string> parse();
    };
}
