#include "config_manager.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>
#include <algorithm>
#include <functional>
#include <iomanip>

namespace lc {
    ConfigManager::ConfigManager(const std::string& filename) : filename_(filename) {}
    bool ConfigManager::hasConfig() const { return std::filesystem::exists(filename_); }

    static std::string clean(const std::string& str) {
        std::string s = str;
        s.erase(std::remove(s.begin(), s.end(), '\r'), s.end());
        s.erase(std::remove(s.begin(), s.end(), '\n'), s.end());

        size_t first = s.find_first_not_of(" \t");
        if (std::string::npos == first) return "";
        size_t last = s.find_last_not_of(" \t");
        s = s.substr(first, (last - first + 1));

        if (s.size() >= 2) {
            if ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')) {
                s = s.substr(1, s.size() - 2);
            }
        }
        return s;
    }

    std::map<std::string, std::string> ConfigManager::parse() {
        std::map<std::string, std::string> data;
        std::ifstream file(filename_);
        std::string line;
        while(std::getline(file, line)) {
            std::string trimmed = clean(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;
            size_t delim = line.find(':');
            if (delim != std::string::npos) {
                std::string key = clean(line.substr(0, delim));
                std::string val = clean(line.substr(delim + 1));
                data[key] = val;
            }
        }
        return data;
    }

    AppConfig ConfigManager::load() {
        AppConfig cfg;
        if (!hasConfig()) return cfg;
        auto data = parse();

        // A malformed value keeps the default and is reported; the rest of the file still loads
        auto number = [&](const char* key, const std::function<void(const std::string&)>& assign) {
            auto it = data.find(key);
            if (it == data.end()) return;
            try {
                assign(it->second);
            } catch (const std::exception& e) {
                std::cerr << "[CONFIG] Bad value for " << key << ": '" << it->second << "'" << std::endl;
                Logger::warn(std::string("Config: bad value for ") + key + " (" + e.what() + ")");
            }
        };

        number("lat", [&](const std::string& v) { cfg.lat = std::stod(v); });
        number("lon", [&](const std::string& v) { cfg.lon = std::stod(v); });
        number("elevation_m", [&](const std::string& v) { cfg.elevation_m = std::stod(v); });
        number("anchor_hour", [&](const std::string& v) { cfg.anchor_hour = std::stoi(v); });
        number("illumination_trigger", [&](const std::string& v) { cfg.illumination_trigger = std::stod(v); });
        number("supermoon_km", [&](const std::string& v) { cfg.supermoon_km = std::stod(v); });
        number("threads", [&](const std::string& v) { cfg.threads = std::stoi(v); });
        number("report_days", [&](const std::string& v) { cfg.report_days = std::stoi(v); });

        if (data.count("timezone")) {
            cfg.timezone = data["timezone"];
            std::cout << "[CONFIG] Time zone: [" << cfg.timezone << "]" << std::endl;
        }
        if (data.count("strategy")) cfg.strategy = data["strategy"];
        if (data.count("output")) cfg.output = data["output"];
        if (data.count("log_file")) cfg.log_file = data["log_file"];

        // Older files used "alt" (metres) for the observer height
        if (!data.count("elevation_m")) number("alt", [&](const std::string& v) { cfg.elevation_m = std::stod(v); });

        return cfg;
    }

    void ConfigManager::save(const AppConfig& config) {
        std::ofstream file(filename_);
        file << std::setprecision(10);
        file << "lat: " << config.lat << "\n";
        file << "lon: " << config.lon << "\n";
        file << "elevation_m: " << config.elevation_m << "\n";
        file << "timezone: " << config.timezone << "\n";
        file << "anchor_hour: " << config.anchor_hour << "\n";
        file << "illumination_trigger: " << config.illumination_trigger << "\n";
        file << "supermoon_km: " << config.supermoon_km << "\n";
        file << "strategy: " << config.strategy << "\n";
        file << "threads: " << config.threads << "\n";
        file << "output: " << config.output << "\n";
        file << "report_days: " << config.report_days << "\n";
        file << "log_file: " << config.log_file << "\n";
        file.close();
    }
}
