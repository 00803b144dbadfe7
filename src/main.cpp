#include <iostream>
#include <string>
#include <vector>
#include <cstdio>
#include "config_manager.hpp"
#include "logger.hpp"
#include "errors.hpp"
#include "time_utils.hpp"
#include "observer.hpp"
#include "sky_ephemeris.hpp"
#include "phase.hpp"
#include "batch_generator.hpp"
#include "report_table.hpp"
#include "report_summary.hpp"
#include "display.hpp"

using namespace lc;

enum class Mode { PHASE, GENERATE, REPORT };

void print_help() {
    std::cout << "Usage: ./lunar_calendar [MODE] [OPTIONS]\n\n"
              << "Modes:\n"
              << "  --phase [time]     Phase and illumination at a UTC time (default: now)\n"
              << "                     e.g. \"2024-01-15 12:30:00\" or 2024-01-15\n"
              << "  --generate         Generate one row per day and write CSV\n"
              << "  --report <csv>     30-day report from a generated CSV\n\n"
              << "Options:\n"
              << "  --help, -h         Show help\n"
              << "  --config <file>    Configuration file (default config.yaml)\n"
              << "  --start <date>     First local date, YYYY-MM-DD\n"
              << "  --days <N>         Number of days to generate\n"
              << "  --end <date>       Last local date (inclusive), instead of --days\n"
              << "  --out <file>       CSV output path\n"
              << "  --lat <deg>        Override latitude\n"
              << "  --lon <deg>        Override longitude\n"
              << "  --alt <m>          Override elevation (metres)\n"
              << "  --tz <zone>        Civil time zone (e.g. America/New_York)\n"
              << "  --strategy <s>     Horizon search: discrete | bisection\n"
              << "  --threads <N>      Worker threads for generation (1 = sequential)\n"
              << "  --text             Print the report instead of the interactive view\n"
              << "\nConfiguration is loaded from config.yaml by default.\n";
}

static int runPhase(const std::string& when) {
    SkyEphemeris eph;
    Instant t = when.empty() ? Clock::now() : parseInstant(when);
    double elong = eph.elongation(t);
    PhaseInfo info = PhaseClassifier::evaluate(elong);

    char illum[32];
    std::snprintf(illum, sizeof(illum), "%.1f", info.illumination);
    std::cout << std::string(60, '=') << "\n"
              << "Date: " << formatDateTimeUtc(t) << "\n"
              << "Phase: " << phaseName(info.label) << "\n"
              << "Illumination: " << illum << "%\n"
              << std::string(60, '=') << std::endl;
    Logger::info("Phase query " + formatDateTimeUtc(t) + ": " + phaseName(info.label));
    return 0;
}

static int runGenerate(const AppConfig& config, const std::string& start, long days, const std::string& end) {
    if (start.empty()) {
        std::cerr << "--generate needs --start YYYY-MM-DD" << std::endl;
        return 1;
    }
    if (days <= 0 && end.empty()) {
        std::cerr << "--generate needs --days N or --end YYYY-MM-DD" << std::endl;
        return 1;
    }

    ObserverLocation observer(config.lat, config.lon, config.elevation_m);
    BatchOptions options;
    options.timezone = config.timezone;
    options.anchor_hour = config.anchor_hour;
    options.illumination_trigger = config.illumination_trigger;
    options.supermoon_km = config.supermoon_km;
    options.strategy = strategyFromName(config.strategy);
    options.threads = config.threads;

    SkyEphemeris eph;
    BatchGenerator generator(eph, observer, options);

    CivilDate first = parseDate(start);
    long total = end.empty() ? days : daysBetween(first, parseDate(end)) + 1;
    long last_pct = -1;
    auto progress = [&](long done, long n) {
        long pct = (done * 100) / n;
        if (pct != last_pct && pct % 10 == 0) {
            std::cout << "[BATCH] " << done << "/" << n << " days (" << pct << "%)" << std::endl;
            last_pct = pct;
        }
    };

    std::vector<DayRecord> records = end.empty() ? generator.generate(first, total, progress)
                                                 : generator.generateRange(first, parseDate(end), progress);
    ReportTable::writeFile(records, config.output);
    std::cout << "[BATCH] Wrote " << records.size() << " rows to " << config.output << std::endl;
    return 0;
}

static int runReport(const AppConfig& config, const std::string& csv, const std::string& start, bool text_only) {
    std::vector<ReportRow> rows = ReportTable::readFile(csv);
    if (rows.empty()) {
        std::cerr << "ERROR: " << csv << " has no rows" << std::endl;
        return 1;
    }
    CivilDate first = start.empty() ? rows.front().date : parseDate(start);
    ReportSummary summary = summarize(rows, first, config.report_days);

    if (text_only) {
        std::cout << ReportView::renderText(summary);
        return 0;
    }

    Display display(std::to_string(config.report_days) + "-DAY LUNAR REPORT - " + csv);
    while (true) {
        display.update(summary);
        if (display.handleInput() == Display::InputResult::QUIT) break;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    for(int i=1; i<argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_help();
            return 0;
        }
    }

    std::string config_path = "config.yaml";
    for(int i=1; i<argc-1; ++i) {
        if (std::string(argv[i]) == "--config") config_path = argv[i+1];
    }

    try {
        ConfigManager config_mgr(config_path);
        AppConfig config = config_mgr.load();

        Mode mode = Mode::PHASE;
        std::string when, start, end, report_csv;
        long days = 0;
        bool text_only = false;

        auto value = [&](int& i) -> std::string {
            if (i+1 >= argc) throw ConfigError(std::string(argv[i]) + " needs a value");
            return argv[++i];
        };

        for(int i=1; i<argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--phase") {
                mode = Mode::PHASE;
                if (i+1 < argc && std::string(argv[i+1]).rfind("--", 0) != 0) {
                    when = argv[++i];
                    // Unquoted "YYYY-MM-DD HH:MM:SS" arrives as two arguments
                    if (when.size() == 10 && i+1 < argc && std::string(argv[i+1]).find(':') != std::string::npos)
                        when += std::string(" ") + argv[++i];
                }
            }
            else if (arg == "--generate") mode = Mode::GENERATE;
            else if (arg == "--report") { mode = Mode::REPORT; report_csv = value(i); }
            else if (arg == "--config") { ++i; }
            else if (arg == "--start") start = value(i);
            else if (arg == "--end") end = value(i);
            else if (arg == "--days") days = std::stol(value(i));
            else if (arg == "--out") config.output = value(i);
            else if (arg == "--lat") config.lat = std::stod(value(i));
            else if (arg == "--lon") config.lon = std::stod(value(i));
            else if (arg == "--alt") config.elevation_m = std::stod(value(i));
            else if (arg == "--tz") config.timezone = value(i);
            else if (arg == "--strategy") config.strategy = value(i);
            else if (arg == "--threads") config.threads = std::stoi(value(i));
            else if (arg == "--text") text_only = true;
            else {
                std::cerr << "Unknown option: " << arg << "\n\n";
                print_help();
                return 1;
            }
        }

        Logger::init(config.log_file);
        Logger::info("Application Starting...");

        int rc = 0;
        switch (mode) {
            case Mode::PHASE: rc = runPhase(when); break;
            case Mode::GENERATE: rc = runGenerate(config, start, days, end); break;
            case Mode::REPORT: rc = runReport(config, report_csv, start, text_only); break;
        }
        Logger::info("Shutdown Complete");
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "FATAL ERROR: " << e.what() << std::endl;
        Logger::error(e.what());
        return 1;
    }
}
