#include "report_table.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

namespace lc {
    namespace {
        const char* boolText(bool b) { return b ? "True" : "False"; }

        bool parseBool(const std::string& s, size_t line) {
            if (s == "True" || s == "true" || s == "1") return true;
            if (s == "False" || s == "false" || s == "0") return false;
            throw ParseError("line " + std::to_string(line) + ": expected True/False, got '" + s + "'");
        }

        std::vector<std::string> splitCsv(const std::string& line) {
            std::vector<std::string> fields;
            std::string field;
            std::stringstream ss(line);
            while (std::getline(ss, field, ',')) fields.push_back(field);
            if (!line.empty() && line.back() == ',') fields.push_back("");
            return fields;
        }
    }

    std::string ReportTable::riseText(const HorizonResult& horizon) {
        if (horizon.isUpAllDay()) return RISE_ALL_DAY;
        if (horizon.rise()) return formatTimeOfDayUtc(*horizon.rise());
        return NO_RISE;
    }

    std::string ReportTable::setText(const HorizonResult& horizon) {
        if (horizon.isDownAllDay()) return SET_DOWN_ALL_DAY;
        if (horizon.set()) return formatTimeOfDayUtc(*horizon.set());
        return NO_SET;
    }

    ReportRow ReportTable::toRow(const DayRecord& r) {
        return ReportRow{
            r.date,
            phaseName(r.phase),
            r.illumination,
            riseText(r.horizon),
            setText(r.horizon),
            r.horizon.isUpAllDay(),
            r.horizon.isDownAllDay(),
            eclipseName(r.eclipse.type),
            r.eclipse.depth,
            r.eclipse.time ? formatDateTimeUtc(*r.eclipse.time) : std::string(NONE),
            r.supermoon
        };
    }

    void ReportTable::writeRows(const std::vector<ReportRow>& rows, std::ostream& out) {
        out << HEADER << "\n";
        char illum[32];
        for (const auto& r : rows) {
            std::snprintf(illum, sizeof(illum), "%.1f", r.illumination);
            out << formatDate(r.date) << ',' << r.phase << ',' << illum << ','
                << r.rise << ',' << r.set << ','
                << boolText(r.up_all_day) << ',' << boolText(r.down_all_day) << ','
                << r.eclipse_type << ',' << r.eclipse_depth << ',' << r.eclipse_time << ','
                << boolText(r.supermoon) << "\n";
        }
    }

    void ReportTable::write(const std::vector<DayRecord>& records, std::ostream& out) {
        std::vector<ReportRow> rows;
        rows.reserve(records.size());
        for (const auto& r : records) rows.push_back(toRow(r));
        writeRows(rows, out);
    }

    void ReportTable::writeFile(const std::vector<DayRecord>& records, const std::string& path) {
        std::ofstream file(path);
        if (!file.is_open()) throw std::runtime_error("cannot open " + path + " for writing");
        write(records, file);
        file.close();
        if (!file) throw std::runtime_error("failed writing " + path);
        Logger::info("Wrote " + std::to_string(records.size()) + " rows to " + path);
    }

    std::vector<ReportRow> ReportTable::read(std::istream& in) {
        std::vector<ReportRow> rows;
        std::string line;
        size_t line_no = 0;

        if (!std::getline(in, line)) throw ParseError("empty table");
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line != HEADER) throw ParseError("unexpected header '" + line + "'");

        while (std::getline(in, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            auto f = splitCsv(line);
            if (f.size() != 11)
                throw ParseError("line " + std::to_string(line_no) + ": expected 11 columns, got " + std::to_string(f.size()));

            ReportRow r;
            r.date = parseDate(f[0]);
            r.phase = f[1];
            PhaseLabel label;
            if (!phaseFromName(r.phase, label)) throw ParseError("line " + std::to_string(line_no) + ": unknown phase '" + r.phase + "'");
            try {
                r.illumination = std::stod(f[2]);
                r.eclipse_depth = std::stoi(f[8]);
            } catch (const std::exception&) {
                throw ParseError("line " + std::to_string(line_no) + ": bad number");
            }
            r.rise = f[3];
            r.set = f[4];
            r.up_all_day = parseBool(f[5], line_no);
            r.down_all_day = parseBool(f[6], line_no);
            r.eclipse_type = f[7];
            EclipseType type;
            if (!eclipseFromName(r.eclipse_type, type)) throw ParseError("line " + std::to_string(line_no) + ": unknown eclipse type '" + r.eclipse_type + "'");
            r.eclipse_time = f[9];
            r.supermoon = parseBool(f[10], line_no);
            rows.push_back(r);
        }
        return rows;
    }

    std::vector<ReportRow> ReportTable::readFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) throw std::runtime_error("cannot open " + path);
        return read(file);
    }

    bool ReportTable::hourOfDay(const std::string& column, double& hours) {
        int h = 0, m = 0, s = 0;
        if (std::sscanf(column.c_str(), "%d:%d:%d", &h, &m, &s) != 3) return false;
        hours = h + m / 60.0 + s / 3600.0;
        return true;
    }
}
