#include "report_summary.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>

namespace lc {
    namespace {
        constexpr int RISE_SET_AXIS_COLS = 49;

        int axisColumn(double hours) {
            int col = static_cast<int>(std::lround(hours * 2.0));
            return std::max(0, std::min(RISE_SET_AXIS_COLS - 1, col));
        }
    }

    ReportSummary summarize(const std::vector<ReportRow>& rows, const CivilDate& start, int days) {
        ReportSummary s;
        for (const auto& r : rows) {
            if (static_cast<int>(s.rows.size()) >= days) break;
            if (r.date < start) continue;
            s.rows.push_back(r);
        }
        if (s.rows.empty()) return s;

        std::map<std::string, int> counts;
        double total = 0.0;
        s.max_illumination = s.rows.front().illumination;
        s.min_illumination = s.rows.front().illumination;

        for (const auto& r : s.rows) {
            if (r.phase == "Full Moon") s.full_moons++;
            if (r.phase == "New Moon") s.new_moons++;
            if (r.supermoon) { s.supermoons++; s.supermoon_rows.push_back(r); }
            if (r.eclipse_type != ReportTable::NONE) { s.eclipses++; s.eclipse_rows.push_back(r); }
            if (r.up_all_day) s.up_all_day++;
            if (r.down_all_day) s.down_all_day++;
            total += r.illumination;
            s.max_illumination = std::max(s.max_illumination, r.illumination);
            s.min_illumination = std::min(s.min_illumination, r.illumination);
            counts[r.phase]++;
        }
        s.avg_illumination = total / s.rows.size();

        s.phase_counts.assign(counts.begin(), counts.end());
        std::stable_sort(s.phase_counts.begin(), s.phase_counts.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        return s;
    }

    std::vector<std::string> ReportView::renderLines(const ReportSummary& s) {
        std::vector<std::string> lines;
        char buf[256];

        if (s.empty()) {
            lines.push_back("NO DATA IN SELECTED PERIOD.");
            return lines;
        }

        std::snprintf(buf, sizeof(buf), "PERIOD: %s - %s (%zu days)",
                      formatDate(s.rows.front().date).c_str(), formatDate(s.rows.back().date).c_str(), s.rows.size());
        lines.push_back(buf);
        std::snprintf(buf, sizeof(buf), "FULL MOONS: %d  |  NEW MOONS: %d  |  SUPERMOONS: %d  |  LUNAR ECLIPSES: %d",
                      s.full_moons, s.new_moons, s.supermoons, s.eclipses);
        lines.push_back(buf);
        lines.push_back("");

        lines.push_back("ECLIPSES");
        if (s.eclipse_rows.empty()) lines.push_back("  No lunar eclipses during this period.");
        for (const auto& r : s.eclipse_rows) {
            std::snprintf(buf, sizeof(buf), "  %s  %-9s depth %3d%%  %s", formatDate(r.date).c_str(),
                          r.eclipse_type.c_str(), r.eclipse_depth, r.eclipse_time.c_str());
            lines.push_back(buf);
        }
        lines.push_back("SUPERMOONS");
        if (s.supermoon_rows.empty()) lines.push_back("  No supermoons during this period.");
        for (const auto& r : s.supermoon_rows) {
            std::snprintf(buf, sizeof(buf), "  %s  illumination %.1f%%", formatDate(r.date).c_str(), r.illumination);
            lines.push_back(buf);
        }
        lines.push_back("");

        const char* fmt = "%-10s  %-16s %7s  %-13s %-13s";
        std::snprintf(buf, sizeof(buf), fmt, "DATE", "PHASE", "ILLUM", "RISE", "SET");
        lines.push_back(buf);
        lines.push_back("----------------------------------------------------------------");
        for (const auto& r : s.rows) {
            char illum[16];
            std::snprintf(illum, sizeof(illum), "%.1f%%", r.illumination);
            std::snprintf(buf, sizeof(buf), fmt, formatDate(r.date).c_str(), r.phase.c_str(), illum,
                          r.rise.c_str(), r.set.c_str());
            lines.push_back(buf);
        }
        lines.push_back("");

        // Rise (R) and set (S) marks on a 0-24 h UTC axis, two columns per hour
        lines.push_back("RISE & SET TIMES (UTC)");
        std::string axis(RISE_SET_AXIS_COLS + 2, ' ');
        for (int hr = 0; hr <= 24; hr += 3) {
            std::string label = std::to_string(hr);
            axis.replace(hr * 2, label.size(), label);
        }
        lines.push_back(std::string(14, ' ') + axis);
        for (const auto& r : s.rows) {
            std::string track(RISE_SET_AXIS_COLS, '.');
            double rise_h = 0.0, set_h = 0.0;
            bool has_rise = ReportTable::hourOfDay(r.rise, rise_h);
            bool has_set = ReportTable::hourOfDay(r.set, set_h);
            if (has_rise) track[axisColumn(rise_h)] = 'R';
            if (has_set) track[axisColumn(set_h)] = (has_rise && axisColumn(rise_h) == axisColumn(set_h)) ? '*' : 'S';

            std::string line = "  " + formatDate(r.date) + "  " + track;
            std::string note;
            if (!has_rise) note = r.rise;
            if (!has_set) note += (note.empty() ? "" : ", ") + r.set;
            if (!note.empty()) line += "  " + note;
            lines.push_back(line);
        }
        lines.push_back("");

        std::snprintf(buf, sizeof(buf), "ILLUMINATION  avg %.1f%%  max %.1f%%  min %.1f%%",
                      s.avg_illumination, s.max_illumination, s.min_illumination);
        lines.push_back(buf);
        std::snprintf(buf, sizeof(buf), "UP ALL DAY: %d days  |  DOWN ALL DAY: %d days", s.up_all_day, s.down_all_day);
        lines.push_back(buf);
        lines.push_back("DAYS PER PHASE");
        for (const auto& pc : s.phase_counts) {
            std::snprintf(buf, sizeof(buf), "  %-16s %3d", pc.first.c_str(), pc.second);
            lines.push_back(buf);
        }
        return lines;
    }

    std::string ReportView::renderText(const ReportSummary& s) {
        std::string out;
        for (const auto& l : renderLines(s)) out += l + "\n";
        return out;
    }
}
