#pragma once
#include "report_table.hpp"
#include <string>
#include <utility>
#include <vector>

namespace lc {
    struct ReportSummary {
        std::vector<ReportRow> rows;          // the report period
        int full_moons = 0;
        int new_moons = 0;
        int supermoons = 0;
        int eclipses = 0;
        double avg_illumination = 0.0;
        double max_illumination = 0.0;
        double min_illumination = 0.0;
        int up_all_day = 0;
        int down_all_day = 0;
        std::vector<std::pair<std::string, int>> phase_counts;   // descending by count
        std::vector<ReportRow> eclipse_rows;
        std::vector<ReportRow> supermoon_rows;

        bool empty() const { return rows.empty(); }
    };

    // First `days` rows dated on or after start
    ReportSummary summarize(const std::vector<ReportRow>& rows, const CivilDate& start, int days = 30);

    class ReportView {
    public:
        static std::vector<std::string> renderLines(const ReportSummary& s);
        static std::string renderText(const ReportSummary& s);
    };
}
