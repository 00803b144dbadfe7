#pragma once
#include "batch_generator.hpp"
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace lc {
    // One CSV row. Text columns keep the literal sentinels consumers match on.
    struct ReportRow {
        CivilDate date;
        std::string phase;
        double illumination;
        std::string rise;
        std::string set;
        bool up_all_day;
        bool down_all_day;
        std::string eclipse_type;
        int eclipse_depth;
        std::string eclipse_time;
        bool supermoon;
    };

    class ReportTable {
    public:
        static constexpr const char* HEADER =
            "Date,Phase,Illumination_%,Moon_Rise,Moon_Set,Up_All_Day,Down_All_Day,"
            "Eclipse_Type,Eclipse_Depth_%,Eclipse_Time,Supermoon";

        static constexpr const char* RISE_ALL_DAY = "All day";
        static constexpr const char* NO_RISE = "No rise";
        static constexpr const char* SET_DOWN_ALL_DAY = "Down all day";
        static constexpr const char* NO_SET = "No set";
        static constexpr const char* NONE = "None";

        static ReportRow toRow(const DayRecord& record);
        static std::string riseText(const HorizonResult& horizon);
        static std::string setText(const HorizonResult& horizon);

        static void write(const std::vector<DayRecord>& records, std::ostream& out);
        static void writeFile(const std::vector<DayRecord>& records, const std::string& path);
        static void writeRows(const std::vector<ReportRow>& rows, std::ostream& out);

        // Throws ParseError on a bad header or malformed row
        static std::vector<ReportRow> read(std::istream& in);
        static std::vector<ReportRow> readFile(const std::string& path);

        // Rise/set column to fractional UTC hours; false for sentinels
        static bool hourOfDay(const std::string& column, double& hours);
    };
}
