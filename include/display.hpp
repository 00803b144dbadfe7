#pragma once
#include <ncurses.h>
#include <vector>
#include <string>
#include "report_summary.hpp"

namespace lc {
    // Full-screen view of a ReportSummary. Owns the curses session for its lifetime.
    class Display {
    public:
        enum class InputResult { NONE, QUIT };
        Display(std::string title);
        ~Display();
        Display(const Display&) = delete;
        Display& operator=(const Display&) = delete;

        void update(const ReportSummary& summary);
        InputResult handleInput();

    private:
        void initColors();
        void drawHeader();
        void drawFooter();
        void drawScrollbar(int total_rows, int visible_rows);
        int lineColor(const std::string& line) const;

        std::string title_;
        int scroll_offset_;
    };
}
