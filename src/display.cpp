#include "display.hpp"
#include <algorithm>
#include <cctype>

namespace lc {
    Display::Display(std::string title) : title_(std::move(title)), scroll_offset_(0) {
        initscr();
        cbreak();
        noecho();
        keypad(stdscr, TRUE);
        timeout(100);
        curs_set(0);
        initColors();
    }
    Display::~Display() { endwin(); }

    void Display::initColors() {
        if (has_colors()) {
            start_color();
            init_pair(1, COLOR_GREEN, COLOR_BLACK);
            init_pair(2, COLOR_YELLOW, COLOR_BLACK);
            init_pair(3, COLOR_CYAN, COLOR_BLACK);
            init_pair(4, COLOR_RED, COLOR_BLACK);
            init_pair(5, COLOR_WHITE, COLOR_BLUE);
            init_pair(6, COLOR_BLACK, COLOR_WHITE);
        }
    }

    Display::InputResult Display::handleInput() {
        int ch = getch();
        if (ch == ERR) return InputResult::NONE;

        if (ch == 'q' || ch == 'Q') return InputResult::QUIT;
        if (ch == KEY_UP) { scroll_offset_--; if (scroll_offset_ < 0) scroll_offset_ = 0; }
        else if (ch == KEY_DOWN) scroll_offset_++;
        else if (ch == KEY_PPAGE) { scroll_offset_ -= 10; if (scroll_offset_ < 0) scroll_offset_ = 0; }
        else if (ch == KEY_NPAGE) scroll_offset_ += 10;

        return InputResult::NONE;
    }

    int Display::lineColor(const std::string& line) const {
        if (line.find("Total") != std::string::npos || line.find("Partial") != std::string::npos) return 4;
        if (line.find("Penumbral") != std::string::npos) return 2;
        if (line.find("Full Moon") != std::string::npos) return 1;
        if (!line.empty() && line[0] != ' ' && std::all_of(line.begin(), line.end(), [](char c) { return !std::islower(static_cast<unsigned char>(c)); }))
            return 3;
        return 0;
    }

    void Display::update(const ReportSummary& summary) {
        std::vector<std::string> lines = ReportView::renderLines(summary);

        drawHeader();

        int start_y = 2;
        int available_lines = LINES - start_y - 1;
        int max_offset = (int)lines.size() - available_lines;
        if (max_offset < 0) max_offset = 0;
        if (scroll_offset_ > max_offset) scroll_offset_ = max_offset;

        for (int i = 0; i < available_lines; ++i) {
            int idx = scroll_offset_ + i;
            if (idx >= (int)lines.size()) {
                move(start_y + i, 0); clrtoeol(); continue;
            }
            int color = lineColor(lines[idx]);
            if (color) attron(COLOR_PAIR(color));
            mvprintw(start_y + i, 1, "%s", lines[idx].substr(0, COLS > 3 ? COLS - 3 : 0).c_str());
            if (color) attroff(COLOR_PAIR(color));
            clrtoeol();
        }
        clrtobot();
        drawScrollbar((int)lines.size(), available_lines);
        drawFooter();
        refresh();
    }

    void Display::drawScrollbar(int total_rows, int visible_rows) {
        if (total_rows <= visible_rows) return;
        int start_y = 2;
        int bar_height = visible_rows;
        float ratio = (float)visible_rows / total_rows;
        int slider_size = (int)(bar_height * ratio);
        if (slider_size < 1) slider_size = 1;
        float pos_ratio = (float)scroll_offset_ / (total_rows - visible_rows);
        int slider_pos = (int)((bar_height - slider_size) * pos_ratio);
        for(int i=0; i<bar_height; ++i) mvaddch(start_y + i, COLS-1, '|');
        attron(COLOR_PAIR(6));
        for(int i=0; i<slider_size; ++i) mvaddch(start_y + slider_pos + i, COLS-1, ' ');
        attroff(COLOR_PAIR(6));
    }

    void Display::drawHeader() {
        attron(COLOR_PAIR(5));
        move(0, 0);
        printw("%s", title_.c_str());
        for(int k=getcurx(stdscr); k<COLS; k++) addch(' ');
        attroff(COLOR_PAIR(5));
    }

    void Display::drawFooter() {
        attron(COLOR_PAIR(5));
        move(LINES-1, 0);
        printw("Controls: [UP/DOWN/PGUP/PGDN] Scroll  [q] Quit");
        clrtoeol();
        attroff(COLOR_PAIR(5));
    }
}
