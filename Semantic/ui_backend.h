#ifndef _Semantic_ui_backend_h_
#define _Semantic_ui_backend_h_

// Terminal UI layer for the setup wizard (ncurses).
// Include after Semantic.h: ncurses defines function-like macros
// (move, clear, erase, refresh) that collide with standard library names.

#include <ncurses.h>

enum UiColor {
    UI_DONE     = 1,  // completed progress dots
    UI_CURRENT  = 2,  // current progress dot, prompts
    UI_FUTURE   = 3,  // pending dots, hints, separators
    UI_SELECTED = 4,  // highlighted option row
    UI_VALUE    = 5,  // summary values
    UI_PATH     = 6,  // config path on the welcome screen
    UI_ERROR    = 7   // commit error
};

// RAII wrapper around newterm()/endwin().
struct UiSession {
    SCREEN* screen = nullptr;

    UiSession(){
        screen = newterm(nullptr, stdout, stdin);
        if(!screen) return;
        set_term(screen);
        cbreak();
        noecho();
        keypad(stdscr, TRUE);
        set_escdelay(25);
        curs_set(0);
        if(has_colors()){
            start_color();
            use_default_colors();
            init_pair(UI_DONE,     COLOR_GREEN,  -1);
            init_pair(UI_CURRENT,  COLOR_CYAN,   -1);
            init_pair(UI_FUTURE,   COLOR_WHITE,  -1);
            init_pair(UI_SELECTED, COLOR_BLACK,  COLOR_CYAN);
            init_pair(UI_VALUE,    COLOR_CYAN,   -1);
            init_pair(UI_PATH,     COLOR_YELLOW, -1);
            init_pair(UI_ERROR,    COLOR_RED,    -1);
        }
    }

    ~UiSession(){
        if(screen){
            endwin();
            delscreen(screen);
        }
    }

    UiSession(const UiSession&) = delete;
    UiSession& operator=(const UiSession&) = delete;

    bool ok() const { return screen != nullptr; }
};

inline int ui_rows(){
    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    (void)cols;
    return rows;
}

inline int ui_cols(){
    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    (void)rows;
    return cols;
}

inline void ui_print_at(int y, int x, const std::string& text, attr_t attrs = A_NORMAL){
    if(y < 0 || y >= ui_rows()) return;
    if(x < 0) x = 0;
    int room = ui_cols() - x;
    if(room <= 0) return;
    if(attrs != A_NORMAL) attr_on(attrs, nullptr);
    mvaddnstr(y, x, text.c_str(), room);
    if(attrs != A_NORMAL) attr_off(attrs, nullptr);
}

inline void ui_print_centered(int y, const std::string& text, attr_t attrs = A_NORMAL){
    int x = (ui_cols() - static_cast<int>(text.size())) / 2;
    ui_print_at(y, x, text, attrs);
}

inline attr_t ui_color(UiColor c){
    return has_colors() ? static_cast<attr_t>(COLOR_PAIR(c)) : static_cast<attr_t>(A_NORMAL);
}

#endif
