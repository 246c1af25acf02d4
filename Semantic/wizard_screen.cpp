#include "Semantic.h"
#include "ui_backend.h"

const char* help_text(Step s){
    switch(s){
        case Step::Welcome: return i18n::get(i18n::MsgId::HELP_WELCOME);
        case Step::Summary: return i18n::get(i18n::MsgId::HELP_SUMMARY);
        case Step::Done:    return "";
        default:            return i18n::get(i18n::MsgId::HELP_SELECT);
    }
}

std::string progress_markers(Step s){
    std::string out;
    const size_t current = step_index(s);
    for(size_t i = 0; i < TOTAL_VISIBLE_STEPS; ++i){
        if(i < current) out.push_back('+');
        else if(i == current) out.push_back('@');
        else out.push_back('.');
    }
    return out;
}

int key_code_from_curses(int ch){
    switch(ch){
        case KEY_UP:        return keys::Up;
        case KEY_DOWN:      return keys::Down;
        case KEY_ENTER:     return keys::Enter;
        case KEY_BACKSPACE: return keys::Backspace;
        case KEY_RESIZE:    return keys::None;
        // blocking getch() only fails once the terminal is gone
        case ERR:           return keys::Lost;
        default:            return ch;
    }
}

namespace {

// Reads keys from the ncurses screen.
class CursesIntentSource : public IntentSource {
public:
    Intent next_intent() override {
        KeyEvent ev;
        ev.code = key_code_from_curses(getch());
        if(ev.code == keys::Lost) lost_ = true;
        return decode_key(ev);
    }

    bool lost() const { return lost_; }

private:
    bool lost_ = false;
};

void draw_progress(const WizardSession& session){
    const std::string markers = progress_markers(session.current_step());
    const int width = static_cast<int>(markers.size()) * 3;
    int x = (ui_cols() - width) / 2;
    for(char m : markers){
        attr_t attrs = A_NORMAL;
        const char* dot = " * ";
        if(m == '+') attrs = ui_color(UI_DONE);
        else if(m == '@') attrs = ui_color(UI_CURRENT) | A_BOLD;
        else { attrs = ui_color(UI_FUTURE) | A_DIM; dot = " o "; }
        ui_print_at(1, x, dot, attrs);
        x += 3;
    }
    attr_on(ui_color(UI_FUTURE) | A_DIM, nullptr);
    mvhline(2, 0, ACS_HLINE, ui_cols());
    attr_off(ui_color(UI_FUTURE) | A_DIM, nullptr);
}

void draw_help(const WizardSession& session){
    const int rows = ui_rows();
    attr_on(ui_color(UI_FUTURE) | A_DIM, nullptr);
    mvhline(rows - 3, 0, ACS_HLINE, ui_cols());
    attr_off(ui_color(UI_FUTURE) | A_DIM, nullptr);
    ui_print_centered(rows - 2, help_text(session.current_step()), ui_color(UI_FUTURE) | A_DIM);
}

void draw_welcome(int top, const std::string& config_path){
    ui_print_centered(top + 1, "semantic", ui_color(UI_CURRENT) | A_BOLD | A_UNDERLINE);
    ui_print_centered(top + 3, "Welcome to the semantic setup wizard.");
    ui_print_centered(top + 5, "This will configure how you interact with your system.");
    ui_print_centered(top + 6, "You can change everything later in:");
    ui_print_centered(top + 7, "  " + config_path, ui_color(UI_PATH));
    ui_print_centered(top + 9, "Press Enter to get started.", ui_color(UI_FUTURE) | A_DIM);
}

void draw_selection(int top, int left, const WizardSession& session){
    const Step step = session.current_step();
    ui_print_at(top, left, step_prompt(step), A_BOLD);

    const auto& options = step_options(step);
    const size_t selected = session.cursor(step);
    const int width = ui_cols() - 2 * left;
    for(size_t i = 0; i < options.size(); ++i){
        const int y = top + 3 + static_cast<int>(i);
        const bool is_selected = (i == selected);
        std::string row = std::string(is_selected ? "  > " : "    ") + options[i].value;
        if(is_selected){
            std::string line = row;
            if(options[i].description[0]) line += std::string("  ") + options[i].description;
            if(static_cast<int>(line.size()) < width) line.append(static_cast<size_t>(width) - line.size(), ' ');
            ui_print_at(y, left, line, ui_color(UI_SELECTED) | A_BOLD);
        } else {
            ui_print_at(y, left, row);
            if(options[i].description[0]){
                ui_print_at(y, left + static_cast<int>(row.size()),
                            std::string("  ") + options[i].description, ui_color(UI_FUTURE) | A_DIM);
            }
        }
    }
}

void draw_summary(int top, int left, const WizardSession& session){
    ui_print_at(top, left, step_prompt(Step::Summary), A_BOLD);

    struct Row { const char* label; std::string value; };
    const Row rows[] = {
        {"  Shell:          ", session.selected_shell()},
        {"  Command style:  ", session.selected_command_style()},
        {"  Folder style:   ", session.selected_folder_style()},
        {"  New shell:      ", new_shell_policy_name(session.selected_new_shell())},
    };
    int y = top + 2;
    for(const auto& r : rows){
        ui_print_at(y, left, r.label, ui_color(UI_FUTURE) | A_DIM);
        ui_print_at(y, left + static_cast<int>(std::strlen(r.label)), r.value, ui_color(UI_VALUE));
        ++y;
    }
    ui_print_at(y + 1, left, "Press Enter to save, or Backspace to go back.", ui_color(UI_FUTURE) | A_DIM);

    if(const auto& err = session.last_commit_error()){
        ui_print_at(y + 3, left, *err, ui_color(UI_ERROR) | A_BOLD);
    }
}

void draw(const WizardSession& session, const std::string& config_path){
    erase();
    draw_progress(session);

    // content area between the progress bar and the help bar, vertically centered
    const Step step = session.current_step();
    const int area_top = 3;
    const int area_height = ui_rows() - 6;
    const int content_height = (step == Step::Welcome || step == Step::Summary) ? 10 : 8;
    const int top = area_top + std::max(0, (area_height - content_height) / 2);
    const int left = std::max(1, ui_cols() * 5 / 100);

    switch(step){
        case Step::Welcome: draw_welcome(top, config_path); break;
        case Step::Summary: draw_summary(top, left, session); break;
        case Step::Done: break;
        default: draw_selection(top, left, session); break;
    }

    draw_help(session);
    refresh();
}

} // namespace

int run_wizard(const ConfigPaths& paths){
    TRACE_FN("config=", paths.config_file.string());
    if(!terminal_available()){
        std::cerr << i18n::get(i18n::MsgId::TERMINAL_UNAVAILABLE) << "\n";
        return 1;
    }

    ConfigStore store(paths);
    WizardSession session(store);
    const std::string config_path = paths.config_file.string();
    bool terminal_lost = false;
    {
        UiSession ui;
        if(!ui.ok()){
            std::cerr << i18n::get(i18n::MsgId::TERMINAL_UNAVAILABLE) << "\n";
            return 1;
        }
        CursesIntentSource source;
        drive_wizard(session, source, [&config_path](const WizardSession& s){
            draw(s, config_path);
        });
        terminal_lost = source.lost();
    }

    if(terminal_lost){
        std::cerr << i18n::get(i18n::MsgId::TERMINAL_LOST) << "\n";
        return 1;
    }

    if(session.current_step() == Step::Done){
        std::cout << i18n::get(i18n::MsgId::CONFIG_WRITTEN) << config_path << "\n";
        std::cout << i18n::get(i18n::MsgId::RUN_INIT_HINT) << "\n";
    }
    return 0;
}
