#include "Semantic.h"

Step next_step(Step s){
    switch(s){
        case Step::Welcome:          return Step::Shell;
        case Step::Shell:            return Step::CommandStyle;
        case Step::CommandStyle:     return Step::FolderStyle;
        case Step::FolderStyle:      return Step::NewShellBehavior;
        case Step::NewShellBehavior: return Step::Summary;
        case Step::Summary:          return Step::Done;
        case Step::Done:             return Step::Done;
    }
    return s;
}

Step prev_step(Step s){
    switch(s){
        case Step::Welcome:          return Step::Welcome;
        case Step::Shell:            return Step::Welcome;
        case Step::CommandStyle:     return Step::Shell;
        case Step::FolderStyle:      return Step::CommandStyle;
        case Step::NewShellBehavior: return Step::FolderStyle;
        case Step::Summary:          return Step::NewShellBehavior;
        case Step::Done:             return Step::Done;
    }
    return s;
}

size_t step_index(Step s){
    return static_cast<size_t>(s);
}

const char* step_name(Step s){
    switch(s){
        case Step::Welcome:          return "Welcome";
        case Step::Shell:            return "Shell";
        case Step::CommandStyle:     return "CommandStyle";
        case Step::FolderStyle:      return "FolderStyle";
        case Step::NewShellBehavior: return "NewShellBehavior";
        case Step::Summary:          return "Summary";
        case Step::Done:             return "Done";
    }
    return "?";
}

//
// Option tables, indexed by step
//
namespace {

const std::vector<WizardOption>& options_table(size_t idx){
    static const std::array<std::vector<WizardOption>, STEP_COUNT> table = {{
        {},  // Welcome
        {    // Shell
            {"fish", ""},
            {"bash", ""},
            {"zsh",  ""},
        },
        {    // CommandStyle
            {"natural",     "goto, list, install, delete"},
            {"traditional", "cd, ls, pacman, rm"},
            {"verbose",     "go-to, list-files, install-package"},
        },
        {    // FolderStyle
            {"natural",     "/apps, /settings, /logs"},
            {"traditional", "/usr/bin, /etc, /var/log"},
            {"verbose",     "/user/applications, /configuration"},
        },
        {    // NewShellBehavior
            {"auto-setup", "Automatically configure new shells"},
            {"notify",     "Notify when a new shell is detected"},
            {"ignore",     "Do nothing"},
        },
        {},  // Summary
        {},  // Done
    }};
    return table[idx];
}

} // namespace

const std::vector<WizardOption>& step_options(Step s){
    return options_table(step_index(s));
}

bool step_has_options(Step s){
    return !step_options(s).empty();
}

const char* step_prompt(Step s){
    switch(s){
        case Step::Shell:            return "Which shell do you use?";
        case Step::CommandStyle:     return "Pick a command style:";
        case Step::FolderStyle:      return "Pick a folder style:";
        case Step::NewShellBehavior: return "When a new shell is installed:";
        case Step::Summary:          return "Review your choices:";
        default:                     return "";
    }
}

//
// WizardSession
//
WizardSession::WizardSession(ConfigWriter& writer) : writer_(writer) {}

size_t WizardSession::cursor(Step s) const {
    return cursors_[step_index(s)];
}

void WizardSession::move_cursor_up(){
    const size_t n = step_options(step_).size();
    if(n == 0) return;
    size_t& i = cursors_[step_index(step_)];
    i = (i + n - 1) % n;
}

void WizardSession::move_cursor_down(){
    const size_t n = step_options(step_).size();
    if(n == 0) return;
    size_t& i = cursors_[step_index(step_)];
    i = (i + 1) % n;
}

void WizardSession::advance(){
    TRACE_FN("step=", step_name(step_));
    if(step_ == Step::Done) return;
    if(step_ == Step::Summary){
        commit();
        return;
    }
    step_ = next_step(step_);
}

void WizardSession::go_back(){
    TRACE_FN("step=", step_name(step_));
    last_commit_error_.reset();
    step_ = prev_step(step_);
}

void WizardSession::quit(){
    quit_requested_ = true;
}

std::string WizardSession::selected_value(Step s) const {
    const auto& opts = step_options(s);
    if(opts.empty()) return {};
    size_t i = cursors_[step_index(s)];
    return opts[i < opts.size() ? i : 0].value;
}

NewShellPolicy WizardSession::selected_new_shell() const {
    // option values are exactly the policy names
    return parse_new_shell_policy(selected_value(Step::NewShellBehavior))
        .value_or(NewShellPolicy::AutoSetup);
}

MappingStore WizardSession::build_store() const {
    return MappingStore::from_selections(selected_shell(),
                                         selected_command_style(),
                                         selected_folder_style(),
                                         selected_new_shell());
}

void WizardSession::commit(){
    MappingStore store = build_store();
    try {
        writer_.save(store);
    } catch(const std::exception& e){
        last_commit_error_ = std::string(i18n::get(i18n::MsgId::WRITE_FAILED)) + e.what();
        TRACE_MSG("commit failed: ", e.what());
        return;
    }
    last_commit_error_.reset();
    step_ = Step::Done;
}
