#ifndef _Semantic_wizard_h_
#define _Semantic_wizard_h_

//
// Setup wizard steps, in order. Navigation is strictly linear.
//
enum class Step {
    Welcome,
    Shell,
    CommandStyle,
    FolderStyle,
    NewShellBehavior,
    Summary,
    Done
};

constexpr size_t STEP_COUNT = 7;
constexpr size_t TOTAL_VISIBLE_STEPS = 6;  // Welcome through Summary

Step next_step(Step s);
Step prev_step(Step s);
size_t step_index(Step s);
const char* step_name(Step s);

struct WizardOption {
    const char* value;
    const char* description;  // empty when the value speaks for itself
};

// Fixed option list of a step; empty for Welcome, Summary and Done.
const std::vector<WizardOption>& step_options(Step s);
bool step_has_options(Step s);
const char* step_prompt(Step s);

//
// WizardSession: state machine behind the setup wizard.
//
class WizardSession {
public:
    explicit WizardSession(ConfigWriter& writer);

    Step current_step() const { return step_; }
    size_t cursor(Step s) const;
    const std::optional<std::string>& last_commit_error() const { return last_commit_error_; }
    bool quit_requested() const { return quit_requested_; }
    bool finished() const { return quit_requested_ || step_ == Step::Done; }

    // Wrap within the current step's options; no-op on steps without options.
    void move_cursor_up();
    void move_cursor_down();

    // Next step, or commit when on Summary.
    void advance();
    // Previous step; clears the commit error, keeps every cursor.
    void go_back();
    void quit();

    std::string selected_value(Step s) const;
    std::string selected_shell() const { return selected_value(Step::Shell); }
    std::string selected_command_style() const { return selected_value(Step::CommandStyle); }
    std::string selected_folder_style() const { return selected_value(Step::FolderStyle); }
    NewShellPolicy selected_new_shell() const;

    MappingStore build_store() const;

private:
    void commit();

    ConfigWriter& writer_;
    Step step_ = Step::Welcome;
    std::array<size_t, STEP_COUNT> cursors_{};
    std::optional<std::string> last_commit_error_;
    bool quit_requested_ = false;
};

#endif
