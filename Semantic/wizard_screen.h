#ifndef _Semantic_wizard_screen_h_
#define _Semantic_wizard_screen_h_

// Key binding hint shown in the bottom bar for a step.
const char* help_text(Step s);

// Progress marker per visible step: '+' done, '@' current, '.' pending.
std::string progress_markers(Step s);

// Terminal-independent key code for a getch() result; ERR becomes keys::Lost.
int key_code_from_curses(int ch);

// Full-screen setup wizard writing to paths.config_file.
// Returns the process exit status.
int run_wizard(const ConfigPaths& paths);

#endif
