#ifndef _Semantic_shell_init_h_
#define _Semantic_shell_init_h_

// Basename of the $SHELL value; "bash" when unset.
std::string detect_shell(const std::string& shell_env);

// Configured default shell, else the detected one.
std::string effective_shell(const MappingStore& store, const std::string& detected);

// Programs that must run inside the interactive shell instead of a child process.
bool is_shell_builtin(const std::string& program);

// Alias tokens usable as shell function names: [A-Za-z0-9_][A-Za-z0-9_.-]*
bool is_valid_alias_name(const std::string& token);

// Command tokens generate_init() leaves out because they are not valid names.
std::vector<std::string> invalid_alias_names(const MappingStore& store);

// Shell init text to be eval'd/sourced by fish, bash or zsh (others get bash syntax).
// Builtin targets are wrapped in-shell with path substitution, everything else
// forwards to `<exe> translate <token> ...`.
std::string generate_init(const MappingStore& store, const std::string& shell,
                          const std::string& exe = "semantic");

#endif
