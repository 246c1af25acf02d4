#ifndef _Semantic_mapping_store_h_
#define _Semantic_mapping_store_h_

enum class NewShellPolicy { AutoSetup, Notify, Ignore };

const char* new_shell_policy_name(NewShellPolicy policy);
std::optional<NewShellPolicy> parse_new_shell_policy(const std::string& name);

struct GeneralPrefs {
    std::string command_style;
    std::string folder_style;
};

struct ShellPrefs {
    std::string default_shell;
    std::vector<std::string> enabled_shells;  // no duplicates, first-seen order
    NewShellPolicy on_new_shell = NewShellPolicy::AutoSetup;
};

//
// MappingStore: the user's alias tables plus the preferences that produced them.
// Built once per wizard commit or loaded once per translation; read-only afterwards.
//
struct MappingStore {
    AliasTable command_map;
    AliasTable path_map;
    GeneralPrefs general;
    ShellPrefs shells;

    // Build from the four wizard selections using the style presets.
    static MappingStore from_selections(const std::string& shell,
                                        const std::string& command_style,
                                        const std::string& folder_style,
                                        NewShellPolicy on_new_shell);

    bool operator==(const MappingStore& o) const;
    bool operator!=(const MappingStore& o) const { return !(*this == o); }
};

#endif
