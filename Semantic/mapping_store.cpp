#include "Semantic.h"

const char* new_shell_policy_name(NewShellPolicy policy){
    switch(policy){
        case NewShellPolicy::AutoSetup: return "auto-setup";
        case NewShellPolicy::Notify:    return "notify";
        case NewShellPolicy::Ignore:    return "ignore";
    }
    return "auto-setup";
}

std::optional<NewShellPolicy> parse_new_shell_policy(const std::string& name){
    if(name == "auto-setup") return NewShellPolicy::AutoSetup;
    if(name == "notify") return NewShellPolicy::Notify;
    if(name == "ignore") return NewShellPolicy::Ignore;
    return std::nullopt;
}

MappingStore MappingStore::from_selections(const std::string& shell,
                                           const std::string& command_style,
                                           const std::string& folder_style,
                                           NewShellPolicy on_new_shell){
    TRACE_FN("shell=", shell, ", commands=", command_style, ", folders=", folder_style);
    MappingStore store;
    store.command_map = build_preset(command_style);
    store.path_map = build_path_preset(folder_style);
    store.general.command_style = command_style;
    store.general.folder_style = folder_style;
    store.shells.default_shell = shell;
    store.shells.enabled_shells = {shell};
    store.shells.on_new_shell = on_new_shell;
    return store;
}

bool MappingStore::operator==(const MappingStore& o) const {
    return command_map == o.command_map &&
           path_map == o.path_map &&
           general.command_style == o.general.command_style &&
           general.folder_style == o.general.folder_style &&
           shells.default_shell == o.shells.default_shell &&
           shells.enabled_shells == o.shells.enabled_shells &&
           shells.on_new_shell == o.shells.on_new_shell;
}
