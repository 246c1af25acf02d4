#include "Semantic.h"

Style parse_style(const std::string& name){
    if(name == "natural") return Style::Natural;
    if(name == "verbose") return Style::Verbose;
    return Style::Traditional;
}

const char* style_name(Style style){
    switch(style){
        case Style::Natural:     return "natural";
        case Style::Traditional: return "traditional";
        case Style::Verbose:     return "verbose";
    }
    return "traditional";
}

//
// Command presets
//
namespace {

AliasTable natural_commands(){
    return {
        {"goto",    "cd"},
        {"back",    "cd .."},
        {"list",    "ls -la"},
        {"delete",  "rm -rf"},
        {"copy",    "cp -r"},
        {"move",    "mv"},
        {"install", "sudo pacman -S"},
        {"remove",  "sudo pacman -R"},
        {"update",  "sudo pacman -Syu"},
    };
}

AliasTable verbose_commands(){
    return {
        {"go-to",           "cd"},
        {"go-back",         "cd .."},
        {"list-files",      "ls -la"},
        {"delete-file",     "rm -rf"},
        {"copy-file",       "cp -r"},
        {"move-file",       "mv"},
        {"install-package", "sudo pacman -S"},
        {"remove-package",  "sudo pacman -R"},
        {"update-system",   "sudo pacman -Syu"},
    };
}

// real commands map to themselves
AliasTable traditional_commands(){
    return {
        {"cd",     "cd"},
        {"ls",     "ls"},
        {"rm",     "rm"},
        {"cp",     "cp"},
        {"mv",     "mv"},
        {"pacman", "pacman"},
    };
}

//
// Path presets
//
AliasTable natural_paths(){
    return {
        {"/apps",     "/usr/bin"},
        {"/settings", "/etc"},
        {"/logs",     "/var/log"},
    };
}

AliasTable verbose_paths(){
    return {
        {"/user/applications", "/usr/bin"},
        {"/configuration",     "/etc"},
        {"/system-logs",       "/var/log"},
    };
}

} // namespace

AliasTable build_preset(Style style){
    switch(style){
        case Style::Natural: return natural_commands();
        case Style::Verbose: return verbose_commands();
        case Style::Traditional: break;
    }
    return traditional_commands();
}

AliasTable build_path_preset(Style style){
    switch(style){
        case Style::Natural: return natural_paths();
        case Style::Verbose: return verbose_paths();
        case Style::Traditional: break;
    }
    // no remapping, real paths are used as-is
    return {};
}
