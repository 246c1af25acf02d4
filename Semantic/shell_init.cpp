#include "Semantic.h"

std::string detect_shell(const std::string& shell_env){
    std::string s = trim_copy(shell_env);
    while(s.size() > 1 && s.back() == '/') s.pop_back();
    if(s.empty()) return "bash";
    std::string name = path_basename(s);
    return (name.empty() || name == "/") ? std::string("bash") : name;
}

std::string effective_shell(const MappingStore& store, const std::string& detected){
    return store.shells.default_shell.empty() ? detected : store.shells.default_shell;
}

bool is_shell_builtin(const std::string& program){
    return program == "cd" || program == "pushd" || program == "popd";
}

bool is_valid_alias_name(const std::string& token){
    if(token.empty()) return false;
    const unsigned char first = static_cast<unsigned char>(token[0]);
    if(!std::isalnum(first) && first != '_') return false;
    return std::all_of(token.begin(), token.end(), [](unsigned char c){
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

std::vector<std::string> invalid_alias_names(const MappingStore& store){
    std::vector<std::string> out;
    for(const auto& kv : store.command_map){
        if(!is_valid_alias_name(kv.first)) out.push_back(kv.first);
    }
    return out;
}

namespace {

struct Wrapper {
    std::string name;
    std::string program;
    std::vector<std::string> fixed_args;
    bool builtin;
};

// Identity entries (token == full real command) only matter when paths need rewriting.
std::vector<Wrapper> collect_wrappers(const MappingStore& store){
    std::vector<Wrapper> out;
    for(const auto& [token, real] : store.command_map){
        std::vector<std::string> parts = split_whitespace(real);
        if(parts.empty()) continue;
        // the name becomes a shell function, so it must not carry shell syntax
        if(!is_valid_alias_name(token)) continue;
        if(store.path_map.empty() && parts.size() == 1 && parts[0] == token) continue;
        Wrapper w;
        w.name = token;
        w.program = parts[0];
        w.fixed_args.assign(parts.begin() + 1, parts.end());
        w.builtin = is_shell_builtin(w.program);
        out.push_back(w);
    }
    return out;
}

std::string quoted_fixed(const std::vector<std::string>& args){
    std::string out;
    for(const auto& a : args){
        out += shell_quote(a);
        out.push_back(' ');
    }
    return out;
}

void emit_posix(std::ostringstream& os, const MappingStore& store,
                const std::vector<Wrapper>& wrappers, const std::string& exe){
    os << "__semantic_path() {\n";
    os << "    case \"$1\" in\n";
    for(const auto& [from, to] : store.path_map){
        os << "        " << shell_quote(from) << ") printf '%s\\n' " << shell_quote(to) << " ;;\n";
    }
    os << "        *) printf '%s\\n' \"$1\" ;;\n";
    os << "    esac\n";
    os << "}\n";

    for(const auto& w : wrappers){
        os << w.name << "() {\n";
        if(w.builtin){
            os << "    local __semantic_args=() __semantic_arg\n";
            os << "    for __semantic_arg in \"$@\"; do\n";
            os << "        __semantic_args+=(\"$(__semantic_path \"$__semantic_arg\")\")\n";
            os << "    done\n";
            os << "    builtin " << w.program << ' ' << quoted_fixed(w.fixed_args)
               << "\"${__semantic_args[@]}\"\n";
        } else {
            os << "    command " << shell_quote(exe) << " translate " << shell_quote(w.name) << " \"$@\"\n";
        }
        os << "}\n";
    }
}

void emit_fish(std::ostringstream& os, const MappingStore& store,
               const std::vector<Wrapper>& wrappers, const std::string& exe){
    os << "function __semantic_path\n";
    os << "    switch $argv[1]\n";
    for(const auto& [from, to] : store.path_map){
        os << "        case " << shell_quote(from) << "\n";
        os << "            printf '%s\\n' " << shell_quote(to) << "\n";
    }
    os << "        case '*'\n";
    os << "            printf '%s\\n' $argv[1]\n";
    os << "    end\n";
    os << "end\n";

    for(const auto& w : wrappers){
        // fish ships pushd/popd as functions, only cd is a real builtin
        bool fish_builtin = w.builtin && w.program == "cd";
        if(w.builtin && !fish_builtin && w.name == w.program) continue;
        os << "function " << w.name << "\n";
        if(w.builtin){
            os << "    set -l __semantic_args\n";
            os << "    for __semantic_arg in $argv\n";
            os << "        set -a __semantic_args (__semantic_path $__semantic_arg)\n";
            os << "    end\n";
            os << "    " << (fish_builtin ? "builtin " : "") << w.program << ' '
               << quoted_fixed(w.fixed_args) << "$__semantic_args\n";
        } else {
            os << "    command " << shell_quote(exe) << " translate " << shell_quote(w.name) << " $argv\n";
        }
        os << "end\n";
    }
}

} // namespace

std::string generate_init(const MappingStore& store, const std::string& shell, const std::string& exe){
    TRACE_FN("shell=", shell);
    std::vector<Wrapper> wrappers = collect_wrappers(store);
    std::ostringstream os;
    if(shell == "fish"){
        os << "# semantic init (fish)\n";
        emit_fish(os, store, wrappers, exe);
    } else {
        os << "# semantic init (" << (shell == "zsh" ? "zsh" : "bash") << ")\n";
        emit_posix(os, store, wrappers, exe);
    }
    return os.str();
}
