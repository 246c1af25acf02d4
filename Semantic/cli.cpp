#include "Semantic.h"

namespace {

void usage(std::ostream& os){
    os << i18n::get(i18n::MsgId::USAGE) << "\n";
}

std::optional<MappingStore> load_or_report(const ConfigStore& config, bool hint_wizard){
    try {
        return config.load();
    } catch(const SemanticError& e){
        std::cerr << i18n::get(i18n::MsgId::CONFIG_LOAD_FAILED) << e.what() << "\n";
        if(hint_wizard) std::cerr << i18n::get(i18n::MsgId::RUN_WIZARD_FIRST) << "\n";
        return std::nullopt;
    }
}

// Print shell init code for the configured (or detected) shell.
int cmd_init(const ConfigPaths& paths){
    TRACE_FN();
    ConfigStore config(paths);
    auto store = load_or_report(config, true);
    if(!store) return 1;

    const std::string shell = effective_shell(*store, detect_shell(env_or_empty("SHELL")));
    for(const auto& token : invalid_alias_names(*store)){
        std::cerr << i18n::get(i18n::MsgId::SKIPPED_ALIAS) << shell_quote(token) << "\n";
    }
    std::cout << generate_init(*store, shell);
    std::cout.flush();
    return 0;
}

// semantic translate <token> [args...]
int cmd_translate(const ConfigPaths& paths, const std::vector<std::string>& args){
    TRACE_FN("argc=", args.size());
    if(args.empty()){
        std::cerr << i18n::get(i18n::MsgId::TRANSLATE_USAGE) << "\n";
        return 1;
    }

    ConfigStore config(paths);
    auto store = load_or_report(config, false);
    if(!store) return 1;

    const std::string& token = args[0];
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    ExecutionPlan plan;
    try {
        plan = translate(*store, token, rest);
    } catch(const SemanticError& e){
        if(e.kind == ErrorKind::UnknownCommand){
            std::cerr << i18n::get(i18n::MsgId::UNKNOWN_SEMANTIC_COMMAND) << token << "\n";
        } else {
            std::cerr << "error: " << e.what() << " (" << config.paths().config_file.string() << ")\n";
        }
        return 1;
    }

    try {
        return run_plan(plan);
    } catch(const SemanticError& e){
        std::cerr << i18n::get(i18n::MsgId::RUN_FAILED) << e.what() << "\n";
        return 1;
    }
}

} // namespace

int run_cli(const std::vector<std::string>& args, const ConfigPaths& paths){
    TRACE_FN("argc=", args.size());
    if(args.empty()) return run_wizard(paths);

    const std::string& cmd = args[0];
    if(cmd == "init") return cmd_init(paths);
    if(cmd == "translate") return cmd_translate(paths, {args.begin() + 1, args.end()});

    std::cerr << i18n::get(i18n::MsgId::UNKNOWN_SUBCOMMAND) << cmd << "\n";
    usage(std::cerr);
    return 1;
}
