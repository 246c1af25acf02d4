#include "Semantic.h"

std::string ExecutionPlan::command_line() const {
    std::string out = program;
    for(const auto& a : args){
        out.push_back(' ');
        out += a;
    }
    return out;
}

std::string substitute_path(const AliasTable& path_map, const std::string& arg){
    auto it = path_map.find(arg);
    return it == path_map.end() ? arg : it->second;
}

ExecutionPlan translate(const MappingStore& store,
                        const std::string& alias,
                        const std::vector<std::string>& trailing_args){
    TRACE_FN("alias=", alias, ", argc=", trailing_args.size());

    auto it = store.command_map.find(alias);
    if(it == store.command_map.end()){
        throw SemanticError(ErrorKind::UnknownCommand, alias);
    }

    // the real command may carry fixed flags, e.g. "sudo pacman -S"
    std::vector<std::string> parts = split_whitespace(it->second);
    if(parts.empty()){
        throw SemanticError(ErrorKind::MalformedMapping,
                            "command '" + alias + "' maps to an empty command");
    }

    ExecutionPlan plan;
    plan.program = parts.front();
    plan.args.assign(parts.begin() + 1, parts.end());
    plan.args.reserve(plan.args.size() + trailing_args.size());
    for(const auto& arg : trailing_args){
        plan.args.push_back(substitute_path(store.path_map, arg));
    }
    TRACE_MSG("resolved: ", plan.command_line());
    return plan;
}
