#ifndef _Semantic_translator_h_
#define _Semantic_translator_h_

struct ExecutionPlan {
    std::string program;
    std::vector<std::string> args;

    // "program arg1 arg2", for diagnostics
    std::string command_line() const;

    bool operator==(const ExecutionPlan& o) const { return program == o.program && args == o.args; }
};

// Resolve one semantic invocation against a loaded store.
// Throws SemanticError: UnknownCommand when alias is not mapped,
// MalformedMapping when it maps to an empty command.
ExecutionPlan translate(const MappingStore& store,
                        const std::string& alias,
                        const std::vector<std::string>& trailing_args);

// Whole-argument path substitution; unmapped arguments pass through.
std::string substitute_path(const AliasTable& path_map, const std::string& arg);

#endif
