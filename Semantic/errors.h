#ifndef _Semantic_errors_h_
#define _Semantic_errors_h_

enum class ErrorKind {
    ConfigUnreadable,   // config file missing or unreadable
    ConfigMalformed,    // config present but not the expected shape
    ConfigWriteFailed,  // save() could not write the record
    UnknownCommand,     // token absent from the command map
    MalformedMapping,   // command maps to an empty string
    ExecutionFailed     // fork/exec of the resolved program failed
};

const char* error_kind_name(ErrorKind kind);

struct SemanticError : std::runtime_error {
    ErrorKind kind;

    SemanticError(ErrorKind k, const std::string& msg)
        : std::runtime_error(msg), kind(k) {}
};

#endif
