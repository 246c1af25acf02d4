#pragma once


// Tracing (optional debug feature)
#ifdef SEMANTIC_TRACE
namespace semantic_trace {
    void log_line(const std::string& line);

    inline std::string concat(){ return {}; }

    template<typename... Args>
    std::string concat(Args&&... args){
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        return oss.str();
    }

    struct Scope {
        std::string name;
        Scope(const char* fn, const std::string& details);
        ~Scope();
    };

    void log_loop(const char* tag, const std::string& details);
}
#define TRACE_FN(...) semantic_trace::Scope __trace_scope(__func__, semantic_trace::concat(__VA_ARGS__))
#define TRACE_MSG(...) semantic_trace::log_line(semantic_trace::concat(__VA_ARGS__))
#define TRACE_LOOP(tag, ...) semantic_trace::log_loop(tag, semantic_trace::concat(__VA_ARGS__))
#else
#define TRACE_FN(...)
#define TRACE_MSG(...)
#define TRACE_LOOP(...)
#endif

// i18n (internationalization)
namespace i18n {
    enum class MsgId {
        USAGE, UNKNOWN_SUBCOMMAND, TRANSLATE_USAGE,
        CONFIG_LOAD_FAILED, RUN_WIZARD_FIRST,
        UNKNOWN_SEMANTIC_COMMAND, RUN_FAILED,
        CONFIG_WRITTEN, RUN_INIT_HINT, WRITE_FAILED,
        TERMINAL_UNAVAILABLE, TERMINAL_LOST, SKIPPED_ALIAS,
        HELP_WELCOME, HELP_SUMMARY, HELP_SELECT
    };

    const char* get(MsgId id);
    void init();
    void set_english_only();
}
