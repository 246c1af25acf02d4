#include "Semantic.h"

#ifdef SEMANTIC_TRACE
namespace semantic_trace {
    namespace {
        std::mutex& trace_mutex(){ static std::mutex m; return m; }
        std::ofstream& trace_stream(){
            static std::ofstream s([]{
                const char* env = std::getenv("SEMANTIC_TRACE_FILE");
                return std::string(env && *env ? env : "semantic_trace.log");
            }(), std::ios::app);
            return s;
        }
        void write_line(const std::string& line){
            auto& os = trace_stream();
            os << line << '\n';
            os.flush();
        }
    }

    void log_line(const std::string& line){
        std::lock_guard<std::mutex> lock(trace_mutex());
        write_line(line);
    }

    Scope::Scope(const char* fn, const std::string& details) : name(fn ? fn : "?"){
        if(!name.empty()){
            std::string msg = std::string("enter ") + name;
            if(!details.empty()) msg += " | " + details;
            log_line(msg);
        }
    }

    Scope::~Scope(){
        if(!name.empty()){
            log_line(std::string("exit ") + name);
        }
    }

    void log_loop(const char* tag, const std::string& details){
        std::lock_guard<std::mutex> lock(trace_mutex());
        std::string msg = std::string("loop ") + (tag ? tag : "?");
        if(!details.empty()) msg += " | " + details;
        write_line(msg);
    }
}
#endif

//
// Internationalization implementation
//
namespace i18n {
    namespace {
        enum class Lang { EN, FI };
        Lang current_lang = Lang::EN;

        struct MsgTable {
            const char* en;
#ifdef SEMANTIC_I18N_ENABLED
            const char* fi;
#endif
        };

        const MsgTable messages[] = {
            // USAGE
            { "Usage: semantic [init | translate <command> ...]"
#ifdef SEMANTIC_I18N_ENABLED
            , "Käyttö: semantic [init | translate <komento> ...]"
#endif
            },
            // UNKNOWN_SUBCOMMAND
            { "Unknown command: "
#ifdef SEMANTIC_I18N_ENABLED
            , "Tuntematon komento: "
#endif
            },
            // TRANSLATE_USAGE
            { "Usage: semantic translate <command> [args...]"
#ifdef SEMANTIC_I18N_ENABLED
            , "Käyttö: semantic translate <komento> [argumentit...]"
#endif
            },
            // CONFIG_LOAD_FAILED
            { "Failed to load config: "
#ifdef SEMANTIC_I18N_ENABLED
            , "Asetusten lataus epäonnistui: "
#endif
            },
            // RUN_WIZARD_FIRST
            { "Run `semantic` (no args) to set up your config first."
#ifdef SEMANTIC_I18N_ENABLED
            , "Aja ensin `semantic` ilman argumentteja asetusten luomiseksi."
#endif
            },
            // UNKNOWN_SEMANTIC_COMMAND
            { "Unknown semantic command: "
#ifdef SEMANTIC_I18N_ENABLED
            , "Tuntematon semanttinen komento: "
#endif
            },
            // RUN_FAILED
            { "Failed to run "
#ifdef SEMANTIC_I18N_ENABLED
            , "Suoritus epäonnistui: "
#endif
            },
            // CONFIG_WRITTEN
            { "Config written to "
#ifdef SEMANTIC_I18N_ENABLED
            , "Asetukset kirjoitettu: "
#endif
            },
            // RUN_INIT_HINT
            { "Run `semantic init` to generate shell aliases."
#ifdef SEMANTIC_I18N_ENABLED
            , "Aja `semantic init` luodaksesi komentotulkin aliakset."
#endif
            },
            // WRITE_FAILED
            { "Failed to write config: "
#ifdef SEMANTIC_I18N_ENABLED
            , "Asetusten kirjoitus epäonnistui: "
#endif
            },
            // TERMINAL_UNAVAILABLE
            { "error: the setup wizard needs an interactive terminal"
#ifdef SEMANTIC_I18N_ENABLED
            , "virhe: asennusvelho tarvitsee interaktiivisen päätteen"
#endif
            },
            // TERMINAL_LOST
            { "error: lost the terminal, setup wizard aborted without saving"
#ifdef SEMANTIC_I18N_ENABLED
            , "virhe: pääte katosi, asennusvelho keskeytettiin tallentamatta"
#endif
            },
            // SKIPPED_ALIAS
            { "note: skipping command not usable as a shell function name: "
#ifdef SEMANTIC_I18N_ENABLED
            , "huom: ohitetaan komento, joka ei kelpaa funktion nimeksi: "
#endif
            },
            // HELP_WELCOME
            { "Enter: continue  |  q: quit"
#ifdef SEMANTIC_I18N_ENABLED
            , "Enter: jatka  |  q: lopeta"
#endif
            },
            // HELP_SUMMARY
            { "Enter: save config  |  Backspace: back  |  q: quit"
#ifdef SEMANTIC_I18N_ENABLED
            , "Enter: tallenna  |  Backspace: takaisin  |  q: lopeta"
#endif
            },
            // HELP_SELECT
            { "Up/Down: select  |  Enter: continue  |  Backspace: back  |  q: quit"
#ifdef SEMANTIC_I18N_ENABLED
            , "Ylös/Alas: valitse  |  Enter: jatka  |  Backspace: takaisin  |  q: lopeta"
#endif
            },
        };

        Lang detect_language() {
            const char* lang_env = std::getenv("LANG");
            if(!lang_env) lang_env = std::getenv("LC_MESSAGES");
            if(!lang_env) lang_env = std::getenv("LC_ALL");

            if(lang_env) {
                std::string lang_str(lang_env);
                if(lang_str.find("fi_") == 0 || lang_str.find("fi.") == 0 ||
                   lang_str.find("finnish") != std::string::npos ||
                   lang_str.find("Finnish") != std::string::npos) {
                    return Lang::FI;
                }
            }
            return Lang::EN;
        }
    }

    void init() {
#ifdef SEMANTIC_I18N_ENABLED
        current_lang = detect_language();
#else
        (void)detect_language;
        current_lang = Lang::EN;
#endif
    }

    void set_english_only() {
        current_lang = Lang::EN;
    }

    const char* get(MsgId id) {
        size_t idx = static_cast<size_t>(id);
        if(idx >= sizeof(messages) / sizeof(messages[0])) {
            return "??? missing translation ???";
        }
#ifdef SEMANTIC_I18N_ENABLED
        if(current_lang == Lang::FI) {
            return messages[idx].fi;
        }
#endif
        return messages[idx].en;
    }
}
