#include "Semantic.h"

int main(int argc, char** argv){
    TRACE_FN();
    i18n::init();

    const std::vector<std::string> args(argv + 1, argv + argc);
    const ConfigPaths paths = ConfigPaths::from_root(
        resolve_config_root(env_or_empty("SEMANTIC_CONFIG_HOME"),
                            env_or_empty("XDG_CONFIG_HOME"),
                            env_or_empty("HOME")));

    try {
        return run_cli(args, paths);
    } catch(const std::exception& e){
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
