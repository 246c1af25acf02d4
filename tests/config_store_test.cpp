/**
 * Tests for the YAML config store: round trip, directory creation,
 * overwrite, load errors and config root resolution.
 */

#include "test_helpers.h"

namespace fs = std::filesystem;

static void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::trunc);
    out << content;
}

void test_round_trip() {
    test_header("Round Trip");

    TempDir tmp("roundtrip");
    ConfigStore config(ConfigPaths::from_root(tmp.path / "nested" / "root"));

    for (const char* style : {"natural", "traditional", "verbose"}) {
        MappingStore original = MappingStore::from_selections("fish", style, style, NewShellPolicy::Notify);
        config.save(original);
        MappingStore loaded = config.load();
        expect(loaded == original, std::string("store survives save/load with style ") + style);
    }

    expect(fs::exists(config.paths().config_file), "missing parent directories were created");
    expect(config.paths().config_file.filename() == "config.yaml", "file is named config.yaml");
}

void test_overwrite() {
    test_header("Overwrite");

    TempDir tmp("overwrite");
    ConfigStore config(ConfigPaths::from_root(tmp.path));

    config.save(MappingStore::from_selections("bash", "natural", "natural", NewShellPolicy::AutoSetup));
    MappingStore second = MappingStore::from_selections("zsh", "verbose", "traditional", NewShellPolicy::Ignore);
    config.save(second);

    MappingStore loaded = config.load();
    expect(loaded == second, "second save replaces the first");
    expect(loaded.path_map.empty(), "empty path table round-trips");

    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(config.paths().config_dir)) {
        (void)entry;
        ++files;
    }
    expect(files == 1, "no temp files left behind");
}

void test_serialized_layout() {
    test_header("Serialized Layout");

    std::string text = serialize_config(
        MappingStore::from_selections("fish", "natural", "natural", NewShellPolicy::AutoSetup));
    YAML::Node root = YAML::Load(text);
    expect(root["general"]["command_style"].as<std::string>() == "natural", "general.command_style");
    expect(root["shells"]["default"].as<std::string>() == "fish", "shells.default");
    expect(root["shells"]["enabled"].IsSequence() && root["shells"]["enabled"].size() == 1, "shells.enabled list");
    expect(root["shells"]["on_new_shell"].as<std::string>() == "auto-setup", "shells.on_new_shell");
    expect(root["commands"]["install"].as<std::string>() == "sudo pacman -S", "commands section");
    expect(root["paths"]["/apps"].as<std::string>() == "/usr/bin", "paths section");
}

void test_hand_written_config() {
    test_header("Hand Written Config");

    MappingStore store = parse_config(
        "general:\n"
        "  command_style: custom\n"
        "  folder_style: custom\n"
        "shells:\n"
        "  default: \"\"\n"
        "  enabled: [bash, zsh, bash]\n"
        "  on_new_shell: notify\n"
        "commands:\n"
        "  open: xdg-open\n"
        "  gitlog: git log --oneline\n"
        "paths:\n"
        "  /home-cfg: /home/user/.config\n",
        "inline");
    expect(store.command_map.at("gitlog") == "git log --oneline", "custom command parsed");
    expect(store.shells.default_shell.empty(), "empty default shell allowed");
    expect((store.shells.enabled_shells == std::vector<std::string>{"bash", "zsh"}), "duplicate shells dropped");
    expect(store.shells.on_new_shell == NewShellPolicy::Notify, "policy parsed");

    ExecutionPlan plan = translate(store, "gitlog", {"/home-cfg"});
    expect(plan.program == "git" &&
           (plan.args == std::vector<std::string>{"log", "--oneline", "/home/user/.config"}),
           "loaded store drives translation");
}

void test_load_errors() {
    test_header("Load Errors");

    TempDir tmp("errors");
    ConfigStore config(ConfigPaths::from_root(tmp.path));

    expect_error(ErrorKind::ConfigUnreadable, [&] { config.load(); }, "missing file is ConfigUnreadable");

    write_file(config.paths().config_file, "general: [unterminated\n");
    expect_error(ErrorKind::ConfigMalformed, [&] { config.load(); }, "invalid YAML is ConfigMalformed");

    write_file(config.paths().config_file,
               "general: {command_style: a, folder_style: b}\n"
               "shells: {default: fish, enabled: [fish], on_new_shell: ignore}\n"
               "paths: {}\n");
    expect_error(ErrorKind::ConfigMalformed, [&] { config.load(); }, "missing commands section is ConfigMalformed");

    write_file(config.paths().config_file,
               "general: {command_style: a, folder_style: b}\n"
               "shells: {default: fish, enabled: [fish], on_new_shell: sometimes}\n"
               "commands: {}\n"
               "paths: {}\n");
    expect_error(ErrorKind::ConfigMalformed, [&] { config.load(); }, "unknown policy is ConfigMalformed");

    write_file(config.paths().config_file,
               "general: {command_style: a, folder_style: b}\n"
               "shells: {default: fish, enabled: fish, on_new_shell: ignore}\n"
               "commands: {}\n"
               "paths: {}\n");
    expect_error(ErrorKind::ConfigMalformed, [&] { config.load(); }, "scalar enabled list is ConfigMalformed");

    write_file(config.paths().config_file, "- just\n- a list\n");
    expect_error(ErrorKind::ConfigMalformed, [&] { config.load(); }, "non-mapping root is ConfigMalformed");

    fs::remove(config.paths().config_file);
    fs::create_directories(config.paths().config_file);
    expect_error(ErrorKind::ConfigUnreadable, [&] { config.load(); }, "directory in place of file is ConfigUnreadable");
}

void test_legacy_toml_config() {
    test_header("Legacy TOML Config");

    TempDir tmp("legacy");
    ConfigStore config(ConfigPaths::from_root(tmp.path));
    expect(config.paths().legacy_file == tmp.path / "semantic" / "config.toml", "legacy file sits beside config.yaml");

    write_file(config.paths().legacy_file,
               "[general]\ncommand_style = \"natural\"\nfolder_style = \"natural\"\n");
    try {
        config.load();
        test_fail("legacy-only config must not load");
    } catch (const SemanticError& e) {
        expect(e.kind == ErrorKind::ConfigUnreadable, "legacy-only config is ConfigUnreadable");
        std::string msg = e.what();
        expect(msg.find("config.toml") != std::string::npos && msg.find("run `semantic`") != std::string::npos,
               "message names the old file and how to recreate the config");
    }

    MappingStore fresh = MappingStore::from_selections("fish", "natural", "natural", NewShellPolicy::AutoSetup);
    config.save(fresh);
    expect(config.load() == fresh, "config.yaml wins once it exists");
    expect(fs::exists(config.paths().legacy_file), "the old file is left untouched");
}

void test_save_error() {
    test_header("Save Error");

    TempDir tmp("saveerr");
    // a regular file where the config directory should be
    write_file(tmp.path / "semantic", "not a directory");
    ConfigStore config(ConfigPaths::from_root(tmp.path));
    expect_error(ErrorKind::ConfigWriteFailed,
                 [&] { config.save(MappingStore::from_selections("fish", "natural", "natural", NewShellPolicy::Ignore)); },
                 "unwritable location is ConfigWriteFailed");
}

void test_config_root() {
    test_header("Config Root");

    expect(resolve_config_root("/a", "/b", "/c") == fs::path("/a"), "SEMANTIC_CONFIG_HOME wins");
    expect(resolve_config_root("", "/b", "/c") == fs::path("/b"), "XDG_CONFIG_HOME next");
    expect(resolve_config_root("", "", "/c") == fs::path("/c/.config"), "HOME/.config next");
    expect(resolve_config_root("", "", "") == fs::path(".config"), "relative fallback");
    expect(ConfigPaths::from_root("/r").config_file == fs::path("/r/semantic/config.yaml"), "config file path");
}

int main() {
    std::cout << "Running config store tests..." << std::endl;

    test_round_trip();
    test_overwrite();
    test_serialized_layout();
    test_hand_written_config();
    test_load_errors();
    test_legacy_toml_config();
    test_save_error();
    test_config_root();

    std::cout << "\nAll config store tests passed." << std::endl;
    return 0;
}
