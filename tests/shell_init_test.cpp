/**
 * Tests for shell detection and the generated shell init text.
 */

#include "test_helpers.h"

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void test_detect_shell() {
    test_header("Detect Shell");

    expect(detect_shell("/usr/bin/fish") == "fish", "basename of $SHELL");
    expect(detect_shell("/bin/zsh/") == "zsh", "trailing slash ignored");
    expect(detect_shell("bash") == "bash", "bare name");
    expect(detect_shell("") == "bash", "unset falls back to bash");
    expect(detect_shell("/") == "bash", "root path falls back to bash");

    MappingStore store = MappingStore::from_selections("zsh", "natural", "natural", NewShellPolicy::Ignore);
    expect(effective_shell(store, "fish") == "zsh", "configured shell wins");
    store.shells.default_shell.clear();
    expect(effective_shell(store, "fish") == "fish", "detected shell when none configured");
}

void test_builtins() {
    test_header("Builtins");

    expect(is_shell_builtin("cd") && is_shell_builtin("pushd") && is_shell_builtin("popd"), "directory builtins");
    expect(!is_shell_builtin("ls") && !is_shell_builtin("sudo"), "external programs");
}

void test_fish_natural() {
    test_header("Fish Natural");

    MappingStore store = MappingStore::from_selections("fish", "natural", "natural", NewShellPolicy::AutoSetup);
    std::string text = generate_init(store, "fish");

    expect(contains(text, "# semantic init (fish)"), "fish header");
    expect(contains(text, "function __semantic_path"), "path helper defined");
    expect(contains(text, "case /apps\n            printf '%s\\n' /usr/bin"), "path helper maps /apps");
    expect(contains(text, "case '*'\n            printf '%s\\n' $argv[1]"),
           "unmapped arguments are printed verbatim, even ones that look like flags");
    expect(!contains(text, "echo"), "fish path helper never goes through echo");
    expect(contains(text, "function goto\n"), "goto wrapper defined");
    expect(contains(text, "builtin cd $__semantic_args"), "goto runs cd in-shell");
    expect(contains(text, "builtin cd .. $__semantic_args"), "back keeps its fixed argument");
    expect(contains(text, "function list\n    command semantic translate list $argv"), "list forwards to translate");
    expect(!contains(text, "\"$@\""), "no POSIX syntax in fish output");
}

void test_bash_natural() {
    test_header("Bash Natural");

    MappingStore store = MappingStore::from_selections("bash", "natural", "natural", NewShellPolicy::AutoSetup);
    std::string text = generate_init(store, "bash", "/opt/semantic/bin/semantic");

    expect(contains(text, "# semantic init (bash)"), "bash header");
    expect(contains(text, "__semantic_path() {"), "path helper defined");
    expect(contains(text, "        /apps) printf '%s\\n' /usr/bin ;;"), "path helper maps /apps");
    expect(contains(text, "goto() {"), "goto wrapper defined");
    expect(contains(text, "builtin cd \"${__semantic_args[@]}\""), "goto runs cd in-shell");
    expect(contains(text, "command /opt/semantic/bin/semantic translate install \"$@\""), "custom exe used");

    std::string zsh = generate_init(store, "zsh");
    expect(contains(zsh, "# semantic init (zsh)") && contains(zsh, "goto() {"), "zsh uses POSIX functions");

    std::string other = generate_init(store, "tcsh");
    expect(contains(other, "# semantic init (bash)"), "unknown shell gets bash syntax");
}

void test_traditional_identity_skipped() {
    test_header("Traditional Identity");

    MappingStore store = MappingStore::from_selections("bash", "traditional", "traditional", NewShellPolicy::Ignore);
    std::string text = generate_init(store, "bash");
    expect(!contains(text, "ls() {") && !contains(text, "cd() {"), "identity mappings without paths are skipped");
    expect(contains(text, "__semantic_path() {"), "path helper still emitted");

    store.path_map["/apps"] = "/usr/bin";
    text = generate_init(store, "bash");
    expect(contains(text, "ls() {") && contains(text, "cd() {"), "identity mappings wrapped when paths exist");
}

void test_custom_quoting() {
    test_header("Quoting");

    MappingStore store = MappingStore::from_selections("bash", "traditional", "traditional", NewShellPolicy::Ignore);
    store.path_map["/my docs"] = "/home/user/My Documents";
    store.command_map["jump"] = "cd";
    std::string text = generate_init(store, "bash");
    expect(contains(text, "'/my docs') printf '%s\\n' '/home/user/My Documents' ;;"), "paths with spaces quoted");
}

void test_alias_names() {
    test_header("Alias Names");

    expect(is_valid_alias_name("goto") && is_valid_alias_name("list-files") &&
           is_valid_alias_name("git.log_2") && is_valid_alias_name("_x"),
           "words with dashes, dots and underscores are valid");
    expect(!is_valid_alias_name("") && !is_valid_alias_name("two words") &&
           !is_valid_alias_name("x;y") && !is_valid_alias_name("-n") &&
           !is_valid_alias_name("a$(b)") && !is_valid_alias_name("new\nline"),
           "empty, spaced, flag-like and shell-syntax names are rejected");

    MappingStore store = MappingStore::from_selections("bash", "natural", "natural", NewShellPolicy::Ignore);
    store.command_map["oops; touch /tmp/pwned"] = "ls";
    store.command_map["two words"] = "cd";
    store.command_map["ll"] = "ls -l";

    auto bad = invalid_alias_names(store);
    expect((bad == std::vector<std::string>{"oops; touch /tmp/pwned", "two words"}),
           "invalid names are reported in key order");

    for (const char* shell : {"bash", "fish"}) {
        std::string text = generate_init(store, shell);
        expect(!contains(text, "pwned") && !contains(text, "two words"),
               std::string(shell) + ": invalid names never reach the init text");
        expect(contains(text, "\nll() {") || contains(text, "\nfunction ll\n"),
               std::string(shell) + ": valid custom names are still wrapped");
    }
}

void test_string_helpers() {
    test_header("String Helpers");

    expect(shell_quote("/usr/bin") == "/usr/bin", "plain words stay bare");
    expect(shell_quote("") == "''", "empty string is quoted");
    expect(shell_quote("it's") == "'it'\\''s'", "single quotes are escaped");
    expect(trim_copy("  a b \t") == "a b", "trim both ends");
    expect((split_whitespace(" sudo  pacman\t-S ") == std::vector<std::string>{"sudo", "pacman", "-S"}),
           "split on runs of whitespace");
    expect(path_basename("/usr/bin/zsh") == "zsh" && path_basename("fish") == "fish", "basename");
}

int main() {
    std::cout << "Running shell init tests..." << std::endl;

    test_detect_shell();
    test_builtins();
    test_fish_natural();
    test_bash_natural();
    test_traditional_identity_skipped();
    test_custom_quoting();
    test_alias_names();
    test_string_helpers();

    std::cout << "\nAll shell init tests passed." << std::endl;
    return 0;
}
