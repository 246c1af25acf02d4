/**
 * Tests for running translated plans as child processes.
 */

#include "test_helpers.h"

void test_exit_codes() {
    test_header("Exit Codes");

    expect(run_plan(ExecutionPlan{"true", {}}) == 0, "true exits 0");
    expect(run_plan(ExecutionPlan{"false", {}}) == 1, "false exits 1");
    expect(run_plan(ExecutionPlan{"sh", {"-c", "exit 3"}}) == 3, "child exit code is returned");
    expect(run_plan(ExecutionPlan{"sh", {"-c", "kill -TERM $$"}}) == 128 + SIGTERM, "signal maps to 128+n");
}

void test_arguments_passed() {
    test_header("Arguments");

    TempDir tmp("exec");
    std::string target = (tmp.path / "made by child").string();
    expect(run_plan(ExecutionPlan{"touch", {target}}) == 0, "touch succeeded");
    expect(std::filesystem::exists(target), "argument with a space passed as one word");
}

void test_translated_plan() {
    test_header("Translated Plan");

    MappingStore store = MappingStore::from_selections("bash", "traditional", "traditional", NewShellPolicy::Ignore);
    store.command_map["check"] = "sh -c";
    ExecutionPlan plan = translate(store, "check", {"exit 7"});
    expect(run_plan(plan) == 7, "translated plan runs with its trailing args");
}

void test_missing_program() {
    test_header("Missing Program");

    ExecutionPlan plan{"semantic-no-such-program-xyz", {"arg"}};
    expect_error(ErrorKind::ExecutionFailed, [&] { run_plan(plan); }, "missing program is ExecutionFailed");
    try {
        run_plan(plan);
    } catch (const SemanticError& e) {
        expect(std::string(e.what()).find("semantic-no-such-program-xyz") != std::string::npos,
               "error names the program");
    }
}

int main() {
    std::cout << "Running executor tests..." << std::endl;

    test_exit_codes();
    test_arguments_passed();
    test_translated_plan();
    test_missing_program();

    std::cout << "\nAll executor tests passed." << std::endl;
    return 0;
}
