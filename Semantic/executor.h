#ifndef _Semantic_executor_h_
#define _Semantic_executor_h_

// Spawn plan.program (PATH lookup) with plan.args, inheriting stdio, and wait.
// Returns the child's exit code, or 128 + signal when it was killed.
// Throws SemanticError(ExecutionFailed) when the program cannot be started.
int run_plan(const ExecutionPlan& plan);

#endif
