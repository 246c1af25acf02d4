#ifndef _Semantic_cli_h_
#define _Semantic_cli_h_

// Dispatch the command line (argv without the program name).
// Returns the process exit status: 0 for the wizard and init on success,
// the child's code for translate, 1 on any usage or runtime error.
int run_cli(const std::vector<std::string>& args, const ConfigPaths& paths);

#endif
