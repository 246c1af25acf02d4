#ifndef _Semantic_utils_h_
#define _Semantic_utils_h_

// String utilities
std::string trim_copy(const std::string& s);
std::vector<std::string> split_whitespace(const std::string& s);
std::string shell_quote(const std::string& s);

// Path utilities
std::string path_basename(const std::string& path);

// Environment
std::string env_or_empty(const char* name);
bool terminal_available();

#endif
