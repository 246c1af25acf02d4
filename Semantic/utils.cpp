#include "Semantic.h"

// String utilities
std::string trim_copy(const std::string& s){
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

std::vector<std::string> split_whitespace(const std::string& s){
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while(iss >> tok) out.push_back(tok);
    return out;
}

// Single-quote for POSIX shells and fish. Bare words that need no quoting
// are returned as-is so generated init text stays readable.
std::string shell_quote(const std::string& s){
    if(s.empty()) return "''";
    bool plain = std::all_of(s.begin(), s.end(), [](unsigned char c){
        return std::isalnum(c) || c=='/' || c=='.' || c=='-' || c=='_' || c=='+' || c==':' || c==',';
    });
    if(plain) return s;
    std::string o; o.reserve(s.size()+8);
    o.push_back('\'');
    for(char c : s){
        if(c=='\'') o += "'\\''";
        else o.push_back(c);
    }
    o.push_back('\'');
    return o;
}

// Path utilities
std::string path_basename(const std::string& path){
    if(path.empty() || path=="/") return "/";
    auto pos = path.find_last_of('/');
    if(pos==std::string::npos) return path;
    return path.substr(pos+1);
}

// Environment
std::string env_or_empty(const char* name){
    if(const char* v = std::getenv(name); v && *v) return v;
    return {};
}

bool terminal_available(){
    return ::isatty(STDIN_FILENO) == 1 && ::isatty(STDOUT_FILENO) == 1;
}
