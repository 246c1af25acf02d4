#include "Semantic.h"

namespace fs = std::filesystem;

ConfigPaths ConfigPaths::from_root(const fs::path& root){
    ConfigPaths p;
    p.config_dir = root / "semantic";
    p.config_file = p.config_dir / "config.yaml";
    p.legacy_file = p.config_dir / "config.toml";
    return p;
}

fs::path resolve_config_root(const std::string& semantic_home,
                             const std::string& xdg_config_home,
                             const std::string& home){
    if(!semantic_home.empty()) return fs::path(semantic_home);
    if(!xdg_config_home.empty()) return fs::path(xdg_config_home);
    if(!home.empty()) return fs::path(home) / ".config";
    return fs::path(".config");
}

//
// YAML codec
//
std::string serialize_config(const MappingStore& store){
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "general" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "command_style" << YAML::Value << store.general.command_style;
    out << YAML::Key << "folder_style" << YAML::Value << store.general.folder_style;
    out << YAML::EndMap;

    out << YAML::Key << "shells" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "default" << YAML::Value << store.shells.default_shell;
    out << YAML::Key << "enabled" << YAML::Value << YAML::Flow << store.shells.enabled_shells;
    out << YAML::Key << "on_new_shell" << YAML::Value << new_shell_policy_name(store.shells.on_new_shell);
    out << YAML::EndMap;

    auto emit_table = [&out](const char* name, const AliasTable& table){
        out << YAML::Key << name << YAML::Value;
        if(table.empty()){
            out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
            return;
        }
        out << YAML::BeginMap;
        for(const auto& [k, v] : table){
            out << YAML::Key << k << YAML::Value << v;
        }
        out << YAML::EndMap;
    };
    emit_table("commands", store.command_map);
    emit_table("paths", store.path_map);

    out << YAML::EndMap;
    if(!out.good()){
        throw SemanticError(ErrorKind::ConfigWriteFailed,
                            std::string("cannot encode config: ") + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

namespace {

[[noreturn]] void malformed(const std::string& origin, const std::string& what){
    throw SemanticError(ErrorKind::ConfigMalformed, origin + ": " + what);
}

YAML::Node require_map(const YAML::Node& parent, const char* key, const std::string& origin){
    YAML::Node n = parent[key];
    if(!n.IsDefined() || n.IsNull()) malformed(origin, std::string("missing section '") + key + "'");
    if(!n.IsMap()) malformed(origin, std::string("section '") + key + "' must be a mapping");
    return n;
}

std::string require_string(const YAML::Node& parent, const char* key, const std::string& origin,
                           const std::string& section){
    YAML::Node n = parent[key];
    if(!n.IsDefined()) malformed(origin, "missing key '" + section + "." + key + "'");
    if(n.IsNull()) return {};
    if(!n.IsScalar()) malformed(origin, "'" + section + "." + key + "' must be a string");
    return n.as<std::string>();
}

AliasTable read_table(const YAML::Node& node, const std::string& origin, const char* section){
    AliasTable table;
    for(const auto& kv : node){
        if(!kv.first.IsScalar() || !(kv.second.IsScalar() || kv.second.IsNull())){
            malformed(origin, std::string("entries of '") + section + "' must be string pairs");
        }
        std::string key = kv.first.as<std::string>();
        if(key.empty()) malformed(origin, std::string("empty key in '") + section + "'");
        table[key] = kv.second.IsNull() ? std::string() : kv.second.as<std::string>();
    }
    return table;
}

} // namespace

MappingStore parse_config(const std::string& text, const std::string& origin){
    TRACE_FN("origin=", origin);
    try {
        YAML::Node root = YAML::Load(text);
        if(!root.IsMap()) malformed(origin, "top level must be a mapping");

        MappingStore store;

        YAML::Node general = require_map(root, "general", origin);
        store.general.command_style = require_string(general, "command_style", origin, "general");
        store.general.folder_style = require_string(general, "folder_style", origin, "general");

        YAML::Node shells = require_map(root, "shells", origin);
        store.shells.default_shell = require_string(shells, "default", origin, "shells");
        YAML::Node enabled = shells["enabled"];
        if(!enabled.IsDefined()) malformed(origin, "missing key 'shells.enabled'");
        if(!enabled.IsNull()){
            if(!enabled.IsSequence()) malformed(origin, "'shells.enabled' must be a list");
            for(const auto& item : enabled){
                if(!item.IsScalar()) malformed(origin, "'shells.enabled' must contain strings");
                std::string name = item.as<std::string>();
                auto& list = store.shells.enabled_shells;
                if(std::find(list.begin(), list.end(), name) == list.end()) list.push_back(name);
            }
        }
        std::string policy = require_string(shells, "on_new_shell", origin, "shells");
        auto parsed = parse_new_shell_policy(policy);
        if(!parsed) malformed(origin, "unknown 'shells.on_new_shell' value '" + policy + "'");
        store.shells.on_new_shell = *parsed;

        store.command_map = read_table(require_map(root, "commands", origin), origin, "commands");
        store.path_map = read_table(require_map(root, "paths", origin), origin, "paths");
        return store;
    } catch(const YAML::Exception& e){
        malformed(origin, e.what());
    }
}

//
// ConfigStore
//
MappingStore ConfigStore::load() const {
    const std::string origin = paths_.config_file.string();
    TRACE_FN("path=", origin);

    std::error_code ec;
    if(!fs::exists(paths_.config_file, ec)){
        std::error_code legacy_ec;
        if(fs::exists(paths_.legacy_file, legacy_ec)){
            throw SemanticError(ErrorKind::ConfigUnreadable,
                                origin + ": not found; " + paths_.legacy_file.string() +
                                " is from an older release and is no longer read, run `semantic` to recreate it");
        }
        throw SemanticError(ErrorKind::ConfigUnreadable,
                            origin + ": " + (ec ? ec.message() : std::string(std::strerror(ENOENT))));
    }
    if(fs::is_directory(paths_.config_file, ec)){
        throw SemanticError(ErrorKind::ConfigUnreadable, origin + ": " + std::strerror(EISDIR));
    }

    errno = 0;
    std::ifstream in(paths_.config_file, std::ios::binary);
    if(!in){
        int err = errno;
        throw SemanticError(ErrorKind::ConfigUnreadable,
                            origin + ": " + (err ? std::strerror(err) : "cannot open file"));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if(in.bad()){
        throw SemanticError(ErrorKind::ConfigUnreadable, origin + ": read error");
    }
    return parse_config(buf.str(), origin);
}

void ConfigStore::save(const MappingStore& store){
    TRACE_FN("path=", paths_.config_file.string());
    const std::string text = serialize_config(store);

    std::error_code ec;
    fs::create_directories(paths_.config_dir, ec);
    if(ec){
        throw SemanticError(ErrorKind::ConfigWriteFailed,
                            paths_.config_dir.string() + ": " + ec.message());
    }

    // Write a sibling temp file and rename it over the target so readers
    // never observe a partially written config.
    fs::path tmp = paths_.config_file;
    tmp += ".tmp." + std::to_string(::getpid());
    {
        errno = 0;
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if(!out){
            int err = errno;
            throw SemanticError(ErrorKind::ConfigWriteFailed,
                                tmp.string() + ": " + (err ? std::strerror(err) : "cannot create file"));
        }
        out << text;
        out.flush();
        if(!out){
            out.close();
            fs::remove(tmp, ec);
            throw SemanticError(ErrorKind::ConfigWriteFailed, tmp.string() + ": write error");
        }
    }

    fs::rename(tmp, paths_.config_file, ec);
    if(ec){
        std::string reason = ec.message();
        std::error_code ignore;
        fs::remove(tmp, ignore);
        throw SemanticError(ErrorKind::ConfigWriteFailed,
                            paths_.config_file.string() + ": " + reason);
    }
    TRACE_MSG("config saved: ", paths_.config_file.string());
}
