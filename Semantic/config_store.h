#ifndef _Semantic_config_store_h_
#define _Semantic_config_store_h_

// Persistence seam used by the wizard's commit step.
struct ConfigWriter {
    virtual ~ConfigWriter() = default;
    virtual void save(const MappingStore& store) = 0;
};

struct ConfigPaths {
    std::filesystem::path config_dir;   // <root>/semantic
    std::filesystem::path config_file;  // <root>/semantic/config.yaml
    std::filesystem::path legacy_file;  // <root>/semantic/config.toml, written by earlier releases

    static ConfigPaths from_root(const std::filesystem::path& root);
};

// Picks the config root from explicit values, first non-empty wins:
// semantic_home, xdg_config_home, home + "/.config", then "./.config".
std::filesystem::path resolve_config_root(const std::string& semantic_home,
                                          const std::string& xdg_config_home,
                                          const std::string& home);

// YAML codec for the four-section record (general, shells, commands, paths).
std::string serialize_config(const MappingStore& store);
MappingStore parse_config(const std::string& text, const std::string& origin);

class ConfigStore : public ConfigWriter {
public:
    explicit ConfigStore(ConfigPaths paths) : paths_(std::move(paths)) {}

    // Throws SemanticError (ConfigUnreadable / ConfigMalformed).
    MappingStore load() const;

    // Creates missing directories, then replaces the file atomically.
    // Throws SemanticError (ConfigWriteFailed).
    void save(const MappingStore& store) override;

    const ConfigPaths& paths() const { return paths_; }

private:
    ConfigPaths paths_;
};

#endif
