#ifndef _Semantic_presets_h_
#define _Semantic_presets_h_

// semantic token -> real command, or virtual path -> real path
using AliasTable = std::map<std::string, std::string>;

enum class Style { Natural, Traditional, Verbose };

// Unrecognized names resolve to Style::Traditional.
Style parse_style(const std::string& name);
const char* style_name(Style style);

AliasTable build_preset(Style style);
AliasTable build_path_preset(Style style);

inline AliasTable build_preset(const std::string& style){ return build_preset(parse_style(style)); }
inline AliasTable build_path_preset(const std::string& style){ return build_path_preset(parse_style(style)); }

#endif
