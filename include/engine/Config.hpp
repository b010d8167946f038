#pragma once
#include "model/Options.hpp"
#include "util/TomlReader.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace sift::engine {

// Default config location: $XDG_CONFIG_HOME/sift/config.toml, falling back
// to ~/.config/sift/config.toml. Empty when neither variable is set.
std::string config_file_path();

// Options from the [regex] section of the TOML file at `path`, then SIFT_*
// environment variables, then compiled defaults. A missing or unreadable
// file behaves like an empty one.
model::Options load_options(const std::string& path);
model::Options load_options();

// Per-key resolution over an already parsed file.
model::Options resolve_options(const util::TomlReader& toml, bool have_toml);

// "first" / "leftmost-first", "longest" / "leftmost-longest".
std::optional<model::MatchMode> parse_match_mode(std::string_view s);
// "auto", "pikevm", "backtrack", "literals".
std::optional<model::MatchEngine> parse_engine(std::string_view s);

} // namespace sift::engine
