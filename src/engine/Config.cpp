#include "engine/Config.hpp"
#include "util/Env.hpp"
#include "util/Log.hpp"
#include <cctype>
#include <cstdlib>

namespace sift::engine {

static constexpr const char* SECTION = "regex";

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

std::optional<model::MatchMode> parse_match_mode(std::string_view s) {
  auto v = lower(s);
  if (v == "first" || v == "leftmost-first") return model::MatchMode::LeftmostFirst;
  if (v == "longest" || v == "leftmost-longest") return model::MatchMode::LeftmostLongest;
  return std::nullopt;
}

std::optional<model::MatchEngine> parse_engine(std::string_view s) {
  auto v = lower(s);
  if (v == "auto") return model::MatchEngine::Auto;
  if (v == "pikevm" || v == "pike") return model::MatchEngine::PikeVM;
  if (v == "backtrack") return model::MatchEngine::Backtrack;
  if (v == "literals") return model::MatchEngine::Literals;
  return std::nullopt;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/sift/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/sift/config.toml";
  return {};
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* key, const char* env_name, bool def) {
  if (have_toml && toml.has(SECTION, key))
    return toml.get_bool(SECTION, key, def);
  return util::env_flag(env_name, def);
}

// Resolve a size from TOML -> env -> compiled default
static size_t resolve_size(const util::TomlReader& toml, bool have_toml,
                           const char* key, const char* env_name, size_t def) {
  if (have_toml && toml.has(SECTION, key))
    return toml.get_size(SECTION, key, def);
  return util::getenv_size(env_name, def);
}

// Resolve a string from TOML -> env; empty when neither is set
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* key, const char* env_name) {
  if (have_toml && toml.has(SECTION, key))
    return toml.get_string(SECTION, key);
  if (const char* v = util::getenv_compat(env_name)) return v;
  return {};
}

model::Options resolve_options(const util::TomlReader& toml, bool have_toml) {
  model::Options o;

  if (auto s = resolve_string(toml, have_toml, "mode", "SIFT_MODE"); !s.empty()) {
    if (auto m = parse_match_mode(s)) o.mode = *m;
    else util::log_error("Config", "unknown match mode '%s', using leftmost-first", s.c_str());
  }
  if (auto s = resolve_string(toml, have_toml, "engine", "SIFT_ENGINE"); !s.empty()) {
    if (auto e = parse_engine(s)) o.engine = *e;
    else util::log_error("Config", "unknown engine '%s', using auto", s.c_str());
  }

  o.case_insensitive = resolve_bool(toml, have_toml, "case_insensitive", "SIFT_CASE_INSENSITIVE", o.case_insensitive);
  o.multi_line       = resolve_bool(toml, have_toml, "multi_line", "SIFT_MULTI_LINE", o.multi_line);
  o.use_prefixes     = resolve_bool(toml, have_toml, "prefixes", "SIFT_PREFIXES", o.use_prefixes);
  o.size_limit       = resolve_size(toml, have_toml, "size_limit", "SIFT_SIZE_LIMIT", o.size_limit);
  o.backtrack_budget = resolve_size(toml, have_toml, "backtrack_budget", "SIFT_BACKTRACK_BUDGET", o.backtrack_budget);

  util::log_debug("Config", "mode=%s engine=%s size_limit=%zu backtrack_budget=%zu prefixes=%d",
                  model::to_string(o.mode), model::to_string(o.engine),
                  o.size_limit, o.backtrack_budget, o.use_prefixes ? 1 : 0);
  return o;
}

model::Options load_options(const std::string& path) {
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) {
    for (size_t line : toml.malformed_lines())
      util::log_error("Config", "%s:%zu: malformed line ignored", path.c_str(), line);
  }
  return resolve_options(toml, have_toml);
}

model::Options load_options() {
  return load_options(config_file_path());
}

} // namespace sift::engine
