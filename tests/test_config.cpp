#include "minitest.hpp"
#include "engine/Config.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace sift;

static std::string tmp_path(const char* suffix) {
  return std::string("/tmp/sift_test_config_") + suffix + ".toml";
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

// Clears every variable the loader reads, both spellings.
static void clear_env() {
  for (const char* name : {"MODE", "ENGINE", "CASE_INSENSITIVE", "MULTI_LINE", "PREFIXES",
                           "SIZE_LIMIT", "BACKTRACK_BUDGET"}) {
    ::unsetenv((std::string("SIFT_") + name).c_str());
    ::unsetenv((std::string("sift_") + name).c_str());
  }
}

// ============================================================================
// TOML READER
// ============================================================================

TEST(toml_sections_and_types) {
  util::TomlReader tr;
  tr.parse("top = 1\n[regex]\nmode = \"longest\"  # trailing\nsize_limit = 1024\nmulti_line = true\n");
  ASSERT_EQ(tr.get_size("", "top"), 1u);
  ASSERT_EQ(tr.get_string("regex", "mode"), "longest");
  ASSERT_EQ(tr.get_size("regex", "size_limit"), 1024u);
  ASSERT_TRUE(tr.get_bool("regex", "multi_line"));
  ASSERT_TRUE(tr.has("regex", "mode"));
  ASSERT_FALSE(tr.has("regex", "engine"));
  ASSERT_FALSE(tr.has("other", "mode"));
}

TEST(toml_defaults_and_bad_values) {
  util::TomlReader tr;
  tr.parse("[regex]\nsize_limit = lots\ncase_insensitive = maybe\n");
  ASSERT_EQ(tr.get_size("regex", "size_limit", 7), 7u);
  ASSERT_TRUE(tr.get_bool("regex", "case_insensitive", true));
  ASSERT_EQ(tr.get_string("regex", "missing", "fallback"), "fallback");
}

TEST(toml_hash_inside_quotes_kept) {
  util::TomlReader tr;
  tr.parse("[regex]\nnote = \"a # b\" # comment\n");
  ASSERT_EQ(tr.get_string("regex", "note"), "a # b");
}

TEST(toml_malformed_lines_reported) {
  util::TomlReader tr;
  tr.parse("[regex\nmode = first\njunk\n= 3\n");
  ASSERT_EQ(tr.malformed_lines().size(), 3u);
  ASSERT_EQ(tr.malformed_lines()[0], 1u);
  ASSERT_EQ(tr.malformed_lines()[1], 3u);
  ASSERT_EQ(tr.malformed_lines()[2], 4u);
}

TEST(toml_load_missing_file) {
  util::TomlReader tr;
  ASSERT_FALSE(tr.load("/tmp/sift_test_config_does_not_exist.toml"));
}

// ============================================================================
// OPTION RESOLUTION
// ============================================================================

TEST(config_parsers) {
  ASSERT_EQ(engine::parse_match_mode("First"), std::optional<model::MatchMode>(model::MatchMode::LeftmostFirst));
  ASSERT_EQ(engine::parse_match_mode("leftmost-longest"), std::optional<model::MatchMode>(model::MatchMode::LeftmostLongest));
  ASSERT_FALSE(engine::parse_match_mode("posix").has_value());
  ASSERT_EQ(engine::parse_engine("PikeVM"), std::optional<model::MatchEngine>(model::MatchEngine::PikeVM));
  ASSERT_EQ(engine::parse_engine("literals"), std::optional<model::MatchEngine>(model::MatchEngine::Literals));
  ASSERT_FALSE(engine::parse_engine("dfa").has_value());
}

TEST(config_defaults_without_file_or_env) {
  clear_env();
  auto o = engine::load_options(std::string());
  ASSERT_EQ(o.mode, model::MatchMode::LeftmostFirst);
  ASSERT_FALSE(o.case_insensitive);
  ASSERT_FALSE(o.multi_line);
  ASSERT_EQ(o.size_limit, static_cast<size_t>(1u << 18));
  ASSERT_EQ(o.backtrack_budget, static_cast<size_t>(256 * 1024));
  ASSERT_EQ(o.engine, model::MatchEngine::Auto);
  ASSERT_TRUE(o.use_prefixes);
}

TEST(config_file_values) {
  clear_env();
  auto path = tmp_path("values");
  write_file(path,
    "[regex]\n"
    "mode = \"longest\"\n"
    "case_insensitive = true\n"
    "multi_line = true\n"
    "size_limit = 5000\n"
    "backtrack_budget = 4096\n"
    "engine = \"backtrack\"\n"
    "prefixes = false\n");
  auto o = engine::load_options(path);
  ASSERT_EQ(o.mode, model::MatchMode::LeftmostLongest);
  ASSERT_TRUE(o.case_insensitive);
  ASSERT_TRUE(o.multi_line);
  ASSERT_EQ(o.size_limit, 5000u);
  ASSERT_EQ(o.backtrack_budget, 4096u);
  ASSERT_EQ(o.engine, model::MatchEngine::Backtrack);
  ASSERT_FALSE(o.use_prefixes);
  remove_file(path);
}

TEST(config_env_fills_keys_missing_from_file) {
  clear_env();
  auto path = tmp_path("env");
  write_file(path, "[regex]\nsize_limit = 100\n");
  ::setenv("SIFT_SIZE_LIMIT", "999", 1);
  ::setenv("sift_MODE", "longest", 1);
  ::setenv("SIFT_PREFIXES", "0", 1);
  auto o = engine::load_options(path);
  // The file wins over the environment
  ASSERT_EQ(o.size_limit, 100u);
  ASSERT_EQ(o.mode, model::MatchMode::LeftmostLongest);
  ASSERT_FALSE(o.use_prefixes);
  clear_env();
  remove_file(path);
}

TEST(config_unknown_values_keep_defaults) {
  clear_env();
  util::TomlReader tr;
  tr.parse("[regex]\nmode = \"posix\"\nengine = \"jit\"\n");
  auto o = engine::resolve_options(tr, true);
  ASSERT_EQ(o.mode, model::MatchMode::LeftmostFirst);
  ASSERT_EQ(o.engine, model::MatchEngine::Auto);
}

TEST(config_ignores_other_sections) {
  clear_env();
  util::TomlReader tr;
  tr.parse("[ui]\nmode = \"longest\"\n");
  ASSERT_EQ(engine::resolve_options(tr, true).mode, model::MatchMode::LeftmostFirst);
}

TEST(config_file_path_follows_xdg) {
  const char* old = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old ? old : "";
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
  ASSERT_EQ(engine::config_file_path(), "/tmp/xdg/sift/config.toml");
  if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
  else ::unsetenv("XDG_CONFIG_HOME");
}
