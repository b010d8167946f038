#pragma once
#include "util/CharClass.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sift::model {

enum class AnchorKind : uint8_t {
  StartLine,       // start of input or after \n
  EndLine,         // end of input or before \n
  StartText,
  EndText,
  WordBoundary,    // word char on exactly one side
  NotWordBoundary
};

enum class NodeKind : uint8_t {
  Empty,      // matches the empty string
  Literal,    // code point sequence
  Concat,
  Alternate,  // children in priority order
  Repeat,
  Class,
  Capture,
  Group,      // non-capturing
  Anchor
};

// Syntax tree node. Only the fields relevant to `kind` are meaningful;
// Repeat, Capture and Group keep their operand in children[0].
struct Node {
  NodeKind kind{NodeKind::Empty};
  std::u32string literal;
  std::vector<Node> children;
  uint32_t min{0};
  std::optional<uint32_t> max;        // nullopt = unbounded
  bool greedy{true};
  util::CharClass cls;
  uint32_t index{0};                  // capture index, >= 1
  std::optional<std::string> name;
  AnchorKind anchor{AnchorKind::StartText};

  static Node empty() { return Node{}; }
  static Node lit(std::u32string s);
  static Node lit(char32_t c) { return lit(std::u32string(1, c)); }
  static Node concat(std::vector<Node> items);
  static Node alternate(std::vector<Node> items);
  static Node repeat(Node child, uint32_t min, std::optional<uint32_t> max, bool greedy = true);
  static Node star(Node child, bool greedy = true) { return repeat(std::move(child), 0, std::nullopt, greedy); }
  static Node plus(Node child, bool greedy = true) { return repeat(std::move(child), 1, std::nullopt, greedy); }
  static Node zero_or_one(Node child, bool greedy = true) { return repeat(std::move(child), 0, 1, greedy); }
  static Node klass(util::CharClass cls);
  static Node capture(uint32_t index, Node child, std::optional<std::string> name = std::nullopt);
  static Node group(Node child);
  static Node assertion(AnchorKind kind);
};

// Parsed pattern: the root plus the capture groups it declares.
// cap_names[0] is the implicit whole-match group and is always unnamed.
struct SyntaxTree {
  Node root;
  std::vector<std::optional<std::string>> cap_names{std::nullopt};

  [[nodiscard]] size_t capture_count() const { return cap_names.size(); }
};

// Debug rendering, e.g. cat(lit("ab"), star(class[0-9])).
[[nodiscard]] std::string to_string(const Node& node);

} // namespace sift::model
