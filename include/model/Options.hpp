#pragma once
#include <cstddef>
#include <cstdint>

namespace sift::model {

enum class MatchMode : uint8_t { LeftmostFirst, LeftmostLongest };

// Which executor runs a search. Auto picks per call from program and input size.
enum class MatchEngine : uint8_t { Auto, PikeVM, Backtrack, Literals };

struct Options {
  MatchMode mode{MatchMode::LeftmostFirst};
  bool case_insensitive{false};
  bool multi_line{false};            // ^ and $ match at line boundaries
  size_t size_limit{1u << 18};       // maximum instruction count
  size_t backtrack_budget{256 * 1024}; // visited bitmap bytes
  MatchEngine engine{MatchEngine::Auto};
  bool use_prefixes{true};
};

[[nodiscard]] const char* to_string(MatchMode mode);
[[nodiscard]] const char* to_string(MatchEngine engine);

} // namespace sift::model
