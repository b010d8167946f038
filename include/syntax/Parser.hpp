#pragma once

#include "model/Ast.hpp"
#include "model/Error.hpp"
#include "model/Options.hpp"
#include <optional>
#include <string_view>

namespace sift::syntax {

// Regex parser.
// UTF-8 pattern text → syntax tree. Supports:
//   literals, . [] [^] [a-z] \d \w \s (and negations), * + ? {n} {n,} {n,m}
//   (each optionally lazy with a trailing ?), | ( ) (?: ) (?P<name> ) (?<name> )
//   ^ $ \A \z \b \B, escapes \n \t \r \f \v \xHH \x{HHHH}
// Only options.multi_line is consulted (selects line or text anchors for ^ $).
// On failure returns nullopt and fills `err` with kind Syntax and the byte offset.
[[nodiscard]] std::optional<model::SyntaxTree> parse(std::string_view pattern,
                                                     const model::Options& options,
                                                     model::Error& err);

// Deepest group nesting the parser accepts.
static constexpr int MAX_NESTING = 250;

} // namespace sift::syntax
