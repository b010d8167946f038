#include "model/Error.hpp"
#include "model/Options.hpp"

namespace sift::model {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::Syntax: return "syntax error";
    case ErrorKind::SizeLimitExceeded: return "size limit exceeded";
    case ErrorKind::InvalidCaptureReference: return "invalid capture reference";
    case ErrorKind::UnsupportedConstruct: return "unsupported construct";
  }
  return "unknown";
}

const char* to_string(MatchMode mode) {
  switch (mode) {
    case MatchMode::LeftmostFirst: return "leftmost-first";
    case MatchMode::LeftmostLongest: return "leftmost-longest";
  }
  return "unknown";
}

const char* to_string(MatchEngine engine) {
  switch (engine) {
    case MatchEngine::Auto: return "auto";
    case MatchEngine::PikeVM: return "pikevm";
    case MatchEngine::Backtrack: return "backtrack";
    case MatchEngine::Literals: return "literals";
  }
  return "unknown";
}

} // namespace sift::model
