#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace sift::model {

enum class ErrorKind : uint8_t {
  None,
  Syntax,                  // pattern text could not be parsed
  SizeLimitExceeded,       // compiled program above the configured instruction limit
  InvalidCaptureReference, // capture index 0, undeclared, or declared twice
  UnsupportedConstruct     // node the compiler cannot lower (e.g. min > max)
};

struct Error {
  ErrorKind kind{ErrorKind::None};
  std::string message;
  size_t offset{0};        // byte offset into the pattern (Syntax only)

  explicit operator bool() const { return kind != ErrorKind::None; }
};

[[nodiscard]] const char* to_string(ErrorKind kind);

} // namespace sift::model
