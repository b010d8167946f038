#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace sift::model {

// Half-open span of code-point offsets.
struct Span {
  size_t start{};
  size_t end{};

  [[nodiscard]] size_t length() const { return end - start; }
  bool operator==(const Span&) const = default;
};

// Two slots per capture group: slots[2i] = start, slots[2i+1] = end.
using Slots = std::vector<std::optional<size_t>>;

class Captures {
public:
  explicit Captures(Slots slots) : slots_(std::move(slots)) {}

  // Number of groups, including group 0 (the whole match).
  [[nodiscard]] size_t len() const { return slots_.size() / 2; }

  // Span of group i, or nullopt when the group did not take part in the match.
  [[nodiscard]] std::optional<Span> get(size_t i) const {
    if (2 * i + 1 >= slots_.size()) return std::nullopt;
    const auto& s = slots_[2 * i];
    const auto& e = slots_[2 * i + 1];
    if (!s || !e) return std::nullopt;
    return Span{*s, *e};
  }

  [[nodiscard]] Span whole() const { return Span{slots_[0].value_or(0), slots_[1].value_or(0)}; }
  [[nodiscard]] const Slots& slots() const { return slots_; }

private:
  Slots slots_;
};

} // namespace sift::model
