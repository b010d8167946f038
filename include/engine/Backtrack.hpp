#pragma once

#include "engine/Program.hpp"
#include "model/Match.hpp"
#include <cstddef>
#include <string_view>

namespace sift::engine {

// Bounded backtracking executor.
// A visited bitmap over (pc, offset) pairs guarantees each pair is explored
// at most once per search, so the running time is linear in
// len(program) * len(text) like the Pike VM, at the cost of the bitmap.
class Backtracker {
public:
    explicit Backtracker(const Program& prog) : prog_(prog) {}

    // True when the visited bitmap for searching text[start..] fits in
    // `budget_bytes`.
    [[nodiscard]] static bool should_exec(const Program& prog, size_t text_len, size_t start,
                                          size_t budget_bytes);

    // Same contract and results as PikeVM::exec.
    [[nodiscard]] bool exec(std::u32string_view text, size_t start, model::Slots& slots,
                            bool use_prefixes) const;

private:
    const Program& prog_;
};

} // namespace sift::engine
