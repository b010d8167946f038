#pragma once

#include "engine/Program.hpp"
#include "model/Match.hpp"
#include <cstddef>
#include <string_view>

namespace sift::engine {

// Thread-list simulation of a Program (Pike VM).
// O(len(program) * len(text)) time for every input. All per-search state
// lives on the call, so one PikeVM may run on many threads at once.
class PikeVM {
public:
    explicit PikeVM(const Program& prog) : prog_(prog) {}

    // Searches text for the first match starting at or after `start`.
    // On success `slots` holds the winning thread's capture slots.
    [[nodiscard]] bool exec(std::u32string_view text, size_t start, model::Slots& slots,
                            bool use_prefixes) const;

private:
    const Program& prog_;
};

} // namespace sift::engine
