#include "engine/Backtrack.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

namespace sift::engine {

namespace {

constexpr size_t WORD_BITS = 64;

size_t bitmap_words(size_t insts, size_t text_len, size_t start) {
    const size_t bits = insts * (text_len - start + 1);
    return (bits + WORD_BITS - 1) / WORD_BITS;
}

struct Job {
    enum class Kind : uint8_t { Explore, Restore } kind;
    uint32_t pc_or_slot;
    size_t at;
    std::optional<size_t> old;
};

class Search {
public:
    Search(const Program& prog, std::u32string_view text, size_t start)
        : prog_(prog), text_(text), base_(start),
          visited_(bitmap_words(prog.len(), text.size(), start), 0),
          slots_(prog.num_slots()) {}

    bool run(bool use_prefixes, model::Slots& out) {
        const size_t n = text_.size();
        const bool skip = use_prefixes && !prog_.prefixes.empty() && !prog_.anchored_begin;
        // The bitmap is kept across start offsets: a (pc, at) pair that
        // failed from an earlier start fails from every later one too.
        for (size_t at = base_; at <= n; ++at) {
            if (prog_.anchored_begin && at > 0) break;
            if (skip) {
                at = prog_.prefixes.find(text_, at);
                if (at == Prefixes::NPOS) break;
            }
            std::fill(slots_.begin(), slots_.end(), std::nullopt);
            if (step(at)) {
                out = best_;
                return true;
            }
        }
        return false;
    }

private:
    const Program& prog_;
    std::u32string_view text_;
    size_t base_;
    std::vector<uint64_t> visited_;
    model::Slots slots_;
    model::Slots best_;
    std::optional<size_t> best_end_;
    std::vector<Job> jobs_;

    bool first_visit(uint32_t pc, size_t at) {
        const size_t k = static_cast<size_t>(pc) * (text_.size() - base_ + 1) + (at - base_);
        uint64_t& word = visited_[k / WORD_BITS];
        const uint64_t bit = uint64_t{1} << (k % WORD_BITS);
        if (word & bit) return false;
        word |= bit;
        return true;
    }

    // Depth-first search from pc 0 at `start`, primary branches first.
    bool step(size_t start) {
        const bool longest = prog_.mode == model::MatchMode::LeftmostLongest;
        jobs_.clear();
        jobs_.push_back({Job::Kind::Explore, 0, start, std::nullopt});
        while (!jobs_.empty()) {
            Job job = jobs_.back();
            jobs_.pop_back();
            if (job.kind == Job::Kind::Restore) {
                slots_[job.pc_or_slot] = job.old;
                continue;
            }
            uint32_t pc = job.pc_or_slot;
            size_t at = job.at;
            while (first_visit(pc, at)) {
                const Inst& inst = prog_.insts[pc];
                if (inst.op == Op::MATCH) {
                    if (!longest) {
                        best_ = slots_;
                        return true;
                    }
                    // Keep looking for a longer match from the same start
                    if (!best_end_ || at > *best_end_) {
                        best_ = slots_;
                        best_end_ = at;
                    }
                    break;
                }
                if (inst.op == Op::SAVE) {
                    if (inst.x < slots_.size()) {
                        jobs_.push_back({Job::Kind::Restore, inst.x, 0, slots_[inst.x]});
                        slots_[inst.x] = at;
                    }
                    ++pc;
                } else if (inst.op == Op::JUMP) {
                    pc = inst.x;
                } else if (inst.op == Op::SPLIT) {
                    jobs_.push_back({Job::Kind::Explore, inst.y, at, std::nullopt});
                    pc = inst.x;
                } else if (inst.op == Op::ASSERT) {
                    if (!assertion_holds(inst.anchor(), text_, at)) break;
                    ++pc;
                } else {
                    if (at >= text_.size() || !prog_.consumes(inst, static_cast<uint32_t>(text_[at])))
                        break;
                    ++pc;
                    ++at;
                }
            }
        }
        return best_end_.has_value();
    }
};

} // namespace

bool Backtracker::should_exec(const Program& prog, size_t text_len, size_t start,
                              size_t budget_bytes) {
    if (start > text_len) return false;
    return bitmap_words(prog.len(), text_len, start) * sizeof(uint64_t) <= budget_bytes;
}

bool Backtracker::exec(std::u32string_view text, size_t start, model::Slots& slots,
                       bool use_prefixes) const {
    if (start > text.size()) return false;
    Search search(prog_, text, start);
    return search.run(use_prefixes, slots);
}

} // namespace sift::engine
