#include "engine/PikeVM.hpp"
#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

namespace sift::engine {

namespace {

// Sparse set of program counters with one capture-slot row per pc.
// Insertion order is thread priority.
class ThreadList {
public:
    ThreadList(size_t insts, size_t nslots)
        : dense_(insts), sparse_(insts), slots_(insts * nslots), nslots_(nslots) {}

    [[nodiscard]] bool contains(uint32_t pc) const {
        uint32_t i = sparse_[pc];
        return i < size_ && dense_[i] == pc;
    }

    void insert(uint32_t pc) {
        sparse_[pc] = static_cast<uint32_t>(size_);
        dense_[size_++] = pc;
    }

    void clear() { size_ = 0; }
    [[nodiscard]] bool empty() const { return size_ == 0; }
    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] uint32_t pc_at(size_t i) const { return dense_[i]; }

    std::optional<size_t>* row(uint32_t pc) { return slots_.data() + static_cast<size_t>(pc) * nslots_; }

private:
    std::vector<uint32_t> dense_;
    std::vector<uint32_t> sparse_;
    model::Slots slots_;
    size_t size_{0};
    size_t nslots_;
};

struct Frame {
    enum class Kind : uint8_t { Explore, Restore } kind;
    uint32_t pc_or_slot;
    std::optional<size_t> old;
};

class Search {
public:
    Search(const Program& prog, std::u32string_view text)
        : prog_(prog), text_(text), nslots_(prog.num_slots()),
          clist_(prog.len(), nslots_), nlist_(prog.len(), nslots_),
          scratch_(nslots_), best_(nslots_) {}

    bool run(size_t start, bool use_prefixes, model::Slots& out) {
        const size_t n = text_.size();
        const bool longest = prog_.mode == model::MatchMode::LeftmostLongest;
        const bool skip = use_prefixes && !prog_.prefixes.empty() && !prog_.anchored_begin;
        bool matched = false;
        size_t at = start;

        while (true) {
            if (clist_.empty()) {
                if (matched) break;
                if (prog_.anchored_begin && at > 0) break;
                if (skip) {
                    size_t next = prog_.prefixes.find(text_, at);
                    if (next == Prefixes::NPOS) break;
                    at = next;
                }
            }
            // New start threads have the lowest priority of the step
            if (!matched && (!prog_.anchored_begin || at == 0)) {
                std::fill(scratch_.begin(), scratch_.end(), std::nullopt);
                add(clist_, 0, at);
            }

            const uint32_t c = at < n ? static_cast<uint32_t>(text_[at]) : 0;
            for (size_t i = 0; i < clist_.size(); ++i) {
                const uint32_t pc = clist_.pc_at(i);
                const Inst& inst = prog_.insts[pc];
                auto* row = clist_.row(pc);
                if (inst.op == Op::MATCH) {
                    if (!longest) {
                        std::copy(row, row + nslots_, best_.begin());
                        matched = true;
                        break;   // lower-priority threads lose to this match
                    }
                    if (!matched || *row[0] < *best_[0]
                        || (*row[0] == *best_[0] && *row[1] > *best_[1])) {
                        std::copy(row, row + nslots_, best_.begin());
                        matched = true;
                    }
                    continue;
                }
                if (inst.op != Op::CHAR && inst.op != Op::RANGES) continue;
                if (longest && matched && *row[0] > *best_[0]) continue;
                if (at < n && prog_.consumes(inst, c)) {
                    std::copy(row, row + nslots_, scratch_.begin());
                    add(nlist_, pc + 1, at + 1);
                }
            }
            std::swap(clist_, nlist_);
            nlist_.clear();
            if (at >= n) break;
            ++at;
        }

        if (matched) out = best_;
        return matched;
    }

private:
    const Program& prog_;
    std::u32string_view text_;
    size_t nslots_;
    ThreadList clist_;
    ThreadList nlist_;
    model::Slots scratch_;
    model::Slots best_;
    std::vector<Frame> stack_;

    // Epsilon closure of pc at offset `at`, following splits primary first.
    // Slot writes are undone on the way back so sibling branches see the
    // slots as they were at the split.
    void add(ThreadList& list, uint32_t pc0, size_t at) {
        stack_.push_back({Frame::Kind::Explore, pc0, std::nullopt});
        while (!stack_.empty()) {
            Frame f = stack_.back();
            stack_.pop_back();
            if (f.kind == Frame::Kind::Restore) {
                scratch_[f.pc_or_slot] = f.old;
                continue;
            }
            uint32_t pc = f.pc_or_slot;
            while (!list.contains(pc)) {
                list.insert(pc);
                const Inst& inst = prog_.insts[pc];
                if (inst.op == Op::JUMP) {
                    pc = inst.x;
                } else if (inst.op == Op::SPLIT) {
                    stack_.push_back({Frame::Kind::Explore, inst.y, std::nullopt});
                    pc = inst.x;
                } else if (inst.op == Op::SAVE) {
                    if (inst.x < nslots_) {
                        stack_.push_back({Frame::Kind::Restore, inst.x, scratch_[inst.x]});
                        scratch_[inst.x] = at;
                    }
                    ++pc;
                } else if (inst.op == Op::ASSERT) {
                    if (!assertion_holds(inst.anchor(), text_, at)) break;
                    ++pc;
                } else {
                    std::copy(scratch_.begin(), scratch_.end(), list.row(pc));
                    break;
                }
            }
        }
    }
};

} // namespace

bool PikeVM::exec(std::u32string_view text, size_t start, model::Slots& slots,
                  bool use_prefixes) const {
    if (start > text.size()) return false;
    Search search(prog_, text);
    return search.run(start, use_prefixes, slots);
}

} // namespace sift::engine
