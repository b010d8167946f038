#include "engine/Literals.hpp"
#include "engine/Program.hpp"
#include <utility>

namespace sift::engine {

Prefixes::Prefixes(std::vector<std::u32string> lits, bool complete)
    : lits_(std::move(lits)), complete_(complete && !lits_.empty()) {
    if (lits_.size() == 1) {
        single_.emplace(lits_[0]);
        return;
    }
    for (const auto& lit : lits_) {
        if (!lit.empty()) first_.add(static_cast<uint32_t>(lit[0]));
    }
}

bool Prefixes::literal_at(std::u32string_view text, size_t at, size_t i) const {
    const auto& lit = lits_[i];
    if (lit.size() > text.size() - at) return false;
    return text.compare(at, lit.size(), lit) == 0;
}

size_t Prefixes::find(std::u32string_view text, size_t start) const {
    if (start > text.size()) return NPOS;
    if (lits_.empty()) return start;
    if (single_) return single_->search(text, start);

    for (size_t at = start; at < text.size(); ++at) {
        if (!first_.contains(static_cast<uint32_t>(text[at]))) continue;
        for (size_t i = 0; i < lits_.size(); ++i) {
            if (literal_at(text, at, i)) return at;
        }
    }
    return NPOS;
}

std::optional<model::Span> Prefixes::find_match(std::u32string_view text, size_t start,
                                                model::MatchMode mode) const {
    if (lits_.empty()) return std::nullopt;
    size_t at = find(text, start);
    if (at == NPOS) return std::nullopt;

    std::optional<size_t> best;
    for (size_t i = 0; i < lits_.size(); ++i) {
        if (!literal_at(text, at, i)) continue;
        if (mode == model::MatchMode::LeftmostFirst) {
            best = i;
            break;
        }
        if (!best || lits_[i].size() > lits_[*best].size()) best = i;
    }
    if (!best) return std::nullopt;
    return model::Span{at, at + lits_[*best].size()};
}

// ── Extraction ──

namespace {

struct Walk {
    std::vector<std::u32string> alts;
    bool complete{false};
};

// Literal strings spelled by the straight-line code starting at pc.
// Alternatives grow in lock step, so checking one length bounds them all.
Walk prefixes_from(const Program& prog, size_t pc) {
    Walk w;
    w.complete = true;
    w.alts.emplace_back();
    size_t steps = 0;
    while (pc < prog.len()) {
        if (++steps > prog.len()) {
            w.complete = false;
            break;
        }
        const Inst& inst = prog.insts[pc];
        const bool consuming = inst.op == Op::CHAR || inst.op == Op::RANGES;
        if (consuming && w.alts[0].size() >= Prefixes::MAX_LENGTH) {
            w.complete = false;
            break;
        }
        if (inst.op == Op::SAVE) {
            ++pc;
        } else if (inst.op == Op::JUMP) {
            pc = inst.x;
        } else if (inst.op == Op::CHAR) {
            for (auto& alt : w.alts) alt.push_back(static_cast<char32_t>(inst.x));
            ++pc;
        } else if (inst.op == Op::RANGES) {
            const auto& cls = prog.classes[inst.x];
            const size_t n = cls.count();
            if (n == 0) {
                // Nothing can be consumed here
                return Walk{};
            }
            if (w.alts.size() * n > Prefixes::MAX_ALTERNATIVES) {
                w.complete = false;
                break;
            }
            std::vector<std::u32string> grown;
            grown.reserve(w.alts.size() * n);
            for (const auto& r : cls.ranges()) {
                for (uint32_t c = r.lo; c <= r.hi; ++c) {
                    for (const auto& alt : w.alts) {
                        grown.push_back(alt);
                        grown.back().push_back(static_cast<char32_t>(c));
                    }
                }
            }
            w.alts = std::move(grown);
            ++pc;
        } else {
            w.complete = prog.leads_to_match(pc);
            break;
        }
    }
    if (w.alts[0].empty()) return Walk{};
    return w;
}

} // namespace

Prefixes extract_prefixes(const Program& prog) {
    if (prog.len() < 2) return {};

    Walk head = prefixes_from(prog, 1);
    if (!head.alts.empty()) return Prefixes(std::move(head.alts), head.complete);

    // Top-level alternation: a chain of splits whose arms all start with literals
    std::vector<std::u32string> lits;
    bool complete = true;
    size_t pc = 1;
    for (size_t guard = 0; guard <= prog.len() && prog.insts[pc].op == Op::SPLIT; ++guard) {
        const Inst& split = prog.insts[pc];
        const bool x_split = prog.insts[split.x].op == Op::SPLIT;
        const bool y_split = prog.insts[split.y].op == Op::SPLIT;
        if (x_split && y_split) return {};

        Walk xw = x_split ? Walk{} : prefixes_from(prog, split.x);
        Walk yw = y_split ? Walk{} : prefixes_from(prog, split.y);
        bool done = false;
        if (y_split) {
            if (xw.alts.empty()) return {};
            complete = complete && xw.complete;
            lits.insert(lits.end(), xw.alts.begin(), xw.alts.end());
            pc = split.y;
        } else if (x_split) {
            if (yw.alts.empty()) return {};
            // Secondary arm collected before the primary; priority order is lost
            complete = false;
            lits.insert(lits.end(), yw.alts.begin(), yw.alts.end());
            pc = split.x;
        } else {
            if (xw.alts.empty() || yw.alts.empty()) return {};
            complete = complete && xw.complete && yw.complete;
            lits.insert(lits.end(), xw.alts.begin(), xw.alts.end());
            lits.insert(lits.end(), yw.alts.begin(), yw.alts.end());
            done = true;
        }
        if (lits.size() > Prefixes::MAX_ALTERNATIVES) return {};
        if (done) return Prefixes(std::move(lits), complete);
    }
    return {};
}

} // namespace sift::engine
