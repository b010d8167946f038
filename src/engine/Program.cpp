#include "engine/Program.hpp"
#include <cstdio>

namespace sift::engine {

using model::AnchorKind;

bool Program::leads_to_match(size_t pc) const {
    // Bounded by program length so a jump cycle cannot spin forever
    for (size_t steps = 0; pc < insts.size() && steps <= insts.size(); ++steps) {
        const auto& inst = insts[pc];
        switch (inst.op) {
            case Op::MATCH: return true;
            case Op::SAVE: ++pc; break;
            case Op::JUMP: pc = inst.x; break;
            default: return false;
        }
    }
    return false;
}

bool assertion_holds(AnchorKind kind, std::u32string_view text, size_t at) {
    const bool at_start = at == 0;
    const bool at_end = at >= text.size();
    switch (kind) {
        case AnchorKind::StartText: return at_start;
        case AnchorKind::EndText: return at_end;
        case AnchorKind::StartLine: return at_start || text[at - 1] == U'\n';
        case AnchorKind::EndLine: return at_end || text[at] == U'\n';
        case AnchorKind::WordBoundary:
        case AnchorKind::NotWordBoundary: {
            bool before = !at_start && util::is_word_char(static_cast<uint32_t>(text[at - 1]));
            bool after = !at_end && util::is_word_char(static_cast<uint32_t>(text[at]));
            return (kind == AnchorKind::WordBoundary) == (before != after);
        }
    }
    return false;
}

static const char* anchor_mnemonic(AnchorKind k) {
    switch (k) {
        case AnchorKind::StartLine: return "^line";
        case AnchorKind::EndLine: return "$line";
        case AnchorKind::StartText: return "^text";
        case AnchorKind::EndText: return "$text";
        case AnchorKind::WordBoundary: return "\\b";
        case AnchorKind::NotWordBoundary: return "\\B";
    }
    return "?";
}

std::string to_string(const Program& prog) {
    std::string out;
    char buf[96];
    for (size_t pc = 0; pc < prog.insts.size(); ++pc) {
        const auto& in = prog.insts[pc];
        switch (in.op) {
            case Op::MATCH:  std::snprintf(buf, sizeof(buf), "%03zu match\n", pc); break;
            case Op::SAVE:   std::snprintf(buf, sizeof(buf), "%03zu save %u\n", pc, in.x); break;
            case Op::JUMP:   std::snprintf(buf, sizeof(buf), "%03zu jump %u\n", pc, in.x); break;
            case Op::SPLIT:  std::snprintf(buf, sizeof(buf), "%03zu split %u, %u\n", pc, in.x, in.y); break;
            case Op::ASSERT: std::snprintf(buf, sizeof(buf), "%03zu assert %s\n", pc, anchor_mnemonic(in.anchor())); break;
            case Op::CHAR:   std::snprintf(buf, sizeof(buf), "%03zu char U+%04X\n", pc, in.x); break;
            case Op::RANGES: {
                const auto& cls = prog.classes[in.x];
                std::snprintf(buf, sizeof(buf), "%03zu ranges #%u (%zu ranges, %zu code points)\n",
                              pc, in.x, cls.ranges().size(), cls.count());
                break;
            }
        }
        out += buf;
    }
    return out;
}

} // namespace sift::engine
