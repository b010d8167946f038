#pragma once

#include "engine/Literals.hpp"
#include "model/Ast.hpp"
#include "model/Options.hpp"
#include "util/CharClass.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sift::engine {

enum class Op : uint8_t {
    MATCH,    // accept; always the last instruction
    SAVE,     // record the current offset in slot x
    JUMP,     // goto x
    SPLIT,    // fork to x and y, preferring x
    ASSERT,   // zero-width check of kind x (model::AnchorKind)
    CHAR,     // consume code point x
    RANGES,   // consume a code point in classes[x]
};

struct Inst {
    Op       op;
    uint32_t x{0};
    uint32_t y{0};

    [[nodiscard]] model::AnchorKind anchor() const { return static_cast<model::AnchorKind>(x); }

    static Inst match()                         { return {Op::MATCH, 0, 0}; }
    static Inst save(uint32_t slot)             { return {Op::SAVE, slot, 0}; }
    static Inst jump(uint32_t to)               { return {Op::JUMP, to, 0}; }
    static Inst split(uint32_t a, uint32_t b)   { return {Op::SPLIT, a, b}; }
    static Inst assertion(model::AnchorKind k)  { return {Op::ASSERT, static_cast<uint32_t>(k), 0}; }
    static Inst chr(uint32_t cp)                { return {Op::CHAR, cp, 0}; }
    static Inst ranges(uint32_t cls)            { return {Op::RANGES, cls, 0}; }
};

// Compiled regular expression. Immutable once built by the Compiler; any
// number of searches may read it concurrently.
struct Program {
    std::vector<Inst> insts;
    std::vector<util::CharClass> classes;
    std::vector<std::optional<std::string>> cap_names;  // [0] = whole match
    Prefixes prefixes;
    model::MatchMode mode{model::MatchMode::LeftmostFirst};
    bool anchored_begin{false};   // every match starts at offset 0
    bool anchored_end{false};     // every match ends at the end of the text

    [[nodiscard]] size_t len() const { return insts.size(); }
    [[nodiscard]] size_t num_captures() const { return cap_names.size(); }
    [[nodiscard]] size_t num_slots() const { return 2 * cap_names.size(); }

    // Does the consuming instruction at pc accept code point c?
    [[nodiscard]] bool consumes(const Inst& inst, uint32_t c) const {
        return inst.op == Op::CHAR ? inst.x == c : classes[inst.x].contains(c);
    }

    // True if pc reaches MATCH through SAVE and JUMP only.
    [[nodiscard]] bool leads_to_match(size_t pc) const;
};

// Zero-width assertion at offset `at` of text.
[[nodiscard]] bool assertion_holds(model::AnchorKind kind, std::u32string_view text, size_t at);

// Disassembly, one instruction per line: "003 split 4, 7".
[[nodiscard]] std::string to_string(const Program& prog);

} // namespace sift::engine
