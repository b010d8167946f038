#include "engine/Compiler.hpp"
#include "util/Log.hpp"
#include <algorithm>
#include <set>
#include <string>
#include <utility>

namespace sift::engine {

using model::ErrorKind;
using model::Node;
using model::NodeKind;

Compiler::Compiler(const model::Options& options) : options_(options) {}

std::optional<Program> Compiler::compile(const model::SyntaxTree& tree, model::Error& err) {
    insts_.clear();
    classes_.clear();
    err_ = model::Error{};

    bool ok = validate_captures(tree);
    if (ok) {
        push(Inst::save(0));
        ok = c(tree.root);
    }
    if (ok) {
        push(Inst::save(1));
        push(Inst::match());
        ok = check_size();
    }
    if (!ok) {
        err = err_;
        util::log_error("Compiler", "%s: %s", model::to_string(err.kind), err.message.c_str());
        insts_.clear();
        classes_.clear();
        return std::nullopt;
    }

    Program prog;
    prog.insts = std::move(insts_);
    prog.classes = std::move(classes_);
    prog.cap_names = tree.cap_names;
    prog.mode = options_.mode;

    const auto& first = prog.insts[1];
    prog.anchored_begin = first.op == Op::ASSERT && first.anchor() == model::AnchorKind::StartText;
    prog.anchored_end = ends_at_text_end(prog);

    prog.prefixes = extract_prefixes(prog);
    util::log_debug("Compiler", "%zu instructions, %zu classes, %zu prefixes%s",
                    prog.len(), prog.classes.size(), prog.prefixes.size(),
                    prog.prefixes.complete() ? " (complete)" : "");
    err = model::Error{};
    return prog;
}

// The ASSERT before save 1 only anchors every match if no edge lands past it.
bool Compiler::ends_at_text_end(const Program& prog) {
    const size_t guard = prog.len() - 3;
    const auto& last = prog.insts[guard];
    if (last.op != Op::ASSERT || last.anchor() != model::AnchorKind::EndText) return false;
    for (const auto& inst : prog.insts) {
        if (inst.op == Op::JUMP && inst.x > guard) return false;
        if (inst.op == Op::SPLIT && (inst.x > guard || inst.y > guard)) return false;
    }
    return true;
}

// ── Validation ──

bool Compiler::validate_captures(const model::SyntaxTree& tree) {
    std::set<uint32_t> seen;
    std::vector<const Node*> stack{&tree.root};
    while (!stack.empty()) {
        const Node* n = stack.back();
        stack.pop_back();
        if (n->kind == NodeKind::Capture) {
            if (n->index == 0)
                return fail(ErrorKind::InvalidCaptureReference, "capture index 0 is reserved for the whole match");
            if (n->index >= tree.cap_names.size())
                return fail(ErrorKind::InvalidCaptureReference,
                            "capture index " + std::to_string(n->index) + " is not declared");
            if (!seen.insert(n->index).second)
                return fail(ErrorKind::InvalidCaptureReference,
                            "capture index " + std::to_string(n->index) + " declared twice");
        }
        for (const auto& child : n->children) stack.push_back(&child);
    }
    return true;
}

// ── Lowering ──

bool Compiler::c(const Node& node) {
    bool ok = true;
    switch (node.kind) {
        case NodeKind::Empty:
            break;
        case NodeKind::Literal:
            ok = c_literal(node.literal);
            break;
        case NodeKind::Concat:
            for (const auto& child : node.children) {
                if (!c(child)) return false;
            }
            break;
        case NodeKind::Alternate:
            ok = c_alternate(node.children);
            break;
        case NodeKind::Repeat:
            ok = c_repeat(node);
            break;
        case NodeKind::Class:
            ok = c_class(node.cls);
            break;
        case NodeKind::Capture:
            push(Inst::save(2 * node.index));
            ok = c(node.children[0]);
            push(Inst::save(2 * node.index + 1));
            break;
        case NodeKind::Group:
            ok = c(node.children[0]);
            break;
        case NodeKind::Anchor:
            push(Inst::assertion(node.anchor));
            break;
    }
    return ok && check_size();
}

bool Compiler::c_literal(const std::u32string& lit) {
    for (char32_t ch : lit) {
        auto cp = static_cast<uint32_t>(ch);
        if (cp > util::CharClass::MAX_CODEPOINT || (cp >= 0xD800 && cp <= 0xDFFF))
            return fail(ErrorKind::UnsupportedConstruct, "literal is not a Unicode scalar value");
        if (options_.case_insensitive && util::simple_fold(cp)) {
            if (!c_class(util::CharClass::single(cp))) return false;
        } else {
            push(Inst::chr(cp));
        }
    }
    return true;
}

bool Compiler::c_class(util::CharClass cls) {
    if (options_.case_insensitive) cls.case_fold();
    if (auto cp = cls.single_codepoint()) {
        push(Inst::chr(*cp));
        return true;
    }
    classes_.push_back(std::move(cls));
    push(Inst::ranges(static_cast<uint32_t>(classes_.size() - 1)));
    return true;
}

// split L1, L2; L1: a; jump end; L2: split L3, L4; ... ; end:
bool Compiler::c_alternate(const std::vector<Node>& alts) {
    if (alts.empty()) return true;
    std::vector<uint32_t> jumps;
    for (size_t i = 0; i + 1 < alts.size(); ++i) {
        uint32_t split = empty_split();
        uint32_t primary = pc();
        if (!c(alts[i])) return false;
        jumps.push_back(empty_jump());
        set_split(split, primary, pc());
    }
    if (!c(alts.back())) return false;
    for (uint32_t j : jumps) set_jump(j, pc());
    return true;
}

bool Compiler::c_zero_or_one(const Node& child, bool greedy) {
    uint32_t split = empty_split();
    if (!c(child)) return false;
    if (greedy) set_split(split, split + 1, pc());
    else set_split(split, pc(), split + 1);
    return true;
}

bool Compiler::c_star(const Node& child, bool greedy) {
    uint32_t loop = empty_split();
    if (!c(child)) return false;
    push(Inst::jump(loop));
    if (greedy) set_split(loop, loop + 1, pc());
    else set_split(loop, pc(), loop + 1);
    return true;
}

bool Compiler::c_plus(const Node& child, bool greedy) {
    uint32_t body = pc();
    if (!c(child)) return false;
    uint32_t split = empty_split();
    if (greedy) set_split(split, body, pc());
    else set_split(split, pc(), body);
    return true;
}

bool Compiler::c_repeat(const Node& node) {
    const Node& child = node.children[0];
    const uint32_t min = node.min;
    const auto max = node.max;
    const bool greedy = node.greedy;

    if (max && min > *max)
        return fail(ErrorKind::UnsupportedConstruct,
                    "repetition minimum " + std::to_string(min) + " exceeds maximum " + std::to_string(*max));

    if (!max) {
        if (min == 0) return c_star(child, greedy);
        if (min == 1) return c_plus(child, greedy);
    } else {
        if (*max == 0) return true;
        if (min == 0 && *max == 1) return c_zero_or_one(child, greedy);
    }

    // Emit the first copy, then project the full unrolled size from it so
    // huge bounds fail before anything else is allocated.
    std::vector<uint32_t> holes;
    if (min == 0) holes.push_back(empty_split());
    const size_t before = insts_.size();
    if (!c(child)) return false;
    const size_t one = insts_.size() - before;
    if (one == 0) {
        // Child emits nothing, so every copy is the same empty program
        for (uint32_t h : holes) set_split(h, pc(), pc());
        return true;
    }
    const size_t copies = max ? *max : min;
    const size_t splits = max ? *max - std::max<uint32_t>(min, 1) : 1;
    if (insts_.size() + (copies - 1) * one + splits > options_.size_limit)
        return fail(ErrorKind::SizeLimitExceeded,
                    "repetition of " + std::to_string(copies) + " copies exceeds the size limit of "
                    + std::to_string(options_.size_limit) + " instructions");

    if (!max) {
        // (min - 1) mandatory copies followed by a plus
        for (uint32_t i = 2; i < min; ++i) {
            if (!c(child)) return false;
        }
        return c_plus(child, greedy);
    }

    for (uint32_t i = 1; i < min; ++i) {
        if (!c(child)) return false;
    }
    // Optional copies nest: once one is skipped, all later ones are too
    for (uint32_t i = std::max<uint32_t>(min, 1); i < *max; ++i) {
        holes.push_back(empty_split());
        if (!c(child)) return false;
    }
    const uint32_t end = pc();
    for (uint32_t h : holes) {
        if (greedy) set_split(h, h + 1, end);
        else set_split(h, end, h + 1);
    }
    return true;
}

// ── Helpers ──

uint32_t Compiler::empty_split() {
    push(Inst::split(0, 0));
    return pc() - 1;
}

uint32_t Compiler::empty_jump() {
    push(Inst::jump(0));
    return pc() - 1;
}

void Compiler::set_split(uint32_t at, uint32_t primary, uint32_t secondary) {
    insts_[at].x = primary;
    insts_[at].y = secondary;
}

void Compiler::set_jump(uint32_t at, uint32_t target) {
    insts_[at].x = target;
}

bool Compiler::check_size() {
    if (insts_.size() <= options_.size_limit) return true;
    return fail(ErrorKind::SizeLimitExceeded,
                "compiled program exceeds the size limit of " + std::to_string(options_.size_limit)
                + " instructions");
}

bool Compiler::fail(ErrorKind kind, std::string msg) {
    err_.kind = kind;
    err_.message = std::move(msg);
    err_.offset = 0;
    return false;
}

std::optional<Program> compile(const model::SyntaxTree& tree, const model::Options& options,
                               model::Error& err) {
    return Compiler(options).compile(tree, err);
}

} // namespace sift::engine
