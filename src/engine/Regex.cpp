#include "engine/Regex.hpp"
#include "engine/Backtrack.hpp"
#include "engine/Compiler.hpp"
#include "engine/PikeVM.hpp"
#include "syntax/Parser.hpp"
#include "util/Log.hpp"
#include "util/Utf8.hpp"
#include <utility>

namespace sift::engine {

using model::MatchEngine;
using model::Span;

std::optional<Regex> Regex::compile(std::string_view pattern, const model::Options& options,
                                    model::Error& err) {
    auto tree = syntax::parse(pattern, options, err);
    if (!tree) return std::nullopt;
    return compile(*tree, options, err);
}

std::optional<Regex> Regex::compile(const model::SyntaxTree& tree, const model::Options& options,
                                    model::Error& err) {
    auto prog = Compiler(options).compile(tree, err);
    if (!prog) return std::nullopt;
    return Regex(std::make_shared<const Program>(std::move(*prog)), options);
}

// ── Engine selection ──

bool Regex::literals_apply() const {
    return options_.use_prefixes && prog_->prefixes.complete() && prog_->num_captures() == 1;
}

MatchEngine Regex::choose_engine(size_t text_len, size_t start) const {
    switch (options_.engine) {
        case MatchEngine::PikeVM:
        case MatchEngine::Backtrack:
            return options_.engine;
        case MatchEngine::Literals:
        case MatchEngine::Auto:
            break;
    }
    if (literals_apply()) return MatchEngine::Literals;
    if (Backtracker::should_exec(*prog_, text_len, start, options_.backtrack_budget))
        return MatchEngine::Backtrack;
    return MatchEngine::PikeVM;
}

bool Regex::exec(std::u32string_view text, size_t start, model::Slots& slots) const {
    slots.assign(prog_->num_slots(), std::nullopt);
    if (start > text.size()) return false;

    const MatchEngine engine = choose_engine(text.size(), start);
    util::log_debug("Regex", "%s search of %zu code points from %zu",
                    model::to_string(engine), text.size(), start);
    switch (engine) {
        case MatchEngine::Literals: {
            auto m = prog_->prefixes.find_match(text, start, prog_->mode);
            if (!m) return false;
            slots[0] = m->start;
            slots[1] = m->end;
            return true;
        }
        case MatchEngine::Backtrack:
            return Backtracker(*prog_).exec(text, start, slots, options_.use_prefixes);
        case MatchEngine::PikeVM:
        case MatchEngine::Auto:
            break;
    }
    return PikeVM(*prog_).exec(text, start, slots, options_.use_prefixes);
}

// ── Searches ──

std::optional<Span> Regex::find(std::u32string_view text, size_t start) const {
    model::Slots slots;
    if (!exec(text, start, slots)) return std::nullopt;
    return Span{*slots[0], *slots[1]};
}

std::optional<model::Captures> Regex::captures(std::u32string_view text, size_t start) const {
    model::Slots slots;
    if (!exec(text, start, slots)) return std::nullopt;
    return model::Captures(std::move(slots));
}

bool Regex::is_match(std::u32string_view text) const {
    model::Slots slots;
    return exec(text, 0, slots);
}

Matches Regex::find_iter(std::u32string_view text) const {
    return Matches(*this, text);
}

std::vector<Span> Regex::find_all(std::u32string_view text) const {
    std::vector<Span> out;
    for (const auto& m : find_iter(text)) out.push_back(m);
    return out;
}

std::optional<Span> Regex::find(std::string_view utf8, size_t start) const {
    return find(std::u32string_view(util::to_u32(utf8)), start);
}

std::optional<model::Captures> Regex::captures(std::string_view utf8, size_t start) const {
    return captures(std::u32string_view(util::to_u32(utf8)), start);
}

bool Regex::is_match(std::string_view utf8) const {
    return is_match(std::u32string_view(util::to_u32(utf8)));
}

std::vector<Span> Regex::find_all(std::string_view utf8) const {
    const std::u32string text = util::to_u32(utf8);
    return find_all(std::u32string_view(text));
}

std::optional<size_t> Regex::capture_index(std::string_view name) const {
    const auto& names = prog_->cap_names;
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] && *names[i] == name) return i;
    }
    return std::nullopt;
}

// ── Iteration ──

void Matches::iterator::advance() {
    current_.reset();
    while (next_ <= text_.size()) {
        auto m = re_->find(text_, next_);
        if (!m) break;
        if (m->start == m->end) {
            next_ = m->end + 1;
            if (last_end_ && *last_end_ == m->end) continue;
        } else {
            next_ = m->end;
        }
        last_end_ = m->end;
        current_ = m;
        return;
    }
    next_ = text_.size() + 1;
}

} // namespace sift::engine
