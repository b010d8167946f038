#pragma once

#include "engine/Program.hpp"
#include "model/Ast.hpp"
#include "model/Error.hpp"
#include "model/Match.hpp"
#include "model/Options.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sift::engine {

class Matches;

// Compiled regular expression. Cheap to copy: copies share one immutable
// Program, and every search keeps its state on the call, so a Regex may be
// used from any number of threads at once.
//
// Offsets are code-point offsets into the searched text. The UTF-8
// overloads decode first, mapping each invalid byte to U+FFFD.
class Regex {
public:
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      const model::Options& options,
                                                      model::Error& err);
    [[nodiscard]] static std::optional<Regex> compile(const model::SyntaxTree& tree,
                                                      const model::Options& options,
                                                      model::Error& err);

    [[nodiscard]] std::optional<model::Span> find(std::u32string_view text, size_t start = 0) const;
    [[nodiscard]] std::optional<model::Captures> captures(std::u32string_view text, size_t start = 0) const;
    [[nodiscard]] bool is_match(std::u32string_view text) const;
    // Successive non-overlapping matches; `text` must outlive the range.
    [[nodiscard]] Matches find_iter(std::u32string_view text) const;
    [[nodiscard]] std::vector<model::Span> find_all(std::u32string_view text) const;

    [[nodiscard]] std::optional<model::Span> find(std::string_view utf8, size_t start = 0) const;
    [[nodiscard]] std::optional<model::Captures> captures(std::string_view utf8, size_t start = 0) const;
    [[nodiscard]] bool is_match(std::string_view utf8) const;
    [[nodiscard]] std::vector<model::Span> find_all(std::string_view utf8) const;

    // Runs one search with the engine chosen for this input. `slots` is
    // resized to the program's slot count.
    bool exec(std::u32string_view text, size_t start, model::Slots& slots) const;

    // Engine a search of text[start..] would run on.
    [[nodiscard]] model::MatchEngine choose_engine(size_t text_len, size_t start) const;

    [[nodiscard]] const Program& program() const { return *prog_; }
    [[nodiscard]] const model::Options& options() const { return options_; }
    [[nodiscard]] size_t captures_len() const { return prog_->num_captures(); }
    [[nodiscard]] const std::vector<std::optional<std::string>>& capture_names() const { return prog_->cap_names; }
    [[nodiscard]] std::optional<size_t> capture_index(std::string_view name) const;

private:
    Regex(std::shared_ptr<const Program> prog, const model::Options& options)
        : prog_(std::move(prog)), options_(options) {}

    [[nodiscard]] bool literals_apply() const;

    std::shared_ptr<const Program> prog_;
    model::Options options_;
};

// Input range over the matches of one Regex in one text.
// After an empty match the search resumes one code point later, and an
// empty match directly at the end of the previous match is skipped.
class Matches {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = model::Span;
        using difference_type = std::ptrdiff_t;
        using pointer = const model::Span*;
        using reference = const model::Span&;

        iterator() = default;
        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance(); return *this; }
        void operator++(int) { advance(); }
        bool operator==(const iterator& o) const { return done() == o.done() && (done() || current_ == o.current_); }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        friend class Matches;
        iterator(const Regex* re, std::u32string_view text) : re_(re), text_(text) { advance(); }

        [[nodiscard]] bool done() const { return !current_.has_value(); }
        void advance();

        const Regex* re_{nullptr};
        std::u32string_view text_;
        size_t next_{0};
        std::optional<size_t> last_end_;
        std::optional<model::Span> current_;
    };

    Matches(const Regex& re, std::u32string_view text) : re_(&re), text_(text) {}

    [[nodiscard]] iterator begin() const { return iterator(re_, text_); }
    [[nodiscard]] iterator end() const { return iterator(); }

private:
    const Regex* re_;
    std::u32string_view text_;
};

} // namespace sift::engine
