#include "syntax/Parser.hpp"
#include "util/Log.hpp"
#include "util/Utf8.hpp"
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace sift::syntax {

using model::AnchorKind;
using model::Node;
using model::NodeKind;
using util::CharClass;

namespace {

bool is_repetition_char(char c) { return c == '*' || c == '+' || c == '?' || c == '{'; }

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Class for \d \D \w \W \s \S, or nullopt for any other escape letter.
// Folds before negating when `fold` is set.
std::optional<CharClass> perl_class(char c, bool fold) {
    CharClass cls;
    switch (c) {
        case 'd': case 'D': cls = CharClass::digit(); break;
        case 'w': case 'W': cls = CharClass::word(); break;
        case 's': case 'S': cls = CharClass::space(); break;
        default: return std::nullopt;
    }
    if (fold) cls.case_fold();
    if (std::isupper(static_cast<unsigned char>(c))) cls.negate();
    return cls;
}

class Parser {
public:
    Parser(std::string_view pattern, const model::Options& options)
        : src_(pattern), multi_line_(options.multi_line), fold_(options.case_insensitive) {}

    std::optional<model::SyntaxTree> run(model::Error& err) {
        auto root = parse_alternation();
        if (root && !at_end()) {
            // The only way parse_alternation stops early is an unmatched ')'
            fail("unopened group", pos_);
            root.reset();
        }
        if (!root) {
            err = err_;
            return std::nullopt;
        }
        model::SyntaxTree tree;
        tree.root = std::move(*root);
        tree.cap_names = std::move(cap_names_);
        return tree;
    }

private:
    std::string_view src_;
    size_t pos_{0};
    bool multi_line_;
    bool fold_;
    int depth_{0};
    std::vector<std::optional<std::string>> cap_names_{std::nullopt};
    model::Error err_;

    [[nodiscard]] bool at_end() const { return pos_ >= src_.size(); }
    [[nodiscard]] char peek() const { return src_[pos_]; }

    bool eat(char c) {
        if (!at_end() && peek() == c) { ++pos_; return true; }
        return false;
    }

    bool fail(std::string msg, size_t offset) {
        if (!err_) {
            err_.kind = model::ErrorKind::Syntax;
            err_.message = std::move(msg);
            err_.offset = offset;
        }
        return false;
    }

    // ── Alternation / concatenation ──────────────────────────────────────

    std::optional<Node> parse_alternation() {
        std::vector<Node> alts;
        auto first = parse_concat();
        if (!first) return std::nullopt;
        alts.push_back(std::move(*first));
        while (eat('|')) {
            auto next = parse_concat();
            if (!next) return std::nullopt;
            alts.push_back(std::move(*next));
        }
        if (alts.size() == 1) return std::move(alts[0]);
        return Node::alternate(std::move(alts));
    }

    std::optional<Node> parse_concat() {
        std::vector<Node> items;
        while (!at_end() && peek() != '|' && peek() != ')') {
            auto atom = parse_atom();
            if (!atom) return std::nullopt;
            if (!parse_repetition(*atom)) return std::nullopt;
            // Adjacent single literals fold into one literal run
            if (atom->kind == NodeKind::Literal && !items.empty()
                && items.back().kind == NodeKind::Literal) {
                items.back().literal += atom->literal;
            } else {
                items.push_back(std::move(*atom));
            }
        }
        if (items.empty()) return Node::empty();
        if (items.size() == 1) return std::move(items[0]);
        return Node::concat(std::move(items));
    }

    // ── Repetition ───────────────────────────────────────────────────────

    bool parse_number(uint32_t& out) {
        size_t start = pos_;
        uint64_t v = 0;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            v = v * 10 + static_cast<uint64_t>(peek() - '0');
            if (v > std::numeric_limits<uint32_t>::max())
                return fail("repetition count too large", start);
            ++pos_;
        }
        if (pos_ == start) return fail("invalid repetition count", start);
        out = static_cast<uint32_t>(v);
        return true;
    }

    bool parse_repetition(Node& atom) {
        if (at_end()) return true;
        size_t op_pos = pos_;
        uint32_t min = 0;
        std::optional<uint32_t> max;
        switch (peek()) {
            case '*': ++pos_; break;
            case '+': ++pos_; min = 1; break;
            case '?': ++pos_; max = 1; break;
            case '{': {
                ++pos_;
                if (!parse_number(min)) return false;
                if (eat('}')) {
                    max = min;
                } else if (eat(',')) {
                    if (!eat('}')) {
                        uint32_t hi = 0;
                        if (!parse_number(hi)) return false;
                        if (!eat('}')) return fail("unclosed counted repetition", op_pos);
                        max = hi;
                    }
                } else {
                    return fail("unclosed counted repetition", op_pos);
                }
                if (max && *max < min) return fail("invalid repetition range", op_pos);
                break;
            }
            default:
                return true;
        }
        bool greedy = !eat('?');
        if (!at_end() && is_repetition_char(peek()))
            return fail("repeated repetition operator", pos_);
        atom = Node::repeat(std::move(atom), min, max, greedy);
        return true;
    }

    // ── Atoms ────────────────────────────────────────────────────────────

    std::optional<Node> parse_atom() {
        char c = peek();
        switch (c) {
            case '(': return parse_group();
            case '[': return parse_class();
            case '.': ++pos_; return Node::klass(CharClass::any_except_newline());
            case '^':
                ++pos_;
                return Node::assertion(multi_line_ ? AnchorKind::StartLine : AnchorKind::StartText);
            case '$':
                ++pos_;
                return Node::assertion(multi_line_ ? AnchorKind::EndLine : AnchorKind::EndText);
            case '\\': return parse_escape();
            case '*': case '+': case '?': case '{':
                fail("repetition operator missing expression", pos_);
                return std::nullopt;
            default: {
                uint32_t cp;
                if (!decode(cp)) return std::nullopt;
                return Node::lit(static_cast<char32_t>(cp));
            }
        }
    }

    bool decode(uint32_t& cp) {
        int n = util::decode_utf8(src_.data() + pos_, src_.size() - pos_, &cp);
        if (n == 0) return fail("invalid UTF-8 in pattern", pos_);
        pos_ += static_cast<size_t>(n);
        return true;
    }

    std::optional<Node> parse_group() {
        size_t open = pos_;
        ++pos_;  // (
        if (++depth_ > MAX_NESTING) {
            fail("groups nested too deeply", open);
            return std::nullopt;
        }

        bool capturing = true;
        std::optional<std::string> name;
        if (eat('?')) {
            if (eat(':')) {
                capturing = false;
            } else if ((eat('P') && eat('<')) || eat('<')) {
                size_t name_pos = pos_;
                std::string n;
                while (!at_end() && peek() != '>') {
                    char ch = peek();
                    if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_') {
                        fail("invalid capture group name", pos_);
                        return std::nullopt;
                    }
                    n.push_back(ch);
                    ++pos_;
                }
                if (!eat('>') || n.empty() || std::isdigit(static_cast<unsigned char>(n[0]))) {
                    fail("invalid capture group name", name_pos);
                    return std::nullopt;
                }
                for (const auto& existing : cap_names_) {
                    if (existing && *existing == n) {
                        fail("duplicate capture group name", name_pos);
                        return std::nullopt;
                    }
                }
                name = std::move(n);
            } else {
                fail("unsupported group syntax", open);
                return std::nullopt;
            }
        }

        // Capture indices follow the order of opening parentheses
        uint32_t index = 0;
        if (capturing) {
            index = static_cast<uint32_t>(cap_names_.size());
            cap_names_.push_back(name);
        }

        auto inner = parse_alternation();
        if (!inner) return std::nullopt;
        if (!eat(')')) {
            fail("unclosed group", open);
            return std::nullopt;
        }
        --depth_;
        if (capturing) return Node::capture(index, std::move(*inner), std::move(name));
        return Node::group(std::move(*inner));
    }

    // ── Escapes ──────────────────────────────────────────────────────────

    // Parses the code point of an escape whose letter is at pos_ (after '\').
    bool escape_codepoint(uint32_t& cp) {
        size_t at = pos_ - 1;
        char c = peek();
        ++pos_;
        switch (c) {
            case 'n': cp = '\n'; return true;
            case 't': cp = '\t'; return true;
            case 'r': cp = '\r'; return true;
            case 'f': cp = 0x0C; return true;
            case 'v': cp = 0x0B; return true;
            case 'x': return hex_escape(cp, at);
            default: break;
        }
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && std::ispunct(uc)) { cp = uc; return true; }
        return fail("unrecognized escape sequence", at);
    }

    bool hex_escape(uint32_t& cp, size_t at) {
        uint32_t v = 0;
        if (eat('{')) {
            int digits = 0;
            while (!at_end() && peek() != '}') {
                int h = hex_value(peek());
                if (h < 0 || ++digits > 6) return fail("invalid hex escape", at);
                v = v * 16 + static_cast<uint32_t>(h);
                ++pos_;
            }
            if (!eat('}') || digits == 0) return fail("invalid hex escape", at);
        } else {
            for (int i = 0; i < 2; ++i) {
                if (at_end() || hex_value(peek()) < 0) return fail("invalid hex escape", at);
                v = v * 16 + static_cast<uint32_t>(hex_value(peek()));
                ++pos_;
            }
        }
        if (v > CharClass::MAX_CODEPOINT || (v >= 0xD800 && v <= 0xDFFF))
            return fail("hex escape is not a Unicode scalar value", at);
        cp = v;
        return true;
    }

    std::optional<Node> parse_escape() {
        size_t at = pos_;
        ++pos_;  // backslash
        if (at_end()) {
            fail("trailing backslash", at);
            return std::nullopt;
        }
        char c = peek();
        if (auto cls = perl_class(c, fold_)) {
            ++pos_;
            return Node::klass(std::move(*cls));
        }
        switch (c) {
            case 'b': ++pos_; return Node::assertion(AnchorKind::WordBoundary);
            case 'B': ++pos_; return Node::assertion(AnchorKind::NotWordBoundary);
            case 'A': ++pos_; return Node::assertion(AnchorKind::StartText);
            case 'z': ++pos_; return Node::assertion(AnchorKind::EndText);
            default: break;
        }
        uint32_t cp;
        if (!escape_codepoint(cp)) return std::nullopt;
        return Node::lit(static_cast<char32_t>(cp));
    }

    // ── Bracket classes ──────────────────────────────────────────────────

    // One class member endpoint: a literal or escaped code point.
    bool class_codepoint(uint32_t& cp) {
        if (peek() == '\\') {
            ++pos_;
            if (at_end()) return fail("trailing backslash", pos_ - 1);
            return escape_codepoint(cp);
        }
        return decode(cp);
    }

    std::optional<Node> parse_class() {
        size_t open = pos_;
        ++pos_;  // [
        bool negated = eat('^');
        CharClass cls;
        bool first = true;
        while (true) {
            if (at_end()) {
                fail("unclosed character class", open);
                return std::nullopt;
            }
            if (peek() == ']' && !first) {
                ++pos_;
                break;
            }
            first = false;

            if (peek() == '\\' && pos_ + 1 < src_.size()) {
                if (auto pc = perl_class(src_[pos_ + 1], fold_)) {
                    pos_ += 2;
                    cls.union_with(*pc);
                    continue;
                }
            }

            size_t item_pos = pos_;
            uint32_t lo;
            if (!class_codepoint(lo)) return std::nullopt;
            if (pos_ + 1 < src_.size() && peek() == '-' && src_[pos_ + 1] != ']') {
                ++pos_;  // -
                uint32_t hi;
                if (!class_codepoint(hi)) return std::nullopt;
                if (hi < lo) {
                    fail("invalid character class range", item_pos);
                    return std::nullopt;
                }
                cls.add(lo, hi);
            } else {
                cls.add(lo);
            }
        }
        // [^a] must exclude both cases, so fold the members first
        if (fold_) cls.case_fold();
        if (negated) cls.negate();
        return Node::klass(std::move(cls));
    }
};

} // namespace

std::optional<model::SyntaxTree> parse(std::string_view pattern, const model::Options& options,
                                       model::Error& err) {
    Parser parser(pattern, options);
    auto tree = parser.run(err);
    if (!tree)
        util::log_error("Parser", "%s at offset %zu", err.message.c_str(), err.offset);
    return tree;
}

} // namespace sift::syntax
