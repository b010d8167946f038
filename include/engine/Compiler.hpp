#pragma once

#include "engine/Program.hpp"
#include "model/Ast.hpp"
#include "model/Error.hpp"
#include "model/Options.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sift::engine {

// Lowers a syntax tree into a Program.
//
// Layout: save 0, <body>, save 1, match. Counted repetitions are unrolled;
// before unrolling, one copy is measured and the whole repetition is
// rejected with SizeLimitExceeded if it cannot fit, so huge bounds fail
// without allocating. Case-insensitive options fold literals and classes
// here, so the engines never see case.
class Compiler {
public:
    explicit Compiler(const model::Options& options);

    // nullopt on error, with `err` describing it. Never returns a partial program.
    [[nodiscard]] std::optional<Program> compile(const model::SyntaxTree& tree, model::Error& err);

private:
    model::Options options_;
    std::vector<Inst> insts_;
    std::vector<util::CharClass> classes_;
    model::Error err_;

    static bool ends_at_text_end(const Program& prog);
    bool validate_captures(const model::SyntaxTree& tree);
    bool c(const model::Node& node);
    bool c_literal(const std::u32string& lit);
    bool c_class(util::CharClass cls);
    bool c_alternate(const std::vector<model::Node>& alts);
    bool c_repeat(const model::Node& node);
    bool c_zero_or_one(const model::Node& child, bool greedy);
    bool c_star(const model::Node& child, bool greedy);
    bool c_plus(const model::Node& child, bool greedy);

    bool check_size();
    bool fail(model::ErrorKind kind, std::string msg);

    void push(Inst inst) { insts_.push_back(inst); }
    [[nodiscard]] uint32_t pc() const { return static_cast<uint32_t>(insts_.size()); }
    uint32_t empty_split();
    uint32_t empty_jump();
    void set_split(uint32_t at, uint32_t primary, uint32_t secondary);
    void set_jump(uint32_t at, uint32_t target);
};

// Convenience: Compiler(options).compile(tree, err).
[[nodiscard]] std::optional<Program> compile(const model::SyntaxTree& tree,
                                             const model::Options& options, model::Error& err);

} // namespace sift::engine
