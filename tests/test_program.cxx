#include <cassert>
#include <cstddef>
#include <string>
#include <vector>

#include "helpers.hxx"
#include "tapevm/program.hxx"

using tapevm::BracketError;
using tapevm::CompiledProgram;
using tapevm::Position;
using tapevm::ProgramIndex;

static void test_matching_across_lines() {
    ProgramIndex idx;
    idx.rebuild({"+[>[-]<", "]"});
    assert(idx.errors().empty());
    assert(idx.matchOf({0, 1}) == Position({1, 0}));
    assert(idx.matchOf({1, 0}) == Position({0, 1}));
    assert(idx.matchOf({0, 3}) == Position({0, 5}));
    for (const Position p : {Position{0, 1}, Position{0, 3}, Position{0, 5}, Position{1, 0}}) {
        assert(idx.matchOf(*idx.matchOf(p)) == p);
    }
    assert(!idx.matchOf({0, 0}));
}

static void test_unmatched_brackets_reported() {
    CerrCapture cap;
    ProgramIndex idx;
    const auto& errors = idx.rebuild({"][", "[x"});
    assert(errors.size() == 3);
    assert(errors[0].kind == BracketError::Kind::UnmatchedClose);
    assert(errors[0].position == Position({0, 0}));
    assert(errors[1].kind == BracketError::Kind::UnmatchedOpen);
    assert(errors[1].position == Position({0, 1}));
    assert(errors[2].position == Position({1, 0}));
    assert(cap.contains("unmatched ']'"));
    assert(cap.contains("2 unmatched '['"));
    assert(!idx.matchOf({0, 1}));
}

static void test_line_terminator_hides_rest() {
    ProgramIndex idx;
    idx.rebuild({"+[/]", "]"});
    assert(idx.errors().empty());
    assert(idx.matchOf({0, 1}) == Position({1, 0}));
    assert(!idx.matchOf({0, 3}));
}

static void test_navigation() {
    ProgramIndex idx;
    idx.rebuild({"ab", "", "c"});
    Position p{0, 0};
    assert(idx.next(p) && p == Position({0, 1}));
    assert(idx.next(p) && p == Position({1, 0}));
    assert(idx.next(p) && p == Position({2, 0}));
    assert(!idx.next(p));
    Position q{0, 1};
    assert(idx.nextLine(q) && q == Position({1, 0}));
    Position last{2, 0};
    assert(!idx.nextLine(last));

    assert(idx.charAt({0, 1}) == 'b');
    assert(!idx.charAt({1, 0}));
    assert(!idx.charAt({3, 0}));
}

static void test_flatten() {
    ProgramIndex idx;
    idx.rebuild({"+a$-/+", "[.]"});
    const CompiledProgram& c = idx.flatten();
    assert(c.size() == 6);
    assert(c.ops[1].opcode == '$');
    assert(c.ops[1].position == Position({0, 2}));
    assert(c.ops[3].position == Position({1, 0}));
    assert(c.jumps[3] == 5);
    assert(c.jumps[5] == 3);
    assert(c.jumps[0] == CompiledProgram::npos);
    assert(c.indexAtOrAfter({0, 0}) == 0);
    assert(c.indexAtOrAfter({0, 1}) == 1);
    assert(c.indexAtOrAfter({0, 4}) == 3);
    assert(c.indexAtOrAfter({5, 0}) == c.size());
    // Cached until the next rebuild.
    assert(&idx.flatten() == &c);
    idx.rebuild({"+"});
    assert(idx.flatten().size() == 1);
}

int main() {
    test_matching_across_lines();
    test_unmatched_brackets_reported();
    test_line_terminator_hides_rest();
    test_navigation();
    test_flatten();
    return 0;
}
