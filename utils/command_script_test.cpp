#include "command_script.hpp"
#include "index_errors.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using indexmaps::ScriptError;
using namespace indexmaps::script;

namespace {
    // true if parse_line rejects text with a ScriptError naming the given line
    bool rejects(const std::string &text, const std::size_t line = 1) {
        try {
            static_cast<void>(parse_line(text, line));
        } catch (const ScriptError &e) {
            std::cout << "  rejected: " << e.what() << "\n";
            return e.line() == line;
        }
        return false;
    }
} // namespace

void test_commands() {
    std::cout << "=== parse_line: commands ===\n";
    const auto put = parse_line("put 3 9", 1);
    assert(put && put->op == Op::Put);
    assert((put->args == std::vector<long long>{3, 9}));
    assert(put->line == 1);

    const auto get = parse_line("  GET   -4  ", 2);
    assert(get && get->op == Op::Get);
    assert((get->args == std::vector<long long>{-4}));

    const auto sub = parse_line("Sub +3 8", 3);
    assert(sub && sub->op == Op::Sub);
    assert((sub->args == std::vector<long long>{3, 8}));

    for (const char *word: {"size", "first", "last", "print"}) {
        const auto cmd = parse_line(word, 4);
        assert(cmd && cmd->args.empty());
        assert(std::string(op_name(cmd->op)) == word);
    }
    std::cout << "[OK] commands passed\n";
}

void test_skipped_lines() {
    std::cout << "=== parse_line: blank and comment lines ===\n";
    assert(!parse_line("", 1).has_value());
    assert(!parse_line("   \t", 1).has_value());
    assert(!parse_line("# put 1 1", 1).has_value());
    assert(!parse_line("   # indented comment", 1).has_value());
    std::cout << "[OK] skipped lines passed\n";
}

void test_errors() {
    std::cout << "=== parse_line: malformed lines ===\n";
    assert(rejects("put 3", 7));
    assert(rejects("get", 2));
    assert(rejects("size 1"));
    assert(rejects("frob 1"));
    assert(rejects("get x"));
    assert(rejects("get 1.5"));
    assert(rejects("get 99999999999999999999"));
    assert(rejects("42"));
    std::cout << "[OK] malformed lines passed\n";
}

void test_arity() {
    std::cout << "=== arity ===\n";
    assert(arity(Op::Put) == 2);
    assert(arity(Op::Sub) == 2);
    assert(arity(Op::Get) == 1);
    assert(arity(Op::Head) == 1);
    assert(arity(Op::Tail) == 1);
    assert(arity(Op::Size) == 0);
    assert(arity(Op::Print) == 0);
    std::cout << "[OK] arity passed\n";
}

void test_parse_count() {
    std::cout << "=== parse_count ===\n";
    assert(parse_count("5") == 5);
    assert(parse_count("+30") == 30);
    for (const char *bad: {"5x", "x5", "", "0", "-3", "1.5", " 5"}) {
        bool threw = false;
        try {
            static_cast<void>(parse_count(bad));
        } catch (const std::invalid_argument &e) {
            std::cout << "  rejected: " << e.what() << "\n";
            threw = true;
        }
        assert(threw);
    }
    bool threw = false;
    try {
        static_cast<void>(parse_count("99999999999"));
    } catch (const std::out_of_range &) {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] parse_count passed\n";
}

void test_script() {
    std::cout << "=== parse_script ===\n";
    std::istringstream in(
        "# demo\n"
        "put 1 1\n"
        "\n"
        "put 3 9\n"
        "get 3\n"
        "sub 1 4\n");
    const auto cmds = parse_script(in);
    assert(cmds.size() == 4);
    assert(cmds[0].op == Op::Put && cmds[0].line == 2);
    assert(cmds[1].op == Op::Put && cmds[1].line == 4);
    assert(cmds[2].op == Op::Get && cmds[2].line == 5);
    assert(cmds[3].op == Op::Sub && cmds[3].line == 6);

    std::istringstream bad("put 1 1\nget\nput 2 2\n");
    bool threw = false;
    try {
        static_cast<void>(parse_script(bad));
    } catch (const ScriptError &e) {
        assert(e.line() == 2);
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] parse_script passed\n";
}

int main() {
    test_commands();
    test_skipped_lines();
    test_errors();
    test_arity();
    test_parse_count();
    test_script();
    std::cout << "\nAll tests passed ✔\n";
    return 0;
}
