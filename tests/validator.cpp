#include <iostream>
#include <sstream>
#include <vector>
#include <string>

#include "../src/parser.h"
#include "../src/interpreter.h"
#include "../src/diagnostics.h"
#include "../src/prelude.h"

using namespace forge;

struct TestCase {
    std::string name;
    std::string program;
    std::string expectedOutput; // normalized to LF, no trailing spaces
    bool expectParseFailure = false; // when true, parsing must report errors
    std::string expectedErrorContains; // substring expected in the parse report
    bool expectRuntimeError = false; // when true, evaluation must raise
    std::string expectedRuntimeErrorContains; // substring expected in the runtime report
    std::string input; // text fed to `input`
};

static std::string normalize(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '\r') continue;
        out.push_back(c);
    }
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ' || out.back() == '\t')) out.pop_back();
    return out;
}

static TestCase parseFailure(std::string name, std::string program, std::string contains) {
    TestCase tc;
    tc.name = std::move(name);
    tc.program = std::move(program);
    tc.expectParseFailure = true;
    tc.expectedErrorContains = std::move(contains);
    return tc;
}

static TestCase runtimeFailure(std::string name, std::string program, std::string output, std::string contains) {
    TestCase tc;
    tc.name = std::move(name);
    tc.program = std::move(program);
    tc.expectedOutput = std::move(output);
    tc.expectRuntimeError = true;
    tc.expectedRuntimeErrorContains = std::move(contains);
    return tc;
}

static TestCase withInput(std::string name, std::string program, std::string output, std::string input) {
    TestCase tc;
    tc.name = std::move(name);
    tc.program = std::move(program);
    tc.expectedOutput = std::move(output);
    tc.input = std::move(input);
    return tc;
}

int main() {
    const std::string arityProgram = R"(var f = || { print "hi"; }; f(1);)";
    const std::string arityReport =
        "[ERROR] Runtime error at 1:29...\n"
        "        1| " + arityProgram + "\n"
        "         | " + std::string(28, ' ') + "^^^^\n"
        "   ...declared at 1:9...\n"
        "        1| " + arityProgram + "\n"
        "         | " + std::string(8, ' ') + std::string(18, '^') + "\n"
        "   ArityError: 'f' expected 0 arguments, found 1";

    std::vector<TestCase> tests = {
        {
            "splice_grows_list",
            R"(var L = [0,1,2,3]; L[1..3] = ["a","b","c","d","e"]; print L;)",
            R"([0, "a", "b", "c", "d", "e", 3])"
        },
        {
            "splice_shrinks_list",
            R"(var L = [0,1,2,3,4]; L[1..4] = [9]; print L; L[0..0] = 1..3; print L;)",
            "[0, 9, 4]\n[1, 2, 0, 9, 4]"
        },
        {
            "string_range_slice",
            R"(print "Hello, world!"[7..12];)",
            "world"
        },
        {
            "string_splice",
            R"(var test = "An apple is what I am eating"; test[3..8] = "pear"; print test;)",
            "An pear is what I am eating"
        },
        {
            "slice_hi_clamped",
            R"(var l = [1,2,3]; print l[1..10]; print "abc"[2..1];)",
            "[2, 3]"
        },
        {
            "range_iteration_half_open",
            R"(for i in 1..4 { print i; })",
            "1\n2\n3"
        },
        {
            "empty_range_does_not_iterate",
            R"(for i in 3..3 { print i; } print "done";)",
            "done"
        },
        {
            "list_aliasing",
            R"(var a = [1, 2]; var b = a; push(b, 3); print a;)",
            "[1, 2, 3]"
        },
        {
            "clone_is_independent",
            R"(var a = [[1], [2]]; var b = clone a; b[0][0] = 9; print a; print b;)",
            "[[1], [2]]\n[[9], [2]]"
        },
        {
            "mirror_aliases",
            R"(var a = [1]; var m = mirror a; m[0] = 5; print a;)",
            "[5]"
        },
        {
            "string_value_semantics",
            R"(var s = "abc"; var t = s; t[0] = 'x'; print s; print t;)",
            "abc\nxbc"
        },
        {
            "map_upsert_and_compound",
            R"(var m = ["x": 1]; m["y"] = 2; m["x"] += 10; print m; print m["x"]; print [:];)",
            "[\"x\": 11, \"y\": 2]\n11\n[:]"
        },
        {
            "list_repeat",
            R"(print [0; 3]; print [1, 2] * 2; print "ab" * 3;)",
            "[0, 0, 0]\n[1, 2, 1, 2]\nababab"
        },
        {
            "unicode_indexing",
            R"(var s = "héllo"; print s[1]; print len(s); s[1] = 'e'; print s;)",
            "é\n5\nhello"
        },
        {
            "closure_counter",
            R"(
var make = || {
    var n = 0;
    return || { n += 1; return n; };
};
var c = make();
var d = make();
print c();
print c();
print d();
)",
            "1\n2\n1"
        },
        {
            "recursion",
            R"(var fib = |n| { if n < 2 { return n; } return fib(n - 1) + fib(n - 2); }; print fib(10);)",
            "55"
        },
        {
            "break_and_continue",
            R"(for i in 0..10 { if i == 2 { continue; } if i == 4 { break; } print i; })",
            "0\n1\n3"
        },
        {
            "while_counter",
            R"(var i = 0; while i < 3 { print i; i += 1; } print i;)",
            "0\n1\n2\n3"
        },
        {
            "else_if_chain",
            R"(var x = 5; if x < 3 { print "small"; } else if x < 10 { print "medium"; } else { print "large"; })",
            "medium"
        },
        {
            "block_scope_shadowing",
            R"(var x = 1; { var x = 2; print x; } print x; { x = 3; } print x;)",
            "2\n1\n3"
        },
        {
            "number_formatting",
            R"(print 7 / 2; print 10 / 4 * 2; print 10 % 3; print -2.5;)",
            "3.5\n5\n1\n-2.5"
        },
        {
            "casts",
            R"(print "42" as number + 1; print 3 as string + "!"; print 1 as bool; print "hi" as list;)",
            "43\n3!\ntrue\n['h', 'i']"
        },
        {
            "string_concatenation",
            R"(print "n=" + 5; print 'a' + "b"; print "ok: " + true;)",
            "n=5\nab\nok: true"
        },
        {
            "logic_and_comparison",
            R"(print true xor false; print "abc" < "abd"; print 'a' < 'b'; print [1, [2]] == [1, [2]]; print 1 == "1";)",
            "true\ntrue\ntrue\ntrue\nfalse"
        },
        {
            "short_circuit_skips_rhs",
            R"(print false and undefined_name; print true or undefined_name;)",
            "false\ntrue"
        },
        {
            "natives",
            R"(var l = [1, 2, 3]; print pop(l); print l; print type(l); print keys(["a": 1, "b": 2]); print len(0..5);)",
            "3\n[1, 2]\nlist\n[\"a\", \"b\"]\n5"
        },
        {
            "self_referencing_list_display",
            R"(var l = [1]; push(l, l); print l;)",
            "[1, [...]]"
        },
        {
            "var_without_initializer_is_null",
            R"(var x; print x;)",
            "null"
        },
        withInput(
            "input_reads_line",
            R"(var name; input name, "Name? "; print "Hi " + name;)",
            "Name? Hi Ada",
            "Ada\n"),
        withInput(
            "input_into_list_element",
            R"(var l = [0, 0]; input l[1]; print l;)",
            "[0, \"42\"]",
            "42\r\n"),
        withInput(
            "input_at_end_of_stream",
            R"(var x = 1; input x; print x;)",
            "null",
            ""),
        runtimeFailure(
            "arity_error_report",
            arityProgram,
            "",
            arityReport),
        runtimeFailure(
            "while_condition_must_be_bool",
            R"(var p = true; while p { p = null; })",
            "",
            "TypeError: cannot determine truthiness of value of type 'null'"),
        runtimeFailure(
            "while_condition_error_position",
            R"(var p = true; while p { p = null; })",
            "",
            "[ERROR] Runtime error at 1:21..."),
        runtimeFailure(
            "division_by_zero",
            R"(print "before"; print 1 / 0; print "after";)",
            "before",
            "ArithmeticError"),
        runtimeFailure(
            "huge_repeat_count_is_an_error",
            R"(print "before"; var x = [0; 1000000000000000000]; print "after";)",
            "before",
            "RuntimeError: repeat count 1000000000000000000 is more than a list can hold"),
        runtimeFailure(
            "huge_string_repeat_is_an_error",
            R"(var s = "abcdefghij" * 1000000000000000000;)",
            "",
            "RuntimeError: repeated string would hold 10 x 1000000000000000000 elements"),
        runtimeFailure(
            "huge_range_conversion_is_an_error",
            R"(print "start"; var l = (0..1000000000000000000) as list;)",
            "start",
            "RuntimeError: allocation too large"),
        runtimeFailure(
            "undefined_variable",
            R"(print y;)",
            "",
            "UndefinedVariableError: undefined variable 'y'"),
        runtimeFailure(
            "assignment_to_undeclared",
            R"(y = 1;)",
            "",
            "undefined variable 'y'"),
        runtimeFailure(
            "index_out_of_bounds",
            R"(var l = [1]; print l[3];)",
            "",
            "IndexError: index 3 is out of bounds for list of length 1"),
        runtimeFailure(
            "missing_map_key",
            R"(var m = ["a": 1]; print m["b"];)",
            "",
            "key \"b\" not found in map"),
        runtimeFailure(
            "scalar_into_range_slot",
            R"(var l = [1, 2]; l[0..1] = 5;)",
            "",
            "cannot splice a value of type 'number' into a list slice"),
        runtimeFailure(
            "call_trail",
            R"(
var inner = || { return 1 / 0; };
var outer = || { return inner(); };
outer();
)",
            "",
            "   ...while calling 'inner'...\n   ...while calling 'outer'..."),
        runtimeFailure(
            "native_arity",
            R"(print len(1, 2);)",
            "",
            "'len' expected 1 argument, found 2"),
        runtimeFailure(
            "not_callable",
            R"(var x = 3; x();)",
            "",
            "value of type 'number' is not callable"),
        runtimeFailure(
            "map_is_not_iterable",
            R"(for k in ["a": 1] { print k; })",
            "",
            "value of type 'map' is not iterable"),
        runtimeFailure(
            "and_requires_bool",
            R"(print 1 and true;)",
            "",
            "operand of 'and' must be bool"),
        parseFailure(
            "missing_variable_name",
            R"(var = 3;)",
            "expected variable name"),
        parseFailure(
            "context_trail",
            R"(var x = [1, 2;)",
            "   ...while parsing list...\n   ...while parsing variable declaration..."),
        parseFailure(
            "recovery_reports_every_statement",
            "var x = ;\nprint 1;\nprint (2;\n",
            "[ERROR] Parsing error at 3:9..."),
        parseFailure(
            "return_outside_function",
            R"(return 1;)",
            "'return' outside of a function"),
        parseFailure(
            "break_outside_loop",
            R"(break;)",
            "'break' outside of a loop"),
        parseFailure(
            "invalid_assignment_target",
            R"(1 + 2 = 3;)",
            "while parsing lvalue"),
        parseFailure(
            "unterminated_string",
            R"(print "abc;)",
            "LexError"),
    };

    int passed = 0;
    int failed = 0;

    for (const auto &tc : tests) {
        auto source = Source::fromUtf8(tc.name, tc.program);
        Parser parser(source);
        auto program = parser.parse();

        std::ostringstream parseErrors;
        report(parseErrors, parser.getErrors());
        if (tc.expectParseFailure) {
            std::string errs = parseErrors.str();
            bool ok = parser.hasErrors() && (errs.find(tc.expectedErrorContains) != std::string::npos);
            if (ok) {
                std::cout << "[PASS] " << tc.name << std::endl;
                passed++;
            } else {
                std::cout << "[FAIL] " << tc.name << std::endl;
                if (!parser.hasErrors()) std::cout << "  expected: parse failure but parsing succeeded" << std::endl;
                std::cout << "  expected error to contain: \n" << tc.expectedErrorContains << std::endl;
                std::cout << "  report was: \n" << errs << std::endl;
                failed++;
            }
            continue;
        }
        if (parser.hasErrors()) {
            std::cout << "[FAIL] " << tc.name << ": unexpected parse errors\n" << parseErrors.str() << std::endl;
            failed++;
            continue;
        }

        std::ostringstream outBuf;
        std::istringstream inBuf(tc.input);
        std::string runtimeReport;
        {
            InterpreterOptions options;
            options.out = &outBuf;
            options.in = &inBuf;
            Interpreter interpreter(options);
            Environment env;
            registerPrelude(env);
            try {
                interpreter.run(program, env);
            } catch (const Error &e) {
                runtimeReport = formatError(e);
            }
        }
        std::string got = normalize(outBuf.str());
        auto expect = normalize(tc.expectedOutput);

        if (tc.expectRuntimeError) {
            if (runtimeReport.find(tc.expectedRuntimeErrorContains) == std::string::npos) {
                std::cout << "[FAIL] " << tc.name << std::endl;
                std::cout << "  expected runtime error to contain:\n" << tc.expectedRuntimeErrorContains << std::endl;
                std::cout << "  report was:\n" << runtimeReport << std::endl;
                failed++;
                continue;
            }
        } else if (!runtimeReport.empty()) {
            std::cout << "[FAIL] " << tc.name << ": unexpected runtime error\n" << runtimeReport << std::endl;
            failed++;
            continue;
        }

        if (got == expect) {
            std::cout << "[PASS] " << tc.name << std::endl;
            passed++;
        } else {
            std::cout << "[FAIL] " << tc.name << std::endl;
            std::cout << "  expected: \n" << expect << std::endl;
            std::cout << "  got: \n" << got << std::endl;
            failed++;
        }
    }

    std::cout << "\nSummary: " << passed << " passed, " << failed << " failed" << std::endl;
    return failed == 0 ? 0 : 1;
}
