#include <iostream>
#include <sstream>
#include <vector>
#include <string>
#include <functional>
#include <memory>
#include <stdexcept>

#include "../src/lexer.h"
#include "../src/parser.h"
#include "../src/interpreter.h"
#include "../src/diagnostics.h"
#include "../src/host.h"
#include "../src/prelude.h"

using namespace forge;

struct UnitCase {
    std::string name;
    std::function<std::string()> body; // empty string on success, reason otherwise
};

// Parses and runs `code` against env, capturing print output.
static std::string runIn(Environment &env, const std::string &code, const std::string &name = "test") {
    auto source = Source::fromUtf8(name, code);
    Parser parser(source);
    auto program = parser.parse();
    if (parser.hasErrors()) {
        std::ostringstream errs;
        report(errs, parser.getErrors());
        throw std::runtime_error("unexpected parse errors:\n" + errs.str());
    }
    std::ostringstream out;
    InterpreterOptions options;
    options.out = &out;
    Interpreter interpreter(options);
    interpreter.run(program, env);
    return out.str();
}

static std::string expectEq(const std::string &what, const std::string &got, const std::string &want) {
    if (got == want) return "";
    return what + ": expected '" + want + "', got '" + got + "'";
}

// A host type standing for an integer countdown: iterable, callable and
// usable as a number in arithmetic.
class Countdown : public HostType {
public:
    std::string name() const override { return "countdown"; }

    std::string display(const CustomValue &v) const override {
        return "<countdown " + std::to_string(start(v)) + ">";
    }

    bool equals(const CustomValue &a, const CustomValue &b) const override {
        return start(a) == start(b);
    }

    std::unique_ptr<HostIterator> iterate(const CustomValue &v) const override {
        class Iter : public HostIterator {
        public:
            explicit Iter(int n) : n_(n) {}
            bool next(Value &out) override {
                if (n_ <= 0) return false;
                out = Value::number(n_--);
                return true;
            }
        private:
            int n_;
        };
        return std::make_unique<Iter>(start(v));
    }

    bool callable() const override { return true; }
    int arity() const override { return 1; }
    Value call(Interpreter &, const CustomValue &v, std::vector<Value> &args) const override {
        return Value::number(start(v) * args[0].asNumber());
    }

    std::optional<Value> coerce(const CustomValue &v, ValueKind target) const override {
        if (target == ValueKind::Number) return Value::number(start(v));
        return std::nullopt;
    }

    static int start(const CustomValue &v) { return *static_cast<const int *>(v.payload.get()); }
};

static Value makeCountdown(int n) {
    static auto type = std::make_shared<Countdown>();
    return makeCustom(type, std::make_shared<int>(n));
}

int main() {
    std::vector<UnitCase> tests = {
        {"lexer_positions", []() -> std::string {
            Lexer lexer(Source::fromUtf8("t", "var x = 1;\n  print x;"));
            auto tokens = lexer.tokenize();
            if (tokens.size() != 9) return "expected 9 tokens, got " + std::to_string(tokens.size());
            const Token &print = tokens[5];
            if (print.type != TokenType::PRINT) return "token 5 is not 'print'";
            if (print.span.line != 2 || print.span.column != 3) {
                return "print at " + std::to_string(print.span.line) + ":" + std::to_string(print.span.column);
            }
            if (tokens.back().type != TokenType::END) return "missing end token";
            return "";
        }},
        {"lexer_counts_columns_in_characters", []() -> std::string {
            Lexer lexer(Source::fromUtf8("t", "\"\xC3\xA9\" x"));
            auto tokens = lexer.tokenize();
            if (tokens.size() < 2 || tokens[1].type != TokenType::IDENTIFIER) return "expected string then identifier";
            return expectEq("column of x", std::to_string(tokens[1].span.column), "5");
        }},
        {"lexer_range_is_not_a_decimal", []() -> std::string {
            Lexer lexer(Source::fromUtf8("t", "1..4 2.5"));
            auto tokens = lexer.tokenize();
            if (tokens.size() != 5) return "expected 5 tokens, got " + std::to_string(tokens.size());
            if (tokens[1].type != TokenType::DOT_DOT) return "expected '..' after 1";
            if (tokens[3].number != 2.5) return "2.5 lexed as " + std::to_string(tokens[3].number);
            return "";
        }},
        {"lexer_is_restartable", []() -> std::string {
            Lexer lexer(Source::fromUtf8("t", "a b"));
            Token first = lexer.next();
            lexer.next();
            lexer.reset();
            return expectEq("first token after reset", lexer.next().value, first.value);
        }},
        {"lexer_reports_bad_character", []() -> std::string {
            Lexer lexer(Source::fromUtf8("t", "var @"));
            try {
                lexer.tokenize();
            } catch (const LexError &e) {
                return expectEq("column", std::to_string(e.span().column), "5");
            }
            return "expected a LexError";
        }},
        {"parser_recovers_and_collects", []() -> std::string {
            Parser parser(Source::fromUtf8("t", "var x = ;\nprint 1;\nprint (2;\n"));
            parser.parse();
            if (parser.getErrors().size() != 2) {
                return "expected 2 errors, got " + std::to_string(parser.getErrors().size());
            }
            auto first = std::dynamic_pointer_cast<ParseError>(parser.getErrors()[0]);
            if (!first) return "first error is not a ParseError";
            if (first->context().empty() || first->context().front() != "variable declaration") {
                return "missing 'variable declaration' context";
            }
            return expectEq("second error line", std::to_string(parser.getErrors()[1]->span().line), "3");
        }},
        {"parser_reports_each_missing_semicolon", []() -> std::string {
            Parser parser(Source::fromUtf8("t", "var a = 0;\na = 1\na = 2\nprint a;\n"));
            parser.parse();
            const auto &errors = parser.getErrors();
            if (errors.size() != 2) return "expected 2 errors, got " + std::to_string(errors.size());
            for (const auto &error : errors) {
                auto pe = std::dynamic_pointer_cast<ParseError>(error);
                if (!pe || pe->expected().size() != 1 || pe->expected()[0] != "';'") {
                    return "unexpected error: " + std::string(error->what());
                }
            }
            std::string where = std::to_string(errors[0]->span().line) + ":" + std::to_string(errors[0]->span().column) +
                                " " + std::to_string(errors[1]->span().line) + ":" + std::to_string(errors[1]->span().column);
            return expectEq("error positions", where, "3:1 4:1");
        }},
        {"block_reports_each_missing_semicolon", []() -> std::string {
            Parser parser(Source::fromUtf8("t", "var a = 0;\nwhile false {\n    a = 1\n    a = 2\n    a = 3;\n}\n"));
            parser.parse();
            const auto &errors = parser.getErrors();
            if (errors.size() != 2) return "expected 2 errors, got " + std::to_string(errors.size());
            return expectEq("second error line", std::to_string(errors[1]->span().line), "5");
        }},
        {"parser_never_loops_on_garbage", []() -> std::string {
            Parser parser(Source::fromUtf8("t", ") ) } ] , ;"));
            parser.parse();
            if (!parser.hasErrors()) return "expected errors";
            return "";
        }},
        {"parser_expression_only", []() -> std::string {
            Parser parser(Source::fromUtf8("t", "1 + 2"));
            if (!parser.parseExpressionOnly()) return "bare expression rejected";
            Parser stmt(Source::fromUtf8("t", "print 1;"));
            if (stmt.parseExpressionOnly()) return "statement accepted as an expression";
            return "";
        }},
        {"arity_error_carries_declaration_frame", []() -> std::string {
            Environment env;
            try {
                runIn(env, "var f = |a| { return a; };\nf();");
            } catch (const ArityError &e) {
                if (e.expected() != 1 || e.found() != 0) return "wrong counts in ArityError";
                if (!e.secondary()) return "missing declaration frame";
                if (e.secondary()->span.line != 1 || e.secondary()->span.column != 9) return "declaration frame at wrong position";
                return expectEq("call site line", std::to_string(e.span().line), "2");
            }
            return "expected an ArityError";
        }},
        {"environment_persists_across_runs", []() -> std::string {
            Environment env;
            runIn(env, "var add = |a, b| { return a + b; }; var total = 1;", "first");
            std::string out = runIn(env, "total = add(total, 41); print total;", "second");
            if (out != "42\n") return "got '" + out + "'";
            try {
                runIn(env, "add(1);", "third");
            } catch (const ArityError &e) {
                // The declaration frame still points into the first source
                if (!e.secondary() || e.secondary()->span.source->name() != "first") return "declaration frame lost its source";
                return "";
            }
            return "expected an ArityError";
        }},
        {"runtime_error_keeps_environment", []() -> std::string {
            Environment env;
            try {
                runIn(env, "var kept = 7; print 1 / 0; var lost = 1;");
            } catch (const ArithmeticError &) {
                // expected; the environment is inspected below
            }
            if (!env.lookup("kept")) return "binding made before the error vanished";
            if (env.lookup("lost")) return "statement after the error ran";
            return "";
        }},
        {"map_lookup_by_value_across_many_keys", []() -> std::string {
            Heap heap;
            MapRef m = heap.makeMap();
            for (int i = 0; i < 5000; ++i) m->set(Value::number(i), Value::number(i * 2));
            m->set(Value::number(-0.0), Value::string(std::string("zero")));
            m->set(Value::string(std::string("1")), Value::boolean(true));
            m->set(Value::list(heap.makeList({Value::number(1)})), Value::string(std::string("list")));
            if (m->size() != 5002) return "expected 5002 entries, got " + std::to_string(m->size());
            Value *last = m->find(Value::number(4999));
            if (!last) return "key 4999 not found";
            std::string r = expectEq("value of 4999", displayValue(*last), "9998");
            if (!r.empty()) return r;
            r = expectEq("first entry", displayValue(m->entries().front().second), "zero");
            if (!r.empty()) return r;
            r = expectEq("number key 1", displayValue(*m->find(Value::number(1))), "2");
            if (!r.empty()) return r;
            Value *byList = m->find(Value::list(heap.makeList({Value::number(1)})));
            if (!byList) return "equal list key not found";
            r = expectEq("list key", displayValue(*byList), "list");
            if (!r.empty()) return r;
            if (m->find(Value::number(5000))) return "absent key found";
            auto released = m->release();
            if (released.size() != 5002 || !m->empty() || m->find(Value::number(1))) return "release left entries behind";
            return "";
        }},
        {"collector_reclaims_cycles", []() -> std::string {
            Environment env;
            registerPrelude(env);
            runIn(env, "var a = [1]; var b = [a]; push(a, b);");
            std::weak_ptr<ListData> weak = env.lookup("a")->asList();
            runIn(env, "a = null; b = null;");
            if (weak.expired()) return "cycle was freed without the collector";
            env.collectGarbage();
            if (!weak.expired()) return "cycle survived a collection";
            return "";
        }},
        {"collector_reclaims_closure_cycles", []() -> std::string {
            Environment env;
            runIn(env, "var make = || { var self = || { return self; }; return self; }; var keep = make(); make();");
            std::size_t before = env.heap().tracked();
            env.collectGarbage();
            std::size_t after = env.heap().tracked();
            if (after >= before) return "nothing reclaimed";
            std::string out = runIn(env, "print keep() == keep;");
            return expectEq("reachable closure", out, "true\n");
        }},
        {"collector_runs_at_threshold", []() -> std::string {
            Environment env(16);
            registerPrelude(env);
            runIn(env, "for i in 0..200 { var a = []; push(a, a); }");
            if (env.heap().tracked() > 64) {
                return "registry still tracks " + std::to_string(env.heap().tracked()) + " objects";
            }
            return "";
        }},
        {"pinned_values_survive", []() -> std::string {
            Environment env;
            std::weak_ptr<ListData> weak;
            {
                ListRef list = env.heap().makeList();
                list->items.push_back(Value::list(list));
                env.heap().pin(Value::list(list));
                weak = list;
            }
            env.collectGarbage();
            if (weak.expired()) return "pinned list was collected";
            env.heap().unpin(Value::list(weak.lock()));
            env.collectGarbage();
            if (!weak.expired()) return "unpinned cycle survived";
            return expectEq("pins", std::to_string(env.heap().pinnedCount()), "0");
        }},
        {"host_custom_type", []() -> std::string {
            Environment env;
            env.define("c", makeCountdown(3));
            std::string out = runIn(env, "for x in c { print x; } print c; print c + 1; print c(2); print c == c;");
            return expectEq("output", out, "3\n2\n1\n<countdown 3>\n4\n6\ntrue\n");
        }},
        {"host_custom_without_capability", []() -> std::string {
            Environment env;
            env.define("c", makeCountdown(3));
            try {
                runIn(env, "print c + \"x\";");
            } catch (const TypeError &e) {
                if (e.message().find("countdown") == std::string::npos) return "message does not name the host type";
                return "";
            }
            return "expected a TypeError";
        }},
        {"native_variadic_and_zero_arity", []() -> std::string {
            Environment env;
            env.defineNative("sum", FunctionData::kVariadic, [](Interpreter &, std::vector<Value> &args) {
                double total = 0;
                for (const auto &a : args) total += a.asNumber();
                return Value::number(total);
            });
            env.defineNative("answer", 0, [](Interpreter &, std::vector<Value> &) { return Value::number(42); });
            std::string out = runIn(env, "print sum(); print sum(1, 2, 3); print answer();");
            if (out != "0\n6\n42\n") return "got '" + out + "'";
            try {
                runIn(env, "answer(1);");
            } catch (const ArityError &) {
                return "";
            }
            return "expected an ArityError for answer(1)";
        }},
        {"native_calls_back_into_interpreter", []() -> std::string {
            Environment env;
            env.defineNative("twice", 2, [](Interpreter &in, std::vector<Value> &args) {
                Value once = in.call(args[0], {args[1]});
                return in.call(args[0], {once});
            });
            std::string out = runIn(env, "print twice(|x| { return x * 3; }, 2);");
            return expectEq("output", out, "18\n");
        }},
        {"native_exception_is_wrapped", []() -> std::string {
            Environment env;
            env.defineNative("boom", 0, [](Interpreter &, std::vector<Value> &) -> Value {
                throw std::runtime_error("disk on fire");
            });
            try {
                runIn(env, "var x = 1;\n  boom();");
            } catch (const RuntimeError &e) {
                if (e.message() != "native 'boom' failed: disk on fire") return "message was '" + e.message() + "'";
                return expectEq("error position", std::to_string(e.span().line) + ":" + std::to_string(e.span().column), "2:3");
            }
            return "expected a RuntimeError";
        }},
        {"environment_is_unavailable_when_idle", []() -> std::string {
            Interpreter interpreter;
            try {
                interpreter.environment();
            } catch (const RuntimeError &) {
                return "";
            }
            return "expected a RuntimeError";
        }},
        {"report_without_color_has_no_escapes", []() -> std::string {
            Parser parser(Source::fromUtf8("t", "print ;"));
            parser.parse();
            if (!parser.hasErrors()) return "expected a parse error";
            std::string plain = formatError(*parser.getErrors()[0], false);
            std::string colored = formatError(*parser.getErrors()[0], true);
            if (plain.find('\x1b') != std::string::npos) return "plain report contains escapes";
            if (colored.find('\x1b') == std::string::npos) return "colored report has no escapes";
            return expectEq("first line", plain.substr(0, plain.find('\n')), "[ERROR] Parsing error at 1:7...");
        }},
        {"caret_copies_tabs", []() -> std::string {
            Parser parser(Source::fromUtf8("t", "\tprint ;"));
            parser.parse();
            if (!parser.hasErrors()) return "expected a parse error";
            std::string snippet = formatSnippet(parser.getErrors()[0]->span());
            std::string caretLine = snippet.substr(snippet.find('\n') + 1);
            return expectEq("caret line", caretLine, "         | \t      ^\n");
        }},
    };

    int passed = 0;
    int failed = 0;
    for (const auto &tc : tests) {
        std::string reason;
        try {
            reason = tc.body();
        } catch (const Error &e) {
            reason = "unexpected " + e.className() + ": " + e.message();
        } catch (const std::exception &e) {
            reason = std::string("unexpected exception: ") + e.what();
        }
        if (reason.empty()) {
            std::cout << "[PASS] " << tc.name << std::endl;
            passed++;
        } else {
            std::cout << "[FAIL] " << tc.name << std::endl;
            std::cout << "  " << reason << std::endl;
            failed++;
        }
    }

    std::cout << "\nSummary: " << passed << " passed, " << failed << " failed" << std::endl;
    return failed == 0 ? 0 : 1;
}
