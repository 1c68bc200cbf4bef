#include <iostream>
#include <vector>
#include <string>
#include <cstdio>
#include <array>
#include <sstream>
#ifdef _WIN32
#define POPEN _popen
#define PCLOSE _pclose
#else
#include <sys/wait.h>
#define POPEN popen
#define PCLOSE pclose
#endif

// Runs cmd through the shell with stderr folded into stdout.
static std::string runCmd(const std::string &cmd, int &exitCode) {
    std::array<char, 4096> buf{};
    std::string out;
    exitCode = -1;
    FILE *p = POPEN((cmd + " 2>&1").c_str(), "r");
    if (!p) return out;
    while (fgets(buf.data(), static_cast<int>(buf.size()), p)) {
        out += buf.data();
    }
    int status = PCLOSE(p);
#ifdef _WIN32
    exitCode = status;
#else
    exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
    return out;
}

static std::string quote(const std::string &s) { return "\"" + s + "\""; }

struct TestCase {
    std::string name;
    std::string args;                        // flags and script, relative paths resolved against the script dir
    std::vector<std::string> expectedLines;  // exact, when non-empty
    std::vector<std::string> fragments;      // must appear in this order
    int expectedExit = 0;
    std::string stdinFile;                   // fed to the REPL
    std::vector<std::string> forbidden;
};

int main(int argc, char **argv) {
    if (argc < 3) {
        std::cerr << "usage: forge_script_tests <forge executable> <scripts dir>" << std::endl;
        return 2;
    }
    const std::string exe = argv[1];
    const std::string dir = std::string(argv[2]) + "/";

    const std::string arityLine = R"(var f = || { print "hi"; }; f(1);)";

    std::vector<TestCase> tests = {
        {"basics", quote(dir + "basics.fg"),
         {"6", "sum is 6", "forge", "hammer", "2", "big", "2 words"}, {}, 0},
        {"splice", quote(dir + "splice.fg"),
         {R"([0, "a", "b", "c", "d", "e", 3])", "world", "An pear is what I am eating",
          "[[0, 5], [0, 5]]", "[[0, 5], [0, 0]]"}, {}, 0},
        {"closures", quote(dir + "closures.fg"),
         {"3", "11", R"(["hits": 2])"}, {}, 0},
        {"arity_error", quote(dir + "arity_error.fg"),
         {"[ERROR] Runtime error at 1:29...",
          "        1| " + arityLine,
          "         | " + std::string(28, ' ') + "^^^^",
          "   ...declared at 1:9...",
          "        1| " + arityLine,
          "         | " + std::string(8, ' ') + std::string(18, '^'),
          "   ArityError: 'f' expected 0 arguments, found 1"}, {}, 1},
        {"runtime_trail", quote(dir + "runtime_trail.fg"),
         {"start", "yes",
          "[ERROR] Runtime error at 3:8...",
          "   ...while calling 'check'...",
          "        3|     if v {",
          "         | " + std::string(7, ' ') + "^",
          "   TypeError: cannot determine truthiness of value of type 'null'"}, {}, 1},
        {"parse_errors", quote(dir + "parse_errors.fg"),
         {"[ERROR] Parsing error at 2:5...",
          "   ...while parsing variable declaration...",
          "        2| var = 1;",
          "         | " + std::string(4, ' ') + "^",
          "   ParseError: expected variable name, found '='",
          "[ERROR] Parsing error at 3:9...",
          "   ...while parsing parenthesized expression...",
          "   ...while parsing print statement...",
          "        3| print (2;",
          "         | " + std::string(8, ' ') + "^",
          "   ParseError: expected ')', found ';'"}, {}, 1},
        {"tokens_flag", "--tokens " + quote(dir + "arity_error.fg"),
         {}, {"1:1\tVAR | var", "1:9\tPIPE | |", "1:29\tIDENTIFIER | f", "END"}, 0},
        {"ast_flag", "--ast " + quote(dir + "closures.fg"),
         {}, {"Block  @1:1", "  Var counter  @1:1", "    Function ||", "Call"}, 0},
        {"missing_script", quote(dir + "no_such_script.fg"),
         {}, {"Cannot read script"}, 2},
        {"unknown_flag", "--frobnicate",
         {}, {"Unknown flag: --frobnicate", "Usage: forge"}, 2},
        {"repl_session", "--no-log --no-color",
         {}, {"> 3", "> > 10", "undefined variable 'y'", "allocation too large", "> 5", "> 6"}, 0,
         dir + "repl_session.txt", {"after exit"}},
    };

    auto normalize = [](const std::string &s) {
        std::vector<std::string> lines;
        std::istringstream iss(s);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) lines.push_back(line);
        }
        return lines;
    };

    int failures = 0;
    int passes = 0;
    for (auto &tc : tests) {
        std::string cmd = quote(exe) + " " + tc.args;
        if (!tc.stdinFile.empty()) cmd += " < " + quote(tc.stdinFile);
        int exitCode = 0;
        std::string out = runCmd(cmd, exitCode);
        std::vector<std::string> lines = normalize(out);

        std::vector<std::string> problems;
        if (exitCode != tc.expectedExit) {
            problems.push_back("exit code " + std::to_string(exitCode) + ", expected " + std::to_string(tc.expectedExit));
        }
        if (!tc.expectedLines.empty() && lines != tc.expectedLines) {
            problems.push_back("output lines differ");
        }
        std::size_t from = 0;
        for (const auto &fragment : tc.fragments) {
            std::size_t at = out.find(fragment, from);
            if (at == std::string::npos) {
                problems.push_back("missing (in order): " + fragment);
                break;
            }
            from = at + fragment.size();
        }
        for (const auto &bad : tc.forbidden) {
            if (out.find(bad) != std::string::npos) problems.push_back("unexpected: " + bad);
        }

        if (problems.empty()) {
            ++passes;
            std::cout << "[PASS] " << tc.name << "\n";
        } else {
            ++failures;
            std::cout << "[FAIL] " << tc.name << "\n";
            for (auto &p : problems) std::cout << "  " << p << "\n";
            std::cout << "  Output (" << lines.size() << " lines):\n";
            for (auto &l : lines) std::cout << "    " << l << "\n";
            if (!tc.expectedLines.empty()) {
                std::cout << "  Expected (" << tc.expectedLines.size() << "):\n";
                for (auto &l : tc.expectedLines) std::cout << "    " << l << "\n";
            }
        }
    }
    std::cout << "Summary: " << passes << " passed, " << failures << " failed." << std::endl;
    return failures == 0 ? 0 : 1;
}
