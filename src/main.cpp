#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <cstdlib>
#include "lexer.h"
#include "parser.h"
#include "interpreter.h"
#include "diagnostics.h"
#include "ast_printer.h"
#include "prelude.h"
#include "version.h"
#ifdef _WIN32
#include <windows.h>
#include <io.h>
#else
#include <unistd.h>
#endif

using namespace forge;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string path;
    bool wantHelp = false;
    bool wantVersion = false;
    bool wantTokens = false;
    bool wantAst = false;
    bool logSession = true;
    std::string logPath = "forge_session.log";
    int color = -1;  // -1 = decide from the terminal
    std::size_t gcThreshold = Heap::kDefaultThreshold;
};

void initConsole() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
    HANDLE hErr = GetStdHandle(STD_ERROR_HANDLE);
    if (hErr != INVALID_HANDLE_VALUE) {
        DWORD mode = 0;
        if (GetConsoleMode(hErr, &mode)) SetConsoleMode(hErr, mode | 0x0004); // ENABLE_VIRTUAL_TERMINAL_PROCESSING
    }
#endif
}

bool stderrIsTerminal() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

std::string nowTimestamp() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    std::time_t t = system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void printUsage(std::ostream& out) {
    out << "Usage: forge [flags] [file]\n";
    out << "  <file>               Run a script; without one the REPL starts.\n";
    out << "  --tokens             Dump the token stream and exit.\n";
    out << "  --ast                Dump the parsed syntax tree and exit.\n";
    out << "  --color / --no-color Colour diagnostics (default: on when stderr is a terminal).\n";
    out << "  --log <path>         REPL transcript file (default: forge_session.log).\n";
    out << "  --no-log             Do not write a REPL transcript.\n";
    out << "  --gc-threshold <n>   Tracked objects before the cycle collector runs.\n";
    out << "  --version            Print the version and exit.\n";
    out << "  --help               Show this help.\n";
}

// Returns false (after printing why) on a usage error.
bool parseArgs(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") opts.wantHelp = true;
        else if (arg == "--version") opts.wantVersion = true;
        else if (arg == "--tokens") opts.wantTokens = true;
        else if (arg == "--ast") opts.wantAst = true;
        else if (arg == "--color") opts.color = 1;
        else if (arg == "--no-color") opts.color = 0;
        else if (arg == "--no-log") opts.logSession = false;
        else if (arg == "--log") {
            if (i + 1 >= argc) { std::cerr << "--log needs a path" << std::endl; return false; }
            opts.logPath = argv[++i];
        } else if (arg == "--gc-threshold") {
            if (i + 1 >= argc) { std::cerr << "--gc-threshold needs a number" << std::endl; return false; }
            std::string value = argv[++i];
            char* end = nullptr;
            unsigned long long n = std::strtoull(value.c_str(), &end, 10);
            if (value.empty() || value[0] == '-' || *end != '\0' || n == 0) {
                std::cerr << "--gc-threshold expects a positive integer, got '" << value << "'" << std::endl;
                return false;
            }
            opts.gcThreshold = static_cast<std::size_t>(n);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown flag: " << arg << std::endl;
            return false;
        } else if (opts.path.empty()) {
            opts.path = arg;
        } else {
            std::cerr << "Only one script may be given (got '" << opts.path << "' and '" << arg << "')" << std::endl;
            return false;
        }
    }
    return true;
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return false;
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return !f.bad();
}

int runScript(const CliOptions& opts, bool color) {
    std::string bytes;
    if (!readFile(opts.path, bytes)) {
        std::cerr << "Cannot read script: '" << opts.path << "'" << std::endl;
        return kExitUsage;
    }
    SourceRef source = Source::fromUtf8(opts.path, bytes);

    if (opts.wantTokens) {
        try {
            Lexer lexer(source);
            printTokens(std::cout, lexer.tokenize());
        } catch (const LexError& e) {
            report(std::cerr, e, color);
            return kExitFailure;
        }
        return kExitOk;
    }

    Parser parser(source);
    auto program = parser.parse();
    if (parser.hasErrors()) {
        report(std::cerr, parser.getErrors(), color);
        return kExitFailure;
    }
    if (opts.wantAst) {
        printAst(std::cout, program);
        return kExitOk;
    }

    Environment env(opts.gcThreshold);
    registerPrelude(env);
    Interpreter interpreter;
    try {
        interpreter.run(program, env);
    } catch (const Error& e) {
        std::cout.flush();
        report(std::cerr, e, color);
        return kExitFailure;
    }
    return kExitOk;
}

void runRepl(const CliOptions& opts, bool color) {
    Environment env(opts.gcThreshold);
    registerPrelude(env);
    Interpreter interpreter; // persistent across lines

    std::ofstream session;
    if (opts.logSession) session.open(opts.logPath, std::ios::app);
    int lineNo = 0;

    std::cout << "** Forge " << FORGE_VERSION << " **" << std::endl;
    std::cout << "Type 'exit' or 'quit' to leave." << std::endl;
    while (true) {
        std::cout << "> " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) break;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        ++lineNo;
        if (session.good()) {
            session << "[" << nowTimestamp() << "] [Line " << lineNo << "] " << line << "\n";
            session.flush();
        }

        std::string trimmed = line;
        while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t')) trimmed.pop_back();
        while (!trimmed.empty() && (trimmed[0] == ' ' || trimmed[0] == '\t')) trimmed.erase(trimmed.begin());
        if (trimmed == "exit" || trimmed == "quit") break;
        if (trimmed.empty()) continue;

        SourceRef source = Source::fromUtf8("<repl:" + std::to_string(lineNo) + ">", line);
        Parser parser(source);
        try {
            if (NodePtr expr = parser.parseExpressionOnly()) {
                Value v = interpreter.evaluate(expr, env);
                env.define("_", v);
                if (!v.isNull()) std::cout << displayValue(v) << std::endl;
            } else {
                auto program = parser.parse();
                if (parser.hasErrors()) {
                    report(std::cerr, parser.getErrors(), color);
                    continue;
                }
                interpreter.run(program, env);
            }
        } catch (const Error& e) {
            std::cout.flush();
            report(std::cerr, e, color);
        }
        if (env.heap().shouldCollect()) env.collectGarbage();
    }
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (opts.wantHelp) {
        printUsage(std::cout);
        return kExitOk;
    }
    if (opts.wantVersion) {
        std::cout << "Forge " << FORGE_VERSION << "\n";
        std::cout << "Built on " << FORGE_BUILD_DATE << "\n";
        std::cout << "Commit: " << FORGE_BUILD_HASH << "\n";
        return kExitOk;
    }
    initConsole();

    if (opts.path.empty()) {
        if (opts.wantTokens || opts.wantAst) {
            std::cerr << "--tokens and --ast need a script path" << std::endl;
            return kExitUsage;
        }
        bool color = opts.color < 0 ? stderrIsTerminal() : opts.color == 1;
        runRepl(opts, color);
        return kExitOk;
    }
    return runScript(opts, opts.color == 1);
}
