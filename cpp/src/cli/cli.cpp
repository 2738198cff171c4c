// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: сообщения об ошибках в стиле clap
// ("error: ...", Usage, подсказка), exit code 2 для ошибок использования.
//
// ==============================================================================

#include "ruleval/cli.hpp"

#include "ruleval/platform.hpp"

#include <cstring>

namespace ruleval::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

/// Опции, общие для eval и check
struct EvaluationArgs {
    std::optional<std::string> expression;
    std::optional<std::filesystem::path> data;
    std::optional<std::filesystem::path> declarations;
    bool json = false;
};

const char* usage_line(const std::string& command) {
    if (command == "eval") {
        return "Usage: ruleval eval [OPTIONS] --expression <EXPR>";
    }
    if (command == "check") {
        return "Usage: ruleval check [OPTIONS] --expression <EXPR>";
    }
    return "Usage: ruleval [OPTIONS] <COMMAND>";
}

std::string render_usage_error(const std::string& error_msg, const std::string& command = {}) {
    // Формат clap: error + "\n\n" + Usage + "\n\n" + hint
    return error_msg + "\n\n" + usage_line(command) +
           "\n\n"
           "For more information, try '--help'.\n";
}

ParseResult usage_error(ParseResult result, const std::string& message,
                        const std::string& command = {}) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message, command);
    return result;
}

std::string evaluation_help(const char* command, const char* about) {
    return std::string(about) +
           "\n"
           "\n"
           "Usage: ruleval " +
           command +
           " [OPTIONS] --expression <EXPR>\n"
           "\n"
           "Options:\n"
           "  -e, --expression <EXPR>      The rule expression\n"
           "  -d, --data <DATA>            JSON document to evaluate against ('-' for stdin)\n"
           "      --declarations <YAML>    Extra typed variable declarations\n"
           "  -j, --json                   Print output in JSON format\n"
           "  -v...                        Print verbose output\n"
           "  -q                           Suppress informational output\n"
           "      --no-banner              Hide the banner\n"
           "  -h, --help                   Print help\n";
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("ruleval ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: ruleval [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  eval   Evaluate a rule expression against a JSON document\n"
               "  check  Build the environment and compile a rule without evaluating it\n"
               "  help   Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -v...            Print verbose output\n"
               "  -q               Suppress informational output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n";
    }
    if (*command == "eval") {
        return evaluation_help("eval", "Evaluate a rule expression against a JSON document");
    }
    if (*command == "check") {
        return evaluation_help(
            "check", "Build the environment and compile a rule without evaluating it");
    }
    if (*command == "help") {
        return "Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Usage: ruleval help [COMMAND]\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            return usage_error(std::move(result),
                               std::string("error: unexpected argument '") + arg + "' found");
        }
    }

    if (cmd_idx >= argc) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    const std::string cmd = argv[cmd_idx];

    if (cmd == "help") {
        HelpCommand help_cmd;
        if (cmd_idx + 1 < argc) {
            help_cmd.command = std::string(argv[cmd_idx + 1]);
        }
        result.ok = true;
        result.command = help_cmd;
        return result;
    }

    if (cmd != "eval" && cmd != "check") {
        return usage_error(std::move(result), "error: unrecognized subcommand '" + cmd + "'");
    }

    // Аргументы eval / check
    EvaluationArgs args;
    for (int i = cmd_idx + 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Опция со значением: значение обязательно
        auto take_value = [&]() -> const char* {
            if (i + 1 >= argc) {
                return nullptr;
            }
            return argv[++i];
        };

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{cmd};
            return result;
        } else if (str_eq(arg, "-e") || str_eq(arg, "--expression")) {
            const char* value = take_value();
            if (value == nullptr) {
                return usage_error(std::move(result),
                                   "error: a value is required for '--expression <EXPR>' but "
                                   "none was supplied",
                                   cmd);
            }
            args.expression = std::string(value);
        } else if (str_eq(arg, "-d") || str_eq(arg, "--data")) {
            const char* value = take_value();
            if (value == nullptr) {
                return usage_error(std::move(result),
                                   "error: a value is required for '--data <DATA>' but none "
                                   "was supplied",
                                   cmd);
            }
            args.data = platform::path_from_utf8(value);
        } else if (str_eq(arg, "--declarations")) {
            const char* value = take_value();
            if (value == nullptr) {
                return usage_error(std::move(result),
                                   "error: a value is required for '--declarations <YAML>' but "
                                   "none was supplied",
                                   cmd);
            }
            args.declarations = platform::path_from_utf8(value);
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            args.json = true;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else {
            return usage_error(std::move(result),
                               std::string("error: unexpected argument '") + arg + "' found",
                               cmd);
        }
    }

    if (!args.expression.has_value()) {
        return usage_error(std::move(result),
                           "error: the following required arguments were not provided:\n"
                           "  --expression <EXPR>",
                           cmd);
    }

    if (cmd == "eval") {
        result.command = EvalCommand{*args.expression, args.data, args.declarations, args.json};
    } else {
        result.command = CheckCommand{*args.expression, args.data, args.declarations, args.json};
    }
    result.ok = true;
    return result;
}

}  // namespace ruleval::cli
