// ==============================================================================
// ruleval/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (сообщение + exit code)
//
// Команды:
//   ruleval eval  -e <EXPR> [-d <DATA>] [--declarations <YAML>] [-j]
//   ruleval check -e <EXPR> [-d <DATA>] [--declarations <YAML>] [-j]
//   ruleval help [<COMMAND>]
//
// ==============================================================================

#ifndef RULEVAL_CLI_HPP
#define RULEVAL_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace ruleval::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// eval - вычислить правило над документом
struct EvalCommand {
    std::string expression;                             // -e, --expression (обязательно)
    std::optional<std::filesystem::path> data;          // -d, --data (нет или "-" = stdin)
    std::optional<std::filesystem::path> declarations;  // --declarations
    bool json = false;                                  // -j, --json
};

/// check - построить окружение и скомпилировать без вычисления
struct CheckCommand {
    std::string expression;
    std::optional<std::filesystem::path> data;
    std::optional<std::filesystem::path> declarations;
    bool json = false;
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

// ----------------------------------------------------------------------------
// Command - вариант команды
// ----------------------------------------------------------------------------

using Command = std::variant<EvalCommand, CheckCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Генерировать текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Генерировать текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Версия программы
constexpr const char* VERSION = "0.1.0";

/// Описание программы
constexpr const char* ABOUT = "Evaluate boolean detection rules against JSON events";

}  // namespace ruleval::cli

#endif  // RULEVAL_CLI_HPP
