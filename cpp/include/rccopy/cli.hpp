// ==============================================================================
// rccopy/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv в CopyCommand / HelpCommand / VersionCommand
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// Проверка путей (существование, тип) в CLI не делается:
// это задача transfer::validate_paths().
//
// ==============================================================================

#ifndef RCCOPY_CLI_HPP
#define RCCOPY_CLI_HPP

#include "rccopy/hash.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace rccopy::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Копирование дерева
struct CopyCommand {
    std::filesystem::path input;                     // -i, --input (required)
    std::filesystem::path destination;               // -d, --destination (required)
    std::optional<hash::Algorithm> checksum;         // -c, --checksum
    bool mhl = false;                                // -m, --mhl
    bool dry_run = false;                            // --dry-run
    bool json = false;                               // --json
    bool allow_missing_ctime = false;                // --allow-missing-ctime
    std::optional<std::filesystem::path> config;     // --config
};

/// help - показать справку
struct HelpCommand {};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<CopyCommand, HelpCommand, VersionCommand>;

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
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version: "rccopy 0.1.0\n"
std::string render_version();

/// Строка инструмента для <tool> в MHL: "rccopy ver. 0.1.0"
std::string tool_identity();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* NAME = "rccopy";

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT =
    "Copies a given input directory to a new destination directory while preserving the "
    "directory structure using checksums to verify that the files are identical after copying. "
    "Can write a mhl (MediaHashList) file containing the checksums of the copied files to the "
    "destination directory.";

}  // namespace rccopy::cli

#endif  // RCCOPY_CLI_HPP
