// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Формат ошибок повторяет clap: "error: ...\n\nUsage: ...\n\nFor more
// information, try '--help'.\n", exit code 2.
//
// ==============================================================================

#include "rccopy/cli.hpp"

#include "rccopy/platform.hpp"

#include <cstring>
#include <stdexcept>

namespace rccopy::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE =
    "Usage: rccopy [OPTIONS] --input <INPUT> --destination <DESTINATION>";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n" + USAGE + "\n\nFor more information, try '--help'.\n";
}

ParseResult fail(ParseResult result, const std::string& error_msg) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(error_msg);
    return result;
}

/// Опция со значением: "-c md5", "--checksum md5", "--checksum=md5"
/// @return true если arg - эта опция; value заполняется (nullptr если значения нет)
bool match_value_option(const char* arg, const char* short_name, const char* long_name,
                        int argc, char** argv, int& i, const char*& value) {
    if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
        value = (i + 1 < argc) ? argv[++i] : nullptr;
        return true;
    }
    std::string prefix = std::string(long_name) + "=";
    if (starts_with(arg, prefix.c_str())) {
        value = arg + prefix.size();
        return true;
    }
    return false;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(NAME) + " " + VERSION + "\n";
}

std::string tool_identity() {
    return std::string(NAME) + " ver. " + VERSION;
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n" +
           USAGE +
           "\n"
           "\n"
           "Options:\n"
           "  -i, --input <INPUT>              The source directory to copy.\n"
           "  -d, --destination <DESTINATION>  The target directory to copy to.\n"
           "  -c, --checksum <CHECKSUM>        The checksum method to use. Possible checksums: "
           "md5, sha1, xxhash64.\n"
           "  -m, --mhl                        Write a mhl file to the destination directory.\n"
           "      --dry-run                    Preview the files that will be copied.\n"
           "      --config <CONFIG>            Read default options from a YAML file.\n"
           "      --json                       Print a JSON run report to stdout.\n"
           "      --allow-missing-ctime        Warn instead of failing a file whose creation "
           "time cannot be read.\n"
           "      --no-banner                  Hide the banner.\n"
           "  -q                               Suppress informational output.\n"
           "  -v...                            Print verbose output.\n"
           "  -h, --help                       Print help\n"
           "  -V, --version                    Print version\n";
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
        result.diagnostic.stderr_message = render_help();
        return result;
    }

    CopyCommand copy_cmd;
    bool has_input = false;
    bool has_destination = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = nullptr;

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (arg[0] == '-' && arg[1] == 'v' &&
                   std::strspn(arg + 1, "v") == std::strlen(arg + 1)) {
            // -v, -vv, -vvv
            result.global.verbose += static_cast<int>(std::strlen(arg + 1));
        } else if (str_eq(arg, "-m") || str_eq(arg, "--mhl")) {
            copy_cmd.mhl = true;
        } else if (str_eq(arg, "--dry-run")) {
            copy_cmd.dry_run = true;
        } else if (str_eq(arg, "--json")) {
            copy_cmd.json = true;
        } else if (str_eq(arg, "--allow-missing-ctime")) {
            copy_cmd.allow_missing_ctime = true;
        } else if (match_value_option(arg, "-i", "--input", argc, argv, i, value)) {
            if (value == nullptr || value[0] == '\0') {
                return fail(std::move(result),
                            "error: a value is required for '--input <INPUT>' but none was "
                            "supplied");
            }
            copy_cmd.input = platform::path_from_utf8(value);
            has_input = true;
        } else if (match_value_option(arg, "-d", "--destination", argc, argv, i, value)) {
            if (value == nullptr || value[0] == '\0') {
                return fail(std::move(result),
                            "error: a value is required for '--destination <DESTINATION>' but "
                            "none was supplied");
            }
            copy_cmd.destination = platform::path_from_utf8(value);
            has_destination = true;
        } else if (match_value_option(arg, "-c", "--checksum", argc, argv, i, value)) {
            if (value == nullptr || value[0] == '\0') {
                return fail(std::move(result),
                            "error: a value is required for '--checksum <CHECKSUM>' but none was "
                            "supplied");
            }
            try {
                copy_cmd.checksum = hash::parse_algorithm(value);
            } catch (const std::invalid_argument& e) {
                return fail(std::move(result), std::string("error: invalid value '") + value +
                                                   "' for '--checksum <CHECKSUM>': " + e.what());
            }
        } else if (match_value_option(arg, nullptr, "--config", argc, argv, i, value)) {
            if (value == nullptr || value[0] == '\0') {
                return fail(std::move(result),
                            "error: a value is required for '--config <CONFIG>' but none was "
                            "supplied");
            }
            copy_cmd.config = platform::path_from_utf8(value);
        } else {
            return fail(std::move(result),
                        std::string("error: unexpected argument '") + arg + "' found");
        }
    }

    if (!has_input || !has_destination) {
        std::string missing;
        if (!has_input) {
            missing += "  --input <INPUT>\n";
        }
        if (!has_destination) {
            missing += "  --destination <DESTINATION>\n";
        }
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            "error: the following required arguments were not provided:\n" + missing + "\n" +
            USAGE + "\n\nFor more information, try '--help'.\n";
        return result;
    }

    result.ok = true;
    result.command = std::move(copy_cmd);
    return result;
}

}  // namespace rccopy::cli
