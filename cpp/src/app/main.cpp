// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации и наложение флагов CLI
// 4. Прогон копирования (transfer)
// 5. Возврат exit code: 0 успех / dry run / нечего копировать, 1 ошибки, 2 ошибка CLI
//
// ==============================================================================

#include "rccopy/cli.hpp"
#include "rccopy/config.hpp"
#include "rccopy/output.hpp"
#include "rccopy/platform.hpp"
#include "rccopy/report.hpp"
#include "rccopy/transfer.hpp"

#include <exception>
#include <iostream>
#include <rapidjson/document.h>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
    ██████╗  ██████╗ ██████╗ ██████╗ ██████╗ ██╗   ██╗
    ██╔══██╗██╔════╝██╔════╝██╔═══██╗██╔══██╗╚██╗ ██╔╝
    ██████╔╝██║     ██║     ██║   ██║██████╔╝ ╚████╔╝
    ██╔══██╗██║     ██║     ██║   ██║██╔═══╝   ╚██╔╝
    ██║  ██║╚██████╗╚██████╗╚██████╔╝██║        ██║
    ╚═╝  ╚═╝ ╚═════╝ ╚═════╝ ╚═════╝ ╚═╝        ╚═╝
)";

void print_banner(rccopy::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(rccopy::output::Stream::Stderr, BANNER);
    writer.write_line(rccopy::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Копирование
// ----------------------------------------------------------------------------

int run_copy(const rccopy::cli::CopyCommand& cmd, rccopy::output::Writer& writer) {
    using namespace rccopy;

    config::FileConfig file_config;
    if (cmd.config.has_value()) {
        auto loaded = config::load(*cmd.config);
        if (!loaded) {
            TransferError error{ErrorKind::Configuration, loaded.error, ""};
            writer.error(error.format());
            return 1;
        }
        file_config = std::move(loaded.config);
        writer.debug("Loaded config " + platform::path_to_utf8(*cmd.config));
    }

    auto settings = config::merge(file_config, cmd.checksum, cmd.mhl, cmd.allow_missing_ctime);

    transfer::TransferOptions options;
    options.source_root = cmd.input;
    options.destination_root = cmd.destination;
    options.algorithm = settings.checksum;
    options.write_mhl = settings.mhl;
    options.preview = cmd.dry_run;
    options.allow_missing_creation_time = settings.allow_missing_creation_time;
    options.discovery.extra_exclusions.insert(settings.exclude.begin(), settings.exclude.end());
    options.tool = cli::tool_identity();

    transfer::Transfer transfer(std::move(options), writer);
    auto summary = transfer.run();

    if (cmd.json) {
        rapidjson::Document doc;
        report::summary_to_json(summary, doc);
        writer.write_json_pretty(doc);
    }

    return summary.status == transfer::RunStatus::Errors ? 1 : 0;
}

int run(int argc, char** argv) {
    using namespace rccopy;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга: сообщение как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_copy(cmd, writer);
            }
        },
        parse_result.command);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Перехват исключений на границе приложения: "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
