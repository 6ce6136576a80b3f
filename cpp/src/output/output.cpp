// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: никаких std::endl, всё через fwrite.
//
// ==============================================================================

#include "rccopy/output.hpp"

#include "rccopy/platform.hpp"

#include <cmath>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace rccopy::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";

// Ширина поля скорости: затирает остатки предыдущего значения
constexpr int RATE_FIELD_WIDTH = 30;

std::string format_scaled(double value, const char* const units[], int count) {
    // База 1024, два знака после запятой начиная с KB
    char buf[64];
    if (value < 1024.0) {
        std::snprintf(buf, sizeof(buf), "%llu %s",
                      static_cast<unsigned long long>(value < 0.0 ? 0.0 : value), units[0]);
        return buf;
    }
    int unit = 0;
    while (value >= 1024.0 && unit < count - 1) {
        value /= 1024.0;
        ++unit;
    }
    std::snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    return buf;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefix(std::string_view prefix, Color color) {
    clear_transfer_line();
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[+] ", Color::Green);
    write_line(Stream::Stderr, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[!] ", Color::Yellow);
    write_line(Stream::Stderr, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefix("[x] ", Color::Red);
    write_line(Stream::Stderr, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefix("[*] ", Color::Cyan);
    write_line(Stream::Stderr, message);
}

void Writer::line(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    clear_transfer_line();
    write_line(Stream::Stderr, message);
}

void Writer::green_line(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    clear_transfer_line();
    write_colored(Stream::Stderr, message, Color::Green);
    write(Stream::Stderr, "\n");
}

void Writer::red_line(std::string_view message) {
    clear_transfer_line();
    write_colored(Stream::Stderr, message, Color::Red);
    write(Stream::Stderr, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    if (supports_color(s)) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::transfer_speed(double bytes_per_second) {
    // Возврат каретки в файл/пайп только засоряет лог
    if (config_.quiet || !platform::is_tty_stderr()) {
        return;
    }
    char buf[96];
    std::snprintf(buf, sizeof(buf), "\rTransfer speed: %-*s\r", RATE_FIELD_WIDTH,
                  format_rate(bytes_per_second).c_str());
    write(Stream::Stderr, buf);
    std::fflush(stderr);
    transfer_line_active_ = true;
}

void Writer::clear_transfer_line() {
    if (!transfer_line_active_) {
        return;
    }
    transfer_line_active_ = false;
    write(Stream::Stderr, "\r\x1b[2K");
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_rate(double bytes_per_second) {
    static const char* const units[] = {"B/s", "KB/s", "MB/s", "GB/s", "TB/s"};
    if (!std::isfinite(bytes_per_second)) {
        bytes_per_second = 0.0;
    }
    return format_scaled(bytes_per_second, units, 5);
}

std::string format_size(std::uint64_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    return format_scaled(static_cast<double>(bytes), units, 5);
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace rccopy::output
