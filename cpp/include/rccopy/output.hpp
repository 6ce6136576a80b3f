// ==============================================================================
// rccopy/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*] (цвет при TTY)
// - Строка скорости передачи ("\rTransfer speed: 12.34 MB/s")
// - JSON-отчёт о прогоне (RapidJSON)
//
// ==============================================================================

#ifndef RCCOPY_OUTPUT_HPP
#define RCCOPY_OUTPUT_HPP

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace rccopy::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan     // Отладка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить informational stderr
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Строка без префикса и цвета в stderr (если не quiet)
    void line(std::string_view message);

    /// Зелёная строка в stderr (если не quiet)
    void green_line(std::string_view message);

    /// Красная строка в stderr (всегда)
    void red_line(std::string_view message);

    // Скорость передачи
    // -------------------------------------------------------------------------

    /// Обновить строку "Transfer speed: ..." (только TTY stderr, не quiet)
    void transfer_speed(double bytes_per_second);

    /// Стереть строку скорости, если она выводилась
    void clear_transfer_line();

    // JSON
    // -------------------------------------------------------------------------

    /// Pretty JSON + newline в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    /// Записать с цветом
    void write_colored(Stream s, std::string_view message, Color color);

    /// Префикс "[x] " с цветом при TTY
    void write_prefix(std::string_view prefix, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    bool transfer_line_active_ = false;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Скорость в человекочитаемом виде: "512 B/s", "1.50 KB/s", ..., "2.00 TB/s"
std::string format_rate(double bytes_per_second);

/// Размер в человекочитаемом виде: "512 B", "1.50 KB", ...
std::string format_size(std::uint64_t bytes);

std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace rccopy::output

#endif  // RCCOPY_OUTPUT_HPP
