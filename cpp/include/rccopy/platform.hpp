// ==============================================================================
// rccopy/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Идентификация оператора (user/host/device) для заголовка MHL
// - Метаданные файлов: размер, права, времена доступа/изменения/создания
// - Установка времён файла после копирования
//
// Вся платформенная специфика (#ifdef _WIN32 / __APPLE__ / __linux__)
// изолирована в platform.cpp.
//
// ==============================================================================

#ifndef RCCOPY_PLATFORM_HPP
#define RCCOPY_PLATFORM_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rccopy::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

/// Путь в generic-форме ("/" как разделитель) в UTF-8
/// Используется для относительных путей в MHL на всех платформах
std::string generic_utf8(const std::filesystem::path& p);

/// fopen для native path ("rb", "wb"); на Windows через _wfopen
std::FILE* open_file(const std::filesystem::path& path, const char* mode);

struct FileCloser {
    void operator()(std::FILE* f) const {
        if (f != nullptr) {
            std::fclose(f);
        }
    }
};

/// Владеющий FILE*, закрывается при выходе из области видимости
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Информация о платформе и операторе
// ----------------------------------------------------------------------------

/// Имя текущего пользователя ("unknown" если не удалось определить)
std::string user_name();

/// Сетевое имя хоста
std::string host_name();

/// Человекочитаемое имя устройства
/// Linux: PRETTY_HOSTNAME из /etc/machine-info, иначе host_name()
std::string device_name();

// ----------------------------------------------------------------------------
// Метаданные файлов
// ----------------------------------------------------------------------------

using TimePoint = std::chrono::system_clock::time_point;

/// Снимок метаданных файла
struct FileStat {
    std::uint64_t size = 0;
    std::filesystem::perms permissions = std::filesystem::perms::none;
    TimePoint accessed;
    TimePoint modified;

    /// Время создания (birth time). nullopt, если ФС/ядро его не отдаёт
    std::optional<TimePoint> created;
};

/// Результат stat_file()
struct StatResult {
    bool ok = false;
    FileStat stat;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Получить метаданные файла (символические ссылки разыменовываются)
StatResult stat_file(const std::filesystem::path& path);

/// Установить времена доступа/изменения (и создания, где это возможно)
///
/// Время создания выставляется только на Windows и macOS. На Linux
/// birth time не изменяется системными вызовами и поле игнорируется.
///
/// @param error[out] Текст ошибки при неудаче
/// @return true при успехе
bool set_file_times(const std::filesystem::path& path, const FileStat& times, std::string& error);

}  // namespace rccopy::platform

#endif  // RCCOPY_PLATFORM_HPP
