// ==============================================================================
// rccopy/mhl.hpp - MediaHashList (MHL) манифест
// ==============================================================================
//
// Назначение:
// - FileRecord / CreatorInfo / RunManifest - модель манифеста
// - Сериализация в XML <hashlist version="1.1"> через pugixml
// - Обратный разбор манифеста (проверка round-trip)
// - Имя файла манифеста и форматирование времени (RFC 3339, UTC, секунды)
//
// Формат:
//   <hashlist version="1.1">
//     <creatorinfo> name, username, hostname, tool, startdate, finishdate
//     <hash> file, size, lastmodificationdate, <md5|sha1|xxhash64be>, hashdate
//
// Всё состояние процесса (время, пользователь, хост) передаётся явно
// через CreatorInfo, сам writer ничего не читает из окружения.
//
// ==============================================================================

#ifndef RCCOPY_MHL_HPP
#define RCCOPY_MHL_HPP

#include "rccopy/error.hpp"
#include "rccopy/hash.hpp"
#include "rccopy/platform.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rccopy::mhl {

using TimePoint = platform::TimePoint;

/// Версия формата в атрибуте корневого элемента
constexpr const char* MHL_VERSION = "1.1";

/// Расширение файла манифеста
constexpr const char* MHL_EXTENSION = ".mhl";

// ----------------------------------------------------------------------------
// Модель
// ----------------------------------------------------------------------------

/// Запись о проверенном файле
struct FileRecord {
    std::string relative_path;  // относительно корня копии, разделитель "/"
    std::uint64_t size_bytes = 0;
    TimePoint modified_at;
    std::string checksum;  // lowercase hex
    hash::Algorithm algorithm = hash::Algorithm::Xxh64;
    TimePoint hashed_at;
};

/// Сведения о создателе манифеста
struct CreatorInfo {
    std::string name;      // имя устройства
    std::string username;
    std::string hostname;
    std::string tool;      // "rccopy ver. X.Y.Z"
    TimePoint start;
    TimePoint finish;
};

/// Манифест одного прогона
struct RunManifest {
    CreatorInfo creator;
    std::vector<FileRecord> records;  // в порядке обнаружения
};

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// "2024-01-02T03:04:05Z" (UTC, точность до секунд)
std::string format_rfc3339(TimePoint tp);

/// Разобрать RFC 3339 ("...Z" или "...+hh:mm"); дробная часть отбрасывается
std::optional<TimePoint> parse_rfc3339(std::string_view text);

// ----------------------------------------------------------------------------
// Запись / чтение
// ----------------------------------------------------------------------------

/// Имя файла манифеста: "<basename(source_root)>_<YYYY-MM-DD_HHMMSS>.mhl"
std::string file_name(const std::filesystem::path& source_root, TimePoint start);

/// Собрать CreatorInfo из окружения процесса (пользователь, хост, устройство)
CreatorInfo collect_creator_info(std::string tool, TimePoint start);

/// Корректная ли UTF-8 последовательность (без overlong, суррогатов и > U+10FFFF)
bool is_valid_utf8(std::string_view text);

/// Сериализовать манифест в XML-строку
std::string to_xml(const RunManifest& manifest);

struct WriteResult {
    bool ok = false;
    TransferError error;

    explicit operator bool() const { return ok; }
};

/// Записать манифест в файл (ErrorKind::ManifestWrite при ошибке)
///
/// Путь записи, не являющийся корректным UTF-8, - ошибка: документ объявлен как UTF-8.
WriteResult write_mhl(const std::filesystem::path& path, const RunManifest& manifest);

struct ReadResult {
    bool ok = false;
    RunManifest manifest;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать манифест из строки
ReadResult parse_mhl(std::string_view xml);

/// Прочитать манифест из файла
ReadResult read_mhl(const std::filesystem::path& path);

}  // namespace rccopy::mhl

#endif  // RCCOPY_MHL_HPP
