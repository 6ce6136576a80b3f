// ==============================================================================
// rccopy/config.hpp - Конфигурационный файл
// ==============================================================================
//
// Назначение:
// - Загрузка значений по умолчанию из YAML (--config <FILE>)
// - Флаги командной строки имеют приоритет над файлом
//
// Формат:
//   checksum: xxhash64          # md5 | sha1 | xxhash64
//   mhl: true
//   allow_missing_creation_time: false
//   exclude:
//     - .cache
//
// Неизвестные ключи игнорируются.
//
// ==============================================================================

#ifndef RCCOPY_CONFIG_HPP
#define RCCOPY_CONFIG_HPP

#include "rccopy/hash.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rccopy::config {

/// Значения из файла; nullopt = ключ не задан
struct FileConfig {
    std::optional<hash::Algorithm> checksum;
    std::optional<bool> mhl;
    std::optional<bool> allow_missing_creation_time;
    std::vector<std::string> exclude;
};

struct LoadResult {
    bool ok = false;
    FileConfig config;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать YAML из строки
LoadResult parse(std::string_view yaml);

/// Загрузить YAML из файла
LoadResult load(const std::filesystem::path& path);

/// Итоговые параметры прогона
struct Settings {
    std::optional<hash::Algorithm> checksum;
    bool mhl = false;
    bool allow_missing_creation_time = false;
    std::vector<std::string> exclude;
};

/// Наложить флаги командной строки на значения из файла
/// Заданный в CLI алгоритм и включённые флаги имеют приоритет.
Settings merge(const FileConfig& file, std::optional<hash::Algorithm> cli_checksum, bool cli_mhl,
               bool cli_allow_missing_creation_time);

}  // namespace rccopy::config

#endif  // RCCOPY_CONFIG_HPP
