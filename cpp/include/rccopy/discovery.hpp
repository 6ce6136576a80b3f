// ==============================================================================
// rccopy/discovery.hpp - Directory Walker
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход дерева источника: только регулярные файлы
// - Пустые директории (чтобы воссоздать их в destination)
// - Исключение служебных файлов ОС (.DS_Store, Thumbs.db, "._*" и т.п.)
// - Детерминированный порядок результатов (сортировка по пути)
//
// ==============================================================================

#ifndef RCCOPY_DISCOVERY_HPP
#define RCCOPY_DISCOVERY_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace rccopy::io {

// ----------------------------------------------------------------------------
// DiscoveryOptions
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// Дополнительные имена (файлов или директорий), которые пропускаются
    /// вместе со встроенным набором. Сравнение по имени, case-sensitive.
    std::unordered_set<std::string> extra_exclusions;
};

/// Префикс теневых файлов метаданных macOS (AppleDouble): "._"
constexpr const char* APPLE_DOUBLE_PREFIX = "._";

/// Встроенный набор исключаемых имён
const std::vector<std::string>& default_exclusions();

/// Исключается ли запись с таким именем
bool is_excluded_name(std::string_view name, const DiscoveryOptions& opt = {});

// ----------------------------------------------------------------------------
// Обход
// ----------------------------------------------------------------------------

/// Найти все регулярные файлы под root
///
/// - Символические ссылки не разыменовываются и не попадают в результат
/// - Исключённые директории не обходятся
/// - Результат отсортирован, каждый файл встречается ровно один раз
///
/// @throws std::runtime_error если root или вложенная директория не читается
std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const DiscoveryOptions& opt = {});

/// Найти директории под root, у которых нет ни одной записи
/// Сам root в результат не входит.
///
/// @throws std::runtime_error если директория не читается
std::vector<std::filesystem::path> list_empty_dirs(const std::filesystem::path& root,
                                                   const DiscoveryOptions& opt = {});

}  // namespace rccopy::io

#endif  // RCCOPY_DISCOVERY_HPP
