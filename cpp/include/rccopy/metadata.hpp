// ==============================================================================
// rccopy/metadata.hpp - Metadata Preserver
// ==============================================================================
//
// Назначение:
// - Перенос прав доступа source -> destination
// - Перенос времён доступа/изменения/создания
//
// Время создания:
// - читается всегда (statx/st_birthtime/GetFileAttributesEx)
// - выставляется там, где ОС это позволяет (Windows, macOS)
// - если ФС его не отдаёт: ошибка файла, а при allow_missing_creation_time -
//   предупреждение
//
// ==============================================================================

#ifndef RCCOPY_METADATA_HPP
#define RCCOPY_METADATA_HPP

#include "rccopy/error.hpp"
#include "rccopy/platform.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rccopy::io {

struct MetadataOptions {
    /// Отсутствие времени создания у источника - предупреждение, а не ошибка файла
    bool allow_missing_creation_time = false;
};

/// Результат переноса метаданных
struct MetadataResult {
    bool ok = false;
    TransferError error;

    /// Некритичные замечания (например, нет birth time)
    std::vector<std::string> warnings;

    explicit operator bool() const { return ok; }
};

/// Перенести права и времена source -> destination по снятому stat источника
///
/// Порядок: права, затем времена (изменение прав не трогает mtime,
/// но запись времён последней гарантирует их итоговое значение).
MetadataResult preserve_metadata(const platform::FileStat& source_stat,
                                 const std::filesystem::path& source,
                                 const std::filesystem::path& destination,
                                 const MetadataOptions& opt = {});

}  // namespace rccopy::io

#endif  // RCCOPY_METADATA_HPP
