// ==============================================================================
// rccopy/transfer.hpp - Transfer Orchestrator
// ==============================================================================
//
// Назначение:
// - Проверка путей source/destination до начала работы
// - Обход источника и решение по каждому файлу: пропуск или копирование
// - Сверка контрольных сумм и сбор записей манифеста
// - Воссоздание пустых директорий
// - Запись MHL и итоговый статус прогона
//
// Состояния файла:
//   Pending -> SkippedVerified | SkippedFailed | SkippedUnverified
//            | CopiedVerified | CopiedFailed | CopiedNoChecksum
//   В режиме dry run: PlannedSkip | PlannedCopy (ничего не изменяется на диске)
//
// Время и сведения о создателе MHL внедряются (Clock, CreatorProvider),
// чтобы прогон был воспроизводим в тестах.
//
// ==============================================================================

#ifndef RCCOPY_TRANSFER_HPP
#define RCCOPY_TRANSFER_HPP

#include "rccopy/copier.hpp"
#include "rccopy/discovery.hpp"
#include "rccopy/error.hpp"
#include "rccopy/hash.hpp"
#include "rccopy/mhl.hpp"
#include "rccopy/output.hpp"
#include "rccopy/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rccopy::transfer {

using TimePoint = platform::TimePoint;

// ----------------------------------------------------------------------------
// Состояния
// ----------------------------------------------------------------------------

enum class FileState {
    SkippedVerified,    // размер совпал, дайджесты совпали
    SkippedFailed,      // размер совпал, дайджесты разошлись или не вычислились
    SkippedUnverified,  // размер совпал, алгоритм не задан
    CopiedVerified,
    CopiedFailed,
    CopiedNoChecksum,
    PlannedSkip,
    PlannedCopy
};

/// "skipped_verified", "copied_failed", ...
const char* file_state_to_string(FileState state);

/// SkippedFailed | CopiedFailed
bool is_failure(FileState state);

enum class RunStatus {
    Success,  // хотя бы один файл скопирован или подтверждён, ошибок нет
    Errors,   // есть неудачные файлы или не записан MHL
    Nothing,  // нечего было делать
    DryRun
};

/// "success" | "errors" | "nothing" | "dry_run"
const char* run_status_to_string(RunStatus status);

// ----------------------------------------------------------------------------
// Опции и внедряемые зависимости
// ----------------------------------------------------------------------------

struct TransferOptions {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    std::optional<hash::Algorithm> algorithm;
    bool write_mhl = false;
    bool preview = false;  // --dry-run
    bool allow_missing_creation_time = false;
    io::DiscoveryOptions discovery;
    std::size_t chunk_size = io::CHUNK_SIZE;

    /// Значение <tool> в MHL
    std::string tool;
};

/// Источник текущего времени
using Clock = std::function<TimePoint()>;

/// Сведения о создателе MHL для заданного времени старта
using CreatorProvider = std::function<mhl::CreatorInfo(const std::string& tool, TimePoint start)>;

// ----------------------------------------------------------------------------
// Результаты
// ----------------------------------------------------------------------------

struct FileOutcome {
    std::filesystem::path source;
    std::filesystem::path destination;
    FileState state = FileState::PlannedCopy;
    std::optional<std::string> checksum;
    std::optional<TransferError> error;
    std::uint64_t bytes_copied = 0;
};

struct TransferSummary {
    RunStatus status = RunStatus::Nothing;
    TimePoint start;

    std::vector<FileOutcome> files;  // в порядке обхода

    /// Исходные пути неудачных файлов (и директорий, которые не удалось создать)
    std::vector<std::filesystem::path> failed;

    /// Воссозданные пустые директории (в destination)
    std::vector<std::filesystem::path> created_dirs;

    mhl::RunManifest manifest;
    std::optional<std::filesystem::path> mhl_path;
    std::optional<TransferError> manifest_error;

    std::uint64_t bytes_copied = 0;

    /// Количество файлов в данном состоянии
    std::size_t count(FileState state) const;

    bool has_failures() const { return !failed.empty() || manifest_error.has_value(); }
};

// ----------------------------------------------------------------------------
// Проверка путей
// ----------------------------------------------------------------------------

struct PathCheck {
    bool ok = false;
    TransferError error;

    explicit operator bool() const { return ok; }
};

/// Оба пути существуют и являются директориями, не совпадают,
/// destination не лежит внутри source (после канонизации)
PathCheck validate_paths(const std::filesystem::path& source,
                         const std::filesystem::path& destination);

// ----------------------------------------------------------------------------
// Transfer
// ----------------------------------------------------------------------------

class Transfer {
public:
    Transfer(TransferOptions options, output::Writer& writer);

    /// Заменить источник времени (по умолчанию system_clock::now)
    Transfer& clock(Clock clock);

    /// Заменить источник сведений о создателе (по умолчанию mhl::collect_creator_info)
    Transfer& creator(CreatorProvider provider);

    /// Выполнить прогон целиком
    ///
    /// Ошибки отдельных файлов попадают в summary; прогон продолжается.
    ///
    /// @throws std::runtime_error при ошибке путей или обхода источника
    TransferSummary run();

private:
    FileOutcome process_file(const std::filesystem::path& source, std::size_t index,
                             std::size_t total, TransferSummary& summary);

    FileOutcome verify_existing(FileOutcome outcome, const platform::FileStat& source_stat,
                                TransferSummary& summary);

    FileOutcome copy_new(FileOutcome outcome, const platform::FileStat& source_stat,
                         TransferSummary& summary);

    void recreate_empty_dirs(TransferSummary& summary);

    void write_manifest(TransferSummary& summary);

    void add_record(TransferSummary& summary, const FileOutcome& outcome,
                    const platform::FileStat& source_stat);

    TransferOptions options_;
    output::Writer& writer_;
    Clock clock_;
    CreatorProvider creator_;
};

/// Итоговые строки: "Finished successfully.", "Finished with errors." + список, ...
void print_summary(const TransferSummary& summary, output::Writer& writer);

}  // namespace rccopy::transfer

#endif  // RCCOPY_TRANSFER_HPP
