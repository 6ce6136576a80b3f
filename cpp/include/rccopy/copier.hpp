// ==============================================================================
// rccopy/copier.hpp - File Copier
// ==============================================================================
//
// Назначение:
// - Потоковое копирование source -> destination чанками по 8 MiB
// - Опциональное хеширование каждого записанного чанка (один путь кода)
// - Замер скорости: мгновенная скорость не реже раза в ~100 мс,
//   наружу отдаётся среднее по скользящему окну из 10 замеров
// - Перенос метаданных после записи всех байтов
//
// Ошибки любого шага локальны для файла и возвращаются как CopyResult.
//
// ==============================================================================

#ifndef RCCOPY_COPIER_HPP
#define RCCOPY_COPIER_HPP

#include "rccopy/error.hpp"
#include "rccopy/hash.hpp"
#include "rccopy/metadata.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rccopy::io {

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Размер чанка чтения/записи/хеширования
constexpr std::size_t CHUNK_SIZE = 8 * 1024 * 1024;

/// Период замера скорости
constexpr std::chrono::milliseconds THROUGHPUT_INTERVAL{100};

/// Размер окна сглаживания скорости
constexpr std::size_t THROUGHPUT_WINDOW = 10;

// ----------------------------------------------------------------------------
// ThroughputMeter - скользящее среднее скорости
// ----------------------------------------------------------------------------

class ThroughputMeter {
public:
    explicit ThroughputMeter(std::size_t window = THROUGHPUT_WINDOW);

    /// Добавить мгновенный замер (bytes за elapsed) и вернуть текущее среднее, байт/с
    /// Замеры с нулевой длительностью игнорируются.
    double add_sample(std::uint64_t bytes, std::chrono::duration<double> elapsed);

    /// Среднее арифметическое по окну (0 если замеров нет)
    double average() const;

    std::size_t sample_count() const { return samples_.size(); }

private:
    std::size_t window_;
    std::deque<double> samples_;
};

// ----------------------------------------------------------------------------
// copy_file
// ----------------------------------------------------------------------------

/// Наблюдатель сглаженной скорости (байт/с). Не влияет на ход копирования.
using ThroughputObserver = std::function<void(double bytes_per_second)>;

/// Источник монотонного времени для замеров скорости
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

struct CopyOptions {
    std::size_t chunk_size = CHUNK_SIZE;
    MetadataOptions metadata;
    ThroughputObserver on_throughput;

    /// Пустой - std::chrono::steady_clock::now
    SteadyClock clock;
};

struct CopyResult {
    bool ok = false;

    /// Дайджест источника; nullopt если алгоритм не запрошен
    std::optional<std::string> checksum;

    std::uint64_t bytes_copied = 0;
    TransferError error;
    std::vector<std::string> warnings;

    explicit operator bool() const { return ok; }
};

/// Скопировать один файл
///
/// 1. Создать родительские директории destination
/// 2. Открыть source на чтение, destination на запись (truncate/create)
/// 3. Переносить чанки, подавая их в хешер (если algorithm задан)
/// 4. Закрыть destination и перенести права и времена source
///
/// @return CopyResult; при ok=false файл мог остаться частично записанным
CopyResult copy_file(const std::filesystem::path& source,
                     const std::filesystem::path& destination,
                     std::optional<hash::Algorithm> algorithm, const CopyOptions& opt = {});

}  // namespace rccopy::io

#endif  // RCCOPY_COPIER_HPP
