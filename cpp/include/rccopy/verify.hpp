// ==============================================================================
// rccopy/verify.hpp - Verifier
// ==============================================================================
//
// Назначение:
// - Независимый пересчёт контрольной суммы файла с начала
//   (тем же размером чанка, что и при копировании)
// - Сравнение дайджестов (без учёта регистра)
//
// Используется после копирования (destination) и при пропуске файла
// по совпавшему размеру (source и destination хешируются оба).
//
// ==============================================================================

#ifndef RCCOPY_VERIFY_HPP
#define RCCOPY_VERIFY_HPP

#include "rccopy/error.hpp"
#include "rccopy/hash.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace rccopy::io {

struct ChecksumResult {
    bool ok = false;
    std::string checksum;
    TransferError error;

    explicit operator bool() const { return ok; }
};

/// Пересчитать дайджест файла целиком
/// Ошибки возвращаются с ErrorKind::Verification
ChecksumResult checksum_file(const std::filesystem::path& path, hash::Algorithm algorithm,
                             std::size_t chunk_size = 0);

/// Побайтовое сравнение дайджестов после приведения к нижнему регистру
bool checksums_equal(std::string_view a, std::string_view b);

/// Результат сверки двух файлов
struct VerifyResult {
    bool ok = false;          // дайджесты вычислены и совпали
    std::string source_checksum;
    std::string destination_checksum;
    TransferError error;      // при ok=false

    explicit operator bool() const { return ok; }
};

/// Сверить destination с уже известным дайджестом источника
VerifyResult verify_against(const std::string& source_checksum,
                            const std::filesystem::path& destination, hash::Algorithm algorithm);

/// Независимо захешировать source и destination и сравнить
VerifyResult verify_pair(const std::filesystem::path& source,
                         const std::filesystem::path& destination, hash::Algorithm algorithm);

}  // namespace rccopy::io

#endif  // RCCOPY_VERIFY_HPP
