// ==============================================================================
// rccopy/error.hpp - Ошибки копирования
// ==============================================================================
//
// Назначение:
// - Классификация ошибок (фатальные до старта / локальные для файла / MHL)
// - TransferError - значение ошибки, которое возвращают Copier/Verifier
//
// Политика:
// - Configuration, Path: фатальные, до обработки файлов
// - Copy, Verification: локальные, файл попадает в список failed, прогон идёт дальше
// - ManifestWrite: после копирования, прогон завершается с ошибкой
//
// ==============================================================================

#ifndef RCCOPY_ERROR_HPP
#define RCCOPY_ERROR_HPP

#include <string>

namespace rccopy {

enum class ErrorKind {
    Configuration,  // неизвестный алгоритм, битый конфиг
    Path,           // source/destination отсутствуют, не директории, совпадают
    Copy,           // open/read/write/permissions/timestamps
    Verification,   // дайджесты не совпали или не вычислились
    ManifestWrite   // ошибка записи MHL
};

const char* error_kind_to_string(ErrorKind kind);

struct TransferError {
    ErrorKind kind = ErrorKind::Copy;
    std::string message;
    std::string path;

    /// "<kind> error: <message> (<path>)"
    std::string format() const;
};

}  // namespace rccopy

#endif  // RCCOPY_ERROR_HPP
