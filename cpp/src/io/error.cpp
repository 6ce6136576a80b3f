// ==============================================================================
// error.cpp - Ошибки копирования
// ==============================================================================

#include "rccopy/error.hpp"

namespace rccopy {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Configuration:
        return "configuration";
    case ErrorKind::Path:
        return "path";
    case ErrorKind::Copy:
        return "copy";
    case ErrorKind::Verification:
        return "verification";
    case ErrorKind::ManifestWrite:
        return "manifest write";
    }
    return "unknown";
}

std::string TransferError::format() const {
    std::string result = std::string(error_kind_to_string(kind)) + " error: " + message;
    if (!path.empty()) {
        result += " (" + path + ")";
    }
    return result;
}

}  // namespace rccopy
