// ==============================================================================
// rccopy/report.hpp - JSON-отчёт о прогоне
// ==============================================================================
//
// Формат (--json, stdout):
//   {
//     "status": "success" | "errors" | "nothing" | "dry_run",
//     "start": "2024-01-02T03:04:05Z",
//     "counts": { "<state>": N, ... },
//     "bytes_copied": N,
//     "failed": ["<source path>", ...],
//     "mhl": "<path>" | null,
//     "files": [ { "source", "destination", "state", "checksum"? } ]
//   }
//
// ==============================================================================

#ifndef RCCOPY_REPORT_HPP
#define RCCOPY_REPORT_HPP

#include "rccopy/transfer.hpp"

#include <rapidjson/document.h>

#include <string>

namespace rccopy::report {

/// Заполнить doc (становится объектом) сводкой прогона
void summary_to_json(const transfer::TransferSummary& summary, rapidjson::Document& doc);

/// Компактная JSON-строка сводки
std::string summary_to_string(const transfer::TransferSummary& summary);

}  // namespace rccopy::report

#endif  // RCCOPY_REPORT_HPP
