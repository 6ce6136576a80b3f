// ==============================================================================
// report.cpp - JSON-отчёт о прогоне
// ==============================================================================

#include "rccopy/report.hpp"

#include "rccopy/platform.hpp"

#include <cstdint>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace rccopy::report {

namespace {

rapidjson::Value string_value(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
}

constexpr transfer::FileState ALL_STATES[] = {
    transfer::FileState::SkippedVerified,  transfer::FileState::SkippedFailed,
    transfer::FileState::SkippedUnverified, transfer::FileState::CopiedVerified,
    transfer::FileState::CopiedFailed,     transfer::FileState::CopiedNoChecksum,
    transfer::FileState::PlannedSkip,      transfer::FileState::PlannedCopy,
};

}  // namespace

void summary_to_json(const transfer::TransferSummary& summary, rapidjson::Document& doc) {
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("status",
                  rapidjson::Value(transfer::run_status_to_string(summary.status), alloc), alloc);
    doc.AddMember("start", string_value(mhl::format_rfc3339(summary.start), alloc), alloc);

    rapidjson::Value counts(rapidjson::kObjectType);
    for (auto state : ALL_STATES) {
        counts.AddMember(rapidjson::Value(transfer::file_state_to_string(state), alloc),
                         rapidjson::Value(static_cast<std::uint64_t>(summary.count(state))),
                         alloc);
    }
    doc.AddMember("counts", counts, alloc);
    doc.AddMember("bytes_copied", summary.bytes_copied, alloc);

    rapidjson::Value failed(rapidjson::kArrayType);
    for (const auto& path : summary.failed) {
        failed.PushBack(string_value(platform::path_to_utf8(path), alloc), alloc);
    }
    doc.AddMember("failed", failed, alloc);

    if (summary.mhl_path.has_value()) {
        doc.AddMember("mhl", string_value(platform::path_to_utf8(*summary.mhl_path), alloc),
                      alloc);
    } else {
        doc.AddMember("mhl", rapidjson::Value(rapidjson::kNullType), alloc);
    }

    rapidjson::Value files(rapidjson::kArrayType);
    for (const auto& f : summary.files) {
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("source", string_value(platform::path_to_utf8(f.source), alloc), alloc);
        entry.AddMember("destination", string_value(platform::path_to_utf8(f.destination), alloc),
                        alloc);
        entry.AddMember("state", rapidjson::Value(transfer::file_state_to_string(f.state), alloc),
                        alloc);
        if (f.checksum.has_value()) {
            entry.AddMember("checksum", string_value(*f.checksum, alloc), alloc);
        }
        if (f.error.has_value()) {
            entry.AddMember("error", string_value(f.error->format(), alloc), alloc);
        }
        files.PushBack(entry, alloc);
    }
    doc.AddMember("files", files, alloc);
}

std::string summary_to_string(const transfer::TransferSummary& summary) {
    rapidjson::Document doc;
    summary_to_json(summary, doc);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace rccopy::report
