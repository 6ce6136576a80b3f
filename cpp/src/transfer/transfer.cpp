// ==============================================================================
// transfer.cpp - Transfer Orchestrator
// ==============================================================================

#include "rccopy/transfer.hpp"

#include "rccopy/verify.hpp"

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace rccopy::transfer {

namespace fs = std::filesystem;

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* SEPARATOR = "-------------------------";

std::string u8(const fs::path& p) {
    return platform::path_to_utf8(p);
}

void report_verification_failure(output::Writer& writer, const io::VerifyResult& verify) {
    if (!verify.source_checksum.empty() && !verify.destination_checksum.empty()) {
        writer.red_line("Error: Checksums do not match. File was not copied successfully.");
    } else {
        writer.red_line("Error: Could not verify checksum.");
    }
    writer.error(verify.error.format());
}

}  // namespace

const char* file_state_to_string(FileState state) {
    switch (state) {
    case FileState::SkippedVerified:
        return "skipped_verified";
    case FileState::SkippedFailed:
        return "skipped_failed";
    case FileState::SkippedUnverified:
        return "skipped_unverified";
    case FileState::CopiedVerified:
        return "copied_verified";
    case FileState::CopiedFailed:
        return "copied_failed";
    case FileState::CopiedNoChecksum:
        return "copied_no_checksum";
    case FileState::PlannedSkip:
        return "planned_skip";
    case FileState::PlannedCopy:
        return "planned_copy";
    }
    return "unknown";
}

bool is_failure(FileState state) {
    return state == FileState::SkippedFailed || state == FileState::CopiedFailed;
}

const char* run_status_to_string(RunStatus status) {
    switch (status) {
    case RunStatus::Success:
        return "success";
    case RunStatus::Errors:
        return "errors";
    case RunStatus::Nothing:
        return "nothing";
    case RunStatus::DryRun:
        return "dry_run";
    }
    return "unknown";
}

std::size_t TransferSummary::count(FileState state) const {
    std::size_t n = 0;
    for (const auto& f : files) {
        if (f.state == state) {
            ++n;
        }
    }
    return n;
}

// ----------------------------------------------------------------------------
// validate_paths
// ----------------------------------------------------------------------------

PathCheck validate_paths(const fs::path& source, const fs::path& destination) {
    PathCheck result;
    auto fail = [&result](const std::string& message, const fs::path& p) {
        result.ok = false;
        result.error = TransferError{ErrorKind::Path, message, u8(p)};
        return result;
    };

    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return fail("input directory does not exist", source);
    }
    if (!fs::exists(destination, ec)) {
        return fail("destination directory does not exist", destination);
    }
    if (!fs::is_directory(source, ec)) {
        return fail("input is not a directory", source);
    }
    if (!fs::is_directory(destination, ec)) {
        return fail("destination is not a directory", destination);
    }

    const auto canonical_source = fs::weakly_canonical(source, ec);
    if (ec) {
        return fail("cannot resolve path - " + ec.message(), source);
    }
    const auto canonical_destination = fs::weakly_canonical(destination, ec);
    if (ec) {
        return fail("cannot resolve path - " + ec.message(), destination);
    }

    if (canonical_source == canonical_destination) {
        return fail("input and destination directories are the same", destination);
    }

    // destination внутри source: копия попала бы в собственный обход
    const auto rel = canonical_destination.lexically_relative(canonical_source);
    if (!rel.empty() && *rel.begin() != ".." && rel != ".") {
        return fail("destination directory is inside the input directory", destination);
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Transfer
// ----------------------------------------------------------------------------

Transfer::Transfer(TransferOptions options, output::Writer& writer)
    : options_(std::move(options)),
      writer_(writer),
      clock_([] { return std::chrono::system_clock::now(); }),
      creator_([](const std::string& tool, TimePoint start) {
          return mhl::collect_creator_info(tool, start);
      }) {}

Transfer& Transfer::clock(Clock clock) {
    clock_ = std::move(clock);
    return *this;
}

Transfer& Transfer::creator(CreatorProvider provider) {
    creator_ = std::move(provider);
    return *this;
}

TransferSummary Transfer::run() {
    TransferSummary summary;
    summary.start = clock_();
    writer_.line("Start date: " + mhl::format_rfc3339(summary.start));

    auto check = validate_paths(options_.source_root, options_.destination_root);
    if (!check) {
        throw std::runtime_error(check.error.format());
    }

    if (options_.write_mhl && !options_.algorithm.has_value()) {
        writer_.warn("No checksum method selected, the mhl file will not be written");
    }
    if (options_.preview) {
        writer_.info("Dry run: nothing will be written to the destination");
    }

    const auto files = io::list_files(options_.source_root, options_.discovery);
    writer_.debug("Found " + std::to_string(files.size()) + " files in " +
                  u8(options_.source_root));

    for (std::size_t i = 0; i < files.size(); ++i) {
        auto outcome = process_file(files[i], i + 1, files.size(), summary);
        if (is_failure(outcome.state)) {
            summary.failed.push_back(outcome.source);
        }
        summary.bytes_copied += outcome.bytes_copied;
        summary.files.push_back(std::move(outcome));
    }

    if (!options_.preview) {
        recreate_empty_dirs(summary);
    }

    if (options_.write_mhl && !options_.preview && !summary.manifest.records.empty()) {
        write_manifest(summary);
    }

    const std::size_t processed = summary.count(FileState::CopiedVerified) +
                                  summary.count(FileState::CopiedNoChecksum) +
                                  summary.count(FileState::SkippedVerified) +
                                  summary.created_dirs.size();
    if (options_.preview) {
        summary.status = RunStatus::DryRun;
    } else if (summary.has_failures()) {
        summary.status = RunStatus::Errors;
    } else if (processed > 0) {
        summary.status = RunStatus::Success;
    } else {
        summary.status = RunStatus::Nothing;
    }

    writer_.debug("Copied " + output::format_size(summary.bytes_copied));
    print_summary(summary, writer_);
    return summary;
}

FileOutcome Transfer::process_file(const fs::path& source, std::size_t index, std::size_t total,
                                   TransferSummary& summary) {
    FileOutcome outcome;
    outcome.source = source;
    outcome.destination = options_.destination_root / source.lexically_relative(options_.source_root);

    writer_.line(SEPARATOR);
    const std::string progress = std::to_string(index) + " / " + std::to_string(total) + ": ";

    auto source_stat = platform::stat_file(source);
    if (!source_stat) {
        outcome.error = TransferError{ErrorKind::Copy, source_stat.error, u8(source)};
        writer_.line(progress + u8(source) + " --> " + u8(outcome.destination));
        if (options_.preview) {
            outcome.state = FileState::PlannedCopy;
            writer_.warn(outcome.error->format());
        } else {
            outcome.state = FileState::CopiedFailed;
            writer_.error(outcome.error->format());
        }
        return outcome;
    }

    // Пропуск только по совпадению размера; содержимое сверяется отдельно
    std::error_code ec;
    bool same_size = false;
    if (fs::is_regular_file(outcome.destination, ec)) {
        const auto size = fs::file_size(outcome.destination, ec);
        same_size = !ec && size == source_stat.stat.size;
    }

    if (same_size) {
        writer_.line(progress + "File " + u8(outcome.destination) +
                     " already exists and has identical file size. Skipping...");
        if (options_.preview) {
            outcome.state = FileState::PlannedSkip;
            return outcome;
        }
        return verify_existing(std::move(outcome), source_stat.stat, summary);
    }

    writer_.line(progress + u8(source) + " --> " + u8(outcome.destination));
    if (options_.preview) {
        outcome.state = FileState::PlannedCopy;
        return outcome;
    }
    return copy_new(std::move(outcome), source_stat.stat, summary);
}

FileOutcome Transfer::verify_existing(FileOutcome outcome, const platform::FileStat& source_stat,
                                      TransferSummary& summary) {
    if (!options_.algorithm.has_value()) {
        outcome.state = FileState::SkippedUnverified;
        writer_.debug("No checksum method selected, size match is not verified");
        return outcome;
    }

    const auto algorithm = *options_.algorithm;
    writer_.line("Verifying checksum... (" + hash::to_string(algorithm) + ")");

    auto verify = io::verify_pair(outcome.source, outcome.destination, algorithm);
    if (!verify.source_checksum.empty()) {
        outcome.checksum = verify.source_checksum;
    }
    if (!verify) {
        outcome.state = FileState::SkippedFailed;
        outcome.error = verify.error;
        report_verification_failure(writer_, verify);
        return outcome;
    }

    writer_.green_line("Checksums match: " + verify.source_checksum);
    outcome.state = FileState::SkippedVerified;
    add_record(summary, outcome, source_stat);
    return outcome;
}

FileOutcome Transfer::copy_new(FileOutcome outcome, const platform::FileStat& source_stat,
                               TransferSummary& summary) {
    io::CopyOptions copy_opt;
    copy_opt.chunk_size = options_.chunk_size;
    copy_opt.metadata.allow_missing_creation_time = options_.allow_missing_creation_time;
    copy_opt.on_throughput = [this](double bytes_per_second) {
        writer_.transfer_speed(bytes_per_second);
    };

    auto copied = io::copy_file(outcome.source, outcome.destination, options_.algorithm, copy_opt);
    writer_.clear_transfer_line();
    outcome.bytes_copied = copied.bytes_copied;

    for (const auto& warning : copied.warnings) {
        writer_.warn(warning);
    }

    if (!copied) {
        outcome.state = FileState::CopiedFailed;
        outcome.error = copied.error;
        writer_.red_line("Error: Could not copy file.");
        writer_.error(copied.error.format());
        return outcome;
    }

    if (!options_.algorithm.has_value() || !copied.checksum.has_value()) {
        outcome.state = FileState::CopiedNoChecksum;
        return outcome;
    }

    const auto algorithm = *options_.algorithm;
    outcome.checksum = *copied.checksum;
    writer_.line("Verifying checksum... (" + hash::to_string(algorithm) + ")");

    auto verify = io::verify_against(*copied.checksum, outcome.destination, algorithm);
    if (!verify) {
        outcome.state = FileState::CopiedFailed;
        outcome.error = verify.error;
        report_verification_failure(writer_, verify);
        return outcome;
    }

    writer_.green_line("Checksums match: " + *copied.checksum);
    outcome.state = FileState::CopiedVerified;
    add_record(summary, outcome, source_stat);
    return outcome;
}

void Transfer::add_record(TransferSummary& summary, const FileOutcome& outcome,
                          const platform::FileStat& source_stat) {
    mhl::FileRecord record;
    record.relative_path =
        platform::generic_utf8(outcome.source.lexically_relative(options_.source_root));
    if (!mhl::is_valid_utf8(record.relative_path)) {
        writer_.warn("File name of " + u8(outcome.source) +
                     " is not valid UTF-8, not recorded in the mhl file");
        return;
    }
    record.size_bytes = source_stat.size;
    record.modified_at = source_stat.modified;
    record.checksum = outcome.checksum.value_or("");
    record.algorithm = *options_.algorithm;
    record.hashed_at = clock_();
    summary.manifest.records.push_back(std::move(record));
}

void Transfer::recreate_empty_dirs(TransferSummary& summary) {
    const auto dirs = io::list_empty_dirs(options_.source_root, options_.discovery);
    for (const auto& dir : dirs) {
        const auto target = options_.destination_root / dir.lexically_relative(options_.source_root);

        std::error_code ec;
        const bool created = fs::create_directories(target, ec);
        if (ec) {
            TransferError error{ErrorKind::Copy, "failed to create directory - " + ec.message(),
                                u8(target)};
            writer_.error(error.format());
            summary.failed.push_back(dir);
            continue;
        }
        if (created) {
            writer_.debug("Created empty directory " + u8(target));
            summary.created_dirs.push_back(target);
        }
    }
}

void Transfer::write_manifest(TransferSummary& summary) {
    writer_.line(SEPARATOR);
    writer_.line("Writing mhl file...");

    summary.manifest.creator = creator_(options_.tool, summary.start);
    summary.manifest.creator.start = summary.start;
    summary.manifest.creator.finish = clock_();

    const auto path =
        options_.destination_root / platform::path_from_utf8(
                                        mhl::file_name(options_.source_root, summary.start));
    auto written = mhl::write_mhl(path, summary.manifest);
    if (!written) {
        summary.manifest_error = written.error;
        writer_.red_line("Error: Could not write mhl file.");
        writer_.error(written.error.format());
        return;
    }

    summary.mhl_path = path;
    writer_.info("Wrote " + u8(path));
}

// ----------------------------------------------------------------------------
// print_summary
// ----------------------------------------------------------------------------

void print_summary(const TransferSummary& summary, output::Writer& writer) {
    writer.line(SEPARATOR);
    switch (summary.status) {
    case RunStatus::DryRun:
        writer.line("Finished dry run.");
        break;
    case RunStatus::Errors:
        writer.red_line("Finished with errors.");
        if (!summary.failed.empty()) {
            writer.red_line("Failed files:");
            for (const auto& path : summary.failed) {
                writer.red_line(u8(path));
            }
        }
        break;
    case RunStatus::Success:
        writer.green_line("Finished successfully.");
        break;
    case RunStatus::Nothing:
        writer.line("Nothing to copy.");
        break;
    }
}

}  // namespace rccopy::transfer
