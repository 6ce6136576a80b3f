// ==============================================================================
// copier.cpp - File Copier
// ==============================================================================

#include "rccopy/copier.hpp"

#include "rccopy/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <memory>
#include <numeric>
#include <system_error>

namespace rccopy::io {

// ----------------------------------------------------------------------------
// ThroughputMeter
// ----------------------------------------------------------------------------

ThroughputMeter::ThroughputMeter(std::size_t window) : window_(window == 0 ? 1 : window) {}

double ThroughputMeter::add_sample(std::uint64_t bytes, std::chrono::duration<double> elapsed) {
    if (elapsed.count() <= 0.0) {
        return average();
    }
    samples_.push_back(static_cast<double>(bytes) / elapsed.count());
    while (samples_.size() > window_) {
        samples_.pop_front();
    }
    return average();
}

double ThroughputMeter::average() const {
    if (samples_.empty()) {
        return 0.0;
    }
    return std::accumulate(samples_.begin(), samples_.end(), 0.0) /
           static_cast<double>(samples_.size());
}

// ----------------------------------------------------------------------------
// copy_file
// ----------------------------------------------------------------------------

namespace {

TransferError copy_error(const std::string& message, const std::filesystem::path& path) {
    return TransferError{ErrorKind::Copy, message, platform::path_to_utf8(path)};
}

std::string errno_text() {
    return std::strerror(errno);
}

}  // namespace

CopyResult copy_file(const std::filesystem::path& source,
                     const std::filesystem::path& destination,
                     std::optional<hash::Algorithm> algorithm, const CopyOptions& opt) {
    CopyResult result;

    // Снимок метаданных до чтения: чтение может обновить atime источника
    auto source_stat = platform::stat_file(source);
    if (!source_stat) {
        result.error = copy_error(source_stat.error, source);
        return result;
    }

    // 1. Родительские директории
    std::error_code ec;
    const auto parent = destination.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            result.error = copy_error("failed to create directory - " + ec.message(), parent);
            return result;
        }
    }

    // 2. Открытие файлов
    platform::FilePtr in(platform::open_file(source, "rb"));
    if (!in) {
        result.error = copy_error("failed to open source file - " + errno_text(), source);
        return result;
    }
    platform::FilePtr out(platform::open_file(destination, "wb"));
    if (!out) {
        result.error =
            copy_error("failed to create destination file - " + errno_text(), destination);
        return result;
    }

    // 3. Перенос чанков
    try {
        std::unique_ptr<hash::Hasher> hasher;
        if (algorithm.has_value()) {
            hasher = hash::make_hasher(*algorithm);
        }

        std::vector<unsigned char> buffer(opt.chunk_size == 0 ? CHUNK_SIZE : opt.chunk_size);
        ThroughputMeter meter;
        SteadyClock now_fn = opt.clock;
        if (!now_fn) {
            now_fn = [] { return std::chrono::steady_clock::now(); };
        }
        auto last_sample = now_fn();
        std::uint64_t bytes_since_sample = 0;

        for (;;) {
            std::size_t n = std::fread(buffer.data(), 1, buffer.size(), in.get());
            if (n == 0) {
                if (std::ferror(in.get()) != 0) {
                    result.error = copy_error("failed to read source file - " + errno_text(), source);
                    return result;
                }
                break;
            }

            if (std::fwrite(buffer.data(), 1, n, out.get()) != n) {
                result.error =
                    copy_error("failed to write destination file - " + errno_text(), destination);
                return result;
            }
            if (hasher) {
                hasher->update(buffer.data(), n);
            }

            result.bytes_copied += n;
            bytes_since_sample += n;

            auto now = now_fn();
            auto elapsed = now - last_sample;
            if (elapsed >= THROUGHPUT_INTERVAL) {
                double speed = meter.add_sample(
                    bytes_since_sample, std::chrono::duration<double>(elapsed));
                if (opt.on_throughput) {
                    opt.on_throughput(speed);
                }
                last_sample = now;
                bytes_since_sample = 0;
            }
        }

        if (hasher) {
            result.checksum = hasher->finalize();
        }
    } catch (const std::exception& e) {
        result.error = copy_error(std::string("checksum computation failed - ") + e.what(), source);
        return result;
    }

    // Закрываем до переноса времён: запись буфера при fclose изменила бы mtime
    in.reset();
    std::FILE* raw_out = out.release();
    if (std::fclose(raw_out) != 0) {
        result.error =
            copy_error("failed to finish writing destination file - " + errno_text(), destination);
        return result;
    }

    // 4. Метаданные
    auto meta = preserve_metadata(source_stat.stat, source, destination, opt.metadata);
    result.warnings = std::move(meta.warnings);
    if (!meta) {
        result.error = meta.error;
        result.checksum.reset();
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace rccopy::io
