// ==============================================================================
// verify.cpp - Verifier
// ==============================================================================

#include "rccopy/verify.hpp"

#include "rccopy/copier.hpp"
#include "rccopy/platform.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <memory>
#include <vector>

namespace rccopy::io {

namespace {

TransferError verification_error(const std::string& message, const std::filesystem::path& path) {
    return TransferError{ErrorKind::Verification, message, platform::path_to_utf8(path)};
}

}  // namespace

ChecksumResult checksum_file(const std::filesystem::path& path, hash::Algorithm algorithm,
                             std::size_t chunk_size) {
    ChecksumResult result;

    platform::FilePtr in(platform::open_file(path, "rb"));
    if (!in) {
        result.error = verification_error(
            std::string("failed to open file for checksum - ") + std::strerror(errno), path);
        return result;
    }

    try {
        auto hasher = hash::make_hasher(algorithm);
        std::vector<unsigned char> buffer(chunk_size == 0 ? CHUNK_SIZE : chunk_size);
        for (;;) {
            std::size_t n = std::fread(buffer.data(), 1, buffer.size(), in.get());
            if (n == 0) {
                if (std::ferror(in.get()) != 0) {
                    result.error = verification_error(
                        std::string("failed to read file for checksum - ") + std::strerror(errno),
                        path);
                    return result;
                }
                break;
            }
            hasher->update(buffer.data(), n);
        }
        result.checksum = hasher->finalize();
    } catch (const std::exception& e) {
        result.error =
            verification_error(std::string("checksum computation failed - ") + e.what(), path);
        return result;
    }

    result.ok = true;
    return result;
}

bool checksums_equal(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        auto ca = static_cast<unsigned char>(a[i]);
        auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) {
            return false;
        }
    }
    return true;
}

VerifyResult verify_against(const std::string& source_checksum,
                            const std::filesystem::path& destination, hash::Algorithm algorithm) {
    VerifyResult result;
    result.source_checksum = source_checksum;

    auto dst = checksum_file(destination, algorithm);
    if (!dst) {
        result.error = dst.error;
        return result;
    }
    result.destination_checksum = dst.checksum;

    if (!checksums_equal(source_checksum, dst.checksum)) {
        result.error = verification_error("checksums do not match (" + source_checksum +
                                              " != " + dst.checksum + ")",
                                          destination);
        return result;
    }

    result.ok = true;
    return result;
}

VerifyResult verify_pair(const std::filesystem::path& source,
                         const std::filesystem::path& destination, hash::Algorithm algorithm) {
    auto src = checksum_file(source, algorithm);
    if (!src) {
        VerifyResult result;
        result.error = src.error;
        return result;
    }
    return verify_against(src.checksum, destination, algorithm);
}

}  // namespace rccopy::io
