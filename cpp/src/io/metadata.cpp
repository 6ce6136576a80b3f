// ==============================================================================
// metadata.cpp - Metadata Preserver
// ==============================================================================

#include "rccopy/metadata.hpp"

#include <system_error>

namespace rccopy::io {

MetadataResult preserve_metadata(const platform::FileStat& source_stat,
                                 const std::filesystem::path& source,
                                 const std::filesystem::path& destination,
                                 const MetadataOptions& opt) {
    MetadataResult result;
    const std::string dst_str = platform::path_to_utf8(destination);

    if (!source_stat.created.has_value()) {
        if (!opt.allow_missing_creation_time) {
            result.error = {ErrorKind::Copy,
                            "creation time is not available for source file '" +
                                platform::path_to_utf8(source) + "'",
                            dst_str};
            return result;
        }
        result.warnings.push_back("creation time is not available for '" +
                                  platform::path_to_utf8(source) + "', not preserved");
    }

    std::error_code ec;
    std::filesystem::permissions(destination, source_stat.permissions,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        result.error = {ErrorKind::Copy, "failed to set permissions - " + ec.message(), dst_str};
        return result;
    }

    std::string error;
    if (!platform::set_file_times(destination, source_stat, error)) {
        result.error = {ErrorKind::Copy, error, dst_str};
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace rccopy::io
