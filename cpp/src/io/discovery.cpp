// ==============================================================================
// discovery.cpp - Directory Walker
// ==============================================================================

#include "rccopy/discovery.hpp"

#include "rccopy/platform.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace rccopy::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

enum class Collect { Files, EmptyDirs };

std::filesystem::file_status entry_status(const std::filesystem::path& path) {
    std::error_code ec;
    // symlink_status: ссылки не разыменовываются
    auto status = std::filesystem::symlink_status(path, ec);
    if (ec) {
        throw std::runtime_error("failed to get metadata for '" + platform::path_to_utf8(path) +
                                 "' - " + ec.message());
    }
    return status;
}

/// Рекурсивный обход, depth-first
void collect_recursive(const std::filesystem::path& dir, const DiscoveryOptions& opt,
                       Collect what, std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw std::runtime_error("failed to read directory '" + platform::path_to_utf8(dir) +
                                 "' - " + ec.message());
    }

    bool has_entries = false;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        has_entries = true;
        const std::filesystem::path entry_path = it->path();
        if (is_excluded_name(platform::path_to_utf8(entry_path.filename()), opt)) {
            continue;
        }

        auto status = entry_status(entry_path);
        if (std::filesystem::is_directory(status)) {
            collect_recursive(entry_path, opt, what, result);
        } else if (what == Collect::Files && std::filesystem::is_regular_file(status)) {
            result.push_back(entry_path);
        }
        // Symlinks, сокеты, FIFO и т.п. игнорируются
    }
    if (ec) {
        throw std::runtime_error("failed to enter directory '" + platform::path_to_utf8(dir) +
                                 "' - " + ec.message());
    }

    if (what == Collect::EmptyDirs && !has_entries) {
        result.push_back(dir);
    }
}

std::vector<std::filesystem::path> collect(const std::filesystem::path& root,
                                           const DiscoveryOptions& opt, Collect what) {
    auto status = entry_status(root);
    if (!std::filesystem::is_directory(status)) {
        throw std::runtime_error("not a directory - " + platform::path_to_utf8(root));
    }

    std::vector<std::filesystem::path> result;
    collect_recursive(root, opt, what, result);

    // Сам root не считается "пустой директорией для воссоздания"
    if (what == Collect::EmptyDirs) {
        result.erase(std::remove(result.begin(), result.end(), root), result.end());
    }

    // Порядок directory_iterator зависит от ФС, сортируем для детерминизма
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Исключения
// ----------------------------------------------------------------------------

const std::vector<std::string>& default_exclusions() {
    static const std::vector<std::string> names = {
        ".DS_Store",       ".Spotlight-V100",         ".Trashes", ".fseventsd",
        ".TemporaryItems", ".DocumentRevisions-V100", "Thumbs.db", "desktop.ini",
    };
    return names;
}

bool is_excluded_name(std::string_view name, const DiscoveryOptions& opt) {
    if (name.compare(0, 2, APPLE_DOUBLE_PREFIX) == 0) {
        return true;
    }
    const auto& defaults = default_exclusions();
    if (std::find(defaults.begin(), defaults.end(), name) != defaults.end()) {
        return true;
    }
    return opt.extra_exclusions.count(std::string(name)) > 0;
}

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const DiscoveryOptions& opt) {
    return collect(root, opt, Collect::Files);
}

std::vector<std::filesystem::path> list_empty_dirs(const std::filesystem::path& root,
                                                   const DiscoveryOptions& opt) {
    return collect(root, opt, Collect::EmptyDirs);
}

}  // namespace rccopy::io
