// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Платформенная специфика изолирована здесь:
// - Linux:   statx(STATX_BTIME) + utimensat
// - macOS:   stat(st_birthtimespec) + utimensat + setattrlist(ATTR_CMN_CRTIME)
// - Windows: GetFileAttributesExW + SetFileTime
//
// ==============================================================================

#include "rccopy/platform.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#ifdef __APPLE__
#include <sys/attr.h>
#endif
#endif

namespace rccopy::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

std::string generic_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    return path_to_utf8(std::filesystem::path(p.generic_wstring()));
#else
    return p.generic_string();
#endif
}

std::FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
    std::wstring wmode(mode, mode + std::char_traits<char>::length(mode));
    return _wfopen(path.c_str(), wmode.c_str());
#else
    return std::fopen(path.c_str(), mode);
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value != nullptr && value[0] != '\0') {
        return value;
    }
    return fallback;
}

}  // namespace

std::string user_name() {
#ifdef _WIN32
    return env_or("USERNAME", "unknown");
#else
    const passwd* pw = getpwuid(geteuid());
    if (pw != nullptr && pw->pw_name != nullptr && pw->pw_name[0] != '\0') {
        return pw->pw_name;
    }
    return env_or("USER", "unknown");
#endif
}

std::string host_name() {
#ifdef _WIN32
    return env_or("COMPUTERNAME", "localhost");
#else
    std::vector<char> buf(256, '\0');
    if (gethostname(buf.data(), buf.size() - 1) != 0 || buf[0] == '\0') {
        return "localhost";
    }
    return std::string(buf.data());
#endif
}

std::string device_name() {
#ifdef __linux__
    // systemd-hostnamed: PRETTY_HOSTNAME="Edit Bay 3"
    std::ifstream in("/etc/machine-info");
    std::string line;
    const std::string key = "PRETTY_HOSTNAME=";
    while (std::getline(in, line)) {
        if (line.compare(0, key.size(), key) != 0) {
            continue;
        }
        std::string value = line.substr(key.size());
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (!value.empty()) {
            return value;
        }
    }
#endif
    return host_name();
}

// ----------------------------------------------------------------------------
// Метаданные файлов
// ----------------------------------------------------------------------------

namespace {

#ifdef _WIN32

// FILETIME: интервалы по 100 нс от 1601-01-01
constexpr std::int64_t FILETIME_UNIX_EPOCH = 116444736000000000LL;

TimePoint from_filetime(const FILETIME& ft) {
    ULARGE_INTEGER v;
    v.LowPart = ft.dwLowDateTime;
    v.HighPart = ft.dwHighDateTime;
    auto ticks = static_cast<std::int64_t>(v.QuadPart) - FILETIME_UNIX_EPOCH;
    auto d = std::chrono::duration<std::int64_t, std::ratio<1, 10000000>>(ticks);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(d));
}

FILETIME to_filetime(TimePoint tp) {
    auto d = std::chrono::duration_cast<std::chrono::duration<std::int64_t, std::ratio<1, 10000000>>>(
        tp.time_since_epoch());
    ULARGE_INTEGER v;
    v.QuadPart = static_cast<ULONGLONG>(d.count() + FILETIME_UNIX_EPOCH);
    FILETIME ft;
    ft.dwLowDateTime = v.LowPart;
    ft.dwHighDateTime = v.HighPart;
    return ft;
}

#else

TimePoint from_timespec(std::int64_t sec, std::int64_t nsec) {
    auto d = std::chrono::seconds(sec) + std::chrono::nanoseconds(nsec);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(d));
}

timespec to_timespec(TimePoint tp) {
    constexpr std::int64_t NS_PER_SEC = 1000000000LL;
    std::int64_t ns =
        std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    std::int64_t sec = ns / NS_PER_SEC;
    std::int64_t rem = ns % NS_PER_SEC;
    if (rem < 0) {
        rem += NS_PER_SEC;
        --sec;
    }
    timespec ts{};
    ts.tv_sec = static_cast<time_t>(sec);
    ts.tv_nsec = static_cast<long>(rem);
    return ts;
}

std::string errno_message(const std::string& what, const std::filesystem::path& path) {
    return what + " '" + path_to_utf8(path) + "' - " + std::strerror(errno);
}

#endif

}  // namespace

StatResult stat_file(const std::filesystem::path& path) {
    StatResult result;

#ifdef _WIN32
    WIN32_FILE_ATTRIBUTE_DATA data;
    if (!GetFileAttributesExW(path.c_str(), GetFileExInfoStandard, &data)) {
        result.error = "failed to get metadata for '" + path_to_utf8(path) +
                       "' - error code " + std::to_string(GetLastError());
        return result;
    }
    ULARGE_INTEGER size;
    size.LowPart = data.nFileSizeLow;
    size.HighPart = data.nFileSizeHigh;
    result.stat.size = size.QuadPart;
    result.stat.accessed = from_filetime(data.ftLastAccessTime);
    result.stat.modified = from_filetime(data.ftLastWriteTime);
    result.stat.created = from_filetime(data.ftCreationTime);

    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec) {
        result.error = "failed to get permissions for '" + path_to_utf8(path) + "' - " +
                       ec.message();
        return result;
    }
    result.stat.permissions = status.permissions();
#elif defined(__APPLE__)
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        result.error = errno_message("failed to get metadata for", path);
        return result;
    }
    result.stat.size = static_cast<std::uint64_t>(st.st_size);
    result.stat.permissions = static_cast<std::filesystem::perms>(st.st_mode & 07777);
    result.stat.accessed = from_timespec(st.st_atimespec.tv_sec, st.st_atimespec.tv_nsec);
    result.stat.modified = from_timespec(st.st_mtimespec.tv_sec, st.st_mtimespec.tv_nsec);
    result.stat.created = from_timespec(st.st_birthtimespec.tv_sec, st.st_birthtimespec.tv_nsec);
#else
    struct statx stx;
    if (::statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT, STATX_BASIC_STATS | STATX_BTIME,
                &stx) != 0) {
        result.error = errno_message("failed to get metadata for", path);
        return result;
    }
    result.stat.size = static_cast<std::uint64_t>(stx.stx_size);
    result.stat.permissions = static_cast<std::filesystem::perms>(stx.stx_mode & 07777);
    result.stat.accessed = from_timespec(stx.stx_atime.tv_sec, stx.stx_atime.tv_nsec);
    result.stat.modified = from_timespec(stx.stx_mtime.tv_sec, stx.stx_mtime.tv_nsec);
    // Не все ФС хранят birth time (например, старые ext3, NFS)
    if ((stx.stx_mask & STATX_BTIME) != 0) {
        result.stat.created = from_timespec(stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec);
    }
#endif

    result.ok = true;
    return result;
}

bool set_file_times(const std::filesystem::path& path, const FileStat& times, std::string& error) {
#ifdef _WIN32
    HANDLE h = CreateFileW(path.c_str(), FILE_WRITE_ATTRIBUTES,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        error = "failed to open '" + path_to_utf8(path) + "' for setting times - error code " +
                std::to_string(GetLastError());
        return false;
    }
    FILETIME accessed = to_filetime(times.accessed);
    FILETIME modified = to_filetime(times.modified);
    FILETIME created;
    const FILETIME* created_ptr = nullptr;
    if (times.created.has_value()) {
        created = to_filetime(*times.created);
        created_ptr = &created;
    }
    BOOL ok = SetFileTime(h, created_ptr, &accessed, &modified);
    DWORD last_error = GetLastError();
    CloseHandle(h);
    if (!ok) {
        error = "failed to set file times for '" + path_to_utf8(path) + "' - error code " +
                std::to_string(last_error);
        return false;
    }
    return true;
#else
    timespec ts[2];
    ts[0] = to_timespec(times.accessed);
    ts[1] = to_timespec(times.modified);
    if (::utimensat(AT_FDCWD, path.c_str(), ts, 0) != 0) {
        error = errno_message("failed to set file times for", path);
        return false;
    }
#ifdef __APPLE__
    if (times.created.has_value()) {
        struct attrlist attrs {};
        attrs.bitmapcount = ATTR_BIT_MAP_COUNT;
        attrs.commonattr = ATTR_CMN_CRTIME;
        timespec crtime = to_timespec(*times.created);
        if (::setattrlist(path.c_str(), &attrs, &crtime, sizeof(crtime), 0) != 0) {
            error = errno_message("failed to set creation time for", path);
            return false;
        }
    }
#endif
    return true;
#endif
}

}  // namespace rccopy::platform
