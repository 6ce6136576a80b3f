// ==============================================================================
// mhl.cpp - MediaHashList (MHL) манифест
// ==============================================================================
//
// pugixml: построение DOM и сохранение с отступом в два пробела.
// Экранирование спецсимволов в путях (&, <, >) выполняет pugixml.
//
// ==============================================================================

#include "rccopy/mhl.hpp"

#include <cstdio>
#include <ctime>
#include <pugixml.hpp>
#include <sstream>
#include <stdexcept>

namespace rccopy::mhl {

namespace {

// Дни от 1970-01-01 для даты proleptic Gregorian (обратное к gmtime)
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::string child_text(const pugi::xml_node& parent, const char* name) {
    return parent.child(name).text().as_string();
}

void append_text(pugi::xml_node& parent, const char* name, const std::string& value) {
    parent.append_child(name).text().set(value.c_str());
}

}  // namespace

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

std::string format_rfc3339(TimePoint tp) {
    auto time = std::chrono::system_clock::to_time_t(
        std::chrono::floor<std::chrono::seconds>(tp));
    std::tm tm_result{};
#ifdef _WIN32
    gmtime_s(&tm_result, &time);
#else
    gmtime_r(&time, &tm_result);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_result);
    return buf;
}

std::optional<TimePoint> parse_rfc3339(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS = 19 символов
    if (text.size() < 20) {
        return std::nullopt;
    }
    const std::string head(text.substr(0, 19));
    int year = 0;
    unsigned month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = 0;
    if (std::sscanf(head.c_str(), "%4d-%2u-%2u%c%2u:%2u:%2u", &year, &month, &day, &sep, &hour,
                    &minute, &second) != 7) {
        return std::nullopt;
    }
    if ((sep != 'T' && sep != 't' && sep != ' ') || month < 1 || month > 12 || day < 1 ||
        day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    if (text[pos] == '.') {
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            ++pos;
        }
    }
    if (pos >= text.size()) {
        return std::nullopt;
    }

    std::int64_t offset = 0;
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        if (pos + 1 != text.size()) {
            return std::nullopt;
        }
    } else if (zone == '+' || zone == '-') {
        const std::string tz(text.substr(pos + 1));
        unsigned oh = 0, om = 0;
        if (tz.size() != 5 || std::sscanf(tz.c_str(), "%2u:%2u", &oh, &om) != 2 || oh > 23 ||
            om > 59) {
            return std::nullopt;
        }
        offset = static_cast<std::int64_t>(oh) * 3600 + static_cast<std::int64_t>(om) * 60;
        if (zone == '-') {
            offset = -offset;
        }
    } else {
        return std::nullopt;
    }

    const std::int64_t secs = days_from_civil(year, month, day) * 86400 +
                              static_cast<std::int64_t>(hour) * 3600 + minute * 60LL + second -
                              offset;
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(secs)));
}

// ----------------------------------------------------------------------------
// Имя файла и сведения о создателе
// ----------------------------------------------------------------------------

std::string file_name(const std::filesystem::path& source_root, TimePoint start) {
    // "dir/" -> filename() пуст, берём последний непустой компонент
    auto normal = source_root.lexically_normal();
    std::string base = platform::path_to_utf8(normal.filename());
    if (base.empty()) {
        base = platform::path_to_utf8(normal.parent_path().filename());
    }
    if (base.empty() || base == "." || base == "..") {
        base = "root";
    }

    // 2024-01-02T03:04:05Z -> 2024-01-02_030405
    std::string stamp;
    for (char c : format_rfc3339(start)) {
        if (c == ':' || c == 'Z') {
            continue;
        }
        stamp += (c == 'T') ? '_' : c;
    }
    return base + "_" + stamp + MHL_EXTENSION;
}

CreatorInfo collect_creator_info(std::string tool, TimePoint start) {
    CreatorInfo info;
    info.name = platform::device_name();
    info.username = platform::user_name();
    info.hostname = platform::host_name();
    info.tool = std::move(tool);
    info.start = start;
    info.finish = start;
    return info;
}

// ----------------------------------------------------------------------------
// Сериализация
// ----------------------------------------------------------------------------

bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        static constexpr std::uint32_t MIN_BY_LEN[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < MIN_BY_LEN[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

namespace {

void build_document(pugi::xml_document& doc, const RunManifest& manifest) {
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("hashlist");
    root.append_attribute("version") = MHL_VERSION;

    const auto& creator = manifest.creator;
    auto info = root.append_child("creatorinfo");
    append_text(info, "name", creator.name);
    append_text(info, "username", creator.username);
    append_text(info, "hostname", creator.hostname);
    append_text(info, "tool", creator.tool);
    append_text(info, "startdate", format_rfc3339(creator.start));
    append_text(info, "finishdate", format_rfc3339(creator.finish));

    for (const auto& record : manifest.records) {
        auto entry = root.append_child("hash");
        append_text(entry, "file", record.relative_path);
        append_text(entry, "size", std::to_string(record.size_bytes));
        append_text(entry, "lastmodificationdate", format_rfc3339(record.modified_at));
        // Имя элемента = алгоритм: схема самоописывающая для каждой записи
        append_text(entry, hash::info(record.algorithm).mhl_tag, record.checksum);
        append_text(entry, "hashdate", format_rfc3339(record.hashed_at));
    }
}

}  // namespace

std::string to_xml(const RunManifest& manifest) {
    pugi::xml_document doc;
    build_document(doc, manifest);

    std::ostringstream os;
    doc.save(os, "  ", pugi::format_default, pugi::encoding_utf8);
    return os.str();
}

WriteResult write_mhl(const std::filesystem::path& path, const RunManifest& manifest) {
    WriteResult result;

    for (const auto& record : manifest.records) {
        if (!is_valid_utf8(record.relative_path)) {
            result.error = {ErrorKind::ManifestWrite,
                            "file path in record is not valid UTF-8",
                            platform::path_to_utf8(path)};
            return result;
        }
    }

    pugi::xml_document doc;
    build_document(doc, manifest);

    if (!doc.save_file(path.c_str(), "  ", pugi::format_default, pugi::encoding_utf8)) {
        result.error = {ErrorKind::ManifestWrite, "could not write mhl file",
                        platform::path_to_utf8(path)};
        return result;
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Разбор
// ----------------------------------------------------------------------------

namespace {

ReadResult parse_document(const pugi::xml_document& doc) {
    ReadResult result;

    auto root = doc.child("hashlist");
    if (!root) {
        result.error = "missing <hashlist> root element";
        return result;
    }

    auto info = root.child("creatorinfo");
    if (info) {
        auto& creator = result.manifest.creator;
        creator.name = child_text(info, "name");
        creator.username = child_text(info, "username");
        creator.hostname = child_text(info, "hostname");
        creator.tool = child_text(info, "tool");
        if (auto t = parse_rfc3339(child_text(info, "startdate"))) {
            creator.start = *t;
        }
        if (auto t = parse_rfc3339(child_text(info, "finishdate"))) {
            creator.finish = *t;
        }
    }

    for (auto entry : root.children("hash")) {
        FileRecord record;
        record.relative_path = child_text(entry, "file");
        if (record.relative_path.empty()) {
            result.error = "<hash> entry without <file>";
            return result;
        }

        const std::string size_text = child_text(entry, "size");
        try {
            std::size_t consumed = 0;
            record.size_bytes = std::stoull(size_text, &consumed);
            if (consumed != size_text.size()) {
                throw std::invalid_argument(size_text);
            }
        } catch (const std::exception&) {
            result.error = "invalid <size> for '" + record.relative_path + "': " + size_text;
            return result;
        }

        bool has_checksum = false;
        for (auto child : entry.children()) {
            if (child.type() != pugi::node_element) {
                continue;
            }
            auto algorithm = hash::algorithm_from_mhl_tag(child.name());
            // Старые манифесты писали xxHash64 под тегом "xxhash64"
            if (!algorithm && std::string_view(child.name()) == "xxhash64") {
                algorithm = hash::Algorithm::Xxh64;
            }
            if (algorithm) {
                record.algorithm = *algorithm;
                record.checksum = child.text().as_string();
                has_checksum = true;
                break;
            }
        }
        if (!has_checksum) {
            result.error = "<hash> entry without checksum for '" + record.relative_path + "'";
            return result;
        }

        if (auto t = parse_rfc3339(child_text(entry, "lastmodificationdate"))) {
            record.modified_at = *t;
        }
        if (auto t = parse_rfc3339(child_text(entry, "hashdate"))) {
            record.hashed_at = *t;
        }
        result.manifest.records.push_back(std::move(record));
    }

    result.ok = true;
    return result;
}

}  // namespace

ReadResult parse_mhl(std::string_view xml) {
    pugi::xml_document doc;
    auto parsed = doc.load_buffer(xml.data(), xml.size());
    if (!parsed) {
        ReadResult result;
        result.error = std::string("failed to parse mhl - ") + parsed.description();
        return result;
    }
    return parse_document(doc);
}

ReadResult read_mhl(const std::filesystem::path& path) {
    pugi::xml_document doc;
    auto parsed = doc.load_file(path.c_str());
    if (!parsed) {
        ReadResult result;
        result.error = "failed to read mhl '" + platform::path_to_utf8(path) + "' - " +
                       parsed.description();
        return result;
    }
    return parse_document(doc);
}

}  // namespace rccopy::mhl
