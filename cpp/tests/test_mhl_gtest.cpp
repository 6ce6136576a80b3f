// ==============================================================================
// test_mhl_gtest.cpp - Тесты MHL манифеста (GoogleTest)
// ==============================================================================
//
// Тесты: TST-MHL-001..TST-MHL-014
//
// ==============================================================================

#include "rccopy/mhl.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace rccopy::mhl::test {

namespace {

// 2024-01-02T03:04:05Z
constexpr std::int64_t START_UNIX = 1704164645;

TimePoint at(std::int64_t unix_seconds) {
    return TimePoint(
        std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(unix_seconds)));
}

RunManifest sample_manifest() {
    RunManifest manifest;
    manifest.creator.name = "Studio Mac";
    manifest.creator.username = "dit";
    manifest.creator.hostname = "studio.local";
    manifest.creator.tool = "rccopy ver. 0.1.0";
    manifest.creator.start = at(START_UNIX);
    manifest.creator.finish = at(START_UNIX + 55);

    FileRecord a;
    a.relative_path = "a.txt";
    a.size_bytes = 16;
    a.modified_at = at(START_UNIX - 3600);
    a.checksum = "0123456789abcdef";
    a.algorithm = hash::Algorithm::Xxh64;
    a.hashed_at = at(START_UNIX + 10);

    FileRecord b;
    b.relative_path = "sub/b.bin";
    b.size_bytes = 0;
    b.modified_at = at(START_UNIX - 7200);
    b.checksum = "ef46db3751d8e999";
    b.algorithm = hash::Algorithm::Xxh64;
    b.hashed_at = at(START_UNIX + 20);

    manifest.records = {a, b};
    return manifest;
}

}  // namespace

class MhlTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("rccopy_mhl_") + test_info->test_case_name() + "_" +
                                  test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }
};

// ==============================================================================
// Время
// ==============================================================================

TEST(MhlTimeTest, TST_MHL_001_FormatRfc3339_UtcSeconds) {
    EXPECT_EQ(format_rfc3339(at(START_UNIX)), "2024-01-02T03:04:05Z");
    EXPECT_EQ(format_rfc3339(at(0)), "1970-01-01T00:00:00Z");

    // Доли секунды отбрасываются
    auto tp = at(START_UNIX) + std::chrono::milliseconds(999);
    EXPECT_EQ(format_rfc3339(tp), "2024-01-02T03:04:05Z");
}

TEST(MhlTimeTest, TST_MHL_002_ParseRfc3339_Variants) {
    auto z = parse_rfc3339("2024-01-02T03:04:05Z");
    ASSERT_TRUE(z.has_value());
    EXPECT_EQ(*z, at(START_UNIX));

    auto offset = parse_rfc3339("2024-01-02T04:04:05+01:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*offset, at(START_UNIX));

    auto fraction = parse_rfc3339("2024-01-02T03:04:05.250Z");
    ASSERT_TRUE(fraction.has_value());
    EXPECT_EQ(*fraction, at(START_UNIX));
}

TEST(MhlTimeTest, TST_MHL_003_ParseRfc3339_Invalid) {
    EXPECT_FALSE(parse_rfc3339("").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-01-02").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-13-02T03:04:05Z").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-01-02T03:04:05").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-01-02T03:04:05Zjunk").has_value());
}

// ==============================================================================
// Имя файла
// ==============================================================================

TEST(MhlNameTest, TST_MHL_004_FileName_FromSourceBasenameAndStart) {
    EXPECT_EQ(file_name("/media/card/footage", at(START_UNIX)), "footage_2024-01-02_030405.mhl");
    EXPECT_EQ(file_name("/media/card/footage/", at(START_UNIX)), "footage_2024-01-02_030405.mhl");
}

// ==============================================================================
// Сериализация
// ==============================================================================

TEST(MhlXmlTest, TST_MHL_005_ToXml_Structure) {
    const auto xml = to_xml(sample_manifest());

    EXPECT_NE(xml.find("<?xml version=\"1.0\" encoding=\"UTF-8\"?>"), std::string::npos);
    EXPECT_NE(xml.find("<hashlist version=\"1.1\">"), std::string::npos);
    EXPECT_NE(xml.find("\n  <creatorinfo>"), std::string::npos);
    EXPECT_NE(xml.find("<tool>rccopy ver. 0.1.0</tool>"), std::string::npos);
    EXPECT_NE(xml.find("<startdate>2024-01-02T03:04:05Z</startdate>"), std::string::npos);
    EXPECT_NE(xml.find("<finishdate>2024-01-02T03:05:00Z</finishdate>"), std::string::npos);
    EXPECT_NE(xml.find("<file>sub/b.bin</file>"), std::string::npos);
    EXPECT_NE(xml.find("<size>0</size>"), std::string::npos);
    EXPECT_NE(xml.find("<xxhash64be>ef46db3751d8e999</xxhash64be>"), std::string::npos);
}

TEST(MhlXmlTest, TST_MHL_006_ToXml_HashEntriesInRecordOrder) {
    const auto xml = to_xml(sample_manifest());

    auto first = xml.find("<file>a.txt</file>");
    auto second = xml.find("<file>sub/b.bin</file>");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
}

TEST(MhlXmlTest, TST_MHL_007_ToXml_EscapesSpecialCharacters) {
    auto manifest = sample_manifest();
    manifest.records[0].relative_path = "R&D/<take 1>.mov";

    const auto xml = to_xml(manifest);
    EXPECT_NE(xml.find("R&amp;D/&lt;take 1&gt;.mov"), std::string::npos);

    auto parsed = parse_mhl(xml);
    ASSERT_TRUE(parsed) << parsed.error;
    EXPECT_EQ(parsed.manifest.records[0].relative_path, "R&D/<take 1>.mov");
}

// ==============================================================================
// Round-trip
// ==============================================================================

TEST_F(MhlTest, TST_MHL_008_WriteThenRead_SameRecords) {
    const auto manifest = sample_manifest();
    const auto path = test_dir_ / "footage_2024-01-02_030405.mhl";

    auto written = write_mhl(path, manifest);
    ASSERT_TRUE(written) << written.error.format();

    auto read = read_mhl(path);
    ASSERT_TRUE(read) << read.error;

    ASSERT_EQ(read.manifest.records.size(), manifest.records.size());
    for (std::size_t i = 0; i < manifest.records.size(); ++i) {
        const auto& expected = manifest.records[i];
        const auto& actual = read.manifest.records[i];
        EXPECT_EQ(actual.relative_path, expected.relative_path);
        EXPECT_EQ(actual.size_bytes, expected.size_bytes);
        EXPECT_EQ(actual.checksum, expected.checksum);
        EXPECT_EQ(actual.algorithm, expected.algorithm);
        EXPECT_EQ(actual.modified_at, expected.modified_at);
        EXPECT_EQ(actual.hashed_at, expected.hashed_at);
    }

    EXPECT_EQ(read.manifest.creator.username, "dit");
    EXPECT_EQ(read.manifest.creator.hostname, "studio.local");
    EXPECT_EQ(read.manifest.creator.start, manifest.creator.start);
    EXPECT_EQ(read.manifest.creator.finish, manifest.creator.finish);
}

TEST_F(MhlTest, TST_MHL_009_WriteIntoMissingDirectory_ManifestWriteError) {
    auto written = write_mhl(test_dir_ / "missing" / "out.mhl", sample_manifest());

    EXPECT_FALSE(written);
    EXPECT_EQ(written.error.kind, ErrorKind::ManifestWrite);
}

TEST(MhlXmlTest, TST_MHL_013_IsValidUtf8) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("sub/b.bin"));
    EXPECT_TRUE(is_valid_utf8("\xd0\xba\xd0\xb0\xd0\xb4\xd1\x80.mov"));  // "кадр.mov"
    EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x8e\xac"));                          // U+1F3AC

    EXPECT_FALSE(is_valid_utf8("bad\xff.bin"));
    EXPECT_FALSE(is_valid_utf8("\xc3"));              // обрыв последовательности
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));          // overlong "/"
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));      // суррогат U+D800
    EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));  // > U+10FFFF
}

TEST_F(MhlTest, TST_MHL_014_WriteNonUtf8Path_ManifestWriteError) {
    auto manifest = sample_manifest();
    manifest.records[0].relative_path = "bad\xff.bin";

    const auto out = test_dir_ / "out.mhl";
    auto written = write_mhl(out, manifest);

    EXPECT_FALSE(written);
    EXPECT_EQ(written.error.kind, ErrorKind::ManifestWrite);
    EXPECT_FALSE(std::filesystem::exists(out));
}

// ==============================================================================
// Разбор
// ==============================================================================

TEST(MhlParseTest, TST_MHL_010_LegacyXxhash64Tag_Accepted) {
    const char* xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<hashlist version="1.1">
  <hash>
    <file>clip.mov</file>
    <size>42</size>
    <xxhash64>ef46db3751d8e999</xxhash64>
  </hash>
</hashlist>
)";
    auto parsed = parse_mhl(xml);
    ASSERT_TRUE(parsed) << parsed.error;
    ASSERT_EQ(parsed.manifest.records.size(), 1u);
    EXPECT_EQ(parsed.manifest.records[0].algorithm, hash::Algorithm::Xxh64);
    EXPECT_EQ(parsed.manifest.records[0].size_bytes, 42u);
}

TEST(MhlParseTest, TST_MHL_011_Md5AndSha1Tags) {
    const char* xml = R"(<hashlist version="1.1">
  <hash><file>a</file><size>1</size><md5>d41d8cd98f00b204e9800998ecf8427e</md5></hash>
  <hash><file>b</file><size>2</size><sha1>da39a3ee5e6b4b0d3255bfef95601890afd80709</sha1></hash>
</hashlist>)";
    auto parsed = parse_mhl(xml);
    ASSERT_TRUE(parsed) << parsed.error;
    ASSERT_EQ(parsed.manifest.records.size(), 2u);
    EXPECT_EQ(parsed.manifest.records[0].algorithm, hash::Algorithm::Md5);
    EXPECT_EQ(parsed.manifest.records[1].algorithm, hash::Algorithm::Sha1);
}

TEST(MhlParseTest, TST_MHL_012_Malformed_Errors) {
    EXPECT_FALSE(parse_mhl("<hashlist><hash>"));
    EXPECT_FALSE(parse_mhl("<other/>"));
    EXPECT_FALSE(parse_mhl("<hashlist><hash><file>a</file><size>x</size><md5>00</md5></hash>"
                           "</hashlist>"));
    EXPECT_FALSE(parse_mhl("<hashlist><hash><file>a</file><size>1</size></hash></hashlist>"));
}

}  // namespace rccopy::mhl::test
