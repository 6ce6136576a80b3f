// ==============================================================================
// test_copier_gtest.cpp - Тесты File Copier (GoogleTest)
// ==============================================================================
//
// Тесты: TST-COPY-001..TST-COPY-011
//
// ==============================================================================

#include "rccopy/copier.hpp"
#include "rccopy/hash.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace rccopy::io::test {

class CopierTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("rccopy_copier_") + test_info->test_case_name() +
                                  "_" + test_info->name() + "_" +
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

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    CopyOptions options(std::size_t chunk_size = CHUNK_SIZE) {
        CopyOptions opt;
        opt.chunk_size = chunk_size;
        return opt;
    }
};

// ==============================================================================
// TST-COPY-001: Копирование с контрольной суммой
// ==============================================================================

TEST_F(CopierTest, TST_COPY_001_CopyWithChecksum_ContentAndDigest) {
    const std::string content = "0123456789abcdef";
    write_file(test_dir_ / "src" / "a.txt", content);

    auto result = copy_file(test_dir_ / "src" / "a.txt", test_dir_ / "dst" / "a.txt",
                            hash::Algorithm::Xxh64, options());

    ASSERT_TRUE(result) << result.error.format();
    ASSERT_TRUE(result.checksum.has_value());
    EXPECT_EQ(*result.checksum, hash::hash_bytes(hash::Algorithm::Xxh64, content));
    EXPECT_EQ(result.checksum->size(), 16u);
    EXPECT_EQ(result.bytes_copied, content.size());
    EXPECT_EQ(read_file(test_dir_ / "dst" / "a.txt"), content);
}

TEST_F(CopierTest, TST_COPY_002_CopyWithoutChecksum_NoDigest) {
    write_file(test_dir_ / "src" / "a.txt", "payload");

    auto result = copy_file(test_dir_ / "src" / "a.txt", test_dir_ / "dst" / "a.txt",
                            std::nullopt, options());

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_FALSE(result.checksum.has_value());
    EXPECT_EQ(read_file(test_dir_ / "dst" / "a.txt"), "payload");
}

TEST_F(CopierTest, TST_COPY_003_EmptyFile_Copied) {
    write_file(test_dir_ / "src" / "b.bin", "");

    auto result = copy_file(test_dir_ / "src" / "b.bin", test_dir_ / "dst" / "sub" / "b.bin",
                            hash::Algorithm::Xxh64, options());

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.bytes_copied, 0u);
    ASSERT_TRUE(result.checksum.has_value());
    EXPECT_EQ(*result.checksum, "ef46db3751d8e999");
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "dst" / "sub" / "b.bin"));
    EXPECT_EQ(std::filesystem::file_size(test_dir_ / "dst" / "sub" / "b.bin"), 0u);
}

// ==============================================================================
// TST-COPY-004: Размер чанка не влияет на результат
// ==============================================================================

TEST_F(CopierTest, TST_COPY_004_SmallChunks_SameDigest) {
    std::string content;
    for (int i = 0; i < 5000; ++i) {
        content += static_cast<char>(i % 256);
    }
    write_file(test_dir_ / "src" / "data.bin", content);

    auto small = copy_file(test_dir_ / "src" / "data.bin", test_dir_ / "dst1" / "data.bin",
                           hash::Algorithm::Md5, options(13));
    auto large = copy_file(test_dir_ / "src" / "data.bin", test_dir_ / "dst2" / "data.bin",
                           hash::Algorithm::Md5, options());

    ASSERT_TRUE(small) << small.error.format();
    ASSERT_TRUE(large) << large.error.format();
    EXPECT_EQ(*small.checksum, *large.checksum);
    EXPECT_EQ(*small.checksum, hash::hash_bytes(hash::Algorithm::Md5, content));
    EXPECT_EQ(read_file(test_dir_ / "dst1" / "data.bin"), content);
}

// ==============================================================================
// TST-COPY-005: Перезапись существующего файла
// ==============================================================================

TEST_F(CopierTest, TST_COPY_005_ExistingDestination_Truncated) {
    write_file(test_dir_ / "src" / "a.txt", "short");
    write_file(test_dir_ / "dst" / "a.txt", "a much longer previous content");

    auto result = copy_file(test_dir_ / "src" / "a.txt", test_dir_ / "dst" / "a.txt",
                            hash::Algorithm::Sha1, options());

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(read_file(test_dir_ / "dst" / "a.txt"), "short");
}

// ==============================================================================
// TST-COPY-006: Ошибки локальны и возвращаются значением
// ==============================================================================

TEST_F(CopierTest, TST_COPY_006_MissingSource_CopyError) {
    auto result = copy_file(test_dir_ / "src" / "missing.txt", test_dir_ / "dst" / "missing.txt",
                            hash::Algorithm::Md5, options());

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::Copy);
    EXPECT_FALSE(result.checksum.has_value());
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "dst" / "missing.txt"));
}

TEST_F(CopierTest, TST_COPY_007_DestinationIsDirectory_CopyError) {
    write_file(test_dir_ / "src" / "a.txt", "data");
    std::filesystem::create_directories(test_dir_ / "dst" / "a.txt");

    auto result = copy_file(test_dir_ / "src" / "a.txt", test_dir_ / "dst" / "a.txt",
                            hash::Algorithm::Md5, options());

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::Copy);
}

// ==============================================================================
// TST-COPY-008: ThroughputMeter
// ==============================================================================

TEST(ThroughputMeterTest, TST_COPY_008_MovingAverage) {
    ThroughputMeter meter(3);
    EXPECT_DOUBLE_EQ(meter.average(), 0.0);

    using seconds = std::chrono::duration<double>;
    EXPECT_DOUBLE_EQ(meter.add_sample(100, seconds(1.0)), 100.0);
    EXPECT_DOUBLE_EQ(meter.add_sample(200, seconds(1.0)), 150.0);
    EXPECT_DOUBLE_EQ(meter.add_sample(150, seconds(0.5)), 200.0);

    // Окно из трёх: первый замер вытесняется
    EXPECT_DOUBLE_EQ(meter.add_sample(500, seconds(1.0)), (200.0 + 300.0 + 500.0) / 3.0);
    EXPECT_EQ(meter.sample_count(), 3u);
}

TEST(ThroughputMeterTest, TST_COPY_009_ZeroDuration_Ignored) {
    ThroughputMeter meter;
    meter.add_sample(1000, std::chrono::duration<double>(0.0));
    EXPECT_EQ(meter.sample_count(), 0u);
    EXPECT_DOUBLE_EQ(meter.average(), 0.0);
}

// ==============================================================================
// TST-COPY-010: Скорость в ходе copy_file
// ==============================================================================

namespace {

/// Часы, отдающие заданные отметки (в мс) по одной на вызов
SteadyClock scripted_clock(std::vector<int> marks_ms, std::size_t& calls) {
    return [marks = std::move(marks_ms), &calls]() {
        std::size_t i = calls < marks.size() ? calls : marks.size() - 1;
        ++calls;
        return std::chrono::steady_clock::time_point(std::chrono::milliseconds(marks[i]));
    };
}

}  // namespace

TEST_F(CopierTest, TST_COPY_010_Throughput_ReportsWindowedMean) {
    write_file(test_dir_ / "src" / "a.bin", std::string(300, 'x'));

    // Старт в 0 мс, затем по одной отметке на каждый чанк из 100 байт
    std::size_t calls = 0;
    std::vector<double> reported;
    auto opt = options(100);
    opt.clock = scripted_clock({0, 100, 300, 400}, calls);
    opt.on_throughput = [&reported](double speed) { reported.push_back(speed); };

    auto result = copy_file(test_dir_ / "src" / "a.bin", test_dir_ / "dst" / "a.bin",
                            hash::Algorithm::Xxh64, opt);

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(calls, 4u);

    // Замеры: 1000, 500, 1000 байт/с
    ASSERT_EQ(reported.size(), 3u);
    EXPECT_DOUBLE_EQ(reported[0], 1000.0);
    EXPECT_DOUBLE_EQ(reported[1], 750.0);
    EXPECT_DOUBLE_EQ(reported[2], 2500.0 / 3.0);
}

TEST_F(CopierTest, TST_COPY_011_Throughput_ShortIntervalsAccumulate) {
    write_file(test_dir_ / "src" / "a.bin", std::string(300, 'x'));

    std::size_t calls = 0;
    std::vector<double> reported;
    auto opt = options(100);
    opt.clock = scripted_clock({0, 50, 100, 150}, calls);
    opt.on_throughput = [&reported](double speed) { reported.push_back(speed); };

    auto result = copy_file(test_dir_ / "src" / "a.bin", test_dir_ / "dst" / "a.bin",
                            std::nullopt, opt);

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.bytes_copied, 300u);

    // Один замер на отметке 100 мс: 200 байт за 0.1 с
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_DOUBLE_EQ(reported[0], 2000.0);
    EXPECT_EQ(read_file(test_dir_ / "dst" / "a.bin"), std::string(300, 'x'));
}

}  // namespace rccopy::io::test
