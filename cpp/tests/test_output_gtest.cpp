// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// TST-OUTPUT-001..TST-OUTPUT-008
//
// ==============================================================================

#include "rccopy/output.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

namespace rccopy::output::test {

// ==============================================================================
// TST-OUTPUT-001: создание Writer и базовый вывод
// ==============================================================================

TEST(OutputTest, TST_OUTPUT_001_Writer_Configs_CreateSuccessfully) {
    OutputConfig config;
    EXPECT_NO_THROW({ Writer writer(config); });

    config.quiet = true;
    EXPECT_NO_THROW({ Writer writer(config); });

    config.quiet = false;
    config.verbose = 2;
    EXPECT_NO_THROW({ Writer writer(config); });
}

TEST(OutputTest, TST_OUTPUT_002_Writer_AllMessageKinds_DoNotThrow) {
    OutputConfig config;
    config.verbose = 2;
    Writer writer(config);

    EXPECT_NO_THROW({
        writer.info("info");
        writer.warn("warn");
        writer.error("error");
        writer.debug("debug");
        writer.line("-------------------------");
        writer.green_line("Checksums match: ef46db3751d8e999");
        writer.red_line("Error: Checksums do not match");
        writer.transfer_speed(1024.0 * 1024.0);
        writer.clear_transfer_line();
        writer.flush();
    });
}

// ==============================================================================
// TST-OUTPUT-004: скорость передачи
// ==============================================================================

TEST(OutputTest, TST_OUTPUT_004_FormatRate_Units) {
    EXPECT_EQ(format_rate(0.0), "0 B/s");
    EXPECT_EQ(format_rate(512.0), "512 B/s");
    EXPECT_EQ(format_rate(1536.0), "1.50 KB/s");
    EXPECT_EQ(format_rate(12.34 * 1024.0 * 1024.0), "12.34 MB/s");
    EXPECT_EQ(format_rate(2.0 * 1024.0 * 1024.0 * 1024.0), "2.00 GB/s");
    EXPECT_EQ(format_rate(3.0 * 1024.0 * 1024.0 * 1024.0 * 1024.0), "3.00 TB/s");
}

TEST(OutputTest, TST_OUTPUT_005_FormatRate_LargestUnitCaps) {
    // Выше TB/s единица не растёт
    EXPECT_EQ(format_rate(2048.0 * 1024.0 * 1024.0 * 1024.0 * 1024.0), "2048.00 TB/s");
}

TEST(OutputTest, TST_OUTPUT_006_FormatSize) {
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(1023), "1023 B");
    EXPECT_EQ(format_size(1024), "1.00 KB");
    EXPECT_EQ(format_size(5ULL * 1024 * 1024), "5.00 MB");
}

// ==============================================================================
// TST-OUTPUT-007: ANSI коды
// ==============================================================================

TEST(OutputTest, TST_OUTPUT_007_AnsiCodes) {
    EXPECT_EQ(ansi_color_code(Color::Green), "\x1b[32m");
    EXPECT_EQ(ansi_color_code(Color::Red), "\x1b[31m");
    EXPECT_EQ(ansi_color_code(Color::Default), "");
    EXPECT_EQ(ansi_color_code(Color::Cyan), "\x1b[36m");
}

// ==============================================================================
// TST-OUTPUT-008: JSON в stdout
// ==============================================================================

TEST(OutputTest, TST_OUTPUT_008_WriteJsonPretty_DoesNotThrow) {
    OutputConfig config;
    Writer writer(config);

    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("status", "success", doc.GetAllocator());

    EXPECT_NO_THROW({ writer.write_json_pretty(doc); });
}

}  // namespace rccopy::output::test
