/**
 * @file chr_reader_tests.cpp
 * @brief Tile data loading from assembly listings and raw files
 */

#include "test_helpers.hpp"
#include "chr_reader.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>

TEST(ChrReaderTest, ParsesCharsSegment) {
    const char* source =
        ".segment \"CHARS\"\n"
        "  .byte $00,$FF,$18\n"
        "  .byte 0x3C, %10000001, 255\n";
    expectBytes(ChrReader::parseAssembly(source), {0x00, 0xFF, 0x18, 0x3C, 0x81, 0xFF});
}

TEST(ChrReaderTest, IgnoresOtherSegmentsAndComments) {
    const char* source =
        "; generated tile set\n"
        ".segment \"RODATA\"\n"
        ".byte $11,$22\n"
        ".segment \"CHARS\"\n"
        ".byte $01 ; first\n"
        "\n"
        ".segment \"VECTORS\"\n"
        ".byte $33\n"
        ".segment \"CHARS\"\n"
        ".byte $02\r\n";
    expectBytes(ChrReader::parseAssembly(source), {0x01, 0x02});
}

TEST(ChrReaderTest, EmptyCharsSegmentIsAllowed) {
    EXPECT_TRUE(ChrReader::parseAssembly(".segment \"CHARS\"\n").empty());
}

TEST(ChrReaderTest, MissingCharsSegmentThrows) {
    EXPECT_THROW(ChrReader::parseAssembly(".byte $01\n"), DecodeError);
}

TEST(ChrReaderTest, BadByteValuesThrow) {
    EXPECT_THROW(ChrReader::parseAssembly(".segment \"CHARS\"\n.byte $1G\n"), DecodeError);
    EXPECT_THROW(ChrReader::parseAssembly(".segment \"CHARS\"\n.byte 256\n"), DecodeError);
    EXPECT_THROW(ChrReader::parseAssembly(".segment \"CHARS\"\n.byte %2\n"), DecodeError);
}

// ============================================================================
// Files
// ============================================================================

class ChrFileTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("nesil_chr_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ignored;
        std::filesystem::remove_all(dir, ignored);
    }

    std::string write(const std::string& name, const std::string& contents) {
        const auto path = dir / name;
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path.string();
    }
};

TEST_F(ChrFileTest, LoadsAssemblyByExtension) {
    const auto path = write("tiles.s", ".segment \"CHARS\"\n.byte $AA,$55\n");
    expectBytes(ChrReader::load(path), {0xAA, 0x55});
}

TEST_F(ChrFileTest, LoadsRawBinary) {
    const std::string raw("\x00\x01\xFE\x2E", 4);
    const auto path = write("tiles.chr", raw);
    expectBytes(ChrReader::load(path), {0x00, 0x01, 0xFE, 0x2E});
}

TEST_F(ChrFileTest, MissingFileThrows) {
    EXPECT_THROW(ChrReader::load((dir / "absent.chr").string()), DecodeError);
}
