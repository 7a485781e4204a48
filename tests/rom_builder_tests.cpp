/**
 * @file rom_builder_tests.cpp
 * @brief iNES image layout: header, PRG banks, vectors and CHR
 */

#include "test_helpers.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace {

constexpr size_t PRG_START = ines::HEADER_SIZE;
constexpr size_t BANK2_START = PRG_START + ines::PRG_BANK_SIZE;
constexpr size_t CHR_START = PRG_START + 2 * ines::PRG_BANK_SIZE;
constexpr size_t ROM_SIZE = CHR_START + ines::CHR_BANK_SIZE;

} // namespace

class RomBuilderTest : public TranslatorTestBase {
protected:
    Translation hello;

    void SetUp() override {
        buildHelloProgram(il);
        hello = translate();
    }
};

// ============================================================================
// Header
// ============================================================================

TEST(RomHeaderTest, HorizontalMirroring) {
    expectBytes(RomBuilder::header(false), {
        'N', 'E', 'S', 0x1A, 0x02, 0x01, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    });
}

TEST(RomHeaderTest, MirroringChangesOneBit) {
    auto horizontal = RomBuilder::header(false);
    auto vertical = RomBuilder::header(true);
    ASSERT_EQ(horizontal.size(), vertical.size());
    for (size_t i = 0; i < horizontal.size(); ++i) {
        if (i == 6) {
            EXPECT_EQ(horizontal[i] ^ vertical[i], ines::FLAG6_VERTICAL_MIRRORING);
        } else {
            EXPECT_EQ(horizontal[i], vertical[i]) << "header byte " << i;
        }
    }
}

// ============================================================================
// Image layout
// ============================================================================

TEST_F(RomBuilderTest, ImageSize) {
    auto rom = RomBuilder().build(hello, {});
    EXPECT_EQ(rom.size(), ROM_SIZE);
    EXPECT_EQ(rom.size(), 40976u);
}

TEST_F(RomBuilderTest, MainAtCanonicalOffset) {
    auto rom = RomBuilder().build(hello, {});
    expectBytes(extractBytes(rom, PRG_START + 0x500, HELLO_MAIN.size()), HELLO_MAIN);
}

TEST_F(RomBuilderTest, StringFollowsRuntime) {
    auto rom = RomBuilder().build(hello, {});
    const std::string text = "HELLO, .NET!";
    auto bytes = extractBytes(rom, PRG_START + 0x5F1, text.size() + 1);
    EXPECT_EQ(std::string(bytes.begin(), bytes.end() - 1), text);
    EXPECT_EQ(bytes.back(), 0x00);
}

TEST_F(RomBuilderTest, ResetStartsWithStartupCode) {
    auto rom = RomBuilder().build(hello, {});
    EXPECT_EQ(rom[PRG_START], 0x78);        // SEI
    EXPECT_EQ(rom[PRG_START + 1], 0xA2);    // LDX #$FF
    EXPECT_EQ(rom[PRG_START + 2], 0xFF);
}

TEST_F(RomBuilderTest, VectorsAtEndOfSecondBank) {
    auto rom = RomBuilder().build(hello, {});
    const size_t vectors = CHR_START - ines::VECTORS_SIZE;
    EXPECT_EQ(readWord(rom, vectors), 0x80BC);       // NMI
    EXPECT_EQ(readWord(rom, vectors + 2), 0x8000);   // RESET
    EXPECT_EQ(readWord(rom, vectors + 4), 0x8202);   // IRQ
}

TEST_F(RomBuilderTest, SecondBankIsOtherwiseEmpty) {
    auto rom = RomBuilder().build(hello, {});
    auto bank = extractBytes(rom, BANK2_START, ines::PRG_BANK_SIZE - ines::VECTORS_SIZE);
    EXPECT_TRUE(std::all_of(bank.begin(), bank.end(), [](uint8_t b) { return b == 0; }));
}

TEST_F(RomBuilderTest, FirstBankIsZeroPadded) {
    Program program = assemble(hello);
    const size_t codeSize = program.toBytes().size();
    auto rom = RomBuilder().build(hello, {});
    auto padding = extractBytes(rom, PRG_START + codeSize, ines::PRG_BANK_SIZE - codeSize);
    EXPECT_TRUE(std::all_of(padding.begin(), padding.end(), [](uint8_t b) { return b == 0; }));
}

TEST_F(RomBuilderTest, VerticalMirroringFlag) {
    BuildOptions options;
    options.verticalMirroring = true;
    auto rom = RomBuilder(options).build(hello, {});
    EXPECT_EQ(rom[6], ines::FLAG6_VERTICAL_MIRRORING);
}

TEST_F(RomBuilderTest, BuildIsDeterministic) {
    EXPECT_EQ(RomBuilder().build(hello, {0x11}), RomBuilder().build(hello, {0x11}));
}

// ============================================================================
// Tile data
// ============================================================================

TEST_F(RomBuilderTest, ChrCopiedAndPadded) {
    std::vector<uint8_t> chr(32, 0xAA);
    auto rom = RomBuilder().build(hello, chr);
    expectBytes(extractBytes(rom, CHR_START, chr.size()), chr);
    auto rest = extractBytes(rom, CHR_START + chr.size(), ines::CHR_BANK_SIZE - chr.size());
    EXPECT_TRUE(std::all_of(rest.begin(), rest.end(), [](uint8_t b) { return b == 0; }));
}

TEST_F(RomBuilderTest, FullChrBankFits) {
    std::vector<uint8_t> chr(ines::CHR_BANK_SIZE, 0x55);
    auto rom = RomBuilder().build(hello, chr);
    EXPECT_EQ(rom.size(), ROM_SIZE);
    EXPECT_EQ(rom.back(), 0x55);
}

TEST_F(RomBuilderTest, OversizedChrThrows) {
    std::vector<uint8_t> chr(ines::CHR_BANK_SIZE + 1, 0x00);
    try {
        RomBuilder().build(hello, chr);
        FAIL() << "expected RomOverflow";
    } catch (const RomOverflow& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Limit);
    }
}

// ============================================================================
// Program size and diagnostics
// ============================================================================

TEST(RomBuilderLimitTest, OversizedProgramThrows) {
    Translation translation;
    for (int i = 0; i < 6000; ++i) {
        translation.code.emit(Instruction::abs(Mnemonic::JSR, "ppu_wait_nmi"));
    }
    translation.calls.insert("ppu_wait_nmi");
    EXPECT_THROW(RomBuilder().build(translation, {}), RomOverflow);
}

TEST(RomBuilderLimitTest, UnresolvedLabelInUserCodeThrows) {
    Translation translation;
    translation.code.emit(Instruction::abs(Mnemonic::JMP, "IL_0042"));
    EXPECT_THROW(RomBuilder().assemble(translation), UnresolvedLabel);
}

TEST_F(RomBuilderTest, ProgressIsLoggedWhenRequested) {
    std::ostringstream log;
    BuildOptions options;
    options.log = &log;
    RomBuilder(options).build(hello, {});
    EXPECT_NE(log.str().find("Size of main: 67"), std::string::npos) << log.str();
    EXPECT_NE(log.str().find("ROM complete. Total size: 40976 bytes"), std::string::npos) << log.str();
}

// ============================================================================
// Output file
// ============================================================================

class RomFileTest : public RomBuilderTest {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        RomBuilderTest::SetUp();
        dir = std::filesystem::temp_directory_path() /
              ("nesil_rom_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ignored;
        std::filesystem::remove_all(dir, ignored);
    }
};

TEST_F(RomFileTest, WritesWholeImage) {
    const std::vector<uint8_t> rom = RomBuilder().build(hello, {});
    const auto path = (dir / "hello.nes").string();
    RomBuilder::write(path, rom);

    std::ifstream in(path, std::ios::binary);
    const std::vector<uint8_t> written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(written, rom);
}

TEST_F(RomFileTest, UnopenablePathThrows) {
    const std::vector<uint8_t> rom = RomBuilder().build(hello, {});
    try {
        RomBuilder::write((dir / "missing" / "hello.nes").string(), rom);
        FAIL() << "expected WriteError";
    } catch (const WriteError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::BadInput);
    }
}

TEST_F(RomFileTest, FailedWriteThrows) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "no /dev/full on this system";
    }
    const std::vector<uint8_t> rom = RomBuilder().build(hello, {});
    EXPECT_THROW(RomBuilder::write("/dev/full", rom), WriteError);
}
