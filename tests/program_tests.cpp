/**
 * @file program_tests.cpp
 * @brief Block arena, address resolution and long-branch relaxation
 */

#include "test_helpers.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

using M = Mnemonic;
using I = Instruction;

// ============================================================================
// Block
// ============================================================================

TEST(BlockTest, SizeAndOffsets) {
    Block block("routine");
    block.emit(I::imm(M::LDA, 0x00))
         .emit(I::abs(M::STA, 0x2001))
         .emit(I::implied(M::RTS));

    EXPECT_EQ(block.count(), 3u);
    EXPECT_EQ(block.size(), 6u);
    EXPECT_EQ(block.offsetAt(0), 0u);
    EXPECT_EQ(block.offsetAt(1), 2u);
    EXPECT_EQ(block.offsetAt(2), 5u);
}

TEST(BlockTest, TruncateRependsLabels) {
    Block block("main");
    block.emit(I::imm(M::LDA, 0x01));
    block.setNextLabel("IL_0002");
    block.emit(I::abs(M::JSR, "pusha"));
    block.emit(I::imm(M::LDA, 0x02));

    block.truncate(1);
    EXPECT_EQ(block.count(), 1u);
    ASSERT_EQ(block.trailingLabels().size(), 1u);
    EXPECT_EQ(block.trailingLabels()[0], "IL_0002");

    block.emit(I::implied(M::RTS));
    ASSERT_EQ(block.instructions().size(), 2u);
    ASSERT_EQ(block.instructions()[1].labels.size(), 1u);
    EXPECT_EQ(block.instructions()[1].labels[0], "IL_0002");
    EXPECT_TRUE(block.trailingLabels().empty());
}

TEST(BlockTest, ReplaceKeepsLabelOnFirst) {
    Block block("main");
    block.emit(I::abs(M::JSR, "pusha"), "here");
    block.replace(0, {I::imm(M::LDX, 0x00), I::abs(M::JSR, "pushax")});

    ASSERT_EQ(block.count(), 2u);
    EXPECT_EQ(block[0].mnemonic, M::LDX);
    EXPECT_EQ(block[1].operand.label, "pushax");
    ASSERT_EQ(block.instructions()[0].labels.size(), 1u);
    EXPECT_EQ(block.instructions()[0].labels[0], "here");
}

TEST(BlockTest, RawData) {
    Block data = Block::fromRawData({'H', 'I', 0}, "string_0");
    EXPECT_TRUE(data.isData());
    EXPECT_EQ(data.size(), 3u);
    EXPECT_THROW(Block("code").rawData(), std::logic_error);
}

// ============================================================================
// Resolution
// ============================================================================

TEST_F(ProgramTestBase, ForwardAndBackwardReferences) {
    Block first("first");
    first.emit(I::abs(M::JSR, "second"))
         .emit(I::abs(M::JMP, "first"));
    Block second("second");
    second.emit(I::implied(M::RTS));
    program.addBlock(std::move(first));
    program.addBlock(std::move(second));

    expectBytes(program.toBytes(), {0x20, 0x06, 0x80, 0x4C, 0x00, 0x80, 0x60});
    EXPECT_EQ(program.labelAddress("second"), 0x8006);
    EXPECT_EQ(program.totalSize(), 7u);
}

TEST_F(ProgramTestBase, ResolutionIsIdempotent) {
    Block a("a");
    a.emit(I::imm(M::LDA, 0x01)).emit(I::implied(M::RTS), "@end");
    Block b("b");
    b.emit(I::abs(M::JMP, "a"));
    program.addBlock(std::move(a));
    program.addBlock(std::move(b));

    program.resolveAddresses();
    auto firstStarts = getBlockStarts();
    auto firstLabels = program.labelTable().entries();
    program.resolveAddresses();

    EXPECT_EQ(getBlockStarts(), firstStarts);
    EXPECT_EQ(program.labelTable().entries(), firstLabels);
    EXPECT_TRUE(isResolved());
}

TEST_F(ProgramTestBase, LabelOffsetMovesEntryPoint) {
    Block prefix("pusha", 4);
    prefix.emit(I::zp(M::LDY, 0x22))
          .emit(I::branch(M::BEQ, "@1"))
          .emit(I::implied(M::DEY), "@1")
          .emit(I::implied(M::RTS));
    program.addBlock(std::move(prefix));

    EXPECT_EQ(program.blockAddress("pusha"), 0x8000);
    EXPECT_EQ(program.labelAddress("pusha"), 0x8004);
}

TEST_F(ProgramTestBase, LocalLabelsAreScopedToTheirBlock) {
    Block a("a");
    a.emit(I::implied(M::DEX), "@loop").emit(I::branch(M::BNE, "@loop"));
    Block b("b");
    b.emit(I::implied(M::DEY), "@loop").emit(I::branch(M::BNE, "@loop"));
    program.addBlock(std::move(a));
    program.addBlock(std::move(b));

    expectBytes(program.toBytes(), {0xCA, 0xD0, 0xFD, 0x88, 0xD0, 0xFD});
    EXPECT_EQ(program.labelAddress("a:@loop"), 0x8000);
    EXPECT_EQ(program.labelAddress("b:@loop"), 0x8003);
}

TEST_F(ProgramTestBase, DuplicateLabelThrows) {
    Block a("twice");
    a.emit(I::implied(M::RTS));
    Block b("twice");
    b.emit(I::implied(M::RTS));
    program.addBlock(std::move(a));
    program.addBlock(std::move(b));

    EXPECT_THROW(program.resolveAddresses(), DuplicateLabel);
}

TEST_F(ProgramTestBase, UnresolvedLabelThrowsAndIsReported) {
    Block a("caller");
    a.emit(I::abs(M::JSR, "missing")).emit(I::abs(M::JMP, "@gone"));
    program.addBlock(std::move(a));

    auto missing = program.validate();
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0], "caller:@gone");
    EXPECT_EQ(missing[1], "missing");
    EXPECT_THROW(program.toBytes(), UnresolvedLabel);
}

TEST_F(ProgramTestBase, ExternalLabelsSurviveResolution) {
    program.defineExternalLabel("PPU_CTRL", 0x2000);
    Block a("a");
    a.emit(I::abs(M::STA, "PPU_CTRL"));
    program.addBlock(std::move(a));

    program.resolveAddresses();
    program.resolveAddresses();
    expectBytes(program.toBytes(), {0x8D, 0x00, 0x20});
}

TEST_F(ProgramTestBase, InsertAndMoveRecomputeAddresses) {
    Block a("a");
    a.emit(I::implied(M::RTS));
    Block b("b");
    b.emit(I::abs(M::JMP, "a"));
    program.addBlock(std::move(a));
    program.addBlock(std::move(b));
    EXPECT_EQ(program.labelAddress("b"), 0x8001);

    Block pad("pad");
    pad.emit(I::implied(M::NOP)).emit(I::implied(M::NOP));
    program.insertBlock(0, std::move(pad));
    EXPECT_EQ(program.labelAddress("a"), 0x8002);
    expectBytes(program.toBytes(), {0xEA, 0xEA, 0x60, 0x4C, 0x02, 0x80});

    program.moveBlock(2, 0);
    EXPECT_EQ(program.labelAddress("b"), 0x8000);
    expectBytes(program.toBytes(), {0x4C, 0x05, 0x80, 0xEA, 0xEA, 0x60});

    EXPECT_TRUE(program.removeBlock("pad"));
    EXPECT_FALSE(program.removeBlock("pad"));
    EXPECT_EQ(program.labelAddress("a"), 0x8003);
}

TEST_F(ProgramTestBase, RawDataBlocksAreAddressable) {
    Block code("main");
    code.emit(I::immLow(M::LDA, "string_0")).emit(I::immHigh(M::LDX, "string_0"));
    program.addBlock(std::move(code));
    program.addRawData({'O', 'K', 0}, "string_0");

    expectBytes(program.toBytes(), {0xA9, 0x04, 0xA2, 0x80, 'O', 'K', 0x00});
}

// ============================================================================
// Long branch relaxation
// ============================================================================

namespace {

Block farLoop(bool eligible, size_t padding) {
    Block block("loop");
    block.emit(I::implied(M::NOP), "@top");
    for (size_t i = 0; i < padding; ++i) {
        block.emit(I::abs(M::STA, 0x0200));
    }
    Instruction back = I::branch(M::BNE, "@top");
    back.longBranch = eligible;
    block.emit(back);
    block.emit(I::implied(M::RTS));
    return block;
}

} // namespace

TEST_F(ProgramTestBase, InRangeBranchIsLeftAlone) {
    program.addBlock(farLoop(true, 10));
    EXPECT_EQ(program.relaxBranches(), 0u);
    auto bytes = program.toBytes();
    EXPECT_EQ(bytes[31], 0xD0);
}

TEST_F(ProgramTestBase, FarEligibleBranchBecomesTrampoline) {
    program.addBlock(farLoop(true, 50));
    EXPECT_EQ(program.relaxBranches(), 1u);

    auto bytes = program.toBytes();
    // NOP + 150 bytes of STA, then BEQ +3 / JMP $8000 / RTS
    ASSERT_EQ(bytes.size(), 1u + 150u + 2u + 3u + 1u);
    expectBytes(extractBytes(bytes, 151, 6), {0xF0, 0x03, 0x4C, 0x00, 0x80, 0x60});
}

TEST_F(ProgramTestBase, FarIneligibleBranchThrows) {
    program.addBlock(farLoop(false, 50));
    EXPECT_THROW(program.relaxBranches(), BranchOutOfRange);
}

TEST_F(ProgramTestBase, RelaxedBranchesLandOnTheirLabels) {
    // Two far branches back to the same label.
    Block block("main");
    block.emit(I::implied(M::NOP), "@top");
    for (int i = 0; i < 42; ++i) {
        block.emit(I::abs(M::STA, 0x0200));
    }
    Instruction first = I::branch(M::BEQ, "@top");
    first.longBranch = true;
    Instruction second = I::branch(M::BCC, "@top");
    second.longBranch = true;
    block.emit(first).emit(second).emit(I::implied(M::RTS));
    program.addBlock(std::move(block));

    EXPECT_EQ(program.relaxBranches(), 2u);
    auto bytes = program.toBytes();
    for (size_t i = 0; i + 1 < bytes.size(); ++i) {
        if (bytes[i] == 0x4C) {
            EXPECT_EQ(readWord(bytes, i + 1), 0x8000) << "JMP at offset " << i;
        }
    }
    expectBytes(extractBytes(bytes, 127, 10), {0xD0, 0x03, 0x4C, 0x00, 0x80, 0xB0, 0x03, 0x4C, 0x00, 0x80});
}

TEST_F(ProgramTestBase, DisassembleShowsAddresses) {
    Block a("start");
    a.emit(I::imm(M::LDA, 0x10)).emit(I::abs(M::JMP, "start"));
    program.addBlock(std::move(a));

    std::string text = program.disassemble();
    EXPECT_NE(text.find("start:"), std::string::npos);
    EXPECT_NE(text.find("$8000"), std::string::npos);
    EXPECT_NE(text.find("$8002"), std::string::npos);
    EXPECT_NE(text.find("LDA"), std::string::npos);
}
