/**
 * @file opcodes_tests.cpp
 * @brief 6502 opcode table and single-instruction encoding
 */

#include "test_helpers.hpp"
#include "errors.hpp"
#include "opcodes.hpp"
#include <gtest/gtest.h>

using namespace mos6502;

// ============================================================================
// Opcode table
// ============================================================================

TEST(OpcodeTableTest, EncodesCommonInstructions) {
    EXPECT_EQ(encode(Mnemonic::LDA, AddressMode::Immediate), 0xA9);
    EXPECT_EQ(encode(Mnemonic::LDX, AddressMode::Immediate), 0xA2);
    EXPECT_EQ(encode(Mnemonic::STA, AddressMode::Absolute), 0x8D);
    EXPECT_EQ(encode(Mnemonic::JSR, AddressMode::Absolute), 0x20);
    EXPECT_EQ(encode(Mnemonic::JMP, AddressMode::Absolute), 0x4C);
    EXPECT_EQ(encode(Mnemonic::JMP, AddressMode::Indirect), 0x6C);
    EXPECT_EQ(encode(Mnemonic::LDA, AddressMode::IndirectIndexed), 0xB1);
    EXPECT_EQ(encode(Mnemonic::BNE, AddressMode::Relative), 0xD0);
    EXPECT_EQ(encode(Mnemonic::RTS, AddressMode::Implied), 0x60);
    EXPECT_EQ(encode(Mnemonic::ASL, AddressMode::Accumulator), 0x0A);
}

TEST(OpcodeTableTest, RejectsInvalidPairs) {
    EXPECT_FALSE(isValid(Mnemonic::STA, AddressMode::Immediate));
    EXPECT_FALSE(tryEncode(Mnemonic::JSR, AddressMode::Indirect).has_value());
    EXPECT_THROW(encode(Mnemonic::STX, AddressMode::AbsoluteX), InvalidAddressMode);
}

TEST(OpcodeTableTest, DecodeInvertsEncode) {
    size_t documented = 0;
    for (int byte = 0; byte < 256; ++byte) {
        auto pair = decode(static_cast<uint8_t>(byte));
        if (!pair) continue;
        ++documented;
        EXPECT_EQ(encode(pair->first, pair->second), byte)
            << mnemonicName(pair->first) << " " << modeName(pair->second);
    }
    EXPECT_EQ(documented, 151u);
    EXPECT_FALSE(decode(0x02).has_value());
}

TEST(OpcodeTableTest, InverseBranches) {
    EXPECT_EQ(inverseBranch(Mnemonic::BEQ), Mnemonic::BNE);
    EXPECT_EQ(inverseBranch(Mnemonic::BNE), Mnemonic::BEQ);
    EXPECT_EQ(inverseBranch(Mnemonic::BCC), Mnemonic::BCS);
    EXPECT_EQ(inverseBranch(Mnemonic::BPL), Mnemonic::BMI);
    EXPECT_THROW(inverseBranch(Mnemonic::JMP), InvalidAddressMode);
}

TEST(OpcodeTableTest, SizesFollowAddressingMode) {
    EXPECT_EQ(instructionSize(AddressMode::Implied), 1u);
    EXPECT_EQ(instructionSize(AddressMode::Accumulator), 1u);
    EXPECT_EQ(instructionSize(AddressMode::Immediate), 2u);
    EXPECT_EQ(instructionSize(AddressMode::Relative), 2u);
    EXPECT_EQ(instructionSize(AddressMode::IndexedIndirect), 2u);
    EXPECT_EQ(instructionSize(AddressMode::AbsoluteY), 3u);
}

// ============================================================================
// Instruction encoding
// ============================================================================

TEST(InstructionTest, EncodesLiteralOperands) {
    LabelTable labels;
    expectBytes(Instruction::imm(Mnemonic::LDA, 0x42).encode(0x8000, labels), {0xA9, 0x42});
    expectBytes(Instruction::abs(Mnemonic::STA, 0x2006).encode(0x8000, labels), {0x8D, 0x06, 0x20});
    expectBytes(Instruction::zp(Mnemonic::STA, 0x22).encode(0x8000, labels), {0x85, 0x22});
    expectBytes(Instruction::indY(Mnemonic::LDA, 0x2A).encode(0x8000, labels), {0xB1, 0x2A});
    expectBytes(Instruction::implied(Mnemonic::RTS).encode(0x8000, labels), {0x60});
}

TEST(InstructionTest, EncodesLabelOperands) {
    LabelTable labels;
    labels.define("target", 0x85F1);

    expectBytes(Instruction::abs(Mnemonic::JSR, "target").encode(0x8000, labels), {0x20, 0xF1, 0x85});
    expectBytes(Instruction::abs(Mnemonic::LDA, "target", 2).encode(0x8000, labels), {0xAD, 0xF3, 0x85});
    expectBytes(Instruction::immLow(Mnemonic::LDA, "target").encode(0x8000, labels), {0xA9, 0xF1});
    expectBytes(Instruction::immHigh(Mnemonic::LDX, "target").encode(0x8000, labels), {0xA2, 0x85});
}

TEST(InstructionTest, EncodesRelativeBranches) {
    LabelTable labels;
    labels.define("back", 0x8000);
    labels.define("ahead", 0x8010);

    expectBytes(Instruction::branch(Mnemonic::BNE, "back").encode(0x8004, labels), {0xD0, 0xFA});
    expectBytes(Instruction::branch(Mnemonic::BEQ, "ahead").encode(0x8004, labels), {0xF0, 0x0A});
    expectBytes(Instruction::rel(Mnemonic::BCC, 3).encode(0x8000, labels), {0x90, 0x03});
}

TEST(InstructionTest, BranchOutOfRangeThrows) {
    LabelTable labels;
    labels.define("far", 0x8200);
    EXPECT_THROW(Instruction::branch(Mnemonic::BNE, "far").encode(0x8000, labels), BranchOutOfRange);
}

TEST(InstructionTest, UnknownLabelThrows) {
    LabelTable labels;
    EXPECT_THROW(Instruction::abs(Mnemonic::JMP, "nowhere").encode(0x8000, labels), UnresolvedLabel);
}

TEST(InstructionTest, InvalidModeThrowsOnEncode) {
    LabelTable labels;
    EXPECT_THROW(Instruction::imm(Mnemonic::STA, 0x00).encode(0x8000, labels), InvalidAddressMode);
}
