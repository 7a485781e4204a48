/**
 * @file il_reader_tests.cpp
 * @brief Bytecode decoding: opcodes, operands and token resolution
 */

#include "test_helpers.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

using il::Op;
using il::OperandType;

// ============================================================================
// Opcode table
// ============================================================================

TEST(ILOpcodeTest, LookupSingleAndTwoByteOpcodes) {
    const il::OpcodeInfo* ldstr = il::lookup(0x72);
    ASSERT_NE(ldstr, nullptr);
    EXPECT_EQ(ldstr->code, Op::Ldstr);
    EXPECT_EQ(ldstr->operand, OperandType::String);

    const il::OpcodeInfo* ceq = il::lookup(0xFE01);
    ASSERT_NE(ceq, nullptr);
    EXPECT_EQ(ceq->name, "ceq");

    EXPECT_EQ(il::lookup(0x24), nullptr);
    EXPECT_EQ(il::lookup(0xFE08), nullptr);
}

TEST(ILOpcodeTest, OperandSizes) {
    EXPECT_EQ(il::operandSize(OperandType::None), 0u);
    EXPECT_EQ(il::operandSize(OperandType::ShortBrTarget), 1u);
    EXPECT_EQ(il::operandSize(OperandType::Variable), 2u);
    EXPECT_EQ(il::operandSize(OperandType::Method), 4u);
    EXPECT_EQ(il::operandSize(OperandType::I8), 8u);
}

TEST(ILOpcodeTest, BranchClassification) {
    EXPECT_TRUE(il::isConditionalBranch(Op::Brtrue_s));
    EXPECT_TRUE(il::isConditionalBranch(Op::Blt_un));
    EXPECT_FALSE(il::isConditionalBranch(Op::Br));
    EXPECT_TRUE(il::isUnconditionalBranch(Op::Br_s));
    EXPECT_TRUE(il::isUnconditionalBranch(Op::Leave));
    EXPECT_FALSE(il::isUnconditionalBranch(Op::Call));
}

// ============================================================================
// Decoding
// ============================================================================

TEST(ILReaderTest, DecodesConstants) {
    ILBuilder il;
    il.ldc(-1).ldc(5).ldc(-100).ldc(0x1234);
    auto code = il.decode();

    ASSERT_EQ(code.size(), 4u);
    EXPECT_EQ(code[0].opcode, Op::Ldc_i4_m1);
    EXPECT_EQ(code[1].opcode, Op::Ldc_i4_5);
    EXPECT_EQ(code[2].opcode, Op::Ldc_i4_s);
    EXPECT_EQ(code[2].integer.value(), -100);
    EXPECT_EQ(code[3].opcode, Op::Ldc_i4);
    EXPECT_EQ(code[3].integer.value(), 0x1234);

    EXPECT_EQ(code[2].offset, 2u);
    EXPECT_EQ(code[2].size, 2u);
    EXPECT_EQ(code[3].offset, 4u);
    EXPECT_EQ(code[3].size, 5u);
}

TEST(ILReaderTest, ResolvesTokens) {
    ILBuilder il;
    il.ldstr("HELLO").call("vram_write").newarrByte().ldtoken({1, 2, 3});
    auto code = il.decode();

    ASSERT_EQ(code.size(), 4u);
    EXPECT_EQ(code[0].text.value(), "HELLO");
    EXPECT_EQ(code[1].opcode, Op::Call);
    EXPECT_EQ(code[1].text.value(), "vram_write");
    EXPECT_EQ(code[1].token, 0x0A000001u);
    EXPECT_EQ(code[2].text.value(), "Byte");
    ASSERT_TRUE(code[3].bytes.has_value());
    EXPECT_EQ(*code[3].bytes, (std::vector<uint8_t>{1, 2, 3}));
}

TEST(ILReaderTest, BranchTargetsAreAbsolute) {
    ILBuilder il;
    il.op(il_bytes::NOP);
    il.branchShort(il_bytes::BR_S, 0);
    il.branchLong(il_bytes::BR, 0);
    auto code = il.decode();

    ASSERT_EQ(code.size(), 3u);
    EXPECT_EQ(code[1].integer.value(), -3);
    EXPECT_EQ(code[1].branchTarget(), 0u);
    EXPECT_EQ(code[2].opcode, Op::Br);
    EXPECT_EQ(code[2].branchTarget(), 0u);
    EXPECT_EQ(code[2].toString(), "IL_0003: br IL_0000");
}

TEST(ILReaderTest, DecodesTwoByteOpcodesAndLocals) {
    ILBuilder il;
    il.op2(0x01);                       // ceq
    il.op2(0x0E).raw(0x05).raw(0x01);   // stloc 0x0105
    il.stloc(7);
    auto code = il.decode();

    ASSERT_EQ(code.size(), 3u);
    EXPECT_EQ(code[0].opcode, Op::Ceq);
    EXPECT_EQ(code[0].size, 2u);
    EXPECT_EQ(code[1].opcode, Op::Stloc);
    EXPECT_EQ(code[1].integer.value(), 0x0105);
    EXPECT_EQ(code[2].opcode, Op::Stloc_s);
    EXPECT_EQ(code[2].integer.value(), 7);
}

TEST(ILReaderTest, DecodesSwitch) {
    ILBuilder il;
    il.op(0x45).raw(2).raw(0).raw(0).raw(0);
    il.raw(0x01).raw(0).raw(0).raw(0);
    il.raw(0xFF).raw(0xFF).raw(0xFF).raw(0xFF);
    il.op(il_bytes::RET);
    auto code = il.decode();

    ASSERT_EQ(code.size(), 2u);
    EXPECT_EQ(code[0].opcode, Op::Switch);
    ASSERT_EQ(code[0].switchTargets.size(), 2u);
    EXPECT_EQ(code[0].switchTargets[0], 1);
    EXPECT_EQ(code[0].switchTargets[1], -1);
    EXPECT_EQ(code[1].offset, 13u);
}

TEST(ILReaderTest, DecodingIsDeterministic) {
    ILBuilder il;
    buildHelloProgram(il);

    ILReader reader(il.bytes(), il.tokens());
    auto first = reader.readAll();
    auto second = reader.readAll();
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].toString(), second[i].toString());
        EXPECT_EQ(first[i].offset, second[i].offset);
    }

    reader.reset();
    EXPECT_FALSE(reader.atEnd());
    EXPECT_EQ(reader.next().opcode, Op::Ldc_i4_0);
}

// ============================================================================
// Errors
// ============================================================================

TEST(ILReaderTest, TruncatedOperandThrows) {
    TokenTable tokens;
    ILReader reader({0x20, 0x01, 0x02}, tokens);
    EXPECT_THROW(reader.readAll(), DecodeError);
}

TEST(ILReaderTest, UndefinedOpcodeThrows) {
    TokenTable tokens;
    ILReader reader({0x00, 0x24}, tokens);
    try {
        reader.readAll();
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_NE(std::string(e.what()).find("IL_0001"), std::string::npos) << e.what();
        EXPECT_EQ(e.category(), ErrorCategory::BadInput);
    }
}

TEST(ILReaderTest, UnresolvableTokenThrows) {
    TokenTable tokens;
    ILReader reader({0x28, 0x01, 0x00, 0x00, 0x0A}, tokens);
    EXPECT_THROW(reader.readAll(), DecodeError);

    ILReader strings({0x72, 0x01, 0x00, 0x00, 0x70}, tokens);
    EXPECT_THROW(strings.readAll(), DecodeError);
}
