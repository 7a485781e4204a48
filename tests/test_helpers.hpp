#pragma once
#include <gtest/gtest.h>
#include "il_reader.hpp"
#include "program.hpp"
#include "rom_builder.hpp"
#include "translator.hpp"
#include <vector>
#include <optional>
#include <string>
#include <map>
#include <algorithm>
#include <sstream>

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Compare byte vectors with detailed error messages
 */
inline void expectBytes(const std::vector<uint8_t>& actual,
                        const std::vector<uint8_t>& expected,
                        const std::string& msg = "") {
    ASSERT_EQ(actual.size(), expected.size())
        << msg << " size mismatch: expected " << expected.size()
        << " bytes, got " << actual.size();
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(actual[i], expected[i])
            << msg << " byte mismatch at index " << i
            << ": expected 0x" << std::hex << static_cast<int>(expected[i])
            << ", got 0x" << static_cast<int>(actual[i]);
    }
}

/**
 * @brief Extract a range of bytes from a vector
 */
inline std::vector<uint8_t> extractBytes(const std::vector<uint8_t>& data,
                                         size_t start, size_t length) {
    if (start >= data.size()) return {};
    size_t end = std::min(start + length, data.size());
    return std::vector<uint8_t>(data.begin() + start, data.begin() + end);
}

/**
 * @brief Read a 16-bit little-endian word from a byte vector
 */
inline uint16_t readWord(const std::vector<uint8_t>& data, size_t offset) {
    if (offset + 1 >= data.size()) return 0;
    return static_cast<uint16_t>(data[offset]) |
           (static_cast<uint16_t>(data[offset + 1]) << 8);
}

// ============================================================================
// IL BODY BUILDER
// ============================================================================

/**
 * @brief Assembles a method body by hand, registering tokens as it goes.
 *
 * Call targets get MemberRef tokens (0x0A...), strings get #US tokens
 * (0x70...), ldtoken fields get Field tokens (0x04...).
 */
class ILBuilder {
    std::vector<uint8_t> code;
    TokenTable table;
    std::map<std::string, uint32_t> methodTokens;
    uint32_t nextMember = 1;
    uint32_t nextString = 1;
    uint32_t nextField = 1;

    void token(uint32_t value) {
        for (int i = 0; i < 4; ++i) code.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }

public:
    size_t offset() const { return code.size(); }
    const std::vector<uint8_t>& bytes() const { return code; }
    const TokenTable& tokens() const { return table; }

    ILBuilder& op(uint8_t opcode) { code.push_back(opcode); return *this; }
    ILBuilder& op2(uint8_t second) { code.push_back(0xFE); code.push_back(second); return *this; }

    ILBuilder& ldc(int32_t value) {
        if (value >= -1 && value <= 8) return op(static_cast<uint8_t>(0x16 + value));
        if (value >= -128 && value <= 127) {
            op(0x1F);
            code.push_back(static_cast<uint8_t>(value));
            return *this;
        }
        op(0x20);
        token(static_cast<uint32_t>(value));
        return *this;
    }

    ILBuilder& ldstr(const std::string& text) {
        uint32_t tok = 0x70000000 | nextString++;
        table.addUserString(tok, text);
        op(0x72);
        token(tok);
        return *this;
    }

    ILBuilder& call(const std::string& name) {
        auto it = methodTokens.find(name);
        uint32_t tok = 0;
        if (it == methodTokens.end()) {
            tok = 0x0A000000 | nextMember++;
            table.addMember(tok, name);
            methodTokens[name] = tok;
        } else {
            tok = it->second;
        }
        op(0x28);
        token(tok);
        return *this;
    }

    ILBuilder& newarrByte() {
        uint32_t tok = 0x01000000 | nextMember++;
        table.addMember(tok, "Byte");
        op(0x8D);
        token(tok);
        return *this;
    }

    ILBuilder& ldtoken(std::vector<uint8_t> data) {
        uint32_t tok = 0x04000000 | nextField++;
        table.addMember(tok, "__StaticArrayInit");
        table.addFieldData(tok, std::move(data));
        op(0xD0);
        token(tok);
        return *this;
    }

    ILBuilder& stloc(uint8_t index) { return index <= 3 ? op(static_cast<uint8_t>(0x0A + index)) : op(0x13).raw(index); }
    ILBuilder& ldloc(uint8_t index) { return index <= 3 ? op(static_cast<uint8_t>(0x06 + index)) : op(0x11).raw(index); }
    ILBuilder& raw(uint8_t value) { code.push_back(value); return *this; }

    // Short branch to an absolute body offset.
    ILBuilder& branchShort(uint8_t opcode, size_t target) {
        op(opcode);
        int64_t displacement = static_cast<int64_t>(target) - static_cast<int64_t>(code.size() + 1);
        code.push_back(static_cast<uint8_t>(static_cast<int8_t>(displacement)));
        return *this;
    }

    // Long (int32) branch to an absolute body offset.
    ILBuilder& branchLong(uint8_t opcode, size_t target) {
        op(opcode);
        int64_t displacement = static_cast<int64_t>(target) - static_cast<int64_t>(code.size() + 4);
        token(static_cast<uint32_t>(static_cast<int32_t>(displacement)));
        return *this;
    }

    std::vector<ILInstruction> decode() const {
        ILReader reader(code, table);
        return reader.readAll();
    }
};

namespace il_bytes {
    constexpr uint8_t NOP = 0x00;
    constexpr uint8_t DUP = 0x25;
    constexpr uint8_t POP = 0x26;
    constexpr uint8_t RET = 0x2A;
    constexpr uint8_t BR_S = 0x2B;
    constexpr uint8_t BRFALSE_S = 0x2C;
    constexpr uint8_t BRTRUE_S = 0x2D;
    constexpr uint8_t BEQ_S = 0x2E;
    constexpr uint8_t BGT_S = 0x30;
    constexpr uint8_t BLT_S = 0x32;
    constexpr uint8_t BNE_UN_S = 0x33;
    constexpr uint8_t BR = 0x38;
    constexpr uint8_t BLT_UN = 0x44;
    constexpr uint8_t ADD = 0x58;
    constexpr uint8_t SUB = 0x59;
    constexpr uint8_t MUL = 0x5A;
    constexpr uint8_t DIV = 0x5B;
    constexpr uint8_t DIV_UN = 0x5C;
    constexpr uint8_t REM = 0x5D;
    constexpr uint8_t REM_UN = 0x5E;
    constexpr uint8_t AND = 0x5F;
    constexpr uint8_t SHL = 0x62;
    constexpr uint8_t SHR_UN = 0x64;
    constexpr uint8_t CONV_U1 = 0xD2;
    constexpr uint8_t STELEM_I1 = 0x9C;
    constexpr uint8_t LDNULL = 0x14;
}

// ============================================================================
// BASE TEST FIXTURES
// ============================================================================

/**
 * @brief Exposes Program internals; Program befriends this class.
 */
class ProgramTestBase : public ::testing::Test {
protected:
    Program program{0x8000};

    const std::vector<Block>& getBlocks() const { return program.blocks; }
    const std::vector<uint16_t>& getBlockStarts() const { return program.blockStarts; }
    bool isResolved() const { return program.resolved; }

    // Assemble a single block of code and return its bytes.
    std::vector<uint8_t> encode(Block block) {
        program.addBlock(std::move(block));
        return program.toBytes();
    }
};

class TranslatorTestBase : public ::testing::Test {
protected:
    ILBuilder il;
    Translator translator;

    Translation translate() {
        return translator.translate(il.decode());
    }

    // User code placed at $8500 inside the full ROM layout.
    Program assemble(const Translation& translation) {
        return RomBuilder().assemble(translation);
    }

    std::vector<uint8_t> mainBytes(const Translation& translation) {
        Program resolved = assemble(translation);
        auto bytes = resolved.toBytes();
        size_t start = resolved.blockAddress("main") - resolved.baseAddress();
        return extractBytes(bytes, start, translation.code.size());
    }
};

/**
 * @brief The "hello" program: four palette entries, a string written at
 *        NTADR_A(2,2), rendering on, then an endless loop.
 */
inline void buildHelloProgram(ILBuilder& il) {
    il.ldc(0).ldc(0x02).call("pal_col")
      .ldc(1).ldc(0x14).call("pal_col")
      .ldc(2).ldc(0x20).call("pal_col")
      .ldc(3).ldc(0x30).call("pal_col")
      .ldc(2).ldc(2).call("NTADR_A").call("vram_adr")
      .ldstr("HELLO, .NET!").call("vram_write")
      .call("ppu_on_all");
    il.branchShort(il_bytes::BR_S, il.offset());
}

inline const std::vector<uint8_t> HELLO_MAIN = {
    0xA9, 0x00, 0x20, 0xA2, 0x85, 0xA9, 0x02, 0x20, 0x3E, 0x82,   // pal_col(0, 0x02)
    0xA9, 0x01, 0x20, 0xA2, 0x85, 0xA9, 0x14, 0x20, 0x3E, 0x82,   // pal_col(1, 0x14)
    0xA9, 0x02, 0x20, 0xA2, 0x85, 0xA9, 0x20, 0x20, 0x3E, 0x82,   // pal_col(2, 0x20)
    0xA9, 0x03, 0x20, 0xA2, 0x85, 0xA9, 0x30, 0x20, 0x3E, 0x82,   // pal_col(3, 0x30)
    0xA2, 0x20, 0xA9, 0x42, 0x20, 0xD4, 0x83,                     // vram_adr(NTADR_A(2,2))
    0xA9, 0xF1, 0xA2, 0x85, 0x20, 0xB8, 0x85,                     // &"HELLO, .NET!" -> pushax
    0xA2, 0x00, 0xA9, 0x0C, 0x20, 0x4F, 0x83,                     // vram_write(.., 12)
    0x20, 0x89, 0x82,                                             // ppu_on_all
    0x4C, 0x40, 0x85,                                             // while (true) ;
};
