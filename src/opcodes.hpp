/**
 * @file opcodes.hpp
 * @brief MOS 6502 instruction set: mnemonics, addressing modes and encodings
 *
 * Only the documented NMOS opcodes are covered. Every (mnemonic, mode)
 * pair maps to exactly one opcode byte and every opcode byte decodes back
 * to exactly one pair.
 */

#ifndef NESIL_OPCODES_HPP
#define NESIL_OPCODES_HPP

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace mos6502 {

// =============================================================================
// MNEMONICS
// =============================================================================

enum class Mnemonic : uint8_t {
    ADC, AND, ASL, BCC, BCS, BEQ, BIT, BMI, BNE, BPL, BRK, BVC, BVS, CLC,
    CLD, CLI, CLV, CMP, CPX, CPY, DEC, DEX, DEY, EOR, INC, INX, INY, JMP,
    JSR, LDA, LDX, LDY, LSR, NOP, ORA, PHA, PHP, PLA, PLP, ROL, ROR, RTI,
    RTS, SBC, SEC, SED, SEI, STA, STX, STY, TAX, TAY, TSX, TXA, TXS, TYA,
};

constexpr size_t MNEMONIC_COUNT = 56;

// =============================================================================
// ADDRESSING MODES
// =============================================================================

enum class AddressMode : uint8_t {
    Implied,          // RTS
    Accumulator,      // ASL A
    Immediate,        // LDA #$10
    ZeroPage,         // LDA $10
    ZeroPageX,        // LDA $10,X
    ZeroPageY,        // LDX $10,Y
    Absolute,         // LDA $1234
    AbsoluteX,        // LDA $1234,X
    AbsoluteY,        // LDA $1234,Y
    Indirect,         // JMP ($1234)
    IndexedIndirect,  // LDA ($10,X)
    IndirectIndexed,  // LDA ($10),Y
    Relative,         // BNE label
};

/**
 * @brief Total instruction length in bytes for an addressing mode
 */
constexpr size_t instructionSize(AddressMode mode) noexcept {
    switch (mode) {
        case AddressMode::Implied:
        case AddressMode::Accumulator:
            return 1;
        case AddressMode::Absolute:
        case AddressMode::AbsoluteX:
        case AddressMode::AbsoluteY:
        case AddressMode::Indirect:
            return 3;
        default:
            return 2;
    }
}

/**
 * @brief True for the eight conditional branch mnemonics
 */
constexpr bool isBranch(Mnemonic m) noexcept {
    switch (m) {
        case Mnemonic::BCC: case Mnemonic::BCS: case Mnemonic::BEQ: case Mnemonic::BMI:
        case Mnemonic::BNE: case Mnemonic::BPL: case Mnemonic::BVC: case Mnemonic::BVS:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Branch that is taken exactly when @p m is not
 * @throws InvalidAddressMode if @p m is not a conditional branch
 */
Mnemonic inverseBranch(Mnemonic m);

/**
 * @brief Encode a (mnemonic, mode) pair
 * @throws InvalidAddressMode if the 6502 has no such instruction
 */
uint8_t encode(Mnemonic mnemonic, AddressMode mode);

std::optional<uint8_t> tryEncode(Mnemonic mnemonic, AddressMode mode) noexcept;

bool isValid(Mnemonic mnemonic, AddressMode mode) noexcept;

/**
 * @brief Decode an opcode byte; nullopt for undocumented opcodes
 */
std::optional<std::pair<Mnemonic, AddressMode>> decode(uint8_t opcode) noexcept;

std::string_view mnemonicName(Mnemonic mnemonic) noexcept;

std::string_view modeName(AddressMode mode) noexcept;

} // namespace mos6502

#endif // NESIL_OPCODES_HPP
