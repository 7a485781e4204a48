#pragma once

#include "opcodes.hpp"
#include "label_table.hpp"
#include <cstdint>
#include <string>
#include <vector>

using mos6502::Mnemonic;
using mos6502::AddressMode;

enum class OperandKind {
    None,
    Immediate,      // literal byte
    Absolute,       // literal byte or word address, width taken from the mode
    Label,          // address of a label
    LabelOffset,    // address of a label plus a constant
    Relative,       // branch displacement to a label
    RelativeByte,   // pre-computed branch displacement
    LowByte,        // #<label
    HighByte        // #>label
};

struct Operand {
    OperandKind kind = OperandKind::None;
    int32_t value = 0;
    std::string label;

    bool referencesLabel() const {
        return kind == OperandKind::Label || kind == OperandKind::LabelOffset ||
               kind == OperandKind::Relative || kind == OperandKind::LowByte ||
               kind == OperandKind::HighByte;
    }
};

// A single target machine instruction. Operands that name labels are
// resolved only when the instruction is encoded.
struct Instruction {
    Mnemonic mnemonic = Mnemonic::NOP;
    AddressMode mode = AddressMode::Implied;
    Operand operand;
    // Conditional branches emitted for user code may be rewritten into a
    // branch over a JMP when the target is out of range.
    bool longBranch = false;

    size_t size() const { return mos6502::instructionSize(mode); }

    /**
     * Encode at the given address, appending to @p out.
     * Label operands are looked up in @p labels using its current scope.
     */
    void encode(uint16_t address, const LabelTable& labels, std::vector<uint8_t>& out) const;

    std::vector<uint8_t> encode(uint16_t address, const LabelTable& labels) const {
        std::vector<uint8_t> out;
        encode(address, labels, out);
        return out;
    }

    std::string toString() const;

    // --- Factories ---

    static Instruction implied(Mnemonic m) { return make(m, AddressMode::Implied, {}); }
    static Instruction accumulator(Mnemonic m) { return make(m, AddressMode::Accumulator, {}); }
    static Instruction imm(Mnemonic m, uint8_t value) { return make(m, AddressMode::Immediate, {OperandKind::Immediate, value, {}}); }
    static Instruction immLow(Mnemonic m, const std::string& label) { return make(m, AddressMode::Immediate, {OperandKind::LowByte, 0, label}); }
    static Instruction immHigh(Mnemonic m, const std::string& label) { return make(m, AddressMode::Immediate, {OperandKind::HighByte, 0, label}); }
    static Instruction zp(Mnemonic m, uint8_t address) { return make(m, AddressMode::ZeroPage, {OperandKind::Absolute, address, {}}); }
    static Instruction zpX(Mnemonic m, uint8_t address) { return make(m, AddressMode::ZeroPageX, {OperandKind::Absolute, address, {}}); }
    static Instruction zpY(Mnemonic m, uint8_t address) { return make(m, AddressMode::ZeroPageY, {OperandKind::Absolute, address, {}}); }
    static Instruction abs(Mnemonic m, uint16_t address) { return make(m, AddressMode::Absolute, {OperandKind::Absolute, address, {}}); }
    static Instruction abs(Mnemonic m, const std::string& label) { return make(m, AddressMode::Absolute, {OperandKind::Label, 0, label}); }
    static Instruction abs(Mnemonic m, const std::string& label, int32_t offset) { return make(m, AddressMode::Absolute, {OperandKind::LabelOffset, offset, label}); }
    static Instruction absX(Mnemonic m, uint16_t address) { return make(m, AddressMode::AbsoluteX, {OperandKind::Absolute, address, {}}); }
    static Instruction absX(Mnemonic m, const std::string& label) { return make(m, AddressMode::AbsoluteX, {OperandKind::Label, 0, label}); }
    static Instruction absY(Mnemonic m, uint16_t address) { return make(m, AddressMode::AbsoluteY, {OperandKind::Absolute, address, {}}); }
    static Instruction absY(Mnemonic m, const std::string& label) { return make(m, AddressMode::AbsoluteY, {OperandKind::Label, 0, label}); }
    static Instruction indirect(Mnemonic m, uint16_t address) { return make(m, AddressMode::Indirect, {OperandKind::Absolute, address, {}}); }
    static Instruction indX(Mnemonic m, uint8_t address) { return make(m, AddressMode::IndexedIndirect, {OperandKind::Absolute, address, {}}); }
    static Instruction indY(Mnemonic m, uint8_t address) { return make(m, AddressMode::IndirectIndexed, {OperandKind::Absolute, address, {}}); }
    static Instruction rel(Mnemonic m, int8_t displacement) { return make(m, AddressMode::Relative, {OperandKind::RelativeByte, displacement, {}}); }
    static Instruction branch(Mnemonic m, const std::string& label) { return make(m, AddressMode::Relative, {OperandKind::Relative, 0, label}); }

private:
    static Instruction make(Mnemonic m, AddressMode mode, Operand operand) {
        Instruction i;
        i.mnemonic = m;
        i.mode = mode;
        i.operand = std::move(operand);
        return i;
    }
};
