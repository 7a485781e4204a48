#include "opcodes.hpp"
#include "errors.hpp"
#include <array>
#include <string>

namespace mos6502 {

namespace {

struct Encoding {
    Mnemonic mnemonic;
    AddressMode mode;
    uint8_t opcode;
};

using M = Mnemonic;
using A = AddressMode;

constexpr Encoding ENCODINGS[] = {
    {M::ADC, A::Immediate, 0x69}, {M::ADC, A::ZeroPage, 0x65}, {M::ADC, A::ZeroPageX, 0x75},
    {M::ADC, A::Absolute, 0x6D}, {M::ADC, A::AbsoluteX, 0x7D}, {M::ADC, A::AbsoluteY, 0x79},
    {M::ADC, A::IndexedIndirect, 0x61}, {M::ADC, A::IndirectIndexed, 0x71},

    {M::AND, A::Immediate, 0x29}, {M::AND, A::ZeroPage, 0x25}, {M::AND, A::ZeroPageX, 0x35},
    {M::AND, A::Absolute, 0x2D}, {M::AND, A::AbsoluteX, 0x3D}, {M::AND, A::AbsoluteY, 0x39},
    {M::AND, A::IndexedIndirect, 0x21}, {M::AND, A::IndirectIndexed, 0x31},

    {M::ASL, A::Accumulator, 0x0A}, {M::ASL, A::ZeroPage, 0x06}, {M::ASL, A::ZeroPageX, 0x16},
    {M::ASL, A::Absolute, 0x0E}, {M::ASL, A::AbsoluteX, 0x1E},

    {M::BCC, A::Relative, 0x90}, {M::BCS, A::Relative, 0xB0}, {M::BEQ, A::Relative, 0xF0},
    {M::BMI, A::Relative, 0x30}, {M::BNE, A::Relative, 0xD0}, {M::BPL, A::Relative, 0x10},
    {M::BVC, A::Relative, 0x50}, {M::BVS, A::Relative, 0x70},

    {M::BIT, A::ZeroPage, 0x24}, {M::BIT, A::Absolute, 0x2C},

    {M::BRK, A::Implied, 0x00}, {M::CLC, A::Implied, 0x18}, {M::CLD, A::Implied, 0xD8},
    {M::CLI, A::Implied, 0x58}, {M::CLV, A::Implied, 0xB8},

    {M::CMP, A::Immediate, 0xC9}, {M::CMP, A::ZeroPage, 0xC5}, {M::CMP, A::ZeroPageX, 0xD5},
    {M::CMP, A::Absolute, 0xCD}, {M::CMP, A::AbsoluteX, 0xDD}, {M::CMP, A::AbsoluteY, 0xD9},
    {M::CMP, A::IndexedIndirect, 0xC1}, {M::CMP, A::IndirectIndexed, 0xD1},

    {M::CPX, A::Immediate, 0xE0}, {M::CPX, A::ZeroPage, 0xE4}, {M::CPX, A::Absolute, 0xEC},
    {M::CPY, A::Immediate, 0xC0}, {M::CPY, A::ZeroPage, 0xC4}, {M::CPY, A::Absolute, 0xCC},

    {M::DEC, A::ZeroPage, 0xC6}, {M::DEC, A::ZeroPageX, 0xD6}, {M::DEC, A::Absolute, 0xCE},
    {M::DEC, A::AbsoluteX, 0xDE},
    {M::DEX, A::Implied, 0xCA}, {M::DEY, A::Implied, 0x88},

    {M::EOR, A::Immediate, 0x49}, {M::EOR, A::ZeroPage, 0x45}, {M::EOR, A::ZeroPageX, 0x55},
    {M::EOR, A::Absolute, 0x4D}, {M::EOR, A::AbsoluteX, 0x5D}, {M::EOR, A::AbsoluteY, 0x59},
    {M::EOR, A::IndexedIndirect, 0x41}, {M::EOR, A::IndirectIndexed, 0x51},

    {M::INC, A::ZeroPage, 0xE6}, {M::INC, A::ZeroPageX, 0xF6}, {M::INC, A::Absolute, 0xEE},
    {M::INC, A::AbsoluteX, 0xFE},
    {M::INX, A::Implied, 0xE8}, {M::INY, A::Implied, 0xC8},

    {M::JMP, A::Absolute, 0x4C}, {M::JMP, A::Indirect, 0x6C},
    {M::JSR, A::Absolute, 0x20},

    {M::LDA, A::Immediate, 0xA9}, {M::LDA, A::ZeroPage, 0xA5}, {M::LDA, A::ZeroPageX, 0xB5},
    {M::LDA, A::Absolute, 0xAD}, {M::LDA, A::AbsoluteX, 0xBD}, {M::LDA, A::AbsoluteY, 0xB9},
    {M::LDA, A::IndexedIndirect, 0xA1}, {M::LDA, A::IndirectIndexed, 0xB1},

    {M::LDX, A::Immediate, 0xA2}, {M::LDX, A::ZeroPage, 0xA6}, {M::LDX, A::ZeroPageY, 0xB6},
    {M::LDX, A::Absolute, 0xAE}, {M::LDX, A::AbsoluteY, 0xBE},

    {M::LDY, A::Immediate, 0xA0}, {M::LDY, A::ZeroPage, 0xA4}, {M::LDY, A::ZeroPageX, 0xB4},
    {M::LDY, A::Absolute, 0xAC}, {M::LDY, A::AbsoluteX, 0xBC},

    {M::LSR, A::Accumulator, 0x4A}, {M::LSR, A::ZeroPage, 0x46}, {M::LSR, A::ZeroPageX, 0x56},
    {M::LSR, A::Absolute, 0x4E}, {M::LSR, A::AbsoluteX, 0x5E},

    {M::NOP, A::Implied, 0xEA},

    {M::ORA, A::Immediate, 0x09}, {M::ORA, A::ZeroPage, 0x05}, {M::ORA, A::ZeroPageX, 0x15},
    {M::ORA, A::Absolute, 0x0D}, {M::ORA, A::AbsoluteX, 0x1D}, {M::ORA, A::AbsoluteY, 0x19},
    {M::ORA, A::IndexedIndirect, 0x01}, {M::ORA, A::IndirectIndexed, 0x11},

    {M::PHA, A::Implied, 0x48}, {M::PHP, A::Implied, 0x08},
    {M::PLA, A::Implied, 0x68}, {M::PLP, A::Implied, 0x28},

    {M::ROL, A::Accumulator, 0x2A}, {M::ROL, A::ZeroPage, 0x26}, {M::ROL, A::ZeroPageX, 0x36},
    {M::ROL, A::Absolute, 0x2E}, {M::ROL, A::AbsoluteX, 0x3E},

    {M::ROR, A::Accumulator, 0x6A}, {M::ROR, A::ZeroPage, 0x66}, {M::ROR, A::ZeroPageX, 0x76},
    {M::ROR, A::Absolute, 0x6E}, {M::ROR, A::AbsoluteX, 0x7E},

    {M::RTI, A::Implied, 0x40}, {M::RTS, A::Implied, 0x60},

    {M::SBC, A::Immediate, 0xE9}, {M::SBC, A::ZeroPage, 0xE5}, {M::SBC, A::ZeroPageX, 0xF5},
    {M::SBC, A::Absolute, 0xED}, {M::SBC, A::AbsoluteX, 0xFD}, {M::SBC, A::AbsoluteY, 0xF9},
    {M::SBC, A::IndexedIndirect, 0xE1}, {M::SBC, A::IndirectIndexed, 0xF1},

    {M::SEC, A::Implied, 0x38}, {M::SED, A::Implied, 0xF8}, {M::SEI, A::Implied, 0x78},

    {M::STA, A::ZeroPage, 0x85}, {M::STA, A::ZeroPageX, 0x95}, {M::STA, A::Absolute, 0x8D},
    {M::STA, A::AbsoluteX, 0x9D}, {M::STA, A::AbsoluteY, 0x99},
    {M::STA, A::IndexedIndirect, 0x81}, {M::STA, A::IndirectIndexed, 0x91},

    {M::STX, A::ZeroPage, 0x86}, {M::STX, A::ZeroPageY, 0x96}, {M::STX, A::Absolute, 0x8E},
    {M::STY, A::ZeroPage, 0x84}, {M::STY, A::ZeroPageX, 0x94}, {M::STY, A::Absolute, 0x8C},

    {M::TAX, A::Implied, 0xAA}, {M::TAY, A::Implied, 0xA8}, {M::TSX, A::Implied, 0xBA},
    {M::TXA, A::Implied, 0x8A}, {M::TXS, A::Implied, 0x9A}, {M::TYA, A::Implied, 0x98},
};

constexpr std::string_view MNEMONIC_NAMES[MNEMONIC_COUNT] = {
    "ADC", "AND", "ASL", "BCC", "BCS", "BEQ", "BIT", "BMI", "BNE", "BPL", "BRK", "BVC", "BVS", "CLC",
    "CLD", "CLI", "CLV", "CMP", "CPX", "CPY", "DEC", "DEX", "DEY", "EOR", "INC", "INX", "INY", "JMP",
    "JSR", "LDA", "LDX", "LDY", "LSR", "NOP", "ORA", "PHA", "PHP", "PLA", "PLP", "ROL", "ROR", "RTI",
    "RTS", "SBC", "SEC", "SED", "SEI", "STA", "STX", "STY", "TAX", "TAY", "TSX", "TXA", "TXS", "TYA",
};

// Reverse lookup, built once from ENCODINGS.
struct DecodeTable {
    std::array<bool, 256> present{};
    std::array<Encoding, 256> entries{};

    DecodeTable() {
        for (const auto& e : ENCODINGS) {
            present[e.opcode] = true;
            entries[e.opcode] = e;
        }
    }
};

const DecodeTable& decodeTable() {
    static const DecodeTable table;
    return table;
}

} // namespace

std::optional<uint8_t> tryEncode(Mnemonic mnemonic, AddressMode mode) noexcept {
    for (const auto& e : ENCODINGS) {
        if (e.mnemonic == mnemonic && e.mode == mode) {
            return e.opcode;
        }
    }
    return std::nullopt;
}

uint8_t encode(Mnemonic mnemonic, AddressMode mode) {
    auto opcode = tryEncode(mnemonic, mode);
    if (!opcode) {
        throw InvalidAddressMode(std::string(mnemonicName(mnemonic)) + " " + std::string(modeName(mode)));
    }
    return *opcode;
}

bool isValid(Mnemonic mnemonic, AddressMode mode) noexcept {
    return tryEncode(mnemonic, mode).has_value();
}

std::optional<std::pair<Mnemonic, AddressMode>> decode(uint8_t opcode) noexcept {
    const auto& table = decodeTable();
    if (!table.present[opcode]) {
        return std::nullopt;
    }
    const auto& e = table.entries[opcode];
    return std::make_pair(e.mnemonic, e.mode);
}

Mnemonic inverseBranch(Mnemonic m) {
    switch (m) {
        case Mnemonic::BCC: return Mnemonic::BCS;
        case Mnemonic::BCS: return Mnemonic::BCC;
        case Mnemonic::BEQ: return Mnemonic::BNE;
        case Mnemonic::BNE: return Mnemonic::BEQ;
        case Mnemonic::BMI: return Mnemonic::BPL;
        case Mnemonic::BPL: return Mnemonic::BMI;
        case Mnemonic::BVC: return Mnemonic::BVS;
        case Mnemonic::BVS: return Mnemonic::BVC;
        default:
            throw InvalidAddressMode(std::string(mnemonicName(m)) + " is not a conditional branch");
    }
}

std::string_view mnemonicName(Mnemonic mnemonic) noexcept {
    return MNEMONIC_NAMES[static_cast<size_t>(mnemonic)];
}

std::string_view modeName(AddressMode mode) noexcept {
    switch (mode) {
        case AddressMode::Implied: return "implied";
        case AddressMode::Accumulator: return "accumulator";
        case AddressMode::Immediate: return "immediate";
        case AddressMode::ZeroPage: return "zeropage";
        case AddressMode::ZeroPageX: return "zeropage,X";
        case AddressMode::ZeroPageY: return "zeropage,Y";
        case AddressMode::Absolute: return "absolute";
        case AddressMode::AbsoluteX: return "absolute,X";
        case AddressMode::AbsoluteY: return "absolute,Y";
        case AddressMode::Indirect: return "indirect";
        case AddressMode::IndexedIndirect: return "(indirect,X)";
        case AddressMode::IndirectIndexed: return "(indirect),Y";
        case AddressMode::Relative: return "relative";
    }
    return "unknown";
}

} // namespace mos6502
