#include "instruction.hpp"
#include "errors.hpp"
#include <cstdio>

namespace {

std::string hexByte(unsigned value) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "$%02X", value & 0xFF);
    return buf;
}

std::string hexWord(unsigned value) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "$%04X", value & 0xFFFF);
    return buf;
}

} // namespace

void Instruction::encode(uint16_t address, const LabelTable& labels, std::vector<uint8_t>& out) const
{
    out.push_back(mos6502::encode(mnemonic, mode));

    const size_t operandBytes = size() - 1;
    if (operandBytes == 0) {
        return;
    }

    int32_t value = 0;
    switch (operand.kind) {
        case OperandKind::None:
            throw InvalidAddressMode(std::string(mos6502::mnemonicName(mnemonic)) + " " +
                                     std::string(mos6502::modeName(mode)) + " requires an operand");
        case OperandKind::Immediate:
        case OperandKind::Absolute:
        case OperandKind::RelativeByte:
            value = operand.value;
            break;
        case OperandKind::Label:
            value = labels.resolve(operand.label);
            break;
        case OperandKind::LabelOffset:
            value = labels.resolve(operand.label) + operand.value;
            break;
        case OperandKind::LowByte:
            value = labels.resolve(operand.label) & 0xFF;
            break;
        case OperandKind::HighByte:
            value = (labels.resolve(operand.label) >> 8) & 0xFF;
            break;
        case OperandKind::Relative: {
            int32_t target = labels.resolve(operand.label);
            value = target - (static_cast<int32_t>(address) + 2);
            if (value < -128 || value > 127) {
                throw BranchOutOfRange(operand.label, value);
            }
            break;
        }
    }

    if (operandBytes == 1) {
        // Zero page label operands must actually live in the zero page.
        if ((operand.kind == OperandKind::Label || operand.kind == OperandKind::LabelOffset) &&
            (value < 0 || value > 0xFF)) {
            throw InvalidAddressMode("label " + operand.label + " does not fit in one byte");
        }
        out.push_back(static_cast<uint8_t>(value & 0xFF));
    } else {
        out.push_back(static_cast<uint8_t>(value & 0xFF));
        out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    }
}

std::string Instruction::toString() const
{
    std::string text(mos6502::mnemonicName(mnemonic));

    std::string target;
    switch (operand.kind) {
        case OperandKind::None:
            break;
        case OperandKind::Immediate:
            target = hexByte(operand.value);
            break;
        case OperandKind::Absolute:
            target = size() == 3 ? hexWord(operand.value) : hexByte(operand.value);
            break;
        case OperandKind::Label:
        case OperandKind::Relative:
            target = operand.label;
            break;
        case OperandKind::LabelOffset:
            target = operand.label + (operand.value < 0 ? "" : "+") + std::to_string(operand.value);
            break;
        case OperandKind::LowByte:
            target = "<" + operand.label;
            break;
        case OperandKind::HighByte:
            target = ">" + operand.label;
            break;
        case OperandKind::RelativeByte:
            target = "*" + std::string(operand.value < 0 ? "" : "+") + std::to_string(operand.value + 2);
            break;
    }

    switch (mode) {
        case AddressMode::Implied:
            break;
        case AddressMode::Accumulator:
            text += " A";
            break;
        case AddressMode::Immediate:
            text += " #" + target;
            break;
        case AddressMode::ZeroPage:
        case AddressMode::Absolute:
        case AddressMode::Relative:
            text += " " + target;
            break;
        case AddressMode::ZeroPageX:
        case AddressMode::AbsoluteX:
            text += " " + target + ",X";
            break;
        case AddressMode::ZeroPageY:
        case AddressMode::AbsoluteY:
            text += " " + target + ",Y";
            break;
        case AddressMode::Indirect:
            text += " (" + target + ")";
            break;
        case AddressMode::IndexedIndirect:
            text += " (" + target + ",X)";
            break;
        case AddressMode::IndirectIndexed:
            text += " (" + target + "),Y";
            break;
    }
    return text;
}
