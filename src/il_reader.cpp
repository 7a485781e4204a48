#include "il_reader.hpp"
#include "errors.hpp"
#include <cstring>
#include <sstream>

namespace {

std::string tokenHex(uint32_t token) {
    return "0x" + UnsupportedInstruction::hex4(token >> 16) + UnsupportedInstruction::hex4(token & 0xFFFF);
}

} // namespace

// ============================================================================
// TokenTable
// ============================================================================

std::optional<std::string> TokenTable::memberName(uint32_t token) const
{
    auto it = names.find(token);
    if (it == names.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> TokenTable::userString(uint32_t token) const
{
    auto it = strings.find(token);
    if (it == strings.end()) return std::nullopt;
    return it->second;
}

std::optional<std::vector<uint8_t>> TokenTable::fieldData(uint32_t token) const
{
    auto it = data.find(token);
    if (it == data.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// ILInstruction
// ============================================================================

std::string ILInstruction::toString() const
{
    std::ostringstream out;
    out << "IL_" << UnsupportedInstruction::hex4(offset) << ": " << il::opName(opcode);
    switch (operandType) {
        case il::OperandType::None:
            break;
        case il::OperandType::ShortBrTarget:
        case il::OperandType::BrTarget:
            out << " IL_" << UnsupportedInstruction::hex4(branchTarget());
            break;
        case il::OperandType::String:
            out << " \"" << text.value_or("") << "\"";
            break;
        case il::OperandType::ShortR:
        case il::OperandType::R:
            out << " " << real.value_or(0.0);
            break;
        case il::OperandType::Switch:
            out << " (";
            for (size_t i = 0; i < switchTargets.size(); ++i) {
                out << (i ? ", " : "") << "IL_"
                    << UnsupportedInstruction::hex4(offset + size + switchTargets[i]);
            }
            out << ")";
            break;
        default:
            if (bytes) {
                out << " [" << bytes->size() << " bytes]";
            } else if (text) {
                out << " " << *text;
            } else if (integer) {
                out << " " << *integer;
            }
            break;
    }
    return out.str();
}

// ============================================================================
// ILReader
// ============================================================================

uint8_t ILReader::readU8(size_t opcodeOffset)
{
    if (pos + 1 > body.size()) {
        throw DecodeError("truncated operand at IL_" + UnsupportedInstruction::hex4(opcodeOffset));
    }
    return body[pos++];
}

uint16_t ILReader::readU16(size_t opcodeOffset)
{
    uint16_t lo = readU8(opcodeOffset);
    uint16_t hi = readU8(opcodeOffset);
    return static_cast<uint16_t>(lo | (hi << 8));
}

uint32_t ILReader::readU32(size_t opcodeOffset)
{
    uint32_t lo = readU16(opcodeOffset);
    uint32_t hi = readU16(opcodeOffset);
    return lo | (hi << 16);
}

uint64_t ILReader::readU64(size_t opcodeOffset)
{
    uint64_t lo = readU32(opcodeOffset);
    uint64_t hi = readU32(opcodeOffset);
    return lo | (hi << 32);
}

void ILReader::decodeToken(ILInstruction& instr)
{
    const uint32_t token = instr.token;
    const std::string where = " at IL_" + UnsupportedInstruction::hex4(instr.offset);

    switch (instr.operandType) {
        case il::OperandType::String: {
            auto value = resolver.userString(token);
            if (!value) {
                throw DecodeError("unresolvable string token " + tokenHex(token) + where);
            }
            instr.text = std::move(*value);
            return;
        }
        case il::OperandType::Sig:
            // Stand-alone signatures have no name; calli is rejected later.
            return;
        case il::OperandType::Field:
        case il::OperandType::Tok:
            instr.bytes = resolver.fieldData(token);
            [[fallthrough]];
        default: {
            auto name = resolver.memberName(token);
            if (!name && !instr.bytes) {
                throw DecodeError("unresolvable metadata token " + tokenHex(token) + where);
            }
            instr.text = std::move(name);
            return;
        }
    }
}

ILInstruction ILReader::next()
{
    ILInstruction instr;
    instr.offset = pos;

    uint16_t value = readU8(instr.offset);
    if (value == il::EXTENDED_PREFIX) {
        value = static_cast<uint16_t>(0xFE00 | readU8(instr.offset));
    }

    const il::OpcodeInfo* info = il::lookup(value);
    if (!info) {
        throw DecodeError("undefined opcode 0x" + UnsupportedInstruction::hex4(value) +
                          " at IL_" + UnsupportedInstruction::hex4(instr.offset));
    }
    instr.opcode = info->code;
    instr.operandType = info->operand;

    switch (info->operand) {
        case il::OperandType::None:
            break;
        case il::OperandType::ShortBrTarget:
        case il::OperandType::ShortI:
            instr.integer = static_cast<int8_t>(readU8(instr.offset));
            break;
        case il::OperandType::ShortVariable:
            instr.integer = readU8(instr.offset);
            break;
        case il::OperandType::Variable:
            instr.integer = readU16(instr.offset);
            break;
        case il::OperandType::BrTarget:
        case il::OperandType::I:
            instr.integer = static_cast<int32_t>(readU32(instr.offset));
            break;
        case il::OperandType::I8:
            instr.integer = static_cast<int64_t>(readU64(instr.offset));
            break;
        case il::OperandType::ShortR: {
            uint32_t raw = readU32(instr.offset);
            float f;
            std::memcpy(&f, &raw, sizeof(f));
            instr.real = f;
            break;
        }
        case il::OperandType::R: {
            uint64_t raw = readU64(instr.offset);
            double d;
            std::memcpy(&d, &raw, sizeof(d));
            instr.real = d;
            break;
        }
        case il::OperandType::Switch: {
            uint32_t count = readU32(instr.offset);
            if (static_cast<uint64_t>(count) * 4 > body.size() - pos) {
                throw DecodeError("truncated switch table at IL_" + UnsupportedInstruction::hex4(instr.offset));
            }
            instr.switchTargets.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                instr.switchTargets.push_back(static_cast<int32_t>(readU32(instr.offset)));
            }
            instr.integer = count;
            break;
        }
        default:
            instr.token = readU32(instr.offset);
            decodeToken(instr);
            break;
    }

    instr.size = pos - instr.offset;
    return instr;
}

std::vector<ILInstruction> ILReader::readAll()
{
    reset();
    std::vector<ILInstruction> result;
    while (!atEnd()) {
        result.push_back(next());
    }
    return result;
}
