#pragma once

#include "il_opcodes.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// One decoded bytecode instruction. Immutable once produced.
struct ILInstruction {
    il::Op opcode = il::Op::Nop;
    il::OperandType operandType = il::OperandType::None;
    size_t offset = 0;                          // position of the opcode in the body
    size_t size = 0;                            // opcode plus operand bytes

    std::optional<int64_t> integer;             // literal, local index or branch displacement
    std::optional<double> real;
    std::optional<std::string> text;            // user string, or resolved member/type name
    std::optional<std::vector<uint8_t>> bytes;  // initial data of an RVA field
    uint32_t token = 0;
    std::vector<int32_t> switchTargets;

    // Absolute offset a branch jumps to (relative to the next instruction).
    size_t branchTarget() const {
        return static_cast<size_t>(static_cast<int64_t>(offset + size) + integer.value_or(0));
    }

    std::string toString() const;
};

/**
 * @brief Resolves the metadata tokens embedded in a method body.
 *
 * Implemented by the assembly loader for real input and by TokenTable for
 * hand-built bodies.
 */
class MetadataResolver {
public:
    virtual ~MetadataResolver() = default;

    // Name of the method, field, type or member a token refers to.
    virtual std::optional<std::string> memberName(uint32_t token) const = 0;

    // UTF-8 text of a user string (#US) token.
    virtual std::optional<std::string> userString(uint32_t token) const = 0;

    // Initial value bytes of a field with an RVA, if the token names one.
    virtual std::optional<std::vector<uint8_t>> fieldData(uint32_t token) const = 0;
};

class TokenTable : public MetadataResolver {
    std::map<uint32_t, std::string> names;
    std::map<uint32_t, std::string> strings;
    std::map<uint32_t, std::vector<uint8_t>> data;

public:
    void addMember(uint32_t token, std::string name) { names[token] = std::move(name); }
    void addUserString(uint32_t token, std::string value) { strings[token] = std::move(value); }
    void addFieldData(uint32_t token, std::vector<uint8_t> bytes) { data[token] = std::move(bytes); }

    std::optional<std::string> memberName(uint32_t token) const override;
    std::optional<std::string> userString(uint32_t token) const override;
    std::optional<std::vector<uint8_t>> fieldData(uint32_t token) const override;
};

/**
 * @brief Decodes a method body into ILInstructions.
 *
 * Restartable: reset() rewinds to the first instruction. Throws DecodeError
 * for truncated operands, undefined opcodes and unresolvable tokens.
 */
class ILReader {
    std::vector<uint8_t> body;
    const MetadataResolver& resolver;
    size_t pos = 0;

public:
    ILReader(std::vector<uint8_t> methodBody, const MetadataResolver& metadata)
        : body(std::move(methodBody)), resolver(metadata) {}

    bool atEnd() const { return pos >= body.size(); }
    void reset() { pos = 0; }

    ILInstruction next();
    std::vector<ILInstruction> readAll();

private:
    uint8_t readU8(size_t opcodeOffset);
    uint16_t readU16(size_t opcodeOffset);
    uint32_t readU32(size_t opcodeOffset);
    uint64_t readU64(size_t opcodeOffset);
    void decodeToken(ILInstruction& instr);
};
