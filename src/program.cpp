#include "program.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdio>
#include <set>
#include <sstream>
#include <stdexcept>

void Program::defineExternalLabel(const std::string& name, uint16_t address)
{
    externals[name] = address;
    resolved = false;
}

Block& Program::addBlock(Block block)
{
    blocks.push_back(std::move(block));
    resolved = false;
    return blocks.back();
}

Block& Program::insertBlock(size_t index, Block block)
{
    if (index > blocks.size()) {
        throw std::out_of_range("block index " + std::to_string(index) + " past end of program");
    }
    resolved = false;
    return *blocks.insert(blocks.begin() + static_cast<std::ptrdiff_t>(index), std::move(block));
}

void Program::addRawData(std::vector<uint8_t> bytes, const std::string& label)
{
    addBlock(Block::fromRawData(std::move(bytes), label));
}

bool Program::removeBlock(const std::string& label)
{
    auto it = std::find_if(blocks.begin(), blocks.end(),
                           [&](const Block& b) { return b.label() == label; });
    if (it == blocks.end()) {
        return false;
    }
    blocks.erase(it);
    resolved = false;
    return true;
}

void Program::moveBlock(size_t from, size_t to)
{
    if (from >= blocks.size() || to >= blocks.size()) {
        throw std::out_of_range("block index out of range");
    }
    Block moved = std::move(blocks[from]);
    blocks.erase(blocks.begin() + static_cast<std::ptrdiff_t>(from));
    blocks.insert(blocks.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));
    resolved = false;
}

Block* Program::findBlock(const std::string& label)
{
    for (auto& b : blocks) {
        if (b.label() == label) {
            return &b;
        }
    }
    return nullptr;
}

size_t Program::totalSize() const
{
    size_t total = 0;
    for (const auto& b : blocks) {
        total += b.size();
    }
    return total;
}

// ============================================================================
// Resolution
// ============================================================================

void Program::resolveAddresses()
{
    labels.clear();
    blockStarts.clear();
    for (const auto& [name, address] : externals) {
        labels.define(name, address);
    }

    uint32_t address = base;
    for (const auto& block : blocks) {
        if (address + block.size() > 0x10000) {
            throw RomOverflow("program does not fit below $FFFF");
        }
        blockStarts.push_back(static_cast<uint16_t>(address));
        const auto& scope = block.label();
        if (scope) {
            labels.define(*scope, static_cast<uint16_t>(address + block.labelOffset()));
        }

        if (block.isData()) {
            address += static_cast<uint32_t>(block.size());
            continue;
        }

        for (const auto& entry : block.instructions()) {
            for (const auto& l : entry.labels) {
                labels.define(LabelTable::qualify(l, scope), static_cast<uint16_t>(address));
            }
            address += static_cast<uint32_t>(entry.instruction.size());
        }
        for (const auto& l : block.trailingLabels()) {
            labels.define(LabelTable::qualify(l, scope), static_cast<uint16_t>(address));
        }
    }
    labels.setScope(std::nullopt);
    resolved = true;
}

size_t Program::relaxBranches()
{
    size_t rewritten = 0;
    for (;;) {
        resolveAddresses();

        size_t changed = 0;
        for (size_t bi = 0; bi < blocks.size(); ++bi) {
            Block& block = blocks[bi];
            if (block.isData()) {
                continue;
            }
            labels.setScope(block.label());

            // Collect first, rewrite back to front so earlier indices stay valid.
            std::vector<size_t> farBranches;
            uint32_t address = blockStarts[bi];
            for (size_t i = 0; i < block.count(); ++i) {
                const Instruction& instr = block[i];
                if (instr.operand.kind == OperandKind::Relative) {
                    int32_t target = labels.resolve(instr.operand.label);
                    int32_t displacement = target - static_cast<int32_t>(address + 2);
                    if (displacement < -128 || displacement > 127) {
                        if (!instr.longBranch) {
                            labels.setScope(std::nullopt);
                            throw BranchOutOfRange(instr.operand.label, displacement);
                        }
                        farBranches.push_back(i);
                    }
                }
                address += static_cast<uint32_t>(instr.size());
            }

            for (auto it = farBranches.rbegin(); it != farBranches.rend(); ++it) {
                const Instruction& far = block[*it];
                Instruction skip = Instruction::rel(mos6502::inverseBranch(far.mnemonic), 3);
                Instruction jump = Instruction::abs(Mnemonic::JMP, far.operand.label);
                block.replace(*it, {skip, jump});
            }
            changed += farBranches.size();
        }
        labels.setScope(std::nullopt);

        if (changed == 0) {
            break;
        }
        rewritten += changed;
    }
    return rewritten;
}

std::vector<std::string> Program::validate()
{
    ensureResolved();

    std::set<std::string> missing;
    for (const auto& block : blocks) {
        if (block.isData()) {
            continue;
        }
        labels.setScope(block.label());
        for (const auto& entry : block.instructions()) {
            const Operand& op = entry.instruction.operand;
            if (op.referencesLabel() && !labels.isDefined(op.label)) {
                missing.insert(LabelTable::qualify(op.label, block.label()));
            }
        }
    }
    labels.setScope(std::nullopt);
    return {missing.begin(), missing.end()};
}

// ============================================================================
// Output
// ============================================================================

std::vector<uint8_t> Program::toBytes()
{
    ensureResolved();

    std::vector<uint8_t> out;
    out.reserve(totalSize());
    for (size_t bi = 0; bi < blocks.size(); ++bi) {
        const Block& block = blocks[bi];
        if (block.isData()) {
            const auto& data = block.rawData();
            out.insert(out.end(), data.begin(), data.end());
            continue;
        }
        labels.setScope(block.label());
        uint32_t address = blockStarts[bi];
        try {
            for (const auto& entry : block.instructions()) {
                entry.instruction.encode(static_cast<uint16_t>(address), labels, out);
                address += static_cast<uint32_t>(entry.instruction.size());
            }
        } catch (...) {
            labels.setScope(std::nullopt);
            throw;
        }
    }
    labels.setScope(std::nullopt);
    return out;
}

std::string Program::disassemble()
{
    ensureResolved();

    std::ostringstream out;
    char addr[16];
    for (size_t bi = 0; bi < blocks.size(); ++bi) {
        const Block& block = blocks[bi];
        uint32_t address = blockStarts[bi];

        if (block.label()) {
            out << *block.label() << ":\n";
        }

        if (block.isData()) {
            const auto& data = block.rawData();
            for (size_t i = 0; i < data.size(); i += 16) {
                std::snprintf(addr, sizeof(addr), "$%04X", static_cast<unsigned>(address + i));
                out << addr << "  .byte ";
                for (size_t j = i; j < std::min(i + 16, data.size()); ++j) {
                    char byte[8];
                    std::snprintf(byte, sizeof(byte), "$%02X", data[j]);
                    out << (j == i ? "" : ",") << byte;
                }
                out << "\n";
            }
            continue;
        }

        for (const auto& entry : block.instructions()) {
            for (const auto& l : entry.labels) {
                out << l << ":\n";
            }
            std::snprintf(addr, sizeof(addr), "$%04X", static_cast<unsigned>(address));
            out << addr << "  " << entry.instruction.toString() << "\n";
            address += static_cast<uint32_t>(entry.instruction.size());
        }
        for (const auto& l : block.trailingLabels()) {
            out << l << ":\n";
        }
    }
    return out.str();
}

uint16_t Program::blockAddress(const std::string& label)
{
    ensureResolved();
    for (size_t bi = 0; bi < blocks.size(); ++bi) {
        if (blocks[bi].label() == label) {
            return blockStarts[bi];
        }
    }
    throw UnresolvedLabel(label);
}

uint16_t Program::labelAddress(const std::string& name)
{
    ensureResolved();
    return labels.resolve(name);
}

const LabelTable& Program::labelTable()
{
    ensureResolved();
    return labels;
}
