#pragma once

#include "block.hpp"
#include "label_table.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Ordered arena of blocks loaded at a fixed base address.
 *
 * Every mutation (add, insert, remove, move) only invalidates addresses;
 * they are recomputed from scratch by resolveAddresses(), and bytes are
 * produced by a separate pass over the resolved arena.
 */
class Program {
    friend class ProgramTestBase;

    uint16_t base;
    std::vector<Block> blocks;
    std::vector<uint16_t> blockStarts;
    std::map<std::string, uint16_t> externals;
    LabelTable labels;
    bool resolved = false;

public:
    explicit Program(uint16_t baseAddress = 0x8000) : base(baseAddress) {}

    uint16_t baseAddress() const { return base; }

    // Labels bound to fixed addresses outside the arena (hardware registers,
    // code placed elsewhere). They are re-defined on every resolution.
    void defineExternalLabel(const std::string& name, uint16_t address);

    // The returned reference is invalidated by the next structural mutation.
    Block& addBlock(Block block);
    Block& insertBlock(size_t index, Block block);
    void addRawData(std::vector<uint8_t> bytes, const std::string& label);
    bool removeBlock(const std::string& label);
    void moveBlock(size_t from, size_t to);

    Block* findBlock(const std::string& label);
    const std::vector<Block>& allBlocks() const { return blocks; }
    size_t blockCount() const { return blocks.size(); }

    size_t totalSize() const;

    /**
     * Assign an address to every block, instruction and label.
     * @throws DuplicateLabel if a name is bound twice
     */
    void resolveAddresses();

    /**
     * Rewrite eligible out-of-range conditional branches as an inverted
     * branch over a JMP, repeating until nothing changes.
     * @return number of branches rewritten
     * @throws BranchOutOfRange for an out-of-range branch that is not eligible
     */
    size_t relaxBranches();

    /**
     * Names referenced by some instruction but never defined. Resolves
     * addresses first; does not throw for missing labels.
     */
    std::vector<std::string> validate();

    // Encode the resolved program. Throws UnresolvedLabel / BranchOutOfRange.
    std::vector<uint8_t> toBytes();

    std::string disassemble();

    uint16_t blockAddress(const std::string& label);
    uint16_t labelAddress(const std::string& name);
    const LabelTable& labelTable();

private:
    void ensureResolved() {
        if (!resolved) {
            resolveAddresses();
        }
    }
};
