#pragma once

#include "instruction.hpp"
#include <optional>
#include <string>
#include <vector>

struct BlockEntry {
    Instruction instruction;
    std::vector<std::string> labels;   // labels bound to this instruction's address
};

/**
 * @brief A contiguous run of instructions, or of raw data bytes.
 *
 * Blocks are the unit of layout: a subroutine, a lookup table, or the
 * translated user program. The block label (if any) points at
 * labelOffset bytes past the block start so that a subroutine can carry a
 * short prefix before its entry point.
 */
class Block {
    std::optional<std::string> blockLabel;
    size_t entryOffset = 0;
    std::vector<BlockEntry> entries;
    std::vector<std::string> pending;          // labels waiting for the next instruction
    std::optional<std::vector<uint8_t>> data;

public:
    explicit Block(std::optional<std::string> label = std::nullopt, size_t labelOffset = 0)
        : blockLabel(std::move(label)), entryOffset(labelOffset) {}

    static Block fromRawData(std::vector<uint8_t> bytes, std::optional<std::string> label = std::nullopt);

    const std::optional<std::string>& label() const { return blockLabel; }
    size_t labelOffset() const { return entryOffset; }

    bool isData() const { return data.has_value(); }
    const std::vector<uint8_t>& rawData() const;

    /**
     * Append an instruction. @p label (and any pending labels) are bound to
     * the address of this instruction.
     */
    Block& emit(Instruction instruction, const std::string& label = {});

    // Bind a label to whatever instruction is emitted next, or to the end of
    // the block if nothing follows.
    void setNextLabel(const std::string& label);

    /**
     * Remove every instruction from @p index onward, re-pending their labels.
     */
    void truncate(size_t index);

    // Replace one instruction with a sequence; labels stay on the first.
    void replace(size_t index, const std::vector<Instruction>& replacement);

    size_t count() const { return entries.size(); }
    size_t size() const;
    size_t offsetAt(size_t index) const;

    const Instruction& operator[](size_t index) const { return entries[index].instruction; }
    Instruction& operator[](size_t index) { return entries[index].instruction; }

    const std::vector<BlockEntry>& instructions() const { return entries; }
    const std::vector<std::string>& trailingLabels() const { return pending; }

    const Instruction* last() const { return entries.empty() ? nullptr : &entries.back().instruction; }
};
