#include "block.hpp"
#include <cstddef>
#include <iterator>
#include <stdexcept>

Block Block::fromRawData(std::vector<uint8_t> bytes, std::optional<std::string> label)
{
    Block block(std::move(label));
    block.data = std::move(bytes);
    return block;
}

const std::vector<uint8_t>& Block::rawData() const
{
    if (!data) {
        throw std::logic_error("block " + blockLabel.value_or("<anonymous>") + " holds instructions, not data");
    }
    return *data;
}

Block& Block::emit(Instruction instruction, const std::string& label)
{
    BlockEntry entry{std::move(instruction), std::move(pending)};
    pending.clear();
    if (!label.empty()) {
        entry.labels.push_back(label);
    }
    entries.push_back(std::move(entry));
    return *this;
}

void Block::setNextLabel(const std::string& label)
{
    pending.push_back(label);
}

void Block::truncate(size_t index)
{
    if (index >= entries.size()) {
        return;
    }
    std::vector<std::string> released;
    for (size_t i = index; i < entries.size(); ++i) {
        for (auto& l : entries[i].labels) {
            released.push_back(std::move(l));
        }
    }
    entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(index), entries.end());
    released.insert(released.end(), pending.begin(), pending.end());
    pending = std::move(released);
}

void Block::replace(size_t index, const std::vector<Instruction>& replacement)
{
    if (replacement.empty()) {
        throw std::invalid_argument("empty replacement sequence");
    }
    std::vector<BlockEntry> seq;
    seq.reserve(replacement.size());
    for (const auto& instr : replacement) {
        seq.push_back(BlockEntry{instr, {}});
    }
    seq.front().labels = std::move(entries[index].labels);

    auto pos = entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(index));
    entries.insert(pos, std::make_move_iterator(seq.begin()), std::make_move_iterator(seq.end()));
}

size_t Block::size() const
{
    if (data) {
        return data->size();
    }
    size_t total = 0;
    for (const auto& e : entries) {
        total += e.instruction.size();
    }
    return total;
}

size_t Block::offsetAt(size_t index) const
{
    size_t offset = 0;
    for (size_t i = 0; i < index && i < entries.size(); ++i) {
        offset += entries[i].instruction.size();
    }
    return offset;
}
