/**
 * @file rom_builder.hpp
 * @brief Lays out the cartridge program and writes the iNES image
 */

#pragma once

#include "program.hpp"
#include "translator.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ines {

constexpr size_t HEADER_SIZE   = 16;
constexpr size_t PRG_BANK_SIZE = 16384;
constexpr size_t CHR_BANK_SIZE = 8192;
constexpr size_t VECTORS_SIZE  = 6;
constexpr uint8_t PRG_BANKS    = 2;
constexpr uint8_t CHR_BANKS    = 1;
constexpr uint8_t FLAG6_VERTICAL_MIRRORING = 0x01;

} // namespace ines

struct BuildOptions {
    bool verticalMirroring = false;
    std::ostream* log = nullptr;        // progress messages, when set
};

/**
 * @brief Assembles a translated program with its runtime into a ROM image.
 *
 * Layout, starting at $8000: startup code and resident library, the user
 * program, the runtime helpers it needs, byte arrays, strings and the
 * destructor table. Bank 1 holds that code; bank 2 is empty except for the
 * interrupt vectors at its end.
 */
class RomBuilder {
    BuildOptions options;

public:
    explicit RomBuilder(BuildOptions buildOptions = {}) : options(buildOptions) {}

    /**
     * Build the block arena for @p translation, relax long branches and
     * resolve it.
     * @throws NotFound, UnresolvedLabel, DuplicateLabel, BranchOutOfRange
     */
    Program assemble(const Translation& translation) const;

    /**
     * Complete iNES image: header, two PRG banks, one CHR bank.
     * @throws RomOverflow if the code exceeds one PRG bank or @p chr exceeds
     *         one CHR bank
     */
    std::vector<uint8_t> build(const Translation& translation, const std::vector<uint8_t>& chr) const;

    static std::vector<uint8_t> header(bool verticalMirroring);

    // @throws WriteError if the file cannot be opened or fully written
    static void write(const std::string& path, const std::vector<uint8_t>& rom);

private:
    void log(const std::string& message) const;
};
