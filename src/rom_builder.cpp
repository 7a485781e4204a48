#include "rom_builder.hpp"
#include "errors.hpp"
#include "subroutines.hpp"
#include <fstream>

void RomBuilder::log(const std::string& message) const
{
    if (options.log) {
        *options.log << message << "\n";
    }
}

Program RomBuilder::assemble(const Translation& translation) const
{
    const auto& catalog = SubroutineCatalog::standard();
    const std::set<std::string> included = catalog.closure(translation.calls);
    RuntimeParams params;
    params.localBytes = translation.localBytes;

    Program program;
    for (const Subroutine* routine : catalog.layout(Section::Startup, included)) {
        program.addBlock(routine->build(params));
    }
    program.addBlock(translation.code);
    for (const Subroutine* routine : catalog.layout(Section::Runtime, included)) {
        program.addBlock(routine->build(params));
    }
    for (const auto& array : translation.byteArrays) {
        program.addRawData(array.bytes, array.label);
    }
    for (const auto& text : translation.strings) {
        program.addRawData(text.bytes, text.label);
    }
    for (const Subroutine* routine : catalog.layout(Section::Trailer, included)) {
        program.addBlock(routine->build(params));
    }

    const size_t relaxed = program.relaxBranches();
    if (relaxed > 0) {
        log("Relaxed " + std::to_string(relaxed) + " long branch(es)");
    }

    const auto missing = program.validate();
    if (!missing.empty()) {
        throw UnresolvedLabel(missing.front());
    }
    log("Size of main: " + std::to_string(translation.code.size()) +
        ", locals: " + std::to_string(translation.localBytes));
    return program;
}

std::vector<uint8_t> RomBuilder::header(bool verticalMirroring)
{
    std::vector<uint8_t> bytes(ines::HEADER_SIZE, 0x00);
    bytes[0] = 'N';
    bytes[1] = 'E';
    bytes[2] = 'S';
    bytes[3] = 0x1A;
    bytes[4] = ines::PRG_BANKS;
    bytes[5] = ines::CHR_BANKS;
    bytes[6] = verticalMirroring ? ines::FLAG6_VERTICAL_MIRRORING : 0x00;
    return bytes;
}

std::vector<uint8_t> RomBuilder::build(const Translation& translation, const std::vector<uint8_t>& chr) const
{
    if (chr.size() > ines::CHR_BANK_SIZE) {
        throw RomOverflow("tile data is " + std::to_string(chr.size()) + " bytes, more than one 8 KiB CHR bank");
    }

    Program program = assemble(translation);
    const std::vector<uint8_t> code = program.toBytes();
    if (code.size() > ines::PRG_BANK_SIZE) {
        throw RomOverflow("program is " + std::to_string(code.size()) + " bytes, more than one 16 KiB PRG bank");
    }

    std::vector<uint8_t> rom = header(options.verticalMirroring);
    rom.reserve(ines::HEADER_SIZE + ines::PRG_BANKS * ines::PRG_BANK_SIZE + ines::CHR_BANK_SIZE);

    log("Writing PRG ROM (" + std::to_string(code.size()) + " bytes)...");
    rom.insert(rom.end(), code.begin(), code.end());
    rom.resize(ines::HEADER_SIZE + ines::PRG_BANK_SIZE, 0x00);

    // Second bank: empty apart from NMI, RESET and IRQ at its top.
    rom.resize(ines::HEADER_SIZE + 2 * ines::PRG_BANK_SIZE - ines::VECTORS_SIZE, 0x00);
    for (const char* vector : {"nmi", "_exit", "irq"}) {
        const uint16_t address = program.labelAddress(vector);
        rom.push_back(static_cast<uint8_t>(address & 0xFF));
        rom.push_back(static_cast<uint8_t>(address >> 8));
    }

    log("Writing CHR ROM...");
    rom.insert(rom.end(), chr.begin(), chr.end());
    rom.resize(ines::HEADER_SIZE + 2 * ines::PRG_BANK_SIZE + ines::CHR_BANK_SIZE, 0x00);

    log("ROM complete. Total size: " + std::to_string(rom.size()) + " bytes");
    return rom;
}

void RomBuilder::write(const std::string& path, const std::vector<uint8_t>& rom)
{
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw WriteError(path);
    }
    file.write(reinterpret_cast<const char*>(rom.data()), static_cast<std::streamsize>(rom.size()));
    file.close();
    if (!file) {
        throw WriteError(path);
    }
}
