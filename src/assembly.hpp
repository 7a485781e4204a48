/**
 * @file assembly.hpp
 * @brief Reader for compiled .NET assemblies (PE/COFF + ECMA-335 metadata)
 *
 * Only what the compiler needs is decoded: the entry method's IL body, the
 * names behind its tokens, user strings, the initial data of RVA fields and
 * the NES library methods the program references.
 */

#pragma once

#include "il_reader.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cli {

enum Table : uint8_t {
    Module = 0x00, TypeRef = 0x01, TypeDef = 0x02, FieldPtr = 0x03, Field = 0x04,
    MethodPtr = 0x05, MethodDef = 0x06, ParamPtr = 0x07, Param = 0x08,
    InterfaceImpl = 0x09, MemberRef = 0x0A, Constant = 0x0B, CustomAttribute = 0x0C,
    FieldMarshal = 0x0D, DeclSecurity = 0x0E, ClassLayout = 0x0F, FieldLayout = 0x10,
    StandAloneSig = 0x11, EventMap = 0x12, EventPtr = 0x13, Event = 0x14,
    PropertyMap = 0x15, PropertyPtr = 0x16, Property = 0x17, MethodSemantics = 0x18,
    MethodImpl = 0x19, ModuleRef = 0x1A, TypeSpec = 0x1B, ImplMap = 0x1C, FieldRVA = 0x1D,
    EncLog = 0x1E, EncMap = 0x1F, Assembly = 0x20, AssemblyProcessor = 0x21,
    AssemblyOS = 0x22, AssemblyRef = 0x23, AssemblyRefProcessor = 0x24,
    AssemblyRefOS = 0x25, File = 0x26, ExportedType = 0x27, ManifestResource = 0x28,
    NestedClass = 0x29, GenericParam = 0x2A, MethodSpec = 0x2B, GenericParamConstraint = 0x2C,
    TableCount = 0x2D
};

constexpr uint8_t USER_STRING_TOKEN = 0x70;

constexpr uint32_t tokenTable(uint32_t token) { return token >> 24; }
constexpr uint32_t tokenRow(uint32_t token) { return token & 0x00FFFFFF; }

} // namespace cli

class AssemblyImage : public MetadataResolver {
public:
    // Namespace and type whose member references are library calls.
    static constexpr const char* LIBRARY_NAMESPACE = "NES";
    static constexpr const char* LIBRARY_TYPE = "NESLib";

    /**
     * @brief Parse a complete PE image.
     * @throws DecodeError for anything malformed or without an entry method
     */
    explicit AssemblyImage(std::vector<uint8_t> image);

    // Reads the file at @p path. Throws DecodeError if it cannot be opened.
    static AssemblyImage load(const std::string& path);

    const std::string& entryName() const { return entryMethod; }
    const std::vector<uint8_t>& entryBody() const { return body; }

    // Names of NES.NESLib methods referenced anywhere in the assembly.
    const std::set<std::string>& usedMethods() const { return libraryCalls; }

    std::optional<std::string> memberName(uint32_t token) const override;
    std::optional<std::string> userString(uint32_t token) const override;
    std::optional<std::vector<uint8_t>> fieldData(uint32_t token) const override;

private:
    struct Section {
        uint32_t virtualAddress;
        uint32_t virtualSize;
        uint32_t rawSize;
        uint32_t rawOffset;
    };

    struct Stream {
        size_t offset = 0;
        size_t size = 0;
    };

    struct TableInfo {
        uint32_t rows = 0;
        size_t offset = 0;                  // file offset of row 1
        size_t rowSize = 0;
        std::vector<size_t> columnOffsets;
        std::vector<size_t> columnSizes;
    };

    std::vector<uint8_t> data;
    std::vector<Section> sections;
    Stream strings;
    Stream userStrings;
    Stream blobs;
    Stream guids;
    uint8_t heapSizes = 0;
    std::array<TableInfo, cli::TableCount> tables{};

    std::string entryMethod;
    std::vector<uint8_t> body;
    std::set<std::string> libraryCalls;

    // --- Raw access ---
    uint8_t u8(size_t offset) const;
    uint16_t u16(size_t offset) const;
    uint32_t u32(size_t offset) const;
    size_t rvaToOffset(uint32_t rva) const;

    // --- Layers ---
    size_t parsePeHeaders(uint32_t& entryToken);
    void parseMetadataRoot(size_t offset);
    void parseTables(size_t offset, size_t size);
    void layoutTables();
    void findEntryMethod(uint32_t entryToken);
    void readMethodBody(uint32_t row);
    void collectLibraryCalls();

    // --- Heaps and rows ---
    uint32_t cell(cli::Table table, uint32_t row, size_t column) const;
    std::string stringAt(uint32_t index) const;
    std::vector<uint8_t> blobAt(uint32_t index) const;
    uint32_t compressedUInt(size_t& offset) const;
    std::optional<size_t> fieldSize(uint32_t fieldRow) const;
};
