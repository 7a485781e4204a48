#include "assembly.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

using namespace cli;

namespace {

// ============================================================================
// ECMA-335 table schema (Partition II, 22)
// ============================================================================

enum class Col : uint8_t { U8, U16, U32, Str, Guid, Blob, Index, Coded };

enum CodedIndex : uint8_t {
    TypeDefOrRef, HasConstant, HasCustomAttribute, HasFieldMarshal, HasDeclSecurity,
    MemberRefParent, HasSemantics, MethodDefOrRef, MemberForwarded, Implementation,
    CustomAttributeType, ResolutionScope, TypeOrMethodDef, CodedIndexCount
};

struct Column {
    Col kind;
    uint8_t arg;    // table for Index, CodedIndex for Coded
};

struct CodedInfo {
    uint8_t tagBits;
    std::vector<uint8_t> tables;    // 0xFF marks an unused tag
};

constexpr uint8_t UNUSED = 0xFF;

const CodedInfo CODED[CodedIndexCount] = {
    {2, {TypeDef, TypeRef, TypeSpec}},
    {2, {Field, Param, Property}},
    {5, {MethodDef, Field, TypeRef, TypeDef, Param, InterfaceImpl, MemberRef, Module,
         DeclSecurity, Property, Event, StandAloneSig, ModuleRef, TypeSpec, Assembly,
         AssemblyRef, File, ExportedType, ManifestResource, GenericParam,
         GenericParamConstraint, MethodSpec}},
    {1, {Field, Param}},
    {2, {TypeDef, MethodDef, Assembly}},
    {3, {TypeDef, TypeRef, ModuleRef, MethodDef, TypeSpec}},
    {1, {Event, Property}},
    {1, {MethodDef, MemberRef}},
    {1, {Field, MethodDef}},
    {2, {File, AssemblyRef, ExportedType}},
    {3, {UNUSED, UNUSED, MethodDef, MemberRef, UNUSED}},
    {2, {Module, ModuleRef, AssemblyRef, TypeRef}},
    {1, {TypeDef, MethodDef}},
};

constexpr Column U1{Col::U8, 0};
constexpr Column U2{Col::U16, 0};
constexpr Column U4{Col::U32, 0};
constexpr Column S{Col::Str, 0};
constexpr Column G{Col::Guid, 0};
constexpr Column B{Col::Blob, 0};
constexpr Column idx(uint8_t table) { return {Col::Index, table}; }
constexpr Column coded(CodedIndex kind) { return {Col::Coded, kind}; }

const std::vector<Column> SCHEMA[TableCount] = {
    /* Module */                 {U2, S, G, G, G},
    /* TypeRef */                {coded(ResolutionScope), S, S},
    /* TypeDef */                {U4, S, S, coded(TypeDefOrRef), idx(Field), idx(MethodDef)},
    /* FieldPtr */               {idx(Field)},
    /* Field */                  {U2, S, B},
    /* MethodPtr */              {idx(MethodDef)},
    /* MethodDef */              {U4, U2, U2, S, B, idx(Param)},
    /* ParamPtr */               {idx(Param)},
    /* Param */                  {U2, U2, S},
    /* InterfaceImpl */          {idx(TypeDef), coded(TypeDefOrRef)},
    /* MemberRef */              {coded(MemberRefParent), S, B},
    /* Constant */               {U1, U1, coded(HasConstant), B},
    /* CustomAttribute */        {coded(HasCustomAttribute), coded(CustomAttributeType), B},
    /* FieldMarshal */           {coded(HasFieldMarshal), B},
    /* DeclSecurity */           {U2, coded(HasDeclSecurity), B},
    /* ClassLayout */            {U2, U4, idx(TypeDef)},
    /* FieldLayout */            {U4, idx(Field)},
    /* StandAloneSig */          {B},
    /* EventMap */               {idx(TypeDef), idx(Event)},
    /* EventPtr */               {idx(Event)},
    /* Event */                  {U2, S, coded(TypeDefOrRef)},
    /* PropertyMap */            {idx(TypeDef), idx(Property)},
    /* PropertyPtr */            {idx(Property)},
    /* Property */               {U2, S, B},
    /* MethodSemantics */        {U2, idx(MethodDef), coded(HasSemantics)},
    /* MethodImpl */             {idx(TypeDef), coded(MethodDefOrRef), coded(MethodDefOrRef)},
    /* ModuleRef */              {S},
    /* TypeSpec */               {B},
    /* ImplMap */                {U2, coded(MemberForwarded), S, idx(ModuleRef)},
    /* FieldRVA */               {U4, idx(Field)},
    /* EncLog */                 {U4, U4},
    /* EncMap */                 {U4},
    /* Assembly */               {U4, U2, U2, U2, U2, U4, B, S, S},
    /* AssemblyProcessor */      {U4},
    /* AssemblyOS */             {U4, U4, U4},
    /* AssemblyRef */            {U2, U2, U2, U2, U4, B, S, S, B},
    /* AssemblyRefProcessor */   {U4, idx(AssemblyRef)},
    /* AssemblyRefOS */          {U4, U4, U4, idx(AssemblyRef)},
    /* File */                   {U4, S, B},
    /* ExportedType */           {U4, U4, S, S, coded(Implementation)},
    /* ManifestResource */       {U4, U4, S, coded(Implementation)},
    /* NestedClass */            {idx(TypeDef), idx(TypeDef)},
    /* GenericParam */           {U2, U2, coded(TypeOrMethodDef), S},
    /* MethodSpec */             {coded(MethodDefOrRef), B},
    /* GenericParamConstraint */ {idx(GenericParam), coded(TypeDefOrRef)},
};

// Column indices used below.
constexpr size_t TYPEREF_NAME = 1, TYPEREF_NAMESPACE = 2;
constexpr size_t TYPEDEF_NAME = 1;
constexpr size_t FIELD_NAME = 1, FIELD_SIGNATURE = 2;
constexpr size_t METHOD_RVA = 0, METHOD_NAME = 3;
constexpr size_t MEMBERREF_PARENT = 0, MEMBERREF_NAME = 1;
constexpr size_t CLASSLAYOUT_SIZE = 1, CLASSLAYOUT_PARENT = 2;
constexpr size_t FIELDRVA_RVA = 0, FIELDRVA_FIELD = 1;
constexpr size_t METHODSPEC_METHOD = 0;

constexpr uint32_t PE_SIGNATURE = 0x00004550;       // "PE\0\0"
constexpr uint32_t METADATA_SIGNATURE = 0x424A5342; // "BSJB"
constexpr uint16_t PE32_MAGIC = 0x10B;
constexpr uint16_t PE32_PLUS_MAGIC = 0x20B;
constexpr size_t CLI_HEADER_DIRECTORY = 14;

constexpr uint8_t SIG_FIELD = 0x06;
constexpr uint8_t ELEMENT_TYPE_VALUETYPE = 0x11;

size_t align4(size_t value)
{
    return (value + 3) & ~static_cast<size_t>(3);
}

std::optional<size_t> primitiveSize(uint8_t elementType)
{
    switch (elementType) {
        case 0x02: case 0x04: case 0x05: return 1;      // bool, i1, u1
        case 0x03: case 0x06: case 0x07: return 2;      // char, i2, u2
        case 0x08: case 0x09: case 0x0C: return 4;      // i4, u4, r4
        case 0x0A: case 0x0B: case 0x0D: return 8;      // i8, u8, r8
        default: return std::nullopt;
    }
}

void appendUtf8(std::string& out, uint32_t cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string tokenHex(uint32_t token)
{
    return "0x" + UnsupportedInstruction::hex4(token >> 16) + UnsupportedInstruction::hex4(token & 0xFFFF);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

AssemblyImage::AssemblyImage(std::vector<uint8_t> image)
    : data(std::move(image))
{
    uint32_t entryToken = 0;
    const size_t metadata = parsePeHeaders(entryToken);
    parseMetadataRoot(metadata);
    findEntryMethod(entryToken);
    collectLibraryCalls();
}

AssemblyImage AssemblyImage::load(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DecodeError("could not open assembly: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return AssemblyImage(std::move(bytes));
}

// ============================================================================
// Raw access
// ============================================================================

uint8_t AssemblyImage::u8(size_t offset) const
{
    if (offset >= data.size()) {
        throw DecodeError("truncated assembly image");
    }
    return data[offset];
}

uint16_t AssemblyImage::u16(size_t offset) const
{
    return static_cast<uint16_t>(u8(offset) | (u8(offset + 1) << 8));
}

uint32_t AssemblyImage::u32(size_t offset) const
{
    return static_cast<uint32_t>(u16(offset)) | (static_cast<uint32_t>(u16(offset + 2)) << 16);
}

size_t AssemblyImage::rvaToOffset(uint32_t rva) const
{
    for (const auto& section : sections) {
        const uint32_t extent = std::max(section.virtualSize, section.rawSize);
        if (rva >= section.virtualAddress && rva - section.virtualAddress < extent) {
            return section.rawOffset + (rva - section.virtualAddress);
        }
    }
    throw DecodeError("RVA " + tokenHex(rva) + " is outside every section");
}

// ============================================================================
// PE / COFF
// ============================================================================

size_t AssemblyImage::parsePeHeaders(uint32_t& entryToken)
{
    if (data.size() < 0x40 || data[0] != 'M' || data[1] != 'Z') {
        throw DecodeError("not a PE image (missing MZ header)");
    }
    const size_t pe = u32(0x3C);
    if (u32(pe) != PE_SIGNATURE) {
        throw DecodeError("not a PE image (missing PE signature)");
    }

    const size_t coff = pe + 4;
    const uint16_t sectionCount = u16(coff + 2);
    const uint16_t optionalSize = u16(coff + 16);
    const size_t optional = coff + 20;

    size_t directories = 0;
    switch (u16(optional)) {
        case PE32_MAGIC: directories = optional + 96; break;
        case PE32_PLUS_MAGIC: directories = optional + 112; break;
        default: throw DecodeError("unknown optional header magic");
    }
    if (u32(directories - 4) <= CLI_HEADER_DIRECTORY) {
        throw DecodeError("not a .NET assembly (no CLI header directory)");
    }
    const uint32_t cliRva = u32(directories + CLI_HEADER_DIRECTORY * 8);
    if (cliRva == 0) {
        throw DecodeError("not a .NET assembly (empty CLI header directory)");
    }

    const size_t table = optional + optionalSize;
    for (uint16_t i = 0; i < sectionCount; ++i) {
        const size_t entry = table + i * 40;
        sections.push_back({u32(entry + 12), u32(entry + 8), u32(entry + 16), u32(entry + 20)});
    }

    const size_t cli = rvaToOffset(cliRva);
    entryToken = u32(cli + 20);
    return rvaToOffset(u32(cli + 8));
}

// ============================================================================
// Metadata root and streams
// ============================================================================

void AssemblyImage::parseMetadataRoot(size_t offset)
{
    if (u32(offset) != METADATA_SIGNATURE) {
        throw DecodeError("bad metadata signature");
    }
    size_t pos = offset + 16 + align4(u32(offset + 12));
    const uint16_t streamCount = u16(pos + 2);
    pos += 4;

    Stream tableStream;
    bool haveTables = false;
    for (uint16_t i = 0; i < streamCount; ++i) {
        Stream stream{offset + u32(pos), u32(pos + 4)};
        std::string name;
        size_t p = pos + 8;
        while (u8(p) != 0) {
            name += static_cast<char>(u8(p++));
        }
        pos = pos + 8 + align4(name.size() + 1);

        if (stream.offset + stream.size > data.size()) {
            throw DecodeError("metadata stream " + name + " runs past the end of the image");
        }
        if (name == "#~" || name == "#-") {
            tableStream = stream;
            haveTables = true;
        } else if (name == "#Strings") {
            strings = stream;
        } else if (name == "#US") {
            userStrings = stream;
        } else if (name == "#Blob") {
            blobs = stream;
        } else if (name == "#GUID") {
            guids = stream;
        }
    }
    if (!haveTables) {
        throw DecodeError("metadata has no table stream");
    }
    parseTables(tableStream.offset, tableStream.size);
}

void AssemblyImage::parseTables(size_t offset, size_t size)
{
    heapSizes = u8(offset + 6);
    const uint64_t valid = static_cast<uint64_t>(u32(offset + 8)) | (static_cast<uint64_t>(u32(offset + 12)) << 32);

    size_t pos = offset + 24;
    for (unsigned i = 0; i < 64; ++i) {
        if (!(valid & (uint64_t{1} << i))) {
            continue;
        }
        if (i >= TableCount) {
            throw DecodeError("unknown metadata table 0x" + UnsupportedInstruction::hex4(i));
        }
        tables[i].rows = u32(pos);
        pos += 4;
    }
    if (heapSizes & 0x40) {
        pos += 4;   // extra data word
    }

    tables[0].offset = pos;
    layoutTables();
    const TableInfo& last = tables[TableCount - 1];
    if (last.offset + last.rows * last.rowSize > offset + size) {
        throw DecodeError("metadata tables run past their stream");
    }
}

void AssemblyImage::layoutTables()
{
    auto indexSize = [&](uint8_t table) -> size_t {
        return tables[table].rows < 0x10000 ? 2 : 4;
    };
    auto codedSize = [&](uint8_t kind) -> size_t {
        const CodedInfo& info = CODED[kind];
        uint32_t largest = 0;
        for (uint8_t t : info.tables) {
            if (t != UNUSED) {
                largest = std::max(largest, tables[t].rows);
            }
        }
        return largest < (1u << (16 - info.tagBits)) ? 2 : 4;
    };

    size_t pos = tables[0].offset;
    for (size_t t = 0; t < TableCount; ++t) {
        TableInfo& info = tables[t];
        info.offset = pos;
        info.columnOffsets.clear();
        info.columnSizes.clear();
        size_t rowSize = 0;
        for (const Column& column : SCHEMA[t]) {
            size_t width = 0;
            switch (column.kind) {
                case Col::U8: width = 1; break;
                case Col::U16: width = 2; break;
                case Col::U32: width = 4; break;
                case Col::Str: width = (heapSizes & 0x01) ? 4 : 2; break;
                case Col::Guid: width = (heapSizes & 0x02) ? 4 : 2; break;
                case Col::Blob: width = (heapSizes & 0x04) ? 4 : 2; break;
                case Col::Index: width = indexSize(column.arg); break;
                case Col::Coded: width = codedSize(column.arg); break;
            }
            info.columnOffsets.push_back(rowSize);
            info.columnSizes.push_back(width);
            rowSize += width;
        }
        info.rowSize = rowSize;
        pos += static_cast<size_t>(info.rows) * rowSize;
    }
}

uint32_t AssemblyImage::cell(Table table, uint32_t row, size_t column) const
{
    const TableInfo& info = tables[table];
    if (row == 0 || row > info.rows) {
        throw DecodeError("row " + std::to_string(row) + " out of range in metadata table " + std::to_string(table));
    }
    const size_t at = info.offset + (row - 1) * info.rowSize + info.columnOffsets[column];
    switch (info.columnSizes[column]) {
        case 1: return u8(at);
        case 2: return u16(at);
        default: return u32(at);
    }
}

// ============================================================================
// Heaps
// ============================================================================

std::string AssemblyImage::stringAt(uint32_t index) const
{
    if (index >= strings.size) {
        throw DecodeError("string heap index out of range");
    }
    std::string result;
    for (size_t p = strings.offset + index; p < strings.offset + strings.size && data[p] != 0; ++p) {
        result += static_cast<char>(data[p]);
    }
    return result;
}

// ECMA-335 II.23.2 compressed unsigned integer.
uint32_t AssemblyImage::compressedUInt(size_t& offset) const
{
    const uint8_t first = u8(offset);
    if ((first & 0x80) == 0) {
        offset += 1;
        return first;
    }
    if ((first & 0xC0) == 0x80) {
        const uint32_t value = (static_cast<uint32_t>(first & 0x3F) << 8) | u8(offset + 1);
        offset += 2;
        return value;
    }
    const uint32_t value = (static_cast<uint32_t>(first & 0x1F) << 24) |
                           (static_cast<uint32_t>(u8(offset + 1)) << 16) |
                           (static_cast<uint32_t>(u8(offset + 2)) << 8) |
                           u8(offset + 3);
    offset += 4;
    return value;
}

std::vector<uint8_t> AssemblyImage::blobAt(uint32_t index) const
{
    if (index >= blobs.size) {
        throw DecodeError("blob heap index out of range");
    }
    size_t pos = blobs.offset + index;
    const uint32_t length = compressedUInt(pos);
    if (pos + length > blobs.offset + blobs.size) {
        throw DecodeError("blob runs past the blob heap");
    }
    return std::vector<uint8_t>(data.begin() + static_cast<std::ptrdiff_t>(pos),
                                data.begin() + static_cast<std::ptrdiff_t>(pos + length));
}

// ============================================================================
// Entry method
// ============================================================================

void AssemblyImage::findEntryMethod(uint32_t entryToken)
{
    uint32_t row = 0;
    if (tokenTable(entryToken) == MethodDef && tokenRow(entryToken) >= 1 &&
        tokenRow(entryToken) <= tables[MethodDef].rows) {
        row = tokenRow(entryToken);
    } else {
        for (uint32_t r = 1; r <= tables[MethodDef].rows && row == 0; ++r) {
            const std::string name = stringAt(cell(MethodDef, r, METHOD_NAME));
            if (name == "Main" || name == "<Main>$") {
                row = r;
            }
        }
    }
    if (row == 0) {
        throw DecodeError("assembly has no entry method");
    }
    entryMethod = stringAt(cell(MethodDef, row, METHOD_NAME));
    readMethodBody(row);
}

void AssemblyImage::readMethodBody(uint32_t row)
{
    const uint32_t rva = cell(MethodDef, row, METHOD_RVA);
    if (rva == 0) {
        throw DecodeError("entry method " + entryMethod + " has no body");
    }
    const size_t header = rvaToOffset(rva);
    const uint8_t first = u8(header);

    size_t code = 0;
    size_t size = 0;
    switch (first & 0x03) {
        case 0x02:      // tiny
            code = header + 1;
            size = first >> 2;
            break;
        case 0x03:      // fat
            code = header + static_cast<size_t>(u16(header) >> 12) * 4;
            size = u32(header + 4);
            break;
        default:
            throw DecodeError("bad method header for " + entryMethod);
    }
    if (code + size > data.size()) {
        throw DecodeError("method body of " + entryMethod + " runs past the end of the image");
    }
    body.assign(data.begin() + static_cast<std::ptrdiff_t>(code),
                data.begin() + static_cast<std::ptrdiff_t>(code + size));
}

void AssemblyImage::collectLibraryCalls()
{
    const CodedInfo& parentInfo = CODED[MemberRefParent];
    for (uint32_t row = 1; row <= tables[MemberRef].rows; ++row) {
        const uint32_t parent = cell(MemberRef, row, MEMBERREF_PARENT);
        const uint32_t tag = parent & ((1u << parentInfo.tagBits) - 1);
        const uint32_t parentRow = parent >> parentInfo.tagBits;
        if (tag >= parentInfo.tables.size() || parentInfo.tables[tag] != TypeRef) {
            continue;
        }
        if (stringAt(cell(TypeRef, parentRow, TYPEREF_NAME)) == LIBRARY_TYPE &&
            stringAt(cell(TypeRef, parentRow, TYPEREF_NAMESPACE)) == LIBRARY_NAMESPACE) {
            libraryCalls.insert(stringAt(cell(MemberRef, row, MEMBERREF_NAME)));
        }
    }
}

// ============================================================================
// MetadataResolver
// ============================================================================

std::optional<std::string> AssemblyImage::memberName(uint32_t token) const
{
    const uint32_t table = tokenTable(token);
    const uint32_t row = tokenRow(token);
    if (table >= TableCount || row == 0 || row > tables[table].rows) {
        return std::nullopt;
    }

    switch (table) {
        case TypeRef: return stringAt(cell(TypeRef, row, TYPEREF_NAME));
        case TypeDef: return stringAt(cell(TypeDef, row, TYPEDEF_NAME));
        case Field: return stringAt(cell(Field, row, FIELD_NAME));
        case MethodDef: return stringAt(cell(MethodDef, row, METHOD_NAME));
        case MemberRef: return stringAt(cell(MemberRef, row, MEMBERREF_NAME));
        case MethodSpec: {
            const uint32_t method = cell(MethodSpec, row, METHODSPEC_METHOD);
            const uint32_t target = (method & 1) ? MemberRef : MethodDef;
            return memberName((target << 24) | (method >> 1));
        }
        default:
            return std::nullopt;
    }
}

std::optional<std::string> AssemblyImage::userString(uint32_t token) const
{
    if (tokenTable(token) != USER_STRING_TOKEN || tokenRow(token) >= userStrings.size) {
        return std::nullopt;
    }
    size_t pos = userStrings.offset + tokenRow(token);
    const uint32_t length = compressedUInt(pos);
    if (pos + length > userStrings.offset + userStrings.size) {
        throw DecodeError("user string " + tokenHex(token) + " runs past the #US heap");
    }

    // UTF-16LE code units followed by one terminal flag byte.
    std::string text;
    const size_t units = length / 2;
    for (size_t i = 0; i < units; ++i) {
        uint32_t cp = u16(pos + 2 * i);
        if (cp >= 0xD800 && cp < 0xDC00 && i + 1 < units) {
            const uint32_t low = u16(pos + 2 * (i + 1));
            if (low >= 0xDC00 && low < 0xE000) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                ++i;
            }
        }
        appendUtf8(text, cp);
    }
    return text;
}

std::optional<std::vector<uint8_t>> AssemblyImage::fieldData(uint32_t token) const
{
    if (tokenTable(token) != Field) {
        return std::nullopt;
    }
    const uint32_t field = tokenRow(token);
    if (field == 0 || field > tables[Field].rows) {
        return std::nullopt;
    }

    for (uint32_t row = 1; row <= tables[FieldRVA].rows; ++row) {
        if (cell(FieldRVA, row, FIELDRVA_FIELD) != field) {
            continue;
        }
        const auto size = fieldSize(field);
        if (!size) {
            throw DecodeError("cannot size RVA field " + tokenHex(token));
        }
        const size_t offset = rvaToOffset(cell(FieldRVA, row, FIELDRVA_RVA));
        if (offset + *size > data.size()) {
            throw DecodeError("data of field " + tokenHex(token) + " runs past the end of the image");
        }
        return std::vector<uint8_t>(data.begin() + static_cast<std::ptrdiff_t>(offset),
                                    data.begin() + static_cast<std::ptrdiff_t>(offset + *size));
    }
    return std::nullopt;
}

/**
 * Size of a field's value from its signature: a primitive, or a value type
 * whose ClassLayout gives an explicit size (the compiler's
 * __StaticArrayInitTypeSize=N helpers).
 */
std::optional<size_t> AssemblyImage::fieldSize(uint32_t fieldRow) const
{
    const std::vector<uint8_t> signature = blobAt(cell(Field, fieldRow, FIELD_SIGNATURE));
    if (signature.size() < 2 || signature[0] != SIG_FIELD) {
        return std::nullopt;
    }
    if (signature[1] != ELEMENT_TYPE_VALUETYPE) {
        return primitiveSize(signature[1]);
    }

    // TypeDefOrRefOrSpecEncoded, at most 4 bytes.
    uint32_t encoded = 0;
    const uint8_t first = signature.size() > 2 ? signature[2] : 0;
    if ((first & 0x80) == 0) {
        encoded = first;
    } else if ((first & 0xC0) == 0x80 && signature.size() > 3) {
        encoded = (static_cast<uint32_t>(first & 0x3F) << 8) | signature[3];
    } else if (signature.size() > 5) {
        encoded = (static_cast<uint32_t>(first & 0x1F) << 24) | (static_cast<uint32_t>(signature[3]) << 16) |
                  (static_cast<uint32_t>(signature[4]) << 8) | signature[5];
    } else {
        return std::nullopt;
    }
    if ((encoded & 0x03) != 0) {
        return std::nullopt;    // only types defined in this assembly carry a layout
    }
    const uint32_t typeRow = encoded >> 2;
    for (uint32_t row = 1; row <= tables[ClassLayout].rows; ++row) {
        if (cell(ClassLayout, row, CLASSLAYOUT_PARENT) == typeRow) {
            return cell(ClassLayout, row, CLASSLAYOUT_SIZE);
        }
    }
    return std::nullopt;
}
