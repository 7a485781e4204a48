/**
 * @file assembly_tests.cpp
 * @brief PE/COFF and metadata reading against a hand-built minimal assembly
 */

#include "test_helpers.hpp"
#include "assembly.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

namespace {

// Section .text: RVA 0x2000 mapped at file offset 0x200.
constexpr size_t fileOffset(uint32_t rva) { return rva - 0x2000 + 0x200; }

class ImageWriter {
    std::vector<uint8_t> bytes;

public:
    explicit ImageWriter(size_t size) : bytes(size, 0x00) {}

    void put8(size_t at, uint8_t value) { bytes[at] = value; }
    void put16(size_t at, uint16_t value) {
        put8(at, static_cast<uint8_t>(value));
        put8(at + 1, static_cast<uint8_t>(value >> 8));
    }
    void put32(size_t at, uint32_t value) {
        put16(at, static_cast<uint16_t>(value));
        put16(at + 2, static_cast<uint16_t>(value >> 16));
    }
    void put(size_t at, const std::vector<uint8_t>& data) {
        std::copy(data.begin(), data.end(), bytes.begin() + static_cast<std::ptrdiff_t>(at));
    }
    void putString(size_t at, const std::string& text) {
        put(at, std::vector<uint8_t>(text.begin(), text.end()));
    }

    std::vector<uint8_t> take() { return std::move(bytes); }
};

/**
 * @brief A PE32 image with one .text section holding a CLI header, the
 *        body of Main (call NES.NESLib::pal_col; ret), four bytes of RVA
 *        field data and a metadata root with #~, #Strings, #US and #Blob.
 */
std::vector<uint8_t> buildAssembly(uint32_t entryToken = 0x06000001)
{
    ImageWriter w(0x600);

    // DOS stub, PE signature, COFF header
    w.putString(0x00, "MZ");
    w.put32(0x3C, 0x40);
    w.putString(0x40, "PE");
    w.put16(0x44, 0x014C);          // i386
    w.put16(0x46, 1);               // one section
    w.put16(0x54, 0xE0);            // optional header size

    // Optional header with 16 data directories, CLI header in directory 14
    w.put16(0x58, 0x10B);
    w.put32(0xB4, 16);
    w.put32(0x128, 0x2000);
    w.put32(0x12C, 72);

    // Section table
    w.putString(0x138, ".text");
    w.put32(0x138 + 8, 0x1000);     // virtual size
    w.put32(0x138 + 12, 0x2000);    // virtual address
    w.put32(0x138 + 16, 0x400);     // raw size
    w.put32(0x138 + 20, 0x200);     // raw offset

    // CLI header
    const size_t cli = fileOffset(0x2000);
    w.put32(cli, 72);
    w.put32(cli + 8, 0x2100);
    w.put32(cli + 12, 0x100);
    w.put32(cli + 20, entryToken);

    // Tiny method body
    w.put(fileOffset(0x2048), {0x1A, 0x28, 0x01, 0x00, 0x00, 0x0A, 0x2A});

    // Field initial data
    w.put(fileOffset(0x2060), {0xDE, 0xAD, 0xBE, 0xEF});

    // Metadata root
    const size_t root = fileOffset(0x2100);
    w.putString(root, "BSJB");
    w.put16(root + 4, 1);
    w.put16(root + 6, 1);
    w.put32(root + 12, 12);
    w.putString(root + 16, "v4.0.30319");
    w.put16(root + 30, 4);          // stream count

    size_t header = root + 32;
    auto stream = [&](uint32_t offset, uint32_t size, const std::string& name, size_t padded) {
        w.put32(header, offset);
        w.put32(header + 4, size);
        w.putString(header + 8, name);
        header += 8 + padded;
    };
    stream(0x60, 84, "#~", 4);
    stream(0x100, 32, "#Strings", 12);
    stream(0x140, 8, "#US", 4);
    stream(0x160, 8, "#Blob", 8);

    // Table stream: TypeRef, Field, MethodDef, MemberRef, FieldRVA, one row each
    const size_t tables = root + 0x60;
    w.put8(tables + 4, 2);
    w.put32(tables + 8, 0x20000452);
    for (size_t i = 0; i < 5; ++i) {
        w.put32(tables + 24 + 4 * i, 1);
    }
    w.put(tables + 44, {
        0x00, 0x00, 0x01, 0x00, 0x08, 0x00,                             // TypeRef NES.NESLib
        0x16, 0x00, 0x19, 0x00, 0x05, 0x00,                             // Field data : int32
        0x48, 0x20, 0x00, 0x00, 0x00, 0x00, 0x16, 0x00, 0x0C, 0x00,     // MethodDef Main
        0x01, 0x00, 0x01, 0x00,
        0x09, 0x00, 0x11, 0x00, 0x01, 0x00,                             // MemberRef pal_col
        0x60, 0x20, 0x00, 0x00, 0x01, 0x00,                             // FieldRVA
    });

    // Heaps
    const std::string names("\0NESLib\0NES\0Main\0pal_col\0data\0", 30);
    w.putString(root + 0x100, names);
    w.put(root + 0x140, {0x00, 0x05, 'H', 0x00, 'I', 0x00, 0x00});
    w.put(root + 0x160, {0x00, 0x03, 0x00, 0x00, 0x01, 0x02, 0x06, 0x08});

    return w.take();
}

} // namespace

// ============================================================================
// Successful reads
// ============================================================================

TEST(AssemblyImageTest, FindsEntryMethodByToken) {
    AssemblyImage image(buildAssembly());
    EXPECT_EQ(image.entryName(), "Main");
    expectBytes(image.entryBody(), {0x28, 0x01, 0x00, 0x00, 0x0A, 0x2A});
}

TEST(AssemblyImageTest, FindsEntryMethodByName) {
    AssemblyImage image(buildAssembly(0));
    EXPECT_EQ(image.entryName(), "Main");
    EXPECT_EQ(image.entryBody().size(), 6u);
}

TEST(AssemblyImageTest, CollectsLibraryCalls) {
    AssemblyImage image(buildAssembly());
    EXPECT_EQ(image.usedMethods(), (std::set<std::string>{"pal_col"}));
}

TEST(AssemblyImageTest, ResolvesMemberNames) {
    AssemblyImage image(buildAssembly());
    EXPECT_EQ(image.memberName(0x0A000001).value_or(""), "pal_col");
    EXPECT_EQ(image.memberName(0x01000001).value_or(""), "NESLib");
    EXPECT_EQ(image.memberName(0x06000001).value_or(""), "Main");
    EXPECT_EQ(image.memberName(0x04000001).value_or(""), "data");
    EXPECT_FALSE(image.memberName(0x0A000002).has_value());
    EXPECT_FALSE(image.memberName(0x02000001).has_value());
}

TEST(AssemblyImageTest, DecodesUserStrings) {
    AssemblyImage image(buildAssembly());
    EXPECT_EQ(image.userString(0x70000001).value_or(""), "HI");
    EXPECT_FALSE(image.userString(0x70000100).has_value());
    EXPECT_FALSE(image.userString(0x0A000001).has_value());
}

TEST(AssemblyImageTest, ReadsFieldData) {
    AssemblyImage image(buildAssembly());
    auto data = image.fieldData(0x04000001);
    ASSERT_TRUE(data.has_value());
    expectBytes(*data, {0xDE, 0xAD, 0xBE, 0xEF});
    EXPECT_FALSE(image.fieldData(0x04000002).has_value());
}

TEST(AssemblyImageTest, EntryBodyDecodesAgainstImage) {
    AssemblyImage image(buildAssembly());
    ILReader reader(image.entryBody(), image);
    auto code = reader.readAll();
    ASSERT_EQ(code.size(), 2u);
    EXPECT_EQ(code[0].toString(), "IL_0000: call pal_col");
    EXPECT_EQ(code[1].opcode, il::Op::Ret);
}

// ============================================================================
// Malformed input
// ============================================================================

TEST(AssemblyImageTest, EmptyImageThrows) {
    EXPECT_THROW(AssemblyImage(std::vector<uint8_t>{}), DecodeError);
}

TEST(AssemblyImageTest, MissingMzThrows) {
    auto bytes = buildAssembly();
    bytes[0] = 'X';
    EXPECT_THROW(AssemblyImage(std::move(bytes)), DecodeError);
}

TEST(AssemblyImageTest, BadPeSignatureThrows) {
    auto bytes = buildAssembly();
    bytes[0x41] = 'X';
    EXPECT_THROW(AssemblyImage(std::move(bytes)), DecodeError);
}

TEST(AssemblyImageTest, BadMetadataSignatureThrows) {
    auto bytes = buildAssembly();
    bytes[fileOffset(0x2100)] = 'X';
    EXPECT_THROW(AssemblyImage(std::move(bytes)), DecodeError);
}

TEST(AssemblyImageTest, TruncatedImageThrows) {
    auto bytes = buildAssembly();
    bytes.resize(0x300);
    EXPECT_THROW(AssemblyImage(std::move(bytes)), DecodeError);
}

TEST(AssemblyImageTest, MissingFileThrows) {
    EXPECT_THROW(AssemblyImage::load("/nonexistent/program.dll"), DecodeError);
}
