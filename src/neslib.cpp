#include "neslib.hpp"

namespace nes {

std::optional<uint16_t> nametableBase(std::string_view macro) noexcept {
    if (macro == "NTADR_A") return NAMETABLE_A;
    if (macro == "NTADR_B") return NAMETABLE_B;
    if (macro == "NTADR_C") return NAMETABLE_C;
    if (macro == "NTADR_D") return NAMETABLE_D;
    return std::nullopt;
}

const std::array<uint8_t, 9> PAL_BRIGHT_TABLE_L = {
    0x34, 0x44, 0x54, 0x64, 0x74, 0x84, 0x94, 0xA4, 0xB4,
};

const std::array<uint8_t, 9> PAL_BRIGHT_TABLE_H = {
    0x84, 0x84, 0x84, 0x84, 0x84, 0x84, 0x84, 0x84, 0x84,
};

const std::array<std::array<uint8_t, 16>, 8> PAL_BRIGHT_TABLES = {{
    {0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F},
    {0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F},
    {0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F},
    {0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F, 0x0F},
    {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0A, 0x0B, 0x0C, 0x0F, 0x0F, 0x0F},
    {0x10, 0x11, 0x12, 0x13, 0x14, 0x15, 0x16, 0x17, 0x18, 0x19, 0x1A, 0x1B, 0x1C, 0x00, 0x00, 0x00},
    {0x10, 0x21, 0x22, 0x23, 0x24, 0x25, 0x26, 0x27, 0x28, 0x29, 0x2A, 0x2B, 0x2C, 0x10, 0x10, 0x10},
    {0x30, 0x31, 0x32, 0x33, 0x34, 0x35, 0x36, 0x37, 0x38, 0x39, 0x3A, 0x3B, 0x3C, 0x20, 0x20, 0x20},
}};

const std::array<uint8_t, 64> PAL_BRIGHT_TABLE_8 = [] {
    std::array<uint8_t, 64> t{};
    t.fill(0x30);
    return t;
}();

namespace {

using K = ArgKind;

constexpr LibraryCall CALLS[] = {
    {"pal_all",          1, {K::Pointer}, false},
    {"pal_bg",           1, {K::Pointer}, false},
    {"pal_spr",          1, {K::Pointer}, false},
    {"pal_col",          2, {K::Byte, K::Byte}, false},
    {"pal_clear",        0, {}, false},
    {"pal_bright",       1, {K::Byte}, false},
    {"pal_spr_bright",   1, {K::Byte}, false},
    {"pal_bg_bright",    1, {K::Byte}, false},
    {"ppu_off",          0, {}, false},
    {"ppu_on_all",       0, {}, false},
    {"ppu_on_bg",        0, {}, false},
    {"ppu_on_spr",       0, {}, false},
    {"ppu_mask",         1, {K::Byte}, false},
    {"ppu_system",       0, {}, true},
    {"get_ppu_ctrl_var", 0, {}, true},
    {"set_ppu_ctrl_var", 1, {K::Byte}, false},
    {"oam_clear",        0, {}, false},
    {"oam_size",         1, {K::Byte}, false},
    {"oam_hide_rest",    1, {K::Byte}, false},
    {"oam_spr",          5, {K::Byte, K::Byte, K::Byte, K::Byte, K::Byte}, true},
    {"ppu_wait_frame",   0, {}, false},
    {"ppu_wait_nmi",     0, {}, false},
    {"scroll",           2, {K::Word, K::Word}, false},
    {"bank_spr",         1, {K::Byte}, false},
    {"bank_bg",          1, {K::Byte}, false},
    {"vram_write",       1, {K::Buffer}, false},
    {"set_vram_update",  1, {K::Pointer}, false},
    {"flush_vram_update", 1, {K::Pointer}, false},
    {"vram_adr",         1, {K::Word}, false},
    {"vram_put",         1, {K::Byte}, false},
    {"vram_fill",        2, {K::Byte, K::Word}, false},
    {"vram_inc",         1, {K::Byte}, false},
    {"nesclock",         0, {}, true},
    {"delay",            1, {K::Byte}, false},
    {"pad_poll",         1, {K::Byte}, true},
};

} // namespace

const LibraryCall* findLibraryCall(std::string_view name) noexcept {
    for (const auto& call : CALLS) {
        if (call.name == name) {
            return &call;
        }
    }
    return nullptr;
}

std::string_view argKindName(ArgKind kind) noexcept {
    switch (kind) {
        case ArgKind::Byte: return "byte";
        case ArgKind::Word: return "word";
        case ArgKind::Pointer: return "pointer";
        case ArgKind::Buffer: return "buffer";
    }
    return "?";
}

} // namespace nes
