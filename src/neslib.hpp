/**
 * @file neslib.hpp
 * @brief Hardware addresses, runtime variables and the callable library surface
 *
 * The zero page layout follows the neslib/cc65 runtime the subroutine
 * catalog was taken from. The call table lists every library routine user
 * code may call together with the shape of its arguments.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace nes {

// =============================================================================
// ZERO PAGE (runtime variables)
// =============================================================================

constexpr uint8_t ZP_START        = 0x00;
constexpr uint8_t STARTUP         = 0x01;   // frame counter
constexpr uint8_t NES_PRG_BANKS   = 0x02;
constexpr uint8_t VRAM_UPDATE     = 0x03;
constexpr uint8_t NAME_UPD_ADR    = 0x04;
constexpr uint8_t NAME_UPD_ENABLE = 0x06;
constexpr uint8_t PAL_UPDATE      = 0x07;
constexpr uint8_t PAL_BG_PTR      = 0x08;
constexpr uint8_t PAL_SPR_PTR     = 0x0A;
constexpr uint8_t SCROLL_X        = 0x0C;
constexpr uint8_t SCROLL_Y        = 0x0D;
constexpr uint8_t PRG_FILEOFFS    = 0x10;   // shadow of PPU_CTRL
constexpr uint8_t PPU_MASK_VAR    = 0x12;
constexpr uint8_t NMI_CALLBACK    = 0x14;   // JMP abs, patched at startup
constexpr uint8_t TEMP            = 0x17;
constexpr uint8_t sp              = 0x22;   // software stack pointer
constexpr uint8_t ptr1            = 0x2A;
constexpr uint8_t ptr2            = 0x2C;
constexpr uint8_t tmp1            = 0x32;

// =============================================================================
// RAM
// =============================================================================

constexpr uint16_t PAL_BUF    = 0x01C0;
constexpr uint16_t OAM_BUF    = 0x0200;
constexpr uint16_t CONDES     = 0x0300;
constexpr uint16_t LOCALS     = 0x0324;   // first user local

// =============================================================================
// PPU / APU registers
// =============================================================================

constexpr uint16_t PPU_CTRL     = 0x2000;
constexpr uint16_t PPU_MASK     = 0x2001;
constexpr uint16_t PPU_STATUS   = 0x2002;
constexpr uint16_t PPU_OAM_ADDR = 0x2003;
constexpr uint16_t PPU_OAM_DATA = 0x2004;
constexpr uint16_t PPU_SCROLL   = 0x2005;
constexpr uint16_t PPU_ADDR     = 0x2006;
constexpr uint16_t PPU_DATA     = 0x2007;
constexpr uint16_t DMC_FREQ     = 0x4010;
constexpr uint16_t PPU_OAM_DMA  = 0x4014;
constexpr uint16_t JOYPAD1      = 0x4016;
constexpr uint16_t PPU_FRAMECNT = 0x4017;

// =============================================================================
// NAMETABLES
// =============================================================================

constexpr uint16_t NAMETABLE_A = 0x2000;
constexpr uint16_t NAMETABLE_B = 0x2400;
constexpr uint16_t NAMETABLE_C = 0x2800;
constexpr uint16_t NAMETABLE_D = 0x2C00;

constexpr uint16_t ntadr(uint16_t base, uint8_t x, uint8_t y) noexcept {
    return static_cast<uint16_t>(base | (y << 5) | x);
}

/**
 * @brief Base address for a nametable macro name (NTADR_A..NTADR_D)
 */
std::optional<uint16_t> nametableBase(std::string_view macro) noexcept;

// =============================================================================
// BRIGHTNESS TABLES
// =============================================================================

extern const std::array<uint8_t, 9> PAL_BRIGHT_TABLE_L;
extern const std::array<uint8_t, 9> PAL_BRIGHT_TABLE_H;
extern const std::array<std::array<uint8_t, 16>, 8> PAL_BRIGHT_TABLES;   // 0..7
extern const std::array<uint8_t, 64> PAL_BRIGHT_TABLE_8;

// =============================================================================
// LIBRARY CALLS
// =============================================================================

enum class ArgKind : uint8_t {
    Byte,       // A
    Word,       // A/X
    Pointer,    // address of a data label in A/X
    Buffer      // address pushed, then length in A/X
};

struct LibraryCall {
    std::string_view name;
    uint8_t arity;
    std::array<ArgKind, 5> args;
    bool returnsValue;
};

/**
 * @brief Call shape for a library routine; nullptr if user code may not call it
 */
const LibraryCall* findLibraryCall(std::string_view name) noexcept;

std::string_view argKindName(ArgKind kind) noexcept;

} // namespace nes
