#include "subroutines.hpp"
#include "errors.hpp"
#include "neslib.hpp"
#include <deque>

using namespace nes;

namespace {

using M = Mnemonic;
using I = Instruction;

// ============================================================================
// Startup (crt0)
// ============================================================================

Block exitBlock(const RuntimeParams&)
{
    Block block("_exit");
    block.emit(I::implied(M::SEI))
         .emit(I::imm(M::LDX, 0xFF))
         .emit(I::implied(M::TXS))
         .emit(I::implied(M::INX))
         .emit(I::abs(M::STX, PPU_MASK))
         .emit(I::abs(M::STX, DMC_FREQ))
         .emit(I::abs(M::STX, PPU_CTRL));
    return block;
}

// Two vblank waits before the PPU is usable.
Block initPpu(const RuntimeParams&)
{
    Block block("_initPPU");
    block.emit(I::abs(M::BIT, PPU_STATUS))
         .emit(I::abs(M::BIT, PPU_STATUS), "@1")
         .emit(I::branch(M::BPL, "@1"))
         .emit(I::abs(M::BIT, PPU_STATUS), "@2")
         .emit(I::branch(M::BPL, "@2"))
         .emit(I::imm(M::LDA, 0x40))
         .emit(I::abs(M::STA, PPU_FRAMECNT));
    return block;
}

Block clearPalette(const RuntimeParams&)
{
    Block block("_clearPalette");
    block.emit(I::imm(M::LDA, 0x3F))
         .emit(I::abs(M::STA, PPU_ADDR))
         .emit(I::abs(M::STX, PPU_ADDR))
         .emit(I::imm(M::LDA, 0x0F))
         .emit(I::imm(M::LDX, 0x20))
         .emit(I::abs(M::STA, PPU_DATA), "@1")
         .emit(I::implied(M::DEX))
         .emit(I::branch(M::BNE, "@1"));
    return block;
}

Block clearVram(const RuntimeParams&)
{
    Block block("_clearVRAM");
    block.emit(I::implied(M::TXA))
         .emit(I::imm(M::LDY, 0x20))
         .emit(I::abs(M::STY, PPU_ADDR))
         .emit(I::abs(M::STA, PPU_ADDR))
         .emit(I::imm(M::LDY, 0x10))
         .emit(I::abs(M::STA, PPU_DATA), "@1")
         .emit(I::implied(M::INX))
         .emit(I::branch(M::BNE, "@1"))
         .emit(I::implied(M::DEY))
         .emit(I::branch(M::BNE, "@1"));
    return block;
}

/**
 * Zero all 2K of RAM, reset palette and sprites, set up the C stack and
 * the NMI callback trampoline, then enable NMI.
 */
Block clearRam(const RuntimeParams&)
{
    Block block("clearRAM");
    block.emit(I::implied(M::TXA))
         .emit(I::zpX(M::STA, 0x00), "@loop");
    for (uint16_t page = 0x0100; page <= 0x0700; page += 0x0100) {
        block.emit(I::absX(M::STA, page));
    }
    block.emit(I::implied(M::INX))
         .emit(I::branch(M::BNE, "@loop"))
         .emit(I::imm(M::LDA, 0x04))
         .emit(I::abs(M::JSR, "pal_bright"))
         .emit(I::abs(M::JSR, "pal_clear"))
         .emit(I::abs(M::JSR, "oam_clear"))
         .emit(I::abs(M::JSR, "zerobss"))
         .emit(I::abs(M::JSR, "copydata"))
         .emit(I::imm(M::LDA, 0x00))
         .emit(I::zp(M::STA, sp))
         .emit(I::imm(M::LDA, 0x08))
         .emit(I::zp(M::STA, sp + 1))
         .emit(I::abs(M::JSR, "initlib"))
         .emit(I::imm(M::LDA, 0x4C))          // JMP abs
         .emit(I::zp(M::STA, NMI_CALLBACK))
         .emit(I::immLow(M::LDA, "nmi_default_callback"))
         .emit(I::zp(M::STA, NMI_CALLBACK + 1))
         .emit(I::immHigh(M::LDA, "nmi_default_callback"))
         .emit(I::zp(M::STA, NMI_CALLBACK + 2))
         .emit(I::imm(M::LDA, 0x80))
         .emit(I::zp(M::STA, PRG_FILEOFFS))
         .emit(I::abs(M::STA, PPU_CTRL))
         .emit(I::imm(M::LDA, 0x06))
         .emit(I::zp(M::STA, PPU_MASK_VAR));
    return block;
}

Block waitSync3(const RuntimeParams&)
{
    Block block("_waitSync3");
    block.emit(I::zp(M::LDA, STARTUP))
         .emit(I::zp(M::CMP, STARTUP), "@1")
         .emit(I::branch(M::BEQ, "@1"));
    return block;
}

// Busy-wait calibrated so that the vblank flag tells NTSC from PAL.
Block detectNtsc(const RuntimeParams&)
{
    Block block("detectNTSC");
    block.emit(I::imm(M::LDX, 0x34))
         .emit(I::imm(M::LDY, 0x18))
         .emit(I::implied(M::DEX), "@loop")
         .emit(I::branch(M::BNE, "@loop"))
         .emit(I::implied(M::DEY))
         .emit(I::branch(M::BNE, "@loop"))
         .emit(I::abs(M::LDA, PPU_STATUS))
         .emit(I::imm(M::AND, 0x80))
         .emit(I::zp(M::STA, ZP_START))
         .emit(I::abs(M::JSR, "ppu_off"))
         .emit(I::imm(M::LDA, 0x00))
         .emit(I::abs(M::STA, PPU_SCROLL))
         .emit(I::abs(M::STA, PPU_SCROLL))
         .emit(I::abs(M::STA, PPU_OAM_ADDR))
         .emit(I::abs(M::JMP, "main"));
    return block;
}

// ============================================================================
// NMI / IRQ
// ============================================================================

Block nmi(const RuntimeParams&)
{
    Block block("nmi");
    block.emit(I::implied(M::PHA))
         .emit(I::implied(M::TXA))
         .emit(I::implied(M::PHA))
         .emit(I::implied(M::TYA))
         .emit(I::implied(M::PHA))
         .emit(I::zp(M::LDA, PPU_MASK_VAR))
         .emit(I::imm(M::AND, 0x18))
         .emit(I::branch(M::BNE, "doUpdate"))
         .emit(I::abs(M::JMP, "skipAll"));
    return block;
}

Block doUpdate(const RuntimeParams&)
{
    Block block("doUpdate");
    block.emit(I::imm(M::LDA, OAM_BUF >> 8))
         .emit(I::abs(M::STA, PPU_OAM_DMA))
         .emit(I::zp(M::LDA, PAL_UPDATE))
         .emit(I::branch(M::BNE, "updPal"))
         .emit(I::abs(M::JMP, "updVRAM"));
    return block;
}

/**
 * Write all 32 palette entries through the brightness tables. Entry 0 is
 * mirrored into the first slot of every sub-palette.
 */
Block updPal(const RuntimeParams&)
{
    Block block("updPal");
    block.emit(I::imm(M::LDX, 0x00))
         .emit(I::zp(M::STX, PAL_UPDATE))
         .emit(I::imm(M::LDA, 0x3F))
         .emit(I::abs(M::STA, PPU_ADDR))
         .emit(I::abs(M::STX, PPU_ADDR))
         .emit(I::abs(M::LDY, PAL_BUF))
         .emit(I::indY(M::LDA, PAL_BG_PTR))
         .emit(I::abs(M::STA, PPU_DATA))
         .emit(I::implied(M::TAX));

    for (int i = 1; i <= 3; ++i) {
        block.emit(I::abs(M::LDY, static_cast<uint16_t>(PAL_BUF + i)))
             .emit(I::indY(M::LDA, PAL_BG_PTR))
             .emit(I::abs(M::STA, PPU_DATA));
    }
    for (int set = 1; set <= 3; ++set) {
        block.emit(I::abs(M::STX, PPU_DATA));
        for (int i = 1; i <= 3; ++i) {
            block.emit(I::abs(M::LDY, static_cast<uint16_t>(PAL_BUF + set * 4 + i)))
                 .emit(I::indY(M::LDA, PAL_BG_PTR))
                 .emit(I::abs(M::STA, PPU_DATA));
        }
    }
    for (int set = 1; set <= 4; ++set) {
        block.emit(I::abs(M::STX, PPU_DATA));
        for (int i = 1; i <= 3; ++i) {
            block.emit(I::abs(M::LDY, static_cast<uint16_t>(PAL_BUF + 12 + set * 4 + i)))
                 .emit(I::indY(M::LDA, PAL_SPR_PTR))
                 .emit(I::abs(M::STA, PPU_DATA));
        }
    }
    return block;
}

Block updVram(const RuntimeParams&)
{
    Block block("updVRAM");
    block.emit(I::zp(M::LDA, VRAM_UPDATE))
         .emit(I::branch(M::BEQ, "skipUpd"))
         .emit(I::imm(M::LDA, 0x00))
         .emit(I::zp(M::STA, VRAM_UPDATE))
         .emit(I::zp(M::LDA, NAME_UPD_ENABLE))
         .emit(I::branch(M::BEQ, "skipUpd"))
         .emit(I::abs(M::JSR, "flush_vram_update_nmi"));
    return block;
}

Block skipUpd(const RuntimeParams&)
{
    Block block("skipUpd");
    block.emit(I::imm(M::LDA, 0x00))
         .emit(I::abs(M::STA, PPU_ADDR))
         .emit(I::abs(M::STA, PPU_ADDR))
         .emit(I::zp(M::LDA, SCROLL_X))
         .emit(I::abs(M::STA, PPU_SCROLL))
         .emit(I::zp(M::LDA, SCROLL_Y))
         .emit(I::abs(M::STA, PPU_SCROLL))
         .emit(I::zp(M::LDA, PRG_FILEOFFS))
         .emit(I::abs(M::STA, PPU_CTRL));
    return block;
}

Block skipAll(const RuntimeParams&)
{
    Block block("skipAll");
    block.emit(I::zp(M::LDA, PPU_MASK_VAR))
         .emit(I::abs(M::STA, PPU_MASK))
         .emit(I::zp(M::INC, STARTUP))
         .emit(I::zp(M::INC, NES_PRG_BANKS))
         .emit(I::zp(M::LDA, NES_PRG_BANKS))
         .emit(I::imm(M::CMP, 0x06))
         .emit(I::branch(M::BNE, "skipNtsc"))
         .emit(I::imm(M::LDA, 0x00))
         .emit(I::zp(M::STA, NES_PRG_BANKS));
    return block;
}

Block skipNtsc(const RuntimeParams&)
{
    Block block("skipNtsc");
    block.emit(I::abs(M::JSR, static_cast<uint16_t>(NMI_CALLBACK)))
         .emit(I::implied(M::PLA))
         .emit(I::implied(M::TAY))
         .emit(I::implied(M::PLA))
         .emit(I::implied(M::TAX))
         .emit(I::implied(M::PLA))
         .emit(I::implied(M::RTI));
    return block;
}

Block irq(const RuntimeParams&)
{
    Block block("irq");
    block.emit(I::implied(M::PHA))
         .emit(I::implied(M::TXA))
         .emit(I::implied(M::PHA))
         .emit(I::implied(M::TYA))
         .emit(I::implied(M::PHA))
         .emit(I::imm(M::LDA, 0xFF))
         .emit(I::abs(M::JMP, "skipNtsc"));
    return block;
}

// The trailing RTS doubles as the default (empty) NMI callback.
Block nmiSetCallback(const RuntimeParams&)
{
    Block block("nmi_set_callback");
    block.emit(I::zp(M::STA, NMI_CALLBACK + 1))
         .emit(I::zp(M::STX, NMI_CALLBACK + 2))
         .emit(I::implied(M::RTS), "nmi_default_callback");
    return block;
}

// ============================================================================
// Palette
// ============================================================================

Block palAll(const RuntimeParams&)
{
    Block block("pal_all");
    block.emit(I::zp(M::STA, TEMP))
         .emit(I::zp(M::STX, TEMP + 1))
         .emit(I::imm(M::LDX, 0x00))
         .emit(I::imm(M::LDA, 0x20));
    return block;
}

Block palCopy(const RuntimeParams&)
{
    Block block("pal_copy");
    block.emit(I::zp(M::STA, 0x19))
         .emit(I::imm(M::LDY, 0x00))
         .emit(I::indY(M::LDA, TEMP), "@0")
         .emit(I::absX(M::STA, PAL_BUF))
         .emit(I::implied(M::INX))
         .emit(I::implied(M::INY))
         .emit(I::zp(M::DEC, 0x19))
         .emit(I::branch(M::BNE, "@0"))
         .emit(I::zp(M::INC, PAL_UPDATE))
         .emit(I::implied(M::RTS));
    return block;
}

Block palBg(const RuntimeParams&)
{
    Block block("pal_bg");
    block.emit(I::zp(M::STA, TEMP))
         .emit(I::zp(M::STX, TEMP + 1))
         .emit(I::imm(M::LDX, 0x00))
         .emit(I::imm(M::LDA, 0x10))
         .emit(I::branch(M::BNE, "pal_copy"));
    return block;
}

Block palSpr(const RuntimeParams&)
{
    Block block("pal_spr");
    block.emit(I::zp(M::STA, TEMP))
         .emit(I::zp(M::STX, TEMP + 1))
         .emit(I::imm(M::LDX, 0x10))
         .emit(I::implied(M::TXA))
         .emit(I::branch(M::BNE, "pal_copy"));
    return block;
}

Block palCol(const RuntimeParams&)
{
    Block block("pal_col");
    block.emit(I::zp(M::STA, TEMP))
         .emit(I::abs(M::JSR, "popa"))
         .emit(I::imm(M::AND, 0x1F))
         .emit(I::implied(M::TAX))
         .emit(I::zp(M::LDA, TEMP))
         .emit(I::absX(M::STA, PAL_BUF))
         .emit(I::zp(M::INC, PAL_UPDATE))
         .emit(I::implied(M::RTS));
    return block;
}

Block palClear(const RuntimeParams&)
{
    Block block("pal_clear");
    block.emit(I::imm(M::LDA, 0x0F))
         .emit(I::imm(M::LDX, 0x00))
         .emit(I::absX(M::STA, PAL_BUF), "@1")
         .emit(I::implied(M::INX))
         .emit(I::imm(M::CPX, 0x20))
         .emit(I::branch(M::BNE, "@1"))
         .emit(I::zp(M::STX, PAL_UPDATE))
         .emit(I::implied(M::RTS));
    return block;
}

Block palBrightPointer(const std::string& name, uint8_t pointer)
{
    Block block(name);
    block.emit(I::implied(M::TAX))
         .emit(I::absX(M::LDA, "palBrightTableL"))
         .emit(I::zp(M::STA, pointer))
         .emit(I::absX(M::LDA, "palBrightTableH"))
         .emit(I::zp(M::STA, pointer + 1))
         .emit(I::zp(M::STA, PAL_UPDATE))
         .emit(I::implied(M::RTS));
    return block;
}

Block palSprBright(const RuntimeParams&) { return palBrightPointer("pal_spr_bright", PAL_SPR_PTR); }
Block palBgBright(const RuntimeParams&) { return palBrightPointer("pal_bg_bright", PAL_BG_PTR); }

Block palBright(const RuntimeParams&)
{
    Block block("pal_bright");
    block.emit(I::abs(M::JSR, "pal_spr_bright"))
         .emit(I::implied(M::TXA))
         .emit(I::abs(M::JMP, "pal_bg_bright"));
    return block;
}

// ============================================================================
// PPU control
// ============================================================================

Block ppuOff(const RuntimeParams&)
{
    Block block("ppu_off");
    block.emit(I::zp(M::LDA, PPU_MASK_VAR))
         .emit(I::imm(M::AND, 0xE7))
         .emit(I::zp(M::STA, PPU_MASK_VAR))
         .emit(I::abs(M::JMP, "ppu_wait_nmi"));
    return block;
}

Block ppuOnAll(const RuntimeParams&)
{
    Block block("ppu_on_all");
    block.emit(I::zp(M::LDA, PPU_MASK_VAR))
         .emit(I::imm(M::ORA, 0x18));
    return block;
}

Block ppuOnOff(const RuntimeParams&)
{
    Block block("ppu_onoff");
    block.emit(I::zp(M::STA, PPU_MASK_VAR))
         .emit(I::abs(M::JMP, "ppu_wait_nmi"));
    return block;
}

Block ppuOnBits(const std::string& name, uint8_t bits)
{
    Block block(name);
    block.emit(I::zp(M::LDA, PPU_MASK_VAR))
         .emit(I::imm(M::ORA, bits))
         .emit(I::branch(M::BNE, "ppu_onoff"));
    return block;
}

Block ppuOnBg(const RuntimeParams&) { return ppuOnBits("ppu_on_bg", 0x08); }
Block ppuOnSpr(const RuntimeParams&) { return ppuOnBits("ppu_on_spr", 0x10); }

Block ppuMask(const RuntimeParams&)
{
    Block block("ppu_mask");
    block.emit(I::zp(M::STA, PPU_MASK_VAR))
         .emit(I::implied(M::RTS));
    return block;
}

// Load a zero page byte into A with X cleared.
Block readZeroPage(const std::string& name, uint8_t address)
{
    Block block(name);
    block.emit(I::zp(M::LDA, address))
         .emit(I::imm(M::LDX, 0x00))
         .emit(I::implied(M::RTS));
    return block;
}

Block ppuSystem(const RuntimeParams&) { return readZeroPage("ppu_system", ZP_START); }
Block getPpuCtrlVar(const RuntimeParams&) { return readZeroPage("get_ppu_ctrl_var", PRG_FILEOFFS); }

Block setPpuCtrlVar(const RuntimeParams&)
{
    Block block("set_ppu_ctrl_var");
    block.emit(I::zp(M::STA, PRG_FILEOFFS))
         .emit(I::implied(M::RTS));
    return block;
}

// ============================================================================
// OAM
// ============================================================================

// Store A into the Y byte of every sprite from X onward.
Block oamFill(const std::string& name, bool fromA, uint8_t value)
{
    Block block(name);
    if (fromA) {
        block.emit(I::implied(M::TAX));
    } else {
        block.emit(I::imm(M::LDX, 0x00));
    }
    block.emit(I::imm(M::LDA, value))
         .emit(I::absX(M::STA, OAM_BUF), "@1")
         .emit(I::implied(M::INX))
         .emit(I::implied(M::INX))
         .emit(I::implied(M::INX))
         .emit(I::implied(M::INX))
         .emit(I::branch(M::BNE, "@1"))
         .emit(I::implied(M::RTS));
    return block;
}

Block oamClear(const RuntimeParams&) { return oamFill("oam_clear", false, 0xFF); }
Block oamHideRest(const RuntimeParams&) { return oamFill("oam_hide_rest", true, 0xF0); }

Block oamSize(const RuntimeParams&)
{
    Block block("oam_size");
    for (int i = 0; i < 5; ++i) {
        block.emit(I::accumulator(M::ASL));
    }
    block.emit(I::imm(M::AND, 0x20))
         .emit(I::zp(M::STA, TEMP))
         .emit(I::zp(M::LDA, PRG_FILEOFFS))
         .emit(I::imm(M::AND, 0xDF))
         .emit(I::zp(M::ORA, TEMP))
         .emit(I::zp(M::STA, PRG_FILEOFFS))
         .emit(I::implied(M::RTS));
    return block;
}

/**
 * oam_spr(x, y, chr, attr, id): four bytes come from the C stack, the
 * sprite offset arrives in A. Returns the next offset.
 */
Block oamSpr(const RuntimeParams&)
{
    Block block("oam_spr");
    block.emit(I::implied(M::TAX))
         .emit(I::imm(M::LDY, 0x00))
         .emit(I::indY(M::LDA, sp))
         .emit(I::implied(M::INY))
         .emit(I::absX(M::STA, OAM_BUF + 2))
         .emit(I::indY(M::LDA, sp))
         .emit(I::implied(M::INY))
         .emit(I::absX(M::STA, OAM_BUF + 1))
         .emit(I::indY(M::LDA, sp))
         .emit(I::implied(M::INY))
         .emit(I::absX(M::STA, OAM_BUF + 0))
         .emit(I::indY(M::LDA, sp))
         .emit(I::absX(M::STA, OAM_BUF + 3))
         .emit(I::zp(M::LDA, sp))
         .emit(I::implied(M::CLC))
         .emit(I::imm(M::ADC, 0x04))
         .emit(I::zp(M::STA, sp))
         .emit(I::branch(M::BCC, "@1"))
         .emit(I::zp(M::INC, sp + 1))
         .emit(I::implied(M::TXA), "@1")
         .emit(I::implied(M::CLC))
         .emit(I::imm(M::ADC, 0x04))
         .emit(I::imm(M::LDX, 0x00))
         .emit(I::implied(M::RTS));
    return block;
}

// ============================================================================
// Frame wait
// ============================================================================

Block ppuWaitFrame(const RuntimeParams&)
{
    Block block("ppu_wait_frame");
    block.emit(I::imm(M::LDA, 0x01))
         .emit(I::zp(M::STA, VRAM_UPDATE))
         .emit(I::zp(M::LDA, STARTUP))
         .emit(I::zp(M::CMP, STARTUP), "@1")
         .emit(I::branch(M::BEQ, "@1"))
         .emit(I::zp(M::LDA, ZP_START))
         .emit(I::branch(M::BEQ, "@done"))
         .emit(I::zp(M::LDA, NES_PRG_BANKS), "@3")
         .emit(I::imm(M::CMP, 0x05))
         .emit(I::branch(M::BEQ, "@3"))
         .emit(I::implied(M::RTS), "@done");
    return block;
}

Block ppuWaitNmi(const RuntimeParams&)
{
    Block block("ppu_wait_nmi");
    block.emit(I::imm(M::LDA, 0x01))
         .emit(I::zp(M::STA, VRAM_UPDATE))
         .emit(I::zp(M::LDA, STARTUP))
         .emit(I::zp(M::CMP, STARTUP), "@1")
         .emit(I::branch(M::BEQ, "@1"))
         .emit(I::implied(M::RTS));
    return block;
}

// ============================================================================
// Scroll and CHR banks
// ============================================================================

/**
 * scroll(x, y): y arrives in A/X, x on the C stack. Y values of 240 and
 * above select the lower nametable.
 */
Block scroll(const RuntimeParams&)
{
    Block block("scroll");
    block.emit(I::zp(M::STA, TEMP))
         .emit(I::implied(M::TXA))
         .emit(I::branch(M::BNE, "@1"))
         .emit(I::zp(M::LDA, TEMP))
         .emit(I::imm(M::CMP, 0xF0))
         .emit(I::branch(M::BCS, "@1"))
         .emit(I::zp(M::STA, SCROLL_Y))
         .emit(I::imm(M::LDA, 0x00))
         .emit(I::zp(M::STA, TEMP))
         .emit(I::branch(M::BEQ, "@2"))
         .emit(I::implied(M::SEC), "@1")
         .emit(I::zp(M::LDA, TEMP))
         .emit(I::imm(M::SBC, 0xF0))
         .emit(I::zp(M::STA, SCROLL_Y))
         .emit(I::imm(M::LDA, 0x02))
         .emit(I::zp(M::STA, TEMP))
         .emit(I::abs(M::JSR, "popax"), "@2")
         .emit(I::zp(M::STA, SCROLL_X))
         .emit(I::implied(M::TXA))
         .emit(I::imm(M::AND, 0x01))
         .emit(I::zp(M::ORA, TEMP))
         .emit(I::zp(M::STA, TEMP))
         .emit(I::zp(M::LDA, PRG_FILEOFFS))
         .emit(I::imm(M::AND, 0xFC))
         .emit(I::zp(M::ORA, TEMP))
         .emit(I::zp(M::STA, PRG_FILEOFFS))
         .emit(I::implied(M::RTS));
    return block;
}

Block chrBank(const std::string& name, int shifts, uint8_t keepMask)
{
    Block block(name);
    block.emit(I::imm(M::AND, 0x01));
    for (int i = 0; i < shifts; ++i) {
        block.emit(I::accumulator(M::ASL));
    }
    block.emit(I::zp(M::STA, TEMP))
         .emit(I::zp(M::LDA, PRG_FILEOFFS))
         .emit(I::imm(M::AND, keepMask))
         .emit(I::zp(M::ORA, TEMP))
         .emit(I::zp(M::STA, PRG_FILEOFFS))
         .emit(I::implied(M::RTS));
    return block;
}

Block bankSpr(const RuntimeParams&) { return chrBank("bank_spr", 3, 0xF7); }
Block bankBg(const RuntimeParams&) { return chrBank("bank_bg", 4, 0xEF); }

// ============================================================================
// VRAM
// ============================================================================

// vram_write(src, size): size in A/X, src on the C stack.
Block vramWrite(const RuntimeParams&)
{
    Block block("vram_write");
    block.emit(I::zp(M::STA, TEMP))
         .emit(I::zp(M::STX, TEMP + 1))
         .emit(I::abs(M::JSR, "popax"))
         .emit(I::zp(M::STA, 0x19))
         .emit(I::zp(M::STX, 0x1A))
         .emit(I::imm(M::LDY, 0x00))
         .emit(I::indY(M::LDA, 0x19), "@1")
         .emit(I::abs(M::STA, PPU_DATA))
         .emit(I::zp(M::INC, 0x19))
         .emit(I::branch(M::BNE, "@2"))
         .emit(I::zp(M::INC, 0x1A))
         .emit(I::zp(M::LDA, TEMP), "@2")
         .emit(I::branch(M::BNE, "@3"))
         .emit(I::zp(M::DEC, TEMP + 1))
         .emit(I::zp(M::DEC, TEMP), "@3")
         .emit(I::zp(M::LDA, TEMP))
         .emit(I::zp(M::ORA, TEMP + 1))
         .emit(I::branch(M::BNE, "@1"))
         .emit(I::implied(M::RTS));
    return block;
}

Block setVramUpdate(const RuntimeParams&)
{
    Block block("set_vram_update");
    block.emit(I::zp(M::STA, NAME_UPD_ADR))
         .emit(I::zp(M::STX, NAME_UPD_ADR + 1))
         .emit(I::zp(M::ORA, NAME_UPD_ADR + 1))
         .emit(I::zp(M::STA, NAME_UPD_ENABLE))
         .emit(I::implied(M::RTS));
    return block;
}

/**
 * Walk an update buffer. Each record is either a single byte
 * (addr hi, addr lo, value) or a run (addr hi | flags, addr lo, length,
 * bytes...). $FF terminates. The NMI enters at flush_vram_update_nmi with
 * NAME_UPD_ADR already set.
 */
Block flushVramUpdate(const RuntimeParams&)
{
    Block block("flush_vram_update");
    block.emit(I::zp(M::STA, NAME_UPD_ADR))
         .emit(I::zp(M::STX, NAME_UPD_ADR + 1))
         .emit(I::imm(M::LDY, 0x00), "flush_vram_update_nmi");

    block.emit(I::indY(M::LDA, NAME_UPD_ADR), "@updName")
         .emit(I::implied(M::INY))
         .emit(I::imm(M::CMP, 0x40))
         .emit(I::branch(M::BCS, "@updNotSeq"))
         .emit(I::abs(M::STA, PPU_ADDR))
         .emit(I::indY(M::LDA, NAME_UPD_ADR))
         .emit(I::implied(M::INY))
         .emit(I::abs(M::STA, PPU_ADDR))
         .emit(I::indY(M::LDA, NAME_UPD_ADR))
         .emit(I::implied(M::INY))
         .emit(I::abs(M::STA, PPU_DATA))
         .emit(I::abs(M::JMP, "@updName"));

    block.emit(I::implied(M::TAX), "@updNotSeq")
         .emit(I::zp(M::LDA, PRG_FILEOFFS))
         .emit(I::imm(M::CPX, 0x80))
         .emit(I::branch(M::BCC, "@updHorzSeq"))
         .emit(I::imm(M::CPX, 0xFF))
         .emit(I::branch(M::BEQ, "@updDone"));

    block.emit(I::imm(M::ORA, 0x04), "@updVertSeq")
         .emit(I::branch(M::BNE, "@updNameSeq"))
         .emit(I::imm(M::AND, 0xFB), "@updHorzSeq");

    block.emit(I::abs(M::STA, PPU_CTRL), "@updNameSeq")
         .emit(I::implied(M::TXA))
         .emit(I::imm(M::AND, 0x3F))
         .emit(I::abs(M::STA, PPU_ADDR))
         .emit(I::indY(M::LDA, NAME_UPD_ADR))
         .emit(I::implied(M::INY))
         .emit(I::abs(M::STA, PPU_ADDR))
         .emit(I::indY(M::LDA, NAME_UPD_ADR))
         .emit(I::implied(M::INY))
         .emit(I::implied(M::TAX));

    block.emit(I::indY(M::LDA, NAME_UPD_ADR), "@updNameLoop")
         .emit(I::implied(M::INY))
         .emit(I::abs(M::STA, PPU_DATA))
         .emit(I::implied(M::DEX))
         .emit(I::branch(M::BNE, "@updNameLoop"))
         .emit(I::zp(M::LDA, PRG_FILEOFFS))
         .emit(I::abs(M::STA, PPU_CTRL))
         .emit(I::abs(M::JMP, "@updName"));

    block.emit(I::implied(M::RTS), "@updDone");
    return block;
}

Block vramAdr(const RuntimeParams&)
{
    Block block("vram_adr");
    block.emit(I::abs(M::STX, PPU_ADDR))
         .emit(I::abs(M::STA, PPU_ADDR))
         .emit(I::implied(M::RTS));
    return block;
}

Block vramPut(const RuntimeParams&)
{
    Block block("vram_put");
    block.emit(I::abs(M::STA, PPU_DATA))
         .emit(I::implied(M::RTS));
    return block;
}

// vram_fill(value, count): count in A/X, value on the C stack.
Block vramFill(const RuntimeParams&)
{
    Block block("vram_fill");
    block.emit(I::zp(M::STA, 0x19))
         .emit(I::zp(M::STX, 0x1A))
         .emit(I::abs(M::JSR, "popa"))
         .emit(I::zp(M::LDX, 0x1A))
         .emit(I::branch(M::BEQ, "@3"))
         .emit(I::imm(M::LDX, 0x00), "@1")
         .emit(I::abs(M::STA, PPU_DATA), "@2")
         .emit(I::implied(M::DEX))
         .emit(I::branch(M::BNE, "@2"))
         .emit(I::zp(M::DEC, 0x1A))
         .emit(I::branch(M::BNE, "@2"))
         .emit(I::zp(M::LDX, 0x19), "@3")
         .emit(I::branch(M::BEQ, "@4"))
         .emit(I::abs(M::STA, PPU_DATA), "@5")
         .emit(I::implied(M::DEX))
         .emit(I::branch(M::BNE, "@5"))
         .emit(I::implied(M::RTS), "@4");
    return block;
}

Block vramInc(const RuntimeParams&)
{
    Block block("vram_inc");
    block.emit(I::imm(M::ORA, 0x00))
         .emit(I::branch(M::BEQ, "@1"))
         .emit(I::imm(M::LDA, 0x04))
         .emit(I::zp(M::STA, TEMP), "@1")
         .emit(I::zp(M::LDA, PRG_FILEOFFS))
         .emit(I::imm(M::AND, 0xFB))
         .emit(I::zp(M::ORA, TEMP))
         .emit(I::zp(M::STA, PRG_FILEOFFS))
         .emit(I::abs(M::STA, PPU_CTRL))
         .emit(I::implied(M::RTS));
    return block;
}

// ============================================================================
// Timing
// ============================================================================

Block nesclock(const RuntimeParams&) { return readZeroPage("nesclock", STARTUP); }

Block delay(const RuntimeParams&)
{
    Block block("delay");
    block.emit(I::implied(M::TAX))
         .emit(I::abs(M::JSR, "ppu_wait_nmi"), "@1")
         .emit(I::implied(M::DEX))
         .emit(I::branch(M::BNE, "@1"))
         .emit(I::implied(M::RTS));
    return block;
}

// ============================================================================
// Brightness tables
// ============================================================================

Block tableBlock(const std::string& name, const uint8_t* bytes, size_t count)
{
    return Block::fromRawData(std::vector<uint8_t>(bytes, bytes + count), name);
}

Block brightTableL(const RuntimeParams&) { return tableBlock("palBrightTableL", PAL_BRIGHT_TABLE_L.data(), PAL_BRIGHT_TABLE_L.size()); }
Block brightTableH(const RuntimeParams&) { return tableBlock("palBrightTableH", PAL_BRIGHT_TABLE_H.data(), PAL_BRIGHT_TABLE_H.size()); }

template <size_t N>
Block brightTable(const RuntimeParams&)
{
    return tableBlock("palBrightTable" + std::to_string(N), PAL_BRIGHT_TABLES[N].data(), PAL_BRIGHT_TABLES[N].size());
}

Block brightTable8(const RuntimeParams&) { return tableBlock("palBrightTable8", PAL_BRIGHT_TABLE_8.data(), PAL_BRIGHT_TABLE_8.size()); }

// ============================================================================
// C runtime
// ============================================================================

// Constructor table is empty: Y = 0 skips the dispatch.
Block initlib(const RuntimeParams&)
{
    Block block("initlib");
    block.emit(I::imm(M::LDY, 0x00))
         .emit(I::branch(M::BEQ, "@done"))
         .emit(I::imm(M::LDA, 0x00))
         .emit(I::imm(M::LDX, 0x85))
         .emit(I::abs(M::JMP, CONDES))
         .emit(I::implied(M::RTS), "@done");
    return block;
}

Block donelib(const RuntimeParams&)
{
    Block block("donelib");
    block.emit(I::imm(M::LDY, 0x00))
         .emit(I::branch(M::BEQ, "@done"))
         .emit(I::immLow(M::LDA, "__DESTRUCTOR_TABLE__"))
         .emit(I::immHigh(M::LDX, "__DESTRUCTOR_TABLE__"))
         .emit(I::abs(M::JMP, CONDES))
         .emit(I::implied(M::RTS), "@done");
    return block;
}

Block copydata(const RuntimeParams&)
{
    Block block("copydata");
    block.emit(I::immLow(M::LDA, "__DESTRUCTOR_TABLE__"))
         .emit(I::zp(M::STA, ptr1))
         .emit(I::immHigh(M::LDA, "__DESTRUCTOR_TABLE__"))
         .emit(I::zp(M::STA, ptr1 + 1))
         .emit(I::imm(M::LDA, 0x00))
         .emit(I::zp(M::STA, ptr2))
         .emit(I::imm(M::LDA, 0x03))
         .emit(I::zp(M::STA, ptr2 + 1))
         .emit(I::imm(M::LDX, 0xDA))
         .emit(I::imm(M::LDA, 0xFF))
         .emit(I::zp(M::STA, tmp1))
         .emit(I::imm(M::LDY, 0x00))
         .emit(I::implied(M::INX), "@loop1")
         .emit(I::branch(M::BEQ, "@incTmp"))
         .emit(I::indY(M::LDA, ptr1), "@copyLoop")
         .emit(I::indY(M::STA, ptr2))
         .emit(I::implied(M::INY))
         .emit(I::branch(M::BNE, "@loop1"))
         .emit(I::zp(M::INC, ptr1 + 1))
         .emit(I::zp(M::INC, ptr2 + 1))
         .emit(I::branch(M::BNE, "@loop1"))
         .emit(I::zp(M::INC, tmp1), "@incTmp")
         .emit(I::branch(M::BNE, "@copyLoop"))
         .emit(I::implied(M::RTS));
    return block;
}

// Falls through into incsp2.
Block popax(const RuntimeParams&)
{
    Block block("popax");
    block.emit(I::imm(M::LDY, 0x01))
         .emit(I::indY(M::LDA, sp))
         .emit(I::implied(M::TAX))
         .emit(I::implied(M::DEY))
         .emit(I::indY(M::LDA, sp));
    return block;
}

Block incsp2(const RuntimeParams&)
{
    Block block("incsp2");
    block.emit(I::zp(M::INC, sp))
         .emit(I::branch(M::BEQ, "@1"))
         .emit(I::zp(M::INC, sp))
         .emit(I::branch(M::BEQ, "@2"))
         .emit(I::implied(M::RTS))
         .emit(I::zp(M::INC, sp), "@1")
         .emit(I::zp(M::INC, sp + 1), "@2")
         .emit(I::implied(M::RTS));
    return block;
}

Block popa(const RuntimeParams&)
{
    Block block("popa");
    block.emit(I::imm(M::LDY, 0x00))
         .emit(I::indY(M::LDA, sp))
         .emit(I::zp(M::INC, sp))
         .emit(I::branch(M::BEQ, "@1"))
         .emit(I::implied(M::RTS))
         .emit(I::zp(M::INC, sp + 1), "@1")
         .emit(I::implied(M::RTS));
    return block;
}

// The entry point sits after the pusha0sp/pushaysp prefix.
Block pusha(const RuntimeParams&)
{
    Block block("pusha", 4);
    block.emit(I::imm(M::LDY, 0x00))
         .emit(I::indY(M::LDA, sp))
         .emit(I::zp(M::LDY, sp))
         .emit(I::branch(M::BEQ, "@1"))
         .emit(I::zp(M::DEC, sp))
         .emit(I::imm(M::LDY, 0x00))
         .emit(I::indY(M::STA, sp))
         .emit(I::implied(M::RTS))
         .emit(I::zp(M::DEC, sp + 1), "@1")
         .emit(I::zp(M::DEC, sp))
         .emit(I::indY(M::STA, sp))
         .emit(I::implied(M::RTS));
    return block;
}

// The entry point sits after the push0/pusha0 prefix.
Block pushax(const RuntimeParams&)
{
    Block block("pushax", 4);
    block.emit(I::imm(M::LDA, 0x00))
         .emit(I::imm(M::LDX, 0x00))
         .emit(I::implied(M::PHA))
         .emit(I::zp(M::LDA, sp))
         .emit(I::implied(M::SEC))
         .emit(I::imm(M::SBC, 0x02))
         .emit(I::zp(M::STA, sp))
         .emit(I::branch(M::BCS, "@1"))
         .emit(I::zp(M::DEC, sp + 1))
         .emit(I::imm(M::LDY, 0x01), "@1")
         .emit(I::implied(M::TXA))
         .emit(I::indY(M::STA, sp))
         .emit(I::implied(M::PLA))
         .emit(I::implied(M::DEY))
         .emit(I::indY(M::STA, sp))
         .emit(I::implied(M::RTS));
    return block;
}

Block zerobss(const RuntimeParams& params)
{
    Block block("zerobss");
    block.emit(I::imm(M::LDA, 0x25))
         .emit(I::zp(M::STA, ptr1))
         .emit(I::imm(M::LDA, 0x03))
         .emit(I::zp(M::STA, ptr1 + 1))
         .emit(I::imm(M::LDA, 0x00))
         .emit(I::implied(M::TAY))
         .emit(I::imm(M::LDX, 0x00))
         .emit(I::branch(M::BEQ, "@checkDone"))
         .emit(I::indY(M::STA, ptr1), "@zeroLoop")
         .emit(I::implied(M::INY))
         .emit(I::branch(M::BNE, "@zeroLoop"))
         .emit(I::zp(M::INC, ptr1 + 1))
         .emit(I::implied(M::DEX))
         .emit(I::branch(M::BNE, "@zeroLoop"))
         .emit(I::imm(M::CPY, params.localBytes), "@checkDone")
         .emit(I::branch(M::BEQ, "@done"))
         .emit(I::indY(M::STA, ptr1))
         .emit(I::implied(M::INY))
         .emit(I::branch(M::BNE, "@checkDone"))
         .emit(I::implied(M::RTS), "@done");
    return block;
}

// pad_poll(pad): reads the port three times and keeps a matching pair.
Block padPoll(const RuntimeParams&)
{
    Block block("pad_poll");
    block.emit(I::implied(M::TAY))
         .emit(I::imm(M::LDX, 0x00))
         .emit(I::imm(M::LDA, 0x01), "@padPollPort")
         .emit(I::abs(M::STA, JOYPAD1))
         .emit(I::imm(M::LDA, 0x00))
         .emit(I::abs(M::STA, JOYPAD1))
         .emit(I::imm(M::LDA, 0x08))
         .emit(I::zp(M::STA, TEMP))
         .emit(I::absY(M::LDA, JOYPAD1), "@padPollLoop")
         .emit(I::accumulator(M::LSR))
         .emit(I::zpX(M::ROR, TEMP + 1))
         .emit(I::zp(M::DEC, TEMP))
         .emit(I::branch(M::BNE, "@padPollLoop"))
         .emit(I::implied(M::INX))
         .emit(I::imm(M::CPX, 0x03))
         .emit(I::branch(M::BNE, "@padPollPort"))
         .emit(I::zp(M::LDA, TEMP + 1))
         .emit(I::zp(M::CMP, 0x19))
         .emit(I::branch(M::BEQ, "@done"))
         .emit(I::zp(M::CMP, 0x1A))
         .emit(I::branch(M::BEQ, "@done"))
         .emit(I::zp(M::LDA, 0x19))
         .emit(I::absY(M::STA, 0x003C), "@done")
         .emit(I::implied(M::TAX))
         .emit(I::absY(M::EOR, 0x003E))
         .emit(I::absY(M::AND, 0x003C))
         .emit(I::absY(M::STA, 0x0040))
         .emit(I::implied(M::TXA))
         .emit(I::absY(M::STA, 0x003E))
         .emit(I::imm(M::LDX, 0x00))
         .emit(I::implied(M::RTS));
    return block;
}

// cc65 condes dispatcher. The $FFFF operands are patched at run time.
Block destructorTable(const RuntimeParams&)
{
    Block block("__DESTRUCTOR_TABLE__");
    block.emit(I::abs(M::STA, 0x030E))
         .emit(I::abs(M::STX, 0x030F))
         .emit(I::abs(M::STA, 0x0315))
         .emit(I::abs(M::STX, 0x0316))
         .emit(I::implied(M::DEY), "@loop")
         .emit(I::absY(M::LDA, 0xFFFF))
         .emit(I::abs(M::STA, 0x031F))
         .emit(I::implied(M::DEY))
         .emit(I::absY(M::LDA, 0xFFFF))
         .emit(I::abs(M::STA, 0x031E))
         .emit(I::abs(M::STY, 0x0321))
         .emit(I::abs(M::JSR, 0xFFFF))
         .emit(I::imm(M::LDY, 0xFF))
         .emit(I::branch(M::BNE, "@loop"))
         .emit(I::implied(M::RTS));
    return block;
}

} // namespace

// ============================================================================
// SubroutineCatalog
// ============================================================================

SubroutineCatalog::SubroutineCatalog()
{
    const Section S = Section::Startup;
    const Section R = Section::Runtime;

    routines = {
        {"_exit",            S, false, {"_initPPU"}, exitBlock},
        {"_initPPU",         S, false, {"_clearPalette"}, initPpu},
        {"_clearPalette",    S, false, {"_clearVRAM"}, clearPalette},
        {"_clearVRAM",       S, false, {"clearRAM"}, clearVram},
        {"clearRAM",         S, false, {"_waitSync3", "pal_bright", "pal_clear", "oam_clear", "zerobss",
                                        "copydata", "initlib", "nmi_set_callback"}, clearRam},
        {"_waitSync3",       S, false, {"detectNTSC"}, waitSync3},
        {"detectNTSC",       S, false, {"ppu_off"}, detectNtsc},

        {"nmi",              S, false, {"doUpdate", "skipAll"}, nmi},
        {"doUpdate",         S, false, {"updPal", "updVRAM"}, doUpdate},
        {"updPal",           S, false, {"updVRAM"}, updPal},
        {"updVRAM",          S, false, {"skipUpd", "flush_vram_update"}, updVram},
        {"skipUpd",          S, false, {"skipAll"}, skipUpd},
        {"skipAll",          S, false, {"skipNtsc"}, skipAll},
        {"skipNtsc",         S, false, {}, skipNtsc},
        {"irq",              S, false, {"skipNtsc"}, irq},
        {"nmi_set_callback", S, false, {}, nmiSetCallback},

        {"pal_all",          S, false, {"pal_copy"}, palAll},
        {"pal_copy",         S, false, {}, palCopy},
        {"pal_bg",           S, false, {"pal_copy"}, palBg},
        {"pal_spr",          S, false, {"pal_copy"}, palSpr},
        {"pal_col",          S, false, {"popa"}, palCol},
        {"pal_clear",        S, false, {}, palClear},
        {"pal_spr_bright",   S, false, {"palBrightTableL", "palBrightTableH"}, palSprBright},
        {"pal_bg_bright",    S, false, {"palBrightTableL", "palBrightTableH"}, palBgBright},
        {"pal_bright",       S, false, {"pal_spr_bright", "pal_bg_bright"}, palBright},

        {"ppu_off",          S, false, {"ppu_wait_nmi"}, ppuOff},
        {"ppu_on_all",       S, false, {"ppu_onoff"}, ppuOnAll},
        {"ppu_onoff",        S, false, {"ppu_wait_nmi"}, ppuOnOff},
        {"ppu_on_bg",        S, false, {"ppu_onoff"}, ppuOnBg},
        {"ppu_on_spr",       S, false, {"ppu_onoff"}, ppuOnSpr},
        {"ppu_mask",         S, false, {}, ppuMask},
        {"ppu_system",       S, false, {}, ppuSystem},
        {"get_ppu_ctrl_var", S, false, {}, getPpuCtrlVar},
        {"set_ppu_ctrl_var", S, false, {}, setPpuCtrlVar},

        {"oam_clear",        S, false, {}, oamClear},
        {"oam_size",         S, false, {}, oamSize},
        {"oam_hide_rest",    S, false, {}, oamHideRest},

        {"ppu_wait_frame",   S, false, {}, ppuWaitFrame},
        {"ppu_wait_nmi",     S, false, {}, ppuWaitNmi},

        {"scroll",           S, false, {"popax"}, scroll},
        {"bank_spr",         S, false, {}, bankSpr},
        {"bank_bg",          S, false, {}, bankBg},

        {"vram_write",       S, false, {"popax"}, vramWrite},
        {"set_vram_update",  S, false, {}, setVramUpdate},
        {"flush_vram_update", S, false, {}, flushVramUpdate},
        {"vram_adr",         S, false, {}, vramAdr},
        {"vram_put",         S, false, {}, vramPut},
        {"vram_fill",        S, false, {"popa"}, vramFill},
        {"vram_inc",         S, false, {}, vramInc},

        {"nesclock",         S, false, {}, nesclock},
        {"delay",            S, false, {"ppu_wait_nmi"}, delay},

        {"palBrightTableL",  S, false, {"palBrightTable0", "palBrightTable1", "palBrightTable2",
                                        "palBrightTable3", "palBrightTable4", "palBrightTable5",
                                        "palBrightTable6", "palBrightTable7", "palBrightTable8"}, brightTableL},
        {"palBrightTableH",  S, false, {}, brightTableH},
        {"palBrightTable0",  S, false, {}, brightTable<0>},
        {"palBrightTable1",  S, false, {}, brightTable<1>},
        {"palBrightTable2",  S, false, {}, brightTable<2>},
        {"palBrightTable3",  S, false, {}, brightTable<3>},
        {"palBrightTable4",  S, false, {}, brightTable<4>},
        {"palBrightTable5",  S, false, {}, brightTable<5>},
        {"palBrightTable6",  S, false, {}, brightTable<6>},
        {"palBrightTable7",  S, false, {}, brightTable<7>},
        {"palBrightTable8",  S, false, {}, brightTable8},

        {"initlib",          S, false, {}, initlib},

        {"donelib",          R, false, {"__DESTRUCTOR_TABLE__"}, donelib},
        {"copydata",         R, false, {"__DESTRUCTOR_TABLE__"}, copydata},
        {"popax",            R, false, {"incsp2"}, popax},
        {"incsp2",           R, false, {}, incsp2},
        {"popa",             R, false, {}, popa},
        {"pusha",            R, false, {}, pusha},
        {"pushax",           R, false, {}, pushax},
        {"zerobss",          R, false, {}, zerobss},
        {"pad_poll",         R, true,  {}, padPoll},
        {"oam_spr",          R, true,  {}, oamSpr},

        {"__DESTRUCTOR_TABLE__", Section::Trailer, false, {}, destructorTable},
    };
}

const SubroutineCatalog& SubroutineCatalog::standard()
{
    static const SubroutineCatalog catalog;
    return catalog;
}

const Subroutine* SubroutineCatalog::find(const std::string& name) const
{
    for (const auto& routine : routines) {
        if (routine.name == name) {
            return &routine;
        }
    }
    return nullptr;
}

const Subroutine& SubroutineCatalog::lookup(const std::string& name) const
{
    const Subroutine* routine = find(name);
    if (!routine) {
        throw NotFound(name);
    }
    return *routine;
}

Block SubroutineCatalog::build(const std::string& name, const RuntimeParams& params) const
{
    return lookup(name).build(params);
}

std::set<std::string> SubroutineCatalog::closure(const std::set<std::string>& used) const
{
    std::set<std::string> result;
    std::deque<std::string> work;

    for (const auto& routine : routines) {
        if (!routine.optional) {
            work.push_back(routine.name);
        }
    }
    for (const auto& name : used) {
        lookup(name);
        work.push_back(name);
    }

    while (!work.empty()) {
        std::string name = std::move(work.front());
        work.pop_front();
        if (!result.insert(name).second) {
            continue;
        }
        for (const auto& dep : lookup(name).dependencies) {
            if (!result.count(dep)) {
                work.push_back(dep);
            }
        }
    }
    return result;
}

std::vector<const Subroutine*> SubroutineCatalog::layout(Section section, const std::set<std::string>& included) const
{
    std::vector<const Subroutine*> result;
    for (const auto& routine : routines) {
        if (routine.section == section && included.count(routine.name)) {
            result.push_back(&routine);
        }
    }
    return result;
}
