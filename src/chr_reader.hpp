#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Loads tile (CHR) data for the cartridge.
 *
 * Two input forms are accepted: a ca65 assembly listing whose
 * `.segment "CHARS"` holds `.byte` lines, or a raw binary file. The data
 * itself is opaque; no tile format is interpreted.
 */
class ChrReader {
public:
    // Bytes of every CHARS segment in file order. Throws DecodeError.
    static std::vector<uint8_t> parseAssembly(std::string_view source);

    /**
     * Read @p path. Files ending in `.s` or `.asm` are parsed as assembly,
     * everything else is taken verbatim.
     * @throws DecodeError if the file cannot be read or holds no tile data
     */
    static std::vector<uint8_t> load(const std::string& path);

private:
    static uint8_t parseByte(std::string_view token, size_t line);
};
