#include "chr_reader.hpp"
#include "errors.hpp"
#include <fstream>
#include <iterator>
#include <sstream>

namespace {

std::string_view trim(std::string_view s)
{
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

bool startsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool endsWith(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

uint8_t ChrReader::parseByte(std::string_view token, size_t line)
{
    token = trim(token);
    int base = 10;
    if (startsWith(token, "$")) {
        base = 16;
        token.remove_prefix(1);
    } else if (startsWith(token, "0x") || startsWith(token, "0X")) {
        base = 16;
        token.remove_prefix(2);
    } else if (startsWith(token, "%")) {
        base = 2;
        token.remove_prefix(1);
    }
    if (token.empty()) {
        throw DecodeError("empty .byte value on line " + std::to_string(line));
    }

    unsigned value = 0;
    for (char c : token) {
        unsigned digit = 0;
        if (c >= '0' && c <= '9') {
            digit = static_cast<unsigned>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<unsigned>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            digit = static_cast<unsigned>(c - 'A' + 10);
        } else {
            digit = 99;
        }
        if (digit >= static_cast<unsigned>(base)) {
            throw DecodeError("bad .byte value '" + std::string(token) + "' on line " + std::to_string(line));
        }
        value = value * static_cast<unsigned>(base) + digit;
        if (value > 0xFF) {
            throw DecodeError(".byte value out of range on line " + std::to_string(line));
        }
    }
    return static_cast<uint8_t>(value);
}

std::vector<uint8_t> ChrReader::parseAssembly(std::string_view source)
{
    std::vector<uint8_t> bytes;
    bool inChars = false;
    bool sawChars = false;
    size_t lineNumber = 0;

    while (!source.empty()) {
        const auto eol = source.find('\n');
        std::string_view line = source.substr(0, eol);
        source = eol == std::string_view::npos ? std::string_view{} : source.substr(eol + 1);
        ++lineNumber;

        const auto comment = line.find(';');
        if (comment != std::string_view::npos) {
            line = line.substr(0, comment);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        if (startsWith(line, ".segment")) {
            std::string_view name = trim(line.substr(8));
            if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
                name = name.substr(1, name.size() - 2);
            }
            inChars = name == "CHARS";
            sawChars = sawChars || inChars;
            continue;
        }

        if (inChars && startsWith(line, ".byte")) {
            std::string_view values = line.substr(5);
            while (!values.empty()) {
                const auto comma = values.find(',');
                bytes.push_back(parseByte(values.substr(0, comma), lineNumber));
                values = comma == std::string_view::npos ? std::string_view{} : values.substr(comma + 1);
            }
        }
    }

    if (!sawChars) {
        throw DecodeError("no CHARS segment in tile data");
    }
    return bytes;
}

std::vector<uint8_t> ChrReader::load(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DecodeError("could not open tile data: " + path);
    }

    if (endsWith(path, ".s") || endsWith(path, ".asm")) {
        std::stringstream buffer;
        buffer << file.rdbuf();
        return parseAssembly(buffer.str());
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}
