#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>
#include <cstddef>

// Broad classification so the command line can tell bad input from
// unimplemented features.
enum class ErrorCategory {
    BadInput,       // malformed assembly, unknown call target, broken labels
    Unsupported,    // valid input the compiler has no rule for
    Limit           // output does not fit the cartridge layout
};

class NesilError : public std::runtime_error {
    ErrorCategory cat;

public:
    NesilError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), cat(category) {}

    ErrorCategory category() const noexcept { return cat; }
};

// Truncated method body, unknown opcode or unresolvable metadata token.
class DecodeError : public NesilError {
public:
    explicit DecodeError(const std::string& message)
        : NesilError(ErrorCategory::BadInput, "decode error: " + message) {}
};

// Recognized bytecode (or idiom) the translator has no rule for.
class UnsupportedInstruction : public NesilError {
    size_t off;

public:
    UnsupportedInstruction(size_t offset, const std::string& message)
        : NesilError(ErrorCategory::Unsupported, message + " at IL_" + hex4(offset)), off(offset) {}

    size_t offset() const noexcept { return off; }

    static std::string hex4(size_t value) {
        static const char digits[] = "0123456789abcdef";
        std::string s(4, '0');
        for (int i = 3; i >= 0; --i) {
            s[i] = digits[value & 0xF];
            value >>= 4;
        }
        return s;
    }
};

// User code calls a library name with no catalog entry.
class NotFound : public NesilError {
public:
    explicit NotFound(const std::string& name)
        : NesilError(ErrorCategory::BadInput, "unknown library call: " + name) {}
};

class UnresolvedLabel : public NesilError {
public:
    explicit UnresolvedLabel(const std::string& label)
        : NesilError(ErrorCategory::BadInput, "unresolved label: " + label) {}
};

class DuplicateLabel : public NesilError {
public:
    explicit DuplicateLabel(const std::string& label)
        : NesilError(ErrorCategory::BadInput, "duplicate label: " + label) {}
};

class BranchOutOfRange : public NesilError {
public:
    BranchOutOfRange(const std::string& label, int displacement)
        : NesilError(ErrorCategory::Unsupported,
                     "branch to " + label + " out of range (" + std::to_string(displacement) + " bytes)") {}
};

class InvalidAddressMode : public NesilError {
public:
    explicit InvalidAddressMode(const std::string& message)
        : NesilError(ErrorCategory::Unsupported, "invalid addressing mode: " + message) {}
};

class WriteError : public NesilError {
public:
    explicit WriteError(const std::string& path)
        : NesilError(ErrorCategory::BadInput, "could not write " + path) {}
};

class RomOverflow : public NesilError {
public:
    explicit RomOverflow(const std::string& message)
        : NesilError(ErrorCategory::Limit, message) {}
};
