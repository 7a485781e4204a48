#pragma once

#include "block.hpp"
#include "il_reader.hpp"
#include "neslib.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct DataLiteral {
    std::string label;
    std::vector<uint8_t> bytes;
};

// Output of one translation run: user code plus everything it references.
struct Translation {
    Block code{std::string("main")};
    std::vector<DataLiteral> byteArrays;
    std::vector<DataLiteral> strings;
    std::set<std::string> calls;        // library routines called by user code
    uint8_t localBytes = 0;             // storage taken by byte/word locals
};

/**
 * @brief Selects 6502 code for a single entry method.
 *
 * The evaluation stack is tracked by shape. A value lives in A (byte) or
 * A/X (word) until another value is loaded on top of it; at that point it
 * is pushed onto the C software stack with pusha/pushax. This produces the
 * cc65 calling convention directly: every argument but the last sits on the
 * software stack, the last one in registers.
 *
 * Addresses of literal data are deferred and only materialized when
 * consumed, since their final form depends on the callee (pointer, or
 * pointer plus length).
 */
class Translator {
public:
    Translation translate(const std::vector<ILInstruction>& body);

    static std::string ilLabel(size_t offset);

private:
    struct StackEntry {
        enum class Kind { Constant, Runtime, Address, Token };

        Kind kind = Kind::Runtime;
        int32_t value = 0;                  // Constant
        uint8_t width = 1;                  // Constant / Runtime
        std::string label;                  // Address
        size_t length = 0;                  // Address: payload length in bytes
        std::vector<uint8_t> bytes;         // Token: field initial data

        size_t codeStart = 0;               // first instruction emitted for this value
        bool inRegisters = false;
        bool pushed = false;                // moved onto the software stack
        size_t pushIndex = 0;               // instruction that pushed it
        bool spilledBelow = false;          // loading it pushed the entry underneath
        size_t origin = 0;                  // bytecode offset that produced it
    };

    struct Local {
        bool alias = false;                 // refers to literal data, no storage
        StackEntry target;                  // alias target
        uint16_t address = 0;
        uint8_t width = 1;
    };

    struct PendingArray {
        std::string label;
        size_t length = 0;
        std::vector<uint8_t> data;
        size_t origin = 0;
        bool initialized = false;
    };

    Translation out;
    std::vector<StackEntry> stack;
    std::map<int64_t, Local> locals;
    std::map<int64_t, uint16_t> plannedLocals;          // index -> address, kept across reset()
    std::vector<PendingArray> arrays;
    std::map<std::string, std::string> stringLabels;    // text -> label
    size_t current = 0;                                 // offset being translated
    bool haltEmitted = false;

    void reset();
    void translateBody(const std::vector<ILInstruction>& body);
    void translateOne(const ILInstruction& instr);

    // --- Stack model ---
    StackEntry pop();
    StackEntry& top();
    void require(size_t count);
    bool spill(bool materialize);
    void pushEntry(StackEntry entry);
    void discard(size_t index);

    // --- Loads and stores ---
    void loadConstant(int64_t value);
    void loadString(const std::string& text);
    void loadLocal(int64_t index);
    void storeLocal(int64_t index);
    void newArray();
    void duplicate();
    void popValue();

    // --- Arithmetic ---
    void binaryOp(il::Op op);
    void convert(il::Op op);

    // --- Calls ---
    void call(const std::string& name);
    void foldNametable(uint16_t base);
    void initializeArray();
    void materializeAddress(const StackEntry& entry, bool buffer);
    void passArgument(StackEntry& arg, nes::ArgKind kind, bool last);

    // --- Control flow ---
    void branch(const ILInstruction& instr);
    void conditionalBranch(const ILInstruction& instr);
    void compareBranch(const ILInstruction& instr);
    void ret();

    std::string dataLabelFor(const std::string& text);

    [[noreturn]] void unsupported(const std::string& message) const;
};
