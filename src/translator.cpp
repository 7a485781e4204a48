#include "translator.hpp"
#include "errors.hpp"
#include "subroutines.hpp"
#include <algorithm>

using namespace il;

namespace {

using M = Mnemonic;
using I = Instruction;

constexpr size_t MAX_LOCAL_BYTES = 0x0400 - nes::LOCALS;

// Printable ASCII rendition of UTF-8 text, one '?' per non-ASCII code point.
std::vector<uint8_t> asciiBytes(const std::string& text)
{
    std::vector<uint8_t> bytes;
    for (unsigned char c : text) {
        if (c < 0x80) {
            bytes.push_back(c);
        } else if (c >= 0xC0) {
            bytes.push_back('?');
        }
    }
    return bytes;
}

I longBranch(M mnemonic, const std::string& label)
{
    I instr = I::branch(mnemonic, label);
    instr.longBranch = true;
    return instr;
}

std::string opText(Op op)
{
    return std::string(opName(op));
}

} // namespace

std::string Translator::ilLabel(size_t offset)
{
    return "IL_" + UnsupportedInstruction::hex4(offset);
}

void Translator::unsupported(const std::string& message) const
{
    throw UnsupportedInstruction(current, message);
}

void Translator::reset()
{
    out = Translation{};
    stack.clear();
    locals.clear();
    arrays.clear();
    stringLabels.clear();
    current = 0;
    haltEmitted = false;
}

// Locals are laid out in index order. The first pass learns which indices
// hold values and how wide they are; the second emits code against the
// final addresses. Addresses never change instruction sizes.
Translation Translator::translate(const std::vector<ILInstruction>& body)
{
    plannedLocals.clear();
    translateBody(body);

    std::map<int64_t, uint16_t> plan;
    auto next = static_cast<uint16_t>(nes::LOCALS);
    for (const auto& [index, local] : locals) {
        if (!local.alias) {
            plan[index] = next;
            next = static_cast<uint16_t>(next + local.width);
        }
    }
    plannedLocals = std::move(plan);
    translateBody(body);
    plannedLocals.clear();

    Translation result = std::move(out);
    reset();
    return result;
}

void Translator::translateBody(const std::vector<ILInstruction>& body)
{
    reset();

    std::set<size_t> offsets;
    std::set<size_t> targets;
    size_t end = 0;
    for (const auto& instr : body) {
        offsets.insert(instr.offset);
        end = instr.offset + instr.size;
        if (instr.operandType == OperandType::ShortBrTarget || instr.operandType == OperandType::BrTarget) {
            targets.insert(instr.branchTarget());
        }
    }
    for (size_t target : targets) {
        if (!offsets.count(target) && target != end) {
            throw DecodeError("branch into the middle of an instruction: IL_" + UnsupportedInstruction::hex4(target));
        }
    }

    for (const auto& instr : body) {
        current = instr.offset;
        if (targets.count(instr.offset)) {
            out.code.setNextLabel(ilLabel(instr.offset));
        }
        translateOne(instr);
    }
    if (targets.count(end)) {
        out.code.setNextLabel(ilLabel(end));
    }

    for (auto& array : arrays) {
        if (!array.initialized) {
            throw UnsupportedInstruction(array.origin, "array without constant initializer");
        }
        out.byteArrays.push_back({array.label, std::move(array.data)});
    }
    arrays.clear();
}

// ============================================================================
// Dispatch
// ============================================================================

void Translator::translateOne(const ILInstruction& instr)
{
    const Op op = instr.opcode;
    switch (op) {
        case Op::Nop:
            break;

        case Op::Ldc_i4_m1: loadConstant(-1); break;
        case Op::Ldc_i4_0: case Op::Ldc_i4_1: case Op::Ldc_i4_2:
        case Op::Ldc_i4_3: case Op::Ldc_i4_4: case Op::Ldc_i4_5:
        case Op::Ldc_i4_6: case Op::Ldc_i4_7: case Op::Ldc_i4_8:
            loadConstant(static_cast<int>(op) - static_cast<int>(Op::Ldc_i4_0));
            break;
        case Op::Ldc_i4_s:
        case Op::Ldc_i4:
        case Op::Ldc_i8:
            loadConstant(instr.integer.value_or(0));
            break;
        case Op::Ldstr:
            loadString(instr.text.value_or(""));
            break;

        case Op::Dup: duplicate(); break;
        case Op::Pop: popValue(); break;

        case Op::Ldloc_0: case Op::Ldloc_1: case Op::Ldloc_2: case Op::Ldloc_3:
            loadLocal(static_cast<int>(op) - static_cast<int>(Op::Ldloc_0));
            break;
        case Op::Ldloc_s:
        case Op::Ldloc:
            loadLocal(instr.integer.value_or(0));
            break;
        case Op::Stloc_0: case Op::Stloc_1: case Op::Stloc_2: case Op::Stloc_3:
            storeLocal(static_cast<int>(op) - static_cast<int>(Op::Stloc_0));
            break;
        case Op::Stloc_s:
        case Op::Stloc:
            storeLocal(instr.integer.value_or(0));
            break;

        case Op::Newarr:
            if (instr.text && *instr.text != "Byte" && *instr.text != "SByte") {
                unsupported("arrays of " + *instr.text);
            }
            newArray();
            break;
        case Op::Ldtoken: {
            if (!instr.bytes) {
                unsupported("ldtoken of a member without initial data");
            }
            StackEntry token;
            token.kind = StackEntry::Kind::Token;
            token.bytes = *instr.bytes;
            token.codeStart = out.code.count();
            token.origin = current;
            token.spilledBelow = spill(false);
            pushEntry(std::move(token));
            break;
        }
        case Op::Stelem_i1:
        case Op::Stelem_i: {
            require(3);
            const size_t n = stack.size();
            StackEntry& array = stack[n - 3];
            const StackEntry& index = stack[n - 2];
            const StackEntry& value = stack[n - 1];
            if (array.kind != StackEntry::Kind::Address || index.kind != StackEntry::Kind::Constant ||
                value.kind != StackEntry::Kind::Constant) {
                unsupported("array element store needs a literal array, index and value");
            }
            auto it = std::find_if(arrays.begin(), arrays.end(),
                                   [&](const PendingArray& a) { return a.label == array.label; });
            if (it == arrays.end() || index.value < 0 || static_cast<size_t>(index.value) >= it->length) {
                unsupported("array element store out of bounds");
            }
            it->data[static_cast<size_t>(index.value)] = static_cast<uint8_t>(value.value);
            it->initialized = true;
            discard(n - 2);
            pop();
            break;
        }

        case Op::Call:
            if (!instr.text) {
                unsupported("call through an unnamed token");
            }
            call(*instr.text);
            break;
        case Op::Ret:
            ret();
            break;

        case Op::Br: case Op::Br_s:
        case Op::Leave: case Op::Leave_s:
            branch(instr);
            break;
        case Op::Brtrue: case Op::Brtrue_s:
        case Op::Brfalse: case Op::Brfalse_s:
            conditionalBranch(instr);
            break;
        case Op::Beq: case Op::Beq_s:
        case Op::Bne_un: case Op::Bne_un_s:
        case Op::Blt: case Op::Blt_s: case Op::Blt_un: case Op::Blt_un_s:
        case Op::Bge: case Op::Bge_s: case Op::Bge_un: case Op::Bge_un_s:
        case Op::Bgt: case Op::Bgt_s: case Op::Bgt_un: case Op::Bgt_un_s:
        case Op::Ble: case Op::Ble_s: case Op::Ble_un: case Op::Ble_un_s:
            compareBranch(instr);
            break;

        case Op::Add: case Op::Sub: case Op::Mul: case Op::Div: case Op::Div_un:
        case Op::Rem: case Op::Rem_un: case Op::And: case Op::Or: case Op::Xor:
        case Op::Shl: case Op::Shr: case Op::Shr_un:
            binaryOp(op);
            break;

        case Op::Conv_i1: case Op::Conv_u1: case Op::Conv_i2: case Op::Conv_u2:
        case Op::Conv_i4: case Op::Conv_u4: case Op::Conv_i8: case Op::Conv_u8:
        case Op::Conv_i: case Op::Conv_u:
            convert(op);
            break;

        default:
            unsupported(opText(op) + " is not supported");
    }
}

// ============================================================================
// Stack model
// ============================================================================

void Translator::require(size_t count)
{
    if (stack.size() < count) {
        unsupported("evaluation stack underflow");
    }
}

Translator::StackEntry& Translator::top()
{
    require(1);
    return stack.back();
}

Translator::StackEntry Translator::pop()
{
    require(1);
    StackEntry entry = std::move(stack.back());
    stack.pop_back();
    return entry;
}

void Translator::pushEntry(StackEntry entry)
{
    stack.push_back(std::move(entry));
}

/**
 * Move the value on top of the stack out of the registers onto the software
 * stack. With @p materialize, a deferred address on top is loaded and pushed
 * too, so that code loading a new value may clobber A/X.
 * @return true if anything was pushed
 */
bool Translator::spill(bool materialize)
{
    if (stack.empty()) {
        return false;
    }
    StackEntry& entry = stack.back();
    if (entry.inRegisters) {
        entry.pushIndex = out.code.count();
        out.code.emit(I::abs(M::JSR, entry.width == 1 ? "pusha" : "pushax"));
        entry.inRegisters = false;
        entry.pushed = true;
        return true;
    }
    if (materialize && entry.kind == StackEntry::Kind::Address && !entry.pushed) {
        materializeAddress(entry, false);
        entry.pushIndex = out.code.count();
        out.code.emit(I::abs(M::JSR, "pushax"));
        entry.pushed = true;
        return true;
    }
    return false;
}

// Drop stack entries from @p index up, together with the code that loaded them.
void Translator::discard(size_t index)
{
    const bool restore = stack[index].spilledBelow;
    out.code.truncate(stack[index].codeStart);
    stack.erase(stack.begin() + static_cast<std::ptrdiff_t>(index), stack.end());

    if (restore && !stack.empty()) {
        StackEntry& below = stack.back();
        below.pushed = false;
        below.inRegisters = below.kind == StackEntry::Kind::Constant || below.kind == StackEntry::Kind::Runtime;
    }
}

// ============================================================================
// Loads and stores
// ============================================================================

void Translator::loadConstant(int64_t value)
{
    if (value < -32768 || value > 0xFFFF) {
        unsupported("constant " + std::to_string(value) + " does not fit in 16 bits");
    }

    StackEntry entry;
    entry.kind = StackEntry::Kind::Constant;
    entry.value = static_cast<int32_t>(value);
    entry.width = (value >= -128 && value <= 0xFF) ? 1 : 2;
    entry.codeStart = out.code.count();
    entry.origin = current;
    entry.spilledBelow = spill(true);

    const auto bits = static_cast<uint16_t>(value);
    if (entry.width == 2) {
        out.code.emit(I::imm(M::LDX, static_cast<uint8_t>(bits >> 8)));
    }
    out.code.emit(I::imm(M::LDA, static_cast<uint8_t>(bits & 0xFF)));
    entry.inRegisters = true;
    pushEntry(std::move(entry));
}

std::string Translator::dataLabelFor(const std::string& text)
{
    auto it = stringLabels.find(text);
    if (it != stringLabels.end()) {
        return it->second;
    }
    std::string label = "string_" + std::to_string(out.strings.size());
    std::vector<uint8_t> bytes = asciiBytes(text);
    bytes.push_back(0);
    out.strings.push_back({label, std::move(bytes)});
    stringLabels.emplace(text, label);
    return label;
}

void Translator::loadString(const std::string& text)
{
    StackEntry entry;
    entry.kind = StackEntry::Kind::Address;
    entry.label = dataLabelFor(text);
    entry.length = asciiBytes(text).size();
    entry.codeStart = out.code.count();
    entry.origin = current;
    entry.spilledBelow = spill(false);
    pushEntry(std::move(entry));
}

void Translator::loadLocal(int64_t index)
{
    auto it = locals.find(index);
    if (it == locals.end()) {
        unsupported("local " + std::to_string(index) + " is read before it is assigned");
    }
    const Local& local = it->second;

    if (local.alias) {
        StackEntry entry = local.target;
        entry.codeStart = out.code.count();
        entry.origin = current;
        entry.inRegisters = false;
        entry.pushed = false;
        entry.spilledBelow = spill(false);
        pushEntry(std::move(entry));
        return;
    }

    StackEntry entry;
    entry.kind = StackEntry::Kind::Runtime;
    entry.width = local.width;
    entry.codeStart = out.code.count();
    entry.origin = current;
    entry.spilledBelow = spill(true);
    out.code.emit(I::abs(M::LDA, local.address));
    if (local.width == 2) {
        out.code.emit(I::abs(M::LDX, static_cast<uint16_t>(local.address + 1)));
    }
    entry.inRegisters = true;
    pushEntry(std::move(entry));
}

void Translator::storeLocal(int64_t index)
{
    StackEntry value = pop();
    auto it = locals.find(index);

    if (value.kind == StackEntry::Kind::Address) {
        if (value.pushed) {
            unsupported("store of an address already passed on the stack");
        }
        if (it != locals.end() && !it->second.alias) {
            unsupported("local " + std::to_string(index) + " holds both a value and literal data");
        }
        Local local;
        local.alias = true;
        local.target = std::move(value);
        locals[index] = std::move(local);
        return;
    }
    if (value.kind == StackEntry::Kind::Token) {
        unsupported("store of a metadata token");
    }
    if (!value.inRegisters) {
        unsupported("store of a value that is not in registers");
    }

    if (it == locals.end()) {
        if (out.localBytes + value.width > MAX_LOCAL_BYTES) {
            unsupported("local variables exceed the RAM reserved for them");
        }
        Local local;
        auto planned = plannedLocals.find(index);
        local.address = planned != plannedLocals.end()
            ? planned->second
            : static_cast<uint16_t>(nes::LOCALS + out.localBytes);
        local.width = value.width;
        out.localBytes = static_cast<uint8_t>(out.localBytes + value.width);
        it = locals.emplace(index, local).first;
    } else if (it->second.alias) {
        unsupported("local " + std::to_string(index) + " holds both a value and literal data");
    }

    const Local& local = it->second;
    if (local.width < value.width) {
        unsupported("16-bit value stored in 8-bit local " + std::to_string(index));
    }
    out.code.emit(I::abs(M::STA, local.address));
    if (local.width == 2) {
        if (value.width == 1) {
            out.code.emit(I::imm(M::LDX, 0x00));
        }
        out.code.emit(I::abs(M::STX, static_cast<uint16_t>(local.address + 1)));
    }
}

void Translator::newArray()
{
    const StackEntry& size = top();
    if (size.kind != StackEntry::Kind::Constant || size.value < 0) {
        unsupported("array size must be a non-negative constant");
    }
    PendingArray array;
    array.label = "bytearray_" + std::to_string(arrays.size());
    array.length = static_cast<size_t>(size.value);
    array.data.assign(array.length, 0);
    array.origin = current;
    discard(stack.size() - 1);

    StackEntry entry;
    entry.kind = StackEntry::Kind::Address;
    entry.label = array.label;
    entry.length = array.length;
    entry.codeStart = out.code.count();
    entry.origin = current;
    entry.spilledBelow = spill(false);
    pushEntry(std::move(entry));
    arrays.push_back(std::move(array));
}

void Translator::duplicate()
{
    StackEntry copy = top();
    copy.codeStart = out.code.count();
    copy.origin = current;

    if (copy.kind == StackEntry::Kind::Address || copy.kind == StackEntry::Kind::Token) {
        if (copy.pushed) {
            unsupported("dup of an address already on the stack");
        }
        copy.spilledBelow = spill(false);
        pushEntry(std::move(copy));
        return;
    }
    if (!copy.inRegisters) {
        unsupported("dup of a value that is not in registers");
    }
    // Lower copy goes to the software stack, upper copy stays in A/X.
    copy.spilledBelow = spill(true);
    copy.pushed = false;
    copy.inRegisters = true;
    pushEntry(std::move(copy));
}

void Translator::popValue()
{
    StackEntry& entry = top();
    if (entry.pushed) {
        unsupported("pop of a value on the software stack");
    }
    if (entry.kind == StackEntry::Kind::Constant) {
        discard(stack.size() - 1);
        return;
    }
    pop();
}

// ============================================================================
// Arithmetic
// ============================================================================

void Translator::binaryOp(Op op)
{
    require(2);
    const size_t n = stack.size();
    const StackEntry& lhs = stack[n - 2];
    const StackEntry& rhs = stack[n - 1];

    if (lhs.kind == StackEntry::Kind::Constant && rhs.kind == StackEntry::Kind::Constant) {
        const int64_t a = lhs.value;
        const int64_t b = rhs.value;
        const auto ua = static_cast<uint32_t>(lhs.value);
        const auto ub = static_cast<uint32_t>(rhs.value);
        int64_t result = 0;
        switch (op) {
            case Op::Add: result = a + b; break;
            case Op::Sub: result = a - b; break;
            case Op::Mul: result = a * b; break;
            case Op::Div: case Op::Rem:
                if (b == 0) {
                    unsupported("constant division by zero");
                }
                result = op == Op::Div ? a / b : a % b;
                break;
            case Op::Div_un: case Op::Rem_un:
                if (b == 0) {
                    unsupported("constant division by zero");
                }
                result = op == Op::Div_un ? ua / ub : ua % ub;
                break;
            case Op::And: result = a & b; break;
            case Op::Or: result = a | b; break;
            case Op::Xor: result = a ^ b; break;
            case Op::Shl: result = a << (b & 31); break;
            case Op::Shr: result = a >> (b & 31); break;
            case Op::Shr_un: result = ua >> (b & 31); break;
            default:
                unsupported(opText(op) + " is not supported");
        }
        discard(n - 2);
        loadConstant(result);
        return;
    }

    if (rhs.kind != StackEntry::Kind::Constant || lhs.kind != StackEntry::Kind::Runtime || lhs.width != 1) {
        unsupported(opText(op) + " needs a byte value and a constant");
    }
    const int32_t c = rhs.value;
    discard(n - 1);
    if (!stack.back().inRegisters) {
        unsupported(opText(op) + " on a value that is not in registers");
    }

    const auto operand = static_cast<uint8_t>(c & 0xFF);
    switch (op) {
        case Op::Add:
            out.code.emit(I::implied(M::CLC)).emit(I::imm(M::ADC, operand));
            break;
        case Op::Sub:
            out.code.emit(I::implied(M::SEC)).emit(I::imm(M::SBC, operand));
            break;
        case Op::And: out.code.emit(I::imm(M::AND, operand)); break;
        case Op::Or: out.code.emit(I::imm(M::ORA, operand)); break;
        case Op::Xor: out.code.emit(I::imm(M::EOR, operand)); break;
        case Op::Shl:
        case Op::Shr:
        case Op::Shr_un:
            if (c < 0 || c > 7) {
                unsupported("shift count " + std::to_string(c) + " on a byte");
            }
            for (int32_t i = 0; i < c; ++i) {
                out.code.emit(I::accumulator(op == Op::Shl ? M::ASL : M::LSR));
            }
            break;
        default:
            unsupported(opText(op) + " on runtime values");
    }
}

void Translator::convert(Op op)
{
    StackEntry& entry = top();
    const bool toByte = op == Op::Conv_u1 || op == Op::Conv_i1;
    const bool toWord = op == Op::Conv_u2 || op == Op::Conv_i2;

    if (entry.kind == StackEntry::Kind::Runtime) {
        if (toByte) {
            entry.width = 1;
        }
        return;
    }
    if (entry.kind != StackEntry::Kind::Constant || !(toByte || toWord)) {
        return;
    }

    int64_t value = entry.value;
    switch (op) {
        case Op::Conv_u1: value = static_cast<uint8_t>(value); break;
        case Op::Conv_i1: value = static_cast<int8_t>(value); break;
        case Op::Conv_u2: value = static_cast<uint16_t>(value); break;
        default: value = static_cast<int16_t>(value); break;
    }
    if (value != entry.value) {
        discard(stack.size() - 1);
        loadConstant(value);
    }
}

// ============================================================================
// Calls
// ============================================================================

void Translator::call(const std::string& name)
{
    if (name == "InitializeArray") {
        initializeArray();
        return;
    }
    if (auto base = nes::nametableBase(name)) {
        foldNametable(*base);
        return;
    }

    const nes::LibraryCall* shape = nes::findLibraryCall(name);
    if (!shape) {
        throw NotFound(name + " at " + ilLabel(current));
    }
    SubroutineCatalog::standard().lookup(name);

    const size_t arity = shape->arity;
    require(arity);
    const size_t base = stack.size() - arity;

    if (arity == 0) {
        spill(true);
    } else {
        // Deferred addresses among the leading arguments emitted no code, so
        // pushing them now keeps the argument order.
        for (size_t j = 0; j + 1 < arity; ++j) {
            StackEntry& arg = stack[base + j];
            if (arg.pushed) {
                continue;
            }
            bool laterDeferred = true;
            for (size_t k = j + 1; k < arity; ++k) {
                const StackEntry& later = stack[base + k];
                laterDeferred = laterDeferred && later.kind == StackEntry::Kind::Address && !later.pushed;
            }
            if (arg.kind != StackEntry::Kind::Address || !laterDeferred) {
                unsupported("argument " + std::to_string(j + 1) + " of " + name + " is not on the stack");
            }
            materializeAddress(arg, false);
            arg.pushIndex = out.code.count();
            out.code.emit(I::abs(M::JSR, "pushax"));
            arg.pushed = true;
        }

        // Last to first: widening a pushed argument inserts code after it.
        passArgument(stack[base + arity - 1], shape->args[arity - 1], true);
        for (size_t j = arity - 1; j-- > 0;) {
            passArgument(stack[base + j], shape->args[j], false);
        }
    }

    out.code.emit(I::abs(M::JSR, name));
    out.calls.insert(name);
    stack.resize(base);

    if (shape->returnsValue) {
        StackEntry result;
        result.kind = StackEntry::Kind::Runtime;
        result.width = 1;
        result.codeStart = out.code.count();
        result.origin = current;
        result.inRegisters = true;
        pushEntry(std::move(result));
    }
}

void Translator::materializeAddress(const StackEntry& entry, bool buffer)
{
    out.code.emit(I::immLow(M::LDA, entry.label))
            .emit(I::immHigh(M::LDX, entry.label));
    if (buffer) {
        const auto length = static_cast<uint16_t>(entry.length);
        out.code.emit(I::abs(M::JSR, "pushax"))
                .emit(I::imm(M::LDX, static_cast<uint8_t>(length >> 8)))
                .emit(I::imm(M::LDA, static_cast<uint8_t>(length & 0xFF)));
    }
}

void Translator::passArgument(StackEntry& arg, nes::ArgKind kind, bool last)
{
    const std::string kindName(nes::argKindName(kind));
    const bool isAddress = arg.kind == StackEntry::Kind::Address;

    if (arg.kind == StackEntry::Kind::Token) {
        unsupported("metadata token passed as " + kindName + " argument");
    }
    if (last && !arg.inRegisters && !(isAddress && !arg.pushed)) {
        unsupported(kindName + " argument is not in registers");
    }
    if (!last && !arg.pushed) {
        unsupported(kindName + " argument is not on the stack");
    }

    switch (kind) {
        case nes::ArgKind::Byte:
            if (isAddress) {
                unsupported("address passed as byte argument");
            }
            if (arg.kind == StackEntry::Kind::Constant && arg.width != 1) {
                unsupported("constant " + std::to_string(arg.value) + " passed as byte argument");
            }
            if (!last && arg.width != 1) {
                unsupported("16-bit value passed as byte argument");
            }
            return;

        case nes::ArgKind::Buffer:
            if (!isAddress || !last) {
                unsupported("buffer argument must be literal data passed last");
            }
            materializeAddress(arg, true);
            return;

        case nes::ArgKind::Word:
        case nes::ArgKind::Pointer:
            if (isAddress) {
                if (last) {
                    materializeAddress(arg, false);
                }
                return;
            }
            if (arg.width == 2) {
                return;
            }
            {
                // Zero- or sign-extend a byte value into X.
                const uint8_t high = (arg.kind == StackEntry::Kind::Constant && arg.value < 0) ? 0xFF : 0x00;
                if (last) {
                    out.code.emit(I::imm(M::LDX, high));
                } else {
                    out.code.replace(arg.pushIndex, {I::imm(M::LDX, high), I::abs(M::JSR, "pushax")});
                }
            }
            return;
    }
}

/**
 * NTADR_A..D(x, y) with literal coordinates become one 16-bit constant.
 */
void Translator::foldNametable(uint16_t base)
{
    require(2);
    const size_t n = stack.size();
    const StackEntry& x = stack[n - 2];
    const StackEntry& y = stack[n - 1];
    if (x.kind != StackEntry::Kind::Constant || y.kind != StackEntry::Kind::Constant ||
        x.value < 0 || x.value > 31 || y.value < 0 || y.value > 31) {
        unsupported("nametable coordinates must be constants in 0..31");
    }
    const uint16_t address = nes::ntadr(base, static_cast<uint8_t>(x.value), static_cast<uint8_t>(y.value));
    discard(n - 2);
    loadConstant(address);
}

void Translator::initializeArray()
{
    require(2);
    const size_t n = stack.size();
    const StackEntry& array = stack[n - 2];
    const StackEntry& token = stack[n - 1];
    if (array.kind != StackEntry::Kind::Address || token.kind != StackEntry::Kind::Token) {
        unsupported("InitializeArray needs a new array and a field token");
    }
    auto it = std::find_if(arrays.begin(), arrays.end(),
                           [&](const PendingArray& a) { return a.label == array.label; });
    if (it == arrays.end()) {
        unsupported("InitializeArray on something other than a new array");
    }
    if (token.bytes.size() < it->length) {
        unsupported("array initializer shorter than the array");
    }
    it->data.assign(token.bytes.begin(), token.bytes.begin() + static_cast<std::ptrdiff_t>(it->length));
    it->initialized = true;
    pop();
    pop();
}

// ============================================================================
// Control flow
// ============================================================================

void Translator::branch(const ILInstruction& instr)
{
    out.code.emit(I::abs(M::JMP, ilLabel(instr.branchTarget())));
}

void Translator::conditionalBranch(const ILInstruction& instr)
{
    StackEntry value = pop();
    if (value.kind == StackEntry::Kind::Address || value.kind == StackEntry::Kind::Token) {
        unsupported("branch on an address");
    }
    if (!value.inRegisters || value.width != 1) {
        unsupported("branch condition must be a byte in registers");
    }
    const bool onTrue = instr.opcode == Op::Brtrue || instr.opcode == Op::Brtrue_s;
    out.code.emit(I::imm(M::CMP, 0x00))
            .emit(longBranch(onTrue ? M::BNE : M::BEQ, ilLabel(instr.branchTarget())));
}

/**
 * Compare-and-branch against a literal. Values are bytes and compare
 * unsigned; x > c and x <= c are rewritten as x >= c+1 and x < c+1.
 */
void Translator::compareBranch(const ILInstruction& instr)
{
    require(2);
    const size_t n = stack.size();
    const StackEntry& rhs = stack[n - 1];
    const StackEntry& lhs = stack[n - 2];
    if (rhs.kind != StackEntry::Kind::Constant || rhs.value < 0 || rhs.value > 0xFF) {
        unsupported("comparison needs a byte constant on the right");
    }
    if ((lhs.kind != StackEntry::Kind::Runtime && lhs.kind != StackEntry::Kind::Constant) || lhs.width != 1) {
        unsupported("comparison needs a byte value on the left");
    }
    int32_t c = rhs.value;
    discard(n - 1);
    if (!stack.back().inRegisters) {
        unsupported("comparison of a value that is not in registers");
    }
    pop();

    const std::string target = ilLabel(instr.branchTarget());
    M mnemonic = M::BEQ;
    switch (instr.opcode) {
        case Op::Beq: case Op::Beq_s:
            mnemonic = M::BEQ;
            break;
        case Op::Bne_un: case Op::Bne_un_s:
            mnemonic = M::BNE;
            break;
        case Op::Blt: case Op::Blt_s: case Op::Blt_un: case Op::Blt_un_s:
            mnemonic = M::BCC;
            break;
        case Op::Bge: case Op::Bge_s: case Op::Bge_un: case Op::Bge_un_s:
            mnemonic = M::BCS;
            break;
        case Op::Bgt: case Op::Bgt_s: case Op::Bgt_un: case Op::Bgt_un_s:
            if (c == 0xFF) {
                return;     // never taken
            }
            mnemonic = M::BCS;
            ++c;
            break;
        default:            // ble
            if (c == 0xFF) {
                out.code.emit(I::abs(M::JMP, target));
                return;
            }
            mnemonic = M::BCC;
            ++c;
            break;
    }
    out.code.emit(I::imm(M::CMP, static_cast<uint8_t>(c)))
            .emit(longBranch(mnemonic, target));
}

// There is nothing to return to: park the CPU in a jump-to-self loop.
void Translator::ret()
{
    if (haltEmitted) {
        out.code.emit(I::abs(M::JMP, "@halt"));
        return;
    }
    out.code.emit(I::abs(M::JMP, "@halt"), "@halt");
    haltEmitted = true;
}
