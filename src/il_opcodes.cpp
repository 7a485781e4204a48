#include "il_opcodes.hpp"
#include <array>

namespace il {

namespace {

using T = OperandType;

constexpr OpcodeInfo OPCODES[] = {
    {Op::Nop, "nop", T::None}, {Op::Break, "break", T::None},
    {Op::Ldarg_0, "ldarg.0", T::None}, {Op::Ldarg_1, "ldarg.1", T::None},
    {Op::Ldarg_2, "ldarg.2", T::None}, {Op::Ldarg_3, "ldarg.3", T::None},
    {Op::Ldloc_0, "ldloc.0", T::None}, {Op::Ldloc_1, "ldloc.1", T::None},
    {Op::Ldloc_2, "ldloc.2", T::None}, {Op::Ldloc_3, "ldloc.3", T::None},
    {Op::Stloc_0, "stloc.0", T::None}, {Op::Stloc_1, "stloc.1", T::None},
    {Op::Stloc_2, "stloc.2", T::None}, {Op::Stloc_3, "stloc.3", T::None},
    {Op::Ldarg_s, "ldarg.s", T::ShortVariable}, {Op::Ldarga_s, "ldarga.s", T::ShortVariable},
    {Op::Starg_s, "starg.s", T::ShortVariable}, {Op::Ldloc_s, "ldloc.s", T::ShortVariable},
    {Op::Ldloca_s, "ldloca.s", T::ShortVariable}, {Op::Stloc_s, "stloc.s", T::ShortVariable},
    {Op::Ldnull, "ldnull", T::None},
    {Op::Ldc_i4_m1, "ldc.i4.m1", T::None}, {Op::Ldc_i4_0, "ldc.i4.0", T::None},
    {Op::Ldc_i4_1, "ldc.i4.1", T::None}, {Op::Ldc_i4_2, "ldc.i4.2", T::None},
    {Op::Ldc_i4_3, "ldc.i4.3", T::None}, {Op::Ldc_i4_4, "ldc.i4.4", T::None},
    {Op::Ldc_i4_5, "ldc.i4.5", T::None}, {Op::Ldc_i4_6, "ldc.i4.6", T::None},
    {Op::Ldc_i4_7, "ldc.i4.7", T::None}, {Op::Ldc_i4_8, "ldc.i4.8", T::None},
    {Op::Ldc_i4_s, "ldc.i4.s", T::ShortI}, {Op::Ldc_i4, "ldc.i4", T::I},
    {Op::Ldc_i8, "ldc.i8", T::I8}, {Op::Ldc_r4, "ldc.r4", T::ShortR}, {Op::Ldc_r8, "ldc.r8", T::R},
    {Op::Dup, "dup", T::None}, {Op::Pop, "pop", T::None},
    {Op::Jmp, "jmp", T::Method}, {Op::Call, "call", T::Method}, {Op::Calli, "calli", T::Sig},
    {Op::Ret, "ret", T::None},
    {Op::Br_s, "br.s", T::ShortBrTarget}, {Op::Brfalse_s, "brfalse.s", T::ShortBrTarget},
    {Op::Brtrue_s, "brtrue.s", T::ShortBrTarget}, {Op::Beq_s, "beq.s", T::ShortBrTarget},
    {Op::Bge_s, "bge.s", T::ShortBrTarget}, {Op::Bgt_s, "bgt.s", T::ShortBrTarget},
    {Op::Ble_s, "ble.s", T::ShortBrTarget}, {Op::Blt_s, "blt.s", T::ShortBrTarget},
    {Op::Bne_un_s, "bne.un.s", T::ShortBrTarget}, {Op::Bge_un_s, "bge.un.s", T::ShortBrTarget},
    {Op::Bgt_un_s, "bgt.un.s", T::ShortBrTarget}, {Op::Ble_un_s, "ble.un.s", T::ShortBrTarget},
    {Op::Blt_un_s, "blt.un.s", T::ShortBrTarget},
    {Op::Br, "br", T::BrTarget}, {Op::Brfalse, "brfalse", T::BrTarget},
    {Op::Brtrue, "brtrue", T::BrTarget}, {Op::Beq, "beq", T::BrTarget},
    {Op::Bge, "bge", T::BrTarget}, {Op::Bgt, "bgt", T::BrTarget},
    {Op::Ble, "ble", T::BrTarget}, {Op::Blt, "blt", T::BrTarget},
    {Op::Bne_un, "bne.un", T::BrTarget}, {Op::Bge_un, "bge.un", T::BrTarget},
    {Op::Bgt_un, "bgt.un", T::BrTarget}, {Op::Ble_un, "ble.un", T::BrTarget},
    {Op::Blt_un, "blt.un", T::BrTarget},
    {Op::Switch, "switch", T::Switch},
    {Op::Ldind_i1, "ldind.i1", T::None}, {Op::Ldind_u1, "ldind.u1", T::None},
    {Op::Ldind_i2, "ldind.i2", T::None}, {Op::Ldind_u2, "ldind.u2", T::None},
    {Op::Ldind_i4, "ldind.i4", T::None}, {Op::Ldind_u4, "ldind.u4", T::None},
    {Op::Ldind_i8, "ldind.i8", T::None}, {Op::Ldind_i, "ldind.i", T::None},
    {Op::Ldind_r4, "ldind.r4", T::None}, {Op::Ldind_r8, "ldind.r8", T::None},
    {Op::Ldind_ref, "ldind.ref", T::None}, {Op::Stind_ref, "stind.ref", T::None},
    {Op::Stind_i1, "stind.i1", T::None}, {Op::Stind_i2, "stind.i2", T::None},
    {Op::Stind_i4, "stind.i4", T::None}, {Op::Stind_i8, "stind.i8", T::None},
    {Op::Stind_r4, "stind.r4", T::None}, {Op::Stind_r8, "stind.r8", T::None},
    {Op::Add, "add", T::None}, {Op::Sub, "sub", T::None}, {Op::Mul, "mul", T::None},
    {Op::Div, "div", T::None}, {Op::Div_un, "div.un", T::None}, {Op::Rem, "rem", T::None},
    {Op::Rem_un, "rem.un", T::None}, {Op::And, "and", T::None}, {Op::Or, "or", T::None},
    {Op::Xor, "xor", T::None}, {Op::Shl, "shl", T::None}, {Op::Shr, "shr", T::None},
    {Op::Shr_un, "shr.un", T::None}, {Op::Neg, "neg", T::None}, {Op::Not, "not", T::None},
    {Op::Conv_i1, "conv.i1", T::None}, {Op::Conv_i2, "conv.i2", T::None},
    {Op::Conv_i4, "conv.i4", T::None}, {Op::Conv_i8, "conv.i8", T::None},
    {Op::Conv_r4, "conv.r4", T::None}, {Op::Conv_r8, "conv.r8", T::None},
    {Op::Conv_u4, "conv.u4", T::None}, {Op::Conv_u8, "conv.u8", T::None},
    {Op::Callvirt, "callvirt", T::Method}, {Op::Cpobj, "cpobj", T::Type},
    {Op::Ldobj, "ldobj", T::Type}, {Op::Ldstr, "ldstr", T::String},
    {Op::Newobj, "newobj", T::Method}, {Op::Castclass, "castclass", T::Type},
    {Op::Isinst, "isinst", T::Type}, {Op::Conv_r_un, "conv.r.un", T::None},
    {Op::Unbox, "unbox", T::Type}, {Op::Throw, "throw", T::None},
    {Op::Ldfld, "ldfld", T::Field}, {Op::Ldflda, "ldflda", T::Field},
    {Op::Stfld, "stfld", T::Field}, {Op::Ldsfld, "ldsfld", T::Field},
    {Op::Ldsflda, "ldsflda", T::Field}, {Op::Stsfld, "stsfld", T::Field},
    {Op::Stobj, "stobj", T::Type},
    {Op::Conv_ovf_i1_un, "conv.ovf.i1.un", T::None}, {Op::Conv_ovf_i2_un, "conv.ovf.i2.un", T::None},
    {Op::Conv_ovf_i4_un, "conv.ovf.i4.un", T::None}, {Op::Conv_ovf_i8_un, "conv.ovf.i8.un", T::None},
    {Op::Conv_ovf_u1_un, "conv.ovf.u1.un", T::None}, {Op::Conv_ovf_u2_un, "conv.ovf.u2.un", T::None},
    {Op::Conv_ovf_u4_un, "conv.ovf.u4.un", T::None}, {Op::Conv_ovf_u8_un, "conv.ovf.u8.un", T::None},
    {Op::Conv_ovf_i_un, "conv.ovf.i.un", T::None}, {Op::Conv_ovf_u_un, "conv.ovf.u.un", T::None},
    {Op::Box, "box", T::Type}, {Op::Newarr, "newarr", T::Type},
    {Op::Ldlen, "ldlen", T::None}, {Op::Ldelema, "ldelema", T::Type},
    {Op::Ldelem_i1, "ldelem.i1", T::None}, {Op::Ldelem_u1, "ldelem.u1", T::None},
    {Op::Ldelem_i2, "ldelem.i2", T::None}, {Op::Ldelem_u2, "ldelem.u2", T::None},
    {Op::Ldelem_i4, "ldelem.i4", T::None}, {Op::Ldelem_u4, "ldelem.u4", T::None},
    {Op::Ldelem_i8, "ldelem.i8", T::None}, {Op::Ldelem_i, "ldelem.i", T::None},
    {Op::Ldelem_r4, "ldelem.r4", T::None}, {Op::Ldelem_r8, "ldelem.r8", T::None},
    {Op::Ldelem_ref, "ldelem.ref", T::None},
    {Op::Stelem_i, "stelem.i", T::None}, {Op::Stelem_i1, "stelem.i1", T::None},
    {Op::Stelem_i2, "stelem.i2", T::None}, {Op::Stelem_i4, "stelem.i4", T::None},
    {Op::Stelem_i8, "stelem.i8", T::None}, {Op::Stelem_r4, "stelem.r4", T::None},
    {Op::Stelem_r8, "stelem.r8", T::None}, {Op::Stelem_ref, "stelem.ref", T::None},
    {Op::Ldelem, "ldelem", T::Type}, {Op::Stelem, "stelem", T::Type},
    {Op::Unbox_any, "unbox.any", T::Type},
    {Op::Conv_ovf_i1, "conv.ovf.i1", T::None}, {Op::Conv_ovf_u1, "conv.ovf.u1", T::None},
    {Op::Conv_ovf_i2, "conv.ovf.i2", T::None}, {Op::Conv_ovf_u2, "conv.ovf.u2", T::None},
    {Op::Conv_ovf_i4, "conv.ovf.i4", T::None}, {Op::Conv_ovf_u4, "conv.ovf.u4", T::None},
    {Op::Conv_ovf_i8, "conv.ovf.i8", T::None}, {Op::Conv_ovf_u8, "conv.ovf.u8", T::None},
    {Op::Refanyval, "refanyval", T::Type}, {Op::Ckfinite, "ckfinite", T::None},
    {Op::Mkrefany, "mkrefany", T::Type},
    {Op::Ldtoken, "ldtoken", T::Tok}, {Op::Conv_u2, "conv.u2", T::None},
    {Op::Conv_u1, "conv.u1", T::None}, {Op::Conv_i, "conv.i", T::None},
    {Op::Conv_ovf_i, "conv.ovf.i", T::None}, {Op::Conv_ovf_u, "conv.ovf.u", T::None},
    {Op::Add_ovf, "add.ovf", T::None}, {Op::Add_ovf_un, "add.ovf.un", T::None},
    {Op::Mul_ovf, "mul.ovf", T::None}, {Op::Mul_ovf_un, "mul.ovf.un", T::None},
    {Op::Sub_ovf, "sub.ovf", T::None}, {Op::Sub_ovf_un, "sub.ovf.un", T::None},
    {Op::Endfinally, "endfinally", T::None}, {Op::Leave, "leave", T::BrTarget},
    {Op::Leave_s, "leave.s", T::ShortBrTarget}, {Op::Stind_i, "stind.i", T::None},
    {Op::Conv_u, "conv.u", T::None},

    {Op::Arglist, "arglist", T::None}, {Op::Ceq, "ceq", T::None},
    {Op::Cgt, "cgt", T::None}, {Op::Cgt_un, "cgt.un", T::None},
    {Op::Clt, "clt", T::None}, {Op::Clt_un, "clt.un", T::None},
    {Op::Ldftn, "ldftn", T::Method}, {Op::Ldvirtftn, "ldvirtftn", T::Method},
    {Op::Ldarg, "ldarg", T::Variable}, {Op::Ldarga, "ldarga", T::Variable},
    {Op::Starg, "starg", T::Variable}, {Op::Ldloc, "ldloc", T::Variable},
    {Op::Ldloca, "ldloca", T::Variable}, {Op::Stloc, "stloc", T::Variable},
    {Op::Localloc, "localloc", T::None}, {Op::Endfilter, "endfilter", T::None},
    {Op::Unaligned, "unaligned.", T::ShortI}, {Op::Volatile, "volatile.", T::None},
    {Op::Tail, "tail.", T::None}, {Op::Initobj, "initobj", T::Type},
    {Op::Constrained, "constrained.", T::Type}, {Op::Cpblk, "cpblk", T::None},
    {Op::Initblk, "initblk", T::None}, {Op::No, "no.", T::ShortI},
    {Op::Rethrow, "rethrow", T::None}, {Op::Sizeof, "sizeof", T::Type},
    {Op::Refanytype, "refanytype", T::None}, {Op::Readonly, "readonly.", T::None},
};

// Index: single-byte opcodes at 0x000-0x0FF, extended at 0x100-0x1FF.
struct LookupTable {
    std::array<const OpcodeInfo*, 512> slots{};

    LookupTable() {
        for (const auto& info : OPCODES) {
            slots[indexOf(static_cast<uint16_t>(info.code))] = &info;
        }
    }

    static size_t indexOf(uint16_t value) {
        return (value >> 8) == EXTENDED_PREFIX ? 0x100 + (value & 0xFF) : value;
    }
};

const LookupTable& table() {
    static const LookupTable t;
    return t;
}

} // namespace

const OpcodeInfo* lookup(uint16_t value) noexcept {
    if (value > 0xFF && (value >> 8) != EXTENDED_PREFIX) {
        return nullptr;
    }
    return table().slots[LookupTable::indexOf(value)];
}

std::string_view opName(Op op) noexcept {
    const OpcodeInfo* info = lookup(static_cast<uint16_t>(op));
    return info ? info->name : "???";
}

size_t operandSize(OperandType type) noexcept {
    switch (type) {
        case OperandType::None:
            return 0;
        case OperandType::ShortBrTarget:
        case OperandType::ShortI:
        case OperandType::ShortVariable:
            return 1;
        case OperandType::Variable:
            return 2;
        case OperandType::I8:
        case OperandType::R:
            return 8;
        default:
            return 4;
    }
}

bool isConditionalBranch(Op op) noexcept {
    auto v = static_cast<uint16_t>(op);
    return (v >= 0x2C && v <= 0x37) || (v >= 0x39 && v <= 0x44);
}

bool isUnconditionalBranch(Op op) noexcept {
    return op == Op::Br || op == Op::Br_s || op == Op::Leave || op == Op::Leave_s;
}

} // namespace il
