//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2018 Western Digital Corporation or its affiliates.
//
// This program is free software: you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option)
// any later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
// more details.
//
// You should have received a copy of the GNU General Public License along with
// this program. If not, see <https://www.gnu.org/licenses/>.
//

#include "CtrlSignals.hpp"


using namespace Kestrel;


const char*
Kestrel::aluOpName(AluOp op)
{
  switch (op)
    {
    case AluOp::Add:    return "add";
    case AluOp::Sub:    return "sub";
    case AluOp::Xor:    return "xor";
    case AluOp::Or:     return "or";
    case AluOp::And:    return "and";
    case AluOp::Xnor:   return "xnor";
    case AluOp::Orn:    return "orn";
    case AluOp::Andn:   return "andn";
    case AluOp::Sra:    return "sra";
    case AluOp::Srl:    return "srl";
    case AluOp::Sll:    return "sll";
    case AluOp::Sro:    return "sro";
    case AluOp::Slo:    return "slo";
    case AluOp::Ror:    return "ror";
    case AluOp::Rol:    return "rol";
    case AluOp::Grev:   return "grev";
    case AluOp::Gorc:   return "gorc";
    case AluOp::Shfl:   return "shfl";
    case AluOp::Unshfl: return "unshfl";
    case AluOp::Lt:     return "lt";
    case AluOp::Ltu:    return "ltu";
    case AluOp::Ge:     return "ge";
    case AluOp::Geu:    return "geu";
    case AluOp::Eq:     return "eq";
    case AluOp::Ne:     return "ne";
    case AluOp::Min:    return "min";
    case AluOp::Minu:   return "minu";
    case AluOp::Max:    return "max";
    case AluOp::Maxu:   return "maxu";
    case AluOp::Pack:   return "pack";
    case AluOp::Packu:  return "packu";
    case AluOp::Packh:  return "packh";
    case AluOp::Sextb:  return "sextb";
    case AluOp::Sexth:  return "sexth";
    case AluOp::Clz:    return "clz";
    case AluOp::Ctz:    return "ctz";
    case AluOp::Pcnt:   return "pcnt";
    case AluOp::Slt:    return "slt";
    case AluOp::Sltu:   return "sltu";
    case AluOp::Cmov:   return "cmov";
    case AluOp::Cmix:   return "cmix";
    case AluOp::Fsl:    return "fsl";
    case AluOp::Fsr:    return "fsr";
    case AluOp::Sbset:  return "sbset";
    case AluOp::Sbclr:  return "sbclr";
    case AluOp::Sbinv:  return "sbinv";
    case AluOp::Sbext:  return "sbext";
    }
  return "?";
}


const char*
Kestrel::opASelName(OpASel sel)
{
  switch (sel)
    {
    case OpASel::RegA:   return "rega";
    case OpASel::CurrPc: return "pc";
    case OpASel::ImmZ:   return "immz";
    case OpASel::Zero:   return "zero";
    }
  return "?";
}


const char*
Kestrel::opBSelName(OpBSel sel)
{
  return sel == OpBSel::RegB ? "regb" : "imm";
}


const char*
Kestrel::immBSelName(ImmBSel sel)
{
  switch (sel)
    {
    case ImmBSel::I:      return "i";
    case ImmBSel::S:      return "s";
    case ImmBSel::B:      return "b";
    case ImmBSel::U:      return "u";
    case ImmBSel::J:      return "j";
    case ImmBSel::IncrPc: return "incr";
    }
  return "?";
}


const char*
Kestrel::mdOpName(MdOp op)
{
  switch (op)
    {
    case MdOp::Mull: return "mull";
    case MdOp::Mulh: return "mulh";
    case MdOp::Div:  return "div";
    case MdOp::Rem:  return "rem";
    }
  return "?";
}


const char*
Kestrel::ipmOpName(IpmOp op)
{
  switch (op)
    {
    case IpmOp::Mul:      return "mul";
    case IpmOp::Homog:    return "homog";
    case IpmOp::Square:   return "square";
    case IpmOp::MulConst: return "mulconst";
    case IpmOp::Unmask:   return "unmask";
    case IpmOp::Mask:     return "mask";
    }
  return "?";
}


const char*
Kestrel::csrOpName(CsrOp op)
{
  switch (op)
    {
    case CsrOp::Read:  return "read";
    case CsrOp::Write: return "write";
    case CsrOp::Set:   return "set";
    case CsrOp::Clear: return "clear";
    }
  return "?";
}


const char*
Kestrel::memTypeName(MemType type)
{
  switch (type)
    {
    case MemType::Word: return "word";
    case MemType::Half: return "half";
    case MemType::Byte: return "byte";
    }
  return "?";
}


const char*
Kestrel::trapName(TrapKind trap)
{
  switch (trap)
    {
    case TrapKind::None:   return "none";
    case TrapKind::Ecall:  return "ecall";
    case TrapKind::Ebreak: return "ebreak";
    case TrapKind::Mret:   return "mret";
    case TrapKind::Dret:   return "dret";
    case TrapKind::Wfi:    return "wfi";
    }
  return "?";
}
