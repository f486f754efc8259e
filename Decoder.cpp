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

#include "Decoder.hpp"
#include "instforms.hpp"


using namespace Kestrel;


/// Combine the funct7 and funct3 fields of an OP instruction into a
/// single dispatch key.
static constexpr
unsigned
opKey(unsigned funct7, unsigned funct3)
{
  return (funct7 << 3) | funct3;
}


CsrOp
Kestrel::applyCsrZeroRule(CsrOp op, unsigned rs1Field)
{
  if ((op == CsrOp::Set or op == CsrOp::Clear) and rs1Field == 0)
    return CsrOp::Read;
  return op;
}


void
Kestrel::suppressCommitting(DecoderSignals& sig)
{
  sig.rfWe = false;
  sig.dataReq = false;
  sig.dataWe = false;
  sig.jumpInDec = false;
  sig.jumpSet = false;
  sig.branchInDec = false;
  sig.csrAccess = false;
  sig.icacheInval = false;
  sig.trap = TrapKind::None;
}


bool
Decoder::isLegalShiftImm(uint32_t inst) const
{
  IFormInst iform(inst);
  unsigned funct3 = iform.fields.funct3;
  unsigned top5 = iform.top5();
  unsigned bits26_25 = (inst >> 25) & 3;
  bool bit26 = (inst >> 26) & 1;
  bool rvb = params_.rv32b;

  if (funct3 == 1)
    {
      switch (top5)
	{
	case 0x00: return bits26_25 == 0;        // slli
	case 0x04:                               // sloi
	case 0x09:                               // sbclri
	case 0x05:                               // sbseti
	case 0x0d: return rvb;                   // sbinvi
	case 0x01: return rvb and not bit26;     // shfli
	case 0x0c:
	  {
	    // Unary operations selected by instr[26:20].
	    unsigned sel = (inst >> 20) & 0x7f;
	    if (sel == 0 or sel == 1 or sel == 2)  // clz ctz pcnt
	      return rvb;
	    if (sel == 4 or sel == 5)              // sext.b sext.h
	      return rvb;
	    return false;
	  }
	default:   return false;
	}
    }

  // Funct3 is 5. Bit 26 selects the funnel shift.
  if (bit26)
    return rvb;                                  // fsri

  switch (top5)
    {
    case 0x00:                                   // srli
    case 0x08: return bits26_25 == 0;            // srai
    case 0x04:                                   // sroi
    case 0x0c:                                   // rori
    case 0x09:                                   // sbexti
    case 0x0d:                                   // grevi
    case 0x05:                                   // gorci
    case 0x01: return rvb;                       // unshfli
    default:   return false;
    }
}


bool
Decoder::decodeOp(uint32_t inst, DecoderSignals& sig) const
{
  RFormInst rform(inst);
  unsigned funct7 = rform.bits.funct7, funct3 = rform.bits.funct3;

  // Ternary family: cmix, cmov, fsl, fsr. Bits 31:27 hold rs3.
  if (((inst >> 26) & 1) and (funct3 & 3) == 1)
    return params_.rv32b;

  bool rvb = params_.rv32b, rvm = params_.rv32m;

  switch (opKey(funct7, funct3))
    {
    case opKey(0x00, 0):  // add
    case opKey(0x20, 0):  // sub
    case opKey(0x00, 2):  // slt
    case opKey(0x00, 3):  // sltu
    case opKey(0x00, 4):  // xor
    case opKey(0x00, 6):  // or
    case opKey(0x00, 7):  // and
    case opKey(0x00, 1):  // sll
    case opKey(0x00, 5):  // srl
    case opKey(0x20, 5):  // sra
      return true;

    case opKey(0x20, 7):  // andn
    case opKey(0x20, 6):  // orn
    case opKey(0x20, 4):  // xnor
    case opKey(0x10, 1):  // slo
    case opKey(0x10, 5):  // sro
    case opKey(0x30, 1):  // rol
    case opKey(0x30, 5):  // ror
    case opKey(0x05, 4):  // min
    case opKey(0x05, 5):  // max
    case opKey(0x05, 6):  // minu
    case opKey(0x05, 7):  // maxu
    case opKey(0x04, 4):  // pack
    case opKey(0x24, 4):  // packu
    case opKey(0x04, 7):  // packh
    case opKey(0x24, 1):  // sbclr
    case opKey(0x14, 1):  // sbset
    case opKey(0x34, 1):  // sbinv
    case opKey(0x24, 5):  // sbext
    case opKey(0x34, 5):  // grev
    case opKey(0x14, 5):  // gorc
    case opKey(0x04, 1):  // shfl
    case opKey(0x04, 5):  // unshfl
      return rvb;

    case opKey(0x01, 0):  // mul
      sig.mdOp = MdOp::Mull; sig.mdSignedMode = 0;
      return rvm;
    case opKey(0x01, 1):  // mulh
      sig.mdOp = MdOp::Mulh; sig.mdSignedMode = 3;
      return rvm;
    case opKey(0x01, 2):  // mulhsu
      sig.mdOp = MdOp::Mulh; sig.mdSignedMode = 1;
      return rvm;
    case opKey(0x01, 3):  // mulhu
      sig.mdOp = MdOp::Mulh; sig.mdSignedMode = 0;
      return rvm;
    case opKey(0x01, 4):  // div
      sig.mdOp = MdOp::Div; sig.mdSignedMode = 3;
      return rvm;
    case opKey(0x01, 5):  // divu
      sig.mdOp = MdOp::Div; sig.mdSignedMode = 0;
      return rvm;
    case opKey(0x01, 6):  // rem
      sig.mdOp = MdOp::Rem; sig.mdSignedMode = 3;
      return rvm;
    case opKey(0x01, 7):  // remu
      sig.mdOp = MdOp::Rem; sig.mdSignedMode = 0;
      return rvm;

    default:
      return false;
    }
}


bool
Decoder::decodeSystem(uint32_t inst, DecoderSignals& sig) const
{
  RegFields rf(inst);
  bool legal = true;

  if (rf.funct3 == 0)
    {
      switch (inst >> 20)
	{
	case 0x000: sig.trap = TrapKind::Ecall;  break;
	case 0x001: sig.trap = TrapKind::Ebreak; break;
	case 0x302: sig.trap = TrapKind::Mret;   break;
	case 0x7b2: sig.trap = TrapKind::Dret;   break;
	case 0x105: sig.trap = TrapKind::Wfi;    break;
	default:    legal = false;               break;
	}

      // Rs1 and rd must be zero.
      if (rf.rs1 != 0 or rf.rd != 0)
	legal = false;
      return legal;
    }

  // CSR access. With funct3 bit 2 set the rs1 field is an immediate.
  sig.csrAccess = true;
  sig.rfWdSel = RfWdSel::Csr;
  sig.rfWe = true;
  sig.rfRenA = (rf.funct3 & 4) == 0;

  switch (rf.funct3 & 3)
    {
    case 1:  sig.csrOp = CsrOp::Write; break;
    case 2:  sig.csrOp = CsrOp::Set;   break;
    case 3:  sig.csrOp = CsrOp::Clear; break;
    default: legal = false;            break;
    }

  sig.csrOp = applyCsrZeroRule(sig.csrOp, rf.rs1);
  return legal;
}


DecoderSignals
Decoder::decode(const DecodeInput& input) const
{
  DecoderSignals sig;

  uint32_t inst = input.inst;
  RegFields rf(inst);
  bool first = input.phase == Phase::First;
  bool illegal = false;

  switch (Opcode(opcodeOf(inst)))
    {
    case Opcode::Jal:
    case Opcode::Jalr:
      sig.jumpInDec = true;
      if (first)
	{
	  // Jump target. Return address written in the same cycle only
	  // if the branch-target adder computes the target.
	  sig.rfWe = params_.branchTargetAlu;
	  sig.jumpSet = true;
	}
      else
	sig.rfWe = true;  // Return address (pc + size).

      if (opcodeOf(inst) == uint32_t(Opcode::Jalr))
	{
	  sig.rfRenA = true;
	  if (rf.funct3 != 0)
	    illegal = true;
	}
      break;

    case Opcode::Branch:
      sig.branchInDec = true;
      sig.rfRenA = true;
      sig.rfRenB = true;
      if (rf.funct3 == 2 or rf.funct3 == 3)
	illegal = true;
      break;

    case Opcode::Store:
      sig.rfRenA = true;
      sig.rfRenB = true;
      sig.dataReq = true;
      sig.dataWe = true;
      if (rf.funct3 & 4)
	illegal = true;
      switch (rf.funct3 & 3)
	{
	case 0:  sig.dataType = MemType::Byte; break;
	case 1:  sig.dataType = MemType::Half; break;
	case 2:  sig.dataType = MemType::Word; break;
	default: illegal = true;               break;
	}
      break;

    case Opcode::Load:
      sig.rfRenA = true;
      sig.dataReq = true;
      sig.dataSignExt = (rf.funct3 & 4) == 0;
      switch (rf.funct3 & 3)
	{
	case 0:  sig.dataType = MemType::Byte; break;
	case 1:  sig.dataType = MemType::Half; break;
	case 2:
	  sig.dataType = MemType::Word;
	  if (rf.funct3 & 4)
	    illegal = true;  // There is no lwu in rv32.
	  break;
	default: illegal = true; break;
	}
      break;

    case Opcode::Lui:
    case Opcode::Auipc:
      sig.rfWe = true;
      break;

    case Opcode::OpImm:
      sig.rfRenA = true;
      sig.rfWe = true;
      if (rf.funct3 == 1 or rf.funct3 == 5)
	illegal = not isLegalShiftImm(inst);
      break;

    case Opcode::Op:
      sig.rfRenA = true;
      sig.rfRenB = true;
      sig.rfWe = true;
      illegal = not decodeOp(inst, sig);
      break;

    case Opcode::MiscMem:
      if (rf.funct3 == 0)
	break;  // Fence: Memory accesses are already in order.
      if (rf.funct3 == 1)
	{
	  // Fence.i: Jump to the next instruction. The jump flushes the
	  // prefetch buffer; the instruction cache is invalidated.
	  sig.jumpInDec = true;
	  if (first)
	    {
	      sig.jumpSet = true;
	      sig.icacheInval = true;
	    }
	}
      else
	illegal = true;
      break;

    case Opcode::System:
      illegal = not decodeSystem(inst, sig);
      break;

    case Opcode::Custom0:
      sig.rfRenA = true;
      sig.rfRenB = true;
      sig.rfWe = true;
      switch (rf.funct3)
	{
	case 0:  sig.ipmOp = IpmOp::Mul;      break;
	case 1:  sig.ipmOp = IpmOp::Homog;    break;
	case 2:  sig.ipmOp = IpmOp::Square;   break;
	case 3:  sig.ipmOp = IpmOp::MulConst; break;
	case 4:  sig.ipmOp = IpmOp::Unmask;   break;
	case 5:  sig.ipmOp = IpmOp::Mask;     break;
	default: illegal = true;              break;
	}
      break;

    default:
      illegal = true;
      break;
    }

  if (input.illegalCompressed)
    illegal = true;

  sig.illegal = illegal;
  if (illegal)
    suppressCommitting(sig);

  return sig;
}
