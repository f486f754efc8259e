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

#include "AluDecoder.hpp"
#include "instforms.hpp"


using namespace Kestrel;


static constexpr
unsigned
opKey(unsigned funct7, unsigned funct3)
{
  return (funct7 << 3) | funct3;
}


/// Set the controls of a ternary (two-phase) operation: The first phase
/// reads rs1 and rs2, the second phase also reads rs3.
static
void
setTernary(AluOp op, bool first, AluControl& ctl)
{
  ctl.op = op;
  ctl.multicycle = true;
  ctl.useRs3 = not first;
}


void
AluDecoder::decodeJump(uint32_t inst, bool first, AluControl& ctl) const
{
  bool jalr = opcodeOf(inst) == uint32_t(Opcode::Jalr);
  bool btAlu = params_.branchTargetAlu;

  if (btAlu)
    {
      ctl.btASel = jalr ? OpASel::RegA : OpASel::CurrPc;
      ctl.btBSel = jalr ? ImmBSel::I : ImmBSel::J;
    }

  ctl.op = AluOp::Add;
  ctl.opBSel = OpBSel::Imm;

  if (first and not btAlu)
    {
      // Jump target through the main ALU.
      ctl.opASel = jalr ? OpASel::RegA : OpASel::CurrPc;
      ctl.immBSel = jalr ? ImmBSel::I : ImmBSel::J;
    }
  else
    {
      // Return address: pc + size of instruction.
      ctl.opASel = OpASel::CurrPc;
      ctl.immBSel = ImmBSel::IncrPc;
    }
}


void
AluDecoder::decodeBranch(uint32_t inst, bool first, bool taken,
                         AluControl& ctl) const
{
  switch (RegFields(inst).funct3)
    {
    case 0:  ctl.op = AluOp::Eq;  break;
    case 1:  ctl.op = AluOp::Ne;  break;
    case 4:  ctl.op = AluOp::Lt;  break;
    case 5:  ctl.op = AluOp::Ge;  break;
    case 6:  ctl.op = AluOp::Ltu; break;
    case 7:  ctl.op = AluOp::Geu; break;
    default: break;
    }

  // A not-taken branch goes to the next instruction.
  ImmBSel target = taken ? ImmBSel::B : ImmBSel::IncrPc;

  if (params_.branchTargetAlu)
    {
      ctl.btASel = OpASel::CurrPc;
      ctl.btBSel = target;
    }

  if (first)
    {
      // Evaluate the condition.
      ctl.opASel = OpASel::RegA;
      ctl.opBSel = OpBSel::RegB;
    }
  else
    {
      // Next fetch address through the main ALU.
      ctl.opASel = OpASel::CurrPc;
      ctl.opBSel = OpBSel::Imm;
      ctl.immBSel = target;
      ctl.op = AluOp::Add;
    }
}


void
AluDecoder::decodeOpImm(uint32_t inst, bool first, AluControl& ctl) const
{
  IFormInst iform(inst);
  unsigned funct3 = iform.fields.funct3;
  unsigned top5 = iform.top5();
  bool rvb = params_.rv32b;

  ctl.opASel = OpASel::RegA;
  ctl.opBSel = OpBSel::Imm;
  ctl.immBSel = ImmBSel::I;

  switch (funct3)
    {
    case 0: ctl.op = AluOp::Add;  break;
    case 2: ctl.op = AluOp::Slt;  break;
    case 3: ctl.op = AluOp::Sltu; break;
    case 4: ctl.op = AluOp::Xor;  break;
    case 6: ctl.op = AluOp::Or;   break;
    case 7: ctl.op = AluOp::And;  break;

    case 1:
      if (not rvb)
	{
	  ctl.op = AluOp::Sll;
	  break;
	}
      switch (top5)
	{
	case 0x00: ctl.op = AluOp::Sll;   break;
	case 0x04: ctl.op = AluOp::Slo;   break;
	case 0x09: ctl.op = AluOp::Sbclr; break;
	case 0x05: ctl.op = AluOp::Sbset; break;
	case 0x0d: ctl.op = AluOp::Sbinv; break;
	case 0x01:
	  if (((inst >> 26) & 1) == 0)
	    ctl.op = AluOp::Shfl;
	  break;
	case 0x0c:
	  switch ((inst >> 20) & 0x7f)
	    {
	    case 0: ctl.op = AluOp::Clz;   break;
	    case 1: ctl.op = AluOp::Ctz;   break;
	    case 2: ctl.op = AluOp::Pcnt;  break;
	    case 4: ctl.op = AluOp::Sextb; break;
	    case 5: ctl.op = AluOp::Sexth; break;
	    default: break;
	    }
	  break;
	default: break;
	}
      break;

    case 5:
      if (not rvb)
	{
	  if (top5 == 0x00)
	    ctl.op = AluOp::Srl;
	  else if (top5 == 0x08)
	    ctl.op = AluOp::Sra;
	  break;
	}
      if ((inst >> 26) & 1)
	{
	  setTernary(AluOp::Fsr, first, ctl);  // fsri
	  break;
	}
      switch (top5)
	{
	case 0x00: ctl.op = AluOp::Srl;   break;
	case 0x08: ctl.op = AluOp::Sra;   break;
	case 0x04: ctl.op = AluOp::Sro;   break;
	case 0x09: ctl.op = AluOp::Sbext; break;
	case 0x0c:
	  ctl.op = AluOp::Ror;
	  ctl.multicycle = true;
	  break;
	case 0x0d: ctl.op = AluOp::Grev;   break;
	case 0x05: ctl.op = AluOp::Gorc;   break;
	case 0x01: ctl.op = AluOp::Unshfl; break;
	default: break;
	}
      break;
    }
}


void
AluDecoder::decodeOp(uint32_t inst, bool first, AluControl& ctl) const
{
  RFormInst rform(inst);
  unsigned funct7 = rform.bits.funct7, funct3 = rform.bits.funct3;
  bool rvb = params_.rv32b, rvm = params_.rv32m;

  ctl.opASel = OpASel::RegA;
  ctl.opBSel = OpBSel::RegB;

  if ((inst >> 26) & 1)
    {
      if (not rvb)
	return;
      switch (((funct7 & 3) << 3) | funct3)
	{
	case (3 << 3) | 1: setTernary(AluOp::Cmix, first, ctl); break;
	case (3 << 3) | 5: setTernary(AluOp::Cmov, first, ctl); break;
	case (2 << 3) | 1: setTernary(AluOp::Fsl, first, ctl);  break;
	case (2 << 3) | 5: setTernary(AluOp::Fsr, first, ctl);  break;
	default: break;
	}
      return;
    }

  switch (opKey(funct7, funct3))
    {
    case opKey(0x00, 0): ctl.op = AluOp::Add;  break;
    case opKey(0x20, 0): ctl.op = AluOp::Sub;  break;
    case opKey(0x00, 2): ctl.op = AluOp::Slt;  break;
    case opKey(0x00, 3): ctl.op = AluOp::Sltu; break;
    case opKey(0x00, 4): ctl.op = AluOp::Xor;  break;
    case opKey(0x00, 6): ctl.op = AluOp::Or;   break;
    case opKey(0x00, 7): ctl.op = AluOp::And;  break;
    case opKey(0x00, 1): ctl.op = AluOp::Sll;  break;
    case opKey(0x00, 5): ctl.op = AluOp::Srl;  break;
    case opKey(0x20, 5): ctl.op = AluOp::Sra;  break;

    case opKey(0x10, 1): if (rvb) ctl.op = AluOp::Slo;    break;
    case opKey(0x10, 5): if (rvb) ctl.op = AluOp::Sro;    break;
    case opKey(0x30, 1):
      if (rvb)
	{
	  ctl.op = AluOp::Rol;
	  ctl.multicycle = true;
	}
      break;
    case opKey(0x30, 5):
      if (rvb)
	{
	  ctl.op = AluOp::Ror;
	  ctl.multicycle = true;
	}
      break;
    case opKey(0x05, 4): if (rvb) ctl.op = AluOp::Min;    break;
    case opKey(0x05, 5): if (rvb) ctl.op = AluOp::Max;    break;
    case opKey(0x05, 6): if (rvb) ctl.op = AluOp::Minu;   break;
    case opKey(0x05, 7): if (rvb) ctl.op = AluOp::Maxu;   break;
    case opKey(0x04, 4): if (rvb) ctl.op = AluOp::Pack;   break;
    case opKey(0x24, 4): if (rvb) ctl.op = AluOp::Packu;  break;
    case opKey(0x04, 7): if (rvb) ctl.op = AluOp::Packh;  break;
    case opKey(0x20, 4): if (rvb) ctl.op = AluOp::Xnor;   break;
    case opKey(0x20, 6): if (rvb) ctl.op = AluOp::Orn;    break;
    case opKey(0x20, 7): if (rvb) ctl.op = AluOp::Andn;   break;
    case opKey(0x24, 1): if (rvb) ctl.op = AluOp::Sbclr;  break;
    case opKey(0x14, 1): if (rvb) ctl.op = AluOp::Sbset;  break;
    case opKey(0x34, 1): if (rvb) ctl.op = AluOp::Sbinv;  break;
    case opKey(0x24, 5): if (rvb) ctl.op = AluOp::Sbext;  break;
    case opKey(0x34, 5): if (rvb) ctl.op = AluOp::Grev;   break;
    case opKey(0x14, 5): if (rvb) ctl.op = AluOp::Gorc;   break;
    case opKey(0x04, 1): if (rvb) ctl.op = AluOp::Shfl;   break;
    case opKey(0x04, 5): if (rvb) ctl.op = AluOp::Unshfl; break;

    // Multiply/divide: The ALU adds and the result is dropped; the
    // operands go to the multiply/divide unit.
    case opKey(0x01, 0):
    case opKey(0x01, 1):
    case opKey(0x01, 2):
    case opKey(0x01, 3):
      ctl.op = AluOp::Add;
      ctl.multSel = rvm;
      break;
    case opKey(0x01, 4):
    case opKey(0x01, 5):
    case opKey(0x01, 6):
    case opKey(0x01, 7):
      ctl.op = AluOp::Add;
      ctl.divSel = rvm;
      break;

    default: break;
    }
}


AluControl
AluDecoder::decode(uint32_t inst, Phase phase, bool branchTaken) const
{
  AluControl ctl;
  bool first = phase == Phase::First;
  unsigned funct3 = RegFields(inst).funct3;

  switch (Opcode(opcodeOf(inst)))
    {
    case Opcode::Jal:
    case Opcode::Jalr:
      decodeJump(inst, first, ctl);
      break;

    case Opcode::Branch:
      decodeBranch(inst, first, branchTaken, ctl);
      break;

    case Opcode::Store:
      ctl.opASel = OpASel::RegA;
      ctl.opBSel = OpBSel::RegB;
      ctl.op = AluOp::Add;
      if ((funct3 & 4) == 0)
	{
	  // Offset from immediate.
	  ctl.opBSel = OpBSel::Imm;
	  ctl.immBSel = ImmBSel::S;
	}
      break;

    case Opcode::Load:
      ctl.opASel = OpASel::RegA;
      ctl.opBSel = OpBSel::Imm;
      ctl.immBSel = ImmBSel::I;
      ctl.op = AluOp::Add;
      break;

    case Opcode::Lui:
      ctl.opASel = OpASel::Zero;
      ctl.opBSel = OpBSel::Imm;
      ctl.immBSel = ImmBSel::U;
      ctl.op = AluOp::Add;
      break;

    case Opcode::Auipc:
      ctl.opASel = OpASel::CurrPc;
      ctl.opBSel = OpBSel::Imm;
      ctl.immBSel = ImmBSel::U;
      ctl.op = AluOp::Add;
      break;

    case Opcode::OpImm:
      decodeOpImm(inst, first, ctl);
      break;

    case Opcode::Op:
      decodeOp(inst, first, ctl);
      break;

    case Opcode::MiscMem:
      if (funct3 == 0)
	{
	  // Fence: nop.
	  ctl.op = AluOp::Add;
	  ctl.opASel = OpASel::RegA;
	  ctl.opBSel = OpBSel::Imm;
	}
      else if (funct3 == 1)
	{
	  // Fence.i: jump to pc + size.
	  if (params_.branchTargetAlu)
	    {
	      ctl.btASel = OpASel::CurrPc;
	      ctl.btBSel = ImmBSel::IncrPc;
	    }
	  else
	    {
	      ctl.opASel = OpASel::CurrPc;
	      ctl.opBSel = OpBSel::Imm;
	      ctl.immBSel = ImmBSel::IncrPc;
	      ctl.op = AluOp::Add;
	    }
	}
      break;

    case Opcode::System:
      if (funct3 == 0)
	{
	  ctl.opASel = OpASel::RegA;
	  ctl.opBSel = OpBSel::Imm;
	}
      else
	{
	  // CSR address is in the I immediate. With funct3 bit 2 the rs1
	  // field is a zero-extended immediate.
	  ctl.opBSel = OpBSel::Imm;
	  ctl.immBSel = ImmBSel::I;
	  ctl.opASel = (funct3 & 4) ? OpASel::ImmZ : OpASel::RegA;
	}
      break;

    case Opcode::Custom0:
      ctl.opASel = OpASel::RegA;
      ctl.opBSel = OpBSel::RegB;
      ctl.op = AluOp::Add;
      ctl.ipmSel = true;
      break;

    default:
      break;
    }

  return ctl;
}
