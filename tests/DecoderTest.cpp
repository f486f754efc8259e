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

#include <gtest/gtest.h>
#include "Decoder.hpp"
#include "instforms.hpp"

using namespace Kestrel;


static
DecoderSignals
decode(const Decoder& decoder, uint32_t inst, Phase phase = Phase::First,
       bool taken = false)
{
  DecodeInput input;
  input.inst = inst;
  input.phase = phase;
  input.branchTaken = taken;
  return decoder.decode(input);
}


static
bool
anyCommitting(const DecoderSignals& sig)
{
  return (sig.rfWe or sig.dataReq or sig.dataWe or sig.jumpInDec or
	  sig.jumpSet or sig.branchInDec or sig.csrAccess or sig.icacheInval or
	  sig.trap != TrapKind::None);
}


static
CoreParams
bitManipParams()
{
  CoreParams params;
  params.rv32b = true;
  return params;
}


TEST(Decoder, AddiWritesDestination)
{
  Decoder decoder{CoreParams()};
  IFormInst iform(0);
  ASSERT_TRUE(iform.encodeAddi(1, 0, 5));

  DecoderSignals sig = decode(decoder, iform.code);
  EXPECT_FALSE(sig.illegal);
  EXPECT_TRUE(sig.rfWe);
  EXPECT_TRUE(sig.rfRenA);
  EXPECT_FALSE(sig.rfRenB);
  EXPECT_EQ(sig.rfWdSel, RfWdSel::Ex);
  EXPECT_FALSE(sig.dataReq);
  EXPECT_EQ(sig.trap, TrapKind::None);
}


TEST(Decoder, JalTakesTwoPhasesWithoutTargetAdder)
{
  Decoder decoder{CoreParams()};
  JFormInst jform(0);
  ASSERT_TRUE(jform.encodeJal(1, 0x100));

  DecoderSignals first = decode(decoder, jform.code, Phase::First);
  EXPECT_FALSE(first.illegal);
  EXPECT_TRUE(first.jumpInDec);
  EXPECT_TRUE(first.jumpSet);
  EXPECT_FALSE(first.rfWe);

  DecoderSignals second = decode(decoder, jform.code, Phase::Second);
  EXPECT_FALSE(second.illegal);
  EXPECT_TRUE(second.jumpInDec);
  EXPECT_FALSE(second.jumpSet);
  EXPECT_TRUE(second.rfWe);
}


TEST(Decoder, JalWritesLinkInFirstPhaseWithTargetAdder)
{
  CoreParams params;
  params.branchTargetAlu = true;
  Decoder decoder(params);

  JFormInst jform(0);
  ASSERT_TRUE(jform.encodeJal(1, -8));

  DecoderSignals sig = decode(decoder, jform.code, Phase::First);
  EXPECT_TRUE(sig.jumpSet);
  EXPECT_TRUE(sig.rfWe);
}


TEST(Decoder, JalrRequiresZeroFunct3)
{
  Decoder decoder{CoreParams()};
  IFormInst iform(0);
  ASSERT_TRUE(iform.encodeJalr(1, 5, 12));

  DecoderSignals sig = decode(decoder, iform.code);
  EXPECT_FALSE(sig.illegal);
  EXPECT_TRUE(sig.rfRenA);
  EXPECT_TRUE(sig.jumpInDec);

  for (unsigned funct3 = 1; funct3 < 8; ++funct3)
    {
      uint32_t inst = iform.code | (funct3 << 12);
      sig = decode(decoder, inst);
      EXPECT_TRUE(sig.illegal) << std::hex << inst;
      EXPECT_FALSE(anyCommitting(sig)) << std::hex << inst;
    }
}


TEST(Decoder, BranchFunct3)
{
  Decoder decoder{CoreParams()};
  BFormInst bform(0);
  ASSERT_TRUE(bform.encodeBeq(1, 2, 16));

  for (unsigned funct3 = 0; funct3 < 8; ++funct3)
    {
      uint32_t inst = bform.code | (funct3 << 12);
      DecoderSignals sig = decode(decoder, inst);
      bool unassigned = funct3 == 2 or funct3 == 3;
      EXPECT_EQ(sig.illegal, unassigned) << funct3;
      EXPECT_EQ(sig.branchInDec, not unassigned) << funct3;
      EXPECT_FALSE(sig.rfWe);
      if (not unassigned)
	{
	  EXPECT_TRUE(sig.rfRenA);
	  EXPECT_TRUE(sig.rfRenB);
	}
    }
}


TEST(Decoder, CsrSetClearWithZeroSourceIsRead)
{
  Decoder decoder{CoreParams()};
  IFormInst iform(0);

  ASSERT_TRUE(iform.encodeCsrrs(3, 0, 0x300));
  DecoderSignals sig = decode(decoder, iform.code);
  EXPECT_FALSE(sig.illegal);
  EXPECT_TRUE(sig.csrAccess);
  EXPECT_EQ(sig.csrOp, CsrOp::Read);
  EXPECT_TRUE(sig.rfWe);
  EXPECT_EQ(sig.rfWdSel, RfWdSel::Csr);

  ASSERT_TRUE(iform.encodeCsrrs(3, 4, 0x300));
  EXPECT_EQ(decode(decoder, iform.code).csrOp, CsrOp::Set);

  ASSERT_TRUE(iform.encodeCsrrc(3, 0, 0x300));
  EXPECT_EQ(decode(decoder, iform.code).csrOp, CsrOp::Read);

  ASSERT_TRUE(iform.encodeCsrrc(3, 9, 0x300));
  EXPECT_EQ(decode(decoder, iform.code).csrOp, CsrOp::Clear);

  ASSERT_TRUE(iform.encodeCsrrci(3, 0, 0x300));
  sig = decode(decoder, iform.code);
  EXPECT_EQ(sig.csrOp, CsrOp::Read);
  EXPECT_FALSE(sig.rfRenA);

  ASSERT_TRUE(iform.encodeCsrrsi(3, 1, 0x300));
  EXPECT_EQ(decode(decoder, iform.code).csrOp, CsrOp::Set);

  // A write is a write even with a zero source.
  ASSERT_TRUE(iform.encodeCsrrw(3, 0, 0x300));
  sig = decode(decoder, iform.code);
  EXPECT_EQ(sig.csrOp, CsrOp::Write);
  EXPECT_TRUE(sig.rfRenA);
}


TEST(Decoder, CsrFunct3FourIsIllegal)
{
  Decoder decoder{CoreParams()};
  DecoderSignals sig = decode(decoder, 0x30024073);
  EXPECT_TRUE(sig.illegal);
  EXPECT_FALSE(sig.csrAccess);
  EXPECT_FALSE(sig.rfWe);
}


TEST(Decoder, UndefinedOpcodeIsIllegal)
{
  Decoder decoder{bitManipParams()};

  DecoderSignals sig = decode(decoder, 0xffffffff);
  EXPECT_TRUE(sig.illegal);
  EXPECT_FALSE(anyCommitting(sig));

  // Funct fields of an add, opcode all ones.
  sig = decode(decoder, 0x0000007f);
  EXPECT_TRUE(sig.illegal);
  EXPECT_FALSE(anyCommitting(sig));

  // Funct fields of ecall, opcode all ones.
  sig = decode(decoder, 0x0000007f | (1 << 20));
  EXPECT_TRUE(sig.illegal);
  EXPECT_EQ(sig.trap, TrapKind::None);
}


TEST(Decoder, Loads)
{
  Decoder decoder{CoreParams()};
  IFormInst iform(0);

  ASSERT_TRUE(iform.encodeLw(5, 6, -4));
  DecoderSignals sig = decode(decoder, iform.code);
  EXPECT_FALSE(sig.illegal);
  EXPECT_TRUE(sig.dataReq);
  EXPECT_FALSE(sig.dataWe);
  EXPECT_EQ(sig.dataType, MemType::Word);
  EXPECT_TRUE(sig.dataSignExt);
  EXPECT_TRUE(sig.rfRenA);
  EXPECT_FALSE(sig.rfWe);  // Written back by the load/store unit.

  ASSERT_TRUE(iform.encodeLbu(5, 6, 1));
  sig = decode(decoder, iform.code);
  EXPECT_FALSE(sig.illegal);
  EXPECT_EQ(sig.dataType, MemType::Byte);
  EXPECT_FALSE(sig.dataSignExt);

  // lhu
  sig = decode(decoder, (iform.code & ~0x7000u) | (5 << 12));
  EXPECT_FALSE(sig.illegal);
  EXPECT_EQ(sig.dataType, MemType::Half);
  EXPECT_FALSE(sig.dataSignExt);

  // lwu and funct3 3 and 7 do not exist in rv32.
  for (unsigned funct3 : { 3u, 6u, 7u })
    {
      sig = decode(decoder, (iform.code & ~0x7000u) | (funct3 << 12));
      EXPECT_TRUE(sig.illegal) << funct3;
      EXPECT_FALSE(sig.dataReq) << funct3;
    }
}


TEST(Decoder, Stores)
{
  Decoder decoder{CoreParams()};
  SFormInst sform(0);

  ASSERT_TRUE(sform.encodeSb(1, 2, 3));
  DecoderSignals sig = decode(decoder, sform.code);
  EXPECT_FALSE(sig.illegal);
  EXPECT_TRUE(sig.dataReq);
  EXPECT_TRUE(sig.dataWe);
  EXPECT_EQ(sig.dataType, MemType::Byte);
  EXPECT_TRUE(sig.rfRenA);
  EXPECT_TRUE(sig.rfRenB);
  EXPECT_FALSE(sig.rfWe);

  sig = decode(decoder, sform.code | (1 << 12));
  EXPECT_EQ(sig.dataType, MemType::Half);

  ASSERT_TRUE(sform.encodeSw(1, 2, 3));
  EXPECT_EQ(decode(decoder, sform.code).dataType, MemType::Word);

  for (unsigned funct3 = 3; funct3 < 8; ++funct3)
    {
      uint32_t inst = (sform.code & ~0x7000u) | (funct3 << 12);
      sig = decode(decoder, inst);
      EXPECT_TRUE(sig.illegal) << funct3;
      EXPECT_FALSE(sig.dataWe) << funct3;
    }
}


TEST(Decoder, UpperImmediates)
{
  Decoder decoder{CoreParams()};
  UFormInst uform(0);

  ASSERT_TRUE(uform.encodeLui(4, 0x1234));
  DecoderSignals sig = decode(decoder, uform.code);
  EXPECT_FALSE(sig.illegal);
  EXPECT_TRUE(sig.rfWe);
  EXPECT_FALSE(sig.rfRenA);
  EXPECT_FALSE(sig.rfRenB);

  ASSERT_TRUE(uform.encodeAuipc(4, 0x1234));
  sig = decode(decoder, uform.code);
  EXPECT_FALSE(sig.illegal);
  EXPECT_TRUE(sig.rfWe);
}


TEST(Decoder, SystemTraps)
{
  Decoder decoder{CoreParams()};

  struct { uint32_t inst; TrapKind trap; } cases[] =
    {
     { 0x00000073, TrapKind::Ecall },
     { 0x00100073, TrapKind::Ebreak },
     { 0x30200073, TrapKind::Mret },
     { 0x7b200073, TrapKind::Dret },
     { 0x10500073, TrapKind::Wfi }
    };

  for (const auto& c : cases)
    {
      DecoderSignals sig = decode(decoder, c.inst);
      EXPECT_FALSE(sig.illegal) << std::hex << c.inst;
      EXPECT_EQ(sig.trap, c.trap) << std::hex << c.inst;
      EXPECT_FALSE(sig.rfWe);
      EXPECT_FALSE(sig.csrAccess);

      // Non-zero rd or rs1 makes the instruction illegal.
      sig = decode(decoder, c.inst | (1 << 7));
      EXPECT_TRUE(sig.illegal);
      EXPECT_EQ(sig.trap, TrapKind::None);

      sig = decode(decoder, c.inst | (1 << 15));
      EXPECT_TRUE(sig.illegal);
      EXPECT_EQ(sig.trap, TrapKind::None);
    }

  // Unassigned funct12.
  DecoderSignals sig = decode(decoder, 0x00200073);
  EXPECT_TRUE(sig.illegal);
  EXPECT_EQ(sig.trap, TrapKind::None);
}


TEST(Decoder, FenceAndFencei)
{
  Decoder decoder{CoreParams()};
  IFormInst iform(0);

  ASSERT_TRUE(iform.encodeFence(0xf, 0xf));
  DecoderSignals sig = decode(decoder, iform.code);
  EXPECT_FALSE(sig.illegal);
  EXPECT_FALSE(anyCommitting(sig));

  ASSERT_TRUE(iform.encodeFencei());
  sig = decode(decoder, iform.code, Phase::First);
  EXPECT_FALSE(sig.illegal);
  EXPECT_TRUE(sig.jumpInDec);
  EXPECT_TRUE(sig.jumpSet);
  EXPECT_TRUE(sig.icacheInval);
  EXPECT_FALSE(sig.rfWe);

  sig = decode(decoder, iform.code, Phase::Second);
  EXPECT_TRUE(sig.jumpInDec);
  EXPECT_FALSE(sig.jumpSet);
  EXPECT_FALSE(sig.icacheInval);
  EXPECT_FALSE(sig.rfWe);

  for (unsigned funct3 = 2; funct3 < 8; ++funct3)
    EXPECT_TRUE(decode(decoder, 0x0f | (funct3 << 12)).illegal) << funct3;
}


TEST(Decoder, MultiplyDivideGating)
{
  CoreParams params;
  params.rv32m = false;
  Decoder without(params);
  Decoder with{CoreParams()};

  RFormInst rform(0);
  ASSERT_TRUE(rform.encodeMul(1, 2, 3));

  DecoderSignals sig = decode(without, rform.code);
  EXPECT_TRUE(sig.illegal);
  EXPECT_FALSE(sig.rfWe);

  sig = decode(with, rform.code);
  EXPECT_FALSE(sig.illegal);
  EXPECT_TRUE(sig.rfWe);
  EXPECT_EQ(sig.mdOp, MdOp::Mull);

  struct { unsigned funct3; MdOp op; unsigned mode; } cases[] =
    {
     { 0, MdOp::Mull, 0 }, { 1, MdOp::Mulh, 3 }, { 2, MdOp::Mulh, 1 },
     { 3, MdOp::Mulh, 0 }, { 4, MdOp::Div, 3 },  { 5, MdOp::Div, 0 },
     { 6, MdOp::Rem, 3 },  { 7, MdOp::Rem, 0 }
    };

  for (const auto& c : cases)
    {
      uint32_t inst = (rform.code & ~0x7000u) | (c.funct3 << 12);
      sig = decode(with, inst);
      EXPECT_FALSE(sig.illegal) << c.funct3;
      EXPECT_EQ(sig.mdOp, c.op) << c.funct3;
      EXPECT_EQ(sig.mdSignedMode, c.mode) << c.funct3;
      EXPECT_TRUE(decode(without, inst).illegal) << c.funct3;
    }
}


TEST(Decoder, BitManipGating)
{
  Decoder without{CoreParams()};
  Decoder with{bitManipParams()};

  uint32_t insts[] = { 0x40007033,   // andn
		       0x60001033,   // rol
		       0x0a004033,   // min
		       0x08004033,   // pack
		       0x68005033,   // grev
		       0x20001013,   // sloi
		       0x60005013,   // rori
		       0x60001013,   // clz
		       0x60501013,   // sext.h
		       0x06001033,   // cmix
		       0x04005033,   // fsr
		       0x04005013 }; // fsri

  for (auto inst : insts)
    {
      DecoderSignals sig = decode(without, inst);
      EXPECT_TRUE(sig.illegal) << std::hex << inst;
      EXPECT_FALSE(sig.rfWe) << std::hex << inst;

      sig = decode(with, inst);
      EXPECT_FALSE(sig.illegal) << std::hex << inst;
      EXPECT_TRUE(sig.rfWe) << std::hex << inst;
    }
}


TEST(Decoder, ShiftImmediateEncodings)
{
  Decoder base{CoreParams()};
  Decoder bitManip{bitManipParams()};
  IFormInst iform(0);

  ASSERT_TRUE(iform.encodeSlli(1, 2, 31));
  EXPECT_FALSE(base.decode({iform.code}).illegal);

  ASSERT_TRUE(iform.encodeSrai(1, 2, 7));
  EXPECT_FALSE(base.decode({iform.code}).illegal);

  // Shift amount bit 5 does not exist in rv32.
  EXPECT_TRUE(base.decode({0x02001093}).illegal);
  EXPECT_TRUE(bitManip.decode({0x02001093}).illegal);

  // shfli with bit 26 set.
  EXPECT_TRUE(bitManip.decode({0x0c001013}).illegal);

  // Unary selector 3 is unassigned.
  EXPECT_TRUE(bitManip.decode({0x60301013}).illegal);

  // Unassigned top5 values.
  EXPECT_TRUE(bitManip.decode({0x10001013}).illegal);
  EXPECT_TRUE(bitManip.decode({0x10005013}).illegal);
}


TEST(Decoder, MaskedArithmetic)
{
  Decoder decoder{CoreParams()};

  IpmOp ops[] = { IpmOp::Mul, IpmOp::Homog, IpmOp::Square, IpmOp::MulConst,
		  IpmOp::Unmask, IpmOp::Mask };

  uint32_t base = 0x0b | (1 << 7) | (2 << 15) | (3 << 20);
  for (unsigned funct3 = 0; funct3 < 6; ++funct3)
    {
      DecoderSignals sig = decode(decoder, base | (funct3 << 12));
      EXPECT_FALSE(sig.illegal) << funct3;
      EXPECT_EQ(sig.ipmOp, ops[funct3]);
      EXPECT_TRUE(sig.rfWe);
      EXPECT_TRUE(sig.rfRenA);
      EXPECT_TRUE(sig.rfRenB);
    }

  EXPECT_TRUE(decode(decoder, base | (6 << 12)).illegal);
  EXPECT_TRUE(decode(decoder, base | (7 << 12)).illegal);
}


TEST(Decoder, IllegalCompressedForcesIllegal)
{
  Decoder decoder{CoreParams()};
  IFormInst iform(0);
  ASSERT_TRUE(iform.encodeAddi(1, 0, 5));

  DecodeInput input;
  input.inst = iform.code;
  input.illegalCompressed = true;
  DecoderSignals sig = decoder.decode(input);
  EXPECT_TRUE(sig.illegal);
  EXPECT_FALSE(anyCommitting(sig));
}


TEST(Decoder, IllegalNeverCommits)
{
  CoreParams all;
  all.rv32b = true;
  CoreParams none;
  none.rv32m = false;

  // Sweep opcodes, function fields and a few register fields.
  for (const auto& params : { all, none })
    {
      Decoder decoder(params);
      for (uint32_t opcode = 0; opcode < 0x80; ++opcode)
	for (uint32_t funct3 = 0; funct3 < 8; ++funct3)
	  for (uint32_t top : { 0x000u, 0x001u, 0x302u, 0x7b2u, 0x105u, 0x020u,
				0x400u, 0x600u, 0x0a0u, 0xfffu })
	    for (uint32_t regs : { 0x00000u, 0x08080u })
	      {
		uint32_t inst = (top << 20) | (funct3 << 12) | opcode | regs;
		for (Phase phase : { Phase::First, Phase::Second })
		  {
		    DecoderSignals sig = decode(decoder, inst, phase);
		    if (sig.illegal)
		      EXPECT_FALSE(anyCommitting(sig)) << std::hex << inst;
		  }
	      }
    }
}
