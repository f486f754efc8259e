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
#include "AluDecoder.hpp"
#include "instforms.hpp"

using namespace Kestrel;


static
CoreParams
bitManipParams()
{
  CoreParams params;
  params.rv32b = true;
  return params;
}


TEST(AluDecoder, Defaults)
{
  AluDecoder decoder{CoreParams()};

  // Undefined opcode: Nothing is selected.
  AluControl ctl = decoder.decode(0xffffffff, Phase::First, false);
  EXPECT_EQ(ctl.op, AluOp::Sltu);
  EXPECT_EQ(ctl.opASel, OpASel::Zero);
  EXPECT_EQ(ctl.opBSel, OpBSel::Imm);
  EXPECT_EQ(ctl.immBSel, ImmBSel::I);
  EXPECT_EQ(ctl.btASel, OpASel::CurrPc);
  EXPECT_EQ(ctl.btBSel, ImmBSel::I);
  EXPECT_FALSE(ctl.multicycle);
  EXPECT_FALSE(ctl.useRs3);
  EXPECT_FALSE(ctl.multSel or ctl.divSel or ctl.ipmSel);
}


TEST(AluDecoder, Addi)
{
  AluDecoder decoder{CoreParams()};
  IFormInst iform(0);
  ASSERT_TRUE(iform.encodeAddi(1, 0, 5));

  AluControl ctl = decoder.decode(iform.code, Phase::First, false);
  EXPECT_EQ(ctl.op, AluOp::Add);
  EXPECT_EQ(ctl.opASel, OpASel::RegA);
  EXPECT_EQ(ctl.opBSel, OpBSel::Imm);
  EXPECT_EQ(ctl.immBSel, ImmBSel::I);
}


TEST(AluDecoder, JalWithoutTargetAdder)
{
  AluDecoder decoder{CoreParams()};
  JFormInst jform(0);
  ASSERT_TRUE(jform.encodeJal(1, 0x40));

  // First phase: Target through the ALU.
  AluControl ctl = decoder.decode(jform.code, Phase::First, false);
  EXPECT_EQ(ctl.op, AluOp::Add);
  EXPECT_EQ(ctl.opASel, OpASel::CurrPc);
  EXPECT_EQ(ctl.opBSel, OpBSel::Imm);
  EXPECT_EQ(ctl.immBSel, ImmBSel::J);

  // Second phase: Link address.
  ctl = decoder.decode(jform.code, Phase::Second, false);
  EXPECT_EQ(ctl.op, AluOp::Add);
  EXPECT_EQ(ctl.opASel, OpASel::CurrPc);
  EXPECT_EQ(ctl.immBSel, ImmBSel::IncrPc);
}


TEST(AluDecoder, JumpsWithTargetAdder)
{
  CoreParams params;
  params.branchTargetAlu = true;
  AluDecoder decoder(params);

  JFormInst jform(0);
  ASSERT_TRUE(jform.encodeJal(1, 0x40));
  AluControl ctl = decoder.decode(jform.code, Phase::First, false);
  EXPECT_EQ(ctl.btASel, OpASel::CurrPc);
  EXPECT_EQ(ctl.btBSel, ImmBSel::J);
  EXPECT_EQ(ctl.opASel, OpASel::CurrPc);
  EXPECT_EQ(ctl.immBSel, ImmBSel::IncrPc);

  IFormInst iform(0);
  ASSERT_TRUE(iform.encodeJalr(1, 6, 8));
  ctl = decoder.decode(iform.code, Phase::First, false);
  EXPECT_EQ(ctl.btASel, OpASel::RegA);
  EXPECT_EQ(ctl.btBSel, ImmBSel::I);
  EXPECT_EQ(ctl.opASel, OpASel::CurrPc);
  EXPECT_EQ(ctl.immBSel, ImmBSel::IncrPc);
}


TEST(AluDecoder, JalrFirstPhase)
{
  AluDecoder decoder{CoreParams()};
  IFormInst iform(0);
  ASSERT_TRUE(iform.encodeJalr(1, 6, 8));

  AluControl ctl = decoder.decode(iform.code, Phase::First, false);
  EXPECT_EQ(ctl.opASel, OpASel::RegA);
  EXPECT_EQ(ctl.immBSel, ImmBSel::I);
  EXPECT_EQ(ctl.op, AluOp::Add);
}


TEST(AluDecoder, Branches)
{
  AluDecoder decoder{CoreParams()};
  BFormInst bform(0);
  ASSERT_TRUE(bform.encodeBeq(1, 2, 0x20));

  struct { unsigned funct3; AluOp op; } cases[] =
    {
     { 0, AluOp::Eq }, { 1, AluOp::Ne }, { 4, AluOp::Lt },
     { 5, AluOp::Ge }, { 6, AluOp::Ltu }, { 7, AluOp::Geu }
    };

  for (const auto& c : cases)
    {
      uint32_t inst = bform.code | (c.funct3 << 12);
      AluControl ctl = decoder.decode(inst, Phase::First, false);
      EXPECT_EQ(ctl.op, c.op) << c.funct3;
      EXPECT_EQ(ctl.opASel, OpASel::RegA);
      EXPECT_EQ(ctl.opBSel, OpBSel::RegB);
    }

  AluControl taken = decoder.decode(bform.code, Phase::Second, true);
  EXPECT_EQ(taken.op, AluOp::Add);
  EXPECT_EQ(taken.opASel, OpASel::CurrPc);
  EXPECT_EQ(taken.opBSel, OpBSel::Imm);
  EXPECT_EQ(taken.immBSel, ImmBSel::B);

  AluControl notTaken = decoder.decode(bform.code, Phase::Second, false);
  EXPECT_EQ(notTaken.immBSel, ImmBSel::IncrPc);
}


TEST(AluDecoder, BranchTargetAdderOperands)
{
  CoreParams params;
  params.branchTargetAlu = true;
  AluDecoder decoder(params);
  BFormInst bform(0);
  ASSERT_TRUE(bform.encodeBne(1, 2, -16));

  AluControl ctl = decoder.decode(bform.code, Phase::First, true);
  EXPECT_EQ(ctl.btASel, OpASel::CurrPc);
  EXPECT_EQ(ctl.btBSel, ImmBSel::B);
  EXPECT_EQ(ctl.op, AluOp::Ne);

  ctl = decoder.decode(bform.code, Phase::First, false);
  EXPECT_EQ(ctl.btBSel, ImmBSel::IncrPc);
}


TEST(AluDecoder, LoadsStoresAndUpperImmediates)
{
  AluDecoder decoder{CoreParams()};

  SFormInst sform(0);
  ASSERT_TRUE(sform.encodeSw(1, 2, 8));
  AluControl ctl = decoder.decode(sform.code, Phase::First, false);
  EXPECT_EQ(ctl.op, AluOp::Add);
  EXPECT_EQ(ctl.opASel, OpASel::RegA);
  EXPECT_EQ(ctl.opBSel, OpBSel::Imm);
  EXPECT_EQ(ctl.immBSel, ImmBSel::S);

  IFormInst iform(0);
  ASSERT_TRUE(iform.encodeLw(1, 2, 8));
  ctl = decoder.decode(iform.code, Phase::First, false);
  EXPECT_EQ(ctl.op, AluOp::Add);
  EXPECT_EQ(ctl.opASel, OpASel::RegA);
  EXPECT_EQ(ctl.immBSel, ImmBSel::I);

  UFormInst uform(0);
  ASSERT_TRUE(uform.encodeLui(1, 0x10));
  ctl = decoder.decode(uform.code, Phase::First, false);
  EXPECT_EQ(ctl.opASel, OpASel::Zero);
  EXPECT_EQ(ctl.immBSel, ImmBSel::U);

  ASSERT_TRUE(uform.encodeAuipc(1, 0x10));
  ctl = decoder.decode(uform.code, Phase::First, false);
  EXPECT_EQ(ctl.opASel, OpASel::CurrPc);
  EXPECT_EQ(ctl.immBSel, ImmBSel::U);
}


TEST(AluDecoder, ShiftsWithoutBitManip)
{
  AluDecoder decoder{CoreParams()};
  IFormInst iform(0);

  ASSERT_TRUE(iform.encodeSlli(1, 2, 3));
  EXPECT_EQ(decoder.decode(iform.code, Phase::First, false).op, AluOp::Sll);

  ASSERT_TRUE(iform.encodeSrai(1, 2, 3));
  EXPECT_EQ(decoder.decode(iform.code, Phase::First, false).op, AluOp::Sra);

  // srli
  uint32_t srli = iform.code & ~0x40000000u;
  EXPECT_EQ(decoder.decode(srli, Phase::First, false).op, AluOp::Srl);
}


TEST(AluDecoder, RotatesAreMulticycle)
{
  AluDecoder decoder{bitManipParams()};

  RFormInst rform(0);
  ASSERT_TRUE(rform.encodeRol(1, 2, 3));
  AluControl ctl = decoder.decode(rform.code, Phase::First, false);
  EXPECT_EQ(ctl.op, AluOp::Rol);
  EXPECT_TRUE(ctl.multicycle);
  EXPECT_FALSE(ctl.useRs3);

  ctl = decoder.decode(0x60005033, Phase::First, false);  // ror
  EXPECT_EQ(ctl.op, AluOp::Ror);
  EXPECT_TRUE(ctl.multicycle);

  ctl = decoder.decode(0x60505093, Phase::First, false);  // rori
  EXPECT_EQ(ctl.op, AluOp::Ror);
  EXPECT_TRUE(ctl.multicycle);
  EXPECT_EQ(ctl.opBSel, OpBSel::Imm);
}


TEST(AluDecoder, TernaryUsesThirdSourceOnSecondPhase)
{
  AluDecoder decoder{bitManipParams()};

  R4FormInst r4(0);
  ASSERT_TRUE(r4.encodeCmov(1, 2, 3, 4));

  AluControl first = decoder.decode(r4.code, Phase::First, false);
  EXPECT_EQ(first.op, AluOp::Cmov);
  EXPECT_TRUE(first.multicycle);
  EXPECT_FALSE(first.useRs3);
  EXPECT_EQ(first.opASel, OpASel::RegA);
  EXPECT_EQ(first.opBSel, OpBSel::RegB);

  AluControl second = decoder.decode(r4.code, Phase::Second, false);
  EXPECT_EQ(second.op, AluOp::Cmov);
  EXPECT_TRUE(second.multicycle);
  EXPECT_TRUE(second.useRs3);

  ASSERT_TRUE(r4.encodeFsl(1, 2, 3, 4));
  EXPECT_EQ(decoder.decode(r4.code, Phase::First, false).op, AluOp::Fsl);

  AluControl fsri = decoder.decode(0x24305093, Phase::Second, false);
  EXPECT_EQ(fsri.op, AluOp::Fsr);
  EXPECT_TRUE(fsri.useRs3);
  EXPECT_EQ(fsri.opBSel, OpBSel::Imm);
}


TEST(AluDecoder, BitManipOpcodes)
{
  AluDecoder decoder{bitManipParams()};

  struct { uint32_t inst; AluOp op; } cases[] =
    {
     { 0x40007033, AluOp::Andn },  { 0x40006033, AluOp::Orn },
     { 0x40004033, AluOp::Xnor },  { 0x20001033, AluOp::Slo },
     { 0x0a005033, AluOp::Max },   { 0x0a006033, AluOp::Minu },
     { 0x48004033, AluOp::Packu }, { 0x08007033, AluOp::Packh },
     { 0x28001033, AluOp::Sbset }, { 0x48005033, AluOp::Sbext },
     { 0x28005033, AluOp::Gorc },  { 0x08005033, AluOp::Unshfl },
     { 0x48001013, AluOp::Sbclr }, { 0x68001013, AluOp::Sbinv },
     { 0x60101013, AluOp::Ctz },   { 0x60201013, AluOp::Pcnt },
     { 0x60401013, AluOp::Sextb }, { 0x68005013, AluOp::Grev },
     { 0x08001013, AluOp::Shfl },  { 0x20005013, AluOp::Sro }
    };

  for (const auto& c : cases)
    {
      AluControl ctl = decoder.decode(c.inst, Phase::First, false);
      EXPECT_EQ(ctl.op, c.op) << std::hex << c.inst;
      EXPECT_FALSE(ctl.multicycle) << std::hex << c.inst;
    }
}


TEST(AluDecoder, UnitSelectors)
{
  AluDecoder decoder{CoreParams()};

  RFormInst rform(0);
  ASSERT_TRUE(rform.encodeMul(1, 2, 3));
  AluControl ctl = decoder.decode(rform.code, Phase::First, false);
  EXPECT_EQ(ctl.op, AluOp::Add);
  EXPECT_TRUE(ctl.multSel);
  EXPECT_FALSE(ctl.divSel);

  ASSERT_TRUE(rform.encodeDiv(1, 2, 3));
  ctl = decoder.decode(rform.code, Phase::First, false);
  EXPECT_EQ(ctl.op, AluOp::Add);
  EXPECT_FALSE(ctl.multSel);
  EXPECT_TRUE(ctl.divSel);

  ctl = decoder.decode(0x0031008b, Phase::First, false);
  EXPECT_TRUE(ctl.ipmSel);
  EXPECT_EQ(ctl.opASel, OpASel::RegA);
  EXPECT_EQ(ctl.opBSel, OpBSel::RegB);

  // Without the multiply/divide extension nothing is selected.
  CoreParams params;
  params.rv32m = false;
  AluDecoder noMd(params);
  ASSERT_TRUE(rform.encodeMul(1, 2, 3));
  EXPECT_FALSE(noMd.decode(rform.code, Phase::First, false).multSel);
}


TEST(AluDecoder, SelectorsIndependentOfPhase)
{
  AluDecoder decoder{CoreParams()};

  uint32_t insts[] = { 0x02000033, 0x02004033, 0x0000400b, 0x00500093 };
  for (auto inst : insts)
    for (bool taken : { false, true })
      {
	AluControl first = decoder.decode(inst, Phase::First, taken);
	AluControl second = decoder.decode(inst, Phase::Second, taken);
	EXPECT_EQ(first.multSel, second.multSel);
	EXPECT_EQ(first.divSel, second.divSel);
	EXPECT_EQ(first.ipmSel, second.ipmSel);
      }
}


TEST(AluDecoder, CsrOperands)
{
  AluDecoder decoder{CoreParams()};
  IFormInst iform(0);

  ASSERT_TRUE(iform.encodeCsrrw(1, 2, 0x340));
  AluControl ctl = decoder.decode(iform.code, Phase::First, false);
  EXPECT_EQ(ctl.opASel, OpASel::RegA);
  EXPECT_EQ(ctl.opBSel, OpBSel::Imm);
  EXPECT_EQ(ctl.immBSel, ImmBSel::I);

  ASSERT_TRUE(iform.encodeCsrrsi(1, 2, 0x340));
  ctl = decoder.decode(iform.code, Phase::First, false);
  EXPECT_EQ(ctl.opASel, OpASel::ImmZ);
}


TEST(AluDecoder, Fencei)
{
  IFormInst iform(0);
  ASSERT_TRUE(iform.encodeFencei());

  AluDecoder plain{CoreParams()};
  AluControl ctl = plain.decode(iform.code, Phase::First, false);
  EXPECT_EQ(ctl.op, AluOp::Add);
  EXPECT_EQ(ctl.opASel, OpASel::CurrPc);
  EXPECT_EQ(ctl.immBSel, ImmBSel::IncrPc);

  CoreParams params;
  params.branchTargetAlu = true;
  AluDecoder btAlu(params);
  ctl = btAlu.decode(iform.code, Phase::First, false);
  EXPECT_EQ(ctl.btASel, OpASel::CurrPc);
  EXPECT_EQ(ctl.btBSel, ImmBSel::IncrPc);
}
