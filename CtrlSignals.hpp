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

#pragma once

#include <cstdint>


namespace Kestrel
{

  /// Whether an instruction is presented to the decoders for the first
  /// time or again on a later cycle of a multi-cycle sequence.
  enum class Phase { First, Second };

  /// Trap-like system instructions. A single value per decode so that
  /// at most one of them is ever signaled.
  enum class TrapKind { None, Ecall, Ebreak, Mret, Dret, Wfi };

  /// ALU operations.
  enum class AluOp
    {
     // Arithmetic, logic.
     Add, Sub, Xor, Or, And, Xnor, Orn, Andn,

     // Shifts.
     Sra, Srl, Sll, Sro, Slo, Ror, Rol, Grev, Gorc, Shfl, Unshfl,

     // Comparisons.
     Lt, Ltu, Ge, Geu, Eq, Ne,

     // Min/max, pack, sign extension.
     Min, Minu, Max, Maxu, Pack, Packu, Packh, Sextb, Sexth,

     // Bit counting.
     Clz, Ctz, Pcnt,

     // Set lower than.
     Slt, Sltu,

     // Ternary.
     Cmov, Cmix, Fsl, Fsr,

     // Single bit.
     Sbset, Sbclr, Sbinv, Sbext
    };

  /// Source of ALU operand A.
  enum class OpASel { RegA, CurrPc, ImmZ, Zero };

  /// Source of ALU operand B.
  enum class OpBSel { RegB, Imm };

  /// Immediate selected for ALU operand B (and for the second operand
  /// of the branch-target adder). IncrPc is the size of the current
  /// instruction (2 or 4).
  enum class ImmBSel { I, S, B, U, J, IncrPc };

  /// Multiply/divide operations.
  enum class MdOp { Mull, Mulh, Div, Rem };

  /// Masked-arithmetic (ipm) operations. Opaque to the decoders.
  enum class IpmOp { Mul, Homog, Square, MulConst, Unmask, Mask };

  /// CSR access operations.
  enum class CsrOp { Read, Write, Set, Clear };

  /// Data size of a memory transaction.
  enum class MemType { Word, Half, Byte };

  /// Source of register-file write data.
  enum class RfWdSel { Ex, Csr };


  /// Inputs common to both decoders for one cycle.
  struct DecodeInput
  {
    uint32_t inst = 0;
    Phase phase = Phase::First;
    bool illegalCompressed = false;  // Fetch flagged a bad compressed inst.
    bool compressed = false;         // Expanded from a 16-bit inst.
    bool branchTaken = false;        // Branch outcome of the first phase.
  };


  /// Output of the instruction decoder.
  struct DecoderSignals
  {
    bool illegal = false;
    TrapKind trap = TrapKind::None;

    bool jumpInDec = false;    // Jump in progress.
    bool jumpSet = false;      // Commit the jump target this cycle.
    bool branchInDec = false;  // Conditional branch in progress.
    bool icacheInval = false;

    bool rfWe = false;
    RfWdSel rfWdSel = RfWdSel::Ex;
    bool rfRenA = false;
    bool rfRenB = false;

    MdOp mdOp = MdOp::Mull;
    unsigned mdSignedMode = 0;  // Bit 0: operand A signed, bit 1: B.

    IpmOp ipmOp = IpmOp::Mul;

    bool csrAccess = false;
    CsrOp csrOp = CsrOp::Read;

    bool dataReq = false;
    bool dataWe = false;
    MemType dataType = MemType::Word;
    bool dataSignExt = false;
  };


  /// Output of the ALU-control decoder.
  struct AluControl
  {
    AluOp op = AluOp::Sltu;
    OpASel opASel = OpASel::Zero;
    OpBSel opBSel = OpBSel::Imm;
    ImmBSel immBSel = ImmBSel::I;

    // Branch-target adder operands (only used with a dedicated adder).
    OpASel btASel = OpASel::CurrPc;
    ImmBSel btBSel = ImmBSel::I;

    bool multicycle = false;
    bool useRs3 = false;

    // Static unit selectors. Independent of the phase.
    bool multSel = false;
    bool divSel = false;
    bool ipmSel = false;
  };


  const char* aluOpName(AluOp op);
  const char* opASelName(OpASel sel);
  const char* opBSelName(OpBSel sel);
  const char* immBSelName(ImmBSel sel);
  const char* mdOpName(MdOp op);
  const char* ipmOpName(IpmOp op);
  const char* csrOpName(CsrOp op);
  const char* memTypeName(MemType type);
  const char* trapName(TrapKind trap);

}
