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

namespace Kestrel
{
  /// Associate a unique integer identifier with each instruction.
  enum class InstId
    {
     illegal,

     // Base.
     lui,
     auipc,
     jal,
     jalr,
     beq,
     bne,
     blt,
     bge,
     bltu,
     bgeu,
     lb,
     lh,
     lw,
     lbu,
     lhu,
     sb,
     sh,
     sw,
     addi,
     slti,
     sltiu,
     xori,
     ori,
     andi,
     slli,
     srli,
     srai,
     add,
     sub,
     sll,
     slt,
     sltu,
     xor_,
     srl,
     sra,
     or_,
     and_,
     fence,
     fencei,
     ecall,
     ebreak,
     mret,
     dret,
     wfi,

     // CSR
     csrrw,
     csrrs,
     csrrc,
     csrrwi,
     csrrsi,
     csrrci,

     // Mul/div
     mul,
     mulh,
     mulhsu,
     mulhu,
     div,
     divu,
     rem,
     remu,

     // Bit manipulation: register-register.
     andn,
     orn,
     xnor,
     slo,
     sro,
     rol,
     ror,
     min,
     max,
     minu,
     maxu,
     pack,
     packu,
     packh,
     sbclr,
     sbset,
     sbinv,
     sbext,
     grev,
     gorc,
     shfl,
     unshfl,

     // Bit manipulation: register-immediate.
     sloi,
     sroi,
     rori,
     sbclri,
     sbseti,
     sbinvi,
     sbexti,
     grevi,
     gorci,
     shfli,
     unshfli,
     clz,
     ctz,
     pcnt,
     sext_b,
     sext_h,

     // Bit manipulation: ternary.
     cmix,
     cmov,
     fsl,
     fsr,
     fsri,

     // Masked arithmetic.
     ipm_mul,
     ipm_homog,
     ipm_sq,
     ipm_mulc,
     ipm_unmask,
     ipm_mask,

     maxId = ipm_mask
    };
}
