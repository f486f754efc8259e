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

  // Structures useful for encoding/decoding 32-bit risc-v instructions.

  /// Major opcodes (instruction bits 6 to 0) recognized by the decoders.
  enum class Opcode : uint32_t
    {
     Load    = 0x03,
     Custom0 = 0x0b,  // Masked arithmetic (ipm) extension.
     MiscMem = 0x0f,
     OpImm   = 0x13,
     Auipc   = 0x17,
     Store   = 0x23,
     Op      = 0x33,
     Lui     = 0x37,
     Branch  = 0x63,
     Jalr    = 0x67,
     Jal     = 0x6f,
     System  = 0x73
    };


  /// Return the major opcode field of the given instruction.
  inline uint32_t
  opcodeOf(uint32_t inst)
  { return inst & 0x7f; }


  /// Register and function fields at their fixed positions. These are
  /// extracted for every instruction regardless of its format.
  struct RegFields
  {
    explicit RegFields(uint32_t inst)
      : rd((inst >> 7) & 0x1f), funct3((inst >> 12) & 7),
        rs1((inst >> 15) & 0x1f), rs2((inst >> 20) & 0x1f),
        rs3((inst >> 27) & 0x1f), funct7(inst >> 25)
    { }

    unsigned rd;
    unsigned funct3;
    unsigned rs1;
    unsigned rs2;
    unsigned rs3;
    unsigned funct7;
  };


  /// Pack/unpack an r-form instruction.
  union RFormInst
  {
    /// Constructor: Either pass a valid r-form value or start with any
    /// value and then use an encode method.
    RFormInst(uint32_t inst)
    { code = inst; }

    /// Encode "add rd, rs1, rs2" into this object.
    bool encodeAdd(unsigned rd, unsigned rs1, unsigned rs2);

    /// Encode "sub rd, rs1, rs2" into this object.
    bool encodeSub(unsigned rd, unsigned rs1, unsigned rs2);

    /// Encode "mul rd, rs1, rs2" into this object.
    bool encodeMul(unsigned rd, unsigned rs1, unsigned rs2);

    /// Encode "div rd, rs1, rs2" into this object.
    bool encodeDiv(unsigned rd, unsigned rs1, unsigned rs2);

    /// Encode "rol rd, rs1, rs2" into this object.
    bool encodeRol(unsigned rd, unsigned rs1, unsigned rs2);

    /// Encode a register-register instruction with the given opcode
    /// and function fields. Return false if a field is out of range.
    bool encode(unsigned opcode, unsigned funct7, unsigned funct3,
                unsigned rd, unsigned rs1, unsigned rs2);

    uint32_t code;

    struct
    {
      unsigned opcode : 7;
      unsigned rd     : 5;
      unsigned funct3 : 3;
      unsigned rs1    : 5;
      unsigned rs2    : 5;
      unsigned funct7 : 7;
    } bits;
  };


  /// Pack/unpack an r4-form instruction: Ternary bit-manipulation
  /// instructions (cmix, cmov, fsl, fsr) carry a third source register
  /// in the top 5 bits.
  union R4FormInst
  {
    R4FormInst(uint32_t inst)
    { code = inst; }

    /// Encode "cmov rd, rs2, rs1, rs3" into this object.
    bool encodeCmov(unsigned rd, unsigned rs1, unsigned rs2, unsigned rs3);

    /// Encode "cmix rd, rs2, rs1, rs3" into this object.
    bool encodeCmix(unsigned rd, unsigned rs1, unsigned rs2, unsigned rs3);

    /// Encode "fsl rd, rs1, rs3, rs2" into this object.
    bool encodeFsl(unsigned rd, unsigned rs1, unsigned rs2, unsigned rs3);

    uint32_t code;

    struct
    {
      unsigned opcode : 7;
      unsigned rd     : 5;
      unsigned funct3 : 3;
      unsigned rs1    : 5;
      unsigned rs2    : 5;
      unsigned funct2 : 2;
      unsigned rs3    : 5;
    } bits;
  };


  /// Pack/unpack a b-form instruction.
  union BFormInst
  {
    /// Constructor: Either pass a valid b-form value or start with any
    /// value and then use an encode method.
    BFormInst(uint32_t inst)
    { code = inst; }

    /// Return immediate value as signed.
    int32_t immed() const
    { return (bits.imm12   << 12) | (bits.imm11 << 11) | (bits.imm10_5 << 5) |
	     (bits.imm4_1  << 1); }

    /// Encode a "beq rs1, rs2, imm" into this object.
    bool encodeBeq(unsigned rs1, unsigned rs2, int imm);

    /// Encode a "bne rs1, rs2, imm" into this object.
    bool encodeBne(unsigned rs1, unsigned rs2, int imm);

    uint32_t code;

    struct
    {
      unsigned opcode  : 7;
      unsigned imm11   : 1;
      unsigned imm4_1  : 4;
      unsigned funct3  : 3;
      unsigned rs1     : 5;
      unsigned rs2     : 5;
      unsigned imm10_5 : 6;
      int      imm12   : 1;  // Note: int for sign extension
    } bits;
  };


  /// Pack/unpack a i-form instruction.
  union IFormInst
  {
    /// Constructor: Either pass a valid i-form value or start with any
    /// value and then use an encode method.
    IFormInst(uint32_t inst)
    { code = inst; }

    /// Return immediate value as signed.
    int32_t immed() const
    { return fields.imm; }

    /// Return immediate value as unsigned.
    uint32_t uimmed() const  // Immediate as unsigned.
    { return fields.imm & 0xfff; }

    /// Return top-5 bits of instruction: Selects the shift-like
    /// operation of a shift-immediate instruction.
    unsigned top5() const
    { return uimmed() >> 7; }

    /// Encode "addi rd, rs1, imm" into this object returning
    /// true on success and false if any of the parameters are out of
    /// range.
    bool encodeAddi(unsigned rd, unsigned rs1, int imm);

    /// Encode "ebreak" into this object.
    bool encodeEbreak();

    /// Encode "ecall" into this object.
    bool encodeEcall();

    /// Encode "jalr rd, offset(rs1)" into this object.
    bool encodeJalr(unsigned rd, unsigned rs1, int offset);

    /// Encode "lw rd, offset(rs1)" into this object.
    bool encodeLw(unsigned rd, unsigned rs1, int offset);

    /// Encode "lbu rd, offset(rs1)" into this object.
    bool encodeLbu(unsigned rd, unsigned rs1, int offset);

    /// Encode "slli rd, rs1, shamt" into this object.
    bool encodeSlli(unsigned rd, unsigned rs1, unsigned shamt);

    /// Encode "srai rd, rs1, shamt" into this object.
    bool encodeSrai(unsigned rd, unsigned rs1, unsigned shamt);

    /// Encode "fence.i" into this object.
    bool encodeFencei();

    /// Encode "fence pred, succ" into this object.
    bool encodeFence(uint32_t pred, uint32_t succ);

    /// Encode "csrrw rd, csr, rs" into this object.
    bool encodeCsrrw(uint32_t rd, uint32_t rs1, uint32_t csr);

    /// Encode "csrrs rd, csr, rs" into this object.
    bool encodeCsrrs(uint32_t rd, uint32_t rs1, uint32_t csr);

    /// Encode "csrrc rd, csr, rs" into this object.
    bool encodeCsrrc(uint32_t rd, uint32_t rs1, uint32_t csr);

    /// Encode "csrrsi rd, csr, imm" into this object.
    bool encodeCsrrsi(uint32_t rd, uint32_t imm, uint32_t csr);

    /// Encode "csrrci rd, csr, imm" into this object.
    bool encodeCsrrci(uint32_t rd, uint32_t imm, uint32_t csr);

    uint32_t code;

    struct
    {
      unsigned opcode : 7;
      unsigned rd     : 5;
      unsigned funct3 : 3;
      unsigned rs1    : 5;
      int      imm    : 12;
    } fields;

    struct
    {
      unsigned opcode : 7;
      unsigned rd     : 5;
      unsigned funct3 : 3;
      unsigned rs1    : 5;
      unsigned shamt  : 5;
      unsigned top7   : 7;
    } fields2;
  };


  /// Pack/unpack a s-form instruction.
  union SFormInst
  {
    /// Constructor: Either pass a valid s-form value or start with any
    /// value and then use an encode method.
    SFormInst(uint32_t inst)
    { code = inst; }

    /// Return immediate value as signed.
    int32_t immed() const
    { return (bits.imm11_5 << 5) | bits.imm4_0; }

    /// Encode "sb rs2, imm(rs1)" into this object.
    bool encodeSb(unsigned rs1, unsigned rs2, int imm);

    /// Encode "sw rs2, imm(rs1)" into this object.
    bool encodeSw(unsigned rs1, unsigned rs2, int imm);

    uint32_t code;

    struct
    {
      unsigned opcode  : 7;
      unsigned imm4_0  : 5;
      unsigned funct3  : 3;
      unsigned rs1     : 5;
      unsigned rs2     : 5;
      int      imm11_5 : 7;
    } bits;
  };


  /// Pack/unpack a u-form instruction.
  union UFormInst
  {
    /// Constructor: Either pass a valid u-form value or start with
    /// any value and then use an encode method.
    UFormInst(uint32_t inst)
    { code = inst; }

    /// Return immediate value as signed.
    int32_t immed() const
    { return int32_t(uint32_t(bits.imm) << 12); }

    /// Encode "lui rd, immed" into this object.
    bool encodeLui(unsigned rd, int immed);

    /// Encode "auipc rd, immed" into this object.
    bool encodeAuipc(unsigned rd, int immed);

    uint32_t code;

    struct
    {
      unsigned opcode  : 7;
      unsigned rd      : 5;
      int      imm     : 20;
    } bits;
  };


  /// Pack/unpack a j-form instruction.
  union JFormInst
  {
    /// Constructor: Either pass a valid u-form value or start with
    /// any value and then use an encode method.
    JFormInst(uint32_t inst)
    { code = inst; }

    /// Return immediate value as signed.
    int32_t immed() const
    { return (bits.imm20 << 20) | (bits.imm19_12 << 12) | (bits.imm11 << 11) |
	     (bits.imm10_1 << 1); }

    /// Encode "jal rd, offset" into this object.
    bool encodeJal(unsigned rd, int offset);

    uint32_t code;

    struct
    {
      unsigned opcode   : 7;
      unsigned rd       : 5;
      unsigned imm19_12 : 8;
      unsigned imm11    : 1;
      unsigned imm10_1  : 10;
      int      imm20    : 1;
    } bits;
  };


  /// The immediate values of every instruction format. All of them
  /// are computed for each instruction; the ALU-control decoder picks
  /// the one it needs.
  struct ImmediateSet
  {
    uint32_t i = 0;
    uint32_t s = 0;
    uint32_t b = 0;
    uint32_t u = 0;
    uint32_t j = 0;
    uint32_t z = 0;   // Zero-extended rs1 field (csr immediate).
  };


  /// Return the immediate values of the given instruction.
  ImmediateSet immediates(uint32_t inst);

}
