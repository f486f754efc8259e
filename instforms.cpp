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

#include "instforms.hpp"

using namespace Kestrel;


ImmediateSet
Kestrel::immediates(uint32_t inst)
{
  ImmediateSet imm;

  imm.i = uint32_t(IFormInst(inst).immed());
  imm.s = uint32_t(SFormInst(inst).immed());
  imm.b = uint32_t(BFormInst(inst).immed());
  imm.u = uint32_t(UFormInst(inst).immed());
  imm.j = uint32_t(JFormInst(inst).immed());
  imm.z = (inst >> 15) & 0x1f;

  return imm;
}


bool
RFormInst::encode(unsigned opcode, unsigned funct7, unsigned funct3,
                  unsigned rdv, unsigned rs1v, unsigned rs2v)
{
  if (rdv > 31 or rs1v > 31 or rs2v > 31)
    return false;
  if (opcode > 0x7f or funct7 > 0x7f or funct3 > 7)
    return false;
  bits.opcode = opcode;
  bits.rd = rdv;
  bits.funct3 = funct3;
  bits.rs1 = rs1v;
  bits.rs2 = rs2v;
  bits.funct7 = funct7;
  return true;
}


bool
RFormInst::encodeAdd(unsigned rdv, unsigned rs1v, unsigned rs2v)
{
  return encode(0x33, 0, 0, rdv, rs1v, rs2v);
}


bool
RFormInst::encodeSub(unsigned rd, unsigned rs1, unsigned rs2)
{
  if (not encodeAdd(rd, rs1, rs2))
    return false;
  bits.funct7 = 0x20;
  return true;
}


bool
RFormInst::encodeMul(unsigned rd, unsigned rs1, unsigned rs2)
{
  if (not encodeAdd(rd, rs1, rs2))
    return false;
  bits.funct7 = 1;
  return true;
}


bool
RFormInst::encodeDiv(unsigned rd, unsigned rs1, unsigned rs2)
{
  if (not encodeMul(rd, rs1, rs2))
    return false;
  bits.funct3 = 4;
  return true;
}


bool
RFormInst::encodeRol(unsigned rd, unsigned rs1, unsigned rs2)
{
  return encode(0x33, 0x30, 1, rd, rs1, rs2);
}


bool
R4FormInst::encodeCmov(unsigned rdv, unsigned rs1v, unsigned rs2v,
                       unsigned rs3v)
{
  if (rdv > 31 or rs1v > 31 or rs2v > 31 or rs3v > 31)
    return false;
  bits.opcode = 0x33;
  bits.rd = rdv;
  bits.funct3 = 5;
  bits.rs1 = rs1v;
  bits.rs2 = rs2v;
  bits.funct2 = 3;
  bits.rs3 = rs3v;
  return true;
}


bool
R4FormInst::encodeCmix(unsigned rd, unsigned rs1, unsigned rs2, unsigned rs3)
{
  if (not encodeCmov(rd, rs1, rs2, rs3))
    return false;
  bits.funct3 = 1;
  return true;
}


bool
R4FormInst::encodeFsl(unsigned rd, unsigned rs1, unsigned rs2, unsigned rs3)
{
  if (not encodeCmov(rd, rs1, rs2, rs3))
    return false;
  bits.funct3 = 1;
  bits.funct2 = 2;
  return true;
}


bool
BFormInst::encodeBeq(unsigned rs1v, unsigned rs2v, int imm)
{
  if (imm & 0x1)
    return false;  // Least sig bit must be 0.

  if (imm >= (1 << 12) or imm < -(1 << 12))
    return false;  // Immediate out of range.

  if (rs1v > 31 or rs2v > 31)
    return false;

  bits.opcode = 0x63;
  bits.imm11 = (imm >> 11) & 1;
  bits.imm4_1 = (imm >> 1) & 0xf;
  bits.funct3 = 0;
  bits.rs1 = rs1v;
  bits.rs2 = rs2v;
  bits.imm10_5 = (imm >> 5) & 0x3f;
  bits.imm12 = (imm >> 12) & 1;
  return true;
}


bool
BFormInst::encodeBne(unsigned rs1, unsigned rs2, int imm)
{
  if (not encodeBeq(rs1, rs2, imm))
    return false;
  bits.funct3 = 1;
  return true;
}


bool
IFormInst::encodeAddi(unsigned rdv, unsigned rs1v, int imm)
{
  if (rdv > 31 or rs1v > 31)
    return false;
  if (imm >= (1 << 11) or imm < -(1 << 11))
    return false;
  fields.opcode = 0x13;
  fields.rd = rdv;
  fields.funct3 = 0;
  fields.rs1 = rs1v;
  fields.imm = imm;
  return true;
}


bool
IFormInst::encodeEbreak()
{
  if (not encodeEcall())
    return false;
  fields.imm = 1;
  return true;
}


bool
IFormInst::encodeEcall()
{
  fields.opcode = 0x73;
  fields.rd = 0;
  fields.funct3 = 0;
  fields.rs1 = 0;
  fields.imm = 0;
  return true;
}


bool
IFormInst::encodeJalr(unsigned rdv, unsigned rs1v, int offset)
{
  if (not encodeAddi(rdv, rs1v, offset))
    return false;
  fields.opcode = 0x67;
  return true;
}


bool
IFormInst::encodeLw(unsigned rdv, unsigned rs1v, int offset)
{
  if (not encodeAddi(rdv, rs1v, offset))
    return false;
  fields.opcode = 0x03;
  fields.funct3 = 2;
  return true;
}


bool
IFormInst::encodeLbu(unsigned rdv, unsigned rs1v, int offset)
{
  if (not encodeLw(rdv, rs1v, offset))
    return false;
  fields.funct3 = 4;
  return true;
}


bool
IFormInst::encodeSlli(unsigned rdv, unsigned rs1v, unsigned shamt)
{
  if (shamt > 31)
    return false;
  if (not encodeAddi(rdv, rs1v, 0))
    return false;
  fields.funct3 = 1;
  fields2.shamt = shamt;
  fields2.top7 = 0;
  return true;
}


bool
IFormInst::encodeSrai(unsigned rdv, unsigned rs1v, unsigned shamt)
{
  if (not encodeSlli(rdv, rs1v, shamt))
    return false;
  fields.funct3 = 5;
  fields2.top7 = 0x20;
  return true;
}


bool
IFormInst::encodeFencei()
{
  code = 0x100f;
  return true;
}


bool
IFormInst::encodeFence(uint32_t pred, uint32_t succ)
{
  if (pred > 0xf or succ > 0xf)
    return false;
  code = 0x0f;
  fields.imm = int((pred << 4) | succ);
  return true;
}


bool
IFormInst::encodeCsrrw(uint32_t rd, uint32_t rs1, uint32_t csr)
{
  if (rd > 31 or rs1 > 31)
    return false;

  if (csr >= (1 << 12))
    return false;

  fields.opcode = 0x73;
  fields.rd = rd;
  fields.funct3 = 1;
  fields.rs1 = rs1;
  fields2.shamt = csr & 0x1f;
  fields2.top7 = csr >> 5;
  return true;
}


bool
IFormInst::encodeCsrrs(uint32_t rd, uint32_t rs1, uint32_t csr)
{
  if (not encodeCsrrw(rd, rs1, csr))
    return false;
  fields.funct3 = 2;
  return true;
}


bool
IFormInst::encodeCsrrc(uint32_t rd, uint32_t rs1, uint32_t csr)
{
  if (not encodeCsrrw(rd, rs1, csr))
    return false;
  fields.funct3 = 3;
  return true;
}


bool
IFormInst::encodeCsrrsi(uint32_t rd, uint32_t imm, uint32_t csr)
{
  if (not encodeCsrrw(rd, imm, csr))
    return false;
  fields.funct3 = 6;
  return true;
}


bool
IFormInst::encodeCsrrci(uint32_t rd, uint32_t imm, uint32_t csr)
{
  if (not encodeCsrrw(rd, imm, csr))
    return false;
  fields.funct3 = 7;
  return true;
}


bool
SFormInst::encodeSb(unsigned rs1v, unsigned rs2v, int imm)
{
  if (rs1v > 31 or rs2v > 31 or imm >= (1 << 11) or imm < -(1 << 11))
    return false;

  bits.opcode = 0x23;
  bits.imm4_0 = imm & 0x1f;
  bits.funct3 = 0;
  bits.rs1 = rs1v;
  bits.rs2 = rs2v;
  bits.imm11_5 = (imm >> 5) & 0x7f;
  return true;
}


bool
SFormInst::encodeSw(unsigned rs1, unsigned rs2, int imm)
{
  if (not encodeSb(rs1, rs2, imm))
    return false;
  bits.funct3 = 2;
  return true;
}


bool
UFormInst::encodeLui(unsigned rdv, int immed)
{
  if (rdv > 31)
    return false;

  bits.opcode = 0x37;
  bits.rd = rdv;
  bits.imm = immed;
  return true;
}


bool
UFormInst::encodeAuipc(unsigned rdv, int immed)
{
  if (not encodeLui(rdv, immed))
    return false;
  bits.opcode = 0x17;
  return true;
}


bool
JFormInst::encodeJal(unsigned rdv, int offset)
{
  if (offset & 1)
    return false;  // Least sig bit must be 0.

  if (offset >= (1 << 20) or offset < -(1 << 20))
    return false;

  if (rdv > 31)
    return false;

  bits.opcode = 0x6f;
  bits.rd = rdv;
  bits.imm19_12 = (offset >> 12) & 0xff;
  bits.imm11 = (offset >> 11) & 1;
  bits.imm10_1 = (offset >> 1) & 0x3ff;
  bits.imm20 = (offset >> 20) & 1;
  return true;
}
