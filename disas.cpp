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

#include <iomanip>
#include <iostream>
#include <sstream>
#include "DecodedInst.hpp"


using namespace Kestrel;


static const char* abiRegNames[] = { "zero", "ra", "sp", "gp", "tp", "t0",
				     "t1", "t2", "s0", "s1", "a0", "a1", "a2",
				     "a3", "a4", "a5", "a6", "a7", "s2", "s3",
				     "s4", "s5", "s6", "s7", "s8", "s9", "s10",
				     "s11", "t3", "t4", "t5", "t6" };


std::string
Kestrel::intRegName(unsigned ix, bool abiNames)
{
  if (abiNames and ix < sizeof(abiRegNames)/sizeof(abiRegNames[0]))
    return abiRegNames[ix];
  return std::string("x") + std::to_string(ix);
}


/// Print the given signed immediate in hex with a leading minus sign if
/// negative.
static
void
printSignedHex(std::ostream& stream, int32_t imm)
{
  if (imm < 0)
    stream << "-0x" << std::hex << (-int64_t(imm)) << std::dec;
  else
    stream << "0x" << std::hex << imm << std::dec;
}


/// Helper to disassemble method. Print on the given stream given
/// instruction which is of the form: inst reg1, imm(reg2)
static
void
printLdSt(std::ostream& stream, unsigned reg, unsigned base, int32_t imm,
	  bool abi)
{
  stream << intRegName(reg, abi) << ", ";
  printSignedHex(stream, imm);
  stream << "(" << intRegName(base, abi) << ")";
}


/// Helper to disassemble method. Print a pc-relative target of the form
/// ". + 0x10" or ". - 0x8".
static
void
printPcRel(std::ostream& stream, int32_t imm)
{
  char sign = '+';
  int64_t mag = imm;
  if (mag < 0)
    {
      sign = '-';
      mag = -mag;
    }
  stream << ". " << sign << " 0x" << std::hex << mag << std::dec;
}


/// Helper to disassemble method. Print the predecessor or successor set
/// of a fence instruction (e.g. "iorw").
static
void
printFenceSet(std::ostream& stream, unsigned set)
{
  if (set == 0)
    {
      stream << "0";
      return;
    }
  if (set & 8) stream << 'i';
  if (set & 4) stream << 'o';
  if (set & 2) stream << 'r';
  if (set & 1) stream << 'w';
}


void
Kestrel::disassembleInst(const DecodedInst& di, std::ostream& out, bool abi)
{
  const InstEntry* entry = di.instEntry();
  if (not entry or entry->instId() == InstId::illegal)
    {
      out << "illegal";
      return;
    }

  const RegFields& f = di.fields();
  const ImmediateSet& imm = di.immediates();
  uint32_t inst = di.inst();

  // Print instruction in a 8 character field followed by a space.
  if (entry->format() == InstFormat::None)
    {
      out << entry->name();
      return;
    }
  out << std::left << std::setw(8) << entry->name() << ' ';

  switch (entry->format())
    {
    case InstFormat::R:
      out << intRegName(f.rd, abi) << ", " << intRegName(f.rs1, abi)
	  << ", " << intRegName(f.rs2, abi);
      break;

    case InstFormat::R4:
      // cmix/cmov: rd, rs2, rs1, rs3. fsl/fsr: rd, rs1, rs3, rs2.
      if (entry->instId() == InstId::cmix or entry->instId() == InstId::cmov)
	out << intRegName(f.rd, abi) << ", " << intRegName(f.rs2, abi)
	    << ", " << intRegName(f.rs1, abi) << ", "
	    << intRegName(f.rs3, abi);
      else
	out << intRegName(f.rd, abi) << ", " << intRegName(f.rs1, abi)
	    << ", " << intRegName(f.rs3, abi) << ", "
	    << intRegName(f.rs2, abi);
      break;

    case InstFormat::R4Imm:
      out << intRegName(f.rd, abi) << ", " << intRegName(f.rs1, abi)
	  << ", " << intRegName(f.rs3, abi) << ", 0x" << std::hex
	  << ((inst >> 20) & 0x3f) << std::dec;
      break;

    case InstFormat::I:
      out << intRegName(f.rd, abi) << ", " << intRegName(f.rs1, abi) << ", ";
      printSignedHex(out, int32_t(imm.i));
      break;

    case InstFormat::Shamt:
      out << intRegName(f.rd, abi) << ", " << intRegName(f.rs1, abi)
	  << ", 0x" << std::hex << ((inst >> 20) & 0x1f) << std::dec;
      break;

    case InstFormat::Unary:
      out << intRegName(f.rd, abi) << ", " << intRegName(f.rs1, abi);
      break;

    case InstFormat::Load:
      printLdSt(out, f.rd, f.rs1, int32_t(imm.i), abi);
      break;

    case InstFormat::Store:
      printLdSt(out, f.rs2, f.rs1, int32_t(imm.s), abi);
      break;

    case InstFormat::Branch:
      out << intRegName(f.rs1, abi) << ", " << intRegName(f.rs2, abi) << ", ";
      printPcRel(out, int32_t(imm.b));
      break;

    case InstFormat::U:
      out << intRegName(f.rd, abi) << ", 0x" << std::hex << (imm.u >> 12)
	  << std::dec;
      break;

    case InstFormat::J:
      out << intRegName(f.rd, abi) << ", ";
      printPcRel(out, int32_t(imm.j));
      break;

    case InstFormat::Csr:
      out << intRegName(f.rd, abi) << ", 0x" << std::hex << (inst >> 20)
	  << std::dec << ", " << intRegName(f.rs1, abi);
      break;

    case InstFormat::CsrImm:
      out << intRegName(f.rd, abi) << ", 0x" << std::hex << (inst >> 20)
	  << ", 0x" << imm.z << std::dec;
      break;

    case InstFormat::Fence:
      printFenceSet(out, (inst >> 24) & 0xf);
      out << ", ";
      printFenceSet(out, (inst >> 20) & 0xf);
      break;

    case InstFormat::None:
      break;
    }
}


std::string
Kestrel::disassembleInst(const DecodedInst& di, bool abiNames)
{
  std::ostringstream oss;
  disassembleInst(di, oss, abiNames);
  return oss.str();
}
