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

#include <cassert>
#include "InstEntry.hpp"

using namespace Kestrel;


bool
Kestrel::isExtensionEnabled(Extension ext, const CoreParams& params)
{
  switch (ext)
    {
    case Extension::M: return params.rv32m;
    case Extension::B: return params.rv32b;
    default:           return true;
    }
}


InstEntry::InstEntry(std::string name, InstId id,
		     uint32_t code, uint32_t mask,
		     Extension ext, InstType type, InstFormat format,
		     AluOp aluOp)
  : name_(name), id_(id), code_(code), codeMask_(mask), ext_(ext),
    type_(type), format_(format), aluOp_(aluOp)
{
}


InstTable::InstTable()
{
  setupInstVec();

  // Sanity check.
  for (unsigned i = 0; i <= unsigned(InstId::maxId); ++i)
    {
      InstId id = InstId(i);
      assert(instVec_.at(i).instId() == id);
      (void) id;
    }

  for (const auto& entry : instVec_)
    instMap_[entry.name()] = entry.instId();
}


const InstEntry&
InstTable::getEntry(InstId id) const
{
  if (size_t(id) >= instVec_.size())
    return instVec_.front();
  return instVec_.at(size_t(id));
}


const InstEntry&
InstTable::getEntry(const std::string& name) const
{
  const auto iter = instMap_.find(name);
  if (iter == instMap_.end())
    return instVec_.front();
  auto id = iter->second;
  return getEntry(id);
}


const InstEntry&
InstTable::match(uint32_t inst) const
{
  // Skip the illegal entry: its mask would match the all-ones word.
  for (size_t i = 1; i < instVec_.size(); ++i)
    if (instVec_[i].matches(inst))
      return instVec_[i];
  return instVec_.front();
}


bool
InstTable::hasEntry(const std::string& name) const
{
  return instMap_.find(name) != instMap_.end();
}


void
InstTable::setupInstVec()
{
  uint32_t low7Mask = 0x7f;                 // Opcode mask: lowest 7 bits
  uint32_t funct3Low7Mask = 0x707f;         // Funct3 and lowest 7 bits
  uint32_t top7Funct3Low7Mask = 0xfe00707f; // Top7, Funct3 and lowest 7 bits
  uint32_t top5Funct3Low7Mask = 0xf800707f; // Top5, Funct3 and lowest 7 bits
  uint32_t top6Funct3Low7Mask = 0xfc00707f; // Top6, Funct3 and lowest 7 bits
  uint32_t top12Funct3Low7Mask = 0xfff0707f;
  uint32_t ternaryMask = 0x0600707f;        // Bits 26-25, funct3, opcode
  uint32_t fsriMask = 0x0400707f;           // Bit 26, funct3, opcode
  uint32_t allMask = 0xffffffff;

  using E = Extension;
  using T = InstType;
  using F = InstFormat;
  using A = AluOp;

  instVec_ =
    {
      // Base instructions
      { "illegal", InstId::illegal, 0xffffffff, 0xffffffff },

      { "lui", InstId::lui, 0x37, low7Mask, E::I, T::Int, F::U, A::Add },
      { "auipc", InstId::auipc, 0x17, low7Mask, E::I, T::Int, F::U, A::Add },
      { "jal", InstId::jal, 0x6f, low7Mask, E::I, T::Jump, F::J, A::Add },
      { "jalr", InstId::jalr, 0x67, funct3Low7Mask,
	E::I, T::Jump, F::Load, A::Add },

      { "beq", InstId::beq, 0x0063, funct3Low7Mask,
	E::I, T::Branch, F::Branch, A::Eq },
      { "bne", InstId::bne, 0x1063, funct3Low7Mask,
	E::I, T::Branch, F::Branch, A::Ne },
      { "blt", InstId::blt, 0x4063, funct3Low7Mask,
	E::I, T::Branch, F::Branch, A::Lt },
      { "bge", InstId::bge, 0x5063, funct3Low7Mask,
	E::I, T::Branch, F::Branch, A::Ge },
      { "bltu", InstId::bltu, 0x6063, funct3Low7Mask,
	E::I, T::Branch, F::Branch, A::Ltu },
      { "bgeu", InstId::bgeu, 0x7063, funct3Low7Mask,
	E::I, T::Branch, F::Branch, A::Geu },

      { "lb", InstId::lb, 0x0003, funct3Low7Mask,
	E::I, T::Load, F::Load, A::Add },
      { "lh", InstId::lh, 0x1003, funct3Low7Mask,
	E::I, T::Load, F::Load, A::Add },
      { "lw", InstId::lw, 0x2003, funct3Low7Mask,
	E::I, T::Load, F::Load, A::Add },
      { "lbu", InstId::lbu, 0x4003, funct3Low7Mask,
	E::I, T::Load, F::Load, A::Add },
      { "lhu", InstId::lhu, 0x5003, funct3Low7Mask,
	E::I, T::Load, F::Load, A::Add },

      { "sb", InstId::sb, 0x0023, funct3Low7Mask,
	E::I, T::Store, F::Store, A::Add },
      { "sh", InstId::sh, 0x1023, funct3Low7Mask,
	E::I, T::Store, F::Store, A::Add },
      { "sw", InstId::sw, 0x2023, funct3Low7Mask,
	E::I, T::Store, F::Store, A::Add },

      { "addi", InstId::addi, 0x0013, funct3Low7Mask,
	E::I, T::Int, F::I, A::Add },
      { "slti", InstId::slti, 0x2013, funct3Low7Mask,
	E::I, T::Int, F::I, A::Slt },
      { "sltiu", InstId::sltiu, 0x3013, funct3Low7Mask,
	E::I, T::Int, F::I, A::Sltu },
      { "xori", InstId::xori, 0x4013, funct3Low7Mask,
	E::I, T::Int, F::I, A::Xor },
      { "ori", InstId::ori, 0x6013, funct3Low7Mask,
	E::I, T::Int, F::I, A::Or },
      { "andi", InstId::andi, 0x7013, funct3Low7Mask,
	E::I, T::Int, F::I, A::And },

      { "slli", InstId::slli, 0x1013, top7Funct3Low7Mask,
	E::I, T::Int, F::Shamt, A::Sll },
      { "srli", InstId::srli, 0x5013, top7Funct3Low7Mask,
	E::I, T::Int, F::Shamt, A::Srl },
      { "srai", InstId::srai, 0x40005013, top7Funct3Low7Mask,
	E::I, T::Int, F::Shamt, A::Sra },

      { "add", InstId::add, 0x0033, top7Funct3Low7Mask,
	E::I, T::Int, F::R, A::Add },
      { "sub", InstId::sub, 0x40000033, top7Funct3Low7Mask,
	E::I, T::Int, F::R, A::Sub },
      { "sll", InstId::sll, 0x1033, top7Funct3Low7Mask,
	E::I, T::Int, F::R, A::Sll },
      { "slt", InstId::slt, 0x2033, top7Funct3Low7Mask,
	E::I, T::Int, F::R, A::Slt },
      { "sltu", InstId::sltu, 0x3033, top7Funct3Low7Mask,
	E::I, T::Int, F::R, A::Sltu },
      { "xor", InstId::xor_, 0x4033, top7Funct3Low7Mask,
	E::I, T::Int, F::R, A::Xor },
      { "srl", InstId::srl, 0x5033, top7Funct3Low7Mask,
	E::I, T::Int, F::R, A::Srl },
      { "sra", InstId::sra, 0x40005033, top7Funct3Low7Mask,
	E::I, T::Int, F::R, A::Sra },
      { "or", InstId::or_, 0x6033, top7Funct3Low7Mask,
	E::I, T::Int, F::R, A::Or },
      { "and", InstId::and_, 0x7033, top7Funct3Low7Mask,
	E::I, T::Int, F::R, A::And },

      { "fence", InstId::fence, 0x000f, funct3Low7Mask,
	E::I, T::Fence, F::Fence, A::Add },
      { "fence.i", InstId::fencei, 0x100f, funct3Low7Mask,
	E::I, T::Fence, F::None, A::Add },

      { "ecall", InstId::ecall, 0x00000073, allMask,
	E::I, T::System, F::None, A::Sltu },
      { "ebreak", InstId::ebreak, 0x00100073, allMask,
	E::I, T::System, F::None, A::Sltu },
      { "mret", InstId::mret, 0x30200073, allMask,
	E::I, T::System, F::None, A::Sltu },
      { "dret", InstId::dret, 0x7b200073, allMask,
	E::I, T::System, F::None, A::Sltu },
      { "wfi", InstId::wfi, 0x10500073, allMask,
	E::I, T::System, F::None, A::Sltu },

      { "csrrw", InstId::csrrw, 0x1073, funct3Low7Mask,
	E::I, T::Csr, F::Csr, A::Sltu },
      { "csrrs", InstId::csrrs, 0x2073, funct3Low7Mask,
	E::I, T::Csr, F::Csr, A::Sltu },
      { "csrrc", InstId::csrrc, 0x3073, funct3Low7Mask,
	E::I, T::Csr, F::Csr, A::Sltu },
      { "csrrwi", InstId::csrrwi, 0x5073, funct3Low7Mask,
	E::I, T::Csr, F::CsrImm, A::Sltu },
      { "csrrsi", InstId::csrrsi, 0x6073, funct3Low7Mask,
	E::I, T::Csr, F::CsrImm, A::Sltu },
      { "csrrci", InstId::csrrci, 0x7073, funct3Low7Mask,
	E::I, T::Csr, F::CsrImm, A::Sltu },

      // Mul/div
      { "mul", InstId::mul, 0x02000033, top7Funct3Low7Mask,
	E::M, T::Multiply, F::R, A::Add },
      { "mulh", InstId::mulh, 0x02001033, top7Funct3Low7Mask,
	E::M, T::Multiply, F::R, A::Add },
      { "mulhsu", InstId::mulhsu, 0x02002033, top7Funct3Low7Mask,
	E::M, T::Multiply, F::R, A::Add },
      { "mulhu", InstId::mulhu, 0x02003033, top7Funct3Low7Mask,
	E::M, T::Multiply, F::R, A::Add },
      { "div", InstId::div, 0x02004033, top7Funct3Low7Mask,
	E::M, T::Divide, F::R, A::Add },
      { "divu", InstId::divu, 0x02005033, top7Funct3Low7Mask,
	E::M, T::Divide, F::R, A::Add },
      { "rem", InstId::rem, 0x02006033, top7Funct3Low7Mask,
	E::M, T::Divide, F::R, A::Add },
      { "remu", InstId::remu, 0x02007033, top7Funct3Low7Mask,
	E::M, T::Divide, F::R, A::Add },

      // Bit manipulation: register-register
      { "andn", InstId::andn, 0x40007033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Andn },
      { "orn", InstId::orn, 0x40006033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Orn },
      { "xnor", InstId::xnor, 0x40004033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Xnor },
      { "slo", InstId::slo, 0x20001033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Slo },
      { "sro", InstId::sro, 0x20005033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Sro },
      { "rol", InstId::rol, 0x60001033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Rol },
      { "ror", InstId::ror, 0x60005033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Ror },
      { "min", InstId::min, 0x0a004033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Min },
      { "max", InstId::max, 0x0a005033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Max },
      { "minu", InstId::minu, 0x0a006033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Minu },
      { "maxu", InstId::maxu, 0x0a007033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Maxu },
      { "pack", InstId::pack, 0x08004033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Pack },
      { "packu", InstId::packu, 0x48004033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Packu },
      { "packh", InstId::packh, 0x08007033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Packh },
      { "sbclr", InstId::sbclr, 0x48001033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Sbclr },
      { "sbset", InstId::sbset, 0x28001033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Sbset },
      { "sbinv", InstId::sbinv, 0x68001033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Sbinv },
      { "sbext", InstId::sbext, 0x48005033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Sbext },
      { "grev", InstId::grev, 0x68005033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Grev },
      { "gorc", InstId::gorc, 0x28005033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Gorc },
      { "shfl", InstId::shfl, 0x08001033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Shfl },
      { "unshfl", InstId::unshfl, 0x08005033, top7Funct3Low7Mask,
	E::B, T::Int, F::R, A::Unshfl },

      // Bit manipulation: register-immediate
      { "sloi", InstId::sloi, 0x20001013, top5Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Slo },
      { "sroi", InstId::sroi, 0x20005013, top6Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Sro },
      { "rori", InstId::rori, 0x60005013, top6Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Ror },
      { "sbclri", InstId::sbclri, 0x48001013, top5Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Sbclr },
      { "sbseti", InstId::sbseti, 0x28001013, top5Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Sbset },
      { "sbinvi", InstId::sbinvi, 0x68001013, top5Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Sbinv },
      { "sbexti", InstId::sbexti, 0x48005013, top6Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Sbext },
      { "grevi", InstId::grevi, 0x68005013, top6Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Grev },
      { "gorci", InstId::gorci, 0x28005013, top6Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Gorc },
      { "shfli", InstId::shfli, 0x08001013, top6Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Shfl },
      { "unshfli", InstId::unshfli, 0x08005013, top6Funct3Low7Mask,
	E::B, T::Int, F::Shamt, A::Unshfl },
      { "clz", InstId::clz, 0x60001013, top12Funct3Low7Mask,
	E::B, T::Int, F::Unary, A::Clz },
      { "ctz", InstId::ctz, 0x60101013, top12Funct3Low7Mask,
	E::B, T::Int, F::Unary, A::Ctz },
      { "pcnt", InstId::pcnt, 0x60201013, top12Funct3Low7Mask,
	E::B, T::Int, F::Unary, A::Pcnt },
      { "sext.b", InstId::sext_b, 0x60401013, top12Funct3Low7Mask,
	E::B, T::Int, F::Unary, A::Sextb },
      { "sext.h", InstId::sext_h, 0x60501013, top12Funct3Low7Mask,
	E::B, T::Int, F::Unary, A::Sexth },

      // Bit manipulation: ternary
      { "cmix", InstId::cmix, 0x06001033, ternaryMask,
	E::B, T::Int, F::R4, A::Cmix },
      { "cmov", InstId::cmov, 0x06005033, ternaryMask,
	E::B, T::Int, F::R4, A::Cmov },
      { "fsl", InstId::fsl, 0x04001033, ternaryMask,
	E::B, T::Int, F::R4, A::Fsl },
      { "fsr", InstId::fsr, 0x04005033, ternaryMask,
	E::B, T::Int, F::R4, A::Fsr },
      { "fsri", InstId::fsri, 0x04005013, fsriMask,
	E::B, T::Int, F::R4Imm, A::Fsr },

      // Masked arithmetic
      { "ipm.mul", InstId::ipm_mul, 0x000b, funct3Low7Mask,
	E::Xipm, T::Masked, F::R, A::Add },
      { "ipm.homog", InstId::ipm_homog, 0x100b, funct3Low7Mask,
	E::Xipm, T::Masked, F::R, A::Add },
      { "ipm.sq", InstId::ipm_sq, 0x200b, funct3Low7Mask,
	E::Xipm, T::Masked, F::R, A::Add },
      { "ipm.mulc", InstId::ipm_mulc, 0x300b, funct3Low7Mask,
	E::Xipm, T::Masked, F::R, A::Add },
      { "ipm.unmask", InstId::ipm_unmask, 0x400b, funct3Low7Mask,
	E::Xipm, T::Masked, F::R, A::Add },
      { "ipm.mask", InstId::ipm_mask, 0x500b, funct3Low7Mask,
	E::Xipm, T::Masked, F::R, A::Add },
    };
}
