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
#include <string>
#include <unordered_map>
#include <vector>
#include "CoreParams.hpp"
#include "CtrlSignals.hpp"
#include "InstId.hpp"


namespace Kestrel
{

  /// Instruction-set extension an instruction belongs to.
  enum class Extension { I, M, B, Xipm };

  enum class InstType { Load, Store, Multiply, Divide, Branch, Jump, Int,
			Csr, System, Fence, Masked };

  /// Assembly syntax of the operands. Used by the disassembler.
  enum class InstFormat
    {
     None,    // inst
     R,       // inst rd, rs1, rs2
     R4,      // inst rd, rs1, rs2, rs3
     R4Imm,   // inst rd, rs1, rs3, imm
     I,       // inst rd, rs1, imm
     Shamt,   // inst rd, rs1, shamt
     Unary,   // inst rd, rs1
     Load,    // inst rd, imm(rs1)
     Store,   // inst rs2, imm(rs1)
     Branch,  // inst rs1, rs2, imm
     U,       // inst rd, imm
     J,       // inst rd, imm
     Csr,     // inst rd, csr, rs1
     CsrImm,  // inst rd, csr, imm
     Fence    // inst pred, succ
    };


  /// Return true if the given extension is enabled by the given
  /// configuration. The base and masked-arithmetic sets are always
  /// enabled.
  bool isExtensionEnabled(Extension ext, const CoreParams& params);


  /// Name and encoding pattern of an instruction.
  class InstEntry
  {
  public:

    friend class InstTable;

    // Constructor.
    InstEntry(std::string name = "", InstId id = InstId::illegal,
	      uint32_t code = 0, uint32_t mask = ~0,
	      Extension ext = Extension::I,
	      InstType type = InstType::Int,
	      InstFormat format = InstFormat::None,
	      AluOp aluOp = AluOp::Add);

    /// Return the name of the instruction.
    const std::string& name() const { return name_; }

    /// Return the id of the instruction (an integer between 0 and n
    /// where n is the number of defined instructions).
    InstId instId() const
    { return id_; }

    /// Return the instruction bits with all the operand specifiers set
    /// to zero.
    uint32_t code() const
    { return code_; }

    /// Return the mask corresponding to the code bits: Returned value
    /// has a 1 for each non-operand-specifier bit.
    uint32_t codeMask() const
    { return codeMask_; }

    /// Return true if the given instruction word has this entry's code.
    bool matches(uint32_t inst) const
    { return (inst & codeMask_) == code_; }

    /// Return true if an instruction word may match both this entry
    /// and the given one.
    bool overlaps(const InstEntry& other) const
    { return ((code_ ^ other.code_) & codeMask_ & other.codeMask_) == 0; }

    Extension extension() const
    { return ext_; }

    /// Return the instruction type.
    InstType type() const
    { return type_; }

    InstFormat format() const
    { return format_; }

    /// Return the ALU operation used in the first phase of this
    /// instruction. Meaningful for Int and Branch types.
    AluOp aluOp() const
    { return aluOp_; }

    /// Return true if this is a load instruction (lb, lh, ...)
    bool isLoad() const
    { return type_ == InstType::Load; }

    /// Return true if this is a store instruction (sb, sh, ...)
    bool isStore() const
    { return type_ == InstType::Store; }

    /// Return true if this is a conditional branch.
    bool isBranch() const
    { return type_ == InstType::Branch; }

    /// Return true if this is a CSR instruction.
    bool isCsr() const
    { return type_ == InstType::Csr; }

  private:

    std::string name_;
    InstId id_;
    uint32_t code_;      // Code with all operand bits set to zero.
    uint32_t codeMask_;  // Bit corresponding to code bits are 1.
    Extension ext_;
    InstType type_;
    InstFormat format_;
    AluOp aluOp_;
  };


  // Instruction table: Map an instruction id, an instruction name or an
  // instruction word to the entry corresponding to that instruction.
  class InstTable
  {
  public:
    InstTable();

    // Return the entry corresponding to the given id or the entry of the
    // illegal instruction if no such id.
    const InstEntry& getEntry(InstId) const;

    // Return the entry corresponding to the given name or the entry of
    // the illegal instruction if no such instruction.
    const InstEntry& getEntry(const std::string& name) const;

    // Return the first entry whose code matches the given instruction
    // word or the entry of the illegal instruction if there is no match.
    // The extension of the entry is not checked.
    const InstEntry& match(uint32_t inst) const;

    // Return true if given name is present in the table.
    bool hasEntry(const std::string& name) const;

    // Return all the entries (the illegal entry is the first).
    const std::vector<InstEntry>& entries() const
    { return instVec_; }

  private:

    // Helper to the constructor.
    void setupInstVec();

    std::vector<InstEntry> instVec_;
    std::unordered_map<std::string, InstId> instMap_;
  };
}
