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

#include <iosfwd>
#include <string>
#include "CtrlSignals.hpp"
#include "InstEntry.hpp"
#include "instforms.hpp"


namespace Kestrel
{

  class DecodeStage;


  /// Model a decoded instruction: instruction address and code, the
  /// register and immediate fields, and the control signals produced by
  /// the decode stage for one phase. An object is produced for each
  /// cycle of the instruction: The signals of a jump in its first phase
  /// differ from those of its second phase.
  ///
  /// The signals held here are final: The RV32E register-range check and
  /// the suppression of the committing signals of an illegal
  /// instruction have been applied.
  class DecodedInst
  {
  public:

    /// Default contructor: Define an invalid object.
    DecodedInst()
      : addr_(0), inst_(0), compressed_(false), entry_(nullptr),
	fields_(0)
    { }

    /// Constructor. Extract the register fields and compute all the
    /// immediates of the given instruction.
    DecodedInst(uint32_t addr, uint32_t inst, const InstEntry* entry,
		bool compressed);

    /// Return address of instruction.
    uint32_t address() const
    { return addr_; }

    /// Return instruction code.
    uint32_t inst() const
    { return inst_; }

    /// Return instruction size in bytes: 2 if the instruction was
    /// expanded from a compressed one and 4 otherwise.
    uint32_t instSize() const
    { return compressed_? 2 : 4; }

    bool isCompressed() const
    { return compressed_; }

    /// Return true if this object is valid.
    bool isValid() const
    { return entry_ != nullptr; }

    /// Return associated instruction table information. This is the
    /// entry of the illegal instruction if the instruction is illegal.
    const InstEntry* instEntry() const
    { return entry_; }

    const RegFields& fields() const
    { return fields_; }

    const ImmediateSet& immediates() const
    { return imm_; }

    /// Return the value of the immediate selected by the given selector.
    /// IncrPc yields the size of the instruction.
    uint32_t selectImmediate(ImmBSel sel) const;

    /// Return the signals of the instruction decoder.
    const DecoderSignals& signals() const
    { return sig_; }

    /// Return the signals of the ALU-control decoder.
    const AluControl& aluControl() const
    { return alu_; }

    /// Return true if the instruction is illegal.
    bool isIllegal() const
    { return sig_.illegal; }

    /// Return true if the instruction was found illegal by the RV32E
    /// register-range check alone.
    bool isRv32eIllegal() const
    { return rv32eIllegal_; }

    /// Register-file read address of port A. This is rs3 on the
    /// second phase of a ternary operation and rs1 otherwise.
    unsigned rfRaddrA() const
    { return raddrA_; }

    /// Register-file read address of port B. This is rs1 on the second
    /// phase of a ternary operation and rs2 otherwise.
    unsigned rfRaddrB() const
    { return raddrB_; }

    /// Register-file write address.
    unsigned rfWaddr() const
    { return fields_.rd; }

    /// Dynamic enable of the multiplier.
    bool multEn() const
    { return multEn_; }

    /// Dynamic enable of the divider.
    bool divEn() const
    { return divEn_; }

    /// Dynamic enable of the masked-arithmetic unit.
    bool ipmEn() const
    { return ipmEn_; }

  protected:

    friend class DecodeStage;

    void setSignals(const DecoderSignals& sig)
    { sig_ = sig; }

    void setAluControl(const AluControl& alu)
    { alu_ = alu; }

    void setReadAddresses(unsigned a, unsigned b)
    { raddrA_ = a; raddrB_ = b; }

    void setRv32eIllegal(bool flag)
    { rv32eIllegal_ = flag; }

    void setEnables(bool mult, bool div, bool ipm)
    { multEn_ = mult; divEn_ = div; ipmEn_ = ipm; }

    void setEntry(const InstEntry* e)
    { entry_ = e; }

  private:

    uint32_t addr_;
    uint32_t inst_;
    bool compressed_;
    const InstEntry* entry_;
    RegFields fields_;
    ImmediateSet imm_;

    DecoderSignals sig_;
    AluControl alu_;

    unsigned raddrA_ = 0;
    unsigned raddrB_ = 0;
    bool rv32eIllegal_ = false;
    bool multEn_ = false;
    bool divEn_ = false;
    bool ipmEn_ = false;
  };


  /// Return the name of the given integer register: x0 to x31 or, if
  /// abiNames is true, zero, ra, sp, ...
  std::string intRegName(unsigned ix, bool abiNames = false);

  /// Print on the given stream the disassembly of the given instruction
  /// (e.g. "addi     x1, x0, 0x5").
  void disassembleInst(const DecodedInst& di, std::ostream& out,
		       bool abiNames = false);

  /// Return the disassembly of the given instruction.
  std::string disassembleInst(const DecodedInst& di, bool abiNames = false);

}
