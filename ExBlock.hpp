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
#include "CoreParams.hpp"
#include "DecodedInst.hpp"


namespace Kestrel
{

  /// Register-file data and program counter of the instruction in the
  /// execute stage.
  struct OperandValues
  {
    uint32_t pc = 0;
    uint32_t rfRdataA = 0;
    uint32_t rfRdataB = 0;
  };


  /// Outputs of the ALU. The arithmetic itself is outside this model.
  struct AluOutputs
  {
    uint32_t result = 0;
    uint32_t adderResult = 0;
    bool cmpResult = false;
    bool imdValWe = false;    // Intermediate value written: Not done yet.
  };


  /// Outputs of the multiply/divide unit or of the masked-arithmetic
  /// unit.
  struct UnitOutput
  {
    uint32_t result = 0;
    bool valid = false;
  };


  /// Operation and operands presented to the ALU.
  struct AluOperands
  {
    AluOp op = AluOp::Add;
    uint32_t a = 0;
    uint32_t b = 0;
  };


  struct ExResult
  {
    uint32_t result = 0;
    bool valid = false;
    uint32_t branchTarget = 0;
    bool branchDecision = false;
  };


  /// Execute stage: Operand multiplexing for the ALU and the
  /// branch-target adder, and selection of the result among the ALU,
  /// the multiply/divide unit and the masked-arithmetic unit.
  class ExBlock
  {
  public:

    explicit ExBlock(const CoreParams& params)
      : params_(params)
    { }

    /// Return the value of the given operand-A source.
    static uint32_t selectOperandA(OpASel sel, const DecodedInst& di,
				   const OperandValues& vals);

    /// Return operation and operand values the ALU receives for the
    /// given instruction.
    AluOperands aluOperands(const DecodedInst& di,
			    const OperandValues& vals) const;

    /// Return the branch/jump target: The sum of the branch-target
    /// adder operands if the core has that adder, otherwise the adder
    /// result of the ALU.
    uint32_t branchTarget(const DecodedInst& di, const OperandValues& vals,
			  const AluOutputs& alu) const;

    /// Select result and validity.
    ExResult execute(const DecodedInst& di, const OperandValues& vals,
		     const AluOutputs& alu, const UnitOutput& multdiv,
		     const UnitOutput& ipm) const;

  private:

    CoreParams params_;
  };

}
