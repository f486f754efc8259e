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

#include "ExBlock.hpp"

using namespace Kestrel;


uint32_t
ExBlock::selectOperandA(OpASel sel, const DecodedInst& di,
			const OperandValues& vals)
{
  switch (sel)
    {
    case OpASel::RegA:   return vals.rfRdataA;
    case OpASel::CurrPc: return vals.pc;
    case OpASel::ImmZ:   return di.immediates().z;
    case OpASel::Zero:   return 0;
    }
  return 0;
}


AluOperands
ExBlock::aluOperands(const DecodedInst& di, const OperandValues& vals) const
{
  const AluControl& ctl = di.aluControl();

  AluOperands ops;
  ops.op = ctl.op;
  ops.a = selectOperandA(ctl.opASel, di, vals);
  if (ctl.opBSel == OpBSel::RegB)
    ops.b = vals.rfRdataB;
  else
    ops.b = di.selectImmediate(ctl.immBSel);
  return ops;
}


uint32_t
ExBlock::branchTarget(const DecodedInst& di, const OperandValues& vals,
		      const AluOutputs& alu) const
{
  if (not params_.branchTargetAlu)
    return alu.adderResult;

  const AluControl& ctl = di.aluControl();
  uint32_t a = selectOperandA(ctl.btASel, di, vals);
  uint32_t b = di.selectImmediate(ctl.btBSel);
  return a + b;
}


ExResult
ExBlock::execute(const DecodedInst& di, const OperandValues& vals,
		 const AluOutputs& alu, const UnitOutput& multdiv,
		 const UnitOutput& ipm) const
{
  const AluControl& ctl = di.aluControl();

  ExResult res;

  if (ctl.ipmSel)
    {
      res.result = ipm.result;
      res.valid = ipm.valid;
    }
  else if (ctl.multSel or ctl.divSel)
    {
      res.result = multdiv.result;
      res.valid = multdiv.valid;
    }
  else
    {
      res.result = alu.result;
      res.valid = not alu.imdValWe;
    }

  res.branchTarget = branchTarget(di, vals, alu);
  res.branchDecision = alu.cmpResult;
  return res;
}
