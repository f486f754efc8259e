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

#include "DecodeStage.hpp"

using namespace Kestrel;


DecodeStage::DecodeStage(const CoreParams& params)
  : params_(params), decoder_(params), aluDecoder_(params)
{
}


bool
DecodeStage::rv32eViolation(unsigned raddrA, unsigned raddrB, unsigned waddr,
			    const AluControl& ctl, bool rfWe)
{
  return ((raddrA >= 16 and ctl.opASel == OpASel::RegA) or
	  (raddrB >= 16 and ctl.opBSel == OpBSel::RegB) or
	  (waddr >= 16 and rfWe));
}


DecodedInst
DecodeStage::decode(uint32_t addr, const DecodeInput& input) const
{
  DecoderSignals sig = decoder_.decode(input);
  AluControl ctl = aluDecoder_.decode(input.inst, input.phase,
				      input.branchTaken);

  DecodedInst di(addr, input.inst, nullptr, input.compressed);

  // Second phase of a ternary operation: Port A reads rs3 and port B
  // reads rs1.
  const RegFields& rf = di.fields();
  unsigned raddrA = ctl.useRs3 ? rf.rs3 : rf.rs1;
  unsigned raddrB = ctl.useRs3 ? rf.rs1 : rf.rs2;

  bool rv32eIllegal = false;
  if (params_.rv32e)
    rv32eIllegal = rv32eViolation(raddrA, raddrB, rf.rd, ctl, sig.rfWe);

  if (rv32eIllegal)
    {
      sig.illegal = true;
      suppressCommitting(sig);
    }

  bool legal = not sig.illegal;

  di.setSignals(sig);
  di.setAluControl(ctl);
  di.setReadAddresses(raddrA, raddrB);
  di.setRv32eIllegal(rv32eIllegal);
  di.setEnables(ctl.multSel and legal, ctl.divSel and legal,
		ctl.ipmSel and legal);

  if (legal)
    di.setEntry(&instTable_.match(input.inst));
  else
    di.setEntry(&instTable_.getEntry(InstId::illegal));

  return di;
}


DecodedInst
DecodeStage::decode(uint32_t addr, uint32_t inst) const
{
  DecodeInput input;
  input.inst = inst;
  return decode(addr, input);
}


bool
PhaseFsm::step(const DecodedInst& di, bool branchTaken, bool exValid)
{
  const auto& sig = di.signals();
  const auto& ctl = di.aluControl();

  bool unitBusy = ((di.multEn() or di.divEn() or di.ipmEn() or ctl.multicycle)
		   and not exValid);

  if (phase_ == Phase::First)
    {
      if (di.isIllegal())
	return true;

      // Without a branch-target adder, a jump or a taken branch needs a
      // second cycle to compute the return address or the target.
      bool redirect = (not btAlu_ and
		       (sig.jumpInDec or (sig.branchInDec and branchTaken)));
      if (redirect or unitBusy)
	{
	  phase_ = Phase::Second;
	  return false;
	}
      return true;
    }

  if (unitBusy)
    return false;

  phase_ = Phase::First;
  return true;
}
