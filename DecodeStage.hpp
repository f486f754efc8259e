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
#include "AluDecoder.hpp"
#include "CoreParams.hpp"
#include "DecodedInst.hpp"
#include "Decoder.hpp"
#include "InstEntry.hpp"


namespace Kestrel
{

  /// Decode stage of the core: Run the instruction decoder and the
  /// ALU-control decoder on the same instruction word and merge their
  /// outputs into a DecodedInst. This is where the register read
  /// addresses are derived, where the RV32E register-range check is
  /// applied (it needs the ALU operand selection) and where the dynamic
  /// unit enables are computed from the final legality.
  class DecodeStage
  {
  public:

    /// Constructor. The configuration is copied and never changes.
    explicit DecodeStage(const CoreParams& params);

    /// Decode the instruction word of the given input located at the
    /// given address.
    DecodedInst decode(uint32_t addr, const DecodeInput& input) const;

    /// Convenience: Decode the given word on its first phase.
    DecodedInst decode(uint32_t addr, uint32_t inst) const;

    const CoreParams& params() const
    { return params_; }

    const InstTable& instTable() const
    { return instTable_; }

    /// Return true if the given register addresses violate the RV32E
    /// register range: An address of 16 or more on a port whose value
    /// is consumed by the ALU, or a destination of 16 or more while the
    /// register file is written.
    static bool rv32eViolation(unsigned raddrA, unsigned raddrB,
			       unsigned waddr, const AluControl& ctl,
			       bool rfWe);

  private:

    CoreParams params_;
    Decoder decoder_;
    AluDecoder aluDecoder_;
    InstTable instTable_;
  };


  /// Phase sequencing of the pipeline controller: Decide, after each
  /// cycle, whether the instruction in the decode stage is done or
  /// whether it needs another cycle (second phase). The decoders are
  /// pure; this is the only sequencing state.
  class PhaseFsm
  {
  public:

    explicit PhaseFsm(bool branchTargetAlu)
      : btAlu_(branchTargetAlu)
    { }

    /// Return the phase of the current cycle.
    Phase phase() const
    { return phase_; }

    /// Advance by one cycle given the decode of this cycle, the branch
    /// outcome and the validity of the execute stage. Return true if
    /// the instruction is done: The phase is back to First and the next
    /// instruction may enter the decode stage.
    bool step(const DecodedInst& di, bool branchTaken, bool exValid);

    /// Return to the first phase.
    void reset()
    { phase_ = Phase::First; }

  private:

    bool btAlu_;
    Phase phase_ = Phase::First;
  };

}
