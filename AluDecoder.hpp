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
#include "CtrlSignals.hpp"


namespace Kestrel
{

  /// Secondary decoder: ALU operation and operand selection, branch-target
  /// adder operands, multi-cycle and third-source sequencing, and the
  /// static selectors of the multiply/divide and masked-arithmetic
  /// units. Runs on the same instruction bits as Decoder, independently
  /// of it. It does not decide legality.
  class AluDecoder
  {
  public:

    explicit AluDecoder(const CoreParams& params)
      : params_(params)
    { }

    /// Decode the ALU controls of the given instruction for the given
    /// phase. The branchTaken input only matters for the second phase of
    /// a branch (and for the branch-target adder).
    AluControl decode(uint32_t inst, Phase phase, bool branchTaken) const;

    const CoreParams& params() const
    { return params_; }

  private:

    void decodeJump(uint32_t inst, bool first, AluControl& ctl) const;

    void decodeBranch(uint32_t inst, bool first, bool taken,
                      AluControl& ctl) const;

    void decodeOpImm(uint32_t inst, bool first, AluControl& ctl) const;

    void decodeOp(uint32_t inst, bool first, AluControl& ctl) const;

    CoreParams params_;
  };

}
