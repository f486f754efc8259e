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


namespace Kestrel
{

  /// Static configuration of a core. Fixed when the decoders are
  /// constructed; the decoders keep their own copy and never change it.
  struct CoreParams
  {
    /// Reduced register count (RV32E): Only x0 to x15 exist.
    bool rv32e = false;

    /// Multiply/divide extension (RV32M).
    bool rv32m = true;

    /// Bit-manipulation extension (RV32B).
    bool rv32b = false;

    /// Dedicated branch-target adder: Jumps and branches resolve in a
    /// single cycle.
    bool branchTargetAlu = false;
  };

}
