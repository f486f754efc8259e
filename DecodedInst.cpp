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

#include "DecodedInst.hpp"

using namespace Kestrel;


DecodedInst::DecodedInst(uint32_t addr, uint32_t inst, const InstEntry* entry,
			 bool compressed)
  : addr_(addr), inst_(inst), compressed_(compressed), entry_(entry),
    fields_(inst), imm_(Kestrel::immediates(inst))
{
  raddrA_ = fields_.rs1;
  raddrB_ = fields_.rs2;
}


uint32_t
DecodedInst::selectImmediate(ImmBSel sel) const
{
  switch (sel)
    {
    case ImmBSel::I:      return imm_.i;
    case ImmBSel::S:      return imm_.s;
    case ImmBSel::B:      return imm_.b;
    case ImmBSel::U:      return imm_.u;
    case ImmBSel::J:      return imm_.j;
    case ImmBSel::IncrPc: return instSize();
    }
  return 0;
}
