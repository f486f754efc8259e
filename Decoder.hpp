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

  /// Primary instruction decoder: Legality, register-file enables,
  /// memory access shape, CSR operation, trap-like signals and jump/branch
  /// sequencing of a 32-bit instruction. A decode is a pure function of
  /// the inputs and of the configuration given at construction.
  ///
  /// Legality here does not include the RV32E register-range check: That
  /// check depends on the ALU operand selection and is applied by
  /// DecodeStage.
  class Decoder
  {
  public:

    /// Constructor. The configuration is copied and never changes.
    explicit Decoder(const CoreParams& params)
      : params_(params)
    { }

    /// Decode the given instruction word. If the result is illegal,
    /// all the committing signals (register write, memory request,
    /// jump, branch, csr access) are false and the trap kind is None.
    DecoderSignals decode(const DecodeInput& input) const;

    /// Return the configuration of this decoder.
    const CoreParams& params() const
    { return params_; }

  private:

    /// Return true if the given OP-IMM shift-family instruction
    /// (funct3 1 or 5) is legal.
    bool isLegalShiftImm(uint32_t inst) const;

    /// Decode an OP (register-register) instruction setting the
    /// multiply/divide fields of sig. Return true if legal.
    bool decodeOp(uint32_t inst, DecoderSignals& sig) const;

    /// Decode a SYSTEM instruction. Return true if legal.
    bool decodeSystem(uint32_t inst, DecoderSignals& sig) const;

    CoreParams params_;
  };


  /// CSRRS/CSRRC (and their immediate forms) with a zero rs1 field must
  /// not modify the CSR: Return Read for such a combination and the
  /// given op otherwise.
  CsrOp applyCsrZeroRule(CsrOp op, unsigned rs1Field);


  /// Clear every signal of sig that commits architectural state or
  /// redirects the fetch and clear the trap kind.
  void suppressCommitting(DecoderSignals& sig);

}
