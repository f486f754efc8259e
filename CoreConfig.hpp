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

#include <string>
#include <nlohmann/json_fwd.hpp>
#include "CoreParams.hpp"


namespace Kestrel
{

  /// Manage loading of configuration file and applying it to the static
  /// parameters of a core.
  class CoreConfig
  {
  public:

    /// Constructor.
    CoreConfig();

    /// Destructor.
    ~CoreConfig();

    /// Load given configuration file (JSON file) into this object.
    /// Return true on success and false if file cannot be opened or if the file
    /// does not contain a valid JSON object.
    bool loadConfigFile(const std::string& filePath);

    /// Load the configuration from the given JSON text. Return true on
    /// success and false if the text is not a valid JSON object.
    bool loadConfigString(const std::string& text);

    /// Apply the configurations in this object (as loaded by
    /// loadConfigFile) to the given parameters. The "isa" string is
    /// applied first so that the individual extension flags override
    /// it. Return true on success and false if a value is invalid. The
    /// parameters are modified even on failure: Valid entries are
    /// applied. Unrecognized entries are reported if verbose is true.
    bool applyConfig(CoreParams& params, bool verbose) const;

    /// Apply the given ISA string (e.g. "rv32imb", "rv32e", "imc") to
    /// the given parameters: Letter e enables RV32E, m enables the
    /// multiply/divide extension and b the bit-manipulation extension.
    /// The extensions m and b are disabled if their letter is absent.
    /// Return true on success and false if the string contains an
    /// unsupported extension letter.
    static bool applyIsaString(const std::string& isa, CoreParams& params);

    /// Clear (make empty) the set of configurations held in this object.
    void clear();

  private:

    CoreConfig(const CoreConfig&) = delete;
    void operator= (const CoreConfig&) = delete;

    nlohmann::json* config_;
  };

}
