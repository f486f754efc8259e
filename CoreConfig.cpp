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

#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include "CoreConfig.hpp"


using namespace Kestrel;


CoreConfig::CoreConfig()
{
  config_ = new nlohmann::json();
}


CoreConfig::~CoreConfig()
{
  delete config_;
  config_ = nullptr;
}


bool
CoreConfig::loadConfigFile(const std::string& filePath)
{
  std::ifstream ifs(filePath);
  if (not ifs.good())
    {
      std::cerr << "Failed to open config file '" << filePath
		<< "' for input.\n";
      return false;
    }

  try
    {
      ifs >> *config_;
    }
  catch (std::exception& e)
    {
      std::cerr << "Failed to parse config file '" << filePath << "': "
		<< e.what() << "\n";
      config_->clear();
      return false;
    }

  if (not config_->is_object())
    {
      std::cerr << "Config file '" << filePath
		<< "' does not contain a JSON object\n";
      config_->clear();
      return false;
    }

  return true;
}


bool
CoreConfig::loadConfigString(const std::string& text)
{
  std::istringstream iss(text);

  try
    {
      iss >> *config_;
    }
  catch (std::exception& e)
    {
      std::cerr << e.what() << "\n";
      config_->clear();
      return false;
    }

  if (not config_->is_object())
    {
      std::cerr << "Configuration is not a JSON object\n";
      config_->clear();
      return false;
    }

  return true;
}


namespace Kestrel
{

  /// Convert given json value to a boolean. Accept booleans, numbers
  /// and the strings "0", "1", "true", "false", "True" and "False".
  /// Return true on success and false if the value cannot be converted.
  static
  bool
  getJsonBoolean(const std::string& tag, const nlohmann::json& js,
		 bool& value)
  {
    if (js.is_boolean())
      {
	value = js.get<bool>();
	return true;
      }
    if (js.is_number())
      {
	value = js.get<double>() != 0;
	return true;
      }
    if (js.is_string())
      {
	std::string str = js.get<std::string>();
	if (str == "0" or str == "false" or str == "False")
	  {
	    value = false;
	    return true;
	  }
	if (str == "1" or str == "true" or str == "True")
	  {
	    value = true;
	    return true;
	  }
	std::cerr << "Invalid config file value for '" << tag << "': "
		  << str << '\n';
	return false;
      }
    std::cerr << "Config file entry '" << tag << "' must contain a bool\n";
    return false;
  }

}


bool
CoreConfig::applyIsaString(const std::string& isaStr, CoreParams& params)
{
  std::string str = isaStr;
  for (auto& c : str)
    c = char(std::tolower(static_cast<unsigned char>(c)));

  if (str.compare(0, 4, "rv32") == 0)
    str = str.substr(4);
  else if (str.compare(0, 2, "rv") == 0)
    {
      std::cerr << "Unsupported register width in ISA string \"" << isaStr
		<< "\" -- expecting rv32\n";
      return false;
    }

  bool rve = false, rvm = false, rvb = false;
  unsigned errors = 0;

  for (auto c : str)
    {
      switch (c)
	{
	case 'i':                break;
	case 'c':                break;  // Expanded before decode.
	case 'e': rve = true;    break;
	case 'm': rvm = true;    break;
	case 'b': rvb = true;    break;
	case 'x':                break;  // Masked arithmetic is always on.
	default:
	  std::cerr << "Extension \"" << c << "\" is not supported.\n";
	  errors++;
	  break;
	}
    }

  if (errors)
    return false;

  params.rv32e = rve;
  params.rv32m = rvm;
  params.rv32b = rvb;
  return true;
}


bool
CoreConfig::applyConfig(CoreParams& params, bool verbose) const
{
  unsigned errors = 0;

  if (config_->count("isa"))
    {
      const auto& isa = config_->at("isa");
      if (not isa.is_string())
	{
	  std::cerr << "Config file entry 'isa' must contain a string\n";
	  errors++;
	}
      else if (not applyIsaString(isa.get<std::string>(), params))
	errors++;
    }

  struct Flag
  {
    const char* tag;
    bool CoreParams::* field;
  };

  static const Flag flags[] = { { "rv32e", &CoreParams::rv32e },
				{ "rv32m", &CoreParams::rv32m },
				{ "rv32b", &CoreParams::rv32b },
				{ "branch_target_alu",
				  &CoreParams::branchTargetAlu } };

  for (const auto& flag : flags)
    {
      if (not config_->count(flag.tag))
	continue;
      bool value = false;
      if (getJsonBoolean(flag.tag, config_->at(flag.tag), value))
	params.*(flag.field) = value;
      else
	errors++;
    }

  if (verbose)
    for (auto it = config_->begin(); it != config_->end(); ++it)
      {
	const std::string& tag = it.key();
	bool known = tag == "isa";
	for (const auto& flag : flags)
	  known = known or tag == flag.tag;
	if (not known)
	  std::cerr << "Warning: Unknown config file entry '" << tag
		    << "' ignored\n";
      }

  return errors == 0;
}


void
CoreConfig::clear()
{
  config_->clear();
}
