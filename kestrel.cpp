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

#include <cstdlib>
#include <iostream>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "CoreConfig.hpp"
#include "DecodeStage.hpp"


using namespace Kestrel;


/// Convert the command line string numberStr to a number using
/// strotull and a base of zero (prefixes 0 and 0x are
/// honored). Return true on success and false on failure (string does
/// not represent a number). TYPE is an integer type (e.g
/// uint32_t). Option is the command line option associated with the
/// string and is used for diagnostic messages.
template <typename TYPE>
static
bool
parseCmdLineNumber(const std::string& option,
		   const std::string& numberStr,
		   TYPE& number)
{
  bool good = not numberStr.empty();

  if (good)
    {
      char* end = nullptr;
      uint64_t val = strtoull(numberStr.c_str(), &end, 0);
      number = static_cast<TYPE>(val);
      if (val != number)
	{
	  std::cerr << "parseCmdLineNumber: Number too large: " << numberStr
		    << '\n';
	  return false;
	}
      if (end and *end)
	good = false;  // Part of the string are non parseable.
    }

  if (not good)
    std::cerr << "Invalid command line " << option << " value: " << numberStr
	      << '\n';
  return good;
}


typedef std::vector<std::string> StringVec;


/// Hold values provided on the command line.
struct Args
{
  StringVec   hexFiles;        // Files of instruction words.
  StringVec   words;           // Instruction words on the command line.
  std::string configFile;      // Configuration (JSON) file.
  std::string isa;
  std::string phase = "first"; // first, second or both

  std::optional<uint32_t> pc;

  bool help = false;
  bool verbose = false;
  bool version = false;
  bool btAlu = false;      // Dedicated branch-target adder.
  bool taken = false;      // Branch-taken feedback.
  bool compressed = false; // Words were expanded from compressed insts.
  bool illegalc = false;   // Fetch flagged the words as illegal.
  bool table = false;      // Dump instruction table.
  bool abiNames = false;   // Use ABI register names in inst disassembly.
};


static
void
printVersion()
{
  unsigned version = 1;
  unsigned subversion = 0;
  std::cout << "Version " << version << "." << subversion << " compiled on "
	    << __DATE__ << " at " << __TIME__ << '\n';
}


static
bool
collectCommandLineValues(const boost::program_options::variables_map& varMap,
			 Args& args)
{
  bool ok = true;

  if (varMap.count("pc"))
    {
      auto numStr = varMap["pc"].as<std::string>();
      uint32_t pc = 0;
      if (not parseCmdLineNumber("pc", numStr, pc))
	ok = false;
      else
	args.pc = pc;
    }

  if (args.phase != "first" and args.phase != "second" and
      args.phase != "both")
    {
      std::cerr << "Invalid command line phase value: " << args.phase
		<< " -- expecting first, second or both\n";
      ok = false;
    }

  return ok;
}


/// Parse command line arguments. Place option values in args.
/// Return true on success and false on failure.
static
bool
parseCmdLineArgs(int argc, char* argv[], Args& args)
{
  try
    {
      // Define command line options.
      namespace po = boost::program_options;
      po::options_description desc("options");
      desc.add_options()
	("help,h", po::bool_switch(&args.help),
	 "Produce this message.")
	("isa", po::value(&args.isa),
	 "Specify instruction set extensions to enable. Supported extensions "
	 "are i, e, m and b (Example --isa rv32imb). Default is im.")
	("configfile", po::value(&args.configFile),
	 "Configuration file (JSON file defining core features).")
	("btalu", po::bool_switch(&args.btAlu),
	 "Core has a dedicated branch-target adder.")
	("phase", po::value(&args.phase),
	 "Pipeline phase of the decode: first, second or both. With both, "
	 "the phases the controller walks through are shown, assuming "
	 "multi-cycle units finish on the second cycle.")
	("taken", po::bool_switch(&args.taken),
	 "Branch-taken feedback for the second phase of a branch.")
	("compressed", po::bool_switch(&args.compressed),
	 "Instruction words were expanded from compressed instructions.")
	("illegalc", po::bool_switch(&args.illegalc),
	 "Fetch stage flagged the instruction words as illegal compressed "
	 "instructions.")
	("hex,x", po::value(&args.hexFiles)->multitoken(),
	 "File of instruction words: One hexadecimal word per line, "
	 "# starts a comment.")
	("table", po::bool_switch(&args.table),
	 "Print the instruction table.")
	("abinames", po::bool_switch(&args.abiNames),
	 "Use ABI register names (e.g. sp instead of x2) in instruction "
	 "disassembly.")
	("pc", po::value<std::string>(),
	 "Address of the first instruction word.")
	("word", po::value(&args.words)->multitoken(),
	 "Instruction word (0x prefix for hexadecimal).")
	("verbose,v", po::bool_switch(&args.verbose),
	 "Be verbose.")
	("version", po::bool_switch(&args.version),
	 "Print version.");

      // Define positional options.
      po::positional_options_description pdesc;
      pdesc.add("word", -1);

      // Parse command line options.
      po::variables_map varMap;
      po::command_line_parser parser(argc, argv);
      auto parsed = parser.options(desc).positional(pdesc).run();
      po::store(parsed, varMap);
      po::notify(varMap);

      if (args.version)
        printVersion();

      if (args.help)
	{
	  std::cout <<
	    "Decode the given RISCV instruction words and print the control\n"
	    "signals of the decode stage. Words may be given on the command\n"
	    "line or in files (--hex).\n"
	    "Examples:\n"
	    "  kestrel 0x00500093\n"
	    "  kestrel --isa rv32imb --phase both 0x0000006f\n"
	    "  kestrel --configfile core.json --hex prog.hex\n\n";
	  std::cout << desc;
	  return true;
	}

      if (not collectCommandLineValues(varMap, args))
	return false;
    }

  catch (std::exception& exp)
    {
      std::cerr << "Failed to parse command line args: " << exp.what() << '\n';
      return false;
    }

  return true;
}


/// Read instruction words from the given file appending them to the
/// given vector. Return true on success and false on failure.
static
bool
readHexFile(const std::string& path, std::vector<uint32_t>& words)
{
  std::ifstream ifs(path);
  if (not ifs.good())
    {
      std::cerr << "Failed to open hex file '" << path << "' for input.\n";
      return false;
    }

  unsigned errors = 0;
  unsigned lineNum = 0;
  std::string line;

  while (std::getline(ifs, line))
    {
      lineNum++;

      // Remove comment.
      StringVec parts;
      boost::split(parts, line, boost::is_any_of("#"));
      std::string text = parts.empty() ? "" : parts.front();
      boost::trim(text);
      if (text.empty())
	continue;

      char* end = nullptr;
      uint64_t val = strtoull(text.c_str(), &end, 16);
      if ((end and *end) or val > 0xffffffff)
	{
	  std::cerr << "File " << path << ", Line " << lineNum << ": "
		    << "Invalid instruction word: " << text << '\n';
	  errors++;
	  continue;
	}
      words.push_back(uint32_t(val));
    }

  return errors == 0;
}


static
const char*
extensionName(Extension ext)
{
  switch (ext)
    {
    case Extension::I:    return "i";
    case Extension::M:    return "m";
    case Extension::B:    return "b";
    case Extension::Xipm: return "xipm";
    }
  return "?";
}


/// Print the instruction table.
static
void
printTable(const InstTable& table)
{
  boost::format fmt("%-12s 0x%08x 0x%08x %-5s %s\n");
  for (const auto& entry : table.entries())
    {
      if (entry.instId() == InstId::illegal)
	continue;
      std::cout << fmt % entry.name() % entry.code() % entry.codeMask()
	% extensionName(entry.extension()) % aluOpName(entry.aluOp());
    }
}


/// Print the control signals of the given decoded instruction.
static
void
printDecode(const DecodedInst& di, const char* phase, bool abiNames)
{
  const DecoderSignals& sig = di.signals();
  const AluControl& ctl = di.aluControl();

  std::cout << boost::format("0x%08x 0x%08x %s\n") % di.address() % di.inst()
    % disassembleInst(di, abiNames);

  std::cout << boost::format("  %-6s illegal=%d rv32e_illegal=%d trap=%s\n")
    % phase % sig.illegal % di.isRv32eIllegal() % trapName(sig.trap);

  std::cout << boost::format("         rf: we=%d wd_sel=%s ren_a=%d ren_b=%d "
			     "raddr_a=%s raddr_b=%s waddr=%s\n")
    % sig.rfWe % (sig.rfWdSel == RfWdSel::Csr ? "csr" : "ex")
    % sig.rfRenA % sig.rfRenB % intRegName(di.rfRaddrA(), abiNames)
    % intRegName(di.rfRaddrB(), abiNames) % intRegName(di.rfWaddr(), abiNames);

  std::cout << boost::format("         ctrl: jump=%d jump_set=%d branch=%d "
			     "icache_inval=%d\n")
    % sig.jumpInDec % sig.jumpSet % sig.branchInDec % sig.icacheInval;

  if (sig.dataReq)
    std::cout << boost::format("         data: we=%d type=%s sign_ext=%d\n")
      % sig.dataWe % memTypeName(sig.dataType) % sig.dataSignExt;

  if (sig.csrAccess)
    std::cout << boost::format("         csr: op=%s\n") % csrOpName(sig.csrOp);

  std::cout << boost::format("         alu: op=%s a=%s b=%s imm_b=%s "
			     "bt_a=%s bt_b=%s multicycle=%d use_rs3=%d\n")
    % aluOpName(ctl.op) % opASelName(ctl.opASel) % opBSelName(ctl.opBSel)
    % immBSelName(ctl.immBSel) % opASelName(ctl.btASel)
    % immBSelName(ctl.btBSel) % ctl.multicycle % ctl.useRs3;

  std::cout << boost::format("         units: mult=%d div=%d ipm=%d")
    % di.multEn() % di.divEn() % di.ipmEn();
  if (di.multEn() or di.divEn())
    std::cout << boost::format(" md_op=%s signed=%d") % mdOpName(sig.mdOp)
      % sig.mdSignedMode;
  if (di.ipmEn())
    std::cout << boost::format(" ipm_op=%s") % ipmOpName(sig.ipmOp);
  std::cout << '\n';
}


/// Decode the given word on the phases requested on the command line.
static
void
decodeWord(const DecodeStage& stage, const Args& args, uint32_t addr,
	   uint32_t word)
{
  DecodeInput input;
  input.inst = word;
  input.compressed = args.compressed;
  input.illegalCompressed = args.illegalc;
  input.branchTaken = args.taken;

  if (args.phase != "both")
    {
      input.phase = args.phase == "second" ? Phase::Second : Phase::First;
      DecodedInst di = stage.decode(addr, input);
      printDecode(di, args.phase.c_str(), args.abiNames);
      return;
    }

  // Walk through the phases of the instruction. Multi-cycle units are
  // assumed busy on the first cycle and done on the next.
  PhaseFsm fsm(stage.params().branchTargetAlu);
  for (unsigned cycle = 0; ; ++cycle)
    {
      input.phase = fsm.phase();
      DecodedInst di = stage.decode(addr, input);
      printDecode(di, input.phase == Phase::First ? "first" : "second",
		  args.abiNames);
      bool exValid = cycle > 0;
      if (fsm.step(di, args.taken, exValid))
	break;
    }
}


/// Determine the core parameters from the configuration file and the
/// command line. Command line options override the file. Return true
/// on success.
static
bool
determineParams(const Args& args, CoreParams& params)
{
  bool ok = true;

  if (not args.configFile.empty())
    {
      CoreConfig config;
      if (not config.loadConfigFile(args.configFile))
	return false;
      if (not config.applyConfig(params, args.verbose))
	ok = false;
    }

  if (not args.isa.empty())
    if (not CoreConfig::applyIsaString(args.isa, params))
      ok = false;

  if (args.btAlu)
    params.branchTargetAlu = true;

  if (args.verbose)
    std::cerr << "rv32e=" << params.rv32e << " rv32m=" << params.rv32m
	      << " rv32b=" << params.rv32b << " branch_target_alu="
	      << params.branchTargetAlu << '\n';

  return ok;
}


int
main(int argc, char* argv[])
{
  Args args;
  if (not parseCmdLineArgs(argc, argv, args))
    return 1;

  if (args.help)
    return 0;

  CoreParams params;
  if (not determineParams(args, params))
    return 1;

  bool ok = true;

  try
    {
      DecodeStage stage(params);

      if (args.table)
	printTable(stage.instTable());

      std::vector<uint32_t> words;
      for (const auto& wordStr : args.words)
	{
	  uint32_t word = 0;
	  if (parseCmdLineNumber("word", wordStr, word))
	    words.push_back(word);
	  else
	    ok = false;
	}

      for (const auto& path : args.hexFiles)
	if (not readHexFile(path, words))
	  ok = false;

      if (words.empty() and not args.table and not args.version)
	std::cerr << "No instruction words given (try --help)\n";

      uint32_t addr = args.pc ? *args.pc : 0;
      for (auto word : words)
	{
	  decodeWord(stage, args, addr, word);
	  addr += args.compressed ? 2 : 4;
	}
    }
  catch (std::exception& e)
    {
      std::cerr << e.what() << '\n';
      ok = false;
    }

  return ok? 0 : 1;
}
