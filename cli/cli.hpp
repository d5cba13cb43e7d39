#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pakx::cli {

struct CmdList {
  std::string archive;
};

struct CmdInfo {
  std::string archive;
};

struct CmdExtract {
  std::string archive;
  std::string outDir;
  std::vector<std::string> names; // Empty means every entry
};

struct CmdAdd {
  std::string archive;
  std::vector<std::string> inputs; // Files or directories
  std::optional<int> level;        // Compress with this zlib level when set
  bool overwrite = false;
  bool repack = false;
};

struct CmdRemove {
  std::string archive;
  std::vector<std::string> names;
};

struct CmdRename {
  std::string archive;
  std::string from;
  std::string to;
  bool overwrite = false; // Replace an existing `to`
};

struct CmdRepack {
  std::string archive;
};

struct CmdCompress {
  std::string archive;
  int level = 6;
};

struct CmdHelp {};

using Command = std::variant<CmdList, CmdInfo, CmdExtract, CmdAdd, CmdRemove, CmdRename,
                             CmdRepack, CmdCompress, CmdHelp>;

struct ParseResult {
  std::optional<Command> cmd;
  bool verbose = false;
  std::string error;
};

ParseResult parseCli(int argc, char **argv);

void printUsage();

// Installs the stderr logger. `-v` selects debug; PAKX_LOG=<level> overrides both.
void configureLogging(bool verbose);

// Executes a parsed command; returns the process exit code
int runCommand(const Command &cmd);

} // namespace pakx::cli
