#include <cstdlib>
#include <iostream>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "cli.hpp"

namespace pakx::cli {

static bool hasArg(int i, int argc) { return i + 1 < argc; }

static std::optional<int> parseLevel(std::string_view text) {
  if (text.size() != 1 || text[0] < '0' || text[0] > '9') {
    return std::nullopt;
  }
  return text[0] - '0';
}

void printUsage() {
  std::cerr <<
      R"(pakx - single-file archive tool

Usage:
  pakx [-v] list    <archive>
  pakx [-v] info    <archive>
  pakx [-v] extract <archive> <outdir> [names...]
  pakx [-v] add     [-c LEVEL] [-o] [-r] <archive> <files...>
  pakx [-v] remove  <archive> <names...>
  pakx [-v] rename  [-o] <archive> <from> <to>
  pakx [-v] repack  <archive>
  pakx [-v] compress <archive> <level>

Options:
  -v, --verbose        debug logging (PAKX_LOG=<level> overrides)
  -c, --compress LEVEL store added files deflated at zlib level 0-9
  -o, --overwrite      replace entries that already exist (add, rename)
  -r, --repack         repack the archive after adding
)";
}

ParseResult parseCli(int argc, char **argv) {
  ParseResult r{};

  // Global flags come before the subcommand
  int i = 1;
  for (; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "-v" || a == "--verbose") {
      r.verbose = true;
    } else {
      break;
    }
  }

  if (i >= argc) {
    r.error = "command required";
    return r;
  }

  std::string cmd = argv[i++];
  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    r.cmd = CmdHelp{};
    return r;
  }

  // Positional arguments of the subcommand; options are picked out where allowed
  std::vector<std::string> args;
  CmdAdd add{};
  bool overwrite = false;
  for (; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "-v" || a == "--verbose") {
      r.verbose = true;
    } else if ((cmd == "add" || cmd == "rename") && (a == "-o" || a == "--overwrite")) {
      overwrite = true;
    } else if (cmd == "add" && (a == "-r" || a == "--repack")) {
      add.repack = true;
    } else if (cmd == "add" && (a == "-c" || a == "--compress")) {
      if (!hasArg(i, argc)) {
        r.error = "add: -c requires a level";
        return r;
      }
      add.level = parseLevel(argv[++i]);
      if (!add.level) {
        r.error = std::string("add: invalid compression level: ") + argv[i];
        return r;
      }
    } else if (a.size() > 1 && a[0] == '-' && a != "--") {
      r.error = cmd + ": unknown option: " + std::string(a);
      return r;
    } else if (a != "--") {
      args.emplace_back(a);
    }
  }

  auto need = [&](size_t count, const char *usage) {
    if (args.size() < count) {
      r.error = cmd + ": " + usage;
      return false;
    }
    return true;
  };
  auto exact = [&](size_t count, const char *usage) {
    if (args.size() != count) {
      r.error = cmd + ": " + usage;
      return false;
    }
    return true;
  };

  if (cmd == "list") {
    if (exact(1, "<archive> required")) {
      r.cmd = CmdList{args[0]};
    }
    return r;
  }
  if (cmd == "info") {
    if (exact(1, "<archive> required")) {
      r.cmd = CmdInfo{args[0]};
    }
    return r;
  }
  if (cmd == "extract") {
    if (need(2, "<archive> <outdir> required")) {
      r.cmd = CmdExtract{args[0], args[1],
                         std::vector<std::string>(args.begin() + 2, args.end())};
    }
    return r;
  }
  if (cmd == "add") {
    if (need(2, "<archive> <files...> required")) {
      add.archive = args[0];
      add.inputs.assign(args.begin() + 1, args.end());
      add.overwrite = overwrite;
      r.cmd = add;
    }
    return r;
  }
  if (cmd == "remove") {
    if (need(2, "<archive> <names...> required")) {
      r.cmd = CmdRemove{args[0], std::vector<std::string>(args.begin() + 1, args.end())};
    }
    return r;
  }
  if (cmd == "rename") {
    if (exact(3, "<archive> <from> <to> required")) {
      r.cmd = CmdRename{args[0], args[1], args[2], overwrite};
    }
    return r;
  }
  if (cmd == "repack") {
    if (exact(1, "<archive> required")) {
      r.cmd = CmdRepack{args[0]};
    }
    return r;
  }
  if (cmd == "compress") {
    if (!exact(2, "<archive> <level> required")) {
      return r;
    }
    auto level = parseLevel(args[1]);
    if (!level) {
      r.error = "compress: invalid compression level: " + args[1];
      return r;
    }
    r.cmd = CmdCompress{args[0], *level};
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

void configureLogging(bool verbose) {
  auto logger = spdlog::get("pakx");
  if (!logger) {
    logger = spdlog::stderr_color_mt("pakx");
  }
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

  if (const char *env = std::getenv("PAKX_LOG"); env && *env) {
    std::string name(env);
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
      spdlog::warn("Ignoring unknown PAKX_LOG level: {}", name);
    } else {
      spdlog::set_level(level);
    }
  }
}

} // namespace pakx::cli
