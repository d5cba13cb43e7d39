#include <iostream>

#include "cli.hpp"

int main(int argc, char **argv) {
  auto parsed = pakx::cli::parseCli(argc, argv);
  if (!parsed.cmd) {
    std::cerr << "pakx: " << parsed.error << "\n\n";
    pakx::cli::printUsage();
    return 2;
  }

  pakx::cli::configureLogging(parsed.verbose);
  return pakx::cli::runCommand(*parsed.cmd);
}
