#include <filesystem>
#include <iostream>

#include <pakx/pakx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <archive.pakx> <output_dir>\n";
    return 1;
  }

  pakx::Error error;
  auto reader = pakx::Reader::open(argv[1], &error);

  if (!reader) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  std::filesystem::path outputDir = argv[2];
  std::filesystem::create_directories(outputDir);

  int extractedCount = 0;
  for (const auto &name : reader->list()) {
    if (!pakx::isContainedPath(name)) {
      std::cerr << "Skipping " << name << ": would be written outside " << outputDir << "\n";
      continue;
    }
    std::filesystem::path outputPath = outputDir / name;

    if (!reader->extract(name, outputPath, &error)) {
      std::cerr << "Failed to extract " << name << ": " << error.describe() << "\n";
      continue;
    }
    ++extractedCount;
  }

  std::cout << "Extracted " << extractedCount << " entries to " << outputDir << "\n";
  return 0;
}
