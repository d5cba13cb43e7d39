#include <iostream>

#include <pakx/pakx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.pakx>\n";
    return 1;
  }

  pakx::Error error;
  auto reader = pakx::Reader::open(argv[1], &error);

  if (!reader) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Entries: " << reader->entryCount() << " (" << reader->capacity()
            << " slots)\n\n";

  for (const auto &slot : reader->entries()) {
    std::cout << "  " << slot.name << " (" << slot.entry.size << " bytes";
    if (slot.entry.compressed) {
      std::cout << ", " << slot.entry.storedSize << " stored";
    }
    std::cout << ")\n";
  }

  return 0;
}
