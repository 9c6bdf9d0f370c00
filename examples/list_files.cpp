#include <iostream>

#include <mpqx/mpqx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.mpq>\n";
    return 1;
  }

  mpqx::Error error;
  auto archive = mpqx::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  auto names = archive->listFile(&error);
  if (!names) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Files: " << names->size() << "\n\n";

  for (const auto &name : *names) {
    auto handle = archive->openFile(name, &error);
    if (!handle) {
      std::cout << "  " << name << " (" << mpqx::toString(error.code) << ")\n";
      continue;
    }
    std::cout << "  " << name << " (" << archive->size(*handle) << " bytes)\n";
  }

  return 0;
}
