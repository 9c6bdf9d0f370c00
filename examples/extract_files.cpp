#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <mpqx/mpqx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <archive.mpq> <output_dir> [file...]\n";
    return 1;
  }

  mpqx::Error error;
  auto archive = mpqx::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  std::vector<std::string> names;
  for (int i = 3; i < argc; ++i) {
    names.emplace_back(argv[i]);
  }

  if (names.empty()) {
    auto listed = archive->listFile(&error);
    if (!listed) {
      std::cerr << "Error: no files given and " << error.message << "\n";
      return 1;
    }
    names = std::move(*listed);
  }

  std::filesystem::path outputDir = argv[2];
  std::filesystem::create_directories(outputDir);

  int extractedCount = 0;
  for (const auto &name : names) {
    auto handle = archive->openFile(name, &error);
    if (!handle) {
      std::cerr << "Failed to open " << name << ": " << error.message << "\n";
      continue;
    }

    auto outputPath = mpqx::extractionPath(outputDir, name, &error);
    if (!outputPath) {
      std::cerr << "Failed to extract " << name << ": " << error.message << "\n";
      continue;
    }

    if (!archive->extract(*handle, *outputPath, &error)) {
      std::cerr << "Failed to extract " << name << ": " << error.message << "\n";
      continue;
    }
    ++extractedCount;
  }

  std::cout << "Extracted " << extractedCount << " files to " << outputDir << "\n";
  return 0;
}
