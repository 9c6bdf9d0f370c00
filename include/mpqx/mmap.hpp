#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "types.hpp"

namespace mpqx {

// RAII read-only memory mapping of a whole file
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Maps path for reading. Empty files are rejected.
  // Errors: Io
  bool open(const std::filesystem::path &path, Error *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  void close();

  bool isOpen() const { return data_ != nullptr; }

  size_t size() const { return size_; }

private:
  void cleanup() noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;    // HANDLE
  void *mappingHandle_ = nullptr; // HANDLE
#else
  int fd_ = -1;
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
};

} // namespace mpqx
