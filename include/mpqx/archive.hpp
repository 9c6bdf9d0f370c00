#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "block_index.hpp"
#include "compression.hpp"
#include "hash_index.hpp"
#include "mmap.hpp"
#include "types.hpp"

namespace mpqx {

// Name of the optional file that lists the archive contents
inline constexpr std::string_view kListFileName = "(listfile)";

// Destination of an archived file below outputDir, with '\' read as a path
// separator. Absolute names and names that climb out of outputDir fail.
// Errors: UnsafePath
std::optional<std::filesystem::path> extractionPath(const std::filesystem::path &outputDir,
                                                    std::string_view name,
                                                    Error *outError = nullptr);

// Read-only MPQ archive: owns the backing store, the decrypted indices
// and the codec registry
class Archive {
public:
  Archive();
  ~Archive();

  // Delete copy, enable move
  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept;
  Archive &operator=(Archive &&) noexcept;

  // Open archive from disk (memory-mapped)
  // Returns std::nullopt on failure, with the reason in outError if provided
  static std::optional<Archive> open(const std::filesystem::path &path,
                                     Error *outError = nullptr);
  static std::optional<Archive> open(const std::filesystem::path &path,
                                     const OpenOptions &options, Error *outError = nullptr);

  // Open archive held in memory; the archive takes ownership of bytes
  static std::optional<Archive> openMemory(std::vector<uint8_t> bytes, Error *outError = nullptr);
  static std::optional<Archive> openMemory(std::vector<uint8_t> bytes, const OpenOptions &options,
                                           Error *outError = nullptr);

  // Resolve a file name using the default locale from OpenOptions
  std::optional<FileHandle> openFile(std::string_view name, Error *outError = nullptr) const;

  // Resolve a file name for a specific locale, falling back to the neutral one
  std::optional<FileHandle> openFile(std::string_view name, uint16_t locale,
                                     Error *outError = nullptr) const;

  // Handle for a block table row. Encrypted files opened this way cannot be
  // read since their key derives from the name.
  std::optional<FileHandle> openFileByIndex(uint32_t blockIndex, Error *outError = nullptr) const;

  bool hasFile(std::string_view name) const;

  // Uncompressed size of the file
  uint64_t size(const FileHandle &handle) const;

  // Reads the whole file into buffer and returns the number of bytes written.
  // The buffer must hold at least size(handle) bytes.
  std::optional<size_t> read(const FileHandle &handle, std::span<uint8_t> buffer,
                             Error *outError = nullptr) const;

  std::optional<std::vector<uint8_t>> extractToMemory(const FileHandle &handle,
                                                      Error *outError = nullptr) const;

  // Extract file to disk, creating parent directories as needed
  bool extract(const FileHandle &handle, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;

  // Names stored in (listfile), in file order
  std::optional<std::vector<std::string>> listFile(Error *outError = nullptr) const;

  const Header &header() const { return header_; }
  const HashIndex &hashIndex() const { return hashIndex_; }
  const BlockIndex &blockIndex() const { return blockIndex_; }
  const OpenOptions &options() const { return options_; }

  // Registered decompressors; extra codecs may be added after open
  CodecRegistry &codecs() { return codecs_; }
  const CodecRegistry &codecs() const { return codecs_; }

  bool isOpen() const { return open_; }

  void close();

private:
  bool load(Error *outError);

  // Whole backing store (mapped file or owned buffer)
  std::span<const uint8_t> bytes() const;

  // Bytes from the archive header to the end of the backing store
  std::span<const uint8_t> archiveBytes() const;

  std::optional<FileHandle> resolve(uint32_t blockIndex, uint32_t hashIndex, uint16_t locale,
                                    std::optional<std::string> name, Error *outError) const;

  MappedFile mappedFile_;
  std::vector<uint8_t> buffer_;
  bool mapped_ = false;
  bool open_ = false;

  OpenOptions options_;
  Header header_;
  HashIndex hashIndex_;
  BlockIndex blockIndex_;
  CodecRegistry codecs_;
};

} // namespace mpqx
