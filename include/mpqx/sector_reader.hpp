#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "compression.hpp"
#include "types.hpp"

namespace mpqx {

// Turns a block entry into file bytes: sector boundaries, decryption,
// decompression, and extraction of a byte range
class SectorReader {
public:
  // archive starts at the archive header; block offsets are relative to it
  SectorReader(std::span<const uint8_t> archive, uint32_t sectorSize,
               const CodecRegistry &codecs);

  // Fills out with the file bytes [offset, offset + out.size()).
  // key is required for encrypted entries.
  // Errors: UnsupportedFileType, DecryptionKeyUnavailable, InvalidRange,
  //         TruncatedArchive, CorruptSectorTable, UnsupportedCompressionMethod,
  //         DecompressionFailed, SectorSizeMismatch
  bool read(const BlockEntry &entry, std::optional<uint32_t> key, uint64_t offset,
            std::span<uint8_t> out, Error *outError = nullptr) const;

  uint32_t sectorSize() const { return sectorSize_; }

private:
  std::optional<std::span<const uint8_t>> storedData(const BlockEntry &entry, uint64_t length,
                                                     Error *outError) const;

  bool readSingleUnit(const BlockEntry &entry, std::optional<uint32_t> key, uint64_t offset,
                      std::span<uint8_t> out, Error *outError) const;

  bool readCompressedSectors(const BlockEntry &entry, std::optional<uint32_t> key,
                             uint64_t offset, std::span<uint8_t> out, Error *outError) const;

  bool readPlainSectors(const BlockEntry &entry, std::optional<uint32_t> key, uint64_t offset,
                        std::span<uint8_t> out, Error *outError) const;

  std::optional<std::vector<uint32_t>> loadSectorOffsets(const BlockEntry &entry,
                                                         std::span<const uint8_t> data,
                                                         uint32_t sectorCount,
                                                         std::optional<uint32_t> key,
                                                         Error *outError) const;

  std::optional<std::vector<uint8_t>> decode(const BlockEntry &entry,
                                             std::span<const uint8_t> stored,
                                             size_t expectedSize, Error *outError) const;

  std::span<const uint8_t> archive_;
  uint32_t sectorSize_;
  const CodecRegistry &codecs_;
};

} // namespace mpqx
