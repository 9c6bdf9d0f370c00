#include <algorithm>

#include <mpqx/crypto.hpp>
#include <mpqx/endian.hpp>
#include <mpqx/sector_reader.hpp>

#include "error.hpp"

namespace mpqx {

namespace {

// Copies the part of a decoded chunk that overlaps [offset, offset + out.size())
void copyOverlap(std::span<const uint8_t> chunk, uint64_t chunkStart, uint64_t offset,
                 std::span<uint8_t> out) {
  uint64_t begin = std::max(chunkStart, offset);
  uint64_t end = std::min<uint64_t>(chunkStart + chunk.size(), offset + out.size());
  if (begin >= end) {
    return;
  }
  std::copy(chunk.begin() + (begin - chunkStart), chunk.begin() + (end - chunkStart),
            out.begin() + (begin - offset));
}

} // namespace

SectorReader::SectorReader(std::span<const uint8_t> archive, uint32_t sectorSize,
                           const CodecRegistry &codecs)
    : archive_(archive), sectorSize_(sectorSize), codecs_(codecs) {}

bool SectorReader::read(const BlockEntry &entry, std::optional<uint32_t> key, uint64_t offset,
                        std::span<uint8_t> out, Error *outError) const {
  if (entry.flags & kFilePatchFile) {
    detail::setError(outError, ErrorCode::UnsupportedFileType,
                     "Patch files cannot be read directly");
    return false;
  }

  if (entry.isEncrypted() && !key) {
    detail::setError(outError, ErrorCode::DecryptionKeyUnavailable,
                     "File is encrypted and its name is unknown");
    return false;
  }

  if (offset > entry.fileSize || out.size() > entry.fileSize - offset) {
    detail::setError(outError, ErrorCode::InvalidRange,
                     "Range [{}, {}) is outside the file ({} bytes)", offset,
                     offset + out.size(), entry.fileSize);
    return false;
  }

  if (out.empty()) {
    return true;
  }

  if (entry.isSingleUnit()) {
    return readSingleUnit(entry, key, offset, out, outError);
  }
  if (entry.isCompressed()) {
    return readCompressedSectors(entry, key, offset, out, outError);
  }
  return readPlainSectors(entry, key, offset, out, outError);
}

std::optional<std::span<const uint8_t>>
SectorReader::storedData(const BlockEntry &entry, uint64_t length, Error *outError) const {
  if (entry.offset > archive_.size() || length > archive_.size() - entry.offset) {
    detail::setError(outError, ErrorCode::TruncatedArchive,
                     "File data at {:#x} ({} bytes) extends past the end of the archive ({} bytes)",
                     entry.offset, length, archive_.size());
    return std::nullopt;
  }
  return archive_.subspan(entry.offset, length);
}

std::optional<std::vector<uint8_t>> SectorReader::decode(const BlockEntry &entry,
                                                         std::span<const uint8_t> stored,
                                                         size_t expectedSize,
                                                         Error *outError) const {
  // Data that did not shrink is stored as is
  if (stored.size() >= expectedSize) {
    return std::vector<uint8_t>(stored.begin(), stored.begin() + expectedSize);
  }
  if (entry.flags & kFileImplode) {
    return codecs_.explode(stored, expectedSize, outError);
  }
  if (entry.flags & kFileCompress) {
    return codecs_.decompress(stored, expectedSize, outError);
  }

  detail::setError(outError, ErrorCode::SectorSizeMismatch,
                   "Uncompressed data is {} bytes, expected {}", stored.size(), expectedSize);
  return std::nullopt;
}

bool SectorReader::readSingleUnit(const BlockEntry &entry, std::optional<uint32_t> key,
                                  uint64_t offset, std::span<uint8_t> out,
                                  Error *outError) const {
  auto data = storedData(entry, entry.compressedSize, outError);
  if (!data) {
    return false;
  }

  std::vector<uint8_t> stored(data->begin(), data->end());
  if (entry.isEncrypted()) {
    decryptBytes(stored, *key);
  }

  auto decoded = decode(entry, stored, entry.fileSize, outError);
  if (!decoded) {
    return false;
  }

  copyOverlap(*decoded, 0, offset, out);
  return true;
}

std::optional<std::vector<uint32_t>>
SectorReader::loadSectorOffsets(const BlockEntry &entry, std::span<const uint8_t> data,
                                uint32_t sectorCount, std::optional<uint32_t> key,
                                Error *outError) const {
  const size_t entryCount = static_cast<size_t>(sectorCount) + 1;
  const size_t tableBytes = entryCount * sizeof(uint32_t);
  if (tableBytes > data.size()) {
    detail::setError(outError, ErrorCode::CorruptSectorTable,
                     "Sector offset table ({} bytes) does not fit in {} bytes of file data",
                     tableBytes, data.size());
    return std::nullopt;
  }

  std::vector<uint8_t> raw(data.begin(), data.begin() + tableBytes);
  if (entry.isEncrypted()) {
    // The offset table is encrypted with the key one below sector 0
    decryptBytes(raw, *key - 1);
  }

  std::vector<uint32_t> offsets(entryCount);
  for (size_t i = 0; i < entryCount; ++i) {
    offsets[i] = readLE32(raw.data() + i * sizeof(uint32_t));
  }

  if (offsets[0] < tableBytes) {
    detail::setError(outError, ErrorCode::CorruptSectorTable,
                     "First sector starts at {} inside the {}-byte offset table", offsets[0],
                     tableBytes);
    return std::nullopt;
  }

  for (size_t i = 1; i < entryCount; ++i) {
    if (offsets[i] <= offsets[i - 1] || offsets[i] > entry.compressedSize) {
      detail::setError(outError, ErrorCode::CorruptSectorTable,
                       "Sector {} spans [{}, {}), outside the {} bytes of file data", i - 1,
                       offsets[i - 1], offsets[i], entry.compressedSize);
      return std::nullopt;
    }
  }

  return offsets;
}

bool SectorReader::readCompressedSectors(const BlockEntry &entry, std::optional<uint32_t> key,
                                         uint64_t offset, std::span<uint8_t> out,
                                         Error *outError) const {
  auto data = storedData(entry, entry.compressedSize, outError);
  if (!data) {
    return false;
  }

  const uint32_t sectorCount =
      static_cast<uint32_t>((static_cast<uint64_t>(entry.fileSize) + sectorSize_ - 1) / sectorSize_);
  auto offsets = loadSectorOffsets(entry, *data, sectorCount, key, outError);
  if (!offsets) {
    return false;
  }

  const uint32_t first = static_cast<uint32_t>(offset / sectorSize_);
  const uint32_t last = static_cast<uint32_t>((offset + out.size() - 1) / sectorSize_);

  for (uint32_t i = first; i <= last; ++i) {
    const uint64_t sectorStart = static_cast<uint64_t>(i) * sectorSize_;
    const size_t expected =
        static_cast<size_t>(std::min<uint64_t>(sectorSize_, entry.fileSize - sectorStart));

    std::vector<uint8_t> stored(data->begin() + (*offsets)[i],
                                data->begin() + (*offsets)[i + 1]);
    if (entry.isEncrypted()) {
      decryptBytes(stored, *key + i);
    }

    Error sectorError;
    auto decoded = decode(entry, stored, expected, &sectorError);
    if (!decoded) {
      detail::setError(outError, sectorError.code, "Sector {}: {}", i, sectorError.message);
      return false;
    }

    copyOverlap(*decoded, sectorStart, offset, out);
  }

  return true;
}

bool SectorReader::readPlainSectors(const BlockEntry &entry, std::optional<uint32_t> key,
                                    uint64_t offset, std::span<uint8_t> out,
                                    Error *outError) const {
  auto data = storedData(entry, entry.fileSize, outError);
  if (!data) {
    return false;
  }

  if (!entry.isEncrypted()) {
    copyOverlap(*data, 0, offset, out);
    return true;
  }

  const uint32_t first = static_cast<uint32_t>(offset / sectorSize_);
  const uint32_t last = static_cast<uint32_t>((offset + out.size() - 1) / sectorSize_);

  for (uint32_t i = first; i <= last; ++i) {
    const uint64_t sectorStart = static_cast<uint64_t>(i) * sectorSize_;
    const size_t length =
        static_cast<size_t>(std::min<uint64_t>(sectorSize_, entry.fileSize - sectorStart));

    std::vector<uint8_t> sector(data->begin() + sectorStart,
                                data->begin() + sectorStart + length);
    decryptBytes(sector, *key + i);
    copyOverlap(sector, sectorStart, offset, out);
  }

  return true;
}

} // namespace mpqx
