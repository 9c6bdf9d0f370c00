#include <spdlog/spdlog.h>

#include <mpqx/endian.hpp>
#include <mpqx/header.hpp>

#include "error.hpp"

namespace mpqx {

namespace {

// Largest shift for which 0x200 << shift fits in 32 bits
constexpr uint16_t kMaxSectorSizeShift = 22;

std::optional<Header> decodeHeader(std::span<const uint8_t> stream, size_t offset,
                                   Error *outError) {
  size_t available = stream.size() - offset;
  if (available < kHeaderSizeV1) {
    detail::setError(outError, ErrorCode::TruncatedHeader,
                     "Archive header at offset {:#x} is truncated ({} of {} bytes)", offset,
                     available, kHeaderSizeV1);
    return std::nullopt;
  }

  const uint8_t *src = stream.data() + offset;

  Header header;
  header.archiveOffset = offset;
  header.headerSize = readLE32(src + 0x04);
  header.archiveSize = readLE32(src + 0x08);
  header.formatVersion = readLE16(src + 0x0C);
  header.sectorSizeShift = readLE16(src + 0x0E);
  header.hashTableOffset = readLE32(src + 0x10);
  header.blockTableOffset = readLE32(src + 0x14);
  header.hashTableSize = readLE32(src + 0x18);
  header.blockTableSize = readLE32(src + 0x1C);

  if (header.formatVersion > 1) {
    detail::setError(outError, ErrorCode::UnsupportedVersion,
                     "Unsupported archive format version {}", header.formatVersion);
    return std::nullopt;
  }

  if (header.sectorSizeShift > kMaxSectorSizeShift) {
    detail::setError(outError, ErrorCode::CorruptIndex, "Invalid sector size shift {}",
                     header.sectorSizeShift);
    return std::nullopt;
  }

  if (header.formatVersion == 0) {
    // Some protectors store garbage in the header size of original archives
    header.headerSize = static_cast<uint32_t>(kHeaderSizeV1);
    return header;
  }

  if (header.headerSize < kHeaderSizeV2 || available < kHeaderSizeV2) {
    detail::setError(outError, ErrorCode::TruncatedHeader,
                     "Extended archive header at offset {:#x} is truncated (size {}, {} bytes "
                     "available)",
                     offset, header.headerSize, available);
    return std::nullopt;
  }

  header.hiBlockTableOffset = readLE64(src + 0x20);
  header.hashTableOffsetHigh = readLE16(src + 0x28);
  header.blockTableOffsetHigh = readLE16(src + 0x2A);
  return header;
}

} // namespace

std::optional<Header> parseHeader(std::span<const uint8_t> stream, const OpenOptions &options,
                                  Error *outError) {
  for (size_t offset = 0; offset + sizeof(uint32_t) <= stream.size();
       offset += kHeaderAlignment) {
    uint32_t signature = readLE32(stream.data() + offset);

    if (signature == kUserDataSignature &&
        offset + kUserDataHeaderSize <= stream.size()) {
      uint32_t userDataSize = readLE32(stream.data() + offset + 0x04);
      uint32_t headerOffset = readLE32(stream.data() + offset + 0x08);
      uint32_t userDataHeaderSize = readLE32(stream.data() + offset + 0x0C);

      if (userDataHeaderSize <= userDataSize && userDataSize <= headerOffset) {
        uint64_t target = static_cast<uint64_t>(offset) + headerOffset;
        if (target + sizeof(uint32_t) > stream.size() ||
            readLE32(stream.data() + target) != kHeaderSignature) {
          detail::setError(outError, ErrorCode::InvalidSignature,
                           "User data header at {:#x} points to {:#x}, which is not an archive "
                           "header",
                           offset, target);
          return std::nullopt;
        }

        spdlog::debug("mpqx: user data header at {:#x} redirects to {:#x}", offset, target);
        auto header = decodeHeader(stream, static_cast<size_t>(target), outError);
        if (header) {
          header->hasUserData = true;
          header->userDataOffset = offset;
        }
        return header;
      }
    }

    if (signature == kHeaderSignature) {
      return decodeHeader(stream, offset, outError);
    }

    if (!options.searchForHeader) {
      break;
    }
  }

  detail::setError(outError, ErrorCode::InvalidSignature, "No archive header found in {} bytes",
                   stream.size());
  return std::nullopt;
}

} // namespace mpqx
