#include <mpqx/block_index.hpp>
#include <mpqx/crypto.hpp>
#include <mpqx/endian.hpp>

#include "error.hpp"

namespace mpqx {

std::optional<BlockIndex> BlockIndex::load(std::span<const uint8_t> raw, uint32_t entryCount,
                                           std::span<const uint8_t> hiBytes, Error *outError) {
  size_t tableBytes = static_cast<size_t>(entryCount) * BlockEntry::entrySize;
  if (raw.size() < tableBytes) {
    detail::setError(outError, ErrorCode::TruncatedArchive,
                     "Block table needs {} bytes, only {} available", tableBytes, raw.size());
    return std::nullopt;
  }

  size_t hiTableBytes = static_cast<size_t>(entryCount) * sizeof(uint16_t);
  if (!hiBytes.empty() && hiBytes.size() < hiTableBytes) {
    detail::setError(outError, ErrorCode::TruncatedArchive,
                     "Hi-block table needs {} bytes, only {} available", hiTableBytes,
                     hiBytes.size());
    return std::nullopt;
  }

  std::vector<uint8_t> buffer(raw.begin(), raw.begin() + tableBytes);
  decryptBytes(buffer, kBlockTableKey);

  BlockIndex index;
  index.entries_.resize(entryCount);

  for (uint32_t i = 0; i < entryCount; ++i) {
    const uint8_t *src = buffer.data() + static_cast<size_t>(i) * BlockEntry::entrySize;
    BlockEntry &entry = index.entries_[i];
    entry.offset = readLE32(src);
    entry.compressedSize = readLE32(src + 4);
    entry.fileSize = readLE32(src + 8);
    entry.flags = readLE32(src + 12);

    if (!hiBytes.empty()) {
      uint16_t high = readLE16(hiBytes.data() + static_cast<size_t>(i) * sizeof(uint16_t));
      entry.offset |= static_cast<uint64_t>(high) << 32;
    }
  }

  return index;
}

const BlockEntry *BlockIndex::get(uint32_t index, Error *outError) const {
  if (index >= entries_.size()) {
    detail::setError(outError, ErrorCode::IndexOutOfRange,
                     "Block index {} out of range (table has {} entries)", index,
                     entries_.size());
    return nullptr;
  }
  return &entries_[index];
}

} // namespace mpqx
