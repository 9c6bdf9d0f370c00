#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "types.hpp"

namespace mpqx {

// Per-file physical layout table
class BlockIndex {
public:
  BlockIndex() = default;

  // Decrypts entryCount records from the raw table bytes. hiBytes is the
  // unencrypted hi-block table (entryCount 16-bit values) or empty.
  // Errors: TruncatedArchive
  static std::optional<BlockIndex> load(std::span<const uint8_t> raw, uint32_t entryCount,
                                        std::span<const uint8_t> hiBytes = {},
                                        Error *outError = nullptr);

  // Returns the entry at index, including entries without kFileExists;
  // the caller decides what a deleted entry means.
  // Errors: IndexOutOfRange
  const BlockEntry *get(uint32_t index, Error *outError = nullptr) const;

  const std::vector<BlockEntry> &entries() const { return entries_; }

  size_t size() const { return entries_.size(); }

private:
  std::vector<BlockEntry> entries_;
};

} // namespace mpqx
