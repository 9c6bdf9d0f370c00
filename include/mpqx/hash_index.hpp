#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace mpqx {

// Open-addressed, power-of-two sized name index
class HashIndex {
public:
  struct Match {
    uint32_t hashIndex = 0;  // Slot that matched
    uint32_t blockIndex = 0; // Block table row referenced by the slot
    uint16_t locale = kLocaleNeutral;
  };

  HashIndex() = default;

  // Decrypts entryCount records from the raw table bytes.
  // Errors: TruncatedArchive (not enough bytes), CorruptIndex (size not a power of two)
  static std::optional<HashIndex> load(std::span<const uint8_t> raw, uint32_t entryCount,
                                       Error *outError = nullptr);

  // Wraps already decoded entries
  static std::optional<HashIndex> fromEntries(std::vector<HashEntry> entries,
                                              Error *outError = nullptr);

  // Searches for name. An entry with the requested locale wins; otherwise the
  // first entry with the neutral locale is returned.
  // Errors: FileNotFound (name not present), LocaleNotFound (only other locales)
  std::optional<Match> find(std::string_view name, uint16_t locale,
                            Error *outError = nullptr) const;

  std::optional<uint32_t> lookup(std::string_view name, uint16_t locale,
                                 Error *outError = nullptr) const;

  const std::vector<HashEntry> &entries() const { return entries_; }

  size_t size() const { return entries_.size(); }

private:
  std::vector<HashEntry> entries_;
};

} // namespace mpqx
