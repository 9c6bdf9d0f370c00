#include <bit>

#include <mpqx/crypto.hpp>
#include <mpqx/endian.hpp>
#include <mpqx/hash_index.hpp>

#include "error.hpp"

namespace mpqx {

std::optional<HashIndex> HashIndex::load(std::span<const uint8_t> raw, uint32_t entryCount,
                                         Error *outError) {
  size_t tableBytes = static_cast<size_t>(entryCount) * HashEntry::entrySize;
  if (raw.size() < tableBytes) {
    detail::setError(outError, ErrorCode::TruncatedArchive,
                     "Hash table needs {} bytes, only {} available", tableBytes, raw.size());
    return std::nullopt;
  }

  std::vector<uint8_t> buffer(raw.begin(), raw.begin() + tableBytes);
  decryptBytes(buffer, kHashTableKey);

  std::vector<HashEntry> entries(entryCount);
  for (uint32_t i = 0; i < entryCount; ++i) {
    const uint8_t *src = buffer.data() + static_cast<size_t>(i) * HashEntry::entrySize;
    HashEntry &entry = entries[i];
    entry.nameA = readLE32(src);
    entry.nameB = readLE32(src + 4);
    entry.locale = readLE16(src + 8);
    entry.platform = readLE16(src + 10);
    entry.blockIndex = readLE32(src + 12);
  }

  return fromEntries(std::move(entries), outError);
}

std::optional<HashIndex> HashIndex::fromEntries(std::vector<HashEntry> entries, Error *outError) {
  if (!entries.empty() && !std::has_single_bit(entries.size())) {
    detail::setError(outError, ErrorCode::CorruptIndex,
                     "Hash table size {} is not a power of two", entries.size());
    return std::nullopt;
  }

  HashIndex index;
  index.entries_ = std::move(entries);
  return index;
}

std::optional<HashIndex::Match> HashIndex::find(std::string_view name, uint16_t locale,
                                                Error *outError) const {
  if (entries_.empty()) {
    detail::setError(outError, ErrorCode::FileNotFound, "File not found: {}", name);
    return std::nullopt;
  }

  const uint32_t mask = static_cast<uint32_t>(entries_.size() - 1);
  const uint32_t nameA = hashString(name, HashType::NameA);
  const uint32_t nameB = hashString(name, HashType::NameB);
  uint32_t index = hashString(name, HashType::TableOffset) & mask;

  std::optional<Match> neutral;
  bool nameSeen = false;

  // At most one full pass over the table
  for (size_t step = 0; step < entries_.size(); ++step, index = (index + 1) & mask) {
    const HashEntry &entry = entries_[index];

    SlotState state = entry.state();
    if (state == SlotState::Empty) {
      break;
    }
    if (state == SlotState::Deleted || entry.nameA != nameA || entry.nameB != nameB) {
      continue;
    }

    nameSeen = true;
    if (entry.locale == locale) {
      return Match{index, entry.blockIndex, entry.locale};
    }
    if (entry.locale == kLocaleNeutral && !neutral) {
      neutral = Match{index, entry.blockIndex, entry.locale};
    }
  }

  if (neutral) {
    return neutral;
  }

  if (nameSeen) {
    detail::setError(outError, ErrorCode::LocaleNotFound,
                     "File {} exists, but not for locale {:#06x}", name, locale);
  } else {
    detail::setError(outError, ErrorCode::FileNotFound, "File not found: {}", name);
  }
  return std::nullopt;
}

std::optional<uint32_t> HashIndex::lookup(std::string_view name, uint16_t locale,
                                          Error *outError) const {
  auto match = find(name, locale, outError);
  if (!match) {
    return std::nullopt;
  }
  return match->blockIndex;
}

} // namespace mpqx
