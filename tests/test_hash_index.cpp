#include <string>
#include <vector>

#include <mpqx/crypto.hpp>
#include <mpqx/endian.hpp>
#include <mpqx/hash_index.hpp>

#include <gtest/gtest.h>

namespace {

constexpr uint16_t kLocaleGerman = 0x407;
constexpr uint16_t kLocaleFrench = 0x40C;

mpqx::HashEntry entryFor(std::string_view name, uint32_t blockIndex,
                         uint16_t locale = mpqx::kLocaleNeutral) {
  mpqx::HashEntry entry;
  entry.nameA = mpqx::hashString(name, mpqx::HashType::NameA);
  entry.nameB = mpqx::hashString(name, mpqx::HashType::NameB);
  entry.locale = locale;
  entry.blockIndex = blockIndex;
  return entry;
}

uint32_t homeSlot(std::string_view name, size_t tableSize) {
  return mpqx::hashString(name, mpqx::HashType::TableOffset) &
         static_cast<uint32_t>(tableSize - 1);
}

// Table of the given size with entries placed at name's home slot and after
std::vector<mpqx::HashEntry> tableWith(size_t size, std::string_view name,
                                       const std::vector<mpqx::HashEntry> &chain) {
  std::vector<mpqx::HashEntry> table(size);
  uint32_t slot = homeSlot(name, size);
  for (const auto &entry : chain) {
    table[slot] = entry;
    slot = (slot + 1) & static_cast<uint32_t>(size - 1);
  }
  return table;
}

mpqx::HashIndex makeIndex(std::vector<mpqx::HashEntry> entries) {
  auto index = mpqx::HashIndex::fromEntries(std::move(entries));
  EXPECT_TRUE(index.has_value());
  return index ? std::move(*index) : mpqx::HashIndex{};
}

} // namespace

// Test decrypting and decoding a raw table
TEST(HashIndexTest, LoadEncryptedTable) {
  std::vector<mpqx::HashEntry> entries(4);
  entries[2] = entryFor("war3map.j", 7, kLocaleGerman);
  entries[3].blockIndex = mpqx::kHashEntryDeleted;

  std::vector<uint8_t> raw(entries.size() * mpqx::HashEntry::entrySize);
  for (size_t i = 0; i < entries.size(); ++i) {
    uint8_t *dst = raw.data() + i * mpqx::HashEntry::entrySize;
    mpqx::writeLE32(dst, entries[i].nameA);
    mpqx::writeLE32(dst + 4, entries[i].nameB);
    mpqx::writeLE16(dst + 8, entries[i].locale);
    mpqx::writeLE16(dst + 10, 0);
    mpqx::writeLE32(dst + 12, entries[i].blockIndex);
  }
  mpqx::encryptBytes(raw, mpqx::kHashTableKey);

  mpqx::Error error;
  auto index = mpqx::HashIndex::load(raw, 4, &error);
  ASSERT_TRUE(index.has_value()) << error.message;
  ASSERT_EQ(index->size(), 4u);

  EXPECT_EQ(index->entries()[0].state(), mpqx::SlotState::Empty);
  EXPECT_EQ(index->entries()[2].state(), mpqx::SlotState::Occupied);
  EXPECT_EQ(index->entries()[2].nameA, entries[2].nameA);
  EXPECT_EQ(index->entries()[2].locale, kLocaleGerman);
  EXPECT_EQ(index->entries()[2].blockIndex, 7u);
  EXPECT_EQ(index->entries()[3].state(), mpqx::SlotState::Deleted);
}

// Test that the raw table must cover all entries
TEST(HashIndexTest, LoadTruncated) {
  std::vector<uint8_t> raw(3 * mpqx::HashEntry::entrySize);

  mpqx::Error error;
  EXPECT_FALSE(mpqx::HashIndex::load(raw, 4, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::TruncatedArchive);
}

// Test rejection of sizes that are not a power of two
TEST(HashIndexTest, SizeNotPowerOfTwo) {
  mpqx::Error error;
  EXPECT_FALSE(mpqx::HashIndex::fromEntries(std::vector<mpqx::HashEntry>(12), &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::CorruptIndex);

  EXPECT_TRUE(mpqx::HashIndex::fromEntries({}).has_value());
  EXPECT_TRUE(mpqx::HashIndex::fromEntries(std::vector<mpqx::HashEntry>(1)).has_value());
}

// Test a direct hit at the home slot
TEST(HashIndexTest, LookupHomeSlot) {
  auto index = makeIndex(tableWith(16, "units.dat", {entryFor("units.dat", 3)}));

  mpqx::Error error;
  auto match = index.find("units.dat", mpqx::kLocaleNeutral, &error);
  ASSERT_TRUE(match.has_value()) << error.message;
  EXPECT_EQ(match->blockIndex, 3u);
  EXPECT_EQ(match->hashIndex, homeSlot("units.dat", 16));

  EXPECT_EQ(index.lookup("UNITS.DAT", mpqx::kLocaleNeutral), 3u);
}

// Test probing past other names and tombstones
TEST(HashIndexTest, LookupScansPastCollisionsAndTombstones) {
  mpqx::HashEntry tombstone = entryFor("units.dat", mpqx::kHashEntryDeleted);
  auto index = makeIndex(tableWith(
      16, "units.dat", {entryFor("other.dat", 1), tombstone, entryFor("units.dat", 5)}));

  EXPECT_EQ(index.lookup("units.dat", mpqx::kLocaleNeutral), 5u);
}

// Test that an empty slot ends the search
TEST(HashIndexTest, EmptySlotStopsSearch) {
  auto index = makeIndex(
      tableWith(16, "units.dat", {entryFor("other.dat", 1), mpqx::HashEntry{}, entryFor("units.dat", 5)}));

  mpqx::Error error;
  EXPECT_FALSE(index.lookup("units.dat", mpqx::kLocaleNeutral, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::FileNotFound);
  EXPECT_EQ(error.category(), mpqx::ErrorCategory::Lookup);
}

// Test probing wraps around the end of the table
TEST(HashIndexTest, SearchWrapsAround) {
  std::vector<mpqx::HashEntry> table(8);
  uint32_t home = homeSlot("wrap.txt", 8);
  for (uint32_t i = 0; i < 7; ++i) {
    table[(home + i) & 7] = entryFor("filler" + std::to_string(i), i);
  }
  table[(home + 7) & 7] = entryFor("wrap.txt", 42);

  auto index = makeIndex(std::move(table));
  EXPECT_EQ(index.lookup("wrap.txt", mpqx::kLocaleNeutral), 42u);
}

// Test that a full table without the name terminates
TEST(HashIndexTest, FullTableMiss) {
  std::vector<mpqx::HashEntry> table(8);
  for (uint32_t i = 0; i < 8; ++i) {
    table[i] = entryFor("filler" + std::to_string(i), i);
  }

  auto index = makeIndex(std::move(table));
  mpqx::Error error;
  EXPECT_FALSE(index.lookup("missing.txt", mpqx::kLocaleNeutral, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::FileNotFound);
}

// Test exact locale match over neutral
TEST(HashIndexTest, ExactLocaleWins) {
  auto index = makeIndex(tableWith(16, "sound.wav",
                                   {entryFor("sound.wav", 1), entryFor("sound.wav", 2, kLocaleGerman),
                                    entryFor("sound.wav", 3, kLocaleFrench)}));

  auto match = index.find("sound.wav", kLocaleGerman);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->blockIndex, 2u);
  EXPECT_EQ(match->locale, kLocaleGerman);

  EXPECT_EQ(index.lookup("sound.wav", kLocaleFrench), 3u);
  EXPECT_EQ(index.lookup("sound.wav", mpqx::kLocaleNeutral), 1u);
}

// Test neutral fallback when the requested locale is missing
TEST(HashIndexTest, NeutralFallback) {
  auto index = makeIndex(tableWith(
      16, "sound.wav", {entryFor("sound.wav", 2, kLocaleGerman), entryFor("sound.wav", 1)}));

  auto match = index.find("sound.wav", kLocaleFrench);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->blockIndex, 1u);
  EXPECT_EQ(match->locale, mpqx::kLocaleNeutral);
}

// Test that other locales never serve as fallback
TEST(HashIndexTest, NoFallbackToOtherLocale) {
  auto index = makeIndex(tableWith(16, "sound.wav", {entryFor("sound.wav", 2, kLocaleGerman)}));

  mpqx::Error error;
  EXPECT_FALSE(index.find("sound.wav", kLocaleFrench, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::LocaleNotFound);
  EXPECT_EQ(error.category(), mpqx::ErrorCategory::Lookup);

  EXPECT_FALSE(index.find("sound.wav", mpqx::kLocaleNeutral).has_value());
}

// Test lookups in an empty index
TEST(HashIndexTest, EmptyIndex) {
  mpqx::HashIndex index;

  mpqx::Error error;
  EXPECT_FALSE(index.lookup("anything", mpqx::kLocaleNeutral, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::FileNotFound);
}
