#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace mpqx {

inline constexpr size_t kCryptTableSize = 0x500;

// Selects one of the 0x100-entry slices of the crypt table
enum class HashType : uint32_t {
  TableOffset = 0,
  NameA = 1,
  NameB = 2,
  FileKey = 3,
};

// Keys of the two index tables: hashString("(hash table)", FileKey) and
// hashString("(block table)", FileKey)
inline constexpr uint32_t kHashTableKey = 0xC3AF3770;
inline constexpr uint32_t kBlockTableKey = 0xEC83B3A3;

// Generates the decryption table from the fixed seed 0x00100001
constexpr std::array<uint32_t, kCryptTableSize> buildCryptTable() {
  std::array<uint32_t, kCryptTableSize> table{};
  uint32_t seed = 0x00100001;

  for (uint32_t index1 = 0; index1 < 0x100; ++index1) {
    for (uint32_t index2 = index1, i = 0; i < 5; ++i, index2 += 0x100) {
      seed = (seed * 125 + 3) % 0x2AAAAB;
      uint32_t temp1 = (seed & 0xFFFF) << 0x10;

      seed = (seed * 125 + 3) % 0x2AAAAB;
      uint32_t temp2 = (seed & 0xFFFF);

      table[index2] = temp1 | temp2;
    }
  }

  return table;
}

// Shared read-only instance of the table
const std::array<uint32_t, kCryptTableSize> &cryptTable();

// Hashes a file name. ASCII letters are upper-cased and '/' is folded to '\'
// before hashing, so "a/b.txt" and "A\B.TXT" hash identically.
uint32_t hashString(std::string_view name, HashType type);

// In-place encryption/decryption of 32-bit words
void encryptBlock(std::span<uint32_t> words, uint32_t key);
void decryptBlock(std::span<uint32_t> words, uint32_t key);

// Byte-buffer variants. The buffer is processed as little-endian words;
// up to three trailing bytes that do not form a word are left untouched.
void encryptBytes(std::span<uint8_t> bytes, uint32_t key);
void decryptBytes(std::span<uint8_t> bytes, uint32_t key);

// Returns the part of the path after the last '\' or '/'
std::string_view plainFileName(std::string_view path);

// Encryption key of a stored file. With kFileFixKey the key is bound to the
// block offset and the uncompressed size.
uint32_t fileKey(std::string_view name, uint64_t blockOffset, uint32_t fileSize, uint32_t flags);

} // namespace mpqx
