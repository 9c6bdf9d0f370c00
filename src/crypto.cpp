#include <vector>

#include <mpqx/crypto.hpp>
#include <mpqx/endian.hpp>
#include <mpqx/types.hpp>

namespace mpqx {

namespace {

constexpr std::array<uint32_t, kCryptTableSize> kCryptTable = buildCryptTable();

// Upper-case ASCII letters, convert '/' to '\'
constexpr uint8_t normalizeHashChar(uint8_t c) {
  if (c == '/') {
    return '\\';
  }
  if (c >= 'a' && c <= 'z') {
    return static_cast<uint8_t>(c - 0x20);
  }
  return c;
}

// Runs fn over the whole words of a byte buffer in host order
template <typename Fn>
void transformWords(std::span<uint8_t> bytes, Fn &&fn) {
  size_t wordCount = bytes.size() / sizeof(uint32_t);
  if (wordCount == 0) {
    return;
  }

  std::vector<uint32_t> words(wordCount);
  for (size_t i = 0; i < wordCount; ++i) {
    words[i] = readLE32(bytes.data() + i * sizeof(uint32_t));
  }

  fn(std::span<uint32_t>(words));

  for (size_t i = 0; i < wordCount; ++i) {
    writeLE32(bytes.data() + i * sizeof(uint32_t), words[i]);
  }
}

} // namespace

const std::array<uint32_t, kCryptTableSize> &cryptTable() {
  return kCryptTable;
}

uint32_t hashString(std::string_view name, HashType type) {
  const uint32_t base = static_cast<uint32_t>(type) * 0x100;
  uint32_t seed1 = 0x7FED7FED;
  uint32_t seed2 = 0xEEEEEEEE;

  for (char c : name) {
    uint32_t ch = normalizeHashChar(static_cast<uint8_t>(c));

    seed1 = kCryptTable[base + ch] ^ (seed1 + seed2);
    seed2 = ch + seed1 + seed2 + (seed2 << 5) + 3;
  }

  return seed1;
}

void encryptBlock(std::span<uint32_t> words, uint32_t key) {
  uint32_t seed1 = key;
  uint32_t seed2 = 0xEEEEEEEE;

  for (uint32_t &word : words) {
    seed2 += kCryptTable[0x400 + (seed1 & 0xFF)];
    uint32_t plain = word;
    word = plain ^ (seed1 + seed2);

    seed1 = ((~seed1 << 0x15) + 0x11111111) | (seed1 >> 0x0B);
    seed2 = plain + seed2 + (seed2 << 5) + 3;
  }
}

void decryptBlock(std::span<uint32_t> words, uint32_t key) {
  uint32_t seed1 = key;
  uint32_t seed2 = 0xEEEEEEEE;

  for (uint32_t &word : words) {
    seed2 += kCryptTable[0x400 + (seed1 & 0xFF)];
    uint32_t plain = word ^ (seed1 + seed2);

    seed1 = ((~seed1 << 0x15) + 0x11111111) | (seed1 >> 0x0B);
    seed2 = plain + seed2 + (seed2 << 5) + 3;
    word = plain;
  }
}

void encryptBytes(std::span<uint8_t> bytes, uint32_t key) {
  transformWords(bytes, [key](std::span<uint32_t> words) { encryptBlock(words, key); });
}

void decryptBytes(std::span<uint8_t> bytes, uint32_t key) {
  transformWords(bytes, [key](std::span<uint32_t> words) { decryptBlock(words, key); });
}

std::string_view plainFileName(std::string_view path) {
  size_t pos = path.find_last_of("\\/");
  if (pos == std::string_view::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

// On disk: (hash of the plain name + low 32 bits of the block offset) ^ file size
uint32_t fileKey(std::string_view name, uint64_t blockOffset, uint32_t fileSize, uint32_t flags) {
  uint32_t key = hashString(plainFileName(name), HashType::FileKey);

  if (flags & kFileFixKey) {
    key = (key + static_cast<uint32_t>(blockOffset)) ^ fileSize;
  }

  return key;
}

} // namespace mpqx
