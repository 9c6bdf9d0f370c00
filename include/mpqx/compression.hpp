#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace mpqx {

// Compression mask bits (first byte of a compressed sector)
inline constexpr uint8_t kCompressionHuffman = 0x01;
inline constexpr uint8_t kCompressionZlib = 0x02;
inline constexpr uint8_t kCompressionPkware = 0x08;
inline constexpr uint8_t kCompressionBzip2 = 0x10;
inline constexpr uint8_t kCompressionSparse = 0x20;
inline constexpr uint8_t kCompressionAdpcmMono = 0x40;
inline constexpr uint8_t kCompressionAdpcmStereo = 0x80;

// LZMA is not a bit but a whole mask value and never chains with others
inline constexpr uint8_t kCompressionLzma = 0x12;

// Order in which the stages of a multi-bit mask are undone
inline constexpr std::array<uint8_t, 7> kDecompressionOrder = {
    kCompressionBzip2,      kCompressionPkware,    kCompressionZlib,   kCompressionHuffman,
    kCompressionAdpcmStereo, kCompressionAdpcmMono, kCompressionSparse,
};

// Decodes in into out, producing at most outLimit bytes. On failure returns
// false and may describe the problem in outError.
using DecompressFn = std::function<bool(std::span<const uint8_t> in, size_t outLimit,
                                        std::vector<uint8_t> &out, std::string *outError)>;

// Maps compression bits to decompressors and runs the decode pipeline
class CodecRegistry {
public:
  CodecRegistry() = default;

  // Registry with zlib, bzip2, LZMA, sparse and both ADPCM codecs
  static CodecRegistry withDefaults();

  // Replaces any codec previously registered for mask. mask is either a
  // single bit from kDecompressionOrder or kCompressionLzma.
  void registerCodec(uint8_t mask, DecompressFn fn);

  bool has(uint8_t mask) const;

  // Decodes a buffer that starts with its compression mask byte. The result
  // must be exactly expectedSize bytes long.
  // Errors: UnsupportedCompressionMethod, DecompressionFailed, SectorSizeMismatch
  std::optional<std::vector<uint8_t>> decompress(std::span<const uint8_t> in,
                                                 size_t expectedSize,
                                                 Error *outError = nullptr) const;

  // Decodes data stored with kFileImplode: the PKWARE codec with no mask byte
  std::optional<std::vector<uint8_t>> explode(std::span<const uint8_t> in, size_t expectedSize,
                                              Error *outError = nullptr) const;

private:
  bool runStage(uint8_t mask, std::span<const uint8_t> in, size_t outLimit,
                std::vector<uint8_t> &out, Error *outError) const;

  std::map<uint8_t, DecompressFn> codecs_;
};

} // namespace mpqx
