#include <mpqx/compression.hpp>

#include "codecs.hpp"
#include "error.hpp"

namespace mpqx {

namespace {

constexpr uint8_t kKnownCompressionBits = kCompressionHuffman | kCompressionZlib |
                                          kCompressionPkware | kCompressionBzip2 |
                                          kCompressionSparse | kCompressionAdpcmMono |
                                          kCompressionAdpcmStereo;

bool checkSize(const std::vector<uint8_t> &data, size_t expectedSize, Error *outError) {
  if (data.size() != expectedSize) {
    detail::setError(outError, ErrorCode::SectorSizeMismatch,
                     "Decompressed {} bytes, expected {}", data.size(), expectedSize);
    return false;
  }
  return true;
}

} // namespace

CodecRegistry CodecRegistry::withDefaults() {
  CodecRegistry registry;
  registry.registerCodec(kCompressionZlib, detail::inflateZlib);
  registry.registerCodec(kCompressionBzip2, detail::decompressBzip2);
  registry.registerCodec(kCompressionLzma, detail::decompressLzma);
  registry.registerCodec(kCompressionSparse, detail::decompressSparse);
  registry.registerCodec(kCompressionAdpcmMono,
                         [](std::span<const uint8_t> in, size_t outLimit,
                            std::vector<uint8_t> &out, std::string *outError) {
                           return detail::decompressAdpcm(in, outLimit, 1, out, outError);
                         });
  registry.registerCodec(kCompressionAdpcmStereo,
                         [](std::span<const uint8_t> in, size_t outLimit,
                            std::vector<uint8_t> &out, std::string *outError) {
                           return detail::decompressAdpcm(in, outLimit, 2, out, outError);
                         });
  return registry;
}

void CodecRegistry::registerCodec(uint8_t mask, DecompressFn fn) {
  codecs_[mask] = std::move(fn);
}

bool CodecRegistry::has(uint8_t mask) const {
  return codecs_.find(mask) != codecs_.end();
}

bool CodecRegistry::runStage(uint8_t mask, std::span<const uint8_t> in, size_t outLimit,
                             std::vector<uint8_t> &out, Error *outError) const {
  auto it = codecs_.find(mask);
  if (it == codecs_.end()) {
    detail::setError(outError, ErrorCode::UnsupportedCompressionMethod,
                     "No decompressor registered for method {:#04x}", mask);
    return false;
  }

  std::string reason;
  out.clear();
  if (!it->second(in, outLimit, out, &reason)) {
    detail::setError(outError, ErrorCode::DecompressionFailed,
                     "Decompression with method {:#04x} failed: {}", mask,
                     reason.empty() ? "invalid data" : reason);
    return false;
  }

  if (out.size() > outLimit) {
    detail::setError(outError, ErrorCode::SectorSizeMismatch,
                     "Method {:#04x} produced {} bytes, limit is {}", mask, out.size(), outLimit);
    return false;
  }
  return true;
}

std::optional<std::vector<uint8_t>> CodecRegistry::decompress(std::span<const uint8_t> in,
                                                              size_t expectedSize,
                                                              Error *outError) const {
  if (in.empty()) {
    detail::setError(outError, ErrorCode::DecompressionFailed,
                     "Compressed data is missing its compression mask");
    return std::nullopt;
  }

  const uint8_t mask = in[0];
  std::span<const uint8_t> payload = in.subspan(1);

  if (mask == kCompressionLzma) {
    std::vector<uint8_t> out;
    if (!runStage(kCompressionLzma, payload, expectedSize, out, outError) ||
        !checkSize(out, expectedSize, outError)) {
      return std::nullopt;
    }
    return out;
  }

  if (mask & ~kKnownCompressionBits) {
    detail::setError(outError, ErrorCode::UnsupportedCompressionMethod,
                     "Unknown compression mask {:#04x}", mask);
    return std::nullopt;
  }

  // Every stage must be available before any work is done
  for (uint8_t bit : kDecompressionOrder) {
    if ((mask & bit) && !has(bit)) {
      detail::setError(outError, ErrorCode::UnsupportedCompressionMethod,
                       "No decompressor registered for method {:#04x} (mask {:#04x})", bit,
                       mask);
      return std::nullopt;
    }
  }

  std::vector<uint8_t> current(payload.begin(), payload.end());
  std::vector<uint8_t> next;

  for (uint8_t bit : kDecompressionOrder) {
    if (!(mask & bit)) {
      continue;
    }
    if (!runStage(bit, current, expectedSize, next, outError)) {
      return std::nullopt;
    }
    current.swap(next);
  }

  if (!checkSize(current, expectedSize, outError)) {
    return std::nullopt;
  }
  return current;
}

std::optional<std::vector<uint8_t>> CodecRegistry::explode(std::span<const uint8_t> in,
                                                           size_t expectedSize,
                                                           Error *outError) const {
  std::vector<uint8_t> out;
  if (!runStage(kCompressionPkware, in, expectedSize, out, outError) ||
      !checkSize(out, expectedSize, outError)) {
    return std::nullopt;
  }
  return out;
}

} // namespace mpqx
