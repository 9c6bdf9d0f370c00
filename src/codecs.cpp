#include <algorithm>
#include <cstdint>
#include <limits>

#include <bzlib.h>
#include <fmt/format.h>
#include <lzma.h>
#include <zlib.h>

#include <mpqx/endian.hpp>

#include "codecs.hpp"

namespace mpqx::detail {

namespace {

void setReason(std::string *outError, std::string reason) {
  if (outError) {
    *outError = std::move(reason);
  }
}

// Releases the inflate state on scope exit
class InflateStream {
public:
  InflateStream() { ok_ = inflateInit(&stream_) == Z_OK; }
  ~InflateStream() {
    if (ok_) {
      inflateEnd(&stream_);
    }
  }

  InflateStream(const InflateStream &) = delete;
  InflateStream &operator=(const InflateStream &) = delete;

  bool ok() const { return ok_; }
  z_stream &get() { return stream_; }

private:
  z_stream stream_{};
  bool ok_ = false;
};

// Releases the liblzma decoder on scope exit
class LzmaStream {
public:
  LzmaStream() {
    ok_ = lzma_alone_decoder(&stream_, std::numeric_limits<uint64_t>::max()) == LZMA_OK;
  }
  ~LzmaStream() { lzma_end(&stream_); }

  LzmaStream(const LzmaStream &) = delete;
  LzmaStream &operator=(const LzmaStream &) = delete;

  bool ok() const { return ok_; }
  lzma_stream &get() { return stream_; }

private:
  lzma_stream stream_ = LZMA_STREAM_INIT;
  bool ok_ = false;
};

// IMA ADPCM tables
constexpr int kNextStepTable[32] = {
    -1, 0, -1, 4, -1, 2, -1, 6, -1, 1, -1, 5, -1, 3, -1, 7,
    -1, 1, -1, 5, -1, 3, -1, 7, -1, 2, -1, 4, -1, 6, -1, 8,
};

constexpr int kStepSizeTable[89] = {
    7,     8,     9,     10,    11,    12,    13,    14,    16,    17,    19,    21,    23,
    25,    28,    31,    34,    37,    41,    45,    50,    55,    60,    66,    73,    80,
    88,    97,    107,   118,   130,   143,   157,   173,   190,   209,   230,   253,   279,
    307,   337,   371,   408,   449,   494,   544,   598,   658,   724,   796,   876,   963,
    1060,  1166,  1282,  1411,  1552,  1707,  1878,  2066,  2272,  2499,  2749,  3024,  3327,
    3660,  4026,  4428,  4871,  5358,  5894,  6484,  7132,  7845,  8630,  9493,  10442, 11487,
    12635, 13899, 15289, 16818, 18500, 20350, 22385, 24623, 27086, 29794, 32767,
};

constexpr int kInitialStepIndex = 0x2C;
constexpr int kMaxStepIndex = 0x58;
constexpr int kMaxAdpcmChannels = 2;

// Opcodes that carry no sample
constexpr uint8_t kAdpcmRepeatSample = 0x80;
constexpr uint8_t kAdpcmRaiseStep = 0x81;

int nextStepIndex(int stepIndex, uint8_t encoded) {
  stepIndex += kNextStepTable[encoded & 0x1F];
  return std::clamp(stepIndex, 0, kMaxStepIndex);
}

int decodeSample(int predicted, uint8_t encoded, int stepSize, int difference) {
  for (int bit = 0; bit < 6; ++bit) {
    if (encoded & (1 << bit)) {
      difference += stepSize >> bit;
    }
  }

  if (encoded & 0x40) {
    return std::max(predicted - difference, -32768);
  }
  return std::min(predicted + difference, 32767);
}

} // namespace

bool inflateZlib(std::span<const uint8_t> in, size_t outLimit, std::vector<uint8_t> &out,
                 std::string *outError) {
  InflateStream inflater;
  if (!inflater.ok()) {
    setReason(outError, "inflateInit failed");
    return false;
  }

  // One spare byte makes a stream that runs past outLimit visible to the caller
  const size_t capacity = outLimit + 1;
  out.resize(capacity);
  z_stream &stream = inflater.get();
  stream.next_in = const_cast<Bytef *>(in.data());
  stream.avail_in = static_cast<uInt>(in.size());
  stream.next_out = out.data();
  stream.avail_out = static_cast<uInt>(capacity);

  int ret = inflate(&stream, Z_FINISH);
  bool overrun = stream.avail_out == 0 && (ret == Z_OK || ret == Z_BUF_ERROR);
  if (ret != Z_STREAM_END && !overrun) {
    if (ret == Z_BUF_ERROR) {
      setReason(outError, fmt::format("zlib stream ends after {} bytes",
                                      capacity - stream.avail_out));
    } else {
      setReason(outError, fmt::format("zlib error {}{}{}", ret, stream.msg ? ": " : "",
                                      stream.msg ? stream.msg : ""));
    }
    return false;
  }

  out.resize(capacity - stream.avail_out);
  return true;
}

bool decompressBzip2(std::span<const uint8_t> in, size_t outLimit, std::vector<uint8_t> &out,
                     std::string *outError) {
  out.resize(outLimit);
  unsigned int outLength = static_cast<unsigned int>(outLimit);

  int ret = BZ2_bzBuffToBuffDecompress(
      reinterpret_cast<char *>(out.data()), &outLength,
      const_cast<char *>(reinterpret_cast<const char *>(in.data())),
      static_cast<unsigned int>(in.size()), 0, 0);
  if (ret == BZ_OUTBUFF_FULL) {
    setReason(outError, fmt::format("bzip2 output exceeds {} bytes", outLimit));
    return false;
  }
  if (ret != BZ_OK) {
    setReason(outError, fmt::format("bzip2 error {}", ret));
    return false;
  }

  out.resize(outLength);
  return true;
}

bool decompressLzma(std::span<const uint8_t> in, size_t outLimit, std::vector<uint8_t> &out,
                    std::string *outError) {
  if (in.empty() || in[0] != 0) {
    setReason(outError, "unsupported LZMA filter");
    return false;
  }

  LzmaStream decoder;
  if (!decoder.ok()) {
    setReason(outError, "lzma_alone_decoder failed");
    return false;
  }

  const size_t capacity = outLimit + 1;
  out.resize(capacity);
  lzma_stream &stream = decoder.get();
  stream.next_in = in.data() + 1;
  stream.avail_in = in.size() - 1;
  stream.next_out = out.data();
  stream.avail_out = capacity;

  lzma_ret ret = LZMA_OK;
  while (ret == LZMA_OK && stream.avail_out > 0) {
    ret = lzma_code(&stream, LZMA_FINISH);
  }

  bool overrun = stream.avail_out == 0 && (ret == LZMA_OK || ret == LZMA_BUF_ERROR);
  if (ret != LZMA_STREAM_END && !overrun) {
    if (ret == LZMA_BUF_ERROR) {
      setReason(outError, fmt::format("LZMA stream ends after {} bytes",
                                      capacity - stream.avail_out));
    } else {
      setReason(outError, fmt::format("liblzma error {}", static_cast<int>(ret)));
    }
    return false;
  }

  out.resize(capacity - stream.avail_out);
  return true;
}

bool decompressSparse(std::span<const uint8_t> in, size_t outLimit, std::vector<uint8_t> &out,
                      std::string *outError) {
  if (in.size() < 4) {
    setReason(outError, "sparse header truncated");
    return false;
  }

  // Output size is stored big-endian
  size_t declared = (static_cast<size_t>(in[0]) << 24) | (static_cast<size_t>(in[1]) << 16) |
                    (static_cast<size_t>(in[2]) << 8) | in[3];
  if (declared > outLimit) {
    setReason(outError, fmt::format("sparse size {} exceeds limit {}", declared, outLimit));
    return false;
  }

  out.assign(declared, 0);
  size_t written = 0;
  size_t pos = 4;

  while (pos < in.size() && written < declared) {
    uint8_t control = in[pos++];

    if (control & 0x80) {
      size_t chunk = std::min<size_t>((control & 0x7F) + 1, declared - written);
      if (in.size() - pos < chunk) {
        setReason(outError, "sparse literal run truncated");
        return false;
      }
      std::copy_n(in.begin() + pos, chunk, out.begin() + written);
      pos += chunk;
      written += chunk;
    } else {
      // Zero run; the buffer is already zero-filled
      written += std::min<size_t>((control & 0x7F) + 3, declared - written);
    }
  }

  if (written < declared) {
    setReason(outError,
              fmt::format("sparse data ends after {} of {} bytes", written, declared));
    return false;
  }
  return true;
}

bool decompressAdpcm(std::span<const uint8_t> in, size_t outLimit, int channelCount,
                     std::vector<uint8_t> &out, std::string *outError) {
  if (channelCount < 1 || channelCount > kMaxAdpcmChannels) {
    setReason(outError, fmt::format("unsupported ADPCM channel count {}", channelCount));
    return false;
  }
  if (in.size() < 2) {
    setReason(outError, "ADPCM header truncated");
    return false;
  }

  // First byte is zero, the second one holds the bit shift
  const int bitShift = in[1];
  if (bitShift > 15) {
    setReason(outError, fmt::format("invalid ADPCM bit shift {}", bitShift));
    return false;
  }

  out.clear();
  out.reserve(outLimit);

  auto hasRoom = [&] { return outLimit - out.size() >= sizeof(int16_t); };
  auto writeSample = [&](int sample) {
    uint16_t bits = static_cast<uint16_t>(static_cast<int16_t>(sample));
    out.push_back(static_cast<uint8_t>(bits & 0xFF));
    out.push_back(static_cast<uint8_t>(bits >> 8));
  };

  int predicted[kMaxAdpcmChannels] = {0, 0};
  int stepIndex[kMaxAdpcmChannels] = {kInitialStepIndex, kInitialStepIndex};
  size_t pos = 2;

  for (int channel = 0; channel < channelCount; ++channel) {
    if (in.size() - pos < sizeof(int16_t)) {
      return true;
    }
    if (!hasRoom()) {
      setReason(outError, fmt::format("ADPCM output exceeds {} bytes", outLimit));
      return false;
    }
    predicted[channel] = static_cast<int16_t>(readLE16(in.data() + pos));
    pos += sizeof(int16_t);
    writeSample(predicted[channel]);
  }

  int channel = channelCount - 1;
  while (pos < in.size()) {
    // Every remaining byte may still produce a sample
    if (!hasRoom()) {
      setReason(outError, fmt::format("ADPCM data continues past {} bytes of output", outLimit));
      return false;
    }

    uint8_t encoded = in[pos++];
    channel = (channel + 1) % channelCount;

    if (encoded == kAdpcmRepeatSample) {
      if (stepIndex[channel] != 0) {
        --stepIndex[channel];
      }
      writeSample(predicted[channel]);
    } else if (encoded == kAdpcmRaiseStep) {
      stepIndex[channel] = std::min(stepIndex[channel] + 8, kMaxStepIndex);
      // Next byte belongs to the same channel
      channel = (channel + 1) % channelCount;
    } else {
      int stepSize = kStepSizeTable[stepIndex[channel]];
      predicted[channel] =
          decodeSample(predicted[channel], encoded, stepSize, stepSize >> bitShift);
      writeSample(predicted[channel]);
      stepIndex[channel] = nextStepIndex(stepIndex[channel], encoded);
    }
  }

  return true;
}

} // namespace mpqx::detail
