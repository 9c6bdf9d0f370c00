#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace mpqx::detail {

// Built-in decompressors. Each decodes in into out (at most outLimit bytes)
// and reports a reason through outError on failure.

bool inflateZlib(std::span<const uint8_t> in, size_t outLimit, std::vector<uint8_t> &out,
                 std::string *outError);

bool decompressBzip2(std::span<const uint8_t> in, size_t outLimit, std::vector<uint8_t> &out,
                     std::string *outError);

// in is the data after the mask byte: filter byte, then an .lzma stream
bool decompressLzma(std::span<const uint8_t> in, size_t outLimit, std::vector<uint8_t> &out,
                    std::string *outError);

bool decompressSparse(std::span<const uint8_t> in, size_t outLimit, std::vector<uint8_t> &out,
                      std::string *outError);

// IMA ADPCM with one or two interleaved 16-bit channels
bool decompressAdpcm(std::span<const uint8_t> in, size_t outLimit, int channelCount,
                     std::vector<uint8_t> &out, std::string *outError);

} // namespace mpqx::detail
