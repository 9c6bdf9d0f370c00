#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "types.hpp"

namespace mpqx {

// Locates the archive header in a stream and decodes it.
//
// The header may be preceded by arbitrary data (e.g. an executable stub).
// Candidates are checked at every 512-byte boundary from the stream start.
// A valid user-data header ("MPQ\x1B") redirects to the real header, which
// must be present at the target offset.
//
// Errors: InvalidSignature, TruncatedHeader, UnsupportedVersion, CorruptIndex
std::optional<Header> parseHeader(std::span<const uint8_t> stream, const OpenOptions &options,
                                  Error *outError = nullptr);

} // namespace mpqx
