#include <mpqx/types.hpp>

namespace mpqx {

ErrorCategory Error::category() const {
  switch (code) {
  case ErrorCode::None:
    return ErrorCategory::None;
  case ErrorCode::InvalidSignature:
  case ErrorCode::TruncatedHeader:
  case ErrorCode::UnsupportedVersion:
  case ErrorCode::CorruptIndex:
    return ErrorCategory::Format;
  case ErrorCode::FileNotFound:
  case ErrorCode::LocaleNotFound:
  case ErrorCode::FileDeleted:
  case ErrorCode::IndexOutOfRange:
    return ErrorCategory::Lookup;
  case ErrorCode::UnsupportedCompressionMethod:
  case ErrorCode::SectorSizeMismatch:
  case ErrorCode::DecompressionFailed:
  case ErrorCode::CorruptSectorTable:
  case ErrorCode::DecryptionKeyUnavailable:
  case ErrorCode::UnsupportedFileType:
    return ErrorCategory::Integrity;
  case ErrorCode::Io:
  case ErrorCode::TruncatedArchive:
    return ErrorCategory::Io;
  case ErrorCode::BufferTooSmall:
  case ErrorCode::InvalidRange:
  case ErrorCode::NotOpen:
  case ErrorCode::UnsafePath:
    return ErrorCategory::Usage;
  }
  return ErrorCategory::None;
}

std::string_view toString(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::InvalidSignature:
    return "invalid signature";
  case ErrorCode::TruncatedHeader:
    return "truncated header";
  case ErrorCode::UnsupportedVersion:
    return "unsupported version";
  case ErrorCode::CorruptIndex:
    return "corrupt index";
  case ErrorCode::FileNotFound:
    return "file not found";
  case ErrorCode::LocaleNotFound:
    return "locale not found";
  case ErrorCode::FileDeleted:
    return "file deleted";
  case ErrorCode::IndexOutOfRange:
    return "index out of range";
  case ErrorCode::UnsupportedCompressionMethod:
    return "unsupported compression method";
  case ErrorCode::SectorSizeMismatch:
    return "sector size mismatch";
  case ErrorCode::DecompressionFailed:
    return "decompression failed";
  case ErrorCode::CorruptSectorTable:
    return "corrupt sector table";
  case ErrorCode::DecryptionKeyUnavailable:
    return "decryption key unavailable";
  case ErrorCode::UnsupportedFileType:
    return "unsupported file type";
  case ErrorCode::Io:
    return "i/o error";
  case ErrorCode::TruncatedArchive:
    return "truncated archive";
  case ErrorCode::BufferTooSmall:
    return "buffer too small";
  case ErrorCode::InvalidRange:
    return "invalid range";
  case ErrorCode::NotOpen:
    return "archive not open";
  case ErrorCode::UnsafePath:
    return "unsafe path";
  }
  return "unknown";
}

} // namespace mpqx
